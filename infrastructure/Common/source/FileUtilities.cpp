/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2020 RDK Management
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
/*
 * File:   FileUtilities.cpp
 *
 */

#include "FileUtilities.h"

#include <Logging.h>

#include <sstream>
#include <cerrno>
#include <cstdio>
#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>


std::vector<std::string> PodNetCommon::splitPath(const std::string& path)
{
    std::stringstream ss(path);
    std::vector<std::string> directories;
    std::string token;
    while (getline(ss, token, '/'))
    {
        if (!token.empty())
        {
            directories.emplace_back(std::move(token));
        }
    }
    return directories;
}

bool PodNetCommon::mkdirRecursive(const std::string& path, mode_t mode /*= S_IRWXU*/)
{
    auto directories = PodNetCommon::splitPath(path);
    if (!directories.empty())
    {
        // start with / if it's an absolute path
        std::string partial = path[0] == '/' ? "/" : "";
        for (size_t i = 0; i < directories.size(); ++i)
        {
            bool created = true;

            partial += directories[i] + "/";
            if (mkdir(partial.c_str(), mode) != 0)
            {
                // ENOTDIR if a file is in the way, that is an error
                if (errno == EEXIST)
                {
                    created = false;
                }
                else
                {
                    PN_LOG_SYS_ERROR(errno, "failed to create directory '%s'",
                                     partial.c_str());
                    return false;
                }
            }

            // umask may have stripped bits, force the requested mode
            if (created && (chmod(partial.c_str(), mode) != 0))
            {
                PN_LOG_SYS_ERROR(errno, "failed to set mode on '%s'",
                                 partial.c_str());
                return false;
            }
        }
    }

    return true;
}

bool PodNetCommon::exists(const std::string& path)
{
    struct stat buffer;
    return stat(path.c_str(), &buffer) == 0;
}

bool PodNetCommon::deleteFile(const std::string& filePath)
{
    return unlink(filePath.c_str()) == 0;
}

bool PodNetCommon::createTextFile(const std::string& filePath,
                                  const std::string& contents,
                                  mode_t mode /*= S_IRUSR | S_IWUSR*/)
{
    const std::string tmpPath = filePath + ".tmp";

    int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to create '%s'", tmpPath.c_str());
        return false;
    }

    const char* dataPtr = contents.data();
    size_t remaining = contents.size();

    while (remaining > 0)
    {
        ssize_t ret = TEMP_FAILURE_RETRY(write(fd, dataPtr, remaining));
        if (ret < 0)
        {
            PN_LOG_SYS_ERROR(errno, "failed to write %zu bytes to '%s' file",
                             remaining, tmpPath.c_str());
            break;
        }
        else if (ret == 0)
        {
            PN_LOG_ERROR("didn't write any data, odd");
            break;
        }

        remaining -= static_cast<size_t>(ret);
        dataPtr += ret;
    }

    if (fchmod(fd, mode) < 0)
    {
        PN_LOG_SYS_WARN(errno, "failed to set mode on file to 0%03o", mode);
    }

    if (close(fd) != 0)
    {
        PN_LOG_SYS_WARN(errno, "failed to close file '%s'", tmpPath.c_str());
    }

    if (remaining != 0)
    {
        unlink(tmpPath.c_str());
        return false;
    }

    if (rename(tmpPath.c_str(), filePath.c_str()) != 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to rename '%s' to '%s'",
                         tmpPath.c_str(), filePath.c_str());
        unlink(tmpPath.c_str());
        return false;
    }

    return true;
}

boost::optional<std::string> PodNetCommon::readTextFile(const std::string& filePath)
{
    int fd = open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        return boost::none;
    }

    std::string contents;
    char buf[1024];

    while (true)
    {
        ssize_t ret = TEMP_FAILURE_RETRY(read(fd, buf, sizeof(buf)));
        if (ret < 0)
        {
            int err = errno;
            PN_LOG_SYS_ERROR(err, "failed to read from '%s'", filePath.c_str());
            close(fd);
            errno = err;
            return boost::none;
        }
        else if (ret == 0)
        {
            break;
        }

        contents.append(buf, ret);
    }

    close(fd);
    return contents;
}
