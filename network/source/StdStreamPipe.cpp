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
 * File:   StdStreamPipe.cpp
 *
 */
#include "StdStreamPipe.h"

#include <Logging.h>

#include <cerrno>
#include <unistd.h>
#include <fcntl.h>

/**
 * @brief Creates a new pipe that can be used to capture std streams.
 *
 * @param toolName          Name of the tool writing into the pipe, used as
 *                          the log prefix.
 * @param logPipeContents   If true, then log the contents of the pipe when
 *                          destructed.
 */
StdStreamPipe::StdStreamPipe(const char *toolName, bool logPipeContents)
    : mToolName(toolName ? toolName : "")
    , mReadFd(-1)
    , mWriteFd(-1)
    , mLogPipe(logPipeContents)
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to create pipe");
    }
    else
    {
        mReadFd = fds[0];
        mWriteFd = fds[1];
    }
}

StdStreamPipe::~StdStreamPipe()
{
    if ((mWriteFd >= 0) && (close(mWriteFd) != 0))
        PN_LOG_SYS_ERROR(errno, "failed to close write pipe");

    if (mReadFd >= 0)
    {
        if (mLogPipe)
        {
            const std::string contents = getPipeContents();
            if (!contents.empty())
                PN_LOG_ERROR("%s: %s", mToolName.c_str(), contents.c_str());
        }

        if (close(mReadFd) != 0)
            PN_LOG_SYS_ERROR(errno, "failed to close read pipe");
    }
}

int StdStreamPipe::writeFd() const
{
    return mWriteFd;
}

/**
 * @brief Drains whatever is currently buffered in the pipe.
 *
 * @warning Not thread-safe, the pipe is consumed by the read.
 */
std::string StdStreamPipe::getPipeContents() const
{
    std::string contents;
    char buf[256];

    while (mReadFd >= 0)
    {
        ssize_t ret = TEMP_FAILURE_RETRY(read(mReadFd, buf, sizeof(buf)));
        if (ret < 0)
        {
            // non-blocking pipe, so EAGAIN just means we've hit the end
            if (errno != EAGAIN)
            {
                PN_LOG_SYS_ERROR(errno, "failed to read from pipe");
            }
            break;
        }
        if (ret == 0)
        {
            break;
        }

        contents.append(buf, static_cast<size_t>(ret));
    }

    while (!contents.empty() && (contents.back() == '\n'))
        contents.pop_back();

    return contents;
}
