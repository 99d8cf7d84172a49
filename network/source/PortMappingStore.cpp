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
 * File:   PortMappingStore.cpp
 *
 */
#include "PortMappingStore.h"

#include <Logging.h>
#include <FileUtilities.h>

#include <cerrno>
#include <memory>


PortMappingStore::PortMappingStore(const std::string &stateDir)
    : mStateDir(stateDir)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Gets the path of the file for the container.
 *
 *  The id becomes a file name so anything that could escape the state
 *  directory is refused.
 */
bool PortMappingStore::filePath(const std::string &containerId,
                                std::string *path) const
{
    if (containerId.empty() || (containerId == ".") || (containerId == "..") ||
        (containerId.find('/') != std::string::npos))
    {
        PN_LOG_ERROR("invalid container id '%s'", containerId.c_str());
        return false;
    }

    *path = mStateDir + "/" + containerId;
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Stores the mappings for the container, replacing any stored before.
 *
 *  The state directory is created if it doesn't exist.
 */
bool PortMappingStore::save(const std::string &containerId,
                            const PortMappings &mappings)
{
    PN_LOG_FN_ENTRY();

    std::string path;
    if (!filePath(containerId, &path))
    {
        PN_LOG_FN_EXIT();
        return false;
    }

    if (!PodNetCommon::mkdirRecursive(mStateDir, 0700))
    {
        PN_LOG_SYS_ERROR_EXIT(errno, "failed to create state dir '%s'",
                              mStateDir.c_str());
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    const std::string contents = Json::writeString(builder, portMappingsToJson(mappings));
    if (!PodNetCommon::createTextFile(path, contents))
    {
        PN_LOG_ERROR_EXIT("failed to write port mappings for '%s'",
                          containerId.c_str());
        return false;
    }

    PN_LOG_DEBUG("saved %zu port mapping(s) for '%s'", mappings.size(),
                 containerId.c_str());

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads and removes the mappings stored for the container.
 *
 *  @param[in]  containerId     The container id.
 *  @param[out] mappings        The stored mappings, or boost::none if nothing
 *                              was stored for the container.
 *
 *  @return false only if the stored mappings couldn't be read or removed.
 */
bool PortMappingStore::consume(const std::string &containerId,
                               boost::optional<PortMappings> *mappings)
{
    PN_LOG_FN_ENTRY();

    *mappings = boost::none;

    std::string path;
    if (!filePath(containerId, &path))
    {
        PN_LOG_FN_EXIT();
        return false;
    }

    const boost::optional<std::string> contents = PodNetCommon::readTextFile(path);
    if (!contents)
    {
        if (errno == ENOENT)
        {
            PN_LOG_DEBUG("no port mappings stored for '%s'", containerId.c_str());
            PN_LOG_FN_EXIT();
            return true;
        }

        PN_LOG_SYS_ERROR_EXIT(errno, "failed to read '%s'", path.c_str());
        return false;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(contents->data(), contents->data() + contents->size(),
                       &root, &errors))
    {
        PN_LOG_ERROR_EXIT("failed to parse '%s' - %s", path.c_str(), errors.c_str());
        return false;
    }

    PortMappings stored;
    if (!portMappingsFromJson(root, &stored, &errors))
    {
        PN_LOG_ERROR_EXIT("invalid port mappings in '%s' - %s", path.c_str(),
                          errors.c_str());
        return false;
    }

    if (!PodNetCommon::deleteFile(path))
    {
        PN_LOG_SYS_ERROR_EXIT(errno, "failed to delete '%s'", path.c_str());
        return false;
    }

    *mappings = std::move(stored);

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Discards anything stored for the container.
 *
 *  Succeeds if nothing was stored.
 */
bool PortMappingStore::remove(const std::string &containerId)
{
    std::string path;
    if (!filePath(containerId, &path))
        return false;

    if (!PodNetCommon::deleteFile(path) && (errno != ENOENT))
    {
        PN_LOG_SYS_ERROR(errno, "failed to delete '%s'", path.c_str());
        return false;
    }

    return true;
}
