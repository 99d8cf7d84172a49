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
 * File:   PortMappingStore.h
 *
 */
#ifndef PORTMAPPINGSTORE_H
#define PORTMAPPINGSTORE_H

#include "PortMapping.h"

#include <string>

#include <boost/optional.hpp>


// -----------------------------------------------------------------------------
/**
 *  @class PortMappingStore
 *  @brief Remembers the port mappings installed for each container so they
 *  can be removed again when the container's network is torn down.
 *
 *  Each container gets a JSON file named after its id in the state
 *  directory.  Container ids are unique so no locking is done here.
 */
class PortMappingStore
{
public:
    explicit PortMappingStore(const std::string &stateDir);
    ~PortMappingStore() = default;

public:
    bool save(const std::string &containerId, const PortMappings &mappings);

    bool consume(const std::string &containerId,
                 boost::optional<PortMappings> *mappings);

    bool remove(const std::string &containerId);

    const std::string &stateDir() const { return mStateDir; }

private:
    bool filePath(const std::string &containerId, std::string *path) const;

private:
    const std::string mStateDir;
};

#endif // !defined(PORTMAPPINGSTORE_H)
