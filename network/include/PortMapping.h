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
 * File:   PortMapping.h
 *
 */
#ifndef PORTMAPPING_H
#define PORTMAPPING_H

#include <list>
#include <string>
#include <cstdint>

#include <json/json.h>


// -----------------------------------------------------------------------------
/**
 *  @struct PortMapping
 *  @brief A host port forwarded to a port inside a pod.
 *
 *  podIP is empty until the pod has been given an address.
 */
struct PortMapping
{
    uint16_t hostPort = 0;
    uint16_t podPort = 0;
    std::string protocol = "tcp";
    std::string podIP;

    bool operator==(const PortMapping &rhs) const
    {
        return (hostPort == rhs.hostPort) && (podPort == rhs.podPort) &&
               (protocol == rhs.protocol) && (podIP == rhs.podIP);
    }
};

typedef std::list<PortMapping> PortMappings;

// -----------------------------------------------------------------------------
/**
 *  @brief Parses a port spec of the form "8080:80/tcp,53:53/udp,9000:9000".
 *
 *  The protocol is optional and defaults to tcp.  An empty spec gives an
 *  empty list.
 *
 *  @return false and sets @a error if any entry is malformed.
 */
bool parsePortSpec(const std::string &spec, PortMappings *mappings,
                   std::string *error);

Json::Value portMappingsToJson(const PortMappings &mappings);

bool portMappingsFromJson(const Json::Value &json, PortMappings *mappings,
                          std::string *error);

std::string portMappingToString(const PortMapping &mapping);

#endif // !defined(PORTMAPPING_H)
