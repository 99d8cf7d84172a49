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
 * File:   PortMapping.cpp
 *
 */
#include "PortMapping.h"
#include "NetworkDevice.h"

#include <algorithm>
#include <cctype>
#include <sstream>


namespace
{

std::string trim(const std::string &str)
{
    static const char *whitespace = " \t\r\n";

    const size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos)
        return std::string();

    const size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, (last - first) + 1);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Parses a port number in the range 1 to 65535.
 */
bool parsePort(const std::string &str, uint16_t *port)
{
    if (str.empty() || (str.size() > 5) ||
        !std::all_of(str.begin(), str.end(),
                     [](char c) { return isdigit(static_cast<unsigned char>(c)) != 0; }))
        return false;

    const unsigned long value = std::stoul(str);
    if ((value < 1) || (value > 65535))
        return false;

    *port = static_cast<uint16_t>(value);
    return true;
}

bool parseProtocol(std::string str, std::string *protocol)
{
    std::transform(str.begin(), str.end(), str.begin(),
                   [](char c) { return static_cast<char>(tolower(static_cast<unsigned char>(c))); });

    if ((str != "tcp") && (str != "udp"))
        return false;

    *protocol = str;
    return true;
}

} // namespace

bool parsePortSpec(const std::string &spec, PortMappings *mappings,
                   std::string *error)
{
    mappings->clear();

    std::istringstream specStream(spec);
    std::string entry;

    while (std::getline(specStream, entry, ','))
    {
        entry = trim(entry);
        if (entry.empty())
            continue;

        PortMapping mapping;

        std::string ports = entry;
        const size_t slash = entry.find('/');
        if (slash != std::string::npos)
        {
            ports = entry.substr(0, slash);
            if (!parseProtocol(trim(entry.substr(slash + 1)), &mapping.protocol))
            {
                *error = "invalid protocol in port mapping '" + entry + "'";
                mappings->clear();
                return false;
            }
        }

        const size_t colon = ports.find(':');
        if ((colon == std::string::npos) ||
            !parsePort(trim(ports.substr(0, colon)), &mapping.hostPort) ||
            !parsePort(trim(ports.substr(colon + 1)), &mapping.podPort))
        {
            *error = "invalid port mapping '" + entry + "', expected "
                     "hostPort:podPort[/protocol]";
            mappings->clear();
            return false;
        }

        mappings->emplace_back(mapping);
    }

    return true;
}

Json::Value portMappingsToJson(const PortMappings &mappings)
{
    Json::Value json(Json::arrayValue);

    for (const PortMapping &mapping : mappings)
    {
        Json::Value entry(Json::objectValue);
        entry["hostPort"] = mapping.hostPort;
        entry["podPort"] = mapping.podPort;
        entry["protocol"] = mapping.protocol;
        entry["podIP"] = mapping.podIP;

        json.append(entry);
    }

    return json;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads back a list written by portMappingsToJson().
 *
 *  Entries are validated the same way as a port spec, and the pod IP must be
 *  a dotted quad if present.
 */
bool portMappingsFromJson(const Json::Value &json, PortMappings *mappings,
                          std::string *error)
{
    mappings->clear();

    if (!json.isArray())
    {
        *error = "port mappings are not a JSON array";
        return false;
    }

    for (const Json::Value &entry : json)
    {
        if (!entry.isObject())
        {
            *error = "port mapping entry is not a JSON object";
            mappings->clear();
            return false;
        }

        const Json::Value &hostPort = entry["hostPort"];
        const Json::Value &podPort = entry["podPort"];
        const Json::Value &protocol = entry["protocol"];
        const Json::Value &podIP = entry["podIP"];

        PortMapping mapping;

        if (!hostPort.isUInt() || (hostPort.asUInt() < 1) || (hostPort.asUInt() > 65535) ||
            !podPort.isUInt() || (podPort.asUInt() < 1) || (podPort.asUInt() > 65535))
        {
            *error = "invalid port number in port mapping";
            mappings->clear();
            return false;
        }
        mapping.hostPort = static_cast<uint16_t>(hostPort.asUInt());
        mapping.podPort = static_cast<uint16_t>(podPort.asUInt());

        if (!protocol.isNull() &&
            (!protocol.isString() || !parseProtocol(protocol.asString(), &mapping.protocol)))
        {
            *error = "invalid protocol in port mapping";
            mappings->clear();
            return false;
        }

        if (!podIP.isNull())
        {
            in_addr_t addr;
            if (!podIP.isString() ||
                (!podIP.asString().empty() && !parseIpv4(podIP.asString(), &addr)))
            {
                *error = "invalid pod IP in port mapping";
                mappings->clear();
                return false;
            }

            mapping.podIP = podIP.asString();
        }

        mappings->emplace_back(mapping);
    }

    return true;
}

std::string portMappingToString(const PortMapping &mapping)
{
    std::ostringstream str;
    str << mapping.hostPort << ':';
    if (!mapping.podIP.empty())
        str << mapping.podIP << ':';
    str << mapping.podPort << '/' << mapping.protocol;

    return str.str();
}
