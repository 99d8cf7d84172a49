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
 * File:   NetworkDevice.cpp
 *
 */
#include "NetworkDevice.h"

#include <cstdio>
#include <cstdlib>


std::string ipv4ToString(in_addr_t address)
{
    struct in_addr addr;
    addr.s_addr = htonl(address);

    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr)
        return std::string("?");

    return std::string(buf);
}

std::string macToString(const MacAddress &mac)
{
    char buf[24];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
             mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return std::string(buf);
}

bool parseIpv4(const std::string &str, in_addr_t *address)
{
    struct in_addr addr;
    if (inet_pton(AF_INET, str.c_str(), &addr) != 1)
        return false;

    *address = ntohl(addr.s_addr);
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Parses a string of the form "a.b.c.d/n".
 *
 *  The prefix length is required and must be in the range 0 to 32.
 */
bool parseIpv4Cidr(const std::string &str, in_addr_t *address, uint8_t *prefixLen)
{
    const size_t slash = str.find('/');
    if ((slash == std::string::npos) || (slash == str.size() - 1))
        return false;

    if (!parseIpv4(str.substr(0, slash), address))
        return false;

    const std::string lenStr = str.substr(slash + 1);
    char *end = nullptr;
    unsigned long len = strtoul(lenStr.c_str(), &end, 10);
    if ((end == nullptr) || (*end != '\0') || (len > 32))
        return false;

    *prefixLen = static_cast<uint8_t>(len);
    return true;
}

std::string ipv4AddressToString(const Ipv4Address &address)
{
    return ipv4ToString(address.local) + "/" + std::to_string(address.prefixLen);
}

std::string ipv4RouteToString(const Ipv4Route &route)
{
    std::string str;
    if (route.dstPrefixLen == 0)
        str = "default";
    else
        str = ipv4ToString(route.destination) + "/" + std::to_string(route.dstPrefixLen);

    if (route.gateway != 0)
        str += " via " + ipv4ToString(route.gateway);

    str += " dev " + std::to_string(route.ifIndex);

    if (route.source != 0)
        str += " src " + ipv4ToString(route.source);

    return str;
}
