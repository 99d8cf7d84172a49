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
 * File:   NetworkDevice.h
 *
 */
#ifndef NETWORKDEVICE_H
#define NETWORKDEVICE_H

#include <string>
#include <array>
#include <cstdint>
#include <arpa/inet.h>

#include <boost/optional.hpp>


typedef std::array<uint8_t, 6> MacAddress;

// -----------------------------------------------------------------------------
/**
 *  @struct VlanInfo
 *  @brief The 802.1Q details of a vlan sub-interface.
 */
struct VlanInfo
{
    uint16_t vlanId;
    int parentIndex;
};

// -----------------------------------------------------------------------------
/**
 *  @struct NetworkDevice
 *  @brief Snapshot of a kernel network interface.
 *
 *  The kernel owns the interface, this is only a copy of the attributes we
 *  care about at the time it was read.  The @a vlan field is only set if
 *  @a kind is Kind::VlanSubInterface.
 */
struct NetworkDevice
{
    enum class Kind
    {
        Physical,
        VlanSubInterface,
        Bridge
    };

    Kind kind = Kind::Physical;
    std::string name;
    int index = 0;
    int masterIndex = 0;
    MacAddress mac = {{ 0, 0, 0, 0, 0, 0 }};
    boost::optional<VlanInfo> vlan;

    bool hasMaster() const
    {
        return (masterIndex > 0);
    }
};

// -----------------------------------------------------------------------------
/**
 *  @struct Ipv4Address
 *  @brief An IPv4 interface address, all addresses are in host byte order.
 */
struct Ipv4Address
{
    in_addr_t local = 0;
    uint8_t prefixLen = 32;
    in_addr_t broadcast = 0;
    std::string label;

    bool isLoopback() const
    {
        return ((local & 0xff000000) == 0x7f000000);
    }

    bool operator==(const Ipv4Address &rhs) const
    {
        return (local == rhs.local) && (prefixLen == rhs.prefixLen);
    }
};

// -----------------------------------------------------------------------------
/**
 *  @struct Ipv4Route
 *  @brief An IPv4 route in the main table, addresses in host byte order.
 *
 *  A @a dstPrefixLen of 0 is the default route, a @a gateway or @a source
 *  of 0 means not set.
 */
struct Ipv4Route
{
    in_addr_t destination = 0;
    uint8_t dstPrefixLen = 0;
    in_addr_t gateway = 0;
    in_addr_t source = 0;
    int scope = 0;      // RT_SCOPE_UNIVERSE
    int ifIndex = 0;

    bool operator==(const Ipv4Route &rhs) const
    {
        return (destination == rhs.destination) &&
               (dstPrefixLen == rhs.dstPrefixLen) &&
               (gateway == rhs.gateway) &&
               (ifIndex == rhs.ifIndex);
    }
};


std::string ipv4ToString(in_addr_t address);

std::string macToString(const MacAddress &mac);

bool parseIpv4(const std::string &str, in_addr_t *address);

bool parseIpv4Cidr(const std::string &str, in_addr_t *address, uint8_t *prefixLen);

std::string ipv4AddressToString(const Ipv4Address &address);

std::string ipv4RouteToString(const Ipv4Route &route);

#endif // !defined(NETWORKDEVICE_H)
