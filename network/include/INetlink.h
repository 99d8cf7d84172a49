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
 * File:   INetlink.h
 *
 */
#ifndef INETLINK_H
#define INETLINK_H

#include "NetworkDevice.h"

#include <string>
#include <list>

#include <boost/optional.hpp>

// -----------------------------------------------------------------------------
/**
 *  @class INetlink
 *  @brief Interface to the kernel's view of network interfaces, addresses
 *  and routes.
 *
 *  All operations act on the network namespace the implementation was
 *  created in.  Every method logs its own failures, callers only need to
 *  decide whether to abort.
 */
class INetlink
{
public:
    virtual ~INetlink() = default;

public:
    virtual boost::optional<NetworkDevice> getLink(const std::string &name) const = 0;
    virtual boost::optional<NetworkDevice> getLinkByIndex(int ifIndex) const = 0;
    virtual bool listLinks(std::list<NetworkDevice> *links) const = 0;

public:
    // -------------------------------------------------------------------------
    /**
     *  @brief Creates a bridge device and brings it up.
     *
     *  If @a mac is set it's used as the bridge's hardware address, otherwise
     *  the kernel picks one.
     */
    virtual bool createBridge(const std::string &name,
                              const boost::optional<MacAddress> &mac) = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Creates an 802.1Q sub-interface of @a parentIndex.
     */
    virtual bool createVlan(const std::string &name, uint16_t vlanId,
                            int parentIndex) = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Creates a veth pair, the peer end is moved into the network
     *  namespace referenced by @a netnsFd.
     */
    virtual bool createVethPair(const std::string &hostName,
                                const std::string &peerName,
                                int netnsFd) = 0;

    virtual bool deleteLink(int ifIndex) = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Enslaves the interface to the master, a @a masterIndex of 0
     *  releases the interface from its current master.
     */
    virtual bool setMaster(int ifIndex, int masterIndex) = 0;

    virtual bool ifaceUp(int ifIndex) = 0;

public:
    virtual bool listIpv4Addresses(int ifIndex, std::list<Ipv4Address> *addresses) const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Adds the address to the interface, an address that is already
     *  present is not an error.
     */
    virtual bool addAddress(int ifIndex, const Ipv4Address &address) = 0;
    virtual bool delAddress(int ifIndex, const Ipv4Address &address) = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Returns the routes in the main table that go out the interface.
     */
    virtual bool listIpv4Routes(int ifIndex, std::list<Ipv4Route> *routes) const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Adds the route to the main table, a route that is already
     *  present is not an error.
     */
    virtual bool addRoute(const Ipv4Route &route) = 0;

public:
    // -------------------------------------------------------------------------
    /**
     *  @brief Writes a value to /proc/sys/net/ipv4/conf/<iface>/<conf>
     *
     *  @a ifaceName may be "all" or "default".
     */
    virtual bool setIfaceConf(const std::string &ifaceName,
                              const std::string &conf, int value) = 0;

    virtual bool setNonLocalBind(bool enable) = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Writes /proc/sys/net/ipv6/conf/{all,default}/disable_ipv6
     */
    virtual bool setIpv6Disabled(bool disable) = 0;
};

#endif // !defined(INETLINK_H)
