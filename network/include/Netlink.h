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
 * File:   Netlink.h
 *
 */
#ifndef NETLINK_H
#define NETLINK_H

#include "INetlink.h"

#include <string>
#include <mutex>
#include <list>

struct nl_sock;
class NlLink;

// -----------------------------------------------------------------------------
/**
 *  @class Netlink
 *  @brief Basic wrapper around the libnl netlink library
 *
 *  The object represents a single NETLINK_ROUTE socket, opened at
 *  construction time and closed on destruction.  The socket is bound to the
 *  network namespace of the thread that constructed the object, so to
 *  operate inside a container's namespace create the object from within
 *  PodNetCommon::callInNetworkNamespace(...).
 */
class Netlink : public INetlink
{
public:
    Netlink();
    ~Netlink() override;

public:
    bool isValid() const;

public:
    boost::optional<NetworkDevice> getLink(const std::string &name) const override;
    boost::optional<NetworkDevice> getLinkByIndex(int ifIndex) const override;
    bool listLinks(std::list<NetworkDevice> *links) const override;

public:
    bool createBridge(const std::string &name,
                      const boost::optional<MacAddress> &mac) override;
    bool createVlan(const std::string &name, uint16_t vlanId,
                    int parentIndex) override;
    bool createVethPair(const std::string &hostName,
                        const std::string &peerName,
                        int netnsFd) override;
    bool deleteLink(int ifIndex) override;

    bool setMaster(int ifIndex, int masterIndex) override;
    bool ifaceUp(int ifIndex) override;

public:
    bool listIpv4Addresses(int ifIndex, std::list<Ipv4Address> *addresses) const override;
    bool addAddress(int ifIndex, const Ipv4Address &address) override;
    bool delAddress(int ifIndex, const Ipv4Address &address) override;

    bool listIpv4Routes(int ifIndex, std::list<Ipv4Route> *routes) const override;
    bool addRoute(const Ipv4Route &route) override;

public:
    bool setIfaceConf(const std::string &ifaceName,
                      const std::string &conf, int value) override;
    bool setNonLocalBind(bool enable) override;
    bool setIpv6Disabled(bool disable) override;

private:
    NetworkDevice toNetworkDevice(const NlLink &link) const;
    bool writeProcSysValue(const std::string &path, int value) const;

private:
    struct nl_sock* mSocket;
    mutable std::mutex mLock;
};

#endif // !defined(NETLINK_H)
