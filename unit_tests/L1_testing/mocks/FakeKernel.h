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
#pragma once

#include "INetlink.h"

#include <map>
#include <list>
#include <string>

// -----------------------------------------------------------------------------
/**
 *  @class FakeKernel
 *  @brief In-memory network namespace, holds links, addresses, routes and
 *  sysctl values.
 *
 *  Each namespace starts with an "lo" device at index 1.
 */
class FakeKernel : public INetlink
{
public:
    FakeKernel();
    ~FakeKernel() override = default;

public:
    int addPhysical(const std::string &name, const MacAddress &mac);
    int addVlanDevice(const std::string &name, uint16_t vlanId, int parentIndex);
    int addBridgeDevice(const std::string &name);
    void forceMaster(int ifIndex, int masterIndex);

    boost::optional<NetworkDevice> device(const std::string &name) const;
    bool isUp(const std::string &name) const;
    std::list<Ipv4Address> addresses(const std::string &name) const;
    std::list<Ipv4Route> routes(const std::string &name) const;
    std::list<Ipv4Route> allRoutes() const;
    size_t linkCount(NetworkDevice::Kind kind) const;
    int conf(const std::string &ifaceName, const std::string &conf) const;
    std::string vethPeer(const std::string &hostName) const;

    bool nonLocalBind() const { return mNonLocalBind; }
    bool ipv6Disabled() const { return mIpv6Disabled; }

public:
    boost::optional<NetworkDevice> getLink(const std::string &name) const override;
    boost::optional<NetworkDevice> getLinkByIndex(int ifIndex) const override;
    bool listLinks(std::list<NetworkDevice> *links) const override;

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

    bool listIpv4Addresses(int ifIndex, std::list<Ipv4Address> *addresses) const override;
    bool addAddress(int ifIndex, const Ipv4Address &address) override;
    bool delAddress(int ifIndex, const Ipv4Address &address) override;

    bool listIpv4Routes(int ifIndex, std::list<Ipv4Route> *routes) const override;
    bool addRoute(const Ipv4Route &route) override;

    bool setIfaceConf(const std::string &ifaceName,
                      const std::string &conf, int value) override;
    bool setNonLocalBind(bool enable) override;
    bool setIpv6Disabled(bool disable) override;

private:
    struct Link
    {
        NetworkDevice device;
        bool up = false;
        std::list<Ipv4Address> addresses;
    };

    int addLink(const NetworkDevice &device);
    const Link *findLink(const std::string &name) const;

private:
    std::map<int, Link> mLinks;
    std::list<Ipv4Route> mRoutes;
    std::map<std::string, int> mConf;
    std::map<std::string, std::string> mVethPeers;
    int mNextIndex;
    bool mNonLocalBind;
    bool mIpv6Disabled;
};
