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
#include "FakeKernel.h"

#include <algorithm>


FakeKernel::FakeKernel()
    : mNextIndex(1)
    , mNonLocalBind(false)
    , mIpv6Disabled(false)
{
    NetworkDevice lo;
    lo.name = "lo";
    addLink(lo);
}

int FakeKernel::addLink(const NetworkDevice &device)
{
    Link link;
    link.device = device;
    link.device.index = mNextIndex++;

    mLinks[link.device.index] = link;
    return link.device.index;
}

const FakeKernel::Link *FakeKernel::findLink(const std::string &name) const
{
    for (const auto &entry : mLinks)
    {
        if (entry.second.device.name == name)
            return &entry.second;
    }

    return nullptr;
}

int FakeKernel::addPhysical(const std::string &name, const MacAddress &mac)
{
    NetworkDevice device;
    device.kind = NetworkDevice::Kind::Physical;
    device.name = name;
    device.mac = mac;

    return addLink(device);
}

int FakeKernel::addVlanDevice(const std::string &name, uint16_t vlanId, int parentIndex)
{
    NetworkDevice device;
    device.kind = NetworkDevice::Kind::VlanSubInterface;
    device.name = name;
    device.vlan = VlanInfo{ vlanId, parentIndex };

    return addLink(device);
}

int FakeKernel::addBridgeDevice(const std::string &name)
{
    NetworkDevice device;
    device.kind = NetworkDevice::Kind::Bridge;
    device.name = name;

    return addLink(device);
}

// sets the master without the bridge check setMaster() does
void FakeKernel::forceMaster(int ifIndex, int masterIndex)
{
    auto it = mLinks.find(ifIndex);
    if (it != mLinks.end())
        it->second.device.masterIndex = masterIndex;
}

boost::optional<NetworkDevice> FakeKernel::device(const std::string &name) const
{
    return getLink(name);
}

bool FakeKernel::isUp(const std::string &name) const
{
    const Link *link = findLink(name);
    return link && link->up;
}

std::list<Ipv4Address> FakeKernel::addresses(const std::string &name) const
{
    const Link *link = findLink(name);
    if (!link)
        return { };

    return link->addresses;
}

std::list<Ipv4Route> FakeKernel::routes(const std::string &name) const
{
    std::list<Ipv4Route> routes;

    const Link *link = findLink(name);
    if (link)
        listIpv4Routes(link->device.index, &routes);

    return routes;
}

std::list<Ipv4Route> FakeKernel::allRoutes() const
{
    return mRoutes;
}

size_t FakeKernel::linkCount(NetworkDevice::Kind kind) const
{
    return std::count_if(mLinks.begin(), mLinks.end(),
                         [kind](const std::pair<const int, Link> &entry)
                         {
                             return entry.second.device.kind == kind;
                         });
}

int FakeKernel::conf(const std::string &ifaceName, const std::string &conf) const
{
    auto it = mConf.find(ifaceName + "/" + conf);
    if (it == mConf.end())
        return -1;

    return it->second;
}

std::string FakeKernel::vethPeer(const std::string &hostName) const
{
    auto it = mVethPeers.find(hostName);
    if (it == mVethPeers.end())
        return std::string();

    return it->second;
}

boost::optional<NetworkDevice> FakeKernel::getLink(const std::string &name) const
{
    const Link *link = findLink(name);
    if (!link)
        return boost::none;

    return link->device;
}

boost::optional<NetworkDevice> FakeKernel::getLinkByIndex(int ifIndex) const
{
    auto it = mLinks.find(ifIndex);
    if (it == mLinks.end())
        return boost::none;

    return it->second.device;
}

bool FakeKernel::listLinks(std::list<NetworkDevice> *links) const
{
    links->clear();
    for (const auto &entry : mLinks)
        links->push_back(entry.second.device);

    return true;
}

bool FakeKernel::createBridge(const std::string &name,
                              const boost::optional<MacAddress> &mac)
{
    if (findLink(name))
        return false;

    NetworkDevice device;
    device.kind = NetworkDevice::Kind::Bridge;
    device.name = name;
    if (mac)
        device.mac = mac.get();

    const int index = addLink(device);
    mLinks[index].up = true;
    return true;
}

bool FakeKernel::createVlan(const std::string &name, uint16_t vlanId,
                            int parentIndex)
{
    if (findLink(name) || (mLinks.count(parentIndex) == 0))
        return false;

    addVlanDevice(name, vlanId, parentIndex);
    return true;
}

bool FakeKernel::createVethPair(const std::string &hostName,
                                const std::string &peerName,
                                int netnsFd)
{
    if ((netnsFd < 0) || findLink(hostName))
        return false;

    NetworkDevice device;
    device.kind = NetworkDevice::Kind::Physical;
    device.name = hostName;
    addLink(device);

    mVethPeers[hostName] = peerName;
    return true;
}

bool FakeKernel::deleteLink(int ifIndex)
{
    auto it = mLinks.find(ifIndex);
    if (it == mLinks.end())
        return false;

    mVethPeers.erase(it->second.device.name);
    mLinks.erase(it);

    mRoutes.remove_if([ifIndex](const Ipv4Route &route)
                      {
                          return route.ifIndex == ifIndex;
                      });

    for (auto &entry : mLinks)
    {
        if (entry.second.device.masterIndex == ifIndex)
            entry.second.device.masterIndex = 0;
    }

    return true;
}

bool FakeKernel::setMaster(int ifIndex, int masterIndex)
{
    auto it = mLinks.find(ifIndex);
    if (it == mLinks.end())
        return false;

    if (masterIndex != 0)
    {
        auto master = mLinks.find(masterIndex);
        if ((master == mLinks.end()) ||
            (master->second.device.kind != NetworkDevice::Kind::Bridge))
            return false;
    }

    it->second.device.masterIndex = masterIndex;
    return true;
}

bool FakeKernel::ifaceUp(int ifIndex)
{
    auto it = mLinks.find(ifIndex);
    if (it == mLinks.end())
        return false;

    it->second.up = true;
    return true;
}

bool FakeKernel::listIpv4Addresses(int ifIndex, std::list<Ipv4Address> *addresses) const
{
    auto it = mLinks.find(ifIndex);
    if (it == mLinks.end())
        return false;

    *addresses = it->second.addresses;
    return true;
}

bool FakeKernel::addAddress(int ifIndex, const Ipv4Address &address)
{
    auto it = mLinks.find(ifIndex);
    if (it == mLinks.end())
        return false;

    std::list<Ipv4Address> &addresses = it->second.addresses;
    if (std::find(addresses.begin(), addresses.end(), address) == addresses.end())
        addresses.push_back(address);

    return true;
}

bool FakeKernel::delAddress(int ifIndex, const Ipv4Address &address)
{
    auto it = mLinks.find(ifIndex);
    if (it == mLinks.end())
        return false;

    std::list<Ipv4Address> &addresses = it->second.addresses;
    auto addr = std::find(addresses.begin(), addresses.end(), address);
    if (addr == addresses.end())
        return false;

    addresses.erase(addr);
    return true;
}

bool FakeKernel::listIpv4Routes(int ifIndex, std::list<Ipv4Route> *routes) const
{
    if (mLinks.count(ifIndex) == 0)
        return false;

    routes->clear();
    for (const Ipv4Route &route : mRoutes)
    {
        if (route.ifIndex == ifIndex)
            routes->push_back(route);
    }

    return true;
}

bool FakeKernel::addRoute(const Ipv4Route &route)
{
    auto it = mLinks.find(route.ifIndex);
    if ((it == mLinks.end()) || !it->second.up)
        return false;

    if (std::find(mRoutes.begin(), mRoutes.end(), route) == mRoutes.end())
        mRoutes.push_back(route);

    return true;
}

bool FakeKernel::setIfaceConf(const std::string &ifaceName,
                              const std::string &conf, int value)
{
    if ((ifaceName != "all") && (ifaceName != "default") && !findLink(ifaceName))
        return false;

    mConf[ifaceName + "/" + conf] = value;
    return true;
}

bool FakeKernel::setNonLocalBind(bool enable)
{
    mNonLocalBind = enable;
    return true;
}

bool FakeKernel::setIpv6Disabled(bool disable)
{
    mIpv6Disabled = disable;
    return true;
}
