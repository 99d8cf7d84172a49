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
 * File:   VlanTopology.h
 *
 */
#ifndef VLANTOPOLOGY_H
#define VLANTOPOLOGY_H

#include "INetlink.h"
#include "NetworkConfig.h"

#include <string>
#include <list>
#include <mutex>
#include <memory>
#include <functional>

#include <boost/optional.hpp>


// -----------------------------------------------------------------------------
/**
 *  @class VlanTopology
 *  @brief Builds and reuses the vlan sub-interfaces and bridges that pod
 *  veths are attached to.
 *
 *  The topology for vlan tag N is
 *
 *      <device> ── <vlanNamePrefix>N ── [master] <bridgeNamePrefix>N
 *
 *  and tag 0 maps to the default bridge, which the physical device itself
 *  is enslaved to.  Devices are looked up before they are created, so every
 *  operation can be repeated safely.  Vlan and bridge devices are never
 *  deleted; they are shared by every pod on the same vlan.
 *
 *  All device creation is serialised by a lock held in this object, the lock
 *  does not protect against a second process doing the same thing.
 */
class VlanTopology
{
public:
    VlanTopology(const std::shared_ptr<INetlink> &netlink,
                 const NetworkConfig &config);
    ~VlanTopology() = default;

    VlanTopology(const VlanTopology&) = delete;
    VlanTopology& operator=(const VlanTopology&) = delete;

public:
    bool isMacvlan() const;
    bool isIpvlan() const;
    bool isPure() const;

    std::string bridgeNameForVlan(uint16_t vlanId) const;

    const NetworkConfig &config() const;

public:
    bool init();

    bool provisionBridgeForVlan(uint16_t vlanId, std::string *bridgeName);
    bool ensureVlanDevice(uint16_t vlanId);

public:
    int parentIndex() const;
    int deviceIndex() const;

private:
    typedef std::function<bool(const std::string &name)> CreateStrategy;

    boost::optional<NetworkDevice> getOrCreateDevice(const std::string &name,
                                                     const CreateStrategy &create);
    boost::optional<NetworkDevice> getOrCreateBridge(const std::string &name,
                                                     const boost::optional<MacAddress> &mac);
    boost::optional<NetworkDevice> getOrCreateVlanDevice(uint16_t vlanId);

    bool findVlanDevice(uint16_t vlanId, boost::optional<NetworkDevice> *found) const;
    bool getVlanMaster(const NetworkDevice &vlan,
                       boost::optional<NetworkDevice> *master) const;

    bool setupPureMode();
    bool checkDefaultBridgeMaster(const NetworkDevice &device) const;
    bool migrateAddresses(const NetworkDevice &device,
                          const std::list<Ipv4Address> &addresses);

private:
    const std::shared_ptr<INetlink> mNetlink;
    const NetworkConfig mConfig;

    mutable std::mutex mLock;
    int mParentIndex;
    int mDeviceIndex;
};

#endif // !defined(VLANTOPOLOGY_H)
