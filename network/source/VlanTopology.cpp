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
 * File:   VlanTopology.cpp
 *
 */
#include "VlanTopology.h"
#include "CompensatingActions.h"

#include <Logging.h>


VlanTopology::VlanTopology(const std::shared_ptr<INetlink> &netlink,
                           const NetworkConfig &config)
    : mNetlink(netlink)
    , mConfig(config)
    , mParentIndex(-1)
    , mDeviceIndex(-1)
{
}

bool VlanTopology::isMacvlan() const
{
    return (mConfig.switchMode == SwitchMode::Macvlan);
}

bool VlanTopology::isIpvlan() const
{
    return (mConfig.switchMode == SwitchMode::Ipvlan);
}

bool VlanTopology::isPure() const
{
    return (mConfig.switchMode == SwitchMode::Pure);
}

const NetworkConfig &VlanTopology::config() const
{
    return mConfig;
}

int VlanTopology::parentIndex() const
{
    std::lock_guard<std::mutex> locker(mLock);
    return mParentIndex;
}

int VlanTopology::deviceIndex() const
{
    std::lock_guard<std::mutex> locker(mLock);
    return mDeviceIndex;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the name of the bridge pods on the given vlan attach to.
 *
 *  In pure mode there is no bridge for untagged traffic, so an empty string
 *  is returned for vlan 0.
 */
std::string VlanTopology::bridgeNameForVlan(uint16_t vlanId) const
{
    if ((vlanId == 0) && isPure())
        return std::string();

    if (vlanId == 0)
        return mConfig.defaultBridgeName;

    return mConfig.bridgeNamePrefix + std::to_string(vlanId);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Looks up a device by name and, if it doesn't exist, calls
 *  @a create once and looks it up again.
 *
 *  @return the device, or boost::none if it couldn't be found or created.
 */
boost::optional<NetworkDevice> VlanTopology::getOrCreateDevice(const std::string &name,
                                                               const CreateStrategy &create)
{
    boost::optional<NetworkDevice> device = mNetlink->getLink(name);
    if (device)
        return device;

    if (!create(name))
    {
        PN_LOG_ERROR("failed to add device '%s'", name.c_str());
        return boost::none;
    }

    device = mNetlink->getLink(name);
    if (!device)
    {
        PN_LOG_ERROR("failed to get device '%s' after creating it", name.c_str());
        return boost::none;
    }

    return device;
}

boost::optional<NetworkDevice> VlanTopology::getOrCreateBridge(const std::string &name,
                                                               const boost::optional<MacAddress> &mac)
{
    boost::optional<NetworkDevice> bridge =
        getOrCreateDevice(name, [&](const std::string &bridgeName)
                          {
                              return mNetlink->createBridge(bridgeName, mac);
                          });

    if (bridge && (bridge->kind != NetworkDevice::Kind::Bridge))
    {
        PN_LOG_ERROR("device '%s' exists but is not a bridge", name.c_str());
        return boost::none;
    }

    return bridge;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Searches all links for a vlan device with the given tag on our
 *  parent device.
 *
 *  The vlan device may have been created by someone else with a name that
 *  doesn't follow our prefix, which is why this matches on tag and parent
 *  rather than name.
 *
 *  @return false if the links couldn't be listed, not finding a device is
 *  not an error.
 */
bool VlanTopology::findVlanDevice(uint16_t vlanId,
                                  boost::optional<NetworkDevice> *found) const
{
    std::list<NetworkDevice> links;
    if (!mNetlink->listLinks(&links))
    {
        PN_LOG_ERROR("failed to list links");
        return false;
    }

    for (const NetworkDevice &link : links)
    {
        switch (link.kind)
        {
            case NetworkDevice::Kind::VlanSubInterface:
                if (link.vlan && (link.vlan->vlanId == vlanId) &&
                    (link.vlan->parentIndex == mParentIndex))
                {
                    *found = link;
                    return true;
                }
                break;

            case NetworkDevice::Kind::Physical:
            case NetworkDevice::Kind::Bridge:
                break;
        }
    }

    *found = boost::none;
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Gets the vlan device for the tag, creating it if required.
 *
 *  Must be called with mLock held.  On success the device becomes the
 *  currently resolved device.
 */
boost::optional<NetworkDevice> VlanTopology::getOrCreateVlanDevice(uint16_t vlanId)
{
    boost::optional<NetworkDevice> vlan;
    if (!findVlanDevice(vlanId, &vlan))
    {
        return boost::none;
    }

    if (vlan)
    {
        PN_LOG_DEBUG("found existing vlan device '%s' for vlan %hu",
                     vlan->name.c_str(), vlanId);
        mDeviceIndex = vlan->index;
        return vlan;
    }

    const std::string vlanName = mConfig.vlanNamePrefix + std::to_string(vlanId);
    const int parentIndex = mParentIndex;

    vlan = getOrCreateDevice(vlanName, [&](const std::string &name)
                             {
                                 return mNetlink->createVlan(name, vlanId, parentIndex);
                             });
    if (!vlan)
    {
        return boost::none;
    }

    // a device with our name may belong to another parent or tag
    if ((vlan->kind != NetworkDevice::Kind::VlanSubInterface) || !vlan->vlan ||
        (vlan->vlan->vlanId != vlanId) || (vlan->vlan->parentIndex != parentIndex))
    {
        PN_LOG_ERROR("device '%s' exists but is not vlan %hu on parent index %d",
                     vlanName.c_str(), vlanId, parentIndex);
        return boost::none;
    }

    if (!mNetlink->ifaceUp(vlan->index))
    {
        PN_LOG_ERROR("failed to set up vlan device '%s'", vlanName.c_str());
        return boost::none;
    }

    mDeviceIndex = vlan->index;
    return vlan;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Gets the bridge the vlan device is enslaved to.
 *
 *  @a master is left empty if the vlan device has no master, or its master
 *  isn't a bridge.
 *
 *  @return false if @a vlan isn't a vlan device or its master couldn't be
 *  read.
 */
bool VlanTopology::getVlanMaster(const NetworkDevice &vlan,
                                 boost::optional<NetworkDevice> *master) const
{
    *master = boost::none;

    if (vlan.kind != NetworkDevice::Kind::VlanSubInterface)
    {
        PN_LOG_ERROR("device '%s' is not a vlan device", vlan.name.c_str());
        return false;
    }

    if (!vlan.hasMaster())
    {
        return true;
    }

    boost::optional<NetworkDevice> link = mNetlink->getLinkByIndex(vlan.masterIndex);
    if (!link)
    {
        PN_LOG_ERROR("failed to get master %d of vlan device '%s'",
                     vlan.masterIndex, vlan.name.c_str());
        return false;
    }

    if (link->kind == NetworkDevice::Kind::Bridge)
    {
        *master = link;
    }
    else
    {
        PN_LOG_WARN("vlan device '%s' has non-bridge master '%s'",
                    vlan.name.c_str(), link->name.c_str());
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Resolves the parent device and prepares the host for the
 *  configured switch mode.
 *
 *  In bridge mode, if the device still has its IPv4 addresses they are
 *  moved onto the default bridge and the device is enslaved to it.  If the
 *  device has no addresses it's assumed a previous run already did this and
 *  we just check it's enslaved to the default bridge.
 *
 *  @return true on success, false on failure.
 */
bool VlanTopology::init()
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    boost::optional<NetworkDevice> device = mNetlink->getLink(mConfig.device);
    if (!device)
    {
        PN_LOG_ERROR_EXIT("failed to get device '%s'", mConfig.device.c_str());
        return false;
    }

    mDeviceIndex = device->index;
    mParentIndex = device->index;

    if ((device->kind == NetworkDevice::Kind::VlanSubInterface) && device->vlan)
    {
        mParentIndex = device->vlan->parentIndex;
        PN_LOG_INFO("device '%s' is a vlan device, parent index %d",
                    device->name.c_str(), mParentIndex);
    }

    PN_LOG_MILESTONE("root device '%s' (index %d), vlan parent index %d, "
                     "switch mode %s", device->name.c_str(), mDeviceIndex,
                     mParentIndex, switchModeToString(mConfig.switchMode));

    if (isMacvlan() || isIpvlan())
    {
        PN_LOG_FN_EXIT();
        return true;
    }

    if (isPure())
    {
        bool success = setupPureMode();
        PN_LOG_FN_EXIT();
        return success;
    }

    if (mConfig.disableDefaultBridge == TriState::True)
    {
        PN_LOG_INFO("default bridge disabled");
        PN_LOG_FN_EXIT();
        return true;
    }

    std::list<Ipv4Address> addresses;
    if (!mNetlink->listIpv4Addresses(device->index, &addresses))
    {
        PN_LOG_ERROR_EXIT("error getting ipv4 addresses of '%s'",
                          device->name.c_str());
        return false;
    }

    addresses.remove_if([](const Ipv4Address &address)
                        {
                            return address.isLoopback();
                        });

    bool success;
    if (addresses.empty())
        success = checkDefaultBridgeMaster(device.get());
    else
        success = migrateAddresses(device.get(), addresses);

    PN_LOG_FN_EXIT();
    return success;
}

bool VlanTopology::setupPureMode()
{
    if (!mNetlink->setIfaceConf("all", "arp_ignore", 0) ||
        !mNetlink->setIfaceConf(mConfig.device, "arp_ignore", 0) ||
        !mNetlink->setIfaceConf(mConfig.device, "proxy_arp", 1))
    {
        PN_LOG_ERROR("failed to configure arp on '%s'", mConfig.device.c_str());
        return false;
    }

    if (!mNetlink->setNonLocalBind(true))
    {
        PN_LOG_ERROR("failed to enable non-local bind");
        return false;
    }

    return true;
}

bool VlanTopology::checkDefaultBridgeMaster(const NetworkDevice &device) const
{
    boost::optional<NetworkDevice> bridge = mNetlink->getLink(mConfig.defaultBridgeName);
    if (!bridge)
    {
        PN_LOG_ERROR("error getting bridge device '%s'",
                     mConfig.defaultBridgeName.c_str());
        return false;
    }

    if (bridge->index != device.masterIndex)
    {
        PN_LOG_ERROR("no available address found on device '%s'",
                     device.name.c_str());
        return false;
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Moves the device's addresses and routes onto the default bridge
 *  and enslaves the device to it.
 *
 *  Each step that succeeds pushes its undo action, so if any later step
 *  fails the host is put back the way it was: the addresses are back on the
 *  device, the device is released from the bridge and the original routes
 *  are re-added.  The bridge itself is left in place.
 *
 *  @param[in]  device      The physical (or vlan) device.
 *  @param[in]  addresses   The non-loopback IPv4 addresses of the device.
 *
 *  @return true on success, false on failure.
 */
bool VlanTopology::migrateAddresses(const NetworkDevice &device,
                                    const std::list<Ipv4Address> &addresses)
{
    PN_LOG_FN_ENTRY();

    const std::shared_ptr<INetlink> netlink = mNetlink;
    const std::string &bridgeName = mConfig.defaultBridgeName;

    boost::optional<NetworkDevice> bridge = getOrCreateBridge(bridgeName, device.mac);
    if (!bridge)
    {
        PN_LOG_ERROR_EXIT("failed to get or create bridge '%s'",
                          bridgeName.c_str());
        return false;
    }

    if (!netlink->ifaceUp(bridge->index))
    {
        PN_LOG_ERROR_EXIT("failed to set up bridge device '%s'",
                          bridgeName.c_str());
        return false;
    }

    std::list<Ipv4Route> routes;
    if (!netlink->listIpv4Routes(device.index, &routes))
    {
        PN_LOG_ERROR_EXIT("failed to list routes of device '%s'",
                          device.name.c_str());
        return false;
    }

    CompensatingActions undo;

    // pushed first so it runs last, once the addresses are back
    undo.push("restore routes on " + device.name,
              [netlink, routes]()
              {
                  bool success = true;
                  for (const Ipv4Route &route : routes)
                  {
                      if (!netlink->addRoute(route))
                          success = false;
                  }
                  return success;
              });

    const int deviceIndex = device.index;
    const int bridgeIndex = bridge->index;

    for (const Ipv4Address &address : addresses)
    {
        const std::string addrStr = ipv4AddressToString(address);

        if (!netlink->delAddress(deviceIndex, address))
        {
            PN_LOG_ERROR("failed to remove %s from device '%s'",
                         addrStr.c_str(), device.name.c_str());
            undo.rollback();
            PN_LOG_FN_EXIT();
            return false;
        }

        undo.push("re-add " + addrStr + " to " + device.name,
                  [netlink, deviceIndex, address]()
                  {
                      return netlink->addAddress(deviceIndex, address);
                  });

        // the label is prefixed with the old device name, which the kernel
        // won't accept on the bridge
        Ipv4Address bridgeAddress = address;
        bridgeAddress.label.clear();

        if (!netlink->addAddress(bridgeIndex, bridgeAddress))
        {
            PN_LOG_ERROR("failed to add %s to bridge device '%s'",
                         addrStr.c_str(), bridgeName.c_str());
            undo.rollback();
            PN_LOG_FN_EXIT();
            return false;
        }

        undo.push("remove " + addrStr + " from " + bridgeName,
                  [netlink, bridgeIndex, bridgeAddress]()
                  {
                      return netlink->delAddress(bridgeIndex, bridgeAddress);
                  });
    }

    if (!netlink->setMaster(deviceIndex, bridgeIndex))
    {
        PN_LOG_ERROR("failed to add device '%s' to bridge device '%s'",
                     device.name.c_str(), bridgeName.c_str());
        undo.rollback();
        PN_LOG_FN_EXIT();
        return false;
    }

    undo.push("release " + device.name + " from " + bridgeName,
              [netlink, deviceIndex]()
              {
                  return netlink->setMaster(deviceIndex, 0);
              });

    for (const Ipv4Route &route : routes)
    {
        Ipv4Route bridgeRoute = route;
        bridgeRoute.ifIndex = bridgeIndex;

        if (!netlink->addRoute(bridgeRoute))
        {
            PN_LOG_ERROR("failed to add route '%s'",
                         ipv4RouteToString(bridgeRoute).c_str());
            undo.rollback();
            PN_LOG_FN_EXIT();
            return false;
        }
    }

    undo.commit();

    PN_LOG_MILESTONE("moved %zu address(es) and %zu route(s) from '%s' to "
                     "bridge '%s'", addresses.size(), routes.size(),
                     device.name.c_str(), bridgeName.c_str());

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Gets the name of the bridge to attach pods on the vlan to,
 *  creating the vlan device and bridge if they don't exist.
 *
 *  If the vlan device is already enslaved to a bridge then that bridge is
 *  used as is, whatever its name.  Vlan 0 doesn't need any devices and just
 *  returns the default bridge name (or nothing in pure mode).
 *
 *  @param[in]  vlanId      The vlan tag.
 *  @param[out] bridgeName  Set to the bridge name on success.
 *
 *  @return true on success, false on failure.
 */
bool VlanTopology::provisionBridgeForVlan(uint16_t vlanId, std::string *bridgeName)
{
    PN_LOG_FN_ENTRY();

    if (vlanId == 0)
    {
        *bridgeName = bridgeNameForVlan(0);
        PN_LOG_FN_EXIT();
        return true;
    }

    std::lock_guard<std::mutex> locker(mLock);

    boost::optional<NetworkDevice> vlan = getOrCreateVlanDevice(vlanId);
    if (!vlan)
    {
        PN_LOG_ERROR_EXIT("failed to get vlan device for vlan %hu", vlanId);
        return false;
    }

    boost::optional<NetworkDevice> master;
    if (!getVlanMaster(vlan.get(), &master))
    {
        PN_LOG_FN_EXIT();
        return false;
    }

    if (master)
    {
        *bridgeName = master->name;
        PN_LOG_FN_EXIT();
        return true;
    }

    const std::string name = mConfig.bridgeNamePrefix + std::to_string(vlanId);

    boost::optional<NetworkDevice> bridge = getOrCreateBridge(name, boost::none);
    if (!bridge)
    {
        PN_LOG_ERROR_EXIT("failed to get or create bridge '%s'", name.c_str());
        return false;
    }

    if (vlan->masterIndex != bridge->index)
    {
        if (!mNetlink->setMaster(vlan->index, bridge->index))
        {
            PN_LOG_ERROR_EXIT("failed to add vlan device '%s' to bridge device "
                              "'%s'", vlan->name.c_str(), name.c_str());
            return false;
        }
    }

    if (!mNetlink->ifaceUp(bridge->index))
    {
        PN_LOG_ERROR_EXIT("failed to set up bridge device '%s'", name.c_str());
        return false;
    }

    if (isPure() && !mNetlink->setIfaceConf(name, "proxy_arp", 1))
    {
        PN_LOG_ERROR_EXIT("failed to enable proxy arp on '%s'", name.c_str());
        return false;
    }

    PN_LOG_INFO("vlan %hu uses bridge '%s'", vlanId, name.c_str());

    *bridgeName = name;

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Creates the vlan device for the tag if it doesn't exist, without
 *  attaching it to a bridge.
 */
bool VlanTopology::ensureVlanDevice(uint16_t vlanId)
{
    if (vlanId == 0)
        return true;

    std::lock_guard<std::mutex> locker(mLock);
    return static_cast<bool>(getOrCreateVlanDevice(vlanId));
}
