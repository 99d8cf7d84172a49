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
 * File:   BridgeDelegate.cpp
 *
 */
#include "BridgeDelegate.h"

#include <CompensatingActions.h>
#include <Netlink.h>

#include <Logging.h>
#include <ProcessUtilities.h>

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>
#include <linux/rtnetlink.h>


#define HOST_VETH_PREFIX        "pn"
#define HOST_VETH_ID_CHARS      11


BridgeDelegate::BridgeDelegate(const std::shared_ptr<VlanTopology> &topology,
                               const std::shared_ptr<INetlink> &netlink,
                               const NamespaceExecutor &executor)
    : mTopology(topology)
    , mNetlink(netlink)
    , mExecutor(executor)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Gets the name of the host end of the veth pair for a container.
 *
 *  Interface names are limited to 15 characters.
 */
std::string BridgeDelegate::hostVethName(const std::string &containerId)
{
    return HOST_VETH_PREFIX + containerId.substr(0, HOST_VETH_ID_CHARS);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Runs @a func with a netlink connection opened inside the network
 *  namespace at @a netnsPath.
 */
bool BridgeDelegate::inNetworkNamespace(const std::string &netnsPath,
                                        const NamespaceFunc &func)
{
    return PodNetCommon::callInNetworkNamespace(netnsPath,
        [&func]()
        {
            Netlink netlink;
            if (!netlink.isValid())
            {
                PN_LOG_ERROR("failed to open netlink socket in pod namespace");
                return false;
            }

            return func(netlink);
        });
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads the vlan tag, address and gateway from the CNI_ARGS.
 */
bool BridgeDelegate::parseArgs(const PodRequest &request, PodAddress *podAddress,
                               std::string *error)
{
    podAddress->vlanId = 0;
    podAddress->gateway = 0;

    const boost::optional<std::string> vlan = request.arg("VLAN");
    if (vlan && !vlan->empty())
    {
        char *end = nullptr;
        errno = 0;
        const unsigned long vlanId = strtoul(vlan->c_str(), &end, 10);
        if ((errno != 0) || (end == nullptr) || (*end != '\0') || (vlanId > 4094))
        {
            *error = "invalid VLAN '" + vlan.get() + "'";
            return false;
        }

        podAddress->vlanId = static_cast<uint16_t>(vlanId);
    }

    const boost::optional<std::string> ip = request.arg("IP");
    if (!ip)
    {
        *error = "missing IP in CNI_ARGS";
        return false;
    }
    if (!parseIpv4Cidr(ip.get(), &podAddress->address, &podAddress->prefixLen))
    {
        *error = "invalid IP '" + ip.get() + "', expected a.b.c.d/n";
        return false;
    }

    const boost::optional<std::string> gateway = request.arg("GATEWAY");
    if (gateway && !gateway->empty() && !parseIpv4(gateway.get(), &podAddress->gateway))
    {
        *error = "invalid GATEWAY '" + gateway.get() + "'";
        return false;
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Connects the host end of the veth to the bridge (or in pure mode
 *  routes the pod address to it) and brings it up.
 */
bool BridgeDelegate::attachHostVeth(const NetworkDevice &hostVeth,
                                    const std::string &bridgeName,
                                    const PodAddress &podAddress,
                                    std::string *error)
{
    if (!bridgeName.empty())
    {
        const boost::optional<NetworkDevice> bridge = mNetlink->getLink(bridgeName);
        if (!bridge || (bridge->kind != NetworkDevice::Kind::Bridge))
        {
            *error = "bridge '" + bridgeName + "' not found";
            return false;
        }

        if (!mNetlink->setMaster(hostVeth.index, bridge->index))
        {
            *error = "failed to add '" + hostVeth.name + "' to bridge '" + bridgeName + "'";
            return false;
        }
    }
    else if (!mNetlink->setIfaceConf(hostVeth.name, "proxy_arp", 1))
    {
        *error = "failed to enable proxy arp on '" + hostVeth.name + "'";
        return false;
    }

    if (!mNetlink->ifaceUp(hostVeth.index))
    {
        *error = "failed to bring up '" + hostVeth.name + "'";
        return false;
    }

    if (bridgeName.empty())
    {
        Ipv4Route hostRoute;
        hostRoute.destination = podAddress.address;
        hostRoute.dstPrefixLen = 32;
        hostRoute.scope = RT_SCOPE_LINK;
        hostRoute.ifIndex = hostVeth.index;

        if (!mNetlink->addRoute(hostRoute))
        {
            *error = "failed to add host route to " + ipv4ToString(podAddress.address);
            return false;
        }
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Sets up the pod end of the veth, called from inside the pod's
 *  network namespace.
 */
bool BridgeDelegate::configurePodInterface(INetlink &netlink,
                                           const std::string &ifName,
                                           const PodAddress &podAddress)
{
    const boost::optional<NetworkDevice> iface = netlink.getLink(ifName);
    if (!iface)
    {
        PN_LOG_ERROR("failed to find '%s' in pod namespace", ifName.c_str());
        return false;
    }

    Ipv4Address address;
    address.local = podAddress.address;
    address.prefixLen = podAddress.prefixLen;

    if (!netlink.addAddress(iface->index, address))
    {
        PN_LOG_ERROR("failed to set address %s on '%s'",
                     ipv4AddressToString(address).c_str(), ifName.c_str());
        return false;
    }

    if (!netlink.ifaceUp(iface->index))
    {
        PN_LOG_ERROR("failed to bring up '%s'", ifName.c_str());
        return false;
    }

    const boost::optional<NetworkDevice> loopback = netlink.getLink("lo");
    if (!loopback || !netlink.ifaceUp(loopback->index))
    {
        PN_LOG_ERROR("failed to bring up loopback in pod namespace");
        return false;
    }

    if (podAddress.gateway != 0)
    {
        Ipv4Route defaultRoute;
        defaultRoute.gateway = podAddress.gateway;
        defaultRoute.ifIndex = iface->index;

        if (!netlink.addRoute(defaultRoute))
        {
            PN_LOG_ERROR("failed to add default route via %s",
                         ipv4ToString(podAddress.gateway).c_str());
            return false;
        }
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Creates the veth pair for the pod and attaches it to the bridge for
 *  the requested vlan.
 *
 *  On failure the veth pair is deleted again, the vlan and bridge devices
 *  are left in place.
 */
bool BridgeDelegate::add(const PodRequest &request, AllocationResult *result,
                         std::string *error)
{
    PN_LOG_FN_ENTRY();

    if (mTopology->isMacvlan() || mTopology->isIpvlan())
    {
        *error = std::string("switch mode ") +
                 switchModeToString(mTopology->config().switchMode) +
                 " is not supported by the bridge backend";
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    PodAddress podAddress;
    if (!parseArgs(request, &podAddress, error))
    {
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    std::string bridgeName;
    if (!mTopology->provisionBridgeForVlan(podAddress.vlanId, &bridgeName))
    {
        *error = "failed to set up bridge for vlan " + std::to_string(podAddress.vlanId);
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    const std::string hostName = hostVethName(request.containerId);

    // a veth left over from an earlier failed attempt would stop the create
    const boost::optional<NetworkDevice> stale = mNetlink->getLink(hostName);
    if (stale)
    {
        PN_LOG_WARN("removing stale veth '%s'", hostName.c_str());
        if (!mNetlink->deleteLink(stale->index))
        {
            *error = "failed to remove stale veth '" + hostName + "'";
            PN_LOG_ERROR_EXIT("%s", error->c_str());
            return false;
        }
    }

    int netnsFd = open(request.netns.c_str(), O_RDONLY | O_CLOEXEC);
    if (netnsFd < 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to open '%s'", request.netns.c_str());
        *error = "failed to open network namespace '" + request.netns + "'";
        PN_LOG_FN_EXIT();
        return false;
    }

    const bool created = mNetlink->createVethPair(hostName, request.ifName, netnsFd);

    if (close(netnsFd) != 0)
        PN_LOG_SYS_ERROR(errno, "failed to close namespace fd");

    if (!created)
    {
        *error = "failed to create veth pair '" + hostName + "'";
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    CompensatingActions undo;

    const boost::optional<NetworkDevice> hostVeth = mNetlink->getLink(hostName);
    if (!hostVeth)
    {
        *error = "failed to find veth '" + hostName + "' after creating it";
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    const std::shared_ptr<INetlink> netlink = mNetlink;
    const int hostIndex = hostVeth->index;
    undo.push("delete veth " + hostName,
              [netlink, hostIndex]() { return netlink->deleteLink(hostIndex); });

    if (!attachHostVeth(hostVeth.get(), bridgeName, podAddress, error))
    {
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    if (!mExecutor(request.netns,
                   [&](INetlink &podNetlink)
                   {
                       return configurePodInterface(podNetlink, request.ifName,
                                                    podAddress);
                   }))
    {
        *error = "failed to configure '" + request.ifName + "' in pod namespace";
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    undo.commit();

    AllocationResult::Ipv4Config ip4;
    ip4.address = podAddress.address;
    ip4.prefixLen = podAddress.prefixLen;
    ip4.gateway = podAddress.gateway;
    if (podAddress.gateway != 0)
    {
        AllocationResult::Route defaultRoute;
        defaultRoute.gateway = podAddress.gateway;
        ip4.routes.emplace_back(defaultRoute);
    }

    result->ip4 = ip4;

    PN_LOG_INFO("attached '%s' (%s) to '%s'", hostName.c_str(),
                ipv4ToString(podAddress.address).c_str(),
                bridgeName.empty() ? "<none>" : bridgeName.c_str());

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Deletes the host end of the pod's veth pair, which takes the pod
 *  end with it.
 *
 *  It's not an error if the veth is already gone.
 */
bool BridgeDelegate::del(const PodRequest &request, std::string *error)
{
    PN_LOG_FN_ENTRY();

    const std::string hostName = hostVethName(request.containerId);

    const boost::optional<NetworkDevice> hostVeth = mNetlink->getLink(hostName);
    if (!hostVeth)
    {
        PN_LOG_INFO("veth '%s' already removed", hostName.c_str());
        PN_LOG_FN_EXIT();
        return true;
    }

    if (!mNetlink->deleteLink(hostVeth->index))
    {
        *error = "failed to delete veth '" + hostName + "'";
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}
