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
 * File:   BridgeDelegate.h
 *
 */
#ifndef BRIDGEDELEGATE_H
#define BRIDGEDELEGATE_H

#include "IBackendDelegate.h"

#include <INetlink.h>
#include <VlanTopology.h>

#include <memory>
#include <functional>


// -----------------------------------------------------------------------------
/**
 *  @class BridgeDelegate
 *  @brief Connects pods to the vlan bridges with a veth pair.
 *
 *  The address comes from the request's CNI_ARGS
 *
 *      VLAN=<tag>;IP=<a.b.c.d/n>[;GATEWAY=<a.b.c.d>]
 *
 *  The host end of the veth is named "pn" followed by the first 11
 *  characters of the container id and is enslaved to the bridge for the
 *  vlan.  In pure mode with tag 0 there is no bridge, the host end answers
 *  ARP for the pod and a host route points at it instead.
 */
class BridgeDelegate : public IBackendDelegate
{
public:
    typedef std::function<bool(INetlink &netlink)> NamespaceFunc;
    typedef std::function<bool(const std::string &netnsPath,
                               const NamespaceFunc &func)> NamespaceExecutor;

    BridgeDelegate(const std::shared_ptr<VlanTopology> &topology,
                   const std::shared_ptr<INetlink> &netlink,
                   const NamespaceExecutor &executor = inNetworkNamespace);
    ~BridgeDelegate() override = default;

public:
    bool add(const PodRequest &request, AllocationResult *result,
             std::string *error) override;

    bool del(const PodRequest &request, std::string *error) override;

public:
    static std::string hostVethName(const std::string &containerId);

    static bool inNetworkNamespace(const std::string &netnsPath,
                                   const NamespaceFunc &func);

private:
    struct PodAddress
    {
        uint16_t vlanId;
        in_addr_t address;
        uint8_t prefixLen;
        in_addr_t gateway;
    };

    static bool parseArgs(const PodRequest &request, PodAddress *podAddress,
                          std::string *error);

    bool attachHostVeth(const NetworkDevice &hostVeth,
                        const std::string &bridgeName,
                        const PodAddress &podAddress,
                        std::string *error);

    static bool configurePodInterface(INetlink &netlink,
                                      const std::string &ifName,
                                      const PodAddress &podAddress);

private:
    const std::shared_ptr<VlanTopology> mTopology;
    const std::shared_ptr<INetlink> mNetlink;
    const NamespaceExecutor mExecutor;
};

#endif // !defined(BRIDGEDELEGATE_H)
