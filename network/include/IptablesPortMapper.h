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
 * File:   IptablesPortMapper.h
 *
 */
#ifndef IPTABLESPORTMAPPER_H
#define IPTABLESPORTMAPPER_H

#include "IPortMapper.h"
#include "Netfilter.h"

#include <memory>
#include <mutex>


#define PODNET_HOSTPORTS_CHAIN      "PODNET-HOSTPORTS"


// -----------------------------------------------------------------------------
/**
 *  @class IptablesPortMapper
 *  @brief Forwards host ports to pods with iptables DNAT rules.
 *
 *  All the DNAT rules live in their own nat chain which PREROUTING and OUTPUT
 *  jump to for locally destined packets.  Every rule carries the container
 *  id as its comment.
 *
 *      *nat
 *      -A PREROUTING -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS
 *      -A OUTPUT -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS
 *      -A PODNET-HOSTPORTS -p tcp -m tcp --dport 8080
 *                          -m comment --comment <id>
 *                          -j DNAT --to-destination 10.1.2.3:80
 *      *filter
 *      -I FORWARD -d 10.1.2.3/32 -p tcp -m tcp --dport 80
 *                 -m comment --comment <id> -j ACCEPT
 */
class IptablesPortMapper : public IPortMapper
{
public:
    explicit IptablesPortMapper(const std::shared_ptr<Netfilter> &netfilter);
    ~IptablesPortMapper() override = default;

public:
    bool install(const std::string &containerId,
                 const PortMappings &mappings) override;

    bool uninstall(const std::string &containerId,
                   const PortMappings &mappings) override;

    bool ensureBasicRules() override;

private:
    bool queueBasicRules();
    bool queueMappingRules(const std::string &containerId,
                           const PortMappings &mappings,
                           bool remove);

private:
    std::mutex mLock;
    const std::shared_ptr<Netfilter> mNetfilter;
};

std::string createHostPortJumpRule(const char *chain);

std::string createHostPortDnatRule(const PortMapping &mapping,
                                   const std::string &containerId);

std::string createHostPortForwardRule(const PortMapping &mapping,
                                      const std::string &containerId);

#endif // !defined(IPTABLESPORTMAPPER_H)
