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
 * File:   IptablesPortMapper.cpp
 *
 */
#include "IptablesPortMapper.h"
#include "NetworkDevice.h"

#include <Logging.h>

#include <cstdio>


// -----------------------------------------------------------------------------
/**
 *  @brief Constructs the rule that sends locally destined packets from
 *  @a chain through the host port chain.
 *
 *      iptables -t nat -A <CHAIN> -m addrtype --dst-type LOCAL
 *               -j PODNET-HOSTPORTS
 */
std::string createHostPortJumpRule(const char *chain)
{
    return std::string(chain) + " "
           "-m addrtype --dst-type LOCAL "
           "-j " PODNET_HOSTPORTS_CHAIN;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Constructs the DNAT rule for a single mapping.
 *
 *      iptables -t nat -A PODNET-HOSTPORTS -p <PROTOCOL> -m <PROTOCOL>
 *               --dport <HOST_PORT> -m comment --comment <CONTAINER_ID>
 *               -j DNAT --to-destination <POD_IP>:<POD_PORT>
 *
 *  @return the rule, or an empty string if the mapping has no pod address.
 */
std::string createHostPortDnatRule(const PortMapping &mapping,
                                   const std::string &containerId)
{
    if (mapping.podIP.empty())
        return std::string();

    char buf[256] = {0};

    // We need to add -m <PROTOCOL> because it's automatically added by
    // iptables. If omitted, we won't be able to match the rule for deletion.
    snprintf(buf, sizeof(buf),
             PODNET_HOSTPORTS_CHAIN " "
             "-p %s "                           // protocol
             "-m %s "                           // protocol
             "--dport %u "                      // host port
             "-m comment --comment %s "         // container id
             "-j DNAT --to-destination %s:%u",  // pod address
             mapping.protocol.c_str(),
             mapping.protocol.c_str(),
             unsigned(mapping.hostPort),
             containerId.c_str(),
             mapping.podIP.c_str(),
             unsigned(mapping.podPort));

    return buf;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Constructs the FORWARD rule that lets the translated packets
 *  through to the pod.
 *
 *      iptables -I FORWARD -d <POD_IP>/32 -p <PROTOCOL> -m <PROTOCOL>
 *               --dport <POD_PORT> -m comment --comment <CONTAINER_ID>
 *               -j ACCEPT
 */
std::string createHostPortForwardRule(const PortMapping &mapping,
                                      const std::string &containerId)
{
    if (mapping.podIP.empty())
        return std::string();

    char buf[256] = {0};

    snprintf(buf, sizeof(buf),
             "FORWARD "
             "-d %s/32 "                        // pod address
             "-p %s "                           // protocol
             "-m %s "                           // protocol
             "--dport %u "                      // pod port
             "-m comment --comment %s "         // container id
             "-j ACCEPT",
             mapping.podIP.c_str(),
             mapping.protocol.c_str(),
             mapping.protocol.c_str(),
             unsigned(mapping.podPort),
             containerId.c_str());

    return buf;
}


IptablesPortMapper::IptablesPortMapper(const std::shared_ptr<Netfilter> &netfilter)
    : mNetfilter(netfilter)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Queues the host port chain and the jumps into it.
 */
bool IptablesPortMapper::queueBasicRules()
{
    if (!mNetfilter->createNewChain(Netfilter::TableType::Nat, PODNET_HOSTPORTS_CHAIN))
        return false;

    Netfilter::RuleSet jumpRules =
    {
        { Netfilter::TableType::Nat, { createHostPortJumpRule("PREROUTING"),
                                       createHostPortJumpRule("OUTPUT") } }
    };

    return mNetfilter->addRules(jumpRules, Netfilter::Operation::Append);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Queues the DNAT and FORWARD rules for every mapping, either to be
 *  added or to be deleted.
 */
bool IptablesPortMapper::queueMappingRules(const std::string &containerId,
                                           const PortMappings &mappings,
                                           bool remove)
{
    std::list<std::string> natRules;
    std::list<std::string> filterRules;

    for (const PortMapping &mapping : mappings)
    {
        in_addr_t podAddress;
        if (!parseIpv4(mapping.podIP, &podAddress))
        {
            PN_LOG_ERROR("port mapping %s for '%s' has no valid pod address",
                         portMappingToString(mapping).c_str(), containerId.c_str());
            return false;
        }

        natRules.emplace_back(createHostPortDnatRule(mapping, containerId));
        filterRules.emplace_back(createHostPortForwardRule(mapping, containerId));
    }

    Netfilter::RuleSet natRuleSet = { { Netfilter::TableType::Nat, natRules } };
    Netfilter::RuleSet filterRuleSet = { { Netfilter::TableType::Filter, filterRules } };

    if (remove)
    {
        return mNetfilter->addRules(natRuleSet, Netfilter::Operation::Delete) &&
               mNetfilter->addRules(filterRuleSet, Netfilter::Operation::Delete);
    }
    else
    {
        // the FORWARD rules go in at the top so they're ahead of any drop
        // rules already in the chain
        return mNetfilter->addRules(natRuleSet, Netfilter::Operation::Append) &&
               mNetfilter->addRules(filterRuleSet, Netfilter::Operation::Insert);
    }
}

// -----------------------------------------------------------------------------
/**
 *  @brief Installs the rules for all the mappings of a container.
 *
 *  The host port chain is created first if it's missing.
 */
bool IptablesPortMapper::install(const std::string &containerId,
                                 const PortMappings &mappings)
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (!queueBasicRules() ||
        !queueMappingRules(containerId, mappings, false))
    {
        mNetfilter->clearRules();
        PN_LOG_FN_EXIT();
        return false;
    }

    if (!mNetfilter->applyRules())
    {
        PN_LOG_ERROR_EXIT("failed to install port mappings for '%s'",
                          containerId.c_str());
        return false;
    }

    PN_LOG_INFO("installed %zu port mapping(s) for '%s'", mappings.size(),
                containerId.c_str());

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Removes the rules installed for the mappings of a container.
 *
 *  Rules that aren't there are skipped.
 */
bool IptablesPortMapper::uninstall(const std::string &containerId,
                                   const PortMappings &mappings)
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (!queueMappingRules(containerId, mappings, true))
    {
        mNetfilter->clearRules();
        PN_LOG_FN_EXIT();
        return false;
    }

    if (!mNetfilter->applyRules())
    {
        PN_LOG_ERROR_EXIT("failed to remove port mappings for '%s'",
                          containerId.c_str());
        return false;
    }

    PN_LOG_INFO("removed %zu port mapping(s) for '%s'", mappings.size(),
                containerId.c_str());

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief (Re)creates the host port chain and the jumps to it if anything
 *  has removed them.
 */
bool IptablesPortMapper::ensureBasicRules()
{
    std::lock_guard<std::mutex> locker(mLock);

    if (!queueBasicRules())
    {
        mNetfilter->clearRules();
        return false;
    }

    if (!mNetfilter->applyRules())
    {
        PN_LOG_ERROR("failed to restore the " PODNET_HOSTPORTS_CHAIN " rules");
        return false;
    }

    return true;
}
