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
 * File:   IPodNetSettings.h
 *
 */
#ifndef IPODNETSETTINGS_H
#define IPODNETSETTINGS_H

#include <chrono>
#include <string>

#include <json/json.h>

// -----------------------------------------------------------------------------
/**
 *  @class IPodNetSettings
 *  @brief Interface provided to the daemon at startup, contains the
 *  configuration options for PodNet.
 *
 */
class IPodNetSettings
{
public:
    virtual ~IPodNetSettings() = default;

public:
    // -------------------------------------------------------------------------
    /**
     *  @brief Should return the path of the unix socket the CNI requests are
     *  received on.
     *
     *  Any existing file at the path is removed when the server starts.
     */
    virtual std::string socketPath() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @enum Backend
     *  @brief What wires the pod namespace up.
     *
     *  Bridge does it in-process on top of the vlan topology, Exec runs an
     *  external CNI plugin.
     */
    enum class Backend
    {
        Bridge,
        Exec
    };

    virtual Backend backend() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Should return the host network topology config, in the format
     *  read by NetworkConfig::fromJson().
     *
     *  Only used by the bridge backend.
     */
    virtual Json::Value networkConfig() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief The directory the exec backend looks for plugin binaries in,
     *  and the network config handed to the plugin when the request doesn't
     *  carry one.
     */
    virtual std::string cniPluginDir() const = 0;
    virtual Json::Value cniDelegateConfig() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief The directory the installed port mappings are recorded in.
     */
    virtual std::string portMappingStateDir() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @struct FirewallSettings
     *  @brief The persisted ebtables rule file and how often the rules are
     *  re-applied.
     */
    struct FirewallSettings
    {
        std::string ebtablesFile;
        std::chrono::seconds ebtablesInterval;
        std::chrono::seconds iptablesInterval;
    };

    virtual FirewallSettings firewallSettings() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Whether IPv6 should be switched off inside new pod namespaces.
     */
    virtual bool disableIpv6() const = 0;
};

#endif // !defined(IPODNETSETTINGS_H)
