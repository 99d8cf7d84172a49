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
 * File:   NetworkConfig.h
 *
 */
#ifndef NETWORKCONFIG_H
#define NETWORKCONFIG_H

#include <string>

#include <json/json.h>
#include <boost/optional.hpp>


#define PODNET_DEFAULT_BRIDGE_NAME      "docker"
#define PODNET_BRIDGE_NAME_PREFIX       "docker"
#define PODNET_VLAN_NAME_PREFIX         "vlan"


enum class SwitchMode
{
    Bridge,
    Macvlan,
    Ipvlan,
    Pure
};

// -----------------------------------------------------------------------------
/**
 *  @enum TriState
 *  @brief Boolean config value that may also be absent from the config.
 */
enum class TriState
{
    Unset,
    False,
    True
};

// -----------------------------------------------------------------------------
/**
 *  @struct NetworkConfig
 *  @brief The host network topology config, i.e. the parent device and how
 *  bridges and vlan devices are named.
 *
 *  Parsed from a JSON object of the form
 *
 *      {
 *          "device": "eth1",
 *          "switch": "bridge",
 *          "disable_default_bridge": false,
 *          "default_bridge_name": "docker",
 *          "bridge_name_prefix": "docker",
 *          "vlan_name_prefix": "vlan"
 *      }
 *
 *  Any other fields (cniVersion, name, type, ...) are ignored.  Empty or
 *  missing names are replaced with the defaults above.
 */
struct NetworkConfig
{
    std::string device;
    SwitchMode switchMode = SwitchMode::Bridge;
    TriState disableDefaultBridge = TriState::Unset;
    std::string defaultBridgeName = PODNET_DEFAULT_BRIDGE_NAME;
    std::string bridgeNamePrefix = PODNET_BRIDGE_NAME_PREFIX;
    std::string vlanNamePrefix = PODNET_VLAN_NAME_PREFIX;

    static boost::optional<NetworkConfig> fromJson(const Json::Value &json,
                                                   std::string *error);
    static boost::optional<NetworkConfig> fromString(const std::string &str,
                                                     std::string *error);
};

const char* switchModeToString(SwitchMode mode);

#endif // !defined(NETWORKCONFIG_H)
