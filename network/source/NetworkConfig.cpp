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
 * File:   NetworkConfig.cpp
 *
 */
#include "NetworkConfig.h"

#include <memory>
#include <sstream>


const char* switchModeToString(SwitchMode mode)
{
    switch (mode)
    {
        case SwitchMode::Bridge:    return "bridge";
        case SwitchMode::Macvlan:   return "macvlan";
        case SwitchMode::Ipvlan:    return "ipvlan";
        case SwitchMode::Pure:      return "pure";
    }

    return "unknown";
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads an optional string field, an empty value leaves @a value
 *  untouched so the default is kept.
 */
static bool readOptionalString(const Json::Value &json, const char *key,
                               std::string *value, std::string *error)
{
    const Json::Value &field = json[key];
    if (field.isNull())
        return true;

    if (!field.isString())
    {
        *error = std::string("invalid '") + key + "' field, expected a string";
        return false;
    }

    if (!field.asString().empty())
        *value = field.asString();

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Parses the network config from a JSON object.
 *
 *  @param[in]  json    The JSON object.
 *  @param[out] error   Set to the reason on failure.
 *
 *  @return the config, or boost::none if the JSON is invalid.
 */
boost::optional<NetworkConfig> NetworkConfig::fromJson(const Json::Value &json,
                                                       std::string *error)
{
    if (!json.isObject())
    {
        *error = "network config is not a JSON object";
        return boost::none;
    }

    NetworkConfig config;

    const Json::Value &device = json["device"];
    if (!device.isString() || device.asString().empty())
    {
        *error = "missing or invalid 'device' field";
        return boost::none;
    }
    config.device = device.asString();

    const Json::Value &switchMode = json["switch"];
    if (!switchMode.isNull())
    {
        if (!switchMode.isString())
        {
            *error = "invalid 'switch' field, expected a string";
            return boost::none;
        }

        const std::string mode = switchMode.asString();
        if (mode.empty() || (mode == "bridge"))
            config.switchMode = SwitchMode::Bridge;
        else if (mode == "macvlan")
            config.switchMode = SwitchMode::Macvlan;
        else if (mode == "ipvlan")
            config.switchMode = SwitchMode::Ipvlan;
        else if (mode == "pure")
            config.switchMode = SwitchMode::Pure;
        else
        {
            *error = "unsupported switch mode '" + mode + "'";
            return boost::none;
        }
    }

    const Json::Value &disableDefaultBridge = json["disable_default_bridge"];
    if (!disableDefaultBridge.isNull())
    {
        if (!disableDefaultBridge.isBool())
        {
            *error = "invalid 'disable_default_bridge' field, expected a bool";
            return boost::none;
        }

        config.disableDefaultBridge = disableDefaultBridge.asBool() ?
                                      TriState::True : TriState::False;
    }

    if (!readOptionalString(json, "default_bridge_name", &config.defaultBridgeName, error) ||
        !readOptionalString(json, "bridge_name_prefix", &config.bridgeNamePrefix, error) ||
        !readOptionalString(json, "vlan_name_prefix", &config.vlanNamePrefix, error))
    {
        return boost::none;
    }

    return config;
}

boost::optional<NetworkConfig> NetworkConfig::fromString(const std::string &str,
                                                         std::string *error)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(str.data(), str.data() + str.size(), &root, &errors))
    {
        *error = "failed to parse network config - " + errors;
        return boost::none;
    }

    return fromJson(root, error);
}
