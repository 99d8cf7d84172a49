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
 * File:   Settings.h
 *
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include <IPodNetSettings.h>

#include <json/json.h>

#include <memory>


// -----------------------------------------------------------------------------
/**
 *  @class Settings
 *  @brief Object containing the settings passed to the PodNet daemon.
 *
 *  Usually this is the parsed content of a JSON file, invalid values are
 *  logged and replaced with their defaults.
 *
 *      {
 *          "server": { "socketPath": "/var/run/podnet/podnet.sock" },
 *          "backend": "bridge",
 *          "network": { "device": "eth1", "switch": "bridge" },
 *          "cni": { "pluginDir": "/opt/cni/bin", "delegate": { ... } },
 *          "portMapping": { "stateDir": "/var/lib/podnet/ports" },
 *          "firewall": {
 *              "ebtablesFile": "/etc/sysconfig/podnet-ebtable-filter",
 *              "ebtablesIntervalSec": 300,
 *              "iptablesIntervalSec": 60
 *          },
 *          "disableIpv6": true
 *      }
 *
 */
class Settings final : public IPodNetSettings
{
private:
    Settings();
    explicit Settings(const Json::Value& settings);

public:
    ~Settings() final = default;

    static std::shared_ptr<Settings> fromJsonFile(const std::string& filePath);
    static std::shared_ptr<Settings> defaultSettings();

public:
    std::string socketPath() const override;
    Backend backend() const override;
    Json::Value networkConfig() const override;

    std::string cniPluginDir() const override;
    Json::Value cniDelegateConfig() const override;

    std::string portMappingStateDir() const override;
    FirewallSettings firewallSettings() const override;

    bool disableIpv6() const override;

    void dump(int pnLogLevel = -1) const;

private:
    void setDefaults();

    static void getPath(const Json::Value& root, const char* path,
                        std::string* value);
    static void getInterval(const Json::Value& root, const char* path,
                            std::chrono::seconds* value);

private:
    std::string mSocketPath;
    Backend mBackend;
    Json::Value mNetworkConfig;
    std::string mCniPluginDir;
    Json::Value mCniDelegateConfig;
    std::string mPortMappingStateDir;
    FirewallSettings mFirewallSettings;
    bool mDisableIpv6;
};

#endif // !defined(SETTINGS_H)
