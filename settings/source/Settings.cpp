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
 * File:   Settings.cpp
 *
 */

#include "Settings.h"

#include <Logging.h>

#include <cerrno>
#include <istream>
#include <ext/stdio_filebuf.h>

#include <fcntl.h>
#include <unistd.h>


#define PODNET_DEFAULT_SOCKET_PATH      "/var/run/podnet/podnet.sock"
#define PODNET_DEFAULT_PLUGIN_DIR       "/opt/cni/bin"
#define PODNET_DEFAULT_STATE_DIR        "/var/lib/podnet/ports"
#define PODNET_DEFAULT_EBTABLES_FILE    "/etc/sysconfig/podnet-ebtable-filter"


// -----------------------------------------------------------------------------
/**
 *  @brief Returns the settings with all the default values.
 *
 */
std::shared_ptr<Settings> Settings::defaultSettings()
{
    return std::shared_ptr<Settings>(new Settings());
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads the settings from a JSON file.
 *
 *  @return the settings or nullptr if the file couldn't be opened or parsed.
 */
std::shared_ptr<Settings> Settings::fromJsonFile(const std::string& filePath)
{
    // try and open the config file
    int configFileFd = open(filePath.c_str(), O_CLOEXEC | O_RDONLY);
    if (configFileFd < 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to open config file @ '%s'",
                         filePath.c_str());
        return nullptr;
    }

    // wrap the fd in a c++ file buf, it will close the fd on destruction
    __gnu_cxx::stdio_filebuf<char> fileBuf(configFileFd, std::ios::in);
    std::istream fileStream(&fileBuf);

    Json::CharReaderBuilder builder;
    builder["allowComments"] = true;
    builder["collectComments"] = false;

    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, fileStream, &root, &errs))
    {
        PN_LOG_ERROR("failed to parse JSON config file @ '%s' due to - %s",
                     filePath.c_str(), errs.c_str());
        return nullptr;
    }

    if (!root.isObject())
    {
        PN_LOG_ERROR("config file @ '%s' is not a JSON object", filePath.c_str());
        return nullptr;
    }

    return std::shared_ptr<Settings>(new Settings(root));
}

// -----------------------------------------------------------------------------
/**
 *  @brief Constructs the settings object with the default settings.
 *
 */
Settings::Settings()
{
    setDefaults();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Constructs the settings source the data from the supplied JSON
 *  object.
 *
 */
Settings::Settings(const Json::Value& settings)
{
    // defaults first
    setDefaults();

    // process the paths
    getPath(settings, ".server.socketPath", &mSocketPath);
    getPath(settings, ".cni.pluginDir", &mCniPluginDir);
    getPath(settings, ".portMapping.stateDir", &mPortMappingStateDir);

    // the ebtables file may be set to an empty string to switch it off
    {
        Json::Value ebtablesFile = Json::Path(".firewall.ebtablesFile").resolve(settings);
        if (ebtablesFile.isString())
            mFirewallSettings.ebtablesFile = ebtablesFile.asString();
        else if (!ebtablesFile.isNull())
            PN_LOG_ERROR("invalid 'firewall.ebtablesFile' field in JSON file");
    }

    getInterval(settings, ".firewall.ebtablesIntervalSec",
                &mFirewallSettings.ebtablesInterval);
    getInterval(settings, ".firewall.iptablesIntervalSec",
                &mFirewallSettings.iptablesInterval);

    // process the backend
    {
        Json::Value backend = Json::Path(".backend").resolve(settings);
        if (backend.isString() && (backend.asString() == "bridge"))
            mBackend = Backend::Bridge;
        else if (backend.isString() && (backend.asString() == "exec"))
            mBackend = Backend::Exec;
        else if (!backend.isNull())
            PN_LOG_ERROR("invalid 'backend' field in JSON file, expected "
                         "\"bridge\" or \"exec\"");
    }

    // the network and delegate configs are passed on as is, they're
    // validated by their consumers
    {
        Json::Value network = Json::Path(".network").resolve(settings);
        if (network.isObject())
            mNetworkConfig = network;
        else if (!network.isNull())
            PN_LOG_ERROR("invalid 'network' field in JSON file, expected an object");

        Json::Value delegate = Json::Path(".cni.delegate").resolve(settings);
        if (delegate.isObject())
            mCniDelegateConfig = delegate;
        else if (!delegate.isNull())
            PN_LOG_ERROR("invalid 'cni.delegate' field in JSON file, expected an object");
    }

    {
        Json::Value disableIpv6 = Json::Path(".disableIpv6").resolve(settings);
        if (disableIpv6.isBool())
            mDisableIpv6 = disableIpv6.asBool();
        else if (!disableIpv6.isNull())
            PN_LOG_ERROR("invalid 'disableIpv6' field in JSON file, expected a bool");
    }
}

// -----------------------------------------------------------------------------
/**
 *  @brief Sets the default values for all settings.
 *
 */
void Settings::setDefaults()
{
    mSocketPath = PODNET_DEFAULT_SOCKET_PATH;
    mBackend = Backend::Bridge;
    mNetworkConfig = Json::Value(Json::objectValue);
    mCniPluginDir = PODNET_DEFAULT_PLUGIN_DIR;
    mCniDelegateConfig = Json::Value(Json::objectValue);
    mPortMappingStateDir = PODNET_DEFAULT_STATE_DIR;
    mFirewallSettings.ebtablesFile = PODNET_DEFAULT_EBTABLES_FILE;
    mFirewallSettings.ebtablesInterval = std::chrono::seconds(300);
    mFirewallSettings.iptablesInterval = std::chrono::seconds(60);
    mDisableIpv6 = true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads an absolute path from the JSON, @a value is left untouched
 *  if the field is missing or invalid.
 */
void Settings::getPath(const Json::Value& root, const char* path,
                       std::string* value)
{
    const Json::Value field = Json::Path(path).resolve(root);
    if (field.isNull())
        return;

    if (!field.isString() || field.asString().empty() ||
        (field.asString()[0] != '/'))
    {
        PN_LOG_ERROR("invalid '%s' field in JSON file, expected an absolute path",
                     path + 1);
        return;
    }

    *value = field.asString();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads a positive number of seconds from the JSON.
 */
void Settings::getInterval(const Json::Value& root, const char* path,
                           std::chrono::seconds* value)
{
    const Json::Value field = Json::Path(path).resolve(root);
    if (field.isNull())
        return;

    if (!field.isUInt() || (field.asUInt() == 0))
    {
        PN_LOG_ERROR("invalid '%s' field in JSON file, expected a positive "
                     "number of seconds", path + 1);
        return;
    }

    *value = std::chrono::seconds(field.asUInt());
}

std::string Settings::socketPath() const
{
    return mSocketPath;
}

IPodNetSettings::Backend Settings::backend() const
{
    return mBackend;
}

Json::Value Settings::networkConfig() const
{
    return mNetworkConfig;
}

std::string Settings::cniPluginDir() const
{
    return mCniPluginDir;
}

Json::Value Settings::cniDelegateConfig() const
{
    return mCniDelegateConfig;
}

std::string Settings::portMappingStateDir() const
{
    return mPortMappingStateDir;
}

IPodNetSettings::FirewallSettings Settings::firewallSettings() const
{
    return mFirewallSettings;
}

bool Settings::disableIpv6() const
{
    return mDisableIpv6;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Debugging function to dump the settings to the log - info level.
 *
 *
 */
void Settings::dump(int pnLogLevel) const
{
    if (pnLogLevel < 0)
        pnLogLevel = PN_DEBUG_LEVEL_INFO;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    __PN_LOG_PRINTF(pnLogLevel, "settings.server.socketPath='%s'", mSocketPath.c_str());
    __PN_LOG_PRINTF(pnLogLevel, "settings.backend='%s'",
                    (mBackend == Backend::Bridge) ? "bridge" : "exec");
    __PN_LOG_PRINTF(pnLogLevel, "settings.network=%s",
                    Json::writeString(builder, mNetworkConfig).c_str());
    __PN_LOG_PRINTF(pnLogLevel, "settings.cni.pluginDir='%s'", mCniPluginDir.c_str());
    __PN_LOG_PRINTF(pnLogLevel, "settings.cni.delegate=%s",
                    Json::writeString(builder, mCniDelegateConfig).c_str());
    __PN_LOG_PRINTF(pnLogLevel, "settings.portMapping.stateDir='%s'",
                    mPortMappingStateDir.c_str());
    __PN_LOG_PRINTF(pnLogLevel, "settings.firewall.ebtablesFile='%s'",
                    mFirewallSettings.ebtablesFile.c_str());
    __PN_LOG_PRINTF(pnLogLevel, "settings.firewall.ebtablesIntervalSec=%lld",
                    static_cast<long long>(mFirewallSettings.ebtablesInterval.count()));
    __PN_LOG_PRINTF(pnLogLevel, "settings.firewall.iptablesIntervalSec=%lld",
                    static_cast<long long>(mFirewallSettings.iptablesInterval.count()));
    __PN_LOG_PRINTF(pnLogLevel, "settings.disableIpv6=%s", mDisableIpv6 ? "true" : "false");
}
