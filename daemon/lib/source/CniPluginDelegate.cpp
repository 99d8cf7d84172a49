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
 * File:   CniPluginDelegate.cpp
 *
 */
#include "CniPluginDelegate.h"

#include <Logging.h>
#include <ProcessUtilities.h>

#include <cerrno>
#include <memory>
#include <unistd.h>


namespace
{

bool writeString(int fd, const std::string &str)
{
    const char *s = str.data();
    size_t n = str.size();

    while (n > 0)
    {
        ssize_t written = TEMP_FAILURE_RETRY(write(fd, s, n));
        if (written <= 0)
            return false;

        s += written;
        n -= written;
    }

    return true;
}

bool parseJson(const std::string &str, Json::Value *json)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;

    return reader->parse(str.data(), str.data() + str.size(), json, &errors);
}

} // namespace


CniPluginDelegate::CniPluginDelegate(const std::string &pluginDir,
                                     const Json::Value &defaultConfig)
    : mPluginDir(pluginDir)
    , mDefaultConfig(defaultConfig)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the network config to pass to the plugin.
 */
const Json::Value &CniPluginDelegate::networkConfig(const PodRequest &request) const
{
    if (request.config.isObject() && !request.config.empty())
        return request.config;

    return mDefaultConfig;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Builds the CNI_* environment variables for the plugin.
 *
 *  CNI_ARGS is rebuilt from the parsed key/value pairs, CNI_PATH falls back
 *  to the plugin directory.
 */
std::list<std::string> CniPluginDelegate::pluginEnvironment(const PodRequest &request) const
{
    std::string cniArgs;
    for (const auto &arg : request.args)
    {
        if (!cniArgs.empty())
            cniArgs += ';';
        cniArgs += arg.first + "=" + arg.second;
    }

    std::list<std::string> envs;
    envs.emplace_back("CNI_COMMAND=" + request.commandName);
    envs.emplace_back("CNI_CONTAINERID=" + request.containerId);
    envs.emplace_back("CNI_NETNS=" + request.netns);
    envs.emplace_back("CNI_IFNAME=" + request.ifName);
    envs.emplace_back("CNI_ARGS=" + cniArgs);
    envs.emplace_back("CNI_PATH=" + (request.cniPath.empty() ? mPluginDir : request.cniPath));

    return envs;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Runs the plugin with @a input on stdin and captures its stdout.
 *
 *  The output is captured even if the plugin fails, it usually holds the
 *  error object.
 */
bool CniPluginDelegate::execPlugin(const std::string &pluginPath,
                                   const std::list<std::string> &envs,
                                   const std::string &input,
                                   std::string *output) const
{
    int stdinFd = PodNetCommon::createMemFd("cni-plugin-stdin");
    if (stdinFd < 0)
        return false;

    if (!writeString(stdinFd, input) || (lseek(stdinFd, 0, SEEK_SET) < 0))
    {
        PN_LOG_SYS_ERROR(errno, "failed to fill memfd buffer");
        close(stdinFd);
        return false;
    }

    int stdoutFd = PodNetCommon::createMemFd("cni-plugin-stdout");
    if (stdoutFd < 0)
    {
        close(stdinFd);
        return false;
    }

    int exitCode = -1;
    const bool success = PodNetCommon::forkExec(pluginPath, { }, envs,
                                                stdinFd, stdoutFd, -1,
                                                &exitCode);
    if (!success)
    {
        if (exitCode == 127)
            PN_LOG_ERROR("failed to exec plugin '%s'", pluginPath.c_str());
        else
            PN_LOG_ERROR("plugin '%s' failed with exit code %d",
                         pluginPath.c_str(), exitCode);
    }

    *output = PodNetCommon::readFdContents(stdoutFd);

    if (close(stdoutFd) != 0)
        PN_LOG_SYS_ERROR(errno, "failed to close memfd");
    if (close(stdinFd) != 0)
        PN_LOG_SYS_ERROR(errno, "failed to close memfd");

    return success;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Gets the "msg" (and "details") from a CNI error object.
 */
std::string CniPluginDelegate::pluginErrorMessage(const std::string &output)
{
    Json::Value json;
    if (!parseJson(output, &json) || !json.isObject() || !json["msg"].isString())
        return std::string();

    std::string message = json["msg"].asString();
    if (json["details"].isString() && !json["details"].asString().empty())
        message += ": " + json["details"].asString();

    return message;
}

bool CniPluginDelegate::runPlugin(const PodRequest &request,
                                  std::string *output,
                                  std::string *error) const
{
    const Json::Value &config = networkConfig(request);
    if (!config.isObject() || !config["type"].isString() ||
        config["type"].asString().empty())
    {
        *error = "network config has no plugin 'type'";
        return false;
    }

    const std::string type = config["type"].asString();
    if (type.find('/') != std::string::npos)
    {
        *error = "invalid plugin type '" + type + "'";
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    const std::string input = Json::writeString(builder, config);

    const std::string pluginPath = mPluginDir + "/" + type;

    if (!execPlugin(pluginPath, pluginEnvironment(request), input, output))
    {
        const std::string message = pluginErrorMessage(*output);
        *error = "plugin '" + type + "' failed";
        if (!message.empty())
            *error += ": " + message;

        return false;
    }

    return true;
}

bool CniPluginDelegate::add(const PodRequest &request, AllocationResult *result,
                            std::string *error)
{
    PN_LOG_FN_ENTRY();

    std::string output;
    if (!runPlugin(request, &output, error))
    {
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    Json::Value json;
    if (!parseJson(output, &json))
    {
        *error = "failed to parse plugin result";
        PN_LOG_ERROR_EXIT("%s '%s'", error->c_str(), output.c_str());
        return false;
    }

    std::string parseError;
    const boost::optional<AllocationResult> parsed =
        AllocationResult::fromJson(json, &parseError);
    if (!parsed)
    {
        *error = "invalid plugin result, " + parseError;
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    *result = parsed.get();

    PN_LOG_FN_EXIT();
    return true;
}

bool CniPluginDelegate::del(const PodRequest &request, std::string *error)
{
    PN_LOG_FN_ENTRY();

    std::string output;
    if (!runPlugin(request, &output, error))
    {
        PN_LOG_ERROR_EXIT("%s", error->c_str());
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}
