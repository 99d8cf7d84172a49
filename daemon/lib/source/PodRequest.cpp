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
 * File:   PodRequest.cpp
 *
 */
#include "PodRequest.h"

#include <memory>
#include <sstream>


// -----------------------------------------------------------------------------
/**
 *  @brief Splits a CNI_ARGS string of the form "K1=V1;K2=V2".
 *
 *  Empty entries are skipped, an entry without a '=' or with an empty key is
 *  an error.
 */
bool parseCniArgs(const std::string &cniArgs,
                  std::map<std::string, std::string> *args,
                  std::string *error)
{
    args->clear();

    std::istringstream argsStream(cniArgs);
    std::string entry;

    while (std::getline(argsStream, entry, ';'))
    {
        if (entry.empty())
            continue;

        const size_t equals = entry.find('=');
        if ((equals == std::string::npos) || (equals == 0))
        {
            *error = "invalid CNI_ARGS entry '" + entry + "'";
            args->clear();
            return false;
        }

        (*args)[entry.substr(0, equals)] = entry.substr(equals + 1);
    }

    return true;
}

boost::optional<std::string> PodRequest::arg(const std::string &key) const
{
    auto it = args.find(key);
    if (it == args.end())
        return boost::none;

    return it->second;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Short description of the request used in the log.
 */
std::string PodRequest::toString() const
{
    std::ostringstream str;
    str << commandName << ' ' << containerId
        << " netns=" << netns
        << " ifname=" << ifName;

    if (!args.empty())
    {
        str << " args=";
        bool first = true;
        for (const auto &arg : args)
        {
            str << (first ? "" : ";") << arg.first << '=' << arg.second;
            first = false;
        }
    }

    if (!ports.empty())
        str << " ports=" << ports;

    return str.str();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads an optional string field of the "env" object.
 */
static bool readEnvString(const Json::Value &env, const char *key,
                          std::string *value, std::string *error)
{
    const Json::Value &field = env[key];
    if (field.isNull())
        return true;

    if (!field.isString())
    {
        *error = std::string("invalid '") + key + "', expected a string";
        return false;
    }

    *value = field.asString();
    return true;
}

boost::optional<PodRequest> PodRequest::fromJson(const Json::Value &json,
                                                 std::string *error)
{
    if (!json.isObject())
    {
        *error = "request is not a JSON object";
        return boost::none;
    }

    const Json::Value &env = json["env"];
    if (!env.isObject())
    {
        *error = "missing or invalid 'env' object";
        return boost::none;
    }

    PodRequest request;

    std::string cniArgs;
    if (!readEnvString(env, "CNI_COMMAND", &request.commandName, error) ||
        !readEnvString(env, "CNI_CONTAINERID", &request.containerId, error) ||
        !readEnvString(env, "CNI_NETNS", &request.netns, error) ||
        !readEnvString(env, "CNI_IFNAME", &request.ifName, error) ||
        !readEnvString(env, "CNI_ARGS", &cniArgs, error) ||
        !readEnvString(env, "CNI_PATH", &request.cniPath, error))
    {
        return boost::none;
    }

    if (request.commandName.empty())
    {
        *error = "missing CNI_COMMAND";
        return boost::none;
    }
    if (request.containerId.empty())
    {
        *error = "missing CNI_CONTAINERID";
        return boost::none;
    }
    if (request.ifName.empty())
    {
        request.ifName = "eth0";
    }

    if (request.commandName == "ADD")
        request.command = Command::Add;
    else if (request.commandName == "DEL")
        request.command = Command::Del;
    else
        request.command = Command::Unknown;

    if (!parseCniArgs(cniArgs, &request.args, error))
        return boost::none;

    const Json::Value &ports = json["ports"];
    if (ports.isString())
    {
        request.ports = ports.asString();
    }
    else if (!ports.isNull())
    {
        *error = "invalid 'ports', expected a string";
        return boost::none;
    }

    const Json::Value &config = json["config"];
    if (config.isObject())
    {
        request.config = config;
    }
    else if (!config.isNull())
    {
        *error = "invalid 'config', expected an object";
        return boost::none;
    }

    return request;
}

boost::optional<PodRequest> PodRequest::fromString(const std::string &str,
                                                   std::string *error)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(str.data(), str.data() + str.size(), &root, &errors))
    {
        *error = "failed to parse request - " + errors;
        return boost::none;
    }

    return fromJson(root, error);
}
