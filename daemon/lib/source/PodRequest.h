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
 * File:   PodRequest.h
 *
 */
#ifndef PODREQUEST_H
#define PODREQUEST_H

#include <map>
#include <string>

#include <json/json.h>
#include <boost/optional.hpp>


// -----------------------------------------------------------------------------
/**
 *  @struct PodRequest
 *  @brief A single CNI invocation received from the container runtime.
 *
 *  Built from the JSON body of a /cni request
 *
 *      {
 *          "env": {
 *              "CNI_COMMAND": "ADD",
 *              "CNI_CONTAINERID": "...",
 *              "CNI_NETNS": "/proc/1234/ns/net",
 *              "CNI_IFNAME": "eth0",
 *              "CNI_ARGS": "VLAN=100;IP=10.1.2.3/24;GATEWAY=10.1.2.1",
 *              "CNI_PATH": "/opt/cni/bin"
 *          },
 *          "config": { ... },
 *          "ports": "8080:80/tcp"
 *      }
 *
 *  A command other than ADD or DEL is parsed as Unknown and rejected by the
 *  dispatcher, it is not a parse error.
 */
struct PodRequest
{
    enum class Command { Add, Del, Unknown };

    Command command = Command::Unknown;
    std::string commandName;
    std::string containerId;
    std::string netns;
    std::string ifName = "eth0";
    std::string cniPath;
    std::map<std::string, std::string> args;
    std::string ports;
    Json::Value config;

    boost::optional<std::string> arg(const std::string &key) const;

    std::string toString() const;

    static boost::optional<PodRequest> fromJson(const Json::Value &json,
                                                std::string *error);
    static boost::optional<PodRequest> fromString(const std::string &str,
                                                  std::string *error);
};

bool parseCniArgs(const std::string &cniArgs,
                  std::map<std::string, std::string> *args,
                  std::string *error);

#endif // !defined(PODREQUEST_H)
