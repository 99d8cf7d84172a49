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
 * File:   CniPluginDelegate.h
 *
 */
#ifndef CNIPLUGINDELEGATE_H
#define CNIPLUGINDELEGATE_H

#include "IBackendDelegate.h"

#include <list>
#include <string>

#include <json/json.h>


// -----------------------------------------------------------------------------
/**
 *  @class CniPluginDelegate
 *  @brief Hands the request to an external CNI plugin binary.
 *
 *  The plugin run is <pluginDir>/<type> where type is taken from the network
 *  config, the config itself is written to the plugin's stdin.  The config
 *  carried in the request is used if there is one, otherwise the one given
 *  at construction time.
 */
class CniPluginDelegate : public IBackendDelegate
{
public:
    CniPluginDelegate(const std::string &pluginDir,
                      const Json::Value &defaultConfig);
    ~CniPluginDelegate() override = default;

public:
    bool add(const PodRequest &request, AllocationResult *result,
             std::string *error) override;

    bool del(const PodRequest &request, std::string *error) override;

public:
    std::list<std::string> pluginEnvironment(const PodRequest &request) const;

    const Json::Value &networkConfig(const PodRequest &request) const;

protected:
    virtual bool execPlugin(const std::string &pluginPath,
                            const std::list<std::string> &envs,
                            const std::string &input,
                            std::string *output) const;

private:
    bool runPlugin(const PodRequest &request, std::string *output,
                   std::string *error) const;

    static std::string pluginErrorMessage(const std::string &output);

private:
    const std::string mPluginDir;
    const Json::Value mDefaultConfig;
};

#endif // !defined(CNIPLUGINDELEGATE_H)
