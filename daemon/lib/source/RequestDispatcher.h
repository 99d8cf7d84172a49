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
 * File:   RequestDispatcher.h
 *
 */
#ifndef REQUESTDISPATCHER_H
#define REQUESTDISPATCHER_H

#include "IBackendDelegate.h"

#include <IPortMapper.h>
#include <PortMappingStore.h>

#include <memory>
#include <string>
#include <functional>


// -----------------------------------------------------------------------------
/**
 *  @class RequestDispatcher
 *  @brief Runs a single ADD or DEL request against the backend and keeps the
 *  port mappings in step with it.
 *
 *  A container has a store entry only while its port mapping rules are
 *  installed.  Requests are independent of each other and may be handled on
 *  any thread.
 */
class RequestDispatcher
{
public:
    typedef std::function<bool(const std::string &netnsPath)> Ipv6Disabler;

    RequestDispatcher(const std::shared_ptr<IBackendDelegate> &delegate,
                      const std::shared_ptr<PortMappingStore> &store,
                      const std::shared_ptr<IPortMapper> &portMapper,
                      const Ipv6Disabler &ipv6Disabler = nullptr);
    ~RequestDispatcher() = default;

public:
    bool handle(const PodRequest &request, std::string *response,
                std::string *error);

private:
    bool handleAdd(const PodRequest &request, std::string *response,
                   std::string *error);
    bool handleDel(const PodRequest &request, std::string *error);

    bool addPortMappings(const PodRequest &request,
                         const AllocationResult &result,
                         std::string *error);

private:
    const std::shared_ptr<IBackendDelegate> mDelegate;
    const std::shared_ptr<PortMappingStore> mStore;
    const std::shared_ptr<IPortMapper> mPortMapper;
    const Ipv6Disabler mIpv6Disabler;
};

#endif // !defined(REQUESTDISPATCHER_H)
