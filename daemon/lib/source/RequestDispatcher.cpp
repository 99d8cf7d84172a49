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
 * File:   RequestDispatcher.cpp
 *
 */
#include "RequestDispatcher.h"

#include <Logging.h>

#include <ctime>
#include <sys/time.h>


namespace
{

std::string timestamp()
{
    struct timeval tv;
    gettimeofday(&tv, nullptr);

    struct tm tm;
    localtime_r(&tv.tv_sec, &tm);

    char buf[64];
    size_t len = strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    snprintf(buf + len, sizeof(buf) - len, ".%06ld", static_cast<long>(tv.tv_usec));

    return std::string(buf);
}

} // namespace


RequestDispatcher::RequestDispatcher(const std::shared_ptr<IBackendDelegate> &delegate,
                                     const std::shared_ptr<PortMappingStore> &store,
                                     const std::shared_ptr<IPortMapper> &portMapper,
                                     const Ipv6Disabler &ipv6Disabler)
    : mDelegate(delegate)
    , mStore(store)
    , mPortMapper(portMapper)
    , mIpv6Disabler(ipv6Disabler)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Handles a single request from the runtime.
 *
 *  @param[in]  request     The parsed request.
 *  @param[out] response    The JSON result for ADD, empty for DEL.
 *  @param[out] error       Why the request failed.
 *
 *  @return true if the request succeeded.
 */
bool RequestDispatcher::handle(const PodRequest &request, std::string *response,
                               std::string *error)
{
    const std::string requestStr = request.toString();
    PN_LOG_MILESTONE("%s, %s+", requestStr.c_str(), timestamp().c_str());

    response->clear();
    error->clear();

    bool success = false;
    switch (request.command)
    {
        case PodRequest::Command::Add:
            success = handleAdd(request, response, error);
            break;
        case PodRequest::Command::Del:
            success = handleDel(request, error);
            break;
        case PodRequest::Command::Unknown:
            *error = "unknown CNI_COMMAND '" + request.commandName + "'";
            break;
    }

    PN_LOG_MILESTONE("%s, data %s, err %s, %s-", requestStr.c_str(),
                     response->c_str(), error->c_str(), timestamp().c_str());

    return success;
}

bool RequestDispatcher::handleAdd(const PodRequest &request, std::string *response,
                                  std::string *error)
{
    PN_LOG_FN_ENTRY();

    if (mIpv6Disabler && !mIpv6Disabler(request.netns))
    {
        PN_LOG_WARN("failed to disable ipv6 in '%s'", request.netns.c_str());
    }

    AllocationResult result;
    if (!mDelegate->add(request, &result, error))
    {
        PN_LOG_ERROR_EXIT("backend failed to add '%s' - %s",
                          request.containerId.c_str(), error->c_str());
        return false;
    }

    if (!request.ports.empty() && !addPortMappings(request, result, error))
    {
        PN_LOG_FN_EXIT();
        return false;
    }

    *response = result.toString();

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Parses the port spec, records the mappings and installs the rules.
 *
 *  If the rules can't be installed the record is removed again, as are any
 *  rules that did get in.  The pod's network is left as the backend set it
 *  up, the runtime follows a failed ADD with a DEL.
 */
bool RequestDispatcher::addPortMappings(const PodRequest &request,
                                        const AllocationResult &result,
                                        std::string *error)
{
    PortMappings mappings;
    if (!parsePortSpec(request.ports, &mappings, error))
    {
        PN_LOG_ERROR("%s", error->c_str());
        return false;
    }

    if (mappings.empty())
        return true;

    const std::string podIP = result.podIP();
    if (podIP.empty())
    {
        *error = "port mappings requested but the pod has no IPv4 address";
        PN_LOG_ERROR("%s", error->c_str());
        return false;
    }

    for (PortMapping &mapping : mappings)
        mapping.podIP = podIP;

    if (!mStore->save(request.containerId, mappings))
    {
        *error = "failed to save port mappings";
        PN_LOG_ERROR("%s for '%s'", error->c_str(), request.containerId.c_str());
        return false;
    }

    if (!mPortMapper->install(request.containerId, mappings))
    {
        *error = "failed to install port mappings";
        PN_LOG_ERROR("%s for '%s'", error->c_str(), request.containerId.c_str());

        if (!mPortMapper->uninstall(request.containerId, mappings))
            PN_LOG_ERROR("failed to remove partially installed port mappings");
        if (!mStore->remove(request.containerId))
            PN_LOG_ERROR("failed to remove saved port mappings");

        return false;
    }

    return true;
}

bool RequestDispatcher::handleDel(const PodRequest &request, std::string *error)
{
    PN_LOG_FN_ENTRY();

    if (!mDelegate->del(request, error))
    {
        PN_LOG_ERROR_EXIT("backend failed to delete '%s' - %s",
                          request.containerId.c_str(), error->c_str());
        return false;
    }

    boost::optional<PortMappings> mappings;
    if (!mStore->consume(request.containerId, &mappings))
    {
        *error = "failed to read saved port mappings";
        PN_LOG_ERROR_EXIT("%s for '%s'", error->c_str(), request.containerId.c_str());
        return false;
    }

    if (!mappings)
    {
        PN_LOG_DEBUG("no port mappings saved for '%s'", request.containerId.c_str());
    }
    else if (!mPortMapper->uninstall(request.containerId, mappings.get()))
    {
        *error = "failed to remove port mappings";
        PN_LOG_ERROR_EXIT("%s for '%s'", error->c_str(), request.containerId.c_str());
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}
