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
 * File:   AllocationResult.h
 *
 */
#ifndef ALLOCATIONRESULT_H
#define ALLOCATIONRESULT_H

#include <list>
#include <string>
#include <cstdint>
#include <arpa/inet.h>

#include <json/json.h>
#include <boost/optional.hpp>


// -----------------------------------------------------------------------------
/**
 *  @struct AllocationResult
 *  @brief The network a backend gave a pod, returned to the runtime.
 *
 *  Addresses are in host byte order.  Serialised in the CNI 0.2.0 format
 *
 *      {
 *          "cniVersion": "0.2.0",
 *          "ip4": {
 *              "ip": "10.1.2.3/24",
 *              "gateway": "10.1.2.1",
 *              "routes": [ { "dst": "0.0.0.0/0", "gw": "10.1.2.1" } ]
 *          },
 *          "dns": { "nameservers": [ "10.0.0.2" ] }
 *      }
 *
 *  When parsing plugin output the 0.3.0+ "ips" / "routes" layout is also
 *  accepted.
 */
struct AllocationResult
{
    struct Route
    {
        in_addr_t destination = 0;
        uint8_t prefixLen = 0;
        in_addr_t gateway = 0;
    };

    struct Ipv4Config
    {
        in_addr_t address = 0;
        uint8_t prefixLen = 32;
        in_addr_t gateway = 0;
        std::list<Route> routes;
    };

    boost::optional<Ipv4Config> ip4;
    std::list<std::string> nameservers;

    std::string podIP() const;

    Json::Value toJson() const;
    std::string toString() const;

    static boost::optional<AllocationResult> fromJson(const Json::Value &json,
                                                      std::string *error);
};

#endif // !defined(ALLOCATIONRESULT_H)
