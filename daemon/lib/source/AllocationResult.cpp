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
 * File:   AllocationResult.cpp
 *
 */
#include "AllocationResult.h"

#include <NetworkDevice.h>


std::string AllocationResult::podIP() const
{
    if (!ip4 || (ip4->address == 0))
        return std::string();

    return ipv4ToString(ip4->address);
}

Json::Value AllocationResult::toJson() const
{
    Json::Value json(Json::objectValue);
    json["cniVersion"] = "0.2.0";

    if (ip4)
    {
        Json::Value ip(Json::objectValue);
        ip["ip"] = ipv4ToString(ip4->address) + "/" + std::to_string(ip4->prefixLen);
        if (ip4->gateway != 0)
            ip["gateway"] = ipv4ToString(ip4->gateway);

        if (!ip4->routes.empty())
        {
            Json::Value routes(Json::arrayValue);
            for (const Route &route : ip4->routes)
            {
                Json::Value entry(Json::objectValue);
                entry["dst"] = ipv4ToString(route.destination) + "/" +
                               std::to_string(route.prefixLen);
                if (route.gateway != 0)
                    entry["gw"] = ipv4ToString(route.gateway);

                routes.append(entry);
            }
            ip["routes"] = routes;
        }

        json["ip4"] = ip;
    }

    if (!nameservers.empty())
    {
        Json::Value servers(Json::arrayValue);
        for (const std::string &server : nameservers)
            servers.append(server);

        json["dns"]["nameservers"] = servers;
    }

    return json;
}

std::string AllocationResult::toString() const
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    return Json::writeString(builder, toJson());
}

// -----------------------------------------------------------------------------
/**
 *  @brief Parses a list of {"dst": "a.b.c.d/n", "gw": "a.b.c.d"} routes.
 */
static bool parseRoutes(const Json::Value &json,
                        std::list<AllocationResult::Route> *routes,
                        std::string *error)
{
    if (json.isNull())
        return true;

    if (!json.isArray())
    {
        *error = "invalid 'routes', expected an array";
        return false;
    }

    for (const Json::Value &entry : json)
    {
        if (!entry.isObject())
        {
            *error = "invalid route entry";
            return false;
        }

        AllocationResult::Route route;

        const Json::Value &dst = entry["dst"];
        if (!dst.isString() ||
            !parseIpv4Cidr(dst.asString(), &route.destination, &route.prefixLen))
        {
            *error = "invalid route destination";
            return false;
        }

        const Json::Value &gw = entry["gw"];
        if (!gw.isNull() && (!gw.isString() || !parseIpv4(gw.asString(), &route.gateway)))
        {
            *error = "invalid route gateway";
            return false;
        }

        routes->emplace_back(route);
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Parses the result printed by a CNI plugin.
 *
 *  Only the first IPv4 entry of a 0.3.0+ "ips" list is kept, IPv6 entries
 *  are ignored.
 */
boost::optional<AllocationResult> AllocationResult::fromJson(const Json::Value &json,
                                                             std::string *error)
{
    if (!json.isObject())
    {
        *error = "result is not a JSON object";
        return boost::none;
    }

    AllocationResult result;

    const Json::Value &ip4 = json["ip4"];
    const Json::Value &ips = json["ips"];

    if (ip4.isObject())
    {
        Ipv4Config config;

        const Json::Value &ip = ip4["ip"];
        if (!ip.isString() || !parseIpv4Cidr(ip.asString(), &config.address, &config.prefixLen))
        {
            *error = "invalid 'ip4.ip' in result";
            return boost::none;
        }

        const Json::Value &gateway = ip4["gateway"];
        if (!gateway.isNull() &&
            (!gateway.isString() || !parseIpv4(gateway.asString(), &config.gateway)))
        {
            *error = "invalid 'ip4.gateway' in result";
            return boost::none;
        }

        if (!parseRoutes(ip4["routes"], &config.routes, error))
            return boost::none;

        result.ip4 = config;
    }
    else if (ips.isArray())
    {
        for (const Json::Value &entry : ips)
        {
            if (!entry.isObject())
            {
                *error = "invalid 'ips' entry in result";
                return boost::none;
            }

            const Json::Value &version = entry["version"];
            const Json::Value &address = entry["address"];

            Ipv4Config config;
            if (!address.isString() ||
                !parseIpv4Cidr(address.asString(), &config.address, &config.prefixLen))
            {
                // an IPv6 entry has a version of "6"
                if (version.isString() && (version.asString() == "6"))
                    continue;

                *error = "invalid 'ips' entry in result";
                return boost::none;
            }

            const Json::Value &gateway = entry["gateway"];
            if (gateway.isString() && !parseIpv4(gateway.asString(), &config.gateway))
            {
                *error = "invalid 'ips' gateway in result";
                return boost::none;
            }

            if (!parseRoutes(json["routes"], &config.routes, error))
                return boost::none;

            result.ip4 = config;
            break;
        }
    }
    else if (!ip4.isNull())
    {
        *error = "invalid 'ip4' in result";
        return boost::none;
    }

    const Json::Value &dns = json["dns"];
    if (dns.isObject() && dns["nameservers"].isArray())
    {
        for (const Json::Value &server : dns["nameservers"])
        {
            if (server.isString())
                result.nameservers.emplace_back(server.asString());
        }
    }

    return result;
}
