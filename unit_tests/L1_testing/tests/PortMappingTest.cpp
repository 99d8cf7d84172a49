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

#include <gtest/gtest.h>

#include "PortMapping.h"


TEST(PortMappingTest, parsePortSpecSuccess_protocolDefaultsToTcp)
{
    PortMappings mappings;
    std::string error;

    ASSERT_TRUE(parsePortSpec("8080:80, 53:53/UDP,9000:9000/tcp", &mappings, &error)) << error;
    ASSERT_EQ(mappings.size(), 3u);

    auto it = mappings.begin();
    EXPECT_EQ(it->hostPort, 8080);
    EXPECT_EQ(it->podPort, 80);
    EXPECT_EQ(it->protocol, "tcp");
    EXPECT_TRUE(it->podIP.empty());

    ++it;
    EXPECT_EQ(it->hostPort, 53);
    EXPECT_EQ(it->protocol, "udp");

    ++it;
    EXPECT_EQ(it->hostPort, 9000);
    EXPECT_EQ(it->protocol, "tcp");
}

TEST(PortMappingTest, parsePortSpecSuccess_emptySpec)
{
    PortMappings mappings;
    std::string error;

    EXPECT_TRUE(parsePortSpec("", &mappings, &error));
    EXPECT_TRUE(mappings.empty());

    EXPECT_TRUE(parsePortSpec(" , ,", &mappings, &error));
    EXPECT_TRUE(mappings.empty());
}

/**
 * @brief Test a spec with any malformed entry is rejected as a whole.
 */
TEST(PortMappingTest, parsePortSpecFailed_malformedEntries)
{
    const char *invalid[] = {
        "8080",
        "8080:",
        ":80",
        "0:80",
        "8080:65536",
        "8080:80/sctp",
        "80a:80",
        "8080:80,bogus",
        "8080:8\xc3\xa9",
        "8080:80/tc\xff",
    };

    for (const char *spec : invalid)
    {
        PortMappings mappings;
        std::string error;

        EXPECT_FALSE(parsePortSpec(spec, &mappings, &error)) << spec;
        EXPECT_FALSE(error.empty()) << spec;
        EXPECT_TRUE(mappings.empty()) << spec;
    }
}

TEST(PortMappingTest, portMappingsFromJsonSuccess_storedFormat)
{
    PortMapping mapping;
    mapping.hostPort = 8080;
    mapping.podPort = 80;
    mapping.podIP = "10.1.2.3";

    PortMappings mappings;
    std::string error;
    ASSERT_TRUE(portMappingsFromJson(portMappingsToJson({ mapping }), &mappings, &error)) << error;

    ASSERT_EQ(mappings.size(), 1u);
    EXPECT_EQ(mappings.front(), mapping);
}

TEST(PortMappingTest, portMappingsFromJsonFailed_invalidEntries)
{
    Json::Value notArray(Json::objectValue);

    Json::Value badPort(Json::arrayValue);
    badPort[0]["hostPort"] = 0;
    badPort[0]["podPort"] = 80;

    Json::Value badIP(Json::arrayValue);
    badIP[0]["hostPort"] = 8080;
    badIP[0]["podPort"] = 80;
    badIP[0]["podIP"] = "10.1.2";

    for (const Json::Value &json : { notArray, badPort, badIP })
    {
        PortMappings mappings;
        std::string error;

        EXPECT_FALSE(portMappingsFromJson(json, &mappings, &error));
        EXPECT_FALSE(error.empty());
    }
}

TEST(PortMappingTest, portMappingToString)
{
    PortMapping mapping;
    mapping.hostPort = 8080;
    mapping.podPort = 80;
    mapping.protocol = "udp";

    EXPECT_EQ(portMappingToString(mapping), "8080:80/udp");

    mapping.podIP = "10.1.2.3";
    EXPECT_EQ(portMappingToString(mapping), "8080:10.1.2.3:80/udp");
}
