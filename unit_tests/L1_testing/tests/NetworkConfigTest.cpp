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

#include "NetworkConfig.h"
#include "NetworkDevice.h"


TEST(NetworkConfigTest, fromStringSuccess_defaultsApplied)
{
    std::string error;
    boost::optional<NetworkConfig> config = NetworkConfig::fromString(
        R"({ "cniVersion": "0.3.1", "name": "pods", "type": "podnet", "device": "eth1" })",
        &error);

    ASSERT_TRUE(config) << error;
    EXPECT_EQ(config->device, "eth1");
    EXPECT_EQ(config->switchMode, SwitchMode::Bridge);
    EXPECT_EQ(config->disableDefaultBridge, TriState::Unset);
    EXPECT_EQ(config->defaultBridgeName, "docker");
    EXPECT_EQ(config->bridgeNamePrefix, "docker");
    EXPECT_EQ(config->vlanNamePrefix, "vlan");
}

TEST(NetworkConfigTest, fromStringSuccess_allFieldsRead)
{
    std::string error;
    boost::optional<NetworkConfig> config = NetworkConfig::fromString(
        R"({
            "device": "bond0",
            "switch": "pure",
            "disable_default_bridge": false,
            "default_bridge_name": "br0",
            "bridge_name_prefix": "br",
            "vlan_name_prefix": ""
        })",
        &error);

    ASSERT_TRUE(config) << error;
    EXPECT_EQ(config->device, "bond0");
    EXPECT_EQ(config->switchMode, SwitchMode::Pure);
    EXPECT_EQ(config->disableDefaultBridge, TriState::False);
    EXPECT_EQ(config->defaultBridgeName, "br0");
    EXPECT_EQ(config->bridgeNamePrefix, "br");
    EXPECT_EQ(config->vlanNamePrefix, "vlan");
}

TEST(NetworkConfigTest, fromStringSuccess_switchModes)
{
    std::string error;
    EXPECT_EQ(NetworkConfig::fromString(R"({"device":"eth0","switch":"macvlan"})", &error)->switchMode,
              SwitchMode::Macvlan);
    EXPECT_EQ(NetworkConfig::fromString(R"({"device":"eth0","switch":"ipvlan"})", &error)->switchMode,
              SwitchMode::Ipvlan);
    EXPECT_EQ(NetworkConfig::fromString(R"({"device":"eth0","switch":""})", &error)->switchMode,
              SwitchMode::Bridge);
}

/**
 * @brief Test malformed or incomplete configs are rejected with a reason.
 */
TEST(NetworkConfigTest, fromStringFailed_invalidConfigs)
{
    const char *invalid[] = {
        "not json",
        "[]",
        "{}",
        R"({ "device": "" })",
        R"({ "device": 5 })",
        R"({ "device": "eth0", "switch": "vxlan" })",
        R"({ "device": "eth0", "disable_default_bridge": "yes" })",
        R"({ "device": "eth0", "bridge_name_prefix": 1 })",
    };

    for (const char *str : invalid)
    {
        std::string error;
        EXPECT_FALSE(NetworkConfig::fromString(str, &error)) << str;
        EXPECT_FALSE(error.empty()) << str;
    }
}

TEST(NetworkConfigTest, switchModeToString)
{
    EXPECT_STREQ(switchModeToString(SwitchMode::Bridge), "bridge");
    EXPECT_STREQ(switchModeToString(SwitchMode::Pure), "pure");
}

TEST(NetworkDeviceTest, parseIpv4CidrSuccess)
{
    in_addr_t address = 0;
    uint8_t prefixLen = 0;

    ASSERT_TRUE(parseIpv4Cidr("10.1.2.3/24", &address, &prefixLen));
    EXPECT_EQ(address, 0x0a010203u);
    EXPECT_EQ(prefixLen, 24);
    EXPECT_EQ(ipv4ToString(address), "10.1.2.3");
}

TEST(NetworkDeviceTest, parseIpv4CidrFailed_invalidInput)
{
    in_addr_t address = 0;
    uint8_t prefixLen = 0;

    EXPECT_FALSE(parseIpv4Cidr("10.1.2.3", &address, &prefixLen));
    EXPECT_FALSE(parseIpv4Cidr("10.1.2.3/33", &address, &prefixLen));
    EXPECT_FALSE(parseIpv4Cidr("10.1.2/24", &address, &prefixLen));
    EXPECT_FALSE(parseIpv4Cidr("fe80::1/64", &address, &prefixLen));
}
