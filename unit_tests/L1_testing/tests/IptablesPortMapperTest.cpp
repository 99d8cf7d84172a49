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
#include <gmock/gmock.h>

#include "IptablesPortMapper.h"
#include "NetfilterMock.h"

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;


static const std::string emptyRules =
    "*nat\n"
    ":PREROUTING ACCEPT [0:0]\n"
    ":OUTPUT ACCEPT [0:0]\n"
    "COMMIT\n"
    "*filter\n"
    ":FORWARD ACCEPT [0:0]\n"
    "COMMIT\n";

static const std::string installedRules =
    "*nat\n"
    ":PREROUTING ACCEPT [0:0]\n"
    ":OUTPUT ACCEPT [0:0]\n"
    ":PODNET-HOSTPORTS - [0:0]\n"
    "-A PREROUTING -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS\n"
    "-A OUTPUT -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS\n"
    "-A PODNET-HOSTPORTS -p tcp -m tcp --dport 8080 -m comment --comment abc123 -j DNAT --to-destination 10.1.2.3:80\n"
    "COMMIT\n"
    "*filter\n"
    ":FORWARD ACCEPT [0:0]\n"
    "-A FORWARD -d 10.1.2.3/32 -p tcp -m tcp --dport 80 -m comment --comment abc123 -j ACCEPT\n"
    "COMMIT\n";

class IptablesPortMapperTest : public ::testing::Test
{
protected:
    std::shared_ptr<NiceMock<NetfilterMock>> netfilter;
    std::unique_ptr<IptablesPortMapper> portMapper;

    std::string saved;
    std::list<std::string> restored;
    bool restoreResult;

    PortMappings mappings;

    virtual void SetUp()
    {
        netfilter = std::make_shared<NiceMock<NetfilterMock>>();
        portMapper.reset(new IptablesPortMapper(netfilter));

        saved = emptyRules;
        restoreResult = true;

        ON_CALL(*netfilter, saveRules(_))
            .WillByDefault(Invoke([this](std::string *output)
                                  {
                                      *output = saved;
                                      return true;
                                  }));
        ON_CALL(*netfilter, restoreRules(_))
            .WillByDefault(Invoke([this](const std::string &input)
                                  {
                                      restored.push_back(input);
                                      return restoreResult;
                                  }));

        PortMapping mapping;
        mapping.hostPort = 8080;
        mapping.podPort = 80;
        mapping.podIP = "10.1.2.3";
        mappings = { mapping };
    }

    virtual void TearDown()
    {
        portMapper.reset();
        netfilter.reset();
    }
};

/**
 * @brief Test the chain, the jumps, the DNAT and the FORWARD rules are all
 * written in one go.
 */
TEST_F(IptablesPortMapperTest, installSuccess_allRulesWritten)
{
    EXPECT_TRUE(portMapper->install("abc123", mappings));

    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored.front(),
        "*nat\n"
        ":PODNET-HOSTPORTS - [0:0]\n"
        "-A PREROUTING -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS\n"
        "-A OUTPUT -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS\n"
        "-A PODNET-HOSTPORTS -p tcp -m tcp --dport 8080 -m comment --comment abc123 -j DNAT --to-destination 10.1.2.3:80\n"
        "COMMIT\n"
        "*filter\n"
        "-I FORWARD -d 10.1.2.3/32 -p tcp -m tcp --dport 80 -m comment --comment abc123 -j ACCEPT\n"
        "COMMIT\n");
}

TEST_F(IptablesPortMapperTest, installSuccess_alreadyInstalled)
{
    saved = installedRules;

    EXPECT_TRUE(portMapper->install("abc123", mappings));
    EXPECT_TRUE(restored.empty());
}

TEST_F(IptablesPortMapperTest, installFailed_noPodAddress)
{
    mappings.front().podIP.clear();

    EXPECT_FALSE(portMapper->install("abc123", mappings));
    EXPECT_TRUE(restored.empty());

    // nothing from the failed install is left queued
    saved = installedRules;
    EXPECT_TRUE(portMapper->ensureBasicRules());
    EXPECT_TRUE(restored.empty());
}

TEST_F(IptablesPortMapperTest, installFailed_restoreFails)
{
    restoreResult = false;

    EXPECT_FALSE(portMapper->install("abc123", mappings));
    EXPECT_EQ(restored.size(), 1u);
}

TEST_F(IptablesPortMapperTest, uninstallSuccess_rulesDeleted)
{
    saved = installedRules;

    EXPECT_TRUE(portMapper->uninstall("abc123", mappings));

    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored.front(),
        "*nat\n"
        "-D PODNET-HOSTPORTS -p tcp -m tcp --dport 8080 -m comment --comment abc123 -j DNAT --to-destination 10.1.2.3:80\n"
        "COMMIT\n"
        "*filter\n"
        "-D FORWARD -d 10.1.2.3/32 -p tcp -m tcp --dport 80 -m comment --comment abc123 -j ACCEPT\n"
        "COMMIT\n");
}

TEST_F(IptablesPortMapperTest, uninstallSuccess_rulesAlreadyGone)
{
    EXPECT_TRUE(portMapper->uninstall("abc123", mappings));
    EXPECT_TRUE(restored.empty());
}

TEST_F(IptablesPortMapperTest, ensureBasicRulesSuccess_recreatesChain)
{
    EXPECT_TRUE(portMapper->ensureBasicRules());

    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored.front(),
        "*nat\n"
        ":PODNET-HOSTPORTS - [0:0]\n"
        "-A PREROUTING -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS\n"
        "-A OUTPUT -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS\n"
        "COMMIT\n");
}

TEST(IptablesPortMapperRulesTest, createHostPortDnatRule)
{
    PortMapping mapping;
    mapping.hostPort = 5353;
    mapping.podPort = 53;
    mapping.protocol = "udp";
    mapping.podIP = "10.1.2.3";

    EXPECT_EQ(createHostPortDnatRule(mapping, "abc123"),
              "PODNET-HOSTPORTS -p udp -m udp --dport 5353 -m comment --comment abc123 "
              "-j DNAT --to-destination 10.1.2.3:53");
    EXPECT_EQ(createHostPortForwardRule(mapping, "abc123"),
              "FORWARD -d 10.1.2.3/32 -p udp -m udp --dport 53 -m comment --comment abc123 -j ACCEPT");

    mapping.podIP.clear();
    EXPECT_TRUE(createHostPortDnatRule(mapping, "abc123").empty());
}
