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

#include "NetfilterMock.h"

using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgPointee;


static const std::string savedRules =
    "# Generated by iptables-save v1.8.7\n"
    "*nat\n"
    ":PREROUTING ACCEPT [0:0]\n"
    ":OUTPUT ACCEPT [0:0]\n"
    ":PODNET-HOSTPORTS - [0:0]\n"
    "-A PREROUTING -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS\n"
    "COMMIT\n"
    "*filter\n"
    ":INPUT ACCEPT [10:200]\n"
    ":FORWARD DROP [0:0]\n"
    "-A FORWARD -i eth0 -j DROP\n"
    "COMMIT\n";

class NetfilterTest : public ::testing::Test
{
protected:
    NiceMock<NetfilterMock> netfilter;

    virtual void SetUp()
    {
        ON_CALL(netfilter, saveRules(_))
            .WillByDefault(DoAll(SetArgPointee<0>(savedRules), Return(true)));
    }
};

TEST_F(NetfilterTest, parseRulesSuccess_tablesChainsAndRules)
{
    Netfilter::RuleSet rules;
    Netfilter::RuleSet chains;

    ASSERT_TRUE(Netfilter::parseRules(savedRules, &rules, &chains));

    EXPECT_EQ(rules[Netfilter::TableType::Nat],
              std::list<std::string>({ "PREROUTING -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS" }));
    EXPECT_EQ(rules[Netfilter::TableType::Filter],
              std::list<std::string>({ "FORWARD -i eth0 -j DROP" }));
    EXPECT_EQ(chains[Netfilter::TableType::Nat],
              std::list<std::string>({ "PREROUTING", "OUTPUT", "PODNET-HOSTPORTS" }));
    EXPECT_EQ(chains[Netfilter::TableType::Filter],
              std::list<std::string>({ "INPUT", "FORWARD" }));
}

TEST_F(NetfilterTest, parseRulesFailed_malformedOutput)
{
    Netfilter::RuleSet rules;

    EXPECT_FALSE(Netfilter::parseRules("*bogus\nCOMMIT\n", &rules, nullptr));
    EXPECT_FALSE(Netfilter::parseRules("-A FORWARD -j DROP\n", &rules, nullptr));
    EXPECT_FALSE(Netfilter::parseRules(":FORWARD DROP [0:0]\n", &rules, nullptr));
}

/**
 * @brief Test only the rules that change something are written, new chains
 * first, grouped per table.
 */
TEST_F(NetfilterTest, applyRulesSuccess_duplicatesTrimmed)
{
    Netfilter::RuleSet appendRules =
    {
        { Netfilter::TableType::Nat, { "PREROUTING -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS",
                                       "OUTPUT -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS" } }
    };
    Netfilter::RuleSet insertRules =
    {
        { Netfilter::TableType::Filter, { " FORWARD -i eth0 -j DROP ",
                                          "FORWARD -d 10.1.2.3/32 -j ACCEPT" } }
    };
    Netfilter::RuleSet deleteRules =
    {
        { Netfilter::TableType::Filter, { "FORWARD -i eth0 -j DROP",
                                          "FORWARD -i eth9 -j DROP" } }
    };

    ASSERT_TRUE(netfilter.createNewChain(Netfilter::TableType::Nat, "PODNET-HOSTPORTS"));
    ASSERT_TRUE(netfilter.createNewChain(Netfilter::TableType::Nat, "PODNET-EXTRA"));
    ASSERT_TRUE(netfilter.addRules(appendRules, Netfilter::Operation::Append));
    ASSERT_TRUE(netfilter.addRules(insertRules, Netfilter::Operation::Insert));
    ASSERT_TRUE(netfilter.addRules(deleteRules, Netfilter::Operation::Delete));

    EXPECT_CALL(netfilter, restoreRules(
        "*nat\n"
        ":PODNET-EXTRA - [0:0]\n"
        "-A OUTPUT -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS\n"
        "COMMIT\n"
        "*filter\n"
        "-I FORWARD -d 10.1.2.3/32 -j ACCEPT\n"
        "-D FORWARD -i eth0 -j DROP\n"
        "COMMIT\n"))
        .WillOnce(Return(true));

    EXPECT_TRUE(netfilter.applyRules());
}

TEST_F(NetfilterTest, applyRulesSuccess_nothingToWrite)
{
    Netfilter::RuleSet appendRules =
    {
        { Netfilter::TableType::Nat, { "PREROUTING -m addrtype --dst-type LOCAL -j PODNET-HOSTPORTS" } }
    };

    ASSERT_TRUE(netfilter.addRules(appendRules, Netfilter::Operation::Append));

    EXPECT_CALL(netfilter, restoreRules(_)).Times(0);
    EXPECT_TRUE(netfilter.applyRules());
}

TEST_F(NetfilterTest, applyRulesFailed_saveFails)
{
    Netfilter::RuleSet appendRules =
    {
        { Netfilter::TableType::Filter, { "FORWARD -j ACCEPT" } }
    };
    ASSERT_TRUE(netfilter.addRules(appendRules, Netfilter::Operation::Append));

    EXPECT_CALL(netfilter, saveRules(_)).WillOnce(Return(false));
    EXPECT_CALL(netfilter, restoreRules(_)).Times(0);
    EXPECT_FALSE(netfilter.applyRules());

    // the queue was consumed by the failed attempt
    EXPECT_CALL(netfilter, saveRules(_))
        .WillOnce(DoAll(SetArgPointee<0>(savedRules), Return(true)));
    EXPECT_TRUE(netfilter.applyRules());
}

TEST_F(NetfilterTest, applyRulesFailed_restoreFails)
{
    Netfilter::RuleSet appendRules =
    {
        { Netfilter::TableType::Filter, { "FORWARD -j ACCEPT" } }
    };
    ASSERT_TRUE(netfilter.addRules(appendRules, Netfilter::Operation::Append));

    EXPECT_CALL(netfilter, restoreRules(_)).WillOnce(Return(false));
    EXPECT_FALSE(netfilter.applyRules());
}

TEST_F(NetfilterTest, clearRulesSuccess_queueDropped)
{
    Netfilter::RuleSet appendRules =
    {
        { Netfilter::TableType::Filter, { "FORWARD -j ACCEPT" } }
    };
    ASSERT_TRUE(netfilter.addRules(appendRules, Netfilter::Operation::Append));

    netfilter.clearRules();

    EXPECT_CALL(netfilter, restoreRules(_)).Times(0);
    EXPECT_TRUE(netfilter.applyRules());
}

TEST_F(NetfilterTest, addRulesFailed_invalidArguments)
{
    Netfilter::RuleSet rules =
    {
        { Netfilter::TableType::Filter, { "FORWARD -j ACCEPT" } }
    };
    EXPECT_FALSE(netfilter.addRules(rules, Netfilter::Operation::Unchanged));

    Netfilter::RuleSet invalidTable =
    {
        { Netfilter::TableType::Invalid, { "FORWARD -j ACCEPT" } }
    };
    EXPECT_FALSE(netfilter.addRules(invalidTable, Netfilter::Operation::Append));

    EXPECT_FALSE(netfilter.createNewChain(Netfilter::TableType::Invalid, "CHAIN"));
}

TEST_F(NetfilterTest, rulesSuccess_currentRules)
{
    Netfilter::RuleSet rules = netfilter.rules();
    EXPECT_EQ(rules[Netfilter::TableType::Filter].size(), 1u);

    EXPECT_CALL(netfilter, saveRules(_)).WillOnce(Return(false));
    EXPECT_TRUE(netfilter.rules().empty());
}
