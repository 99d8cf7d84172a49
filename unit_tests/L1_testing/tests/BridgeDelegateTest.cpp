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

#include "BridgeDelegate.h"
#include "NetlinkMock.h"
#include "FakeKernel.h"

#include <memory>
#include <linux/rtnetlink.h>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace
{

const MacAddress kEth1Mac = {{ 0x02, 0x42, 0xac, 0x11, 0x00, 0x05 }};

in_addr_t ip(const char *str)
{
    in_addr_t addr = 0;
    EXPECT_TRUE(parseIpv4(str, &addr));
    return addr;
}

} // namespace

class BridgeDelegateTest : public ::testing::Test {

protected:
    FakeKernel hostKernel;
    FakeKernel podKernel;
    std::shared_ptr<NiceMock<NetlinkMock>> hostNetlink;
    std::shared_ptr<NiceMock<NetlinkMock>> podNetlink;

    std::list<std::string> enteredNamespaces;
    bool podNamespaceAvailable = true;

    PodRequest request;

    virtual void SetUp()
    {
        hostNetlink = std::make_shared<NiceMock<NetlinkMock>>(&hostKernel);
        podNetlink = std::make_shared<NiceMock<NetlinkMock>>(&podKernel);

        const int eth1Index = hostKernel.addPhysical("eth1", kEth1Mac);
        hostKernel.ifaceUp(eth1Index);

        Ipv4Address address;
        parseIpv4Cidr("10.0.0.5/24", &address.local, &address.prefixLen);
        hostKernel.addAddress(eth1Index, address);

        // the pod end of the veth pair as it appears inside the namespace
        podKernel.addPhysical("eth0", MacAddress());

        request.command = PodRequest::Command::Add;
        request.commandName = "ADD";
        request.containerId = "0123456789abcdef";
        request.netns = "/proc/self/ns/net";
        request.ifName = "eth0";
        request.args["VLAN"] = "100";
        request.args["IP"] = "10.1.2.3/24";
        request.args["GATEWAY"] = "10.1.2.1";
    }

    virtual void TearDown()
    {
        hostNetlink.reset();
        podNetlink.reset();
    }

    std::unique_ptr<BridgeDelegate> createDelegate(SwitchMode mode = SwitchMode::Bridge)
    {
        NetworkConfig config;
        config.device = "eth1";
        config.switchMode = mode;

        auto topology = std::make_shared<VlanTopology>(hostNetlink, config);
        EXPECT_TRUE(topology->init());

        BridgeDelegate::NamespaceExecutor executor =
            [this](const std::string &netnsPath, const BridgeDelegate::NamespaceFunc &func)
            {
                enteredNamespaces.push_back(netnsPath);
                return podNamespaceAvailable && func(*podNetlink);
            };

        return std::unique_ptr<BridgeDelegate>(
            new BridgeDelegate(topology, hostNetlink, executor));
    }
};

TEST_F(BridgeDelegateTest, hostVethName_truncatedToInterfaceNameLimit)
{
    EXPECT_EQ(BridgeDelegate::hostVethName("0123456789abcdef"), "pn0123456789a");
    EXPECT_EQ(BridgeDelegate::hostVethName("abc"), "pnabc");
    EXPECT_LE(BridgeDelegate::hostVethName(std::string(64, 'f')).size(), 15u);
}

/**
 * @brief Test a tagged pod gets a veth on the vlan's bridge and is addressed
 * and routed inside its namespace.
 */
TEST_F(BridgeDelegateTest, addSuccess_attachedToVlanBridge)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    AllocationResult result;
    std::string error;
    ASSERT_TRUE(delegate->add(request, &result, &error)) << error;

    boost::optional<NetworkDevice> hostVeth = hostKernel.device("pn0123456789a");
    boost::optional<NetworkDevice> bridge = hostKernel.device("docker100");
    ASSERT_TRUE(hostVeth);
    ASSERT_TRUE(bridge);
    EXPECT_EQ(hostVeth->masterIndex, bridge->index);
    EXPECT_TRUE(hostKernel.isUp("pn0123456789a"));
    EXPECT_EQ(hostKernel.vethPeer("pn0123456789a"), "eth0");

    EXPECT_EQ(enteredNamespaces, std::list<std::string>({ "/proc/self/ns/net" }));

    const std::list<Ipv4Address> podAddresses = podKernel.addresses("eth0");
    ASSERT_EQ(podAddresses.size(), 1u);
    EXPECT_EQ(podAddresses.front().local, ip("10.1.2.3"));
    EXPECT_EQ(podAddresses.front().prefixLen, 24);
    EXPECT_TRUE(podKernel.isUp("eth0"));
    EXPECT_TRUE(podKernel.isUp("lo"));

    const std::list<Ipv4Route> podRoutes = podKernel.routes("eth0");
    ASSERT_EQ(podRoutes.size(), 1u);
    EXPECT_EQ(podRoutes.front().dstPrefixLen, 0);
    EXPECT_EQ(podRoutes.front().gateway, ip("10.1.2.1"));

    ASSERT_TRUE(result.ip4);
    EXPECT_EQ(result.podIP(), "10.1.2.3");
    EXPECT_EQ(result.ip4->prefixLen, 24);
    EXPECT_EQ(result.ip4->gateway, ip("10.1.2.1"));
    ASSERT_EQ(result.ip4->routes.size(), 1u);
    EXPECT_EQ(result.ip4->routes.front().gateway, ip("10.1.2.1"));
}

TEST_F(BridgeDelegateTest, addSuccess_untaggedUsesDefaultBridge)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    request.args.erase("VLAN");
    request.args.erase("GATEWAY");

    AllocationResult result;
    std::string error;
    ASSERT_TRUE(delegate->add(request, &result, &error)) << error;

    EXPECT_EQ(hostKernel.device("pn0123456789a")->masterIndex,
              hostKernel.device("docker")->index);
    EXPECT_FALSE(hostKernel.device("vlan0"));
    EXPECT_TRUE(podKernel.routes("eth0").empty());

    ASSERT_TRUE(result.ip4);
    EXPECT_EQ(result.ip4->gateway, 0u);
    EXPECT_TRUE(result.ip4->routes.empty());
}

/**
 * @brief Test an untagged pod in pure mode is reached through a host route
 * and proxy arp rather than a bridge.
 */
TEST_F(BridgeDelegateTest, addSuccess_pureModeRoutesToVeth)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate(SwitchMode::Pure);

    request.args.erase("VLAN");

    AllocationResult result;
    std::string error;
    ASSERT_TRUE(delegate->add(request, &result, &error)) << error;

    boost::optional<NetworkDevice> hostVeth = hostKernel.device("pn0123456789a");
    ASSERT_TRUE(hostVeth);
    EXPECT_FALSE(hostVeth->hasMaster());
    EXPECT_EQ(hostKernel.conf("pn0123456789a", "proxy_arp"), 1);

    const std::list<Ipv4Route> hostRoutes = hostKernel.routes("pn0123456789a");
    ASSERT_EQ(hostRoutes.size(), 1u);
    EXPECT_EQ(hostRoutes.front().destination, ip("10.1.2.3"));
    EXPECT_EQ(hostRoutes.front().dstPrefixLen, 32);
    EXPECT_EQ(hostRoutes.front().scope, RT_SCOPE_LINK);
}

TEST_F(BridgeDelegateTest, addFailed_unsupportedSwitchMode)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate(SwitchMode::Macvlan);

    EXPECT_CALL(*hostNetlink, createVethPair(_, _, _)).Times(0);

    AllocationResult result;
    std::string error;
    EXPECT_FALSE(delegate->add(request, &result, &error));
    EXPECT_NE(error.find("macvlan"), std::string::npos);
    EXPECT_FALSE(result.ip4);
}

TEST_F(BridgeDelegateTest, addFailed_invalidArgs)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    const std::map<std::string, std::string> invalid[] = {
        { { "VLAN", "100" } },
        { { "IP", "10.1.2.3" } },
        { { "IP", "10.1.2.3/24" }, { "VLAN", "4095" } },
        { { "IP", "10.1.2.3/24" }, { "VLAN", "ten" } },
        { { "IP", "10.1.2.3/24" }, { "GATEWAY", "10.1.2" } },
    };

    EXPECT_CALL(*hostNetlink, createVethPair(_, _, _)).Times(0);

    for (const auto &args : invalid)
    {
        request.args = args;

        AllocationResult result;
        std::string error;
        EXPECT_FALSE(delegate->add(request, &result, &error));
        EXPECT_FALSE(error.empty());
    }
}

TEST_F(BridgeDelegateTest, addFailed_namespaceMissing)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    request.netns = "/nonexistent/ns/net";

    AllocationResult result;
    std::string error;
    EXPECT_FALSE(delegate->add(request, &result, &error));
    EXPECT_NE(error.find("/nonexistent/ns/net"), std::string::npos);
    EXPECT_FALSE(hostKernel.device("pn0123456789a"));
}

/**
 * @brief Test the veth pair is removed again if the pod end can't be set up,
 * while the vlan bridge stays.
 */
TEST_F(BridgeDelegateTest, addFailed_podConfigFailureRemovesVeth)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    podNamespaceAvailable = false;

    AllocationResult result;
    std::string error;
    EXPECT_FALSE(delegate->add(request, &result, &error));
    EXPECT_FALSE(error.empty());

    EXPECT_FALSE(hostKernel.device("pn0123456789a"));
    EXPECT_TRUE(hostKernel.device("docker100"));
    EXPECT_TRUE(hostKernel.device("vlan100"));
}

TEST_F(BridgeDelegateTest, addFailed_attachFailureRemovesVeth)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    const int bridgeIndex = hostKernel.device("docker")->index;

    request.args.erase("VLAN");

    // enslaving the veth fails, everything else goes to the kernel
    EXPECT_CALL(*hostNetlink, setMaster(_, bridgeIndex))
        .WillOnce(Return(false));

    AllocationResult result;
    std::string error;
    EXPECT_FALSE(delegate->add(request, &result, &error));
    EXPECT_NE(error.find("docker"), std::string::npos);
    EXPECT_FALSE(hostKernel.device("pn0123456789a"));
    EXPECT_TRUE(enteredNamespaces.empty());
}

TEST_F(BridgeDelegateTest, addSuccess_staleVethReplaced)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    ASSERT_TRUE(hostKernel.createVethPair("pn0123456789a", "eth9", 3));
    const int staleIndex = hostKernel.device("pn0123456789a")->index;

    AllocationResult result;
    std::string error;
    ASSERT_TRUE(delegate->add(request, &result, &error)) << error;

    boost::optional<NetworkDevice> hostVeth = hostKernel.device("pn0123456789a");
    ASSERT_TRUE(hostVeth);
    EXPECT_NE(hostVeth->index, staleIndex);
    EXPECT_EQ(hostKernel.vethPeer("pn0123456789a"), "eth0");
}

TEST_F(BridgeDelegateTest, delSuccess_vethRemovedAndRepeatable)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    AllocationResult result;
    std::string error;
    ASSERT_TRUE(delegate->add(request, &result, &error)) << error;

    request.command = PodRequest::Command::Del;
    request.commandName = "DEL";

    EXPECT_TRUE(delegate->del(request, &error)) << error;
    EXPECT_FALSE(hostKernel.device("pn0123456789a"));

    // vlan and bridge devices are shared with other pods
    EXPECT_TRUE(hostKernel.device("docker100"));
    EXPECT_TRUE(hostKernel.device("vlan100"));

    EXPECT_TRUE(delegate->del(request, &error)) << error;
}

TEST_F(BridgeDelegateTest, delFailed_deleteLinkFails)
{
    std::unique_ptr<BridgeDelegate> delegate = createDelegate();

    ASSERT_TRUE(hostKernel.createVethPair("pn0123456789a", "eth0", 3));

    EXPECT_CALL(*hostNetlink, deleteLink(_)).WillOnce(Return(false));

    std::string error;
    EXPECT_FALSE(delegate->del(request, &error));
    EXPECT_NE(error.find("pn0123456789a"), std::string::npos);
}
