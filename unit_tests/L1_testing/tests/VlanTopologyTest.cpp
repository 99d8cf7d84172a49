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

#include "NetlinkMock.h"
#include "FakeKernel.h"
#include "VlanTopology.h"

#include <algorithm>
#include <memory>

using ::testing::NiceMock;

namespace
{

const MacAddress kEth1Mac = {{ 0x02, 0x42, 0xac, 0x11, 0x00, 0x05 }};

in_addr_t ip(const char *str)
{
    in_addr_t addr = 0;
    EXPECT_TRUE(parseIpv4(str, &addr));
    return addr;
}

Ipv4Address cidr(const char *str)
{
    Ipv4Address address;
    EXPECT_TRUE(parseIpv4Cidr(str, &address.local, &address.prefixLen));
    return address;
}

} // namespace

class VlanTopologyTest : public ::testing::Test {

protected:
    FakeKernel kernel;
    std::shared_ptr<NiceMock<NetlinkMock>> netlinkMock;
    int eth1Index = -1;

    virtual void SetUp()
    {
        netlinkMock = std::make_shared<NiceMock<NetlinkMock>>(&kernel);

        eth1Index = kernel.addPhysical("eth1", kEth1Mac);
        kernel.ifaceUp(eth1Index);
    }

    virtual void TearDown()
    {
        netlinkMock.reset();
    }

    void addEth1Address()
    {
        Ipv4Address address = cidr("10.0.0.5/24");
        address.label = "eth1";
        kernel.addAddress(eth1Index, address);

        Ipv4Route defaultRoute;
        defaultRoute.gateway = ip("10.0.0.1");
        defaultRoute.ifIndex = eth1Index;
        kernel.addRoute(defaultRoute);
    }

    std::unique_ptr<VlanTopology> createTopology(SwitchMode mode = SwitchMode::Bridge)
    {
        NetworkConfig config;
        config.device = "eth1";
        config.switchMode = mode;

        return std::unique_ptr<VlanTopology>(new VlanTopology(netlinkMock, config));
    }
};

/**
 * @brief Test the bridge names derived for each vlan tag.
 * Tag 0 has no bridge in pure mode, other tags use the prefix in all modes.
 */
TEST_F(VlanTopologyTest, bridgeNameForVlan_dependsOnModeOnlyForTagZero)
{
    EXPECT_EQ(createTopology(SwitchMode::Bridge)->bridgeNameForVlan(0), "docker");
    EXPECT_EQ(createTopology(SwitchMode::Pure)->bridgeNameForVlan(0), "");
    EXPECT_EQ(createTopology(SwitchMode::Macvlan)->bridgeNameForVlan(0), "docker");

    EXPECT_EQ(createTopology(SwitchMode::Bridge)->bridgeNameForVlan(7), "docker7");
    EXPECT_EQ(createTopology(SwitchMode::Pure)->bridgeNameForVlan(7), "docker7");
    EXPECT_EQ(createTopology(SwitchMode::Ipvlan)->bridgeNameForVlan(7), "docker7");
}

/**
 * @brief Test init moves the device's address and default route onto the
 * default bridge and enslaves the device.
 */
TEST_F(VlanTopologyTest, initSuccess_migratesAddressesToDefaultBridge)
{
    addEth1Address();

    std::unique_ptr<VlanTopology> topology = createTopology();
    ASSERT_TRUE(topology->init());

    boost::optional<NetworkDevice> bridge = kernel.device("docker");
    ASSERT_TRUE(bridge);
    EXPECT_EQ(bridge->kind, NetworkDevice::Kind::Bridge);
    EXPECT_EQ(bridge->mac, kEth1Mac);
    EXPECT_TRUE(kernel.isUp("docker"));

    const std::list<Ipv4Address> bridgeAddresses = kernel.addresses("docker");
    ASSERT_EQ(bridgeAddresses.size(), 1u);
    EXPECT_EQ(bridgeAddresses.front(), cidr("10.0.0.5/24"));
    EXPECT_TRUE(bridgeAddresses.front().label.empty());

    EXPECT_TRUE(kernel.addresses("eth1").empty());
    EXPECT_EQ(kernel.device("eth1")->masterIndex, bridge->index);

    const std::list<Ipv4Route> bridgeRoutes = kernel.routes("docker");
    ASSERT_EQ(bridgeRoutes.size(), 1u);
    EXPECT_EQ(bridgeRoutes.front().dstPrefixLen, 0);
    EXPECT_EQ(bridgeRoutes.front().gateway, ip("10.0.0.1"));

    EXPECT_EQ(topology->deviceIndex(), eth1Index);
    EXPECT_EQ(topology->parentIndex(), eth1Index);
}

/**
 * @brief Test a second init after a successful migration only checks the
 * device is still enslaved to the default bridge.
 */
TEST_F(VlanTopologyTest, initSuccess_secondRunFindsExistingBridge)
{
    addEth1Address();
    ASSERT_TRUE(createTopology()->init());

    EXPECT_CALL(*netlinkMock, createBridge(::testing::_, ::testing::_))
        .Times(0);
    EXPECT_CALL(*netlinkMock, setMaster(::testing::_, ::testing::_))
        .Times(0);

    EXPECT_TRUE(createTopology()->init());
    EXPECT_EQ(kernel.linkCount(NetworkDevice::Kind::Bridge), 1u);
}

/**
 * @brief Test init fails when the device has no address and isn't enslaved
 * to the default bridge.
 */
TEST_F(VlanTopologyTest, initFailed_noAddressAndNoBridge)
{
    EXPECT_FALSE(createTopology()->init());

    kernel.addBridgeDevice("docker");
    EXPECT_FALSE(createTopology()->init());
}

TEST_F(VlanTopologyTest, initFailed_deviceMissing)
{
    NetworkConfig config;
    config.device = "eth7";

    VlanTopology topology(netlinkMock, config);
    EXPECT_FALSE(topology.init());
}

/**
 * @brief Test the vlan parent is resolved when the device is itself a vlan
 * sub-interface.
 */
TEST_F(VlanTopologyTest, initSuccess_vlanDeviceResolvesParent)
{
    const int vlanIndex = kernel.addVlanDevice("eth1.5", 5, eth1Index);
    kernel.ifaceUp(vlanIndex);
    kernel.addAddress(vlanIndex, cidr("192.168.5.2/24"));

    NetworkConfig config;
    config.device = "eth1.5";

    VlanTopology topology(netlinkMock, config);
    ASSERT_TRUE(topology.init());

    EXPECT_EQ(topology.deviceIndex(), vlanIndex);
    EXPECT_EQ(topology.parentIndex(), eth1Index);
}

/**
 * @brief Test pure mode sets up proxy arp and non-local bind instead of a
 * default bridge.
 */
TEST_F(VlanTopologyTest, initSuccess_pureModeConfiguresArp)
{
    addEth1Address();

    EXPECT_CALL(*netlinkMock, createBridge(::testing::_, ::testing::_))
        .Times(0);

    ASSERT_TRUE(createTopology(SwitchMode::Pure)->init());

    EXPECT_EQ(kernel.conf("all", "arp_ignore"), 0);
    EXPECT_EQ(kernel.conf("eth1", "arp_ignore"), 0);
    EXPECT_EQ(kernel.conf("eth1", "proxy_arp"), 1);
    EXPECT_TRUE(kernel.nonLocalBind());
    EXPECT_EQ(kernel.addresses("eth1").size(), 1u);
}

TEST_F(VlanTopologyTest, initSuccess_macvlanLeavesHostAlone)
{
    addEth1Address();

    ASSERT_TRUE(createTopology(SwitchMode::Macvlan)->init());
    ASSERT_TRUE(createTopology(SwitchMode::Ipvlan)->init());

    EXPECT_EQ(kernel.linkCount(NetworkDevice::Kind::Bridge), 0u);
    EXPECT_EQ(kernel.addresses("eth1").size(), 1u);
}

TEST_F(VlanTopologyTest, initSuccess_defaultBridgeDisabled)
{
    addEth1Address();

    NetworkConfig config;
    config.device = "eth1";
    config.disableDefaultBridge = TriState::True;

    VlanTopology topology(netlinkMock, config);
    ASSERT_TRUE(topology.init());

    EXPECT_FALSE(kernel.device("docker"));
    EXPECT_EQ(kernel.addresses("eth1").size(), 1u);
}

/**
 * @brief Injects a failure at each step of the address migration and
 * checks the device ends up exactly as it started.
 */
class VlanTopologyRollbackTest : public VlanTopologyTest,
                                 public ::testing::WithParamInterface<int> {
};

TEST_P(VlanTopologyRollbackTest, initFailed_migrationRolledBack)
{
    addEth1Address();

    const std::list<Ipv4Address> addressesBefore = kernel.addresses("eth1");
    const std::list<Ipv4Route> routesBefore = kernel.routes("eth1");

    const int eth1 = eth1Index;
    switch (GetParam())
    {
        case 0:
            ON_CALL(*netlinkMock, delAddress(eth1, ::testing::_))
                .WillByDefault(::testing::Return(false));
            break;
        case 1:
            ON_CALL(*netlinkMock, addAddress(::testing::Ne(eth1), ::testing::_))
                .WillByDefault(::testing::Return(false));
            break;
        case 2:
            ON_CALL(*netlinkMock, setMaster(eth1, ::testing::Ne(0)))
                .WillByDefault(::testing::Return(false));
            break;
        case 3:
            ON_CALL(*netlinkMock, addRoute(::testing::Field(&Ipv4Route::ifIndex, ::testing::Ne(eth1))))
                .WillByDefault(::testing::Return(false));
            break;
        case 4:
            ON_CALL(*netlinkMock, listIpv4Routes(eth1, ::testing::_))
                .WillByDefault(::testing::Return(false));
            break;
    }

    EXPECT_FALSE(createTopology()->init());

    EXPECT_EQ(kernel.addresses("eth1"), addressesBefore);
    EXPECT_EQ(kernel.routes("eth1"), routesBefore);
    EXPECT_FALSE(kernel.device("eth1")->hasMaster());
    EXPECT_TRUE(kernel.addresses("docker").empty());
    EXPECT_TRUE(kernel.routes("docker").empty());
}

INSTANTIATE_TEST_SUITE_P(FailurePoints, VlanTopologyRollbackTest,
                         ::testing::Values(0, 1, 2, 3, 4));

/**
 * @brief Test a failure on the second of two addresses puts the first one
 * back on the device as well.
 */
TEST_F(VlanTopologyTest, initFailed_secondAddressRemoveFailsFirstRestored)
{
    addEth1Address();

    Ipv4Address second = cidr("192.168.7.2/24");
    second.label = "eth1:1";
    kernel.addAddress(eth1Index, second);

    const Ipv4Address first = kernel.addresses("eth1").front();
    const std::list<Ipv4Route> routesBefore = kernel.routes("eth1");

    ON_CALL(*netlinkMock, delAddress(eth1Index, second))
        .WillByDefault(::testing::Return(false));

    EXPECT_FALSE(createTopology()->init());

    const std::list<Ipv4Address> addresses = kernel.addresses("eth1");
    ASSERT_EQ(addresses.size(), 2u);
    EXPECT_NE(std::find(addresses.begin(), addresses.end(), first), addresses.end());
    EXPECT_NE(std::find(addresses.begin(), addresses.end(), second), addresses.end());
    EXPECT_EQ(kernel.routes("eth1"), routesBefore);
    EXPECT_FALSE(kernel.device("eth1")->hasMaster());
    EXPECT_TRUE(kernel.addresses("docker").empty());
}

TEST_F(VlanTopologyTest, initFailed_secondAddressAddToBridgeFails)
{
    addEth1Address();

    Ipv4Address second = cidr("192.168.7.2/24");
    kernel.addAddress(eth1Index, second);

    const Ipv4Address first = kernel.addresses("eth1").front();

    ON_CALL(*netlinkMock, addAddress(::testing::Ne(eth1Index), second))
        .WillByDefault(::testing::Return(false));

    EXPECT_FALSE(createTopology()->init());

    const std::list<Ipv4Address> addresses = kernel.addresses("eth1");
    ASSERT_EQ(addresses.size(), 2u);
    EXPECT_NE(std::find(addresses.begin(), addresses.end(), first), addresses.end());
    EXPECT_NE(std::find(addresses.begin(), addresses.end(), second), addresses.end());
    EXPECT_FALSE(kernel.device("eth1")->hasMaster());
    EXPECT_TRUE(kernel.addresses("docker").empty());
}

/**
 * @brief Test provisioning vlan 100 creates the tagged sub-interface and a
 * bridge for it, and a repeat reuses them.
 */
TEST_F(VlanTopologyTest, provisionBridgeSuccess_createsVlanAndBridge)
{
    addEth1Address();

    std::unique_ptr<VlanTopology> topology = createTopology();
    ASSERT_TRUE(topology->init());

    std::string bridgeName;
    ASSERT_TRUE(topology->provisionBridgeForVlan(100, &bridgeName));
    EXPECT_EQ(bridgeName, "docker100");

    boost::optional<NetworkDevice> vlan = kernel.device("vlan100");
    boost::optional<NetworkDevice> bridge = kernel.device("docker100");
    ASSERT_TRUE(vlan);
    ASSERT_TRUE(bridge);

    EXPECT_EQ(vlan->kind, NetworkDevice::Kind::VlanSubInterface);
    ASSERT_TRUE(vlan->vlan);
    EXPECT_EQ(vlan->vlan->vlanId, 100);
    EXPECT_EQ(vlan->vlan->parentIndex, eth1Index);
    EXPECT_EQ(vlan->masterIndex, bridge->index);
    EXPECT_TRUE(kernel.isUp("vlan100"));
    EXPECT_TRUE(kernel.isUp("docker100"));

    const size_t bridgeCount = kernel.linkCount(NetworkDevice::Kind::Bridge);

    EXPECT_CALL(*netlinkMock, createBridge(::testing::_, ::testing::_))
        .Times(0);
    EXPECT_CALL(*netlinkMock, createVlan(::testing::_, ::testing::_, ::testing::_))
        .Times(0);

    bridgeName.clear();
    ASSERT_TRUE(topology->provisionBridgeForVlan(100, &bridgeName));
    EXPECT_EQ(bridgeName, "docker100");
    EXPECT_EQ(kernel.linkCount(NetworkDevice::Kind::Bridge), bridgeCount);
}

/**
 * @brief Test an existing vlan device already enslaved to a bridge is used
 * as is, whatever the names.
 */
TEST_F(VlanTopologyTest, provisionBridgeSuccess_reusesExistingMaster)
{
    addEth1Address();

    std::unique_ptr<VlanTopology> topology = createTopology();
    ASSERT_TRUE(topology->init());

    const int vlanIndex = kernel.addVlanDevice("eth1.7", 7, eth1Index);
    const int bridgeIndex = kernel.addBridgeDevice("br-custom");
    kernel.setMaster(vlanIndex, bridgeIndex);

    EXPECT_CALL(*netlinkMock, createBridge(::testing::_, ::testing::_))
        .Times(0);
    EXPECT_CALL(*netlinkMock, setMaster(::testing::_, ::testing::_))
        .Times(0);

    std::string bridgeName;
    ASSERT_TRUE(topology->provisionBridgeForVlan(7, &bridgeName));
    EXPECT_EQ(bridgeName, "br-custom");
    EXPECT_EQ(topology->deviceIndex(), vlanIndex);
}

/**
 * @brief Test a vlan device whose master isn't a bridge gets a new bridge.
 */
TEST_F(VlanTopologyTest, provisionBridgeSuccess_nonBridgeMasterGetsNewBridge)
{
    std::unique_ptr<VlanTopology> topology = createTopology(SwitchMode::Pure);
    ASSERT_TRUE(topology->init());

    const int bondIndex = kernel.addPhysical("bond0", kEth1Mac);
    const int vlanIndex = kernel.addVlanDevice("vlan7", 7, eth1Index);
    kernel.forceMaster(vlanIndex, bondIndex);

    std::string bridgeName;
    ASSERT_TRUE(topology->provisionBridgeForVlan(7, &bridgeName));
    EXPECT_EQ(bridgeName, "docker7");

    boost::optional<NetworkDevice> bridge = kernel.device("docker7");
    ASSERT_TRUE(bridge);
    EXPECT_EQ(bridge->kind, NetworkDevice::Kind::Bridge);
    EXPECT_EQ(kernel.device("vlan7")->masterIndex, bridge->index);
    EXPECT_TRUE(kernel.isUp("docker7"));
}

/**
 * @brief Test a vlan device with our name but on another parent is not
 * adopted.
 */
TEST_F(VlanTopologyTest, provisionBridgeFailed_sameNameVlanOnOtherParent)
{
    const int eth2Index = kernel.addPhysical("eth2", kEth1Mac);
    const int otherVlanIndex = kernel.addVlanDevice("vlan100", 100, eth2Index);

    std::unique_ptr<VlanTopology> topology = createTopology(SwitchMode::Pure);
    ASSERT_TRUE(topology->init());

    EXPECT_CALL(*netlinkMock, setMaster(::testing::_, ::testing::_))
        .Times(0);

    std::string bridgeName;
    EXPECT_FALSE(topology->provisionBridgeForVlan(100, &bridgeName));

    EXPECT_NE(topology->deviceIndex(), otherVlanIndex);
    EXPECT_FALSE(kernel.device("vlan100")->hasMaster());
    EXPECT_FALSE(kernel.device("docker100"));
    EXPECT_EQ(kernel.linkCount(NetworkDevice::Kind::VlanSubInterface), 1u);
}

TEST_F(VlanTopologyTest, provisionBridgeSuccess_vlanZeroNeedsNoDevices)
{
    std::unique_ptr<VlanTopology> bridgeTopology = createTopology(SwitchMode::Bridge);
    std::unique_ptr<VlanTopology> pureTopology = createTopology(SwitchMode::Pure);

    EXPECT_CALL(*netlinkMock, createVlan(::testing::_, ::testing::_, ::testing::_))
        .Times(0);

    std::string bridgeName;
    ASSERT_TRUE(bridgeTopology->provisionBridgeForVlan(0, &bridgeName));
    EXPECT_EQ(bridgeName, "docker");

    ASSERT_TRUE(pureTopology->provisionBridgeForVlan(0, &bridgeName));
    EXPECT_EQ(bridgeName, "");
}

TEST_F(VlanTopologyTest, provisionBridgeSuccess_pureModeEnablesProxyArp)
{
    std::unique_ptr<VlanTopology> topology = createTopology(SwitchMode::Pure);
    ASSERT_TRUE(topology->init());

    std::string bridgeName;
    ASSERT_TRUE(topology->provisionBridgeForVlan(20, &bridgeName));
    EXPECT_EQ(bridgeName, "docker20");
    EXPECT_EQ(kernel.conf("docker20", "proxy_arp"), 1);
}

TEST_F(VlanTopologyTest, provisionBridgeFailed_vlanCreateFails)
{
    std::unique_ptr<VlanTopology> topology = createTopology(SwitchMode::Pure);
    ASSERT_TRUE(topology->init());

    ON_CALL(*netlinkMock, createVlan(::testing::_, ::testing::_, ::testing::_))
        .WillByDefault(::testing::Return(false));

    std::string bridgeName;
    EXPECT_FALSE(topology->provisionBridgeForVlan(30, &bridgeName));
    EXPECT_FALSE(kernel.device("docker30"));
}

/**
 * @brief Test the vlan device is only created once however many times it's
 * asked for.
 */
TEST_F(VlanTopologyTest, ensureVlanDeviceSuccess_obtainOrCreateIsIdempotent)
{
    std::unique_ptr<VlanTopology> topology = createTopology(SwitchMode::Pure);
    ASSERT_TRUE(topology->init());

    EXPECT_CALL(*netlinkMock, createVlan("vlan42", 42, eth1Index))
        .Times(1);

    ASSERT_TRUE(topology->ensureVlanDevice(42));
    const int firstIndex = kernel.device("vlan42")->index;

    ASSERT_TRUE(topology->ensureVlanDevice(42));
    EXPECT_EQ(kernel.device("vlan42")->index, firstIndex);
    EXPECT_EQ(kernel.linkCount(NetworkDevice::Kind::VlanSubInterface), 1u);
}
