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
#pragma once

#include <gmock/gmock.h>

#include "INetlink.h"
#include "FakeKernel.h"

#include <boost/optional.hpp>
#include <ostream>

namespace boost {

// gtest printer for boost::optional mock arguments / return values, boost's
// own operator<< static_asserts unless optional_io.hpp is used
template <typename T>
void PrintTo(const optional<T> &value, std::ostream *os)
{
    if (value)
        *os << "optional(" << ::testing::PrintToString(*value) << ")";
    else
        *os << "none";
}

} // namespace boost

// -----------------------------------------------------------------------------
/**
 *  @class NetlinkMock
 *  @brief INetlink mock that by default forwards every call to a FakeKernel,
 *  so individual calls can be made to fail with EXPECT_CALL / ON_CALL.
 */
class NetlinkMock : public INetlink {
public:
    explicit NetlinkMock(FakeKernel *kernel)
    {
        using ::testing::Invoke;

        ON_CALL(*this, getLink(::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::getLink));
        ON_CALL(*this, getLinkByIndex(::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::getLinkByIndex));
        ON_CALL(*this, listLinks(::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::listLinks));
        ON_CALL(*this, createBridge(::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::createBridge));
        ON_CALL(*this, createVlan(::testing::_, ::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::createVlan));
        ON_CALL(*this, createVethPair(::testing::_, ::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::createVethPair));
        ON_CALL(*this, deleteLink(::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::deleteLink));
        ON_CALL(*this, setMaster(::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::setMaster));
        ON_CALL(*this, ifaceUp(::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::ifaceUp));
        ON_CALL(*this, listIpv4Addresses(::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::listIpv4Addresses));
        ON_CALL(*this, addAddress(::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::addAddress));
        ON_CALL(*this, delAddress(::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::delAddress));
        ON_CALL(*this, listIpv4Routes(::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::listIpv4Routes));
        ON_CALL(*this, addRoute(::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::addRoute));
        ON_CALL(*this, setIfaceConf(::testing::_, ::testing::_, ::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::setIfaceConf));
        ON_CALL(*this, setNonLocalBind(::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::setNonLocalBind));
        ON_CALL(*this, setIpv6Disabled(::testing::_)).WillByDefault(Invoke(kernel, &FakeKernel::setIpv6Disabled));
    }

    virtual ~NetlinkMock() = default;

    MOCK_METHOD(boost::optional<NetworkDevice>, getLink, (const std::string &name), (const, override));
    MOCK_METHOD(boost::optional<NetworkDevice>, getLinkByIndex, (int ifIndex), (const, override));
    MOCK_METHOD(bool, listLinks, (std::list<NetworkDevice> *links), (const, override));

    MOCK_METHOD(bool, createBridge, (const std::string &name, const boost::optional<MacAddress> &mac), (override));
    MOCK_METHOD(bool, createVlan, (const std::string &name, uint16_t vlanId, int parentIndex), (override));
    MOCK_METHOD(bool, createVethPair, (const std::string &hostName, const std::string &peerName, int netnsFd), (override));
    MOCK_METHOD(bool, deleteLink, (int ifIndex), (override));
    MOCK_METHOD(bool, setMaster, (int ifIndex, int masterIndex), (override));
    MOCK_METHOD(bool, ifaceUp, (int ifIndex), (override));

    MOCK_METHOD(bool, listIpv4Addresses, (int ifIndex, std::list<Ipv4Address> *addresses), (const, override));
    MOCK_METHOD(bool, addAddress, (int ifIndex, const Ipv4Address &address), (override));
    MOCK_METHOD(bool, delAddress, (int ifIndex, const Ipv4Address &address), (override));
    MOCK_METHOD(bool, listIpv4Routes, (int ifIndex, std::list<Ipv4Route> *routes), (const, override));
    MOCK_METHOD(bool, addRoute, (const Ipv4Route &route), (override));

    MOCK_METHOD(bool, setIfaceConf, (const std::string &ifaceName, const std::string &conf, int value), (override));
    MOCK_METHOD(bool, setNonLocalBind, (bool enable), (override));
    MOCK_METHOD(bool, setIpv6Disabled, (bool disable), (override));
};
