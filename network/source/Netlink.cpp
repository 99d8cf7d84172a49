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
 * File:   Netlink.cpp
 *
 */
#include "Netlink.h"

#include <Logging.h>

#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <linux/if.h>
#include <linux/rtnetlink.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/errno.h>
#include <netlink/cache.h>
#include <netlink/route/link.h>
#include <netlink/route/addr.h>
#include <netlink/route/route.h>
#include <netlink/route/nexthop.h>
#include <netlink/route/link/veth.h>
#include <netlink/route/link/vlan.h>
#include <netlink/route/link/bridge.h>

#define PN_LOG_NL_WARN(err, fmt, args...) \
    PN_LOG_WARN(fmt " (%d - %s)", ##args, -err, nl_geterror(err))

#define PN_LOG_NL_ERROR(err, fmt, args...) \
    PN_LOG_ERROR(fmt " (%d - %s)", ##args, -err, nl_geterror(err))

#define PN_LOG_NL_ERROR_EXIT(err, fmt, args...) \
    PN_LOG_ERROR_EXIT(fmt " (%d - %s)", ##args, -err, nl_geterror(err))


// -----------------------------------------------------------------------------
/**
 *  @class NlAddress
 *  @brief Wrapper around the nl_addr object
 *
 *  Handles construction and safe destruction of a nl addr object.  IPv4
 *  addresses are supplied in host order and stored in network order as
 *  netlink expects.
 */
class NlAddress
{
public:
    explicit NlAddress(in_addr_t address, uint8_t prefixLen = 32)
        : mAddress(fromIpv4(address, prefixLen))
    { }

    explicit NlAddress(const MacAddress &mac)
        : mAddress(nl_addr_build(AF_LLC, mac.data(), mac.size()))
    { }

    ~NlAddress()
    {
        if (mAddress)
            nl_addr_put(mAddress);
    }

    NlAddress(const NlAddress&) = delete;
    NlAddress& operator=(const NlAddress&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mAddress != nullptr);
    }

    operator struct nl_addr*() const noexcept
    {
        return mAddress;
    }

public:
    static in_addr_t toIpv4(struct nl_addr *addr)
    {
        if ((addr == nullptr) ||
            (nl_addr_get_family(addr) != AF_INET) ||
            (nl_addr_get_len(addr) != sizeof(in_addr_t)))
        {
            return 0;
        }

        in_addr_t value;
        memcpy(&value, nl_addr_get_binary_addr(addr), sizeof(value));
        return ntohl(value);
    }

private:
    static struct nl_addr* fromIpv4(in_addr_t address, uint8_t prefixLen)
    {
        struct nl_addr* addr = nullptr;

        // the default route has an empty destination
        if ((address == 0) && (prefixLen == 0))
        {
            addr = nl_addr_alloc(0);
            if (addr != nullptr)
            {
                nl_addr_set_family(addr, AF_INET);
                nl_addr_set_prefixlen(addr, 0);
            }
        }
        else
        {
            struct in_addr ip;
            ip.s_addr = htonl(address);

            addr = nl_addr_build(AF_INET, &ip, sizeof(struct in_addr));
            if (addr != nullptr)
            {
                nl_addr_set_prefixlen(addr, prefixLen);
            }
        }

        return addr;
    }

private:
    struct nl_addr* const mAddress;
};


// -----------------------------------------------------------------------------
/**
 *  @class NlRouteAddress
 *  @brief Wrapper around the rtnl_addr object
 */
class NlRouteAddress
{
public:
    NlRouteAddress(int ifIndex, const Ipv4Address &address)
        : mAddress(fromIpv4(ifIndex, address))
    { }

    ~NlRouteAddress()
    {
        if (mAddress)
            rtnl_addr_put(mAddress);
    }

    NlRouteAddress(const NlRouteAddress&) = delete;
    NlRouteAddress& operator=(const NlRouteAddress&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mAddress != nullptr);
    }

    operator struct rtnl_addr*() const noexcept
    {
        return mAddress;
    }

private:
    static struct rtnl_addr* fromIpv4(int ifIndex, const Ipv4Address &address)
    {
        NlAddress local(address.local, address.prefixLen);
        if (!local)
        {
            PN_LOG_ERROR("failed to create ipv4 nl address");
            return nullptr;
        }

        // the kernel doesn't fill in the broadcast for us, do the same as
        // iproute2 and derive it for anything bigger than a /31
        in_addr_t broadcast = address.broadcast;
        if ((broadcast == 0) && (address.prefixLen < 31))
        {
            const in_addr_t netmask = (address.prefixLen == 0) ? 0 :
                (0xffffffff << (32 - address.prefixLen));
            broadcast = address.local | ~netmask;
        }

        struct rtnl_addr* addr = rtnl_addr_alloc();
        if (addr == nullptr)
        {
            PN_LOG_ERROR("failed to create route address");
            return nullptr;
        }

        rtnl_addr_set_ifindex(addr, ifIndex);
        rtnl_addr_set_family(addr, AF_INET);
        rtnl_addr_set_local(addr, local);
        rtnl_addr_set_prefixlen(addr, address.prefixLen);

        if (broadcast != 0)
        {
            NlAddress bcast(broadcast);
            if (bcast)
                rtnl_addr_set_broadcast(addr, bcast);
        }

        if (!address.label.empty())
            rtnl_addr_set_label(addr, address.label.c_str());

        return addr;
    }

private:
    struct rtnl_addr* const mAddress;
};


// -----------------------------------------------------------------------------
/**
 *  @class NlRoute
 *  @brief Wrapper around the rtnl_route object
 */
class NlRoute
{
public:
    NlRoute()
        : mRoute(rtnl_route_alloc())
    { }

    ~NlRoute()
    {
        if (mRoute != nullptr)
            rtnl_route_put(mRoute);
    }

    NlRoute(const NlRoute&) = delete;
    NlRoute& operator=(const NlRoute&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mRoute != nullptr);
    }

    operator struct rtnl_route*() const noexcept
    {
        return mRoute;
    }

private:
    struct rtnl_route* const mRoute;
};


// -----------------------------------------------------------------------------
/**
 *  @class NlLink
 *  @brief Wrapper around the rtnl_link object
 */
class NlLink
{
public:
    NlLink()
        : mLink(rtnl_link_alloc())
    { }

    explicit NlLink(struct rtnl_link* link)
        : mLink(link)
    { }

    NlLink(struct nl_sock* nl, const std::string& name)
        : mLink(fromKernel(nl, 0, name.c_str()))
    { }

    NlLink(struct nl_sock* nl, int ifIndex)
        : mLink(fromKernel(nl, ifIndex, nullptr))
    { }

    ~NlLink()
    {
        if (mLink != nullptr)
            rtnl_link_put(mLink);
    }

    NlLink(const NlLink&) = delete;
    NlLink& operator=(const NlLink&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mLink != nullptr);
    }

    operator struct rtnl_link*() const noexcept
    {
        return mLink;
    }

private:
    static struct rtnl_link* fromKernel(struct nl_sock* nl, int ifIndex,
                                        const char *name)
    {
        struct rtnl_link* link = nullptr;

        int ret = rtnl_link_get_kernel(nl, ifIndex, name, &link);
        if (ret != 0)
        {
            // not finding a link is a normal part of obtain-or-create
            if (ret != -NLE_NODEV && ret != -NLE_OBJ_NOTFOUND)
            {
                PN_LOG_NL_WARN(ret, "failed to get interface '%s' (index %d)",
                               name ? name : "", ifIndex);
            }
            return nullptr;
        }

        return link;
    }

private:
    struct rtnl_link* const mLink;
};


// -----------------------------------------------------------------------------
/**
 *  @class NlCache
 *  @brief Wrapper around nl_cache, frees the cache on destruction.
 */
class NlCache
{
public:
    NlCache()
        : mCache(nullptr)
    { }

    ~NlCache()
    {
        if (mCache != nullptr)
            nl_cache_free(mCache);
    }

    NlCache(const NlCache&) = delete;
    NlCache& operator=(const NlCache&) = delete;

public:
    struct nl_cache** out()
    {
        return &mCache;
    }

    struct nl_object* first() const
    {
        return mCache ? nl_cache_get_first(mCache) : nullptr;
    }

private:
    struct nl_cache* mCache;
};


Netlink::Netlink()
    : mSocket(nullptr)
{
    PN_LOG_FN_ENTRY();

    mSocket = nl_socket_alloc();
    if (!mSocket)
    {
        PN_LOG_ERROR_EXIT("failed to create netlink socket");
        return;
    }

    int ret = nl_connect(mSocket, NETLINK_ROUTE);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "unable to connect to netlink socket");
        nl_socket_free(mSocket);
        mSocket = nullptr;
        return;
    }

    // forked iptables / plugin processes mustn't inherit the socket
    int fd = nl_socket_get_fd(mSocket);
    if (fd < 0)
    {
        PN_LOG_ERROR("invalid socket fd");
        nl_socket_free(mSocket);
        mSocket = nullptr;
    }
    else
    {
        int flags = fcntl(fd, F_GETFD, 0);
        if ((flags < 0) || (fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0))
        {
            PN_LOG_SYS_ERROR(errno, "failed to set FD_CLOEXEC");
            nl_socket_free(mSocket);
            mSocket = nullptr;
        }
    }

    PN_LOG_FN_EXIT();
}

Netlink::~Netlink()
{
    if (mSocket != nullptr)
    {
        nl_socket_free(mSocket);
        mSocket = nullptr;
    }
}

bool Netlink::isValid() const
{
    std::lock_guard<std::mutex> locker(mLock);
    return (mSocket != nullptr);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Copies the attributes of the libnl link object into a
 *  NetworkDevice.
 *
 *  The kind is taken from the link's IFLA_INFO_KIND, anything that isn't a
 *  vlan or bridge is treated as a physical device.
 */
NetworkDevice Netlink::toNetworkDevice(const NlLink &link) const
{
    NetworkDevice device;

    const char *name = rtnl_link_get_name(link);
    device.name = name ? name : "";
    device.index = rtnl_link_get_ifindex(link);
    device.masterIndex = rtnl_link_get_master(link);

    struct nl_addr *hwAddr = rtnl_link_get_addr(link);
    if (hwAddr && (nl_addr_get_len(hwAddr) == device.mac.size()))
    {
        memcpy(device.mac.data(), nl_addr_get_binary_addr(hwAddr),
               device.mac.size());
    }

    const char *type = rtnl_link_get_type(link);
    if (type && (strcmp(type, "vlan") == 0))
    {
        device.kind = NetworkDevice::Kind::VlanSubInterface;

        VlanInfo info;
        info.vlanId = static_cast<uint16_t>(rtnl_link_vlan_get_id(link));
        info.parentIndex = rtnl_link_get_link(link);
        device.vlan = info;
    }
    else if (type && (strcmp(type, "bridge") == 0))
    {
        device.kind = NetworkDevice::Kind::Bridge;
    }
    else
    {
        device.kind = NetworkDevice::Kind::Physical;
    }

    return device;
}

boost::optional<NetworkDevice> Netlink::getLink(const std::string &name) const
{
    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR("invalid socket");
        return boost::none;
    }

    NlLink link(mSocket, name);
    if (!link)
    {
        return boost::none;
    }

    return toNetworkDevice(link);
}

boost::optional<NetworkDevice> Netlink::getLinkByIndex(int ifIndex) const
{
    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR("invalid socket");
        return boost::none;
    }

    NlLink link(mSocket, ifIndex);
    if (!link)
    {
        return boost::none;
    }

    return toNetworkDevice(link);
}

bool Netlink::listLinks(std::list<NetworkDevice> *links) const
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlCache cache;
    int ret = rtnl_link_alloc_cache(mSocket, AF_UNSPEC, cache.out());
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to get the list of links");
        return false;
    }

    links->clear();
    for (struct nl_object *obj = cache.first(); obj != nullptr;
         obj = nl_cache_get_next(obj))
    {
        // the cache keeps its own reference, take one for the wrapper
        nl_object_get(obj);
        NlLink link(reinterpret_cast<struct rtnl_link*>(obj));

        links->emplace_back(toNetworkDevice(link));
    }

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Creates a new bridge device.
 *
 *  This is equivalent of the performing the following on the command line
 *
 *      ip link add name <name> [address <mac>] type bridge
 *      ip link set <name> up
 *
 *  @param[in]  name    The name of the new bridge.
 *  @param[in]  mac     Optional hardware address for the bridge.
 *
 *  @return true on success, false on failure.
 */
bool Netlink::createBridge(const std::string &name,
                           const boost::optional<MacAddress> &mac)
{
    PN_LOG_FN_ENTRY();

    if (name.empty() || (name.size() >= IFNAMSIZ))
    {
        PN_LOG_ERROR_EXIT("invalid bridge name '%s'", name.c_str());
        return false;
    }

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink bridge(rtnl_link_bridge_alloc());
    if (!bridge)
    {
        PN_LOG_ERROR_EXIT("failed to allocate bridge link");
        return false;
    }

    rtnl_link_set_name(bridge, name.c_str());
    rtnl_link_set_flags(bridge, IFF_UP);

    if (mac)
    {
        NlAddress hwAddr(mac.get());
        if (!hwAddr)
        {
            PN_LOG_ERROR_EXIT("failed to create hw address");
            return false;
        }

        rtnl_link_set_addr(bridge, hwAddr);
    }

    int ret = rtnl_link_add(mSocket, bridge, NLM_F_CREATE | NLM_F_EXCL);
    if (ret == -NLE_EXIST)
    {
        PN_LOG_WARN("bridge '%s' already exists", name.c_str());
    }
    else if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to create bridge named '%s'",
                             name.c_str());
        return false;
    }
    else
    {
        PN_LOG_INFO("created bridge device '%s'%s%s", name.c_str(),
                    mac ? " with mac " : "",
                    mac ? macToString(mac.get()).c_str() : "");
    }

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Creates a vlan sub-interface.
 *
 *  This is equivalent of the performing the following on the command line
 *
 *      ip link add link <parent> name <name> type vlan id <vlanId>
 *
 *  @return true on success, false on failure.
 */
bool Netlink::createVlan(const std::string &name, uint16_t vlanId,
                         int parentIndex)
{
    PN_LOG_FN_ENTRY();

    if (name.empty() || (name.size() >= IFNAMSIZ))
    {
        PN_LOG_ERROR_EXIT("invalid vlan name '%s'", name.c_str());
        return false;
    }

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink vlan(rtnl_link_vlan_alloc());
    if (!vlan)
    {
        PN_LOG_ERROR_EXIT("failed to allocate vlan link");
        return false;
    }

    rtnl_link_set_name(vlan, name.c_str());
    rtnl_link_set_link(vlan, parentIndex);

    int ret = rtnl_link_vlan_set_id(vlan, vlanId);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to set vlan id %hu", vlanId);
        return false;
    }

    ret = rtnl_link_add(mSocket, vlan, NLM_F_CREATE | NLM_F_EXCL);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to add vlan device '%s' (id %hu, "
                             "parent %d)", name.c_str(), vlanId, parentIndex);
        return false;
    }

    PN_LOG_INFO("created vlan device '%s' (id %hu, parent %d)",
                name.c_str(), vlanId, parentIndex);

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Creates a veth pair and moves the peer into another namespace.
 *
 *  This is equivalent of the performing the following on the command line
 *
 *      ip link add <hostName> type veth peer name <peerName> netns <fd>
 *
 *  @param[in]  hostName    The name of the end left in this namespace.
 *  @param[in]  peerName    The name of the end moved into the namespace.
 *  @param[in]  netnsFd     Open fd of the target network namespace.
 *
 *  @return true on success, false on failure.
 */
bool Netlink::createVethPair(const std::string &hostName,
                             const std::string &peerName,
                             int netnsFd)
{
    PN_LOG_FN_ENTRY();

    if (hostName.empty() || (hostName.size() >= IFNAMSIZ) ||
        peerName.empty() || (peerName.size() >= IFNAMSIZ))
    {
        PN_LOG_ERROR_EXIT("invalid veth names ('%s' : '%s')",
                          hostName.c_str(), peerName.c_str());
        return false;
    }

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink veth(rtnl_link_veth_alloc());
    if (!veth)
    {
        PN_LOG_ERROR_EXIT("failed to allocate veth link");
        return false;
    }

    // get_peer takes a reference on the peer
    NlLink peer(rtnl_link_veth_get_peer(veth));
    if (!peer)
    {
        PN_LOG_ERROR_EXIT("failed to get veth peer");
        return false;
    }

    rtnl_link_set_name(veth, hostName.c_str());
    rtnl_link_set_name(peer, peerName.c_str());
    rtnl_link_set_ns_fd(peer, netnsFd);

    int ret = rtnl_link_add(mSocket, veth, NLM_F_CREATE | NLM_F_EXCL);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to create veth pair ('%s' : '%s')",
                             hostName.c_str(), peerName.c_str());
        return false;
    }

    PN_LOG_INFO("created veth pair ('%s' <-> '%s')", hostName.c_str(),
                peerName.c_str());

    PN_LOG_FN_EXIT();
    return true;
}

bool Netlink::deleteLink(int ifIndex)
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink link;
    if (!link)
    {
        PN_LOG_ERROR_EXIT("failed to allocate link");
        return false;
    }

    rtnl_link_set_ifindex(link, ifIndex);

    int ret = rtnl_link_delete(mSocket, link);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to delete link %d", ifIndex);
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Sets or clears the master of an interface.
 *
 *  This is equivalent of the performing the following on the command line
 *
 *      ip link set <ifIndex> master <masterIndex>
 *  Or
 *      ip link set <ifIndex> nomaster
 *
 *  @return true on success, false on failure.
 */
bool Netlink::setMaster(int ifIndex, int masterIndex)
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    int ret;
    if (masterIndex > 0)
        ret = rtnl_link_enslave_ifindex(mSocket, masterIndex, ifIndex);
    else
        ret = rtnl_link_release_ifindex(mSocket, ifIndex);

    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to set master of link %d to %d",
                             ifIndex, masterIndex);
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}

bool Netlink::ifaceUp(int ifIndex)
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink link(mSocket, ifIndex);
    if (!link)
    {
        PN_LOG_ERROR_EXIT("failed to get link %d", ifIndex);
        return false;
    }

    // create an empty link object with just the flags changed
    NlLink changes;
    if (!changes)
    {
        PN_LOG_ERROR_EXIT("failed to create changes object");
        return false;
    }

    rtnl_link_set_flags(changes, IFF_UP);

    int ret = rtnl_link_change(mSocket, link, changes, 0);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to bring up link %d", ifIndex);
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}

bool Netlink::listIpv4Addresses(int ifIndex, std::list<Ipv4Address> *addresses) const
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlCache cache;
    int ret = rtnl_addr_alloc_cache(mSocket, cache.out());
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to get the list of addresses");
        return false;
    }

    addresses->clear();
    for (struct nl_object *obj = cache.first(); obj != nullptr;
         obj = nl_cache_get_next(obj))
    {
        struct rtnl_addr *addr = reinterpret_cast<struct rtnl_addr*>(obj);
        if ((rtnl_addr_get_ifindex(addr) != ifIndex) ||
            (rtnl_addr_get_family(addr) != AF_INET))
        {
            continue;
        }

        Ipv4Address address;
        address.local = NlAddress::toIpv4(rtnl_addr_get_local(addr));
        address.prefixLen = static_cast<uint8_t>(rtnl_addr_get_prefixlen(addr));
        address.broadcast = NlAddress::toIpv4(rtnl_addr_get_broadcast(addr));

        const char *label = rtnl_addr_get_label(addr);
        if (label)
            address.label = label;

        addresses->emplace_back(std::move(address));
    }

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Adds an IPv4 address to an interface.
 *
 *  This is the equivalent of the following on the command line
 *
 *      ip addr add <local>/<prefixLen> brd <broadcast> dev <ifIndex>
 *
 *  An address that already exists on the interface is not an error.
 */
bool Netlink::addAddress(int ifIndex, const Ipv4Address &address)
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlRouteAddress addr(ifIndex, address);
    if (!addr)
    {
        PN_LOG_ERROR_EXIT("failed to create route address object");
        return false;
    }

    PN_LOG_INFO("adding address %s to link %d",
                ipv4AddressToString(address).c_str(), ifIndex);

    int ret = rtnl_addr_add(mSocket, addr, 0);
    if ((ret != 0) && (ret != -NLE_EXIST))
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to add address %s to link %d",
                             ipv4AddressToString(address).c_str(), ifIndex);
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}

bool Netlink::delAddress(int ifIndex, const Ipv4Address &address)
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlRouteAddress addr(ifIndex, address);
    if (!addr)
    {
        PN_LOG_ERROR_EXIT("failed to create route address object");
        return false;
    }

    PN_LOG_INFO("removing address %s from link %d",
                ipv4AddressToString(address).c_str(), ifIndex);

    int ret = rtnl_addr_delete(mSocket, addr, 0);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to remove address %s from link %d",
                             ipv4AddressToString(address).c_str(), ifIndex);
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}

bool Netlink::listIpv4Routes(int ifIndex, std::list<Ipv4Route> *routes) const
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlCache cache;
    int ret = rtnl_route_alloc_cache(mSocket, AF_INET, 0, cache.out());
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to get the list of routes");
        return false;
    }

    routes->clear();
    for (struct nl_object *obj = cache.first(); obj != nullptr;
         obj = nl_cache_get_next(obj))
    {
        struct rtnl_route *route = reinterpret_cast<struct rtnl_route*>(obj);
        if ((rtnl_route_get_table(route) != RT_TABLE_MAIN) ||
            (rtnl_route_get_nnexthops(route) < 1))
        {
            continue;
        }

        struct rtnl_nexthop *nextHop = rtnl_route_nexthop_n(route, 0);
        if (!nextHop || (rtnl_route_nh_get_ifindex(nextHop) != ifIndex))
        {
            continue;
        }

        Ipv4Route entry;
        struct nl_addr *dst = rtnl_route_get_dst(route);
        entry.destination = NlAddress::toIpv4(dst);
        entry.dstPrefixLen = dst ? static_cast<uint8_t>(nl_addr_get_prefixlen(dst)) : 0;
        entry.gateway = NlAddress::toIpv4(rtnl_route_nh_get_gateway(nextHop));
        entry.source = NlAddress::toIpv4(rtnl_route_get_pref_src(route));
        entry.scope = rtnl_route_get_scope(route);
        entry.ifIndex = ifIndex;

        routes->emplace_back(entry);
    }

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Adds a route to the main table.
 *
 *  This is the equivalent of the following on the command line
 *
 *      ip route add <dst> [via <gateway>] dev <ifIndex> [src <source>]
 *                  scope <scope>
 *
 *  A route that already exists is not an error.
 */
bool Netlink::addRoute(const Ipv4Route &route)
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        PN_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlAddress dstAddress(route.destination, route.dstPrefixLen);
    if (!dstAddress)
    {
        PN_LOG_ERROR_EXIT("failed to create destination address");
        return false;
    }

    NlRoute nlRoute;
    if (!nlRoute)
    {
        PN_LOG_ERROR_EXIT("failed to create empty route");
        return false;
    }

    rtnl_route_set_scope(nlRoute, static_cast<uint8_t>(route.scope));
    rtnl_route_set_table(nlRoute, RT_TABLE_MAIN);
    rtnl_route_set_protocol(nlRoute, RTPROT_BOOT);

    int ret = rtnl_route_set_family(nlRoute, AF_INET);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to set the route family");
        return false;
    }
    ret = rtnl_route_set_dst(nlRoute, dstAddress);
    if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to set the route destination");
        return false;
    }

    if (route.source != 0)
    {
        NlAddress srcAddress(route.source);
        if (!srcAddress || (rtnl_route_set_pref_src(nlRoute, srcAddress) != 0))
        {
            PN_LOG_ERROR_EXIT("failed to set the route source");
            return false;
        }
    }

    // the route takes ownership of the next hop
    struct rtnl_nexthop* nextHop = rtnl_route_nh_alloc();
    if (nextHop == nullptr)
    {
        PN_LOG_ERROR_EXIT("failed to create empty next hop");
        return false;
    }

    if (route.gateway != 0)
    {
        NlAddress gwAddress(route.gateway);
        if (!gwAddress)
        {
            rtnl_route_nh_free(nextHop);
            PN_LOG_ERROR_EXIT("failed to create gateway address");
            return false;
        }
        rtnl_route_nh_set_gateway(nextHop, gwAddress);
    }

    rtnl_route_nh_set_ifindex(nextHop, route.ifIndex);
    rtnl_route_add_nexthop(nlRoute, nextHop);

    PN_LOG_INFO("adding route '%s'", ipv4RouteToString(route).c_str());

    ret = rtnl_route_add(mSocket, nlRoute, 0);
    if (ret == -NLE_EXIST)
    {
        PN_LOG_INFO("route '%s' already exists", ipv4RouteToString(route).c_str());
    }
    else if (ret != 0)
    {
        PN_LOG_NL_ERROR_EXIT(ret, "failed to add route '%s'",
                             ipv4RouteToString(route).c_str());
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Writes a decimal value to a file under /proc/sys.
 *
 *  The files are per network namespace, so the value lands in the namespace
 *  of the calling thread.
 */
bool Netlink::writeProcSysValue(const std::string &path, int value) const
{
    int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to open '%s'", path.c_str());
        return false;
    }

    const std::string str = std::to_string(value);

    bool success = true;
    if (TEMP_FAILURE_RETRY(write(fd, str.c_str(), str.size())) != (ssize_t)str.size())
    {
        PN_LOG_SYS_ERROR(errno, "failed to write '%s' to '%s'", str.c_str(),
                         path.c_str());
        success = false;
    }

    if (close(fd) != 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to close '%s'", path.c_str());
    }

    return success;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Sets an IPv4 config value on the interface.
 *
 *  This is the equivalent of the following on the command line
 *
 *      echo <value> > /proc/sys/net/ipv4/conf/<ifaceName>/<conf>
 *
 */
bool Netlink::setIfaceConf(const std::string &ifaceName,
                           const std::string &conf, int value)
{
    if (ifaceName.empty() || (ifaceName.find('/') != std::string::npos) ||
        conf.empty() || (conf.find('/') != std::string::npos))
    {
        PN_LOG_ERROR("invalid interface '%s' or conf '%s'", ifaceName.c_str(),
                     conf.c_str());
        return false;
    }

    PN_LOG_INFO("setting %s/%s to %d", ifaceName.c_str(), conf.c_str(), value);

    return writeProcSysValue("/proc/sys/net/ipv4/conf/" + ifaceName + "/" + conf,
                             value);
}

bool Netlink::setNonLocalBind(bool enable)
{
    return writeProcSysValue("/proc/sys/net/ipv4/ip_nonlocal_bind",
                             enable ? 1 : 0);
}

bool Netlink::setIpv6Disabled(bool disable)
{
    const int value = disable ? 1 : 0;

    return writeProcSysValue("/proc/sys/net/ipv6/conf/all/disable_ipv6", value) &&
           writeProcSysValue("/proc/sys/net/ipv6/conf/default/disable_ipv6", value);
}
