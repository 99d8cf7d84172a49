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
 * File:   PodNetDaemon.cpp
 *
 */
#include "PodNetDaemon.h"
#include "BridgeDelegate.h"
#include "CniPluginDelegate.h"
#include "RequestDispatcher.h"
#include "CniHttpServer.h"

#include <IPodNetSettings.h>
#include <Netlink.h>
#include <Netfilter.h>
#include <NetworkConfig.h>
#include <VlanTopology.h>
#include <PortMappingStore.h>
#include <IptablesPortMapper.h>
#include <PersistedRuleSync.h>

#include <Logging.h>
#include <ProcessUtilities.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <functional>
#include <thread>

#include <stdio.h>
#include <unistd.h>
#include <signal.h>
#include <syslog.h>
#include <strings.h>
#include <sys/uio.h>
#include <sys/syscall.h>

volatile sig_atomic_t PodNetDaemon::mSigTerm = 0;


/// The targets for logging
std::atomic<unsigned> PodNetDaemon::mLogTargets(LogTarget::Console);


PodNetDaemon::PodNetDaemon(const std::shared_ptr<const IPodNetSettings>& settings)
    : mSettings(settings)
{
}

PodNetDaemon::~PodNetDaemon()
{
    PN_LOG_FN_ENTRY();

    // stop taking requests before the things they use go away
    if (mServer)
        mServer->stop();

    if (mRuleSync)
        mRuleSync->stop();

    PN_LOG_FN_EXIT();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Signal handler for SIGTERM and SIGINT
 *
 */
void PodNetDaemon::sigTermHandler(int sigNum)
{
    if ((sigNum == SIGTERM) || (sigNum == SIGINT))
    {
        mSigTerm = 1;
    }
}

// -----------------------------------------------------------------------------
/**
 *  @brief Utility function that MUST be called at startup from the main thread
 *  before any other threads are spawned.
 *
 */
void PodNetDaemon::configSignals()
{
    PN_LOG_FN_ENTRY();

    // Ignore SIGPIPE signal, the http server writes to sockets the client
    // may have closed
    signal(SIGPIPE, SIG_IGN);

    // Install a handler for SIGTERM / SIGINT so that we can cleanly shutdown
    struct sigaction action;
    bzero(&action, sizeof(action));
    action.sa_handler = sigTermHandler;
    action.sa_flags = SA_RESTART;
    sigemptyset(&action.sa_mask);

    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGINT, &action, nullptr);

    PN_LOG_FN_EXIT();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Writes logging output to the console.
 *
 */
void PodNetDaemon::logConsolePrinter(int level, const char *file, const char *func,
                                     int line, const char *message)
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);

    struct iovec iov[6];
    char tbuf[32];

    iov[0].iov_base = tbuf;
    iov[0].iov_len = snprintf(tbuf, sizeof(tbuf), "%.010lu.%.06lu ",
                              ts.tv_sec, ts.tv_nsec / 1000);
    iov[0].iov_len = std::min<size_t>(iov[0].iov_len, sizeof(tbuf));


    char threadbuf[32];
    iov[1].iov_base = threadbuf;
    iov[1].iov_len = snprintf(threadbuf, sizeof(threadbuf), "<T-%lu> ", syscall(SYS_gettid));
    iov[1].iov_len = std::min<size_t>(iov[1].iov_len, sizeof(threadbuf));

    switch (level)
    {
        case PN_DEBUG_LEVEL_FATAL:
            iov[2].iov_base = (void*)"FTL: ";
            iov[2].iov_len = 5;
            break;
        case PN_DEBUG_LEVEL_ERROR:
            iov[2].iov_base = (void*)"ERR: ";
            iov[2].iov_len = 5;
            break;
        case PN_DEBUG_LEVEL_WARNING:
            iov[2].iov_base = (void*)"WRN: ";
            iov[2].iov_len = 5;
            break;
        case PN_DEBUG_LEVEL_MILESTONE:
        case PN_DEBUG_LEVEL_PROD_MILESTONE:
            iov[2].iov_base = (void*)"MIL: ";
            iov[2].iov_len = 5;
            break;
        case PN_DEBUG_LEVEL_INFO:
            iov[2].iov_base = (void*)"NFO: ";
            iov[2].iov_len = 5;
            break;
        case PN_DEBUG_LEVEL_DEBUG:
            iov[2].iov_base = (void*)"DBG: ";
            iov[2].iov_len = 5;
            break;
        default:
            iov[2].iov_base = (void*)": ";
            iov[2].iov_len = 2;
            break;
    }

    char fbuf[160];
    iov[3].iov_base = (void*)fbuf;
    if (!file || !func || (line <= 0))
        iov[3].iov_len = snprintf(fbuf, sizeof(fbuf), "< M:? F:? L:? > ");
    else
        iov[3].iov_len = snprintf(fbuf, sizeof(fbuf), "< M:%.*s F:%.*s L:%d > ",
                                  64, file, 64, func, line);
    iov[3].iov_len = std::min<size_t>(iov[3].iov_len, sizeof(fbuf));

    iov[4].iov_base = const_cast<char*>(message);
    iov[4].iov_len = strlen(message);

    iov[5].iov_base = (void*)"\n";
    iov[5].iov_len = 1;


    // nothing sensible to do if the console write fails
    (void)writev(fileno((level < PN_DEBUG_LEVEL_INFO) ? stderr : stdout), iov, 6);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Diag printer installed in the Logging component, sends each
 *  message to the enabled targets.
 *
 */
void PodNetDaemon::logPrinter(int level, const char *file, const char *func,
                              int line, const char *message)
{
    if (mLogTargets & LogTarget::SysLog)
    {
        int priority;
        switch (level)
        {
            case PN_DEBUG_LEVEL_FATAL:          priority = LOG_CRIT;      break;
            case PN_DEBUG_LEVEL_ERROR:          priority = LOG_ERR;       break;
            case PN_DEBUG_LEVEL_WARNING:        priority = LOG_WARNING;   break;
            case PN_DEBUG_LEVEL_PROD_MILESTONE:
            case PN_DEBUG_LEVEL_MILESTONE:      priority = LOG_NOTICE;    break;
            case PN_DEBUG_LEVEL_INFO:           priority = LOG_INFO;      break;
            case PN_DEBUG_LEVEL_DEBUG:          priority = LOG_DEBUG;     break;
            default:
                return;
        }

        syslog(priority, "< M:%s F:%s L:%d > %s", file, func, line, message);
    }

    if (mLogTargets & LogTarget::Console)
    {
        logConsolePrinter(level, file, func, line, message);
    }
}

// -----------------------------------------------------------------------------
/**
 *  @brief Static method must be called early in the startup before object
 *  is instantiated
 *
 *  May be called again to change the targets, e.g. after daemonising.
 */
void PodNetDaemon::setupLogging(unsigned targets /*= LogTarget::Console*/)
{
    // always setup syslog in-case the user wants to switch to it
    openlog("PodNetDaemon", 0, LOG_DAEMON);

    mLogTargets = targets;

    PodNetCommon::diag_printer_t printer = std::bind(logPrinter,
                                                     std::placeholders::_1,
                                                     std::placeholders::_2,
                                                     std::placeholders::_3,
                                                     std::placeholders::_4,
                                                     std::placeholders::_5);

    PodNetCommon::initLogging(printer);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Switches IPv6 off inside the pod's network namespace.
 */
bool PodNetDaemon::disableIpv6InNamespace(const std::string& netnsPath)
{
    return PodNetCommon::callInNetworkNamespace(netnsPath,
        []()
        {
            Netlink netlink;
            return netlink.isValid() && netlink.setIpv6Disabled(true);
        });
}

// -----------------------------------------------------------------------------
/**
 *  @brief Creates the backend delegate selected in the settings.
 *
 *  For the bridge backend this also takes over the host device and sets up
 *  the default bridge.
 */
bool PodNetDaemon::initBackend()
{
    PN_LOG_FN_ENTRY();

    if (mSettings->backend() == IPodNetSettings::Backend::Exec)
    {
        PN_LOG_INFO("using cni plugins from '%s'", mSettings->cniPluginDir().c_str());

        mDelegate = std::make_shared<CniPluginDelegate>(mSettings->cniPluginDir(),
                                                        mSettings->cniDelegateConfig());
        PN_LOG_FN_EXIT();
        return true;
    }

    std::string error;
    const boost::optional<NetworkConfig> config =
        NetworkConfig::fromJson(mSettings->networkConfig(), &error);
    if (!config)
    {
        PN_LOG_ERROR_EXIT("invalid network config - %s", error.c_str());
        return false;
    }

    mTopology = std::make_shared<VlanTopology>(mNetlink, config.get());
    if (!mTopology->init())
    {
        PN_LOG_ERROR_EXIT("failed to set up host network on '%s'",
                          config->device.c_str());
        return false;
    }

    mDelegate = std::make_shared<BridgeDelegate>(mTopology, mNetlink);

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Builds the engine and starts the request server.
 *
 *  @return false if the daemon can't run, the reason is logged.
 */
bool PodNetDaemon::init()
{
    PN_LOG_FN_ENTRY();

    std::shared_ptr<Netlink> netlink = std::make_shared<Netlink>();
    if (!netlink->isValid())
    {
        PN_LOG_ERROR_EXIT("failed to open netlink socket");
        return false;
    }
    mNetlink = netlink;

    if (!initBackend())
    {
        PN_LOG_FN_EXIT();
        return false;
    }

    mStore = std::make_shared<PortMappingStore>(mSettings->portMappingStateDir());
    mPortMapper = std::make_shared<IptablesPortMapper>(std::make_shared<Netfilter>());

    // the sync timer retries this, so not fatal
    if (!mPortMapper->ensureBasicRules())
    {
        PN_LOG_WARN("failed to set up host port chain");
    }

    RequestDispatcher::Ipv6Disabler ipv6Disabler;
    if (mSettings->disableIpv6())
        ipv6Disabler = disableIpv6InNamespace;

    mDispatcher = std::make_shared<RequestDispatcher>(mDelegate, mStore,
                                                      mPortMapper, ipv6Disabler);

    const IPodNetSettings::FirewallSettings firewall = mSettings->firewallSettings();
    mRuleSync.reset(new PersistedRuleSync(firewall.ebtablesFile,
                                          firewall.ebtablesInterval,
                                          mPortMapper,
                                          firewall.iptablesInterval));
    mRuleSync->start();

    mServer.reset(new CniHttpServer(mSettings->socketPath(), mDispatcher));
    if (!mServer->start())
    {
        PN_LOG_ERROR_EXIT("failed to start request server");
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Blocks until SIGTERM or SIGINT is received.
 *
 */
void PodNetDaemon::run() const
{
    PN_LOG_FN_ENTRY();

    while (mSigTerm == 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    PN_LOG_INFO("detected SIGTERM, terminating daemon");

    PN_LOG_FN_EXIT();
}
