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
 * File:   PodNetDaemon.h
 *
 */
#ifndef PODNETDAEMON_H
#define PODNETDAEMON_H

#include <signal.h>

#include <atomic>
#include <memory>
#include <string>

class IPodNetSettings;
class INetlink;
class VlanTopology;
class IBackendDelegate;
class PortMappingStore;
class IPortMapper;
class RequestDispatcher;
class CniHttpServer;
class PersistedRuleSync;

// -----------------------------------------------------------------------------
/**
 *  @class PodNetDaemon
 *  @brief The root PodNet object, owns the network engine and the request
 *  server.
 *
 */
class PodNetDaemon
{
public:
    explicit PodNetDaemon(const std::shared_ptr<const IPodNetSettings>& settings);
    ~PodNetDaemon();

public:
    bool init();
    void run() const;

public:
    static void configSignals();

public:
    enum LogTarget : unsigned { Console = 0x1, SysLog = 0x2 };
    static void setupLogging(unsigned targets = LogTarget::Console);

private:
    bool initBackend();

    static bool disableIpv6InNamespace(const std::string& netnsPath);

private:
    const std::shared_ptr<const IPodNetSettings> mSettings;

    std::shared_ptr<INetlink> mNetlink;
    std::shared_ptr<VlanTopology> mTopology;
    std::shared_ptr<IBackendDelegate> mDelegate;
    std::shared_ptr<PortMappingStore> mStore;
    std::shared_ptr<IPortMapper> mPortMapper;
    std::shared_ptr<RequestDispatcher> mDispatcher;

    std::unique_ptr<CniHttpServer> mServer;
    std::unique_ptr<PersistedRuleSync> mRuleSync;

private:
    static volatile sig_atomic_t mSigTerm;
    static void sigTermHandler(int sigNum);

private:
    static void logPrinter(int level, const char *file, const char *func,
                           int line, const char *message);
    static void logConsolePrinter(int level, const char *file, const char *func,
                                  int line, const char *message);

    static std::atomic<unsigned> mLogTargets;
};


#endif // !defined(PODNETDAEMON_H)
