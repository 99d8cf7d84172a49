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
 * File:   CniHttpServer.h
 *
 */
#ifndef CNIHTTPSERVER_H
#define CNIHTTPSERVER_H

#include "RequestDispatcher.h"

#include <memory>
#include <mutex>
#include <string>

struct MHD_Daemon;


// -----------------------------------------------------------------------------
/**
 *  @class CniHttpServer
 *  @brief HTTP server on a unix socket that the CNI shim posts requests to.
 *
 *  Only the /cni path is served, GET and POST are treated the same.  Each
 *  connection is handled on its own thread.
 */
class CniHttpServer
{
public:
    CniHttpServer(const std::string &socketPath,
                  const std::shared_ptr<RequestDispatcher> &dispatcher);
    ~CniHttpServer();

    CniHttpServer(const CniHttpServer&) = delete;
    CniHttpServer& operator=(const CniHttpServer&) = delete;

public:
    bool start();
    void stop();

    bool isRunning() const;

public:
    // -------------------------------------------------------------------------
    /**
     *  @brief Processes a complete HTTP request.
     *
     *  @return the HTTP status code to reply with, @a contentType and
     *  @a body are set to the response.
     */
    unsigned processRequest(const std::string &method,
                            const std::string &url,
                            const std::string &requestBody,
                            std::string *contentType,
                            std::string *body) const;

private:
    int createListenSocket() const;

    struct DaemonDeleter
    {
        void operator()(MHD_Daemon *daemon) const;
    };

private:
    const std::string mSocketPath;
    const std::shared_ptr<RequestDispatcher> mDispatcher;

    mutable std::mutex mLock;
    std::unique_ptr<MHD_Daemon, DaemonDeleter> mDaemon;
};

#endif // !defined(CNIHTTPSERVER_H)
