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
 * File:   CniHttpServer.cpp
 *
 */
#include "CniHttpServer.h"

#include <Logging.h>
#include <FileUtilities.h>

#include <cerrno>
#include <cstring>
#include <libgen.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/socket.h>
#include <sys/un.h>

#include <microhttpd.h>


#if MHD_VERSION >= 0x00097002
// libmicrohttpd 0.9.71 changed the callback return type
#define MHD_RESULT enum MHD_Result
#else
#define MHD_RESULT int
#endif

#define CNI_URL_PATH            "/cni"
#define LISTEN_BACKLOG          64


namespace
{

// -----------------------------------------------------------------------------
/**
 *  @struct ConnectionState
 *  @brief The request as it's read in, stored in the connection's con_cls.
 */
struct ConnectionState
{
    std::string method;
    std::string url;
    std::string body;
};

struct ResponseDeleter
{
    void operator()(MHD_Response *response) const
    {
        MHD_destroy_response(response);
    }
};

// -----------------------------------------------------------------------------
/**
 *  @brief Called by libmicrohttpd for each chunk of a request.
 *
 *  The first call for a request only sets up @a con_cls, the body then
 *  arrives over any number of calls with a non-zero @a upload_data_size and
 *  a final call with zero means the request is complete.
 */
extern "C" MHD_RESULT accessHandler(void *cls,
                                    struct MHD_Connection *connection,
                                    const char *url,
                                    const char *method,
                                    const char * /*version*/,
                                    const char *upload_data,
                                    size_t *upload_data_size,
                                    void **con_cls)
{
    ConnectionState *state = static_cast<ConnectionState*>(*con_cls);
    if (state == nullptr)
    {
        state = new ConnectionState;
        state->method = method;
        state->url = url;
        *con_cls = state;
        return MHD_YES;
    }

    if (*upload_data_size != 0)
    {
        state->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    const CniHttpServer *server = static_cast<const CniHttpServer*>(cls);

    std::string contentType;
    std::string body;
    const unsigned status = server->processRequest(state->method, state->url,
                                                   state->body, &contentType,
                                                   &body);

    std::unique_ptr<MHD_Response, ResponseDeleter> response(
        MHD_create_response_from_buffer(body.size(),
                                        const_cast<char*>(body.data()),
                                        MHD_RESPMEM_MUST_COPY));
    if (!response)
    {
        PN_LOG_ERROR("failed to create http response");
        return MHD_NO;
    }

    if (MHD_add_response_header(response.get(), MHD_HTTP_HEADER_CONTENT_TYPE,
                                contentType.c_str()) != MHD_YES)
    {
        PN_LOG_WARN("failed to add content type header");
    }

    return MHD_queue_response(connection, status, response.get());
}

extern "C" void requestCompleted(void * /*cls*/,
                                 struct MHD_Connection * /*connection*/,
                                 void **con_cls,
                                 enum MHD_RequestTerminationCode /*toe*/)
{
    delete static_cast<ConnectionState*>(*con_cls);
    *con_cls = nullptr;
}

} // namespace


void CniHttpServer::DaemonDeleter::operator()(MHD_Daemon *daemon) const
{
    MHD_stop_daemon(daemon);
}

CniHttpServer::CniHttpServer(const std::string &socketPath,
                             const std::shared_ptr<RequestDispatcher> &dispatcher)
    : mSocketPath(socketPath)
    , mDispatcher(dispatcher)
{
}

CniHttpServer::~CniHttpServer()
{
    stop();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Creates the unix socket the server listens on.
 *
 *  Any file already at the socket path is removed, the socket is only
 *  accessible by the owner.
 *
 *  @return the listening socket, or -1 on failure.
 */
int CniHttpServer::createListenSocket() const
{
    struct sockaddr_un address;
    if (mSocketPath.empty() || (mSocketPath.size() >= sizeof(address.sun_path)))
    {
        PN_LOG_ERROR("invalid socket path '%s'", mSocketPath.c_str());
        return -1;
    }

    char *pathCopy = strdup(mSocketPath.c_str());
    const std::string socketDir = dirname(pathCopy);
    free(pathCopy);

    if (!PodNetCommon::mkdirRecursive(socketDir, 0755))
    {
        PN_LOG_ERROR("failed to create socket directory '%s'", socketDir.c_str());
        return -1;
    }

    if ((unlink(mSocketPath.c_str()) != 0) && (errno != ENOENT))
    {
        PN_LOG_SYS_ERROR(errno, "failed to remove stale socket '%s'",
                         mSocketPath.c_str());
        return -1;
    }

    int sock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock < 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to create socket");
        return -1;
    }

    memset(&address, 0, sizeof(address));
    address.sun_family = AF_UNIX;
    strncpy(address.sun_path, mSocketPath.c_str(), sizeof(address.sun_path) - 1);

    if (bind(sock, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) != 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to bind to '%s'", mSocketPath.c_str());
        close(sock);
        return -1;
    }

    if (chmod(mSocketPath.c_str(), S_IRUSR | S_IWUSR) != 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to set mode of '%s'", mSocketPath.c_str());
        close(sock);
        return -1;
    }

    if (listen(sock, LISTEN_BACKLOG) != 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to listen on '%s'", mSocketPath.c_str());
        close(sock);
        return -1;
    }

    return sock;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Starts serving requests on the socket.
 *
 *  @return true if the server is running.
 */
bool CniHttpServer::start()
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mDaemon)
    {
        PN_LOG_WARN("server already running");
        PN_LOG_FN_EXIT();
        return true;
    }

    int sock = createListenSocket();
    if (sock < 0)
    {
        PN_LOG_FN_EXIT();
        return false;
    }

    const struct MHD_OptionItem options[] = {
        { MHD_OPTION_LISTEN_SOCKET, sock, nullptr },
        { MHD_OPTION_NOTIFY_COMPLETED, reinterpret_cast<intptr_t>(&requestCompleted), nullptr },
        { MHD_OPTION_END, 0, nullptr }
    };

    mDaemon.reset(MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_SELECT_INTERNALLY,
                                   0, nullptr, nullptr,
                                   &accessHandler, this,
                                   MHD_OPTION_ARRAY, options,
                                   MHD_OPTION_END));
    if (!mDaemon)
    {
        PN_LOG_ERROR("failed to start http server on '%s'", mSocketPath.c_str());
        close(sock);
        PN_LOG_FN_EXIT();
        return false;
    }

    PN_LOG_MILESTONE("listening on '%s'", mSocketPath.c_str());

    PN_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Stops the server, blocks until in-flight requests are done.
 */
void CniHttpServer::stop()
{
    std::lock_guard<std::mutex> locker(mLock);

    if (!mDaemon)
        return;

    mDaemon.reset();

    if ((unlink(mSocketPath.c_str()) != 0) && (errno != ENOENT))
        PN_LOG_SYS_WARN(errno, "failed to remove socket '%s'", mSocketPath.c_str());
}

bool CniHttpServer::isRunning() const
{
    std::lock_guard<std::mutex> locker(mLock);
    return static_cast<bool>(mDaemon);
}

unsigned CniHttpServer::processRequest(const std::string &method,
                                       const std::string &url,
                                       const std::string &requestBody,
                                       std::string *contentType,
                                       std::string *body) const
{
    *contentType = "text/plain";

    if (url != CNI_URL_PATH)
    {
        *body = "not found";
        return MHD_HTTP_NOT_FOUND;
    }

    if ((method != MHD_HTTP_METHOD_GET) && (method != MHD_HTTP_METHOD_POST))
    {
        *body = "method not allowed";
        return MHD_HTTP_METHOD_NOT_ALLOWED;
    }

    std::string error;
    const boost::optional<PodRequest> request = PodRequest::fromString(requestBody, &error);
    if (!request)
    {
        PN_LOG_ERROR("invalid request - %s", error.c_str());
        *body = error;
        return MHD_HTTP_BAD_REQUEST;
    }

    std::string response;
    if (!mDispatcher->handle(request.get(), &response, &error))
    {
        *body = error;
        return MHD_HTTP_BAD_REQUEST;
    }

    *contentType = "application/json";
    *body = response;
    return MHD_HTTP_OK;
}
