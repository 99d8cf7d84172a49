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

#include "CniHttpServer.h"
#include "BackendDelegateMock.h"
#include "PortMapperMock.h"
#include "NetworkDevice.h"
#include <FileUtilities.h>

#include <cstring>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>

using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgPointee;


static const char *kAddRequest =
    R"({ "env": { "CNI_COMMAND": "ADD", "CNI_CONTAINERID": "abc123",)"
    R"( "CNI_NETNS": "/proc/1234/ns/net", "CNI_ARGS": "IP=10.1.2.3/24" } })";

class CniHttpServerTest : public ::testing::Test
{
protected:
    std::shared_ptr<NiceMock<BackendDelegateMock>> delegate;
    std::shared_ptr<NiceMock<PortMapperMock>> portMapper;
    std::shared_ptr<RequestDispatcher> dispatcher;
    std::unique_ptr<CniHttpServer> server;
    std::string socketPath;

    virtual void SetUp()
    {
        char tmpl[] = "/tmp/podnet-http-XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        mScratch = tmpl;

        delegate = std::make_shared<NiceMock<BackendDelegateMock>>();
        portMapper = std::make_shared<NiceMock<PortMapperMock>>();
        dispatcher = std::make_shared<RequestDispatcher>(
            delegate, std::make_shared<PortMappingStore>(mScratch + "/ports"), portMapper);

        socketPath = mScratch + "/run/podnet.sock";
        server.reset(new CniHttpServer(socketPath, dispatcher));

        AllocationResult allocation;
        AllocationResult::Ipv4Config ip4;
        parseIpv4Cidr("10.1.2.3/24", &ip4.address, &ip4.prefixLen);
        allocation.ip4 = ip4;

        ON_CALL(*delegate, add(_, _, _))
            .WillByDefault(DoAll(SetArgPointee<1>(allocation), Return(true)));
        ON_CALL(*delegate, del(_, _))
            .WillByDefault(Return(true));
    }

    virtual void TearDown()
    {
        server.reset();
        dispatcher.reset();

        if (!mScratch.empty())
            nftw(mScratch.c_str(), &CniHttpServerTest::removeEntry, 16, FTW_DEPTH | FTW_PHYS);
    }

    // Sends a raw HTTP/1.1 request over the unix socket and returns the
    // whole response, the server closes the connection after replying.
    std::string sendRequest(const std::string &method, const std::string &path,
                            const std::string &body)
    {
        int sock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        EXPECT_GE(sock, 0);
        if (sock < 0)
            return std::string();

        struct sockaddr_un address;
        memset(&address, 0, sizeof(address));
        address.sun_family = AF_UNIX;
        strncpy(address.sun_path, socketPath.c_str(), sizeof(address.sun_path) - 1);

        if (connect(sock, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) != 0)
        {
            ADD_FAILURE() << "failed to connect to " << socketPath;
            close(sock);
            return std::string();
        }

        const std::string request =
            method + " " + path + " HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: " + std::to_string(body.size()) + "\r\n"
            "Connection: close\r\n"
            "\r\n" + body;

        EXPECT_EQ(write(sock, request.data(), request.size()),
                  static_cast<ssize_t>(request.size()));

        std::string response;
        char buf[1024];
        ssize_t n;
        while ((n = TEMP_FAILURE_RETRY(read(sock, buf, sizeof(buf)))) > 0)
            response.append(buf, n);

        close(sock);
        return response;
    }

private:
    static int removeEntry(const char *path, const struct stat *, int, struct FTW *)
    {
        return remove(path);
    }

    std::string mScratch;
};

TEST_F(CniHttpServerTest, processRequestSuccess_addReturnsResult)
{
    std::string contentType;
    std::string body;

    EXPECT_EQ(server->processRequest("POST", "/cni", kAddRequest, &contentType, &body), 200u);
    EXPECT_EQ(contentType, "application/json");
    EXPECT_EQ(body, R"({"cniVersion":"0.2.0","ip4":{"ip":"10.1.2.3/24"}})");

    EXPECT_EQ(server->processRequest("GET", "/cni", kAddRequest, &contentType, &body), 200u);
}

TEST_F(CniHttpServerTest, processRequestFailed_wrongPathOrMethod)
{
    std::string contentType;
    std::string body;

    EXPECT_EQ(server->processRequest("POST", "/", kAddRequest, &contentType, &body), 404u);
    EXPECT_EQ(contentType, "text/plain");

    EXPECT_EQ(server->processRequest("POST", "/cni/extra", kAddRequest, &contentType, &body), 404u);

    EXPECT_EQ(server->processRequest("PUT", "/cni", kAddRequest, &contentType, &body), 405u);
    EXPECT_EQ(server->processRequest("DELETE", "/cni", kAddRequest, &contentType, &body), 405u);
}

TEST_F(CniHttpServerTest, processRequestFailed_badRequestBody)
{
    std::string contentType;
    std::string body;

    EXPECT_EQ(server->processRequest("POST", "/cni", "{ not json", &contentType, &body), 400u);
    EXPECT_EQ(contentType, "text/plain");
    EXPECT_EQ(body.find("failed to parse request"), 0u);

    EXPECT_EQ(server->processRequest("POST", "/cni", R"({ "env": {} })", &contentType, &body), 400u);
    EXPECT_EQ(body, "missing CNI_COMMAND");
}

TEST_F(CniHttpServerTest, processRequestFailed_dispatcherError)
{
    EXPECT_CALL(*delegate, add(_, _, _))
        .WillOnce(DoAll(SetArgPointee<2>(std::string("failed to create veth pair 'pnabc123'")),
                        Return(false)));

    std::string contentType;
    std::string body;

    EXPECT_EQ(server->processRequest("POST", "/cni", kAddRequest, &contentType, &body), 400u);
    EXPECT_EQ(contentType, "text/plain");
    EXPECT_EQ(body, "failed to create veth pair 'pnabc123'");
}

/**
 * @brief Test requests are served over the unix socket and the socket is
 * removed again when the server stops.
 */
TEST_F(CniHttpServerTest, startSuccess_servesRequestsOnSocket)
{
    ASSERT_TRUE(server->start());
    EXPECT_TRUE(server->isRunning());

    struct stat buf;
    ASSERT_EQ(stat(socketPath.c_str(), &buf), 0);
    EXPECT_TRUE(S_ISSOCK(buf.st_mode));
    EXPECT_EQ(buf.st_mode & 0777, 0600u);

    std::string response = sendRequest("POST", "/cni", kAddRequest);
    EXPECT_EQ(response.find("HTTP/1.1 200"), 0u) << response;
    EXPECT_NE(response.find(R"({"cniVersion":"0.2.0","ip4":{"ip":"10.1.2.3/24"}})"),
              std::string::npos) << response;

    response = sendRequest("POST", "/other", kAddRequest);
    EXPECT_EQ(response.find("HTTP/1.1 404"), 0u) << response;

    server->stop();
    EXPECT_FALSE(server->isRunning());
    EXPECT_FALSE(PodNetCommon::exists(socketPath));
}

TEST_F(CniHttpServerTest, startSuccess_staleSocketReplaced)
{
    ASSERT_TRUE(PodNetCommon::mkdirRecursive(socketPath.substr(0, socketPath.rfind('/'))));
    ASSERT_TRUE(PodNetCommon::createTextFile(socketPath, "stale"));

    ASSERT_TRUE(server->start());

    std::string response = sendRequest("GET", "/cni", kAddRequest);
    EXPECT_EQ(response.find("HTTP/1.1 200"), 0u) << response;
}

TEST_F(CniHttpServerTest, startFailed_invalidSocketPath)
{
    CniHttpServer noPath("", dispatcher);
    EXPECT_FALSE(noPath.start());
    EXPECT_FALSE(noPath.isRunning());

    CniHttpServer longPath("/tmp/" + std::string(200, 'x'), dispatcher);
    EXPECT_FALSE(longPath.start());
}
