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

#include "PortMappingStore.h"
#include <FileUtilities.h>

#include <memory>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>


class PortMappingStoreTest : public ::testing::Test
{
protected:
    std::string stateDir;
    std::unique_ptr<PortMappingStore> store;
    PortMappings mappings;

    virtual void SetUp()
    {
        char tmpl[] = "/tmp/podnet-ports-XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);

        mScratch = tmpl;
        stateDir = mScratch + "/state/ports";
        store.reset(new PortMappingStore(stateDir));

        PortMapping http;
        http.hostPort = 8080;
        http.podPort = 80;
        http.podIP = "10.1.2.3";

        PortMapping dns;
        dns.hostPort = 5353;
        dns.podPort = 53;
        dns.protocol = "udp";
        dns.podIP = "10.1.2.3";

        mappings = { http, dns };
    }

    virtual void TearDown()
    {
        store.reset();
        if (!mScratch.empty())
            nftw(mScratch.c_str(), &PortMappingStoreTest::removeEntry, 16, FTW_DEPTH | FTW_PHYS);
    }

private:
    static int removeEntry(const char *path, const struct stat *, int, struct FTW *)
    {
        return remove(path);
    }

    std::string mScratch;
};

/**
 * @brief Test saved mappings are returned once and then forgotten.
 */
TEST_F(PortMappingStoreTest, consumeSuccess_returnsSavedMappingsOnce)
{
    ASSERT_TRUE(store->save("abc123", mappings));
    EXPECT_TRUE(PodNetCommon::exists(stateDir + "/abc123"));

    boost::optional<PortMappings> stored;
    ASSERT_TRUE(store->consume("abc123", &stored));
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored.get(), mappings);
    EXPECT_FALSE(PodNetCommon::exists(stateDir + "/abc123"));

    ASSERT_TRUE(store->consume("abc123", &stored));
    EXPECT_FALSE(stored);
}

TEST_F(PortMappingStoreTest, consumeSuccess_nothingStored)
{
    boost::optional<PortMappings> stored = mappings;
    EXPECT_TRUE(store->consume("unknown", &stored));
    EXPECT_FALSE(stored);
}

TEST_F(PortMappingStoreTest, saveSuccess_replacesPreviousMappings)
{
    ASSERT_TRUE(store->save("abc123", mappings));
    ASSERT_TRUE(store->save("abc123", { mappings.front() }));

    boost::optional<PortMappings> stored;
    ASSERT_TRUE(store->consume("abc123", &stored));
    ASSERT_TRUE(stored);
    ASSERT_EQ(stored->size(), 1u);
    EXPECT_EQ(stored->front(), mappings.front());
}

TEST_F(PortMappingStoreTest, removeSuccess_discardsMappings)
{
    ASSERT_TRUE(store->save("abc123", mappings));
    EXPECT_TRUE(store->remove("abc123"));
    EXPECT_TRUE(store->remove("abc123"));

    boost::optional<PortMappings> stored;
    ASSERT_TRUE(store->consume("abc123", &stored));
    EXPECT_FALSE(stored);
}

/**
 * @brief Test ids that would escape the state directory are refused.
 */
TEST_F(PortMappingStoreTest, saveFailed_invalidContainerId)
{
    EXPECT_FALSE(store->save("", mappings));
    EXPECT_FALSE(store->save("..", mappings));
    EXPECT_FALSE(store->save("../escape", mappings));

    boost::optional<PortMappings> stored;
    EXPECT_FALSE(store->consume("a/b", &stored));
    EXPECT_FALSE(store->remove("."));
}

TEST_F(PortMappingStoreTest, consumeFailed_corruptFile)
{
    ASSERT_TRUE(PodNetCommon::mkdirRecursive(stateDir, 0700));
    ASSERT_TRUE(PodNetCommon::createTextFile(stateDir + "/abc123", "[{ \"hostPort\": "));

    boost::optional<PortMappings> stored;
    EXPECT_FALSE(store->consume("abc123", &stored));
    EXPECT_FALSE(stored);
}
