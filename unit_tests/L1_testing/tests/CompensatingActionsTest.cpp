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

#include "CompensatingActions.h"

#include <stdexcept>
#include <vector>


TEST(CompensatingActionsTest, rollbackSuccess_reverseOrder)
{
    std::vector<int> order;

    CompensatingActions actions;
    actions.push("first", [&order]() { order.push_back(1); return true; });
    actions.push("second", [&order]() { order.push_back(2); return true; });
    actions.push("third", [&order]() { order.push_back(3); return true; });
    EXPECT_EQ(actions.size(), 3u);

    actions.rollback();

    EXPECT_EQ(order, std::vector<int>({ 3, 2, 1 }));
    EXPECT_EQ(actions.size(), 0u);
}

/**
 * @brief Test a failing or throwing undo action doesn't stop the rest.
 */
TEST(CompensatingActionsTest, rollbackSuccess_continuesAfterFailure)
{
    std::vector<int> order;

    CompensatingActions actions;
    actions.push("first", [&order]() { order.push_back(1); return true; });
    actions.push("throws", []() -> bool { throw std::runtime_error("boom"); });
    actions.push("fails", [&order]() { order.push_back(3); return false; });

    actions.rollback();

    EXPECT_EQ(order, std::vector<int>({ 3, 1 }));
}

TEST(CompensatingActionsTest, rollbackSuccess_continuesAfterNonStdThrow)
{
    std::vector<int> order;

    {
        CompensatingActions actions;
        actions.push("first", [&order]() { order.push_back(1); return true; });
        actions.push("throws int", []() -> bool { throw 42; });
        actions.push("last", [&order]() { order.push_back(3); return true; });
    }

    EXPECT_EQ(order, std::vector<int>({ 3, 1 }));
}

TEST(CompensatingActionsTest, commitSuccess_nothingRolledBack)
{
    int calls = 0;

    {
        CompensatingActions actions;
        actions.push("undo", [&calls]() { calls++; return true; });
        actions.commit();
        EXPECT_EQ(actions.size(), 0u);
    }

    EXPECT_EQ(calls, 0);
}

TEST(CompensatingActionsTest, destructorSuccess_rollsBackPendingActions)
{
    int calls = 0;

    {
        CompensatingActions actions;
        actions.push("undo", [&calls]() { calls++; return true; });
    }

    EXPECT_EQ(calls, 1);
}

TEST(CompensatingActionsTest, rollbackSuccess_runsOnlyOnce)
{
    int calls = 0;

    {
        CompensatingActions actions;
        actions.push("undo", [&calls]() { calls++; return true; });
        actions.rollback();
        actions.rollback();
    }

    EXPECT_EQ(calls, 1);
}
