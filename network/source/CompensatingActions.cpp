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
 * File:   CompensatingActions.cpp
 *
 */
#include "CompensatingActions.h"

#include <Logging.h>

#include <exception>


CompensatingActions::~CompensatingActions()
{
    if (!mActions.empty())
    {
        rollback();
    }
}

void CompensatingActions::push(const std::string &description,
                               const Action &action)
{
    mActions.push_back({ description, action });
}

void CompensatingActions::commit()
{
    mActions.clear();
}

size_t CompensatingActions::size() const
{
    return mActions.size();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Runs all the pushed actions, most recent first, and empties the
 *  stack.
 */
void CompensatingActions::rollback()
{
    PN_LOG_FN_ENTRY();

    while (!mActions.empty())
    {
        Entry entry = std::move(mActions.back());
        mActions.pop_back();

        PN_LOG_INFO("rolling back: %s", entry.description.c_str());

        bool success = false;
        try
        {
            success = entry.action();
        }
        catch (const std::exception &e)
        {
            PN_LOG_EXCEPTION("exception during rollback of '%s' - %s",
                             entry.description.c_str(), e.what());
        }
        catch (...)
        {
            PN_LOG_EXCEPTION("unknown exception during rollback of '%s'",
                             entry.description.c_str());
        }

        if (!success)
        {
            PN_LOG_ERROR("failed to roll back '%s'", entry.description.c_str());
        }
    }

    PN_LOG_FN_EXIT();
}
