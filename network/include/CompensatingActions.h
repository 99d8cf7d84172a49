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
 * File:   CompensatingActions.h
 *
 */
#ifndef COMPENSATINGACTIONS_H
#define COMPENSATINGACTIONS_H

#include <string>
#include <vector>
#include <functional>


// -----------------------------------------------------------------------------
/**
 *  @class CompensatingActions
 *  @brief Stack of undo operations for a multi-step kernel change.
 *
 *  As each forward step succeeds the caller pushes the action that reverses
 *  it.  If a later step fails, rollback() runs the actions in reverse order;
 *  the failure of an undo action is logged and the remaining actions still
 *  run.  Once all steps have succeeded call commit() to discard the stack.
 *
 *  If the object is destroyed without commit() or rollback() being called
 *  the actions are rolled back.
 */
class CompensatingActions
{
public:
    typedef std::function<bool()> Action;

public:
    CompensatingActions() = default;
    ~CompensatingActions();

    CompensatingActions(const CompensatingActions&) = delete;
    CompensatingActions& operator=(const CompensatingActions&) = delete;

public:
    void push(const std::string &description, const Action &action);

    void commit();
    void rollback();

    size_t size() const;

private:
    struct Entry
    {
        std::string description;
        Action action;
    };

    std::vector<Entry> mActions;
};

#endif // !defined(COMPENSATINGACTIONS_H)
