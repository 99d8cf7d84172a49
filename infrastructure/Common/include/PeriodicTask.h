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
 * File:   PeriodicTask.h
 *
 */

#ifndef PODNETCOMMON_PERIODICTASK_H
#define PODNETCOMMON_PERIODICTASK_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>


namespace PodNetCommon
{

// -----------------------------------------------------------------------------
/**
 *  @class PeriodicTask
 *  @brief Runs an action on its own thread every @a interval until stopped.
 *
 *  The first run happens one interval after construction.  Ticks are
 *  scheduled from the start time, so a slow action doesn't shift later
 *  ticks, but missed ticks are skipped rather than run back to back.
 */
class PeriodicTask
{
public:
    PeriodicTask(const std::string &name,
                 const std::chrono::milliseconds &interval,
                 const std::function<void()> &action);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

public:
    /**
     *  @brief Stops the task, blocking until a running action returns.
     *
     *  Can be called from within the action itself, in which case it
     *  returns straight away and the thread exits after the action.
     */
    void stop();

    std::chrono::milliseconds interval() const;

private:
    void run();

private:
    const std::string mName;
    const std::chrono::milliseconds mInterval;
    const std::function<void()> mAction;

    std::mutex mLock;
    std::condition_variable mCond;
    bool mStopped;

    std::thread mThread;
};

} // namespace PodNetCommon

#endif // !defined(PODNETCOMMON_PERIODICTASK_H)
