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
 * File:   PeriodicTask.cpp
 *
 */
#include "PeriodicTask.h"

#include <Logging.h>

#include <pthread.h>


using namespace PodNetCommon;


PeriodicTask::PeriodicTask(const std::string &name,
                           const std::chrono::milliseconds &interval,
                           const std::function<void()> &action)
    : mName(name)
    , mInterval(interval)
    , mAction(action)
    , mStopped(false)
{
    mThread = std::thread(&PeriodicTask::run, this);
}

PeriodicTask::~PeriodicTask()
{
    stop();

    if (mThread.joinable())
    {
        if (mThread.get_id() == std::this_thread::get_id())
            mThread.detach();
        else
            mThread.join();
    }
}

void PeriodicTask::stop()
{
    {
        std::lock_guard<std::mutex> locker(mLock);
        mStopped = true;
    }

    mCond.notify_all();

    if (mThread.joinable() && (mThread.get_id() != std::this_thread::get_id()))
        mThread.join();
}

std::chrono::milliseconds PeriodicTask::interval() const
{
    return mInterval;
}

void PeriodicTask::run()
{
    // thread names are limited to 15 characters
    pthread_setname_np(pthread_self(), mName.substr(0, 15).c_str());

    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + mInterval;

    std::unique_lock<std::mutex> locker(mLock);

    while (!mCond.wait_until(locker, deadline, [this]() { return mStopped; }))
    {
        locker.unlock();
        mAction();
        locker.lock();

        const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
        do
        {
            deadline += mInterval;
        } while (deadline <= now);
    }

    PN_LOG_DEBUG("periodic task '%s' stopped", mName.c_str());
}
