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
 * File:   PersistedRuleSync.h
 *
 */
#ifndef PERSISTEDRULESYNC_H
#define PERSISTEDRULESYNC_H

#include "IPortMapper.h"

#include <PeriodicTask.h>

#include <chrono>
#include <memory>
#include <string>


// -----------------------------------------------------------------------------
/**
 *  @class PersistedRuleSync
 *  @brief Periodically puts back packet filter rules that something else on
 *  the host may have flushed.
 *
 *  Two independent periodic tasks are run, one re-applying the ebtables
 *  rule file and one recreating the host port chain.  Failures are logged
 *  and retried on the next tick.
 */
class PersistedRuleSync
{
public:
    PersistedRuleSync(const std::string &ebtablesFile,
                      const std::chrono::seconds &ebtablesInterval,
                      const std::shared_ptr<IPortMapper> &portMapper,
                      const std::chrono::seconds &iptablesInterval);
    ~PersistedRuleSync();

public:
    void start();
    void stop();

    bool applyPersistedRules() const;

private:
    void syncEbtables() const;
    void syncIptables() const;

private:
    const std::string mEbtablesFile;
    const std::chrono::seconds mEbtablesInterval;
    const std::shared_ptr<IPortMapper> mPortMapper;
    const std::chrono::seconds mIptablesInterval;

    std::unique_ptr<PodNetCommon::PeriodicTask> mEbtablesTask;
    std::unique_ptr<PodNetCommon::PeriodicTask> mIptablesTask;
};

#endif // !defined(PERSISTEDRULESYNC_H)
