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
 * File:   PersistedRuleSync.cpp
 *
 */
#include "PersistedRuleSync.h"
#include "StdStreamPipe.h"

#include <Logging.h>
#include <FileUtilities.h>
#include <ProcessUtilities.h>

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>


#define EBTABLES_RESTORE_PATH       "ebtables-restore"


PersistedRuleSync::PersistedRuleSync(const std::string &ebtablesFile,
                                     const std::chrono::seconds &ebtablesInterval,
                                     const std::shared_ptr<IPortMapper> &portMapper,
                                     const std::chrono::seconds &iptablesInterval)
    : mEbtablesFile(ebtablesFile)
    , mEbtablesInterval(ebtablesInterval)
    , mPortMapper(portMapper)
    , mIptablesInterval(iptablesInterval)
{
}

PersistedRuleSync::~PersistedRuleSync()
{
    stop();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Syncs both rule sets once and then starts the periodic tasks.
 */
void PersistedRuleSync::start()
{
    PN_LOG_FN_ENTRY();

    stop();

    syncEbtables();
    syncIptables();

    mEbtablesTask.reset(new PodNetCommon::PeriodicTask("PN_EBT_SYNC", mEbtablesInterval,
                                                       [this]() { syncEbtables(); }));

    mIptablesTask.reset(new PodNetCommon::PeriodicTask("PN_IPT_SYNC", mIptablesInterval,
                                                       [this]() { syncIptables(); }));

    PN_LOG_MILESTONE("rule sync started (ebtables every %llds, iptables every %llds)",
                     static_cast<long long>(mEbtablesInterval.count()),
                     static_cast<long long>(mIptablesInterval.count()));

    PN_LOG_FN_EXIT();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Stops the periodic tasks, blocking until any running sync completes.
 */
void PersistedRuleSync::stop()
{
    mEbtablesTask.reset();
    mIptablesTask.reset();
}

void PersistedRuleSync::syncEbtables() const
{
    if (!applyPersistedRules())
        PN_LOG_ERROR("failed to apply persisted ebtables rules");
}

void PersistedRuleSync::syncIptables() const
{
    if (mPortMapper && !mPortMapper->ensureBasicRules())
        PN_LOG_ERROR("failed to ensure the basic iptables rules");
}

// -----------------------------------------------------------------------------
/**
 *  @brief Feeds the ebtables rule file through ebtables-restore.
 *
 *  Hosts without the rule file, or without ebtables installed, have nothing
 *  to restore so that is not a failure.
 *
 *  @return false if the rules couldn't be applied.
 */
bool PersistedRuleSync::applyPersistedRules() const
{
    if (mEbtablesFile.empty() || !PodNetCommon::exists(mEbtablesFile))
    {
        PN_LOG_DEBUG("no ebtables rule file '%s', skipping", mEbtablesFile.c_str());
        return true;
    }

    int rulesFd = open(mEbtablesFile.c_str(), O_RDONLY | O_CLOEXEC);
    if (rulesFd < 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to open '%s'", mEbtablesFile.c_str());
        return false;
    }

    int exitCode = -1;
    bool success;
    {
        StdStreamPipe stdErrPipe(EBTABLES_RESTORE_PATH);

        success = PodNetCommon::forkExec(EBTABLES_RESTORE_PATH, { }, { },
                                         rulesFd, -1, stdErrPipe.writeFd(),
                                         &exitCode);
    }

    if (close(rulesFd) != 0)
        PN_LOG_SYS_ERROR(errno, "failed to close '%s'", mEbtablesFile.c_str());

    if (!success && (exitCode == 127))
    {
        PN_LOG_WARN(EBTABLES_RESTORE_PATH " not available, skipping");
        return true;
    }
    else if (!success)
    {
        PN_LOG_ERROR(EBTABLES_RESTORE_PATH " failed with exit code %d", exitCode);
        return false;
    }

    PN_LOG_DEBUG("applied ebtables rules from '%s'", mEbtablesFile.c_str());
    return true;
}
