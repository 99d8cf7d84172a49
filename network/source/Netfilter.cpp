/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2019 Sky UK
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
 * File:   Netfilter.cpp
 *
 */
#include "Netfilter.h"
#include "StdStreamPipe.h"

#include <Logging.h>
#include <ProcessUtilities.h>

#include <regex>
#include <sstream>
#include <cerrno>
#include <unistd.h>


#define IPTABLES_PATH               "iptables"
#define IPTABLES_SAVE_PATH          "iptables-save"
#define IPTABLES_RESTORE_PATH       "iptables-restore"


namespace
{

// -----------------------------------------------------------------------------
/**
 *  @brief Writes the string into the supplied file descriptor.
 *
 *  @return true if the entire string was written, otherwise false.
 */
bool writeString(int fd, const std::string &str)
{
    const char *s = str.data();
    size_t n = str.size();

    while (n > 0)
    {
        ssize_t written = TEMP_FAILURE_RETRY(write(fd, s, n));
        if (written < 0)
        {
            PN_LOG_SYS_ERROR(errno, "failed to write to file");
            return false;
        }
        else if (written == 0)
        {
            break;
        }

        s += written;
        n -= written;
    }

    return (n == 0);
}

const char *tableName(Netfilter::TableType table)
{
    switch (table)
    {
        case Netfilter::TableType::Raw:        return "raw";
        case Netfilter::TableType::Nat:        return "nat";
        case Netfilter::TableType::Mangle:     return "mangle";
        case Netfilter::TableType::Filter:     return "filter";
        case Netfilter::TableType::Security:   return "security";
        case Netfilter::TableType::Invalid:    break;
    }

    return nullptr;
}

} // namespace

// -----------------------------------------------------------------------------
/**
 *  @brief Parses the output of iptables-save.
 *
 *  The first character on a line indicates what follows, a '*' represents
 *  a table name, a ':' is the chain name and default policy with packet
 *  counts, and a '-' represents a rule.  Rules are stored with the leading
 *  "-A " stripped, chains by their name only.
 *
 *  @param[in]  saved       The iptables-save output.
 *  @param[out] rules       The rules per table.
 *  @param[out] chains      The chain names per table, may be null.
 *
 *  @return false if the output couldn't be parsed.
 */
bool Netfilter::parseRules(const std::string &saved,
                           RuleSet *rules, RuleSet *chains)
{
    rules->clear();
    if (chains)
        chains->clear();

    std::istringstream rulesStream(saved);
    std::string ruleLine;

    TableType ruleTable = TableType::Invalid;
    while (std::getline(rulesStream, ruleLine))
    {
        if (ruleLine.empty() || (ruleLine[0] == '#'))
            continue;

        if (ruleLine[0] == '*')
        {
            if (ruleLine == "*raw")
                ruleTable = TableType::Raw;
            else if (ruleLine == "*nat")
                ruleTable = TableType::Nat;
            else if (ruleLine == "*mangle")
                ruleTable = TableType::Mangle;
            else if (ruleLine == "*filter")
                ruleTable = TableType::Filter;
            else if (ruleLine == "*security")
                ruleTable = TableType::Security;
            else
            {
                PN_LOG_ERROR("unknown rule line '%s'", ruleLine.c_str());
                return false;
            }

            // make sure every table seen has an entry, even an empty one
            (*rules)[ruleTable];
            if (chains)
                (*chains)[ruleTable];
        }
        else if (ruleLine[0] == ':')
        {
            if (ruleTable == TableType::Invalid)
            {
                PN_LOG_ERROR("found chain without a table");
                return false;
            }

            if (chains)
                (*chains)[ruleTable].emplace_back(chainName(ruleLine));
        }
        else if (ruleLine.compare(0, 3, "-A ") == 0)
        {
            if (ruleTable == TableType::Invalid)
            {
                PN_LOG_ERROR("found rule without a table");
                return false;
            }

            (*rules)[ruleTable].emplace_back(ruleLine.substr(3));
        }
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the chain name from a ":NAME POLICY [p:b]" line.
 */
std::string Netfilter::chainName(const std::string &chainRule)
{
    const size_t start = (!chainRule.empty() && chainRule[0] == ':') ? 1 : 0;
    const size_t end = chainRule.find(' ', start);

    if (end == std::string::npos)
        return chainRule.substr(start);
    else
        return chainRule.substr(start, end - start);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Runs iptables-save and returns its output.
 *
 *  The output is captured in a memfd rather than a pipe so that a large
 *  rule set can't block the child.
 */
bool Netfilter::saveRules(std::string *output) const
{
    PN_LOG_FN_ENTRY();

    int rulesMemFd = PodNetCommon::createMemFd("iptables-save-buf");
    if (rulesMemFd < 0)
    {
        PN_LOG_FN_EXIT();
        return false;
    }

    // the destructor logs anything the tool wrote to stderr
    StdStreamPipe stdErrPipe(IPTABLES_SAVE_PATH);

    bool success = PodNetCommon::forkExec(IPTABLES_SAVE_PATH, { }, { },
                                          -1, rulesMemFd, stdErrPipe.writeFd());
    if (success)
    {
        *output = PodNetCommon::readFdContents(rulesMemFd);
        PN_LOG_DEBUG("iptables-save wrote %zu bytes", output->size());
    }
    else
    {
        PN_LOG_ERROR("iptables-save failed");
    }

    if (close(rulesMemFd) != 0)
        PN_LOG_SYS_ERROR(errno, "failed to close memfd");

    PN_LOG_FN_EXIT();
    return success;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Feeds @a input into iptables-restore without flushing the
 *  existing rules.
 *
 *  iptables doesn't provide a stable C/C++ API for adding / removing rules,
 *  hence the fork/exec.
 */
bool Netfilter::restoreRules(const std::string &input)
{
    PN_LOG_FN_ENTRY();

    int rulesMemFd = PodNetCommon::createMemFd("iptables-restore-buf");
    if (rulesMemFd < 0)
    {
        PN_LOG_FN_EXIT();
        return false;
    }

    if (!writeString(rulesMemFd, input) ||
        (lseek(rulesMemFd, 0, SEEK_SET) < 0))
    {
        PN_LOG_SYS_ERROR(errno, "failed to fill memfd buffer");
        close(rulesMemFd);
        PN_LOG_FN_EXIT();
        return false;
    }

    std::list<std::string> args;
    args.emplace_back("--noflush");

    // wait for the xtables lock rather than failing when another tool holds
    // it, needs 1.6.2 or newer
    if (mIptablesVersion.major < 0)
        mIptablesVersion = getIptablesVersion();

    if ((mIptablesVersion.major > 1) ||
        ((mIptablesVersion.major == 1) && (mIptablesVersion.minor > 6)) ||
        ((mIptablesVersion.major == 1) && (mIptablesVersion.minor == 6) &&
         (mIptablesVersion.patch >= 2)))
    {
        args.emplace_back("-w");
        args.emplace_back("2");
        args.emplace_back("-W");
        args.emplace_back("100000");
    }
    else
    {
        PN_LOG_DEBUG("iptables-restore too old to support waiting");
    }

    StdStreamPipe stdErrPipe(IPTABLES_RESTORE_PATH);

    bool success = PodNetCommon::forkExec(IPTABLES_RESTORE_PATH, args, { },
                                          rulesMemFd, -1, stdErrPipe.writeFd());
    if (!success)
    {
        PN_LOG_ERROR("iptables-restore failed");
    }

    if (close(rulesMemFd) != 0)
        PN_LOG_SYS_ERROR(errno, "failed to close memfd");

    PN_LOG_FN_EXIT();
    return success;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the current rules per table, with the "-A " prefix
 *  stripped.
 *
 *  An empty map is returned on failure.
 */
Netfilter::RuleSet Netfilter::rules() const
{
    std::string saved;
    RuleSet ruleSet;

    if (!saveRules(&saved) || !parseRules(saved, &ruleSet, nullptr))
        return RuleSet();

    return ruleSet;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Searches the list of rules for a match.
 *
 *  Leading and trailing whitespace is ignored.
 */
bool Netfilter::ruleInList(const std::string &rule,
                           const std::list<std::string> &rulesList)
{
    static const char *whitespace = " \t\r\n";

    const size_t first = rule.find_first_not_of(whitespace);
    if (first == std::string::npos)
        return false;

    const size_t last = rule.find_last_not_of(whitespace);
    const std::string trimmed = rule.substr(first, (last - first) + 1);

    for (const std::string &existing : rulesList)
    {
        if (existing == trimmed)
            return true;
    }

    return false;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Removes the rules from @a newRuleSet that wouldn't change anything.
 *
 *  Rules with the 'Delete' operation are removed if they aren't installed,
 *  any other rules are removed if they already are.  New chains are
 *  removed if a chain with the same name exists, otherwise restoring the
 *  chain declaration would flush it.
 */
void Netfilter::trimDuplicates(const RuleSet &existing,
                               const RuleSet &existingChains,
                               RuleSet &newRuleSet,
                               Operation operation) const
{
    static const std::list<std::string> empty;

    for (auto &newRules : newRuleSet)
    {
        const TableType table = newRules.first;
        std::list<std::string> &tableRules = newRules.second;

        const RuleSet &lookup = (operation == Operation::Unchanged) ? existingChains
                                                                    : existing;
        auto existingIt = lookup.find(table);
        const std::list<std::string> &existingRules =
            (existingIt == lookup.end()) ? empty : existingIt->second;

        auto it = tableRules.begin();
        while (it != tableRules.end())
        {
            bool present;
            if (operation == Operation::Unchanged)
                present = ruleInList(chainName(*it), existingRules);
            else
                present = ruleInList(*it, existingRules);

            if ((operation == Operation::Delete) && !present)
            {
                PN_LOG_DEBUG("failed to find rule '%s' to delete", it->c_str());
                it = tableRules.erase(it);
            }
            else if ((operation != Operation::Delete) && present)
            {
                PN_LOG_DEBUG("skipping duplicate rule '%s'", it->c_str());
                it = tableRules.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }
}

// -----------------------------------------------------------------------------
/**
 *  @brief Writes all the queued rules with a single iptables-restore call.
 *
 *  The queue is emptied whether or not the write succeeded.
 *
 *  @return true on success, false on failure.
 */
bool Netfilter::applyRules()
{
    PN_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    RuleSets ruleCache;
    std::swap(ruleCache, mRuleCache);

    // remove the rules that are already installed (or already gone), if
    // that leaves nothing there is no need to run iptables-restore at all
    std::string saved;
    if (!saveRules(&saved))
    {
        PN_LOG_ERROR_EXIT("failed to get existing iptables rules");
        return false;
    }

    RuleSet existing;
    RuleSet existingChains;
    if (!parseRules(saved, &existing, &existingChains))
    {
        PN_LOG_ERROR_EXIT("failed to parse existing iptables rules");
        return false;
    }

    trimDuplicates(existing, existingChains, ruleCache.appendRuleSet, Operation::Append);
    trimDuplicates(existing, existingChains, ruleCache.insertRuleSet, Operation::Insert);
    trimDuplicates(existing, existingChains, ruleCache.deleteRuleSet, Operation::Delete);
    trimDuplicates(existing, existingChains, ruleCache.unchangedRuleSet, Operation::Unchanged);

    std::ostringstream rulesStream;

    const TableType tableTypes[] = { TableType::Raw,     TableType::Nat,
                                     TableType::Mangle,  TableType::Filter,
                                     TableType::Security };

    for (TableType tableType : tableTypes)
    {
        // new chains have to go first
        const std::pair<Operation, const RuleSet*> groups[] =
        {
            { Operation::Unchanged, &ruleCache.unchangedRuleSet },
            { Operation::Append,    &ruleCache.appendRuleSet    },
            { Operation::Insert,    &ruleCache.insertRuleSet    },
            { Operation::Delete,    &ruleCache.deleteRuleSet    },
        };

        std::ostringstream tableStream;
        bool haveRules = false;

        for (const auto &group : groups)
        {
            auto tableIt = group.second->find(tableType);
            if (tableIt == group.second->end())
                continue;

            const char *operationStr = "";
            switch (group.first)
            {
                case Operation::Append:     operationStr = "-A ";   break;
                case Operation::Insert:     operationStr = "-I ";   break;
                case Operation::Delete:     operationStr = "-D ";   break;
                case Operation::Unchanged:  operationStr = "";      break;
            }

            for (const std::string &rule : tableIt->second)
            {
                tableStream << operationStr << rule << '\n';
                haveRules = true;
            }
        }

        if (!haveRules)
            continue;

        rulesStream << '*' << tableName(tableType) << '\n'
                    << tableStream.str()
                    << "COMMIT\n";
    }

    const std::string input = rulesStream.str();
    if (input.empty())
    {
        PN_LOG_INFO("all iptables rules are already in place - no new rules to write");
        PN_LOG_FN_EXIT();
        return true;
    }

    const bool success = restoreRules(input);

    PN_LOG_FN_EXIT();
    return success;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Drops any rules queued but not yet applied.
 */
void Netfilter::clearRules()
{
    std::lock_guard<std::mutex> locker(mLock);
    mRuleCache = RuleSets();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Queues the rules in @a ruleSet for the next applyRules() call.
 *
 *  The rules are moved out of @a ruleSet.
 *
 *  @param[in]  ruleSet         rules to add.
 *  @param[in]  operation       Append, Insert or Delete.
 *
 *  @return returns true on success, otherwise false.
 */
bool Netfilter::addRules(RuleSet &ruleSet, Operation operation)
{
    std::lock_guard<std::mutex> locker(mLock);

    RuleSet *cacheRuleSet = nullptr;
    switch (operation)
    {
        case Operation::Append:
            cacheRuleSet = &mRuleCache.appendRuleSet;
            break;
        case Operation::Insert:
            cacheRuleSet = &mRuleCache.insertRuleSet;
            break;
        case Operation::Delete:
            cacheRuleSet = &mRuleCache.deleteRuleSet;
            break;
        case Operation::Unchanged:
            PN_LOG_ERROR("operation type 'Unchanged' not allowed, use Append, "
                         "Insert or Delete");
            return false;
    }

    for (auto &it : ruleSet)
    {
        if (tableName(it.first) == nullptr)
        {
            PN_LOG_ERROR("invalid table type %d", int(it.first));
            return false;
        }

        std::list<std::string> &cached = (*cacheRuleSet)[it.first];
        cached.splice(cached.end(), it.second);
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Queues the creation of a new chain.
 *
 *  This is equivalent to:
 *     iptables -t <table> -N <name>
 *
 *  The chain is left untouched if it already exists.
 */
bool Netfilter::createNewChain(TableType table, const std::string &name)
{
    if (tableName(table) == nullptr)
    {
        PN_LOG_ERROR("invalid table type %d", int(table));
        return false;
    }

    std::lock_guard<std::mutex> locker(mLock);

    std::list<std::string> &chains = mRuleCache.unchangedRuleSet[table];
    const std::string chainRule = ":" + name + " - [0:0]";

    if (!ruleInList(chainRule, chains))
        chains.emplace_back(chainRule);

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Gets the version of iptables that's installed.
 *
 *  Returns 0.0.0 if the version couldn't be determined.
 */
Netfilter::IptablesVersion Netfilter::getIptablesVersion() const
{
    IptablesVersion version{ 0, 0, 0 };

    StdStreamPipe stdOutPipe(IPTABLES_PATH, false);
    StdStreamPipe stdErrPipe(IPTABLES_PATH);

    if (!PodNetCommon::forkExec(IPTABLES_PATH, { "--version" }, { },
                                -1, stdOutPipe.writeFd(), stdErrPipe.writeFd()))
    {
        PN_LOG_ERROR("failed to get iptables version");
        return version;
    }

    const std::string output = stdOutPipe.getPipeContents();

    static const std::regex versionMatch(R"(v([0-9]+)\.([0-9]+)\.([0-9]+))",
                                         std::regex::ECMAScript | std::regex::icase);

    std::smatch matches;
    if (!std::regex_search(output, matches, versionMatch) || (matches.size() != 4))
    {
        PN_LOG_ERROR("failed to parse iptables version from '%s'", output.c_str());
        return version;
    }

    version.major = std::stoi(matches.str(1));
    version.minor = std::stoi(matches.str(2));
    version.patch = std::stoi(matches.str(3));

    PN_LOG_DEBUG("running iptables version %d.%d.%d",
                 version.major, version.minor, version.patch);

    return version;
}
