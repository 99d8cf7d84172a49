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
 * File:   Netfilter.h
 *
 */
#ifndef NETFILTER_H
#define NETFILTER_H

#include <map>
#include <list>
#include <string>
#include <mutex>


// -----------------------------------------------------------------------------
/**
 *  @class Netfilter
 *  @brief Class that can read / write IPv4 iptables rule sets
 *
 *  There is no stable programming API for iptables, so this class uses the
 *  iptables-save and iptables-restore cmdline tools for reading and writing
 *  the rules.
 *
 *  Rules are queued with addRules() / createNewChain() and then written in a
 *  single iptables-restore call by applyRules().  Rules that are already
 *  present are not added again and rules that are missing are not deleted,
 *  so the same rule set can be applied repeatedly.
 *
 */
class Netfilter
{
public:
    Netfilter() = default;
    virtual ~Netfilter() = default;

public:
    enum class TableType { Invalid, Raw, Nat, Mangle, Filter, Security };
    typedef std::map<TableType, std::list<std::string>> RuleSet;

    enum class Operation { Append, Insert, Delete, Unchanged };

    RuleSet rules() const;

    bool addRules(RuleSet &ruleSet, Operation operation);
    bool createNewChain(TableType table, const std::string &name);

    bool applyRules();
    void clearRules();

    static bool parseRules(const std::string &saved,
                           RuleSet *rules, RuleSet *chains);

protected:
    virtual bool saveRules(std::string *output) const;
    virtual bool restoreRules(const std::string &input);

private:
    struct RuleSets
    {
        RuleSet appendRuleSet;
        RuleSet insertRuleSet;
        RuleSet deleteRuleSet;
        RuleSet unchangedRuleSet;
    };

    struct IptablesVersion
    {
        int major;
        int minor;
        int patch;
    };

    static bool ruleInList(const std::string &rule,
                           const std::list<std::string> &rulesList);

    static std::string chainName(const std::string &chainRule);

    void trimDuplicates(const RuleSet &existing, const RuleSet &existingChains,
                        RuleSet &newRuleSet, Operation operation) const;

    IptablesVersion getIptablesVersion() const;

private:
    mutable std::mutex mLock;
    RuleSets mRuleCache;
    IptablesVersion mIptablesVersion{ -1, 0, 0 };
};

#endif // !defined(NETFILTER_H)
