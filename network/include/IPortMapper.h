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
 * File:   IPortMapper.h
 *
 */
#ifndef IPORTMAPPER_H
#define IPORTMAPPER_H

#include "PortMapping.h"

#include <string>


// -----------------------------------------------------------------------------
/**
 *  @class IPortMapper
 *  @brief Interface to the packet filter rules that forward host ports into
 *  pods.
 *
 *  Both install() and uninstall() are idempotent, rules already in place are
 *  not added twice and rules already gone are not an error.
 */
class IPortMapper
{
public:
    virtual ~IPortMapper() = default;

    virtual bool install(const std::string &containerId,
                         const PortMappings &mappings) = 0;

    virtual bool uninstall(const std::string &containerId,
                           const PortMappings &mappings) = 0;

    virtual bool ensureBasicRules() = 0;
};

#endif // !defined(IPORTMAPPER_H)
