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
 * File:   IBackendDelegate.h
 *
 */
#ifndef IBACKENDDELEGATE_H
#define IBACKENDDELEGATE_H

#include "PodRequest.h"
#include "AllocationResult.h"

#include <string>


// -----------------------------------------------------------------------------
/**
 *  @class IBackendDelegate
 *  @brief Interface to whatever does the actual wiring of a pod's network
 *  namespace.
 *
 *  On failure @a error is set to a message that is returned to the runtime.
 */
class IBackendDelegate
{
public:
    virtual ~IBackendDelegate() = default;

    virtual bool add(const PodRequest &request, AllocationResult *result,
                     std::string *error) = 0;

    virtual bool del(const PodRequest &request, std::string *error) = 0;
};

#endif // !defined(IBACKENDDELEGATE_H)
