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
#pragma once

#include <gmock/gmock.h>

#include "IBackendDelegate.h"

class BackendDelegateMock : public IBackendDelegate {
public:
    virtual ~BackendDelegateMock() = default;

    MOCK_METHOD(bool, add, (const PodRequest &request, AllocationResult *result, std::string *error), (override));
    MOCK_METHOD(bool, del, (const PodRequest &request, std::string *error), (override));
};
