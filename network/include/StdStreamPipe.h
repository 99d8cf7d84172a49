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
 * File:   StdStreamPipe.h
 *
 */
#ifndef STDSTREAMPIPE_H
#define STDSTREAMPIPE_H

#include <string>

// -----------------------------------------------------------------------------
/**
 *  @class StdStreamPipe
 *  @brief Non-blocking pipe handed to child processes as their stderr (or
 *  stdout) so the output of the tools we run ends up in our log.
 *
 */
class StdStreamPipe
{
public:
    explicit StdStreamPipe(const char *toolName, bool logPipeContents = true);
    ~StdStreamPipe();

    StdStreamPipe(const StdStreamPipe&) = delete;
    StdStreamPipe& operator=(const StdStreamPipe&) = delete;

public:
    int writeFd() const;

    std::string getPipeContents() const;

private:
    const std::string mToolName;
    int mReadFd;
    int mWriteFd;
    bool mLogPipe;
};

#endif // !STDSTREAMPIPE_H
