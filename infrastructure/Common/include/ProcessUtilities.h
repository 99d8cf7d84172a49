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
 * File:   ProcessUtilities.h
 *
 */

#ifndef PODNETCOMMON_PROCESSUTILITIES_H
#define PODNETCOMMON_PROCESSUTILITIES_H

#include <string>
#include <list>
#include <functional>


namespace PodNetCommon
{

/**
 * @brief Performs a fork/exec and waits for the child to terminate.
 *
 * Any of the std fds that are less than 0 are redirected to /dev/null. The
 * child gets only the environment variables in @a envs.
 *
 * @param[out] exitCode  If not null, set to the child's exit code, or -1 if
 *                       the child didn't exit normally.
 * @return true if the child ran and exited with EXIT_SUCCESS.
 */
bool forkExec(const std::string &execFile,
              const std::list<std::string> &args,
              const std::list<std::string> &envs,
              int stdinFd, int stdoutFd, int stderrFd,
              int *exitCode = nullptr);

/**
 * @brief Creates an anonymous in-memory file, used to capture the output
 * of child processes.
 *
 * @return the fd or -1 on failure.
 */
int createMemFd(const char *name);

/**
 * @brief Rewinds the fd and reads everything in it.
 */
std::string readFdContents(int fd);

/**
 * @brief Runs @a func with the calling thread switched into the network
 * namespace at @a netnsPath.
 *
 * The function is executed on a separate thread so the caller's namespace is
 * never changed, but the call blocks until it completes.
 *
 * @return false if the namespace couldn't be entered or @a func failed.
 */
bool callInNetworkNamespace(const std::string &netnsPath,
                            const std::function<bool()> &func);

} // namespace PodNetCommon

#endif // !defined(PODNETCOMMON_PROCESSUTILITIES_H)
