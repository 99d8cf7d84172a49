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
 * File:   ProcessUtilities.cpp
 *
 */
#ifndef _GNU_SOURCE
#  define _GNU_SOURCE
#endif

#include "ProcessUtilities.h"

#include <Logging.h>

#include <vector>
#include <thread>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <libgen.h>

#include <fcntl.h>
#include <sched.h>
#include <unistd.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sys/mman.h>


// glibc prior to version 2.27 didn't have a syscall wrapper for memfd_create(...)
#if defined(__GLIBC__) && ((__GLIBC__ < 2) || ((__GLIBC__ >= 2) && (__GLIBC_MINOR__ < 27)))
#include <syscall.h>
static inline int memfd_create(const char *name, unsigned int flags)
{
    return syscall(SYS_memfd_create, name, flags);
}
#endif

#if !defined(MFD_CLOEXEC)
#  define MFD_CLOEXEC         0x0001U
#endif


bool PodNetCommon::forkExec(const std::string &execFile,
                            const std::list<std::string> &args,
                            const std::list<std::string> &envs,
                            int stdinFd, int stdoutFd, int stderrFd,
                            int *exitCode /*= nullptr*/)
{
    PN_LOG_FN_ENTRY();

    if (exitCode)
        *exitCode = -1;

    // the first arg is always the exe name, the last is always nullptr
    char *execFileCopy = strdup(execFile.c_str());
    char *execFileName = strdup(basename(execFileCopy));
    free(execFileCopy);

    std::vector<char*> execArgs;
    execArgs.reserve(args.size() + 2);
    execArgs.push_back(execFileName);

    for (const std::string &arg : args)
        execArgs.push_back(strdup(arg.c_str()));

    execArgs.push_back(nullptr);

    std::vector<char*> execEnvs;
    execEnvs.reserve(envs.size() + 1);

    for (const std::string &env : envs)
        execEnvs.push_back(strdup(env.c_str()));

    execEnvs.push_back(nullptr);


    pid_t pid = vfork();
    if (pid == 0)
    {
        // within forked child, nothing here may allocate or log

        int devNull = open("/dev/null", O_RDWR);
        if (devNull < 0)
            _exit(EXIT_FAILURE);

        if (stdinFd < 0)
            stdinFd = devNull;
        if (stdoutFd < 0)
            stdoutFd = devNull;
        if (stderrFd < 0)
            stderrFd = devNull;

        // dup2 clears O_CLOEXEC on the new descriptors
        if (dup2(stdinFd, STDIN_FILENO) != STDIN_FILENO)
            _exit(EXIT_FAILURE);

        if (dup2(stdoutFd, STDOUT_FILENO) != STDOUT_FILENO)
            _exit(EXIT_FAILURE);

        if (dup2(stderrFd, STDERR_FILENO) != STDERR_FILENO)
            _exit(EXIT_FAILURE);

        if (devNull > STDERR_FILENO)
            close(devNull);

        umask(0);

        // the daemon blocks signals on its main thread, don't pass that on
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGCHLD);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGINT);
        if (sigprocmask(SIG_UNBLOCK, &set, nullptr) != 0)
            _exit(EXIT_FAILURE);

        if ((chdir("/")) < 0)
            _exit(EXIT_FAILURE);

        execvpe(execFile.c_str(), execArgs.data(), execEnvs.data());

        // stderr may be /dev/null, so don't bother reporting
        _exit(127);
    }

    for (char *arg : execArgs)
        free(arg);
    for (char *env : execEnvs)
        free(env);

    if (pid < 0)
    {
        PN_LOG_SYS_ERROR_EXIT(errno, "vfork failed");
        return false;
    }

    int status;
    if (TEMP_FAILURE_RETRY(waitpid(pid, &status, 0)) < 0)
    {
        PN_LOG_SYS_ERROR_EXIT(errno, "waitpid failed");
        return false;
    }
    else if (!WIFEXITED(status))
    {
        PN_LOG_ERROR_EXIT("%s didn't exit? (status: 0x%04x)", execFile.c_str(),
                          status);
        return false;
    }

    if (exitCode)
        *exitCode = WEXITSTATUS(status);

    if (WEXITSTATUS(status) != EXIT_SUCCESS)
    {
        PN_LOG_ERROR_EXIT("%s failed with exit code %d", execFile.c_str(),
                          WEXITSTATUS(status));
        return false;
    }

    PN_LOG_FN_EXIT();
    return true;
}

int PodNetCommon::createMemFd(const char *name)
{
    int fd = memfd_create(name, MFD_CLOEXEC);
    if (fd < 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to create memfd '%s'", name);
    }

    return fd;
}

std::string PodNetCommon::readFdContents(int fd)
{
    std::string contents;

    if (lseek(fd, 0, SEEK_SET) != 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to seek to the beginning of fd %d", fd);
        return contents;
    }

    char buf[1024];
    ssize_t ret;
    while ((ret = TEMP_FAILURE_RETRY(read(fd, buf, sizeof(buf)))) > 0)
    {
        contents.append(buf, ret);
    }

    if (ret < 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to read from fd %d", fd);
    }

    return contents;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Thread body for callInNetworkNamespace, switches into the
 *  namespace and runs the function.
 */
static void netnsThread(int newNsFd, bool *success,
                        const std::function<bool()> &func)
{
    PN_LOG_FN_ENTRY();

    if (setns(newNsFd, CLONE_NEWNET) != 0)
    {
        PN_LOG_SYS_ERROR_EXIT(errno, "failed to switch into new namespace");
        *success = false;
        return;
    }

    *success = func();

    PN_LOG_FN_EXIT();
}

bool PodNetCommon::callInNetworkNamespace(const std::string &netnsPath,
                                          const std::function<bool()> &func)
{
    PN_LOG_FN_ENTRY();

    int newNsFd = open(netnsPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (newNsFd < 0)
    {
        PN_LOG_SYS_ERROR_EXIT(errno, "failed to open network namespace @ '%s'",
                              netnsPath.c_str());
        return false;
    }

    PN_LOG_INFO("about to change namespace to '%s'", netnsPath.c_str());

    bool success = false;

    // setns only affects the calling thread, the thread dies with the
    // namespace rather than us having to switch back
    std::thread nsThread(netnsThread, newNsFd, &success, std::cref(func));
    nsThread.join();

    if (close(newNsFd) != 0)
    {
        PN_LOG_SYS_ERROR(errno, "failed to close namespace");
    }

    PN_LOG_FN_EXIT();
    return success;
}
