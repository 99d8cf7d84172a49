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
 * File:   Main.cpp
 *
 */
#include "Settings.h"

#include <PodNetDaemon.h>

#include <Logging.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <fcntl.h>
#include <getopt.h>
#include <errno.h>
#include <ctype.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <memory>


#if !defined(PODNET_VERSION)
#  define PODNET_VERSION "unknown"
#endif

//
static bool gDaemonise = true;

//
static bool gNoConsole = false;

//
#if (PN_BUILD_TYPE == PN_DEBUG)
static int gLogLevel = PN_DEBUG_LEVEL_INFO;
#else
static int gLogLevel = PN_DEBUG_LEVEL_MILESTONE;
#endif

//
static bool gUseSyslog = false;

//
static std::string gSettingsFilePath("/etc/podnet.json");



// -----------------------------------------------------------------------------
/**
 * @brief Simply prints the version string on stdout
 *
 */
static void displayVersion()
{
    printf("Version: " PODNET_VERSION "\n");
}

// -----------------------------------------------------------------------------
/**
 * @brief Simply prints the usage options to stdout
 *
 */
static void displayUsage()
{
    printf("Usage: PodNetDaemon <option(s)>\n");
    printf("  Daemon that connects pod network namespaces to the host vlans.\n");
    printf("\n");
    printf("  -h, --help                    Print this help and exit\n");
    printf("  -v, --verbose                 Increase the log level\n");
    printf("  -V, --version                 Display this program's version number\n");
    printf("\n");
    printf("  -f, --settings-file=PATH      Path to a JSON podnet settings file [%s]\n", gSettingsFilePath.c_str());
    printf("  -n, --nofork                  Do not fork and daemonise the process\n");
    printf("  -k, --noconsole               Disable console output\n");
    printf("  -g, --syslog                  Send all initial logging to syslog rather than the console\n");
    printf("\n");
}

// -----------------------------------------------------------------------------
/**
 * @brief Parses the command line args
 *
 */
static void parseArgs(int argc, char **argv)
{
    struct option longopts[] = {
        { "help",           no_argument,        nullptr,    (int)'h' },
        { "verbose",        no_argument,        nullptr,    (int)'v' },
        { "version",        no_argument,        nullptr,    (int)'V' },
        { "settings-file",  required_argument,  nullptr,    (int)'f' },
        { "nofork",         no_argument,        nullptr,    (int)'n' },
        { "noconsole",      no_argument,        nullptr,    (int)'k' },
        { "syslog",         no_argument,        nullptr,    (int)'g' },
        { nullptr,          0,                  nullptr,    0        }
   };

    opterr = 0;

    int c;
    int longindex;
    while ((c = getopt_long(argc, argv, "hvVf:nkg", longopts, &longindex)) != -1)
    {
        switch (c)
        {
            case 'h':
                displayUsage();
                exit(EXIT_SUCCESS);
                break;

            case 'v':
                gLogLevel++;
                break;

            case 'V':
                displayVersion();
                exit(EXIT_SUCCESS);
                break;

            case 'f':
                gSettingsFilePath = reinterpret_cast<const char*>(optarg);
                if (access(gSettingsFilePath.c_str(), R_OK) != 0)
                {
                    fprintf(stderr, "Error: cannot access settings file @ '%s'\n",
                            gSettingsFilePath.c_str());
                    exit(EXIT_FAILURE);
                }
                break;

            case 'n':
                gDaemonise = false;
                break;

            case 'k':
                gNoConsole = true;
                break;

            case 'g':
                gUseSyslog = true;
                break;

            case '?':
                if (optopt == 'f')
                    fprintf(stderr, "Warning: Option -%c requires an argument.\n", optopt);
                else if (isprint(optopt))
                    fprintf(stderr, "Warning: Unknown option `-%c'.\n", optopt);
                else
                    fprintf(stderr, "Warning: Unknown option character `\\x%x'.\n", optopt);
                exit(EXIT_FAILURE);
                break;

            default:
                exit(EXIT_FAILURE);
                break;
        }
    }

    for (int i = optind; i < argc; i++)
    {
        fprintf(stderr, "Warning: Non-option argument %s ignored\n", argv[i]);
    }
}

// -----------------------------------------------------------------------------
/**
 * @brief Returns the settings from the JSON settings file, or the defaults if
 * there is no file or it can't be parsed.
 *
 */
static std::shared_ptr<Settings> createSettings()
{
    std::shared_ptr<Settings> settings;

    if (!gSettingsFilePath.empty() && (access(gSettingsFilePath.c_str(), R_OK) == 0))
    {
        PN_LOG_INFO("parsing settings from file @ '%s'", gSettingsFilePath.c_str());
        settings = Settings::fromJsonFile(gSettingsFilePath);
    }

    if (!settings)
    {
        PN_LOG_WARN("missing, inaccessible or invalid settings file, using defaults");
        settings = Settings::defaultSettings();
    }

#if (PN_BUILD_TYPE == PN_DEBUG)
    settings->dump();
#endif

    return settings;
}

// -----------------------------------------------------------------------------
/**
 * @brief Redirects stdout/stderr and stdin to /dev/null
 *
 */
static void closeConsole()
{
    int fd = open("/dev/null", O_RDWR, 0);
    if (fd < 0)
    {
        fprintf(stderr, "failed to redirect stdin, stdout and stderr to /dev/null (%d - %s)\n",
                errno, strerror(errno));
    }
    else
    {
        if (dup2(fd, STDIN_FILENO) < 0)
            fprintf(stderr, "failed to redirect stdin (%d - %s)\n", errno, strerror(errno));
        if (dup2(fd, STDOUT_FILENO) < 0)
            fprintf(stderr, "failed to redirect stdout (%d - %s)\n", errno, strerror(errno));
        if (dup2(fd, STDERR_FILENO) < 0)
            fprintf(stderr, "failed to redirect stderr (%d - %s)\n", errno, strerror(errno));
        if (fd != STDIN_FILENO && fd != STDOUT_FILENO && fd != STDERR_FILENO)
            close(fd);
    }
}

// -----------------------------------------------------------------------------
/**
 * @brief Daemonise ourselves
 *
 */
static void daemonise()
{
    pid_t pid = fork();
    if (pid < 0)
    {
        fprintf(stderr, "Error: fork failed (%d - %s)\n", errno, strerror(errno));
        exit(EXIT_FAILURE);
    }

    if (pid > 0)
    {
        exit(EXIT_SUCCESS);
    }

    // the socket and state files are created owner-only regardless
    umask(0022);

    if (setsid() < 0)
    {
        fprintf(stderr, "setsid failed (%d - %s)\n", errno, strerror(errno));
        exit(EXIT_FAILURE);
    }

    if (chdir("/") < 0)
    {
        fprintf(stderr, "chdir(\"/\") failed (%d - %s)\n", errno, strerror(errno));
        exit(EXIT_FAILURE);
    }

    closeConsole();
}

// -----------------------------------------------------------------------------
/**
 * @brief Main entry point for the daemon
 *
 */
int main(int argc, char * argv[])
{
    int rc = EXIT_SUCCESS;

    parseArgs(argc, argv);

    unsigned logTargets = PodNetDaemon::Console;
    if (gUseSyslog)
    {
        logTargets |= PodNetDaemon::SysLog;
    }

    PodNetDaemon::setupLogging(logTargets);
    __pn_debug_log_level = gLogLevel;


    PN_LOG_MILESTONE("starting PodNet daemon");

    if (gDaemonise)
    {
        daemonise();

        logTargets = (logTargets & ~PodNetDaemon::Console) | PodNetDaemon::SysLog;
        PodNetDaemon::setupLogging(logTargets);
    }
    else if (gNoConsole)
    {
        closeConsole();

        logTargets = (logTargets & ~PodNetDaemon::Console) | PodNetDaemon::SysLog;
        PodNetDaemon::setupLogging(logTargets);
    }

    const std::shared_ptr<Settings> settings = createSettings();

    // Setup signals, this MUST be done in the main thread before any other
    // threads are spawned
    PodNetDaemon::configSignals();

    {
        PodNetDaemon daemon(settings);

        if (!daemon.init())
        {
            PN_LOG_ERROR("failed to initialise PodNet daemon");
            rc = EXIT_FAILURE;
        }
        else
        {
            PN_LOG_MILESTONE("started PodNet daemon");

            daemon.run();
        }
    }

    if (rc == EXIT_SUCCESS)
    {
        PN_LOG_MILESTONE("stopped PodNet daemon");
    }

    PodNetCommon::termLogging();
    return rc;
}
