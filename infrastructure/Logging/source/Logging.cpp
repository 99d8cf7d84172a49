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
//
//  Logging.cpp
//  PodNet infrastructure
//
#ifndef _GNU_SOURCE
#  define _GNU_SOURCE
#endif

#include "Logging.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <cstdarg>
#include <ctime>
#include <algorithm>
#include <unistd.h>
#include <sys/uio.h>


/* by default print all fatals, errors, warnings & milestones */
int __pn_debug_log_level = PN_DEBUG_LEVEL_MILESTONE;


static void _pn_default_diag_printer(int level, const char *file, const char *func,
                                     int line, const char *message);

static PodNetCommon::diag_printer_t __pn_diag_printer = &_pn_default_diag_printer;


// -----------------------------------------------------------------------------
/**
 *  @brief Default log printer, used if no other is installed.
 *
 *  Writes a single line to stderr of the form
 *  "<monotonic time> <LVL>: < M:<file> F:<func> L:<line> > <message>".
 */
static void _pn_default_diag_printer(int level, const char *file, const char *func,
                                     int line, const char *message)
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);

    struct iovec iov[5];
    char tbuf[32];

    iov[0].iov_base = tbuf;
    iov[0].iov_len = snprintf(tbuf, sizeof(tbuf), "%.010lu.%.06lu ",
                              ts.tv_sec, ts.tv_nsec / 1000);
    iov[0].iov_len = std::min(iov[0].iov_len, sizeof(tbuf));

    const char *prefix;
    switch (level)
    {
        case PN_DEBUG_LEVEL_FATAL:          prefix = "FTL: ";   break;
        case PN_DEBUG_LEVEL_ERROR:          prefix = "ERR: ";   break;
        case PN_DEBUG_LEVEL_WARNING:        prefix = "WRN: ";   break;
        case PN_DEBUG_LEVEL_MILESTONE:
        case PN_DEBUG_LEVEL_PROD_MILESTONE: prefix = "MIL: ";   break;
        case PN_DEBUG_LEVEL_INFO:           prefix = "NFO: ";   break;
        case PN_DEBUG_LEVEL_DEBUG:          prefix = "DBG: ";   break;
        default:                            prefix = ": ";      break;
    }
    iov[1].iov_base = const_cast<char*>(prefix);
    iov[1].iov_len = strlen(prefix);

    char fbuf[160];
    iov[2].iov_base = fbuf;
    if (!file || !func || (line <= 0))
        iov[2].iov_len = snprintf(fbuf, sizeof(fbuf), "< M:? F:? L:? > ");
    else
        iov[2].iov_len = snprintf(fbuf, sizeof(fbuf), "< M:%.*s F:%.*s L:%d > ",
                                  64, file, 64, func, line);
    iov[2].iov_len = std::min(iov[2].iov_len, sizeof(fbuf));

    iov[3].iov_base = const_cast<char*>(message);
    iov[3].iov_len = strlen(message);

    iov[4].iov_base = const_cast<char*>("\n");
    iov[4].iov_len = 1;

    if (writev(STDERR_FILENO, iov, 5) < 0)
    {
        // nowhere left to report this
    }
}

// -----------------------------------------------------------------------------
/**
 *  @brief Formats a log message and passes it to the installed printer.
 *
 *  Trailing newlines are stripped. If @a append is not null it is appended
 *  to the formatted message, this is used to add the errno string for the
 *  PN_LOG_SYS_* macros.
 */
static void _pn_debug_log_vprintf(int level, const char *file, const char *func,
                                  int line, const char *fmt, va_list ap,
                                  const char *append)
{
    if (__builtin_expect((level > __pn_debug_log_level), 0))
        return;

    char mbuf[512];
    int len;

    len = vsnprintf(mbuf, sizeof(mbuf), fmt, ap);
    if (__builtin_expect((len < 1), 0))
        return;
    if (__builtin_expect((len > (int)(sizeof(mbuf) - 1)), 0))
        len = sizeof(mbuf) - 1;
    if (__builtin_expect((mbuf[len - 1] == '\n'), 0))
        len--;
    mbuf[len] = '\0';

    if (append && (len < (int)(sizeof(mbuf) - 1)))
    {
        size_t extra = std::min<size_t>(strlen(append), (sizeof(mbuf) - len - 1));
        memcpy(mbuf + len, append, extra);
        len += extra;
        mbuf[len] = '\0';
    }

    const char *fname = nullptr;
    if (file)
    {
        if ((fname = strrchr(file, '/')) == nullptr)
            fname = file;
        else
            fname++;
    }

    if (__pn_diag_printer)
        __pn_diag_printer(level, fname, func, line, mbuf);
}


extern "C" void __pn_debug_log_printf(int level, const char *file,
                                      const char *func, int line,
                                      const char *fmt, ...)
{
    va_list ap;

    va_start(ap, fmt);
    _pn_debug_log_vprintf(level, file, func, line, fmt, ap, nullptr);
    va_end(ap);
}

extern "C" void __pn_debug_log_sys_printf(int err, int level, const char *file,
                                          const char *func, int line,
                                          const char *fmt, ...)
{
    va_list ap;
    char errbuf[64];
    char appendbuf[96];

    const char *errmsg = strerror_r(err, errbuf, sizeof(errbuf));

    const char *append = nullptr;
    if (errmsg)
    {
        snprintf(appendbuf, sizeof(appendbuf), " (%d - %s)", err, errmsg);
        appendbuf[sizeof(appendbuf) - 1] = '\0';
        append = appendbuf;
    }

    va_start(ap, fmt);
    _pn_debug_log_vprintf(level, file, func, line, fmt, ap, append);
    va_end(ap);
}


// -----------------------------------------------------------------------------
/**
 *  @brief Installs the printer used for all log messages.
 *
 *  Passing nullptr reinstates the default stderr printer.
 */
void PodNetCommon::initLogging(diag_printer_t diagPrinter)
{
    if (diagPrinter)
        __pn_diag_printer = std::move(diagPrinter);
    else
        __pn_diag_printer = &_pn_default_diag_printer;
}

void PodNetCommon::termLogging()
{
    __pn_diag_printer = &_pn_default_diag_printer;
}
