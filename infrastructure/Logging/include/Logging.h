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
//  Logging.h
//  PodNet infrastructure
//
#ifndef PODNET_LOGGING_H
#define PODNET_LOGGING_H


/**
 * One of the following is set by the cmake build, PN_BUILD_TYPE is set to
 * either PN_RELEASE or PN_DEBUG depending on CMAKE_BUILD_TYPE.
 */
#if !defined(PN_BUILD_TYPE) || !defined(PN_RELEASE) || !defined(PN_DEBUG)
#  warning "No build type defined, expected PN_BUILD_TYPE to be defined to either PN_RELEASE or PN_DEBUG"
#endif
#if (PN_BUILD_TYPE != PN_RELEASE) && (PN_BUILD_TYPE != PN_DEBUG)
#  warning "PN_BUILD_TYPE is not equal to PN_RELEASE or PN_DEBUG"
#endif


#ifdef __cplusplus
extern "C" {
#endif


extern int __pn_debug_log_level;
extern void __pn_debug_log_printf(int level, const char *file, const char *func,
                                  int line, const char *fmt, ...)
    __attribute__ ((format (printf, 5, 6)));
extern void __pn_debug_log_sys_printf(int err, int level, const char *file,
                                      const char *func, int line,
                                      const char *fmt, ...)
    __attribute__ ((format (printf, 6, 7)));


#define PN_DEBUG_LEVEL_PROD_MILESTONE  -1
#define PN_DEBUG_LEVEL_FATAL            0
#define PN_DEBUG_LEVEL_ERROR            1
#define PN_DEBUG_LEVEL_WARNING          2
#define PN_DEBUG_LEVEL_MILESTONE        3
#define PN_DEBUG_LEVEL_INFO             4
#define PN_DEBUG_LEVEL_DEBUG            5


/**
 * Debugging macros.
 *
 * Primitives, everything else is built on these two.
 */
#define __PN_LOG_PRINTF(level, fmt, ...) \
    do {  \
        if (__builtin_expect(((level) <= __pn_debug_log_level),0)) \
            __pn_debug_log_printf((level), __FILE__, __FUNCTION__, __LINE__, fmt, ##__VA_ARGS__); \
    } while(0)

#define __PN_LOG_SYS_PRINTF(err, level, fmt, ...) \
    do {  \
        if (__builtin_expect(((level) <= __pn_debug_log_level),0)) \
            __pn_debug_log_sys_printf((err), (level), __FILE__, __FUNCTION__, __LINE__, fmt, ##__VA_ARGS__); \
    } while(0)


/* In all builds we support production milestone logging */
#define PN_LOG_PROD_MILESTONE(fmt,...) \
    __PN_LOG_PRINTF(PN_DEBUG_LEVEL_PROD_MILESTONE, fmt, ##__VA_ARGS__)


/* Release builds compile out the function tracing, debug and info messages */
#if (PN_BUILD_TYPE == PN_RELEASE)
#   define PN_LOG_FN_ENTRY()
#   define PN_LOG_FN_EXIT()
#   define PN_LOG_DEBUG(fmt,...)
#   define PN_LOG_INFO(fmt,...)
#else
#   define PN_LOG_FN_ENTRY() \
        __PN_LOG_PRINTF(PN_DEBUG_LEVEL_DEBUG, "entry")
#   define PN_LOG_FN_EXIT() \
        __PN_LOG_PRINTF(PN_DEBUG_LEVEL_DEBUG, "exit")
#   define PN_LOG_DEBUG(fmt,...) \
        __PN_LOG_PRINTF(PN_DEBUG_LEVEL_DEBUG, fmt, ##__VA_ARGS__)
#   define PN_LOG_INFO(fmt,...) \
        __PN_LOG_PRINTF(PN_DEBUG_LEVEL_INFO, fmt, ##__VA_ARGS__)
#endif /* (PN_BUILD_TYPE == PN_RELEASE) */

#define PN_LOG_MILESTONE(fmt,...) \
    __PN_LOG_PRINTF(PN_DEBUG_LEVEL_MILESTONE, fmt, ##__VA_ARGS__)
#define PN_LOG_WARN(fmt,...) \
    __PN_LOG_PRINTF(PN_DEBUG_LEVEL_WARNING, fmt, ##__VA_ARGS__)
#define PN_LOG_SYS_WARN(err,fmt,...) \
    __PN_LOG_SYS_PRINTF(err, PN_DEBUG_LEVEL_WARNING, fmt, ##__VA_ARGS__)
#define PN_LOG_ERROR(fmt,...) \
    __PN_LOG_PRINTF(PN_DEBUG_LEVEL_ERROR, fmt, ##__VA_ARGS__)
#define PN_LOG_SYS_ERROR(err, fmt,...) \
    __PN_LOG_SYS_PRINTF(err, PN_DEBUG_LEVEL_ERROR, fmt, ##__VA_ARGS__)
#define PN_LOG_ERROR_EXIT(fmt,...) \
    do { \
        PN_LOG_ERROR(fmt, ##__VA_ARGS__); \
        PN_LOG_FN_EXIT(); \
    } while(0)
#define PN_LOG_SYS_ERROR_EXIT(err,fmt,...) \
    do { \
        PN_LOG_SYS_ERROR(err, fmt, ##__VA_ARGS__); \
        PN_LOG_FN_EXIT(); \
    } while(0)
#define PN_LOG_FATAL(fmt,...) \
    __PN_LOG_PRINTF(PN_DEBUG_LEVEL_FATAL, fmt, ##__VA_ARGS__)
#define PN_LOG_SYS_FATAL(err,fmt,...) \
    __PN_LOG_SYS_PRINTF(err, PN_DEBUG_LEVEL_FATAL, fmt, ##__VA_ARGS__)
#define PN_LOG_FATAL_EXIT(fmt,...) \
    do { \
        PN_LOG_FATAL(fmt, ##__VA_ARGS__); \
        PN_LOG_FN_EXIT(); \
    } while(0)
#define PN_LOG_EXCEPTION(fmt,...) \
    __PN_LOG_PRINTF(PN_DEBUG_LEVEL_FATAL, fmt, ##__VA_ARGS__)


#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include <functional>


namespace PodNetCommon
{

    typedef std::function<void (int level, const char *file, const char *func, int line, const char *message)> diag_printer_t;

    void initLogging(diag_printer_t diagPrinter = nullptr);
    void termLogging();

} // namespace PodNetCommon

#endif // defined(__cplusplus)


#endif /* PODNET_LOGGING_H */
