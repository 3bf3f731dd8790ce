/*
    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

        https://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
*/

#ifndef DFE_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
#define DFE_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
#include <Exceptions/ErrorMessageBuilder.hpp>
#include <Exceptions/RuntimeException.hpp>
#include <Util/Logger/LogLevel.hpp>
#include <Util/Logger/impl/DfeLogger.hpp>
#include <iostream>
#include <magic_enum.hpp>
#include <memory>
#include <sstream>

namespace DFE {

// In the following we define the DFE_COMPILE_TIME_LOG_LEVEL macro.
// This macro indicates the log level, which was chosen at compilation time and enables the complete
// elimination of log messages.
#if defined(DFE_LOGLEVEL_TRACE)
#define DFE_COMPILE_TIME_LOG_LEVEL 7
#elif defined(DFE_LOGLEVEL_DEBUG)
#define DFE_COMPILE_TIME_LOG_LEVEL 6
#elif defined(DFE_LOGLEVEL_INFO)
#define DFE_COMPILE_TIME_LOG_LEVEL 5
#elif defined(DFE_LOGLEVEL_WARN)
#define DFE_COMPILE_TIME_LOG_LEVEL 4
#elif defined(DFE_LOGLEVEL_ERROR)
#define DFE_COMPILE_TIME_LOG_LEVEL 3
#elif defined(DFE_LOGLEVEL_FATAL_ERROR)
#define DFE_COMPILE_TIME_LOG_LEVEL 2
#elif defined(DFE_LOGLEVEL_NONE)
#define DFE_COMPILE_TIME_LOG_LEVEL 1
#else
#define DFE_COMPILE_TIME_LOG_LEVEL 6
#endif

/**
 * @brief GetLogLevel returns the integer LogLevel value for an specific LogLevel value.
 * @param value LogLevel
 * @return integer between 1 and 7 to identify the log level.
 */
constexpr uint64_t getLogLevel(const LogLevel value) { return magic_enum::enum_integer(value); }

/**
 * @brief getLogName returns the string representation LogLevel value for a specific LogLevel value.
 * @param value LogLevel
 * @return string of value
 */
constexpr auto getLogName(const LogLevel value) { return magic_enum::enum_name(value); }

/**
 * @brief LogCaller is our compile-time trampoline to invoke the Logger method for the desired level of logging L
 * @tparam L the level of logging
 */
template<LogLevel L>
struct LogCaller {
    template<typename... arguments>
    constexpr static void do_call(spdlog::source_loc&&, fmt::format_string<arguments...>, arguments&&...) {
        // nop
    }
};

template<>
struct LogCaller<LogLevel::LOG_INFO> {
    template<typename... arguments>
    static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        DFE::Logger::getInstance().info(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_TRACE> {
    template<typename... arguments>
    static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        DFE::Logger::getInstance().trace(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_DEBUG> {
    template<typename... arguments>
    static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        DFE::Logger::getInstance().debug(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_ERROR> {
    template<typename... arguments>
    static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        DFE::Logger::getInstance().error(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_FATAL_ERROR> {
    template<typename... arguments>
    static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        DFE::Logger::getInstance().fatal(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_WARNING> {
    template<typename... arguments>
    static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        DFE::Logger::getInstance().warn(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

// The macros without a 2 at the end concatenate their arguments with <<.
// The ones that have a 2 at the end take a fmt format string followed by its arguments.

/// @brief stream style entry point for logging calls
#define DFE_LOG(LEVEL, message)                                                                                                  \
    do {                                                                                                                         \
        auto constexpr __level = DFE::getLogLevel(LEVEL);                                                                        \
        if constexpr (DFE_COMPILE_TIME_LOG_LEVEL >= __level) {                                                                   \
            std::stringbuf __buffer;                                                                                             \
            std::ostream __os(&__buffer);                                                                                        \
            __os << message;                                                                                                     \
            DFE::LogCaller<LEVEL>::do_call(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, "{}", __buffer.str());       \
        }                                                                                                                        \
    } while (0)

/// @brief fmt style entry point for logging calls
#define DFE_LOG2(LEVEL, ...)                                                                                                     \
    do {                                                                                                                         \
        auto constexpr __level = DFE::getLogLevel(LEVEL);                                                                        \
        if constexpr (DFE_COMPILE_TIME_LOG_LEVEL >= __level) {                                                                   \
            DFE::LogCaller<LEVEL>::do_call(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, __VA_ARGS__);                \
        }                                                                                                                        \
    } while (0)

// Creates a log message with log level trace.
#define DFE_TRACE(...) DFE_LOG(DFE::LogLevel::LOG_TRACE, __VA_ARGS__);
// Creates a log message with log level info.
#define DFE_INFO(...) DFE_LOG(DFE::LogLevel::LOG_INFO, __VA_ARGS__);
// Creates a log message with log level debug.
#define DFE_DEBUG(...) DFE_LOG(DFE::LogLevel::LOG_DEBUG, __VA_ARGS__);
// Creates a log message with log level warning.
#define DFE_WARNING(...) DFE_LOG(DFE::LogLevel::LOG_WARNING, __VA_ARGS__);
// Creates a log message with log level error.
#define DFE_ERROR(...) DFE_LOG(DFE::LogLevel::LOG_ERROR, __VA_ARGS__);
// Creates a log message with log level fatal error.
#define DFE_FATAL_ERROR(...) DFE_LOG(DFE::LogLevel::LOG_FATAL_ERROR, __VA_ARGS__);

// Creates a log message with log level trace.
#define DFE_TRACE2(...) DFE_LOG2(DFE::LogLevel::LOG_TRACE, __VA_ARGS__);
// Creates a log message with log level info.
#define DFE_INFO2(...) DFE_LOG2(DFE::LogLevel::LOG_INFO, __VA_ARGS__);
// Creates a log message with log level debug.
#define DFE_DEBUG2(...) DFE_LOG2(DFE::LogLevel::LOG_DEBUG, __VA_ARGS__);
// Creates a log message with log level warning.
#define DFE_WARNING2(...) DFE_LOG2(DFE::LogLevel::LOG_WARNING, __VA_ARGS__);
// Creates a log message with log level error.
#define DFE_ERROR2(...) DFE_LOG2(DFE::LogLevel::LOG_ERROR, __VA_ARGS__);
// Creates a log message with log level fatal error.
#define DFE_FATAL_ERROR2(...) DFE_LOG2(DFE::LogLevel::LOG_FATAL_ERROR, __VA_ARGS__);

// Throws a RuntimeException if CONDITION does not hold, TEXT is concatenated with <<.
#define DFE_ASSERT(CONDITION, TEXT)                                                                                              \
    do {                                                                                                                         \
        if (!(CONDITION)) {                                                                                                      \
            DFE::Exceptions::failAssertion(#CONDITION, DFE::Exceptions::ErrorMessageBuilder() << TEXT);                          \
        }                                                                                                                        \
    } while (0)

// Throws a RuntimeException, the arguments are concatenated with <<.
#define DFE_THROW_RUNTIME_ERROR(...) DFE::Exceptions::raiseRuntimeError(DFE::Exceptions::ErrorMessageBuilder() << __VA_ARGS__)

}// namespace DFE

#endif// DFE_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
