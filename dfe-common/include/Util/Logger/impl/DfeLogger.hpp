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

#ifndef DFE_COMMON_INCLUDE_UTIL_LOGGER_IMPL_DFELOGGER_HPP_
#define DFE_COMMON_INCLUDE_UTIL_LOGGER_IMPL_DFELOGGER_HPP_

#include <Util/Logger/LogLevel.hpp>
#include <atomic>
#include <memory>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

namespace spdlog::details {
class thread_pool;
class periodic_worker;
}// namespace spdlog::details

namespace DFE {
namespace detail {
/**
 * @brief Wrapper around an asynchronous spdlog logger that writes to the console and to a log file.
 * The wrapper is created empty (writing to /dev/null) and becomes active after configure is called.
 */
class Logger {
  public:
    Logger();

    ~Logger();

    Logger(const Logger&) = delete;

    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Replaces the current logger with one that writes to the console and to logFileName.
     * @param logFileName path of the log file
     * @param level the initial log level
     */
    void configure(const std::string& logFileName, LogLevel level);

    /**
     * @brief Flushes all pending messages and releases the logger.
     */
    void shutdown();

    template<typename... arguments>
    inline void trace(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::trace, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    inline void warn(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::warn, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    inline void fatal(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::critical, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    inline void info(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::info, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    inline void debug(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::debug, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    inline void error(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::err, format, std::forward<arguments>(args)...);
        }
    }

    void forceFlush();

    inline LogLevel getCurrentLogLevel() const noexcept { return currentLogLevel; }

    void changeLogLevel(LogLevel newLevel);

  private:
    std::shared_ptr<spdlog::logger> impl{nullptr};
    LogLevel currentLogLevel = LogLevel::LOG_INFO;
    std::atomic<bool> isShutdown{false};
    std::shared_ptr<spdlog::details::thread_pool> loggerThreadPool{nullptr};
    std::unique_ptr<spdlog::details::periodic_worker> flusher{nullptr};
};
}// namespace detail

namespace Logger {
/**
 * @brief Configures the process-wide logger.
 * @param logFileName path of the log file
 * @param level the log level
 */
void setupLogging(const std::string& logFileName, LogLevel level);

/**
 * @brief Returns the process-wide logger.
 * @return the logger
 */
detail::Logger& getInstance();
}// namespace Logger

}// namespace DFE

#endif// DFE_COMMON_INCLUDE_UTIL_LOGGER_IMPL_DFELOGGER_HPP_
