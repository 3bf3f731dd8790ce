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

#include <Util/Logger/Logger.hpp>
#include <Util/Logger/impl/DfeLogger.hpp>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/periodic_worker.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace DFE {

namespace detail {

namespace {

constexpr auto LOGGER_NAME = "dfe";
constexpr auto NULL_SINK_PATH = "/dev/null";
constexpr auto LOG_PATTERN = "%^[%H:%M:%S.%f] [%n] [%L] [thread %t] [%s:%#] %v%$";
constexpr auto QUEUE_SIZE = 8 * 1024;
constexpr auto WORKER_THREADS = 1;
constexpr auto FLUSH_INTERVAL = std::chrono::seconds(1);

/**
 * @brief Everything an active logger owns besides the spdlog logger itself.
 */
struct AsyncLoggerResources {
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<spdlog::details::thread_pool> threadPool;
    std::unique_ptr<spdlog::details::periodic_worker> flusher;
};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_NONE: return spdlog::level::off;
        case LogLevel::LOG_FATAL_ERROR: return spdlog::level::critical;
        case LogLevel::LOG_ERROR: return spdlog::level::err;
        case LogLevel::LOG_WARNING: return spdlog::level::warn;
        case LogLevel::LOG_INFO: return spdlog::level::info;
        case LogLevel::LOG_DEBUG: return spdlog::level::debug;
        case LogLevel::LOG_TRACE: return spdlog::level::trace;
    }
    return spdlog::level::info;
}

std::vector<spdlog::sink_ptr> createSinks(const std::string& logFileName, spdlog::level::level_enum level) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_color_mode(spdlog::color_mode::always);
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFileName, true);
    std::vector<spdlog::sink_ptr> sinks{console, file};
    for (auto& sink : sinks) {
        sink->set_level(level);
        sink->set_pattern(LOG_PATTERN);
    }
    return sinks;
}

AsyncLoggerResources createAsyncLogger(const std::string& logFileName, LogLevel level) {
    AsyncLoggerResources resources;
    auto spdlogLevel = toSpdlogLevel(level);
    auto sinks = createSinks(logFileName, spdlogLevel);
    resources.threadPool = std::make_shared<spdlog::details::thread_pool>(QUEUE_SIZE, WORKER_THREADS);
    resources.logger = std::make_shared<spdlog::async_logger>(LOGGER_NAME,
                                                              sinks.begin(),
                                                              sinks.end(),
                                                              resources.threadPool,
                                                              spdlog::async_overflow_policy::block);
    resources.logger->set_level(spdlogLevel);
    // debug output of a failing test must reach the file before the process dies
    resources.logger->flush_on(spdlog::level::debug);
    resources.flusher = std::make_unique<spdlog::details::periodic_worker>(
        [logger = resources.logger]() {
            logger->flush();
        },
        FLUSH_INTERVAL);
    return resources;
}

}// namespace

Logger::Logger()
    : impl(std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::basic_file_sink_st>(NULL_SINK_PATH))) {}

Logger::~Logger() { shutdown(); }

void Logger::configure(const std::string& logFileName, LogLevel level) {
    auto resources = createAsyncLogger(logFileName, level);
    // stop the old flusher first, it still references the old logger and its thread pool
    flusher = std::move(resources.flusher);
    impl = std::move(resources.logger);
    loggerThreadPool = std::move(resources.threadPool);
    currentLogLevel = level;
    isShutdown = false;
}

void Logger::forceFlush() {
    if (impl) {
        for (const auto& sink : impl->sinks()) {
            sink->flush();
        }
        impl->flush();
    }
}

void Logger::shutdown() {
    if (isShutdown.exchange(true)) {
        return;
    }
    forceFlush();
    flusher.reset();
    impl.reset();
    loggerThreadPool.reset();
}

void Logger::changeLogLevel(LogLevel newLevel) {
    if (!impl) {
        return;
    }
    auto spdlogLevel = toSpdlogLevel(newLevel);
    impl->set_level(spdlogLevel);
    for (const auto& sink : impl->sinks()) {
        sink->set_level(spdlogLevel);
    }
    currentLogLevel = newLevel;
}

}// namespace detail

namespace Logger {

detail::Logger& getInstance() {
    static detail::Logger instance;
    return instance;
}

void setupLogging(const std::string& logFileName, LogLevel level) { getInstance().configure(logFileName, level); }

}// namespace Logger

}// namespace DFE
