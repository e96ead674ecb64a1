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

#include <Util/Logger/impl/GtcLogger.hpp>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/periodic_worker.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace GTC {
namespace detail {

namespace {
constexpr auto LOGGER_NAME = "gtc";
constexpr auto LOG_PATTERN = "%^[%H:%M:%S.%f] [%L] [%t] [%s:%#] %v%$";
constexpr size_t QUEUE_SIZE = 8192;
constexpr size_t WORKER_THREADS = 1;
constexpr std::chrono::seconds FLUSH_INTERVAL{1};
}// namespace

/**
 * @brief Everything one configured logger consists of. The flusher references the logger and is stopped first.
 */
struct LoggerResources {
    LoggerResources(const std::string& logFileName, LogLevel level)
        : threadPool(std::make_shared<spdlog::details::thread_pool>(QUEUE_SIZE, WORKER_THREADS)) {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                            std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFileName, true)};
        for (const auto& sink : sinks) {
            sink->set_pattern(LOG_PATTERN);
            sink->set_level(toSpdlogLevel(level));
        }
        logger = std::make_shared<spdlog::async_logger>(LOGGER_NAME,
                                                        sinks.begin(),
                                                        sinks.end(),
                                                        threadPool,
                                                        spdlog::async_overflow_policy::block);
        logger->set_level(toSpdlogLevel(level));
        logger->flush_on(spdlog::level::err);
        auto flushed = logger;
        flusher = std::make_unique<spdlog::details::periodic_worker>(
            [flushed]() {
                flushed->flush();
            },
            FLUSH_INTERVAL);
    }

    ~LoggerResources() {
        flusher.reset();
        logger->flush();
    }

    std::shared_ptr<spdlog::details::thread_pool> threadPool;
    std::shared_ptr<spdlog::logger> logger;
    std::unique_ptr<spdlog::details::periodic_worker> flusher;
};

Logger::Logger() = default;

Logger::~Logger() { shutdown(); }

std::shared_ptr<spdlog::logger> Logger::current() const {
    std::lock_guard lock(mutex);
    return resources ? resources->logger : nullptr;
}

void Logger::configure(const std::string& logFileName, LogLevel level) {
    auto configured = std::make_unique<LoggerResources>(logFileName, level);
    std::lock_guard lock(mutex);
    resources = std::move(configured);
    currentLogLevel = level;
}

void Logger::changeLogLevel(LogLevel newLevel) {
    std::lock_guard lock(mutex);
    currentLogLevel = newLevel;
    if (!resources) {
        return;
    }
    for (const auto& sink : resources->logger->sinks()) {
        sink->set_level(toSpdlogLevel(newLevel));
    }
    resources->logger->set_level(toSpdlogLevel(newLevel));
}

LogLevel Logger::getCurrentLogLevel() const {
    std::lock_guard lock(mutex);
    return currentLogLevel;
}

void Logger::forceFlush() {
    if (auto logger = current()) {
        logger->flush();
    }
}

void Logger::shutdown() {
    std::unique_ptr<LoggerResources> released;
    {
        std::lock_guard lock(mutex);
        released = std::move(resources);
    }
}
}// namespace detail

namespace Logger {

void setupLogging(const std::string& logFileName, LogLevel level) { getInstance().configure(logFileName, level); }

detail::Logger& getInstance() {
    static detail::Logger instance;
    return instance;
}
}// namespace Logger

}// namespace GTC
