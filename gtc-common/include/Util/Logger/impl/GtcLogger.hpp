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

#ifndef GTC_COMMON_INCLUDE_UTIL_LOGGER_IMPL_GTCLOGGER_HPP_
#define GTC_COMMON_INCLUDE_UTIL_LOGGER_IMPL_GTCLOGGER_HPP_

#include <Util/Logger/LogLevel.hpp>
#include <memory>
#include <mutex>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

namespace GTC {
namespace detail {

constexpr spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
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

struct LoggerResources;

/**
 * @brief Process wide asynchronous logger writing to the console and to a file.
 * Messages logged before configure() are dropped.
 */
class Logger {
  public:
    Logger();

    ~Logger();

    Logger(const Logger&) = delete;

    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Replaces the current sinks by a console sink and a file sink at the given level.
     */
    void configure(const std::string& logFileName, LogLevel level);

    void changeLogLevel(LogLevel newLevel);

    [[nodiscard]] LogLevel getCurrentLogLevel() const;

    void forceFlush();

    /**
     * @brief Flushes pending messages and stops the background threads.
     */
    void shutdown();

    template<typename... Arguments>
    void log(LogLevel level, spdlog::source_loc loc, fmt::format_string<Arguments...> format, Arguments&&... args) {
        auto logger = current();
        if (logger) {
            logger->log(loc, toSpdlogLevel(level), format, std::forward<Arguments>(args)...);
        }
    }

  private:
    [[nodiscard]] std::shared_ptr<spdlog::logger> current() const;

    mutable std::mutex mutex;
    std::unique_ptr<LoggerResources> resources;
    LogLevel currentLogLevel = LogLevel::LOG_INFO;
};
}// namespace detail

namespace Logger {

/**
 * @brief Configures the process wide logger.
 * @param logFileName the file receiving a copy of every console message
 * @param level messages below this level are dropped
 */
void setupLogging(const std::string& logFileName, LogLevel level);

detail::Logger& getInstance();
}// namespace Logger

}// namespace GTC

#endif// GTC_COMMON_INCLUDE_UTIL_LOGGER_IMPL_GTCLOGGER_HPP_
