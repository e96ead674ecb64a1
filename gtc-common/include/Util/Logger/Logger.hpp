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

#ifndef GTC_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
#define GTC_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
#include <Exceptions/RuntimeException.hpp>
#include <Util/Logger/LogLevel.hpp>
#include <Util/Logger/impl/GtcLogger.hpp>
#include <sstream>

namespace GTC {

// Messages above the level selected at build time (GTC_LOGLEVEL_*) are removed by the compiler.
#if defined(GTC_LOGLEVEL_NONE)
constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::LOG_NONE;
#elif defined(GTC_LOGLEVEL_FATAL_ERROR)
constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::LOG_FATAL_ERROR;
#elif defined(GTC_LOGLEVEL_ERROR)
constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::LOG_ERROR;
#elif defined(GTC_LOGLEVEL_WARN)
constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::LOG_WARNING;
#elif defined(GTC_LOGLEVEL_INFO)
constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::LOG_INFO;
#elif defined(GTC_LOGLEVEL_DEBUG)
constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::LOG_DEBUG;
#else
constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::LOG_TRACE;
#endif

constexpr bool isCompiledIn(LogLevel level) { return level != LogLevel::LOG_NONE && level <= COMPILE_TIME_LOG_LEVEL; }

#define GTC_SOURCE_LOCATION                                                                                                      \
    spdlog::source_loc { __FILE__, __LINE__, SPDLOG_FUNCTION }

/// stream style: GTC_INFO("added " << step->toString())
#define GTC_LOG(LEVEL, message)                                                                                                  \
    do {                                                                                                                         \
        if constexpr (GTC::isCompiledIn(LEVEL)) {                                                                                \
            std::ostringstream gtcLogStream;                                                                                     \
            gtcLogStream << message;                                                                                             \
            GTC::Logger::getInstance().log(LEVEL, GTC_SOURCE_LOCATION, "{}", gtcLogStream.str());                                \
        }                                                                                                                        \
    } while (0)

/// fmt style: GTC_INFO2("read {} options", count)
#define GTC_LOG2(LEVEL, ...)                                                                                                     \
    do {                                                                                                                         \
        if constexpr (GTC::isCompiledIn(LEVEL)) {                                                                                \
            GTC::Logger::getInstance().log(LEVEL, GTC_SOURCE_LOCATION, __VA_ARGS__);                                             \
        }                                                                                                                        \
    } while (0)

#define GTC_TRACE(...) GTC_LOG(GTC::LogLevel::LOG_TRACE, __VA_ARGS__)
#define GTC_DEBUG(...) GTC_LOG(GTC::LogLevel::LOG_DEBUG, __VA_ARGS__)
#define GTC_INFO(...) GTC_LOG(GTC::LogLevel::LOG_INFO, __VA_ARGS__)
#define GTC_WARNING(...) GTC_LOG(GTC::LogLevel::LOG_WARNING, __VA_ARGS__)
#define GTC_ERROR(...) GTC_LOG(GTC::LogLevel::LOG_ERROR, __VA_ARGS__)
#define GTC_FATAL_ERROR(...) GTC_LOG(GTC::LogLevel::LOG_FATAL_ERROR, __VA_ARGS__)

#define GTC_TRACE2(...) GTC_LOG2(GTC::LogLevel::LOG_TRACE, __VA_ARGS__)
#define GTC_DEBUG2(...) GTC_LOG2(GTC::LogLevel::LOG_DEBUG, __VA_ARGS__)
#define GTC_INFO2(...) GTC_LOG2(GTC::LogLevel::LOG_INFO, __VA_ARGS__)
#define GTC_WARNING2(...) GTC_LOG2(GTC::LogLevel::LOG_WARNING, __VA_ARGS__)
#define GTC_ERROR2(...) GTC_LOG2(GTC::LogLevel::LOG_ERROR, __VA_ARGS__)
#define GTC_FATAL_ERROR2(...) GTC_LOG2(GTC::LogLevel::LOG_FATAL_ERROR, __VA_ARGS__)

/// Throws a RuntimeException built from a stream expression.
#define GTC_THROW_RUNTIME_ERROR(...)                                                                                             \
    do {                                                                                                                         \
        std::ostringstream gtcErrorStream;                                                                                       \
        gtcErrorStream << __VA_ARGS__;                                                                                           \
        throw GTC::Exceptions::RuntimeException(gtcErrorStream.str());                                                           \
    } while (0)

/// Internal contract check, a violation is a bug of the caller.
#define GTC_ASSERT(CONDITION, TEXT)                                                                                              \
    do {                                                                                                                         \
        if (!(CONDITION)) {                                                                                                      \
            GTC_THROW_RUNTIME_ERROR("Failed assertion on " #CONDITION " error message: " << TEXT);                               \
        }                                                                                                                        \
    } while (0)

}// namespace GTC

#endif// GTC_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
