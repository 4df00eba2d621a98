// Copyright 2024 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_LEVEL_HPP
#define INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_LEVEL_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <type_traits>

#include "gsl/gsl"

enum class LogLevel {
    Error,    ///< Errors that abort finalization of a target or the build
    Warning,  ///< Recoverable contract violations of collaborators
    Info,     ///< Summaries, such as number of sealed targets
    Debug,    ///< Progress through the individual finalization steps
    Trace     ///< Verbose details, such as every registered output
};

constexpr auto kFirstLogLevel = LogLevel::Error;
constexpr auto kLastLogLevel = LogLevel::Trace;

[[nodiscard]] static inline auto ToLogLevel(
    std::underlying_type_t<LogLevel> level) -> LogLevel {
    return std::min(std::max(static_cast<LogLevel>(level), kFirstLogLevel),
                    kLastLogLevel);
}

[[nodiscard]] static inline auto LogLevelToString(LogLevel level)
    -> std::string {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
    }
    Ensures(false);  // unreachable
}

/// \brief Parse a log level from its (case-sensitive) lower-case name.
[[nodiscard]] static inline auto LogLevelFromString(std::string const& name)
    -> std::optional<LogLevel> {
    for (auto level = static_cast<int>(kFirstLogLevel);
         level <= static_cast<int>(kLastLogLevel);
         ++level) {
        auto str = LogLevelToString(static_cast<LogLevel>(level));
        std::transform(str.begin(), str.end(), str.begin(), [](char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (str == name or (str == "warn" and name == "warning")) {
            return static_cast<LogLevel>(level);
        }
    }
    return std::nullopt;
}

#endif  // INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_LEVEL_HPP
