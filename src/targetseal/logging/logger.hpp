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

#ifndef INCLUDED_SRC_TARGETSEAL_LOGGING_LOGGER_HPP
#define INCLUDED_SRC_TARGETSEAL_LOGGING_LOGGER_HPP

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fmt/core.h"
#include "src/targetseal/logging/log_config.hpp"
#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/log_sink.hpp"

class Logger {
  public:
    using MessageCreateFunc = std::function<std::string()>;

    /// \brief Named logger using the sinks and limit from LogConfig.
    explicit Logger(std::string name) noexcept
        : name_{std::move(name)},
          log_limit_{LogConfig::LogLimit()},
          sinks_{LogConfig::Sinks()} {}

    /// \brief Named logger with its own sink instances.
    Logger(std::string name,
           std::vector<LogSinkFactory> const& factories) noexcept
        : name_{std::move(name)}, log_limit_{LogConfig::LogLimit()} {
        sinks_.reserve(factories.size());
        std::transform(factories.begin(),
                       factories.end(),
                       std::back_inserter(sinks_),
                       [](auto const& f) { return f(); });
    }

    ~Logger() noexcept = default;
    Logger(Logger const&) noexcept = delete;
    Logger(Logger&&) noexcept = delete;
    auto operator=(Logger const&) noexcept -> Logger& = delete;
    auto operator=(Logger&&) noexcept -> Logger& = delete;

    [[nodiscard]] auto Name() const& noexcept -> std::string const& {
        return name_;
    }

    [[nodiscard]] auto LogLimit() const noexcept -> LogLevel {
        return log_limit_;
    }

    void SetLogLimit(LogLevel level) noexcept { log_limit_ = level; }

    /// \brief Emit a fmt-style formatted message via this logger.
    template <class... T_Args>
    void Emit(LogLevel level,
              std::string const& msg,
              T_Args&&... args) const noexcept {
        if (IsEnabled(level, log_limit_)) {
            Forward(this, sinks_, level, msg, std::forward<T_Args>(args)...);
        }
    }

    /// \brief Emit a message that is only created if the level is enabled.
    void Emit(LogLevel level,
              MessageCreateFunc const& msg_creator) const noexcept {
        if (IsEnabled(level, log_limit_)) {
            Forward(this, sinks_, level, msg_creator());
        }
    }

    /// \brief Log via the global sinks and log limit of LogConfig.
    template <class... T_Args>
    static void Log(LogLevel level,
                    std::string const& msg,
                    T_Args&&... args) noexcept {
        if (IsEnabled(level, LogConfig::LogLimit())) {
            Forward(nullptr,
                    LogConfig::Sinks(),
                    level,
                    msg,
                    std::forward<T_Args>(args)...);
        }
    }

    static void Log(LogLevel level,
                    MessageCreateFunc const& msg_creator) noexcept {
        if (IsEnabled(level, LogConfig::LogLimit())) {
            Forward(nullptr, LogConfig::Sinks(), level, msg_creator());
        }
    }

    /// \brief Log via the given logger, or via LogConfig if it is null.
    template <class... T_Args>
    static void Log(Logger const* logger,
                    LogLevel level,
                    std::string const& msg,
                    T_Args&&... args) noexcept {
        if (logger != nullptr) {
            logger->Emit(level, msg, std::forward<T_Args>(args)...);
        }
        else {
            Log(level, msg, std::forward<T_Args>(args)...);
        }
    }

  private:
    std::string name_{};
    LogLevel log_limit_{};
    std::vector<ILogSink::Ptr> sinks_{};

    [[nodiscard]] static auto IsEnabled(LogLevel level,
                                        LogLevel limit) noexcept -> bool {
        return static_cast<int>(level) <= static_cast<int>(limit);
    }

    template <class... T_Args>
    static void Forward(Logger const* logger,
                        std::vector<ILogSink::Ptr> const& sinks,
                        LogLevel level,
                        std::string const& msg,
                        T_Args&&... args) noexcept {
        if constexpr (sizeof...(T_Args) == 0) {
            for (auto const& sink : sinks) {
                sink->Emit(logger, level, msg);
            }
        }
        else {
            std::string formatted{};
            try {
                formatted = fmt::vformat(msg, fmt::make_format_args(args...));
            } catch (std::runtime_error const&) {
                // malformed format string, emit it unformatted
                formatted = msg;
            }
            Forward(logger, sinks, level, formatted);
        }
    }
};

#endif  // INCLUDED_SRC_TARGETSEAL_LOGGING_LOGGER_HPP
