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

#ifndef INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_CONFIG_HPP
#define INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_CONFIG_HPP

#include <algorithm>
#include <atomic>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/log_sink.hpp"

/// \brief Process-wide logging configuration: log limit and sinks.
/// All members are thread-safe.
class LogConfig {
    struct ConfigData {
        std::mutex mutex{};
        std::atomic<LogLevel> log_limit{LogLevel::Info};
        std::vector<ILogSink::Ptr> sinks{};
    };

  public:
    static void SetLogLimit(LogLevel level) noexcept {
        Data().log_limit = level;
    }

    [[nodiscard]] static auto LogLimit() noexcept -> LogLevel {
        return Data().log_limit;
    }

    /// \brief Replace all sinks by fresh instances from the given factories.
    static void SetSinks(
        std::vector<LogSinkFactory> const& factories) noexcept {
        auto sinks = std::vector<ILogSink::Ptr>{};
        sinks.reserve(factories.size());
        std::transform(factories.begin(),
                       factories.end(),
                       std::back_inserter(sinks),
                       [](auto const& f) { return f(); });
        auto& data = Data();
        std::lock_guard lock{data.mutex};
        data.sinks = std::move(sinks);
    }

    static void AddSink(LogSinkFactory const& factory) noexcept {
        auto sink = factory();
        auto& data = Data();
        std::lock_guard lock{data.mutex};
        data.sinks.emplace_back(std::move(sink));
    }

    /// \brief Snapshot of the configured sinks. The returned vector holds
    /// shared ownership, so it can be used without holding the lock.
    [[nodiscard]] static auto Sinks() noexcept -> std::vector<ILogSink::Ptr> {
        auto& data = Data();
        std::lock_guard lock{data.mutex};
        return data.sinks;
    }

  private:
    [[nodiscard]] static auto Data() noexcept -> ConfigData& {
        static ConfigData instance{};
        return instance;
    }
};

#endif  // INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_CONFIG_HPP
