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

#ifndef INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_SINK_HPP
#define INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_SINK_HPP

#include <functional>
#include <memory>
#include <string>

#include "src/targetseal/logging/log_level.hpp"

class Logger;

/// \brief Destination of log messages, shared by all loggers it is
/// configured for.
class ILogSink {
  public:
    using Ptr = std::shared_ptr<ILogSink>;
    ILogSink() noexcept = default;
    ILogSink(ILogSink const&) = delete;
    auto operator=(ILogSink const&) -> ILogSink& = delete;
    virtual ~ILogSink() noexcept = default;

    /// \brief Must be callable from several threads at once. The logger is
    /// nullptr for messages of the global logger.
    virtual void Emit(Logger const* logger,
                      LogLevel level,
                      std::string const& msg) const noexcept = 0;
};

/// \brief Sinks are created lazily, once per logger.
using LogSinkFactory = std::function<ILogSink::Ptr()>;

#endif  // INCLUDED_SRC_TARGETSEAL_LOGGING_LOG_SINK_HPP
