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

#include "src/targetseal/analysis/rule_context.hpp"

#include "fmt/core.h"
#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/logger.hpp"

namespace TargetSeal {

void RuleContext::AttributeError(std::string const& attribute,
                                 std::string const& message) {
    Report(fmt::format("in {} attribute of {} rule {}: {}",
                       attribute,
                       rule_class_.name,
                       label_.ToString(),
                       message),
           /*fatal=*/true);
}

void RuleContext::RuleError(std::string const& message) {
    Report(fmt::format("in {} rule {}: {}",
                       rule_class_.name,
                       label_.ToString(),
                       message),
           /*fatal=*/true);
}

void RuleContext::Warning(std::string const& message) {
    Report(fmt::format("in {} rule {}: {}",
                       rule_class_.name,
                       label_.ToString(),
                       message),
           /*fatal=*/false);
}

void RuleContext::Report(std::string const& message, bool fatal) {
    if (fatal) {
        ++num_errors_;
    }
    if (logger_) {
        logger_(message, fatal);
    }
    else {
        Logger::Log(fatal ? LogLevel::Error : LogLevel::Warning, message);
    }
}

}  // namespace TargetSeal
