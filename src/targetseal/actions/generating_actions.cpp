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

#include "src/targetseal/actions/generating_actions.hpp"

#include <string>
#include <unordered_set>
#include <utility>  // std::move

#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/logger.hpp"

namespace TargetSeal {

auto FilterSharedActionsAndDetectConflicts(
    gsl::not_null<ActionRegistry*> const& registry,
    std::vector<Action::Ptr> const& registered)
    -> expected<GeneratingActions, ActionConflict> {
    GeneratingActions result{};
    result.actions.reserve(registered.size());
    std::unordered_set<std::string> seen{};
    for (auto const& action : registered) {
        if (not seen.insert(action->Key()).second) {
            Logger::Log(LogLevel::Trace,
                        "Skipping repeated registration of {}",
                        action->Describe());
            continue;
        }
        auto claimed = registry->Register(action);
        if (not claimed) {
            for (auto const& earlier : result.actions) {
                registry->Release(earlier);
            }
            return unexpected{std::move(claimed).error()};
        }
        auto const pos = result.actions.size();
        for (auto const& output : action->Outputs()) {
            result.generating_action_index.emplace(output.Id(), pos);
        }
        result.actions.emplace_back(action);
    }
    return result;
}

}  // namespace TargetSeal
