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

#include "src/targetseal/analysis/constraint_check.hpp"

#include <utility>  // std::move
#include <vector>

#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/logger.hpp"

namespace TargetSeal {

auto CheckConstraints(gsl::not_null<RuleContext*> const& context)
    -> std::optional<SupportedEnvironmentsProvider> {
    auto const& semantics = context->ConstraintSemantics();
    if (not context->Config().enforce_constraints or
        not context->RuleClass().supports_constraint_checking or
        semantics == nullptr) {
        return std::nullopt;
    }
    auto declared = semantics->GetSupportedEnvironments(*context);
    if (not declared or declared->IsEmpty()) {
        Logger::Log(LogLevel::Trace,
                    "{} declares no environments, skipping constraint check",
                    context->GetLabel().ToString());
        return std::nullopt;
    }

    EnvironmentCollection::Builder refined{};
    RemovedEnvironmentCulprits removed{};
    semantics->CheckConstraints(context, *declared, &refined, &removed);

    // refinement may only narrow the declared environments
    std::vector<Label> undeclared{};
    for (auto const& environment : refined.Environments()) {
        if (not declared->Contains(environment)) {
            undeclared.emplace_back(environment);
        }
    }
    for (auto const& environment : undeclared) {
        Logger::Log(LogLevel::Warning,
                    "Constraint check of {} refined to undeclared environment "
                    "{}, dropping it",
                    context->GetLabel().ToString(),
                    environment.ToString());
        refined.Remove(environment);
    }

    return SupportedEnvironmentsProvider{.declared = *std::move(declared),
                                         .refined = refined.Build(),
                                         .removed_culprits =
                                             std::move(removed)};
}

}  // namespace TargetSeal
