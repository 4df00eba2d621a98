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

#ifndef INCLUDED_SRC_TARGETSEAL_ANALYSIS_CONSTRAINT_CHECK_HPP
#define INCLUDED_SRC_TARGETSEAL_ANALYSIS_CONSTRAINT_CHECK_HPP

#include <optional>

#include "gsl/gsl"
#include "src/targetseal/analysis/rule_context.hpp"
#include "src/targetseal/providers/provider.hpp"

namespace TargetSeal {

/// \brief Run the constraint semantics of the context, if constraints are
/// enforced and the rule supports checking them.
/// \returns the environments to publish to dependents; nullopt if no check
/// was run, e.g., because the target declares no environments.
[[nodiscard]] auto CheckConstraints(gsl::not_null<RuleContext*> const& context)
    -> std::optional<SupportedEnvironmentsProvider>;

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ANALYSIS_CONSTRAINT_CHECK_HPP
