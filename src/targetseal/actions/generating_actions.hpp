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

#ifndef INCLUDED_SRC_TARGETSEAL_ACTIONS_GENERATING_ACTIONS_HPP
#define INCLUDED_SRC_TARGETSEAL_ACTIONS_GENERATING_ACTIONS_HPP

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "gsl/gsl"
#include "src/targetseal/actions/action_conflict.hpp"
#include "src/targetseal/actions/action_registry.hpp"
#include "src/targetseal/common/action.hpp"
#include "src/targetseal/common/identifier.hpp"
#include "src/utils/cpp/expected.hpp"

namespace TargetSeal {

/// \brief Actions of one target, free of duplicates, and for each output the
/// position of its generating action.
struct GeneratingActions {
    std::vector<Action::Ptr> actions{};
    std::unordered_map<ArtifactIdentifier, std::size_t>
        generating_action_index{};
};

/// \brief Drop repeated registrations of the same action and claim all
/// outputs in the build-wide registry.
/// \returns the conflict for the first output claimed by two different
/// actions, either within this target or across targets. On conflict, the
/// claims already made for this target are released.
[[nodiscard]] auto FilterSharedActionsAndDetectConflicts(
    gsl::not_null<ActionRegistry*> const& registry,
    std::vector<Action::Ptr> const& registered)
    -> expected<GeneratingActions, ActionConflict>;

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ACTIONS_GENERATING_ACTIONS_HPP
