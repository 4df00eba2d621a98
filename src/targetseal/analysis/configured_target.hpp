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

#ifndef INCLUDED_SRC_TARGETSEAL_ANALYSIS_CONFIGURED_TARGET_HPP
#define INCLUDED_SRC_TARGETSEAL_ANALYSIS_CONFIGURED_TARGET_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>  // std::move
#include <vector>

#include "nlohmann/json.hpp"
#include "src/targetseal/actions/generating_actions.hpp"
#include "src/targetseal/collections/artifact_set.hpp"
#include "src/targetseal/common/action.hpp"
#include "src/targetseal/common/artifact.hpp"
#include "src/targetseal/common/label.hpp"
#include "src/targetseal/providers/output_groups.hpp"
#include "src/targetseal/providers/provider.hpp"
#include "src/targetseal/providers/provider_map.hpp"

namespace TargetSeal {

/// \brief Sealed analysis result of a target: its providers and the actions
/// it generates.
class ConfiguredTarget {
  public:
    ConfiguredTarget(Label label,
                     ProviderMap providers,
                     GeneratingActions actions)
        : label_{std::move(label)},
          providers_{std::move(providers)},
          actions_{std::move(actions)} {}

    [[nodiscard]] auto GetLabel() const& noexcept -> Label const& {
        return label_;
    }
    [[nodiscard]] auto Providers() const& noexcept -> ProviderMap const& {
        return providers_;
    }
    [[nodiscard]] auto Actions() const& noexcept
        -> std::vector<Action::Ptr> const& {
        return actions_.actions;
    }
    [[nodiscard]] auto GeneratingActionIndex() const& noexcept
        -> std::unordered_map<ArtifactIdentifier, std::size_t> const& {
        return actions_.generating_action_index;
    }

    template <BuiltinProvider T>
    [[nodiscard]] auto Get() const -> T const* {
        return providers_.Get<T>();
    }

    [[nodiscard]] auto FilesToBuild() const -> ArtifactSet;
    [[nodiscard]] auto FilesToRun() const -> ArtifactSet;

    /// \brief Artifacts of the named output group; empty for unknown names.
    [[nodiscard]] auto OutputGroup(std::string const& name) const
        -> ArtifactSet;
    [[nodiscard]] auto GetOutputGroups() const -> OutputGroups;

    /// \brief Action of this target generating the artifact, or nullptr.
    [[nodiscard]] auto GeneratingAction(Artifact const& artifact) const
        -> Action::Ptr;

    [[nodiscard]] auto ToJson() const -> nlohmann::json;

  private:
    Label label_;
    ProviderMap providers_;
    GeneratingActions actions_;
};

using ConfiguredTargetPtr = std::shared_ptr<ConfiguredTarget const>;

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ANALYSIS_CONFIGURED_TARGET_HPP
