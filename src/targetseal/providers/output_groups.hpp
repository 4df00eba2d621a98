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

#ifndef INCLUDED_SRC_TARGETSEAL_PROVIDERS_OUTPUT_GROUPS_HPP
#define INCLUDED_SRC_TARGETSEAL_PROVIDERS_OUTPUT_GROUPS_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>  // std::move
#include <vector>

#include "nlohmann/json.hpp"
#include "src/targetseal/collections/artifact_set.hpp"
#include "src/targetseal/common/artifact.hpp"

namespace TargetSeal {

/// \brief Group built whenever the target is requested on the command line,
/// without being part of its default outputs.
inline constexpr auto kHiddenTopLevelGroup = "_hidden_top_level_INTERNAL_";

/// \brief Immutable mapping from output group name to artifacts, sorted by
/// name.
class OutputGroups {
  public:
    using map_t = std::map<std::string, ArtifactSet>;

    OutputGroups() = default;
    explicit OutputGroups(map_t groups) noexcept
        : groups_{std::move(groups)} {}

    /// \brief Artifacts of the named group; empty for unknown names.
    [[nodiscard]] auto Get(std::string const& name) const -> ArtifactSet;

    [[nodiscard]] auto Contains(std::string const& name) const -> bool {
        return groups_.contains(name);
    }
    [[nodiscard]] auto Names() const -> std::vector<std::string>;
    [[nodiscard]] auto Size() const noexcept -> std::size_t {
        return groups_.size();
    }
    [[nodiscard]] auto IsEmpty() const noexcept -> bool {
        return groups_.empty();
    }
    [[nodiscard]] auto Groups() const& noexcept -> map_t const& {
        return groups_;
    }

    [[nodiscard]] auto ToJson() const -> nlohmann::json;

  private:
    map_t groups_{};
};

/// \brief Accumulates output groups. Builders are created on first use of a
/// name, repeated additions to a name are unioned.
class OutputGroupsBuilder {
  public:
    auto Merge(std::string const& name, ArtifactSet const& artifacts)
        -> OutputGroupsBuilder&;
    auto Merge(std::string const& name, Artifact artifact)
        -> OutputGroupsBuilder&;
    auto MergeAll(std::map<std::string, ArtifactSet> const& groups)
        -> OutputGroupsBuilder&;

    [[nodiscard]] auto IsEmpty() const noexcept -> bool {
        return builders_.empty();
    }

    [[nodiscard]] auto Build() const -> OutputGroups;

  private:
    std::map<std::string, ArtifactSetBuilder> builders_{};

    [[nodiscard]] auto GroupBuilder(std::string const& name)
        -> ArtifactSetBuilder&;
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_PROVIDERS_OUTPUT_GROUPS_HPP
