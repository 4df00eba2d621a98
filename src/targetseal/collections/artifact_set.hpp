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

#ifndef INCLUDED_SRC_TARGETSEAL_COLLECTIONS_ARTIFACT_SET_HPP
#define INCLUDED_SRC_TARGETSEAL_COLLECTIONS_ARTIFACT_SET_HPP

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/targetseal/collections/nested_set.hpp"
#include "src/targetseal/common/artifact.hpp"

namespace TargetSeal {

using ArtifactSet = NestedSet<Artifact>;
using ArtifactSetBuilder = NestedSetBuilder<Artifact>;

/// \brief Flattened JSON rendering: list of artifact execution paths.
[[nodiscard]] static inline auto ArtifactSetToJson(ArtifactSet const& set)
    -> nlohmann::json {
    auto json = nlohmann::json::array();
    for (auto const& artifact : set.ToList()) {
        json.emplace_back(artifact.ExecPath());
    }
    return json;
}

[[nodiscard]] static inline auto ArtifactPaths(ArtifactSet const& set)
    -> std::vector<std::string> {
    std::vector<std::string> paths{};
    paths.reserve(set.Size());
    for (auto const& artifact : set.ToList()) {
        paths.emplace_back(artifact.ExecPath());
    }
    return paths;
}

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_COLLECTIONS_ARTIFACT_SET_HPP
