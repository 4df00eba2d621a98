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

#include "src/targetseal/providers/output_groups.hpp"

namespace TargetSeal {

auto OutputGroups::Get(std::string const& name) const -> ArtifactSet {
    auto it = groups_.find(name);
    if (it == groups_.end()) {
        return ArtifactSet{};
    }
    return it->second;
}

auto OutputGroups::Names() const -> std::vector<std::string> {
    std::vector<std::string> names{};
    names.reserve(groups_.size());
    for (auto const& [name, _] : groups_) {
        names.emplace_back(name);
    }
    return names;
}

auto OutputGroups::ToJson() const -> nlohmann::json {
    auto json = nlohmann::json::object();
    for (auto const& [name, artifacts] : groups_) {
        json[name] = ArtifactSetToJson(artifacts);
    }
    return json;
}

auto OutputGroupsBuilder::Merge(std::string const& name,
                                ArtifactSet const& artifacts)
    -> OutputGroupsBuilder& {
    GroupBuilder(name).AddTransitive(artifacts);
    return *this;
}

auto OutputGroupsBuilder::Merge(std::string const& name, Artifact artifact)
    -> OutputGroupsBuilder& {
    GroupBuilder(name).Add(std::move(artifact));
    return *this;
}

auto OutputGroupsBuilder::MergeAll(
    std::map<std::string, ArtifactSet> const& groups) -> OutputGroupsBuilder& {
    for (auto const& [name, artifacts] : groups) {
        Merge(name, artifacts);
    }
    return *this;
}

auto OutputGroupsBuilder::Build() const -> OutputGroups {
    OutputGroups::map_t groups{};
    for (auto const& [name, builder] : builders_) {
        groups.emplace(name, builder.Build());
    }
    return OutputGroups{std::move(groups)};
}

auto OutputGroupsBuilder::GroupBuilder(std::string const& name)
    -> ArtifactSetBuilder& {
    auto it = builders_.find(name);
    if (it == builders_.end()) {
        it = builders_.emplace(name, ArtifactSetBuilder{Order::kStable}).first;
    }
    return it->second;
}

}  // namespace TargetSeal
