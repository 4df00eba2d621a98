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

#include "src/targetseal/analysis/configured_target.hpp"

namespace TargetSeal {

auto ConfiguredTarget::FilesToBuild() const -> ArtifactSet {
    if (auto const* provider = Get<FileProvider>()) {
        return provider->files_to_build;
    }
    return ArtifactSet{};
}

auto ConfiguredTarget::FilesToRun() const -> ArtifactSet {
    if (auto const* provider = Get<FilesToRunProvider>()) {
        return provider->files_to_run;
    }
    return ArtifactSet{};
}

auto ConfiguredTarget::OutputGroup(std::string const& name) const
    -> ArtifactSet {
    if (auto const* info = Get<OutputGroupInfo>()) {
        return info->groups.Get(name);
    }
    return ArtifactSet{};
}

auto ConfiguredTarget::GetOutputGroups() const -> OutputGroups {
    if (auto const* info = Get<OutputGroupInfo>()) {
        return info->groups;
    }
    return OutputGroups{};
}

auto ConfiguredTarget::GeneratingAction(Artifact const& artifact) const
    -> Action::Ptr {
    auto const& index = actions_.generating_action_index;
    auto it = index.find(artifact.Id());
    if (it == index.end()) {
        return nullptr;
    }
    return actions_.actions.at(it->second);
}

auto ConfiguredTarget::ToJson() const -> nlohmann::json {
    auto actions = nlohmann::json::array();
    for (auto const& action : actions_.actions) {
        actions.emplace_back(action->Id());
    }
    return nlohmann::json{{"label", label_.ToJson()},
                          {"providers", providers_.ToJson()},
                          {"actions", actions}};
}

}  // namespace TargetSeal
