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

#ifndef INCLUDED_SRC_TARGETSEAL_ACTIONS_ACTION_REGISTRY_HPP
#define INCLUDED_SRC_TARGETSEAL_ACTIONS_ACTION_REGISTRY_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gsl/gsl"
#include "src/targetseal/actions/action_conflict.hpp"
#include "src/targetseal/common/action.hpp"
#include "src/targetseal/common/artifact.hpp"
#include "src/targetseal/common/identifier.hpp"
#include "src/utils/cpp/expected.hpp"

namespace TargetSeal {

// Build-wide map from output to the action generating it. Shared by all
// concurrently analysed targets; access is sharded by output identifier.
class ActionRegistry {
  public:
    explicit ActionRegistry(std::size_t jobs) : width_{ComputeWidth(jobs)} {}

    ActionRegistry() = default;

    // \brief Claim all outputs of the given action. An output already
    // claimed by an action with the same key is shared, not a conflict.
    // On conflict, the outputs claimed by this call are released again.
    // \returns the action that was registered first for the first output,
    // or the conflict for the first output claimed by a different action.
    [[nodiscard]] auto Register(Action::Ptr const& action)
        -> expected<Action::Ptr, ActionConflict> {
        Expects(action != nullptr);
        Action::Ptr canonical{};
        for (auto const& output : action->Outputs()) {
            auto const part = PartOf(output.Id());
            std::unique_lock lock{m_[part]};
            auto [entry, inserted] =
                actions_[part].emplace(output.Id(), action);
            if (not inserted and entry->second->Key() != action->Key()) {
                auto conflict = ActionConflict{entry->second, action, output};
                lock.unlock();
                Release(action);
                return unexpected{std::move(conflict)};
            }
            if (not canonical) {
                canonical = entry->second;
            }
        }
        return canonical ? canonical : action;
    }

    // \brief Drop all claims held by exactly this action instance. Outputs
    // owned by another action, shared or not, are left untouched.
    void Release(Action::Ptr const& action) {
        Expects(action != nullptr);
        for (auto const& output : action->Outputs()) {
            auto const part = PartOf(output.Id());
            std::unique_lock lock{m_[part]};
            auto it = actions_[part].find(output.Id());
            if (it != actions_[part].end() and it->second == action) {
                actions_[part].erase(it);
            }
        }
    }

    // \brief Action registered for the given output, nullptr if none.
    [[nodiscard]] auto GeneratingAction(ArtifactIdentifier const& output) const
        -> Action::Ptr {
        auto const part = PartOf(output);
        std::unique_lock lock{m_[part]};
        auto it = actions_[part].find(output);
        if (it == actions_[part].end()) {
            return nullptr;
        }
        return it->second;
    }

    // \brief Number of registered outputs.
    [[nodiscard]] auto Size() const -> std::size_t {
        std::size_t size{};
        for (std::size_t i = 0; i < width_; ++i) {
            std::unique_lock lock{m_[i]};
            size += actions_[i].size();
        }
        return size;
    }

  private:
    constexpr static std::size_t kScalingFactor = 2;
    std::size_t width_{ComputeWidth(0)};
    mutable std::vector<std::mutex> m_{width_};
    std::vector<std::unordered_map<ArtifactIdentifier, Action::Ptr>> actions_{
        width_};

    [[nodiscard]] auto PartOf(ArtifactIdentifier const& output) const
        -> std::size_t {
        return std::hash<ArtifactIdentifier>{}(output) % width_;
    }

    constexpr static auto ComputeWidth(std::size_t jobs) -> std::size_t {
        if (jobs <= 0) {
            // Non-positive indicates to use the default value
            return ComputeWidth(
                std::max(1U, std::thread::hardware_concurrency()));
        }
        return jobs * kScalingFactor + 1;
    }
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ACTIONS_ACTION_REGISTRY_HPP
