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

#ifndef INCLUDED_SRC_TARGETSEAL_COMMON_ACTION_HPP
#define INCLUDED_SRC_TARGETSEAL_COMMON_ACTION_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/targetseal/common/artifact.hpp"
#include "src/targetseal/common/identifier.hpp"
#include "src/targetseal/common/label.hpp"

namespace TargetSeal {

/// \brief Opaque node of the action graph. Only its outputs and its key are
/// interpreted here: two actions with equal keys are the same action, even
/// if registered by different targets (shared actions).
class Action {
  public:
    using Ptr = std::shared_ptr<Action const>;

    Action(Label owner,
           std::string mnemonic,
           std::vector<Artifact> outputs,
           std::vector<Artifact> inputs,
           nlohmann::json arguments);

    [[nodiscard]] static auto FromJson(nlohmann::json const& json) noexcept
        -> std::optional<Ptr>;

    /// \brief Equality key; covers everything but the owner.
    [[nodiscard]] auto Key() const& noexcept -> std::string const& {
        return key_;
    }
    [[nodiscard]] auto Id() const& noexcept -> ActionIdentifier const& {
        return id_;
    }
    [[nodiscard]] auto Owner() const& noexcept -> Label const& {
        return owner_;
    }
    [[nodiscard]] auto Mnemonic() const& noexcept -> std::string const& {
        return mnemonic_;
    }
    [[nodiscard]] auto Outputs() const& noexcept
        -> std::vector<Artifact> const& {
        return outputs_;
    }
    [[nodiscard]] auto Inputs() const& noexcept
        -> std::vector<Artifact> const& {
        return inputs_;
    }
    [[nodiscard]] auto Arguments() const& noexcept -> nlohmann::json const& {
        return arguments_;
    }

    /// \brief Human-readable description naming mnemonic, id, and owner.
    [[nodiscard]] auto Describe() const -> std::string;

    [[nodiscard]] auto ToJson() const -> nlohmann::json;

  private:
    Label owner_;
    std::string mnemonic_;
    std::vector<Artifact> outputs_;
    std::vector<Artifact> inputs_;
    nlohmann::json arguments_;
    std::string key_;
    ActionIdentifier id_;

    [[nodiscard]] auto ComputeKey() const -> std::string;
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_COMMON_ACTION_HPP
