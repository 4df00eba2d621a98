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

#ifndef INCLUDED_SRC_TARGETSEAL_CONSTRAINTS_ENVIRONMENT_COLLECTION_HPP
#define INCLUDED_SRC_TARGETSEAL_CONSTRAINTS_ENVIRONMENT_COLLECTION_HPP

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <utility>  // std::move

#include "nlohmann/json.hpp"
#include "src/targetseal/common/label.hpp"

namespace TargetSeal {

/// \brief Set of environment labels a target supports.
class EnvironmentCollection {
  public:
    class Builder;

    EnvironmentCollection() = default;
    explicit EnvironmentCollection(std::set<Label> environments) noexcept
        : environments_{std::move(environments)} {}

    [[nodiscard]] auto Environments() const& noexcept
        -> std::set<Label> const& {
        return environments_;
    }
    [[nodiscard]] auto Contains(Label const& environment) const -> bool {
        return environments_.contains(environment);
    }
    [[nodiscard]] auto IsEmpty() const noexcept -> bool {
        return environments_.empty();
    }
    [[nodiscard]] auto Size() const noexcept -> std::size_t {
        return environments_.size();
    }
    [[nodiscard]] auto IsSubsetOf(EnvironmentCollection const& other) const
        -> bool {
        return std::includes(other.environments_.begin(),
                             other.environments_.end(),
                             environments_.begin(),
                             environments_.end());
    }

    [[nodiscard]] auto ToJson() const -> nlohmann::json {
        auto json = nlohmann::json::array();
        for (auto const& environment : environments_) {
            json.emplace_back(environment.ToJson());
        }
        return json;
    }

    [[nodiscard]] auto operator==(EnvironmentCollection const&) const
        -> bool = default;

  private:
    std::set<Label> environments_{};
};

class EnvironmentCollection::Builder {
  public:
    auto Put(Label environment) -> Builder& {
        environments_.insert(std::move(environment));
        return *this;
    }
    auto PutAll(EnvironmentCollection const& collection) -> Builder& {
        environments_.insert(collection.Environments().begin(),
                             collection.Environments().end());
        return *this;
    }
    /// \brief Drop an environment; returns whether it was present.
    auto Remove(Label const& environment) -> bool {
        return environments_.erase(environment) > 0;
    }
    [[nodiscard]] auto Environments() const& noexcept
        -> std::set<Label> const& {
        return environments_;
    }
    [[nodiscard]] auto Build() const -> EnvironmentCollection {
        return EnvironmentCollection{environments_};
    }

  private:
    std::set<Label> environments_{};
};

/// \brief Dependency whose lack of support caused an environment to be
/// removed from the refined set, plus the select() condition that pulled the
/// dependency in, if any.
struct RemovedEnvironmentCulprit {
    Label culprit;
    std::optional<Label> selected_by{};

    [[nodiscard]] auto ToJson() const -> nlohmann::json {
        auto json = nlohmann::json{{"culprit", culprit.ToJson()}};
        if (selected_by) {
            json["selected_by"] = selected_by->ToJson();
        }
        return json;
    }
};

using RemovedEnvironmentCulprits = std::map<Label, RemovedEnvironmentCulprit>;

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_CONSTRAINTS_ENVIRONMENT_COLLECTION_HPP
