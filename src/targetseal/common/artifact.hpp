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

#ifndef INCLUDED_SRC_TARGETSEAL_COMMON_ARTIFACT_HPP
#define INCLUDED_SRC_TARGETSEAL_COMMON_ARTIFACT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"
#include "src/targetseal/common/identifier.hpp"
#include "src/targetseal/common/label.hpp"
#include "src/utils/cpp/hash_combine.hpp"

namespace TargetSeal {

/// \brief A file tracked by the build graph, identified by its execution
/// path. Derived artifacts and middlemen carry the label of the target that
/// owns their generating action.
class Artifact {
  public:
    enum class Root : std::uint8_t {
        kSource,    ///< checked-in input file
        kDerived,   ///< output of an action
        kMiddleman  ///< stand-in for a set of artifacts, e.g., runfiles
    };

    Artifact(std::string exec_path, Root root, std::optional<Label> owner)
        : exec_path_{std::move(exec_path)},
          root_{root},
          owner_{std::move(owner)} {}

    [[nodiscard]] static auto Source(std::string exec_path) -> Artifact {
        return Artifact{std::move(exec_path), Root::kSource, std::nullopt};
    }
    [[nodiscard]] static auto Derived(std::string exec_path, Label owner)
        -> Artifact {
        return Artifact{std::move(exec_path), Root::kDerived, std::move(owner)};
    }
    [[nodiscard]] static auto Middleman(std::string exec_path, Label owner)
        -> Artifact {
        return Artifact{
            std::move(exec_path), Root::kMiddleman, std::move(owner)};
    }

    [[nodiscard]] static auto FromJson(nlohmann::json const& json) noexcept
        -> std::optional<Artifact>;

    [[nodiscard]] auto Id() const& noexcept -> ArtifactIdentifier const& {
        return exec_path_;
    }
    [[nodiscard]] auto ExecPath() const& noexcept -> std::string const& {
        return exec_path_;
    }
    [[nodiscard]] auto GetRoot() const noexcept -> Root { return root_; }
    [[nodiscard]] auto Owner() const& noexcept -> std::optional<Label> const& {
        return owner_;
    }
    [[nodiscard]] auto IsSource() const noexcept -> bool {
        return root_ == Root::kSource;
    }
    [[nodiscard]] auto IsMiddleman() const noexcept -> bool {
        return root_ == Root::kMiddleman;
    }

    [[nodiscard]] auto ToJson() const -> nlohmann::json;
    [[nodiscard]] auto ToString() const -> std::string {
        return exec_path_;
    }

    [[nodiscard]] auto operator==(Artifact const& other) const noexcept
        -> bool {
        return exec_path_ == other.exec_path_ and root_ == other.root_;
    }

  private:
    std::string exec_path_;
    Root root_;
    std::optional<Label> owner_;
};

}  // namespace TargetSeal

namespace std {
template <>
struct hash<TargetSeal::Artifact> {
    [[nodiscard]] auto operator()(TargetSeal::Artifact const& a) const noexcept
        -> std::size_t {
        std::size_t seed{};
        hash_combine(&seed, a.ExecPath());
        hash_combine(&seed, static_cast<std::uint8_t>(a.GetRoot()));
        return seed;
    }
};
}  // namespace std

#endif  // INCLUDED_SRC_TARGETSEAL_COMMON_ARTIFACT_HPP
