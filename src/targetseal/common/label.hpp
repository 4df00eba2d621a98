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

#ifndef INCLUDED_SRC_TARGETSEAL_COMMON_LABEL_HPP
#define INCLUDED_SRC_TARGETSEAL_COMMON_LABEL_HPP

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"
#include "src/utils/cpp/expected.hpp"
#include "src/utils/cpp/hash_combine.hpp"

namespace TargetSeal {

/// \brief Name of a target, environment, or provider-defining file, written
/// as `@repository//package:name`. The repository is empty for the main
/// repository, in which case the `@repository` part is omitted.
class Label {
  public:
    static constexpr auto kRepositoryMarker = '@';
    static constexpr auto kPackageMarker = "//";
    static constexpr auto kNameSeparator = ':';

    Label() = default;
    Label(std::string repository, std::string package, std::string name)
        : repository_{std::move(repository)},
          package_{std::move(package)},
          name_{std::move(name)} {}

    /// \brief Parse a label string. `//pkg` is short for `//pkg:pkg`, where
    /// the name is taken from the last package component.
    [[nodiscard]] static auto Parse(std::string const& label)
        -> expected<Label, std::string>;

    [[nodiscard]] static auto FromJson(nlohmann::json const& json)
        -> expected<Label, std::string>;

    [[nodiscard]] auto Repository() const& noexcept -> std::string const& {
        return repository_;
    }
    [[nodiscard]] auto Package() const& noexcept -> std::string const& {
        return package_;
    }
    [[nodiscard]] auto Name() const& noexcept -> std::string const& {
        return name_;
    }

    [[nodiscard]] auto ToString() const -> std::string;
    [[nodiscard]] auto ToJson() const -> nlohmann::json { return ToString(); }

    [[nodiscard]] auto operator<=>(Label const& other) const = default;

  private:
    std::string repository_{};
    std::string package_{};
    std::string name_{};
};

}  // namespace TargetSeal

namespace std {
template <>
struct hash<TargetSeal::Label> {
    [[nodiscard]] auto operator()(TargetSeal::Label const& l) const noexcept
        -> std::size_t {
        std::size_t seed{};
        hash_combine(&seed, l.Repository());
        hash_combine(&seed, l.Package());
        hash_combine(&seed, l.Name());
        return seed;
    }
};
}  // namespace std

#endif  // INCLUDED_SRC_TARGETSEAL_COMMON_LABEL_HPP
