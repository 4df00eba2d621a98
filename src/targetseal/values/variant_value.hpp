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

#ifndef INCLUDED_SRC_TARGETSEAL_VALUES_VARIANT_VALUE_HPP
#define INCLUDED_SRC_TARGETSEAL_VALUES_VARIANT_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>  // std::move
#include <variant>
#include <vector>

#include "fmt/core.h"
#include "nlohmann/json.hpp"
#include "src/targetseal/common/artifact.hpp"
#include "src/targetseal/common/label.hpp"
#include "src/utils/cpp/expected.hpp"

namespace TargetSeal {

class VariantValue;
using VariantValuePtr = std::shared_ptr<VariantValue const>;

/// \brief Unordered collection of distinct, hashable values. Iteration
/// follows first insertion.
struct SetValue {
    std::vector<VariantValuePtr> items;
};

/// \brief Record with named fields, e.g., an instance of a declared provider.
struct StructValue {
    std::map<std::string, VariantValuePtr> fields;
};

/// \brief Closed set of value kinds that may be stored under a dynamic
/// provider name. Composite values are validated once, when created through
/// the factory functions; a VariantValue that exists is valid.
class VariantValue {
  public:
    using none_t = std::monostate;
    using int_t = std::int64_t;
    using artifact_t = Artifact;
    using label_t = Label;
    using list_t = std::vector<VariantValuePtr>;
    using set_t = SetValue;
    using map_t = std::map<std::string, VariantValuePtr>;
    using struct_t = StructValue;

    class TypeError : public std::exception {
      public:
        explicit TypeError(std::string const& msg) noexcept
            : msg_{"VariantValue::TypeError: " + msg} {}
        [[nodiscard]] auto what() const noexcept -> char const* final {
            return msg_.c_str();
        }

      private:
        std::string msg_;
    };

    template <class T>
    static constexpr bool kIsScalar =
        std::is_same_v<T, none_t> or std::is_same_v<T, bool> or
        std::is_same_v<T, int_t> or std::is_same_v<T, std::string> or
        std::is_same_v<T, artifact_t> or std::is_same_v<T, label_t>;

    VariantValue() noexcept = default;

    /// \brief Scalar values are valid by construction.
    template <class T>
    requires(kIsScalar<std::remove_cvref_t<T>>)
        // NOLINTNEXTLINE(bugprone-forwarding-reference-overload)
        explicit VariantValue(T&& data) noexcept
        : data_{std::forward<T>(data)} {}

    [[nodiscard]] static auto None() -> VariantValuePtr;
    [[nodiscard]] static auto OfBool(bool value) -> VariantValuePtr;
    [[nodiscard]] static auto OfInt(int_t value) -> VariantValuePtr;
    [[nodiscard]] static auto OfString(std::string value) -> VariantValuePtr;
    [[nodiscard]] static auto OfArtifact(artifact_t value) -> VariantValuePtr;
    [[nodiscard]] static auto OfLabel(label_t value) -> VariantValuePtr;

    /// \brief Sequence; elements must not be null.
    [[nodiscard]] static auto MakeList(list_t items)
        -> expected<VariantValuePtr, std::string>;

    /// \brief Set; elements must be non-null scalars. Duplicates are dropped,
    /// keeping the first occurrence.
    [[nodiscard]] static auto MakeSet(list_t items)
        -> expected<VariantValuePtr, std::string>;

    /// \brief Mapping from non-empty string keys to non-null values.
    [[nodiscard]] static auto MakeMap(map_t entries)
        -> expected<VariantValuePtr, std::string>;

    /// \brief Record; field names must be identifiers, values non-null.
    [[nodiscard]] static auto MakeStruct(map_t fields)
        -> expected<VariantValuePtr, std::string>;

    /// \brief Read a value from its JSON representation (see ToJson). Never
    /// throws; validation errors are returned as message.
    [[nodiscard]] static auto FromJson(nlohmann::json const& json) noexcept
        -> expected<VariantValuePtr, std::string>;

    [[nodiscard]] auto IsNone() const noexcept -> bool { return IsA<none_t>(); }
    [[nodiscard]] auto IsBool() const noexcept -> bool { return IsA<bool>(); }
    [[nodiscard]] auto IsInt() const noexcept -> bool { return IsA<int_t>(); }
    [[nodiscard]] auto IsString() const noexcept -> bool {
        return IsA<std::string>();
    }
    [[nodiscard]] auto IsArtifact() const noexcept -> bool {
        return IsA<artifact_t>();
    }
    [[nodiscard]] auto IsLabel() const noexcept -> bool {
        return IsA<label_t>();
    }
    [[nodiscard]] auto IsList() const noexcept -> bool { return IsA<list_t>(); }
    [[nodiscard]] auto IsSet() const noexcept -> bool { return IsA<set_t>(); }
    [[nodiscard]] auto IsMap() const noexcept -> bool { return IsA<map_t>(); }
    [[nodiscard]] auto IsStruct() const noexcept -> bool {
        return IsA<struct_t>();
    }

    /// \brief Whether the value may be an element of a set.
    [[nodiscard]] auto IsHashable() const noexcept -> bool {
        return not(IsList() or IsSet() or IsMap() or IsStruct());
    }

    [[nodiscard]] auto Bool() const -> bool { return Cast<bool>(); }
    [[nodiscard]] auto Int() const -> int_t { return Cast<int_t>(); }
    [[nodiscard]] auto String() const& -> std::string const& {
        return Cast<std::string>();
    }
    [[nodiscard]] auto AsArtifact() const& -> artifact_t const& {
        return Cast<artifact_t>();
    }
    [[nodiscard]] auto AsLabel() const& -> label_t const& {
        return Cast<label_t>();
    }
    [[nodiscard]] auto List() const& -> list_t const& { return Cast<list_t>(); }
    [[nodiscard]] auto Set() const& -> list_t const& {
        return Cast<set_t>().items;
    }
    [[nodiscard]] auto Map() const& -> map_t const& { return Cast<map_t>(); }
    [[nodiscard]] auto Fields() const& -> map_t const& {
        return Cast<struct_t>().fields;
    }

    /// \brief Field of a struct, if present.
    [[nodiscard]] auto Field(std::string const& name) const
        -> std::optional<VariantValuePtr>;

    /// \brief Artifacts of a list or set consisting of artifacts only.
    [[nodiscard]] auto ToArtifacts() const
        -> expected<std::vector<artifact_t>, std::string>;

    [[nodiscard]] auto ToJson() const -> nlohmann::json;
    [[nodiscard]] auto ToString() const -> std::string {
        return ToJson().dump();
    }

    /// \brief String that is equal for two values iff the values are equal.
    [[nodiscard]] auto Identity() const -> std::string;

    [[nodiscard]] auto TypeString() const noexcept -> std::string;

    [[nodiscard]] auto operator==(VariantValue const& other) const -> bool {
        return this == &other or Identity() == other.Identity();
    }

  private:
    std::variant<none_t,
                 bool,
                 int_t,
                 std::string,
                 artifact_t,
                 label_t,
                 list_t,
                 set_t,
                 map_t,
                 struct_t>
        data_{none_t{}};

    explicit VariantValue(list_t list) noexcept : data_{std::move(list)} {}
    explicit VariantValue(set_t set) noexcept : data_{std::move(set)} {}
    explicit VariantValue(map_t map) noexcept : data_{std::move(map)} {}
    explicit VariantValue(struct_t record) noexcept
        : data_{std::move(record)} {}

    template <class T>
    [[nodiscard]] auto IsA() const noexcept -> bool {
        return std::holds_alternative<T>(data_);
    }

    template <class T>
    [[nodiscard]] auto Cast() const& -> T const& {
        if (auto const* value = std::get_if<T>(&data_)) {
            return *value;
        }
        throw TypeError{fmt::format("Value is not of type '{}' but '{}'.",
                                    TypeToString<T>(),
                                    TypeString())};
    }

    template <class T>
    [[nodiscard]] static auto TypeToString() noexcept -> std::string {
        if constexpr (std::is_same_v<T, none_t>) {
            return "none";
        }
        else if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        }
        else if constexpr (std::is_same_v<T, int_t>) {
            return "int";
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        }
        else if constexpr (std::is_same_v<T, artifact_t>) {
            return "artifact";
        }
        else if constexpr (std::is_same_v<T, label_t>) {
            return "label";
        }
        else if constexpr (std::is_same_v<T, list_t>) {
            return "list";
        }
        else if constexpr (std::is_same_v<T, set_t>) {
            return "set";
        }
        else if constexpr (std::is_same_v<T, map_t>) {
            return "map";
        }
        else {
            return "struct";
        }
    }
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_VALUES_VARIANT_VALUE_HPP
