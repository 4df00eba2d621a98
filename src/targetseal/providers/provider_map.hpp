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

#ifndef INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_MAP_HPP
#define INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_MAP_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>  // std::move
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/targetseal/providers/provider.hpp"
#include "src/targetseal/providers/provider_key.hpp"
#include "src/targetseal/values/variant_value.hpp"
#include "src/utils/cpp/expected.hpp"

namespace TargetSeal {

/// \brief Value of a provider map entry. Entries under a dynamic name may
/// hold a plain value or a provider reachable under a legacy name.
using ProviderValue = std::variant<ProviderPtr, VariantValuePtr>;

/// \brief Immutable map of the providers of a target. Iteration follows
/// insertion order; lookups are by key.
class ProviderMap {
    friend class ProviderMapBuilder;

  public:
    using entry_t = std::pair<ProviderKey, ProviderValue>;

    ProviderMap() = default;

    [[nodiscard]] auto Size() const noexcept -> std::size_t {
        return entries_->size();
    }
    [[nodiscard]] auto Contains(ProviderKey const& key) const -> bool {
        return index_->contains(key);
    }
    [[nodiscard]] auto Entries() const& noexcept
        -> std::vector<entry_t> const& {
        return *entries_;
    }

    [[nodiscard]] auto Find(ProviderKey const& key) const
        -> ProviderValue const*;

    /// \brief Built-in provider of type T, or nullptr if absent.
    template <BuiltinProvider T>
    [[nodiscard]] auto Get() const -> T const* {
        if (auto const* value = Find(ProviderKey{T::kKind})) {
            if (auto const* provider = std::get_if<ProviderPtr>(value)) {
                return std::get_if<T>(provider->get());
            }
        }
        return nullptr;
    }

    /// \brief Provider declared in the extension language, or nullptr.
    [[nodiscard]] auto GetDeclared(DeclaredProviderKey const& key) const
        -> StructProvider const*;

    /// \brief Entry stored under a dynamic name, or nullptr.
    [[nodiscard]] auto GetDynamic(std::string const& name) const
        -> ProviderValue const*;

    [[nodiscard]] auto ToJson() const -> nlohmann::json;

  private:
    using index_t = std::unordered_map<ProviderKey, std::size_t>;

    std::shared_ptr<std::vector<entry_t> const> entries_{
        std::make_shared<std::vector<entry_t> const>()};
    std::shared_ptr<index_t const> index_{std::make_shared<index_t const>()};

    ProviderMap(std::vector<entry_t> entries, index_t index)
        : entries_{std::make_shared<std::vector<entry_t> const>(
              std::move(entries))},
          index_{std::make_shared<index_t const>(std::move(index))} {}
};

/// \brief Accumulates the providers of a target. Every key may be used only
/// once; violating that is a bug of the caller, reported as error result.
class ProviderMapBuilder {
  public:
    using result_t = expected<std::monostate, std::string>;

    /// \brief Add a provider under its own key.
    [[nodiscard]] auto Put(ProviderPtr const& provider) -> result_t;

    template <class T>
    requires(std::is_constructible_v<Provider, T>)
        [[nodiscard]] auto Put(T provider) -> result_t {
        return Put(MakeProvider(std::move(provider)));
    }

    /// \brief Add a value or provider under a dynamic name.
    [[nodiscard]] auto Put(std::string const& name, ProviderValue value)
        -> result_t;

    [[nodiscard]] auto PutAll(std::vector<ProviderPtr> const& providers)
        -> result_t;
    [[nodiscard]] auto PutAll(ProviderMap const& providers) -> result_t;

    [[nodiscard]] auto Contains(ProviderKey const& key) const -> bool {
        return index_.contains(key);
    }

    /// \brief Built-in provider added so far, or nullptr.
    template <BuiltinProvider T>
    [[nodiscard]] auto Get() const -> T const* {
        auto it = index_.find(ProviderKey{T::kKind});
        if (it == index_.end()) {
            return nullptr;
        }
        if (auto const* provider =
                std::get_if<ProviderPtr>(&entries_[it->second].second)) {
            return std::get_if<T>(provider->get());
        }
        return nullptr;
    }

    [[nodiscard]] auto Build() const -> ProviderMap {
        return ProviderMap{entries_, index_};
    }

  private:
    std::vector<ProviderMap::entry_t> entries_{};
    ProviderMap::index_t index_{};

    [[nodiscard]] auto Insert(ProviderKey key, ProviderValue value)
        -> result_t;
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_MAP_HPP
