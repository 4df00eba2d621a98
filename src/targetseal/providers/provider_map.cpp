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

#include "src/targetseal/providers/provider_map.hpp"

#include "fmt/core.h"

namespace TargetSeal {

namespace {

[[nodiscard]] auto ValueToJson(ProviderValue const& value) -> nlohmann::json {
    if (auto const* provider = std::get_if<ProviderPtr>(&value)) {
        return ProviderToJson(**provider);
    }
    return std::get<VariantValuePtr>(value)->ToJson();
}

[[nodiscard]] auto IsAbsent(ProviderValue const& value) -> bool {
    return std::visit([](auto const& ptr) { return ptr == nullptr; }, value);
}

}  // namespace

auto ProviderMap::Find(ProviderKey const& key) const -> ProviderValue const* {
    auto it = index_->find(key);
    if (it == index_->end()) {
        return nullptr;
    }
    return &(*entries_)[it->second].second;
}

auto ProviderMap::GetDeclared(DeclaredProviderKey const& key) const
    -> StructProvider const* {
    if (auto const* value = Find(ProviderKey{key})) {
        if (auto const* provider = std::get_if<ProviderPtr>(value)) {
            return std::get_if<StructProvider>(provider->get());
        }
    }
    return nullptr;
}

auto ProviderMap::GetDynamic(std::string const& name) const
    -> ProviderValue const* {
    return Find(ProviderKey{name});
}

auto ProviderMap::ToJson() const -> nlohmann::json {
    auto json = nlohmann::json::object();
    for (auto const& [key, value] : *entries_) {
        json[ProviderKeyToString(key)] = ValueToJson(value);
    }
    return json;
}

auto ProviderMapBuilder::Put(ProviderPtr const& provider) -> result_t {
    if (not provider) {
        return unexpected{std::string{"Cannot add absent provider"}};
    }
    return Insert(KeyOf(*provider), provider);
}

auto ProviderMapBuilder::Put(std::string const& name, ProviderValue value)
    -> result_t {
    return Insert(ProviderKey{name}, std::move(value));
}

auto ProviderMapBuilder::PutAll(std::vector<ProviderPtr> const& providers)
    -> result_t {
    for (auto const& provider : providers) {
        auto result = Put(provider);
        if (not result) {
            return result;
        }
    }
    return std::monostate{};
}

auto ProviderMapBuilder::PutAll(ProviderMap const& providers) -> result_t {
    for (auto const& [key, value] : providers.Entries()) {
        auto result = Insert(key, value);
        if (not result) {
            return result;
        }
    }
    return std::monostate{};
}

auto ProviderMapBuilder::Insert(ProviderKey key, ProviderValue value)
    -> result_t {
    if (IsAbsent(value)) {
        return unexpected{fmt::format("Cannot add absent value for key {}",
                                      ProviderKeyToString(key))};
    }
    if (index_.contains(key)) {
        return unexpected{fmt::format("Provider {} was already added",
                                      ProviderKeyToString(key))};
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
    return std::monostate{};
}

}  // namespace TargetSeal
