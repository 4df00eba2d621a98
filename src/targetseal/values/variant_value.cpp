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

#include "src/targetseal/values/variant_value.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <unordered_set>

namespace TargetSeal {

namespace {

constexpr auto kLabelType = "LABEL";
constexpr auto kSetType = "SET";
constexpr auto kMapType = "MAP";
constexpr auto kStructType = "STRUCT";

[[nodiscard]] auto IsIdentifier(std::string const& name) -> bool {
    if (name.empty() or
        std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return c == '_' or std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
}

[[nodiscard]] auto MakePtr(VariantValue&& value) -> VariantValuePtr {
    return std::make_shared<VariantValue const>(std::move(value));
}

[[nodiscard]] auto ReadEntries(nlohmann::json const& data)
    -> expected<VariantValue::map_t, std::string> {
    if (not data.is_object()) {
        return unexpected{
            fmt::format("Expected object of entries, but found {}",
                        data.dump())};
    }
    VariantValue::map_t entries{};
    for (auto const& [key, value] : data.items()) {
        auto entry = VariantValue::FromJson(value);
        if (not entry) {
            return unexpected{fmt::format(
                "In entry {}:\n{}", nlohmann::json(key).dump(), entry.error())};
        }
        entries.emplace(key, *std::move(entry));
    }
    return entries;
}

[[nodiscard]] auto ReadItems(nlohmann::json const& data)
    -> expected<VariantValue::list_t, std::string> {
    if (not data.is_array()) {
        return unexpected{
            fmt::format("Expected list of items, but found {}", data.dump())};
    }
    VariantValue::list_t items{};
    items.reserve(data.size());
    for (auto const& item : data) {
        auto value = VariantValue::FromJson(item);
        if (not value) {
            return unexpected{fmt::format(
                "In item #{}:\n{}", items.size(), value.error())};
        }
        items.emplace_back(*std::move(value));
    }
    return items;
}

}  // namespace

auto VariantValue::None() -> VariantValuePtr {
    static auto const kNone = MakePtr(VariantValue{});
    return kNone;
}

auto VariantValue::OfBool(bool value) -> VariantValuePtr {
    return MakePtr(VariantValue{value});
}

auto VariantValue::OfInt(int_t value) -> VariantValuePtr {
    return MakePtr(VariantValue{value});
}

auto VariantValue::OfString(std::string value) -> VariantValuePtr {
    return MakePtr(VariantValue{std::move(value)});
}

auto VariantValue::OfArtifact(artifact_t value) -> VariantValuePtr {
    return MakePtr(VariantValue{std::move(value)});
}

auto VariantValue::OfLabel(label_t value) -> VariantValuePtr {
    return MakePtr(VariantValue{std::move(value)});
}

auto VariantValue::MakeList(list_t items)
    -> expected<VariantValuePtr, std::string> {
    for (std::size_t i{}; i < items.size(); ++i) {
        if (not items[i]) {
            return unexpected{
                fmt::format("List item #{} must not be absent", i)};
        }
    }
    return MakePtr(VariantValue{std::move(items)});
}

auto VariantValue::MakeSet(list_t items)
    -> expected<VariantValuePtr, std::string> {
    set_t set{};
    std::unordered_set<std::string> seen{};
    for (auto& item : items) {
        if (not item) {
            return unexpected{std::string{"Set items must not be absent"}};
        }
        if (not item->IsHashable()) {
            return unexpected{
                fmt::format("Set items must be hashable, but found {} {}",
                            item->TypeString(),
                            item->ToString())};
        }
        if (seen.insert(item->Identity()).second) {
            set.items.emplace_back(std::move(item));
        }
    }
    return MakePtr(VariantValue{std::move(set)});
}

auto VariantValue::MakeMap(map_t entries)
    -> expected<VariantValuePtr, std::string> {
    for (auto const& [key, value] : entries) {
        if (key.empty()) {
            return unexpected{std::string{"Map keys must not be empty"}};
        }
        if (not value) {
            return unexpected{fmt::format(
                "Map value for key {} must not be absent",
                nlohmann::json(key).dump())};
        }
    }
    return MakePtr(VariantValue{std::move(entries)});
}

auto VariantValue::MakeStruct(map_t fields)
    -> expected<VariantValuePtr, std::string> {
    for (auto const& [name, value] : fields) {
        if (not IsIdentifier(name)) {
            return unexpected{
                fmt::format("Struct field name {} is not an identifier",
                            nlohmann::json(name).dump())};
        }
        if (not value) {
            return unexpected{
                fmt::format("Struct field {} must not be absent", name)};
        }
    }
    return MakePtr(VariantValue{struct_t{std::move(fields)}});
}

auto VariantValue::FromJson(nlohmann::json const& json) noexcept
    -> expected<VariantValuePtr, std::string> {
    try {
        if (json.is_null()) {
            return None();
        }
        if (json.is_boolean()) {
            return OfBool(json.get<bool>());
        }
        if (json.is_number_integer()) {
            return OfInt(json.get<int_t>());
        }
        if (json.is_number()) {
            return unexpected{fmt::format(
                "Only integral numbers are supported, found {}", json.dump())};
        }
        if (json.is_string()) {
            return OfString(json.get<std::string>());
        }
        if (json.is_array()) {
            return ReadItems(json).and_then(
                [](list_t items) { return MakeList(std::move(items)); });
        }
        auto const type = json.at("type").get<std::string>();
        auto const& data = json.at("data");
        if (type == kLabelType) {
            return Label::FromJson(data).transform(
                [](label_t label) { return OfLabel(std::move(label)); });
        }
        if (type == kSetType) {
            return ReadItems(data).and_then(
                [](list_t items) { return MakeSet(std::move(items)); });
        }
        if (type == kMapType) {
            return ReadEntries(data).and_then(
                [](map_t entries) { return MakeMap(std::move(entries)); });
        }
        if (type == kStructType) {
            return ReadEntries(data).and_then(
                [](map_t fields) { return MakeStruct(std::move(fields)); });
        }
        if (auto artifact = artifact_t::FromJson(json)) {
            return OfArtifact(*std::move(artifact));
        }
        return unexpected{
            fmt::format("Unsupported value description {}", json.dump())};
    } catch (std::exception const& ex) {
        return unexpected{
            fmt::format("Failed to read value description {} with error:\n{}",
                        json.dump(),
                        ex.what())};
    }
}

auto VariantValue::Field(std::string const& name) const
    -> std::optional<VariantValuePtr> {
    auto const& fields = Fields();
    auto it = fields.find(name);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto VariantValue::ToArtifacts() const
    -> expected<std::vector<artifact_t>, std::string> {
    if (not(IsList() or IsSet())) {
        return unexpected{fmt::format(
            "Expected list or set of artifacts, but found {}", TypeString())};
    }
    auto const& items = IsList() ? List() : Set();
    std::vector<artifact_t> artifacts{};
    artifacts.reserve(items.size());
    for (auto const& item : items) {
        if (not item->IsArtifact()) {
            return unexpected{
                fmt::format("Expected only artifacts, but found {} {}",
                            item->TypeString(),
                            item->ToString())};
        }
        artifacts.emplace_back(item->AsArtifact());
    }
    return artifacts;
}

auto VariantValue::ToJson() const -> nlohmann::json {
    if (IsNone()) {
        return nullptr;
    }
    if (IsBool()) {
        return Bool();
    }
    if (IsInt()) {
        return Int();
    }
    if (IsString()) {
        return String();
    }
    if (IsArtifact()) {
        return AsArtifact().ToJson();
    }
    if (IsLabel()) {
        return nlohmann::json{{"type", kLabelType},
                              {"data", AsLabel().ToJson()}};
    }
    auto items_to_json = [](list_t const& items) {
        auto json = nlohmann::json::array();
        for (auto const& item : items) {
            json.emplace_back(item->ToJson());
        }
        return json;
    };
    auto entries_to_json = [](map_t const& entries) {
        auto json = nlohmann::json::object();
        for (auto const& [key, value] : entries) {
            json[key] = value->ToJson();
        }
        return json;
    };
    if (IsList()) {
        return items_to_json(List());
    }
    if (IsSet()) {
        return nlohmann::json{{"type", kSetType},
                              {"data", items_to_json(Set())}};
    }
    if (IsMap()) {
        return nlohmann::json{{"type", kMapType},
                              {"data", entries_to_json(Map())}};
    }
    return nlohmann::json{{"type", kStructType},
                          {"data", entries_to_json(Fields())}};
}

auto VariantValue::Identity() const -> std::string {
    // artifacts are equal by path and root, independent of their owner
    if (IsArtifact()) {
        auto const& artifact = AsArtifact();
        return fmt::format("@{}:{}",
                           static_cast<int>(artifact.GetRoot()),
                           nlohmann::json(artifact.ExecPath()).dump());
    }
    if (IsList() or IsSet()) {
        std::string identity{IsList() ? "[" : "{"};
        for (auto const& item : IsList() ? List() : Set()) {
            identity += item->Identity() + ",";
        }
        return identity + (IsList() ? "]" : "}");
    }
    if (IsMap() or IsStruct()) {
        std::string identity{IsMap() ? "<" : "("};
        for (auto const& [key, value] : IsMap() ? Map() : Fields()) {
            identity += fmt::format(
                "{}:{},", nlohmann::json(key).dump(), value->Identity());
        }
        return identity + (IsMap() ? ">" : ")");
    }
    return ToJson().dump();
}

auto VariantValue::TypeString() const noexcept -> std::string {
    return std::visit(
        [](auto const& value) {
            return TypeToString<std::remove_cvref_t<decltype(value)>>();
        },
        data_);
}

}  // namespace TargetSeal
