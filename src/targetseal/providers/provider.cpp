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

#include "src/targetseal/providers/provider.hpp"

namespace TargetSeal {

namespace {

[[nodiscard]] auto RunfilesToJson(Runfiles const& runfiles) -> nlohmann::json {
    return nlohmann::json{
        {"artifacts", ArtifactSetToJson(runfiles.artifacts)},
        {"extra_middlemen", ArtifactSetToJson(runfiles.extra_middlemen)}};
}

[[nodiscard]] auto StringMapToJson(
    std::map<std::string, std::string> const& map) -> nlohmann::json {
    auto json = nlohmann::json::object();
    for (auto const& [key, value] : map) {
        json[key] = value;
    }
    return json;
}

}  // namespace

auto KeyOf(Provider const& provider) -> ProviderKey {
    return std::visit(
        [](auto const& p) -> ProviderKey {
            using T = std::remove_cvref_t<decltype(p)>;
            if constexpr (std::is_same_v<T, StructProvider>) {
                return p.Key();
            }
            else {
                return T::kKind;
            }
        },
        provider);
}

auto ConstructorOf(Provider const& provider)
    -> std::optional<ProviderConstructor> {
    return std::visit(
        [](auto const& p) -> std::optional<ProviderConstructor> {
            using T = std::remove_cvref_t<decltype(p)>;
            if constexpr (std::is_same_v<T, StructProvider>) {
                return p.constructor;
            }
            else if constexpr (NativeDeclaredProvider<T>) {
                return T::Constructor();
            }
            else {
                return std::nullopt;
            }
        },
        provider);
}

auto ProviderToJson(Provider const& provider) -> nlohmann::json {
    return std::visit(
        [](auto const& p) -> nlohmann::json {
            using T = std::remove_cvref_t<decltype(p)>;
            if constexpr (std::is_same_v<T, FileProvider>) {
                return ArtifactSetToJson(p.files_to_build);
            }
            else if constexpr (std::is_same_v<T, FilesToRunProvider>) {
                auto json = nlohmann::json{
                    {"files_to_run", ArtifactSetToJson(p.files_to_run)}};
                if (p.runfiles_support) {
                    json["runfiles_middleman"] =
                        p.runfiles_support->middleman.ExecPath();
                }
                if (p.executable) {
                    json["executable"] = p.executable->ExecPath();
                }
                return json;
            }
            else if constexpr (std::is_same_v<T, RunfilesProvider>) {
                return nlohmann::json{
                    {"default", RunfilesToJson(p.default_runfiles)},
                    {"data", RunfilesToJson(p.data_runfiles)}};
            }
            else if constexpr (std::is_same_v<T, LicensesProvider>) {
                return p.licenses;
            }
            else if constexpr (std::is_same_v<T, VisibilityProvider>) {
                auto json = nlohmann::json::array();
                for (auto const& label : p.visibility) {
                    json.emplace_back(label.ToJson());
                }
                return json;
            }
            else if constexpr (std::is_same_v<T,
                                              SupportedEnvironmentsProvider>) {
                auto removed = nlohmann::json::object();
                for (auto const& [label, culprit] : p.removed_culprits) {
                    removed[label.ToString()] = culprit.ToJson();
                }
                return nlohmann::json{{"declared", p.declared.ToJson()},
                                      {"refined", p.refined.ToJson()},
                                      {"removed", removed}};
            }
            else if constexpr (std::is_same_v<T, TestProvider>) {
                return p.ToJson();
            }
            else if constexpr (std::is_same_v<T, InstrumentedFilesInfo>) {
                return nlohmann::json{
                    {"instrumented_files",
                     ArtifactSetToJson(p.instrumented_files)},
                    {"metadata_files", ArtifactSetToJson(p.metadata_files)}};
            }
            else if constexpr (std::is_same_v<T, TestEnvironmentInfo>) {
                return StringMapToJson(p.environment);
            }
            else if constexpr (std::is_same_v<T, ExecutionInfo>) {
                return StringMapToJson(p.requirements);
            }
            else if constexpr (std::is_same_v<T, OutputGroupInfo>) {
                return p.groups.ToJson();
            }
            else {
                return p.value->ToJson();
            }
        },
        provider);
}

}  // namespace TargetSeal
