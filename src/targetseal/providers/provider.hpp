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

#ifndef INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_HPP
#define INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_HPP

#include <concepts>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>  // std::move
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/targetseal/collections/artifact_set.hpp"
#include "src/targetseal/common/artifact.hpp"
#include "src/targetseal/common/label.hpp"
#include "src/targetseal/constraints/environment_collection.hpp"
#include "src/targetseal/providers/declared_info.hpp"
#include "src/targetseal/providers/provider_key.hpp"
#include "src/targetseal/providers/runfiles.hpp"
#include "src/targetseal/testing/test_params.hpp"

namespace TargetSeal {

/// \brief Artifacts built by default when the target is requested.
struct FileProvider {
    static constexpr auto kKind = ProviderKind::kFile;
    ArtifactSet files_to_build{};
};

/// \brief Artifacts needed to run the target, plus its run-time support if
/// the target is executable.
struct FilesToRunProvider {
    static constexpr auto kKind = ProviderKind::kFilesToRun;
    ArtifactSet files_to_run{};
    std::optional<RunfilesSupport> runfiles_support{};
    std::optional<Artifact> executable{};
};

/// \brief Runfiles this target contributes to the runfiles of dependents.
struct RunfilesProvider {
    static constexpr auto kKind = ProviderKind::kRunfiles;
    Runfiles default_runfiles{};
    Runfiles data_runfiles{};
};

struct LicensesProvider {
    static constexpr auto kKind = ProviderKind::kLicenses;
    std::vector<std::string> licenses{};
};

struct VisibilityProvider {
    static constexpr auto kKind = ProviderKind::kVisibility;
    std::vector<Label> visibility{};
};

/// \brief Environments a target declares to support, the subset that
/// remains after checking its dependencies, and why the others were removed.
struct SupportedEnvironmentsProvider {
    static constexpr auto kKind = ProviderKind::kSupportedEnvironments;
    EnvironmentCollection declared{};
    EnvironmentCollection refined{};
    RemovedEnvironmentCulprits removed_culprits{};
};

using Provider = std::variant<FileProvider,
                              FilesToRunProvider,
                              RunfilesProvider,
                              LicensesProvider,
                              VisibilityProvider,
                              SupportedEnvironmentsProvider,
                              TestProvider,
                              InstrumentedFilesInfo,
                              TestEnvironmentInfo,
                              ExecutionInfo,
                              OutputGroupInfo,
                              StructProvider>;
using ProviderPtr = std::shared_ptr<Provider const>;

template <class T>
concept BuiltinProvider = requires {
    { T::kKind } -> std::convertible_to<ProviderKind>;
};

template <class T>
concept NativeDeclaredProvider = BuiltinProvider<T> and requires {
    { T::Constructor() } -> std::same_as<ProviderConstructor const&>;
};

template <class T>
requires(std::is_constructible_v<Provider, T>)
    [[nodiscard]] auto MakeProvider(T provider) -> ProviderPtr {
    return std::make_shared<Provider const>(std::move(provider));
}

/// \brief Key under which a provider is stored.
[[nodiscard]] auto KeyOf(Provider const& provider) -> ProviderKey;

/// \brief Constructor of a declared provider, nullopt for providers that are
/// not declared providers.
[[nodiscard]] auto ConstructorOf(Provider const& provider)
    -> std::optional<ProviderConstructor>;

[[nodiscard]] auto ProviderToJson(Provider const& provider) -> nlohmann::json;

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_HPP
