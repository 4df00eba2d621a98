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

#ifndef INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_KEY_HPP
#define INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_KEY_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/targetseal/common/label.hpp"
#include "src/utils/cpp/hash_combine.hpp"

namespace TargetSeal {

/// \brief Providers known to the analysis core, each with a fixed key.
enum class ProviderKind : std::uint8_t {
    kFile,
    kFilesToRun,
    kRunfiles,
    kLicenses,
    kVisibility,
    kSupportedEnvironments,
    kTest,
    kInstrumentedFiles,
    kTestEnvironment,
    kExecutionInfo,
    kOutputGroupInfo
};

/// \brief Key of a provider declared in the extension language: the label
/// of the defining file plus the exported name.
struct DeclaredProviderKey {
    Label origin;
    std::string name;

    [[nodiscard]] auto operator<=>(DeclaredProviderKey const&) const =
        default;
};

/// \brief Key of a provider map entry: a built-in kind, a declared provider,
/// or a plain dynamic name.
using ProviderKey =
    std::variant<ProviderKind, DeclaredProviderKey, std::string>;

[[nodiscard]] static inline auto ProviderKindToString(ProviderKind kind)
    -> std::string {
    switch (kind) {
        case ProviderKind::kFile:
            return "FileProvider";
        case ProviderKind::kFilesToRun:
            return "FilesToRunProvider";
        case ProviderKind::kRunfiles:
            return "RunfilesProvider";
        case ProviderKind::kLicenses:
            return "LicensesProvider";
        case ProviderKind::kVisibility:
            return "VisibilityProvider";
        case ProviderKind::kSupportedEnvironments:
            return "SupportedEnvironmentsProvider";
        case ProviderKind::kTest:
            return "TestProvider";
        case ProviderKind::kInstrumentedFiles:
            return "InstrumentedFilesInfo";
        case ProviderKind::kTestEnvironment:
            return "TestEnvironmentInfo";
        case ProviderKind::kExecutionInfo:
            return "ExecutionInfo";
        case ProviderKind::kOutputGroupInfo:
            return "OutputGroupInfo";
    }
    Ensures(false);  // unreachable
}

[[nodiscard]] static inline auto ProviderKeyToString(ProviderKey const& key)
    -> std::string {
    if (auto const* kind = std::get_if<ProviderKind>(&key)) {
        return ProviderKindToString(*kind);
    }
    if (auto const* declared = std::get_if<DeclaredProviderKey>(&key)) {
        return fmt::format(
            "{}%{}", declared->origin.ToString(), declared->name);
    }
    return fmt::format("'{}'", std::get<std::string>(key));
}

}  // namespace TargetSeal

namespace std {
template <>
struct hash<TargetSeal::DeclaredProviderKey> {
    [[nodiscard]] auto operator()(
        TargetSeal::DeclaredProviderKey const& k) const noexcept
        -> std::size_t {
        std::size_t seed{};
        hash_combine(&seed, k.origin);
        hash_combine(&seed, k.name);
        return seed;
    }
};
}  // namespace std

#endif  // INCLUDED_SRC_TARGETSEAL_PROVIDERS_PROVIDER_KEY_HPP
