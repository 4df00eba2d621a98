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

#ifndef INCLUDED_SRC_TARGETSEAL_PROVIDERS_DECLARED_INFO_HPP
#define INCLUDED_SRC_TARGETSEAL_PROVIDERS_DECLARED_INFO_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>  // std::move

#include "src/targetseal/collections/artifact_set.hpp"
#include "src/targetseal/providers/output_groups.hpp"
#include "src/targetseal/providers/provider_key.hpp"
#include "src/targetseal/values/variant_value.hpp"

namespace TargetSeal {

/// \brief The callable that creates instances of a declared provider. Only
/// constructors bound to a top-level name (exported) may be used for
/// providers of a target.
struct ProviderConstructor {
    ProviderKey key;
    bool exported{true};
    std::optional<std::string> legacy_name{};
    std::string location{};
};

/// \brief Sources and metadata relevant for coverage collection.
struct InstrumentedFilesInfo {
    static constexpr auto kKind = ProviderKind::kInstrumentedFiles;
    [[nodiscard]] static auto Constructor() -> ProviderConstructor const& {
        static ProviderConstructor const kConstructor{
            .key = kKind, .legacy_name = "instrumented_files"};
        return kConstructor;
    }

    ArtifactSet instrumented_files{};
    ArtifactSet metadata_files{};
};

/// \brief Extra environment variables for running a test.
struct TestEnvironmentInfo {
    static constexpr auto kKind = ProviderKind::kTestEnvironment;
    [[nodiscard]] static auto Constructor() -> ProviderConstructor const& {
        static ProviderConstructor const kConstructor{.key = kKind};
        return kConstructor;
    }

    std::map<std::string, std::string> environment{};
};

/// \brief Requirements on the machine executing the target's actions.
struct ExecutionInfo {
    static constexpr auto kKind = ProviderKind::kExecutionInfo;
    [[nodiscard]] static auto Constructor() -> ProviderConstructor const& {
        static ProviderConstructor const kConstructor{.key = kKind};
        return kConstructor;
    }

    std::map<std::string, std::string> requirements{};
};

/// \brief Output groups of a target, as seen by its dependents.
struct OutputGroupInfo {
    static constexpr auto kKind = ProviderKind::kOutputGroupInfo;
    [[nodiscard]] static auto Constructor() -> ProviderConstructor const& {
        static ProviderConstructor const kConstructor{
            .key = kKind, .legacy_name = "output_groups"};
        return kConstructor;
    }

    OutputGroups groups{};
};

/// \brief Instance of a provider declared in the extension language: a
/// struct value together with the constructor that created it.
struct StructProvider {
    ProviderConstructor constructor;
    VariantValuePtr value{VariantValue::None()};

    [[nodiscard]] auto Key() const& noexcept -> ProviderKey const& {
        return constructor.key;
    }
    /// \brief Field of the underlying struct, if the value is a struct that
    /// has it.
    [[nodiscard]] auto Field(std::string const& name) const
        -> std::optional<VariantValuePtr> {
        if (not value->IsStruct()) {
            return std::nullopt;
        }
        return value->Field(name);
    }
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_PROVIDERS_DECLARED_INFO_HPP
