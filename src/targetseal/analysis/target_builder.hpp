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

#ifndef INCLUDED_SRC_TARGETSEAL_ANALYSIS_TARGET_BUILDER_HPP
#define INCLUDED_SRC_TARGETSEAL_ANALYSIS_TARGET_BUILDER_HPP

#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>  // std::move
#include <variant>
#include <vector>

#include "gsl/gsl"
#include "src/targetseal/analysis/assembly_error.hpp"
#include "src/targetseal/analysis/configured_target.hpp"
#include "src/targetseal/analysis/rule_context.hpp"
#include "src/targetseal/collections/artifact_set.hpp"
#include "src/targetseal/common/artifact.hpp"
#include "src/targetseal/providers/declared_info.hpp"
#include "src/targetseal/providers/output_groups.hpp"
#include "src/targetseal/providers/provider.hpp"
#include "src/targetseal/providers/provider_map.hpp"
#include "src/targetseal/providers/runfiles.hpp"
#include "src/targetseal/values/variant_value.hpp"
#include "src/utils/cpp/expected.hpp"

namespace TargetSeal {

/// \brief Assembles the sealed result of a rule target. The rule
/// implementation feeds providers, files, and output groups; Build() adds
/// the providers every target has, checks constraints, creates the test
/// provider for tests, and claims the registered actions.
///
/// Every target starts with a LicensesProvider and a VisibilityProvider
/// taken from its attributes.
class TargetBuilder {
  public:
    using result_t = expected<std::monostate, AssemblyError>;

    explicit TargetBuilder(gsl::not_null<RuleContext*> const& context);

    [[nodiscard]] auto AddProvider(ProviderPtr const& provider) -> result_t;

    template <class T>
    requires(std::is_constructible_v<Provider, T>)
        [[nodiscard]] auto AddProvider(T provider) -> result_t {
        return AddProvider(MakeProvider(std::move(provider)));
    }

    [[nodiscard]] auto AddProviders(std::vector<ProviderPtr> const& providers)
        -> result_t;
    [[nodiscard]] auto AddProviders(ProviderMap const& providers) -> result_t;

    /// \brief Add a declared provider of a built-in rule. If the provider
    /// has a legacy name, it is also made available under that name, unless
    /// the name is taken.
    [[nodiscard]] auto AddNativeDeclaredProvider(ProviderPtr const& provider)
        -> result_t;

    /// \brief Add a provider declared in the extension language. Instances
    /// of OutputGroupInfo are not stored; their fields are added as output
    /// groups instead.
    [[nodiscard]] auto AddDeclaredProvider(StructProvider provider)
        -> result_t;

    /// \brief Add a value under a dynamic name.
    [[nodiscard]] auto AddDynamicValue(std::string const& name,
                                       VariantValuePtr value) -> result_t;

    auto SetRunfilesSupport(RunfilesSupport runfiles_support,
                            Artifact executable) -> TargetBuilder&;
    auto SetFilesToBuild(ArtifactSet files_to_build) -> TargetBuilder&;

    /// \brief Additional files needed to run the target. Files to build and
    /// runfiles middlemen are added automatically.
    auto AddFilesToRun(ArtifactSet const& files) -> TargetBuilder&;

    auto AddOutputGroup(std::string const& name, ArtifactSet const& artifacts)
        -> TargetBuilder&;
    auto AddOutputGroup(std::string const& name, Artifact artifact)
        -> TargetBuilder&;
    auto AddOutputGroups(std::map<std::string, ArtifactSet> const& groups)
        -> TargetBuilder&;

    /// \brief Seal the result.
    /// \returns the configured target, nullptr if errors were reported for
    /// the target before sealing, or the error that prevented sealing.
    [[nodiscard]] auto Build() && -> expected<ConfiguredTargetPtr,
                                              AssemblyError>;

  private:
    gsl::not_null<RuleContext*> context_;
    ProviderMapBuilder providers_{};
    OutputGroupsBuilder output_groups_{};
    ArtifactSet files_to_build_{};
    ArtifactSetBuilder files_to_run_{};
    std::optional<RunfilesSupport> runfiles_support_{};
    std::optional<Artifact> executable_{};

    [[nodiscard]] auto Put(ProviderPtr const& provider) -> result_t;
    [[nodiscard]] auto RunfilesMiddlemen() const -> ArtifactSet;
    void AddHiddenTopLevelGroup(ArtifactSet const& runfiles_middlemen);
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ANALYSIS_TARGET_BUILDER_HPP
