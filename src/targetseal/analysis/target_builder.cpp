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

#include "src/targetseal/analysis/target_builder.hpp"

#include <memory>

#include "fmt/core.h"
#include "src/targetseal/actions/generating_actions.hpp"
#include "src/targetseal/analysis/constraint_check.hpp"
#include "src/targetseal/analysis/test_provider.hpp"
#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/logger.hpp"

namespace TargetSeal {

namespace {

[[nodiscard]] auto ToAssemblyError(
    expected<std::monostate, std::string> const& result)
    -> TargetBuilder::result_t {
    if (not result) {
        return unexpected{AssemblyError::Invariant(result.error())};
    }
    return std::monostate{};
}

}  // namespace

TargetBuilder::TargetBuilder(gsl::not_null<RuleContext*> const& context)
    : context_{context} {
    auto const& attributes = context_->Attributes();
    auto licenses =
        Put(MakeProvider(LicensesProvider{.licenses = attributes.licenses}));
    auto visibility = Put(
        MakeProvider(VisibilityProvider{.visibility = attributes.visibility}));
    Ensures(licenses and visibility);
}

auto TargetBuilder::AddProvider(ProviderPtr const& provider) -> result_t {
    return Put(provider);
}

auto TargetBuilder::AddProviders(std::vector<ProviderPtr> const& providers)
    -> result_t {
    return ToAssemblyError(providers_.PutAll(providers));
}

auto TargetBuilder::AddProviders(ProviderMap const& providers) -> result_t {
    return ToAssemblyError(providers_.PutAll(providers));
}

auto TargetBuilder::AddNativeDeclaredProvider(ProviderPtr const& provider)
    -> result_t {
    if (not provider) {
        return unexpected{
            AssemblyError::Invariant("Cannot add absent declared provider")};
    }
    auto constructor = ConstructorOf(*provider);
    if (not constructor) {
        return unexpected{AssemblyError::Invariant(
            fmt::format("{} is not a declared provider",
                        ProviderKeyToString(KeyOf(*provider))))};
    }
    if (not constructor->exported) {
        return unexpected{AssemblyError::Invariant(
            fmt::format("Constructor of declared provider {} is not exported",
                        ProviderKeyToString(constructor->key)))};
    }
    auto result = Put(provider);
    if (not result) {
        return result;
    }
    if (constructor->legacy_name) {
        auto const& name = *constructor->legacy_name;
        if (providers_.Contains(ProviderKey{name})) {
            Logger::Log(LogLevel::Debug,
                        "Not adding {} to {} under legacy name {}, the name is "
                        "already taken",
                        ProviderKeyToString(constructor->key),
                        context_->GetLabel().ToString(),
                        name);
        }
        else {
            return ToAssemblyError(providers_.Put(name, provider));
        }
    }
    return std::monostate{};
}

auto TargetBuilder::AddDeclaredProvider(StructProvider provider) -> result_t {
    auto const& constructor = provider.constructor;
    if (not constructor.exported) {
        return unexpected{AssemblyError::Export(
            constructor.location.empty()
                ? std::string{"All providers must be top level values"}
                : fmt::format("{}: All providers must be top level values",
                              constructor.location))};
    }
    if (provider.value == nullptr) {
        return unexpected{AssemblyError::Invariant(
            fmt::format("Declared provider {} has no value",
                        ProviderKeyToString(provider.Key())))};
    }
    if (provider.Key() == ProviderKey{OutputGroupInfo::kKind}) {
        if (not provider.value->IsStruct()) {
            return unexpected{AssemblyError::Invariant(fmt::format(
                "OutputGroupInfo must be a struct, but found {}",
                provider.value->TypeString()))};
        }
        for (auto const& [name, value] : provider.value->Fields()) {
            auto artifacts = value->ToArtifacts();
            if (not artifacts) {
                context_->RuleError(
                    fmt::format("Output group {} is invalid:\n{}",
                                name,
                                artifacts.error()));
                continue;
            }
            output_groups_.Merge(name, ArtifactSet::Leaf(*artifacts));
        }
        return std::monostate{};
    }
    return Put(MakeProvider(std::move(provider)));
}

auto TargetBuilder::AddDynamicValue(std::string const& name,
                                    VariantValuePtr value) -> result_t {
    return ToAssemblyError(providers_.Put(name, std::move(value)));
}

auto TargetBuilder::SetRunfilesSupport(RunfilesSupport runfiles_support,
                                       Artifact executable) -> TargetBuilder& {
    runfiles_support_ = std::move(runfiles_support);
    executable_ = std::move(executable);
    return *this;
}

auto TargetBuilder::SetFilesToBuild(ArtifactSet files_to_build)
    -> TargetBuilder& {
    files_to_build_ = std::move(files_to_build);
    return *this;
}

auto TargetBuilder::AddFilesToRun(ArtifactSet const& files) -> TargetBuilder& {
    files_to_run_.AddTransitive(files);
    return *this;
}

auto TargetBuilder::AddOutputGroup(std::string const& name,
                                   ArtifactSet const& artifacts)
    -> TargetBuilder& {
    output_groups_.Merge(name, artifacts);
    return *this;
}

auto TargetBuilder::AddOutputGroup(std::string const& name, Artifact artifact)
    -> TargetBuilder& {
    output_groups_.Merge(name, std::move(artifact));
    return *this;
}

auto TargetBuilder::AddOutputGroups(
    std::map<std::string, ArtifactSet> const& groups) -> TargetBuilder& {
    output_groups_.MergeAll(groups);
    return *this;
}

auto TargetBuilder::Build() && -> expected<ConfiguredTargetPtr,
                                           AssemblyError> {
    auto const& label = context_->GetLabel();
    auto fail = [&label](AssemblyError error)
        -> expected<ConfiguredTargetPtr, AssemblyError> {
        Logger::Log(LogLevel::Error,
                    "Sealing analysis result of {} failed:\n{}",
                    label.ToString(),
                    error.Message());
        return unexpected{std::move(error)};
    };

    if (auto environments = CheckConstraints(context_)) {
        auto result = Put(MakeProvider(*std::move(environments)));
        if (not result) {
            return fail(std::move(result).error());
        }
    }
    if (context_->HasErrors()) {
        Logger::Log(LogLevel::Debug,
                    "Not sealing {}, {} error(s) were reported",
                    label.ToString(),
                    context_->NumErrors());
        return ConfiguredTargetPtr{nullptr};
    }

    auto const runfiles_middlemen = RunfilesMiddlemen();
    files_to_run_.AddTransitive(files_to_build_);
    files_to_run_.AddTransitive(runfiles_middlemen);
    auto const files_to_run =
        FilesToRunProvider{.files_to_run = files_to_run_.Build(),
                           .runfiles_support = runfiles_support_,
                           .executable = executable_};
    for (auto const& provider :
         {MakeProvider(FileProvider{.files_to_build = files_to_build_}),
          MakeProvider(files_to_run)}) {
        auto result = Put(provider);
        if (not result) {
            return fail(std::move(result).error());
        }
    }

    AddHiddenTopLevelGroup(runfiles_middlemen);

    if (context_->RuleClass().is_test) {
        if (not runfiles_support_) {
            return fail(AssemblyError::Invariant(fmt::format(
                "Test target {} has no runfiles support", label.ToString())));
        }
        auto result = Put(MakeProvider(
            InitializeTestProvider(context_, providers_, files_to_run)));
        if (not result) {
            return fail(std::move(result).error());
        }
    }

    if (not output_groups_.IsEmpty()) {
        auto result = AddNativeDeclaredProvider(
            MakeProvider(OutputGroupInfo{.groups = output_groups_.Build()}));
        if (not result) {
            return fail(std::move(result).error());
        }
    }

    auto providers = providers_.Build();

    // last step, as adding providers may register further actions
    auto actions = FilterSharedActionsAndDetectConflicts(
        context_->Registry(), context_->RegisteredActions());
    if (not actions) {
        return fail(AssemblyError::Conflict(std::move(actions).error()));
    }

    Logger::Log(LogLevel::Trace,
                "Sealed {} with {} provider(s) and {} action(s)",
                label.ToString(),
                providers.Size(),
                actions->actions.size());
    return std::make_shared<ConfiguredTarget const>(
        label, std::move(providers), *std::move(actions));
}

auto TargetBuilder::Put(ProviderPtr const& provider) -> result_t {
    return ToAssemblyError(providers_.Put(provider));
}

auto TargetBuilder::RunfilesMiddlemen() const -> ArtifactSet {
    ArtifactSetBuilder middlemen{Order::kStable};
    if (runfiles_support_) {
        middlemen.Add(runfiles_support_->middleman);
        middlemen.AddTransitive(runfiles_support_->runfiles.extra_middlemen);
    }
    return middlemen.Build();
}

void TargetBuilder::AddHiddenTopLevelGroup(
    ArtifactSet const& runfiles_middlemen) {
    if (runfiles_support_) {
        // build the runfiles of binaries, too
        output_groups_.Merge(kHiddenTopLevelGroup, runfiles_middlemen);
    }
    else if (auto const* runfiles = providers_.Get<RunfilesProvider>()) {
        // Best effort to report broken runfiles of non-binary rules. Data
        // runfiles are not considered.
        output_groups_.Merge(kHiddenTopLevelGroup,
                             runfiles->default_runfiles.artifacts);
    }
}

}  // namespace TargetSeal
