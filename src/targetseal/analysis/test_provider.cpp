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

#include "src/targetseal/analysis/test_provider.hpp"

#include "fmt/core.h"

namespace TargetSeal {

auto InitializeTestProvider(gsl::not_null<RuleContext*> const& context,
                            ProviderMapBuilder const& providers,
                            FilesToRunProvider const& files_to_run)
    -> TestProvider {
    Expects(files_to_run.runfiles_support.has_value());
    auto const& attributes = context->Attributes();
    auto const shard_count = attributes.shard_count;
    if (shard_count < 0 and attributes.shard_count_explicit) {
        context->AttributeError("shard_count", "Must not be negative.");
    }
    if (shard_count > kMaxShardCount) {
        context->AttributeError(
            "shard_count",
            fmt::format("Having more than {} shards is indicative of poor "
                        "test organization. Please reduce the number of "
                        "shards.",
                        kMaxShardCount));
    }

    TestParamsBuilder builder{};
    builder.SetInstrumentedFiles(providers.Get<InstrumentedFilesInfo>());
    if (auto const* environment = providers.Get<TestEnvironmentInfo>()) {
        builder.AddExtraEnv(environment->environment);
    }
    builder.SetFilesToRun(files_to_run.files_to_run,
                          *files_to_run.runfiles_support)
        .SetTags(attributes.tags)
        .SetExecutionRequirements(providers.Get<ExecutionInfo>())
        .SetShardCount(shard_count);
    return TestProvider{.params = builder.Build(), .tags = attributes.tags};
}

}  // namespace TargetSeal
