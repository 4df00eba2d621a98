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

#ifndef INCLUDED_SRC_TARGETSEAL_ANALYSIS_TEST_PROVIDER_HPP
#define INCLUDED_SRC_TARGETSEAL_ANALYSIS_TEST_PROVIDER_HPP

#include "gsl/gsl"
#include "src/targetseal/analysis/rule_context.hpp"
#include "src/targetseal/providers/provider.hpp"
#include "src/targetseal/providers/provider_map.hpp"
#include "src/targetseal/testing/test_params.hpp"

namespace TargetSeal {

/// \brief Create the test provider of a test target from its attributes and
/// the providers added so far. Invalid shard counts are reported as
/// attribute errors and kept.
/// \pre files_to_run carries the runfiles support of the target.
[[nodiscard]] auto InitializeTestProvider(
    gsl::not_null<RuleContext*> const& context,
    ProviderMapBuilder const& providers,
    FilesToRunProvider const& files_to_run) -> TestProvider;

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ANALYSIS_TEST_PROVIDER_HPP
