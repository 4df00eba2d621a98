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

#include <map>
#include <string>
#include <vector>

#include "catch2/catch.hpp"
#include "src/targetseal/collections/artifact_set.hpp"
#include "src/targetseal/providers/declared_info.hpp"
#include "src/targetseal/providers/runfiles.hpp"
#include "src/targetseal/testing/test_params.hpp"
#include "test/utils/fixtures.hpp"

using TargetSeal::ExecutionInfo;
using TargetSeal::ExecutionRequirements;
using TargetSeal::ExecutionRequirementsFromTags;
using TargetSeal::InstrumentedFilesInfo;
using TargetSeal::TestParamsBuilder;

TEST_CASE("Execution requirements from tags", "[test_params]") {
    auto const requirements = ExecutionRequirementsFromTags(
        {"local", "manual", "no-remote", "requires-network", "supports-workers",
         "disable-sandbox", "cpu:4", "no-", "flaky", "block-network"});
    CHECK(requirements == ExecutionRequirements{{"block-network", ""},
                                                {"cpu:4", ""},
                                                {"disable-sandbox", ""},
                                                {"local", ""},
                                                {"no-remote", ""},
                                                {"requires-network", ""},
                                                {"supports-workers", ""}});
    CHECK(ExecutionRequirementsFromTags({}).empty());
}

TEST_CASE("Build test parameters", "[test_params]") {
    auto const middleman = MakeDerived("bin/test.runfiles_manifest");
    TestParamsBuilder builder{};
    builder.SetShardCount(3)
        .SetTags({"no-remote", "smoke"})
        .SetFilesToRun(TargetSeal::ArtifactSet::Leaf({MakeDerived("bin/test")}),
                       TargetSeal::RunfilesSupport{.middleman = middleman})
        .AddExtraEnv({{"HOME", "/tmp"}, {"LANG", "C"}})
        .AddExtraEnv({{"LANG", "C.UTF-8"}});

    SECTION("without explicit requirements") {
        auto const params = builder.Build();
        CHECK(params.shard_count == 3);
        CHECK(params.execution_requirements ==
              ExecutionRequirements{{"no-remote", ""}});
        CHECK(params.extra_env ==
              std::map<std::string, std::string>{{"HOME", "/tmp"},
                                                 {"LANG", "C.UTF-8"}});
        CHECK_FALSE(params.instrumented_files);
        REQUIRE(params.runfiles_middleman);
        CHECK(*params.runfiles_middleman == middleman);
        CHECK(params.files_to_run.Size() == 1);
    }

    SECTION("explicit requirements take precedence") {
        auto const info = ExecutionInfo{
            .requirements = {{"no-remote", "1"}, {"gpu", "nvidia"}}};
        auto const params = builder.SetExecutionRequirements(&info).Build();
        CHECK(params.execution_requirements ==
              ExecutionRequirements{{"gpu", "nvidia"}, {"no-remote", "1"}});
    }

    SECTION("instrumented files") {
        auto const info = InstrumentedFilesInfo{
            .instrumented_files =
                TargetSeal::ArtifactSet::Leaf({MakeSource("lib.cpp")})};
        auto const params = builder.SetInstrumentedFiles(&info).Build();
        REQUIRE(params.instrumented_files);
        CHECK(params.instrumented_files->instrumented_files.Size() == 1);
        CHECK(params.ToJson().contains("instrumented_files"));
    }

    SECTION("out of range shard counts are kept") {
        CHECK(builder.SetShardCount(-1).Build().shard_count == -1);
        CHECK(builder.SetShardCount(51).Build().shard_count == 51);
    }
}
