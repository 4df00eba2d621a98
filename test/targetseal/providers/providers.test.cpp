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

#include <string>
#include <variant>
#include <vector>

#include "catch2/catch.hpp"
#include "src/targetseal/collections/artifact_set.hpp"
#include "src/targetseal/providers/output_groups.hpp"
#include "src/targetseal/providers/provider.hpp"
#include "src/targetseal/providers/provider_key.hpp"
#include "src/targetseal/providers/provider_map.hpp"
#include "src/targetseal/values/variant_value.hpp"
#include "test/utils/fixtures.hpp"

using namespace TargetSeal;  // NOLINT

TEST_CASE("Provider keys are unique", "[provider_map]") {
    ProviderMapBuilder builder{};
    REQUIRE(builder.Put(LicensesProvider{.licenses = {"notice"}}));
    REQUIRE(builder.Put(VisibilityProvider{}));

    SECTION("repeated built-in key") {
        auto result = builder.Put(LicensesProvider{});
        REQUIRE_FALSE(result);
        CHECK(result.error().find("LicensesProvider") != std::string::npos);
        auto const* licenses = builder.Get<LicensesProvider>();
        REQUIRE(licenses != nullptr);
        CHECK(licenses->licenses == std::vector<std::string>{"notice"});
    }

    SECTION("repeated dynamic name") {
        REQUIRE(builder.Put("info", VariantValue::OfInt(1)));
        CHECK_FALSE(builder.Put("info", VariantValue::OfInt(2)));
        // a dynamic name never collides with a built-in key
        CHECK(builder.Put("LicensesProvider", VariantValue::OfInt(3)));
    }

    SECTION("repeated declared provider") {
        auto const key = DeclaredProviderKey{MakeLabel("//defs:info"), "Info"};
        auto const provider =
            StructProvider{.constructor = {.key = key},
                           .value = VariantValue::OfString("x")};
        REQUIRE(builder.Put(provider));
        CHECK_FALSE(builder.Put(provider));
        CHECK(builder.Put(StructProvider{
            .constructor = {.key = DeclaredProviderKey{MakeLabel("//defs:info"),
                                                       "Other"}}}));
    }

    SECTION("absent values") {
        CHECK_FALSE(builder.Put(ProviderPtr{}));
        CHECK_FALSE(builder.Put("name", VariantValuePtr{}));
    }
}

TEST_CASE("Sealed provider map", "[provider_map]") {
    auto const key = DeclaredProviderKey{MakeLabel("//defs:info"), "Info"};
    ProviderMapBuilder builder{};
    REQUIRE(builder.Put(FileProvider{
        .files_to_build = ArtifactSet::Leaf({MakeSource("a")})}));
    REQUIRE(builder.Put(StructProvider{.constructor = {.key = key}}));
    REQUIRE(builder.Put("answer", VariantValue::OfInt(42)));
    auto const map = builder.Build();

    // builder may be reused without affecting the sealed map
    REQUIRE(builder.Put(LicensesProvider{}));

    CHECK(map.Size() == 3);
    CHECK(map.Get<LicensesProvider>() == nullptr);
    REQUIRE(map.Get<FileProvider>() != nullptr);
    CHECK(map.Get<FileProvider>()->files_to_build.Size() == 1);
    CHECK(map.GetDeclared(key) != nullptr);
    CHECK(map.GetDeclared(DeclaredProviderKey{key.origin, "Other"}) ==
          nullptr);
    auto const* answer = map.GetDynamic("answer");
    REQUIRE(answer != nullptr);
    CHECK(std::get<VariantValuePtr>(*answer)->Int() == 42);
    CHECK(map.GetDynamic("question") == nullptr);

    SECTION("insertion order") {
        auto const& entries = map.Entries();
        REQUIRE(entries.size() == 3);
        CHECK(std::holds_alternative<ProviderKind>(entries[0].first));
        CHECK(std::holds_alternative<DeclaredProviderKey>(entries[1].first));
        CHECK(std::holds_alternative<std::string>(entries[2].first));
    }

    SECTION("copy into another builder") {
        ProviderMapBuilder other{};
        REQUIRE(other.Put("answer", VariantValue::OfInt(0)));
        CHECK_FALSE(other.PutAll(map));

        ProviderMapBuilder fresh{};
        REQUIRE(fresh.PutAll(map));
        CHECK(fresh.Build().Size() == 3);
    }

    SECTION("JSON rendering") {
        auto json = map.ToJson();
        CHECK(json.contains("FileProvider"));
        CHECK(json["'answer'"] == 42);
    }
}

TEST_CASE("Output groups", "[output_groups]") {
    OutputGroupsBuilder builder{};
    CHECK(builder.IsEmpty());

    builder.Merge("coverage", ArtifactSet::Leaf({MakeSource("a.gcno")}));
    builder.Merge("coverage", MakeSource("b.gcno"));
    builder.Merge("debug", ArtifactSet::Leaf({MakeSource("a.dwo")}));
    builder.MergeAll({{"debug", ArtifactSet::Leaf({MakeSource("b.dwo")})}});
    auto const groups = builder.Build();

    CHECK(groups.Names() == std::vector<std::string>{"coverage", "debug"});
    CHECK(ArtifactPaths(groups.Get("coverage")) ==
          std::vector<std::string>{"a.gcno", "b.gcno"});
    CHECK(ArtifactPaths(groups.Get("debug")) ==
          std::vector<std::string>{"a.dwo", "b.dwo"});

    SECTION("unknown names") {
        CHECK_FALSE(groups.Contains("other"));
        CHECK(groups.Get("other").IsEmpty());
        CHECK(groups.Size() == 2);
    }
}
