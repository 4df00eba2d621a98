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

#include "catch2/catch.hpp"
#include "nlohmann/json.hpp"
#include "src/targetseal/values/variant_value.hpp"
#include "test/utils/fixtures.hpp"

using TargetSeal::VariantValue;

TEST_CASE("Scalar values", "[variant_value]") {
    auto str = VariantValue::OfString("foo");
    auto num = VariantValue::OfInt(42);
    auto label = VariantValue::OfLabel(MakeLabel("//foo:bar"));

    CHECK(VariantValue::None()->IsNone());
    CHECK(str->IsString());
    CHECK(str->String() == "foo");
    CHECK(num->Int() == 42);
    CHECK(label->AsLabel().Name() == "bar");
    CHECK(VariantValue::OfBool(true)->Bool());

    SECTION("throwing accessors") {
        CHECK_THROWS_AS(str->Int(), VariantValue::TypeError);
        CHECK_THROWS_AS(num->String(), VariantValue::TypeError);
        CHECK_THROWS_AS(label->List(), VariantValue::TypeError);
        CHECK(num->TypeString() == "int");
    }

    SECTION("labels differ from strings") {
        CHECK_FALSE(*VariantValue::OfString("//foo:bar") == *label);
        CHECK(*label == *VariantValue::OfLabel(MakeLabel("//foo:bar")));
    }
}

TEST_CASE("Composite values are validated on creation", "[variant_value]") {
    auto a = VariantValue::OfArtifact(MakeSource("a"));
    auto b = VariantValue::OfArtifact(MakeSource("b"));

    SECTION("lists") {
        CHECK(VariantValue::MakeList({a, b}));
        CHECK_FALSE(VariantValue::MakeList({a, nullptr}));
    }

    SECTION("sets drop duplicates") {
        auto set = VariantValue::MakeSet(
            {a, b, VariantValue::OfArtifact(MakeSource("a"))});
        REQUIRE(set);
        CHECK((*set)->Set().size() == 2);
    }

    SECTION("sets require hashable items") {
        auto list = VariantValue::MakeList({a});
        REQUIRE(list);
        CHECK_FALSE(VariantValue::MakeSet({*list}));
        CHECK_FALSE(VariantValue::MakeSet({nullptr}));
    }

    SECTION("structs require identifiers as field names") {
        CHECK(VariantValue::MakeStruct({{"files", a}, {"_x1", b}}));
        CHECK_FALSE(VariantValue::MakeStruct({{"1x", a}}));
        CHECK_FALSE(VariantValue::MakeStruct({{"a-b", a}}));
        CHECK_FALSE(VariantValue::MakeStruct({{"x", nullptr}}));
    }

    SECTION("maps require non-empty keys") {
        CHECK(VariantValue::MakeMap({{"a-b", a}}));
        CHECK_FALSE(VariantValue::MakeMap({{"", a}}));
    }

    SECTION("artifacts of lists and sets") {
        auto list = VariantValue::MakeList({a, b});
        REQUIRE(list);
        auto artifacts = (*list)->ToArtifacts();
        REQUIRE(artifacts);
        CHECK(artifacts->size() == 2);

        auto mixed = VariantValue::MakeList({a, VariantValue::OfInt(1)});
        REQUIRE(mixed);
        CHECK_FALSE((*mixed)->ToArtifacts());
        CHECK_FALSE(a->ToArtifacts());
    }
}

TEST_CASE("Values from JSON", "[variant_value]") {
    SECTION("nested value") {
        auto json = R"({"type": "STRUCT", "data": {
            "srcs": [{"type": "SOURCE", "data": {"path": "foo/a.cpp"}}],
            "deps": {"type": "SET", "data": [
                {"type": "LABEL", "data": "//foo:bar"},
                {"type": "LABEL", "data": "//foo:bar"}]},
            "opts": {"type": "MAP", "data": {"O": 2, "debug": true}},
            "name": "lib",
            "extra": null}})"_json;
        auto value = VariantValue::FromJson(json);
        REQUIRE(value);
        REQUIRE((*value)->IsStruct());
        auto srcs = (*value)->Field("srcs");
        REQUIRE(srcs);
        CHECK((*srcs)->List().at(0)->AsArtifact().ExecPath() == "foo/a.cpp");
        CHECK((*(*value)->Field("deps"))->Set().size() == 1);
        CHECK((*(*value)->Field("opts"))->Map().at("O")->Int() == 2);
        CHECK((*(*value)->Field("extra"))->IsNone());
        CHECK_FALSE((*value)->Field("missing"));

        auto again = VariantValue::FromJson((*value)->ToJson());
        REQUIRE(again);
        CHECK(**again == **value);
    }

    SECTION("invalid values") {
        CHECK_FALSE(VariantValue::FromJson(1.5));
        CHECK_FALSE(VariantValue::FromJson(R"({"foo": 1})"_json));
        CHECK_FALSE(VariantValue::FromJson(
            R"({"type": "SET", "data": [[1]]})"_json));
        CHECK_FALSE(VariantValue::FromJson(
            R"({"type": "STRUCT", "data": {"not valid": 1}})"_json));
        CHECK_FALSE(VariantValue::FromJson(
            R"({"type": "LABEL", "data": "foo"})"_json));
    }
}
