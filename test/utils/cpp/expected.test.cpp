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

#include "src/utils/cpp/expected.hpp"

#include <string>

#include "catch2/catch.hpp"

namespace {

[[nodiscard]] auto ParseDigit(char c) -> expected<int, std::string> {
    if (c < '0' or c > '9') {
        return unexpected{std::string{"not a digit: "} + c};
    }
    return c - '0';
}

}  // namespace

TEST_CASE("Value or error", "[expected]") {
    auto const digit = ParseDigit('7');
    REQUIRE(digit);
    CHECK(*digit == 7);
    CHECK(digit.value_or(0) == 7);

    auto const error = ParseDigit('x');
    REQUIRE_FALSE(error);
    CHECK(error.error() == "not a digit: x");
    CHECK(error.value_or(-1) == -1);
}

TEST_CASE("Chaining", "[expected]") {
    auto twice = [](int value) -> expected<int, std::string> {
        if (value > 4) {
            return unexpected<std::string>{"overflow"};
        }
        return 2 * value;
    };

    CHECK(*ParseDigit('3').and_then(twice) == 6);
    CHECK(ParseDigit('5').and_then(twice).error() == "overflow");
    CHECK(ParseDigit('x').and_then(twice).error() == "not a digit: x");

    auto const text = ParseDigit('4').transform(
        [](int value) { return std::to_string(value); });
    REQUIRE(text);
    CHECK(*text == "4");

    auto const length = ParseDigit('x').transform_error(
        [](std::string const& message) { return message.size(); });
    REQUIRE_FALSE(length);
    CHECK(length.error() == 14U);
}
