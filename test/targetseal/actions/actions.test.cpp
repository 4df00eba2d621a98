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

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include "catch2/catch.hpp"
#include "src/targetseal/actions/action_conflict.hpp"
#include "src/targetseal/actions/action_registry.hpp"
#include "src/targetseal/actions/generating_actions.hpp"
#include "test/utils/fixtures.hpp"

using TargetSeal::ActionConflict;
using TargetSeal::ActionRegistry;
using TargetSeal::FilterSharedActionsAndDetectConflicts;

TEST_CASE("Register actions", "[action_registry]") {
    ActionRegistry registry{1};
    auto const compile = MakeAction("//foo:a", "Compile", {"out/a.o"});

    auto first = registry.Register(compile);
    REQUIRE(first);
    CHECK(*first == compile);
    CHECK(registry.Size() == 1);
    CHECK(registry.GeneratingAction("out/a.o") == compile);
    CHECK(registry.GeneratingAction("out/b.o") == nullptr);

    SECTION("shared action") {
        auto const shared = MakeAction("//foo:b", "Compile", {"out/a.o"});
        auto second = registry.Register(shared);
        REQUIRE(second);
        CHECK(*second == compile);
        CHECK(registry.Size() == 1);
    }

    SECTION("conflicting action") {
        auto const other =
            MakeAction("//foo:b", "Compile", {"out/a.o"}, {{"opt", "-O2"}});
        auto conflict = registry.Register(other);
        REQUIRE_FALSE(conflict);
        auto const& error = conflict.error();
        CHECK(error.Output().ExecPath() == "out/a.o");
        auto const message = error.Message();
        CHECK(message.find("out/a.o") != std::string::npos);
        CHECK(message.find(compile->Id()) != std::string::npos);
        CHECK(message.find(other->Id()) != std::string::npos);
    }
}

TEST_CASE("Failed registration releases its outputs", "[action_registry]") {
    ActionRegistry registry{1};
    auto const b = MakeAction("//b:b", "Gen", {"out/y"});
    auto const a = MakeAction("//a:a", "Gen", {"out/x", "out/y"}, {{"v", 1}});

    REQUIRE(registry.Register(b));
    auto conflict = registry.Register(a);
    REQUIRE_FALSE(conflict);
    CHECK(conflict.error().Output().ExecPath() == "out/y");
    CHECK(registry.GeneratingAction("out/x") == nullptr);
    CHECK(registry.GeneratingAction("out/y") == b);
    CHECK(registry.Size() == 1);

    SECTION("released output can be claimed again") {
        auto const c = MakeAction("//c:c", "Gen", {"out/x"}, {{"v", 2}});
        auto result = registry.Register(c);
        REQUIRE(result);
        CHECK(*result == c);
        CHECK(registry.GeneratingAction("out/x") == c);
    }

    SECTION("through the per-target filter") {
        auto result = FilterSharedActionsAndDetectConflicts(&registry, {a});
        REQUIRE_FALSE(result);
        CHECK(registry.GeneratingAction("out/x") == nullptr);
        CHECK(registry.Size() == 1);
    }
}

TEST_CASE("Conflicts are reported in canonical order", "[action_registry]") {
    auto const a = MakeAction("//foo:a", "Gen", {"out/x"}, {{"v", 1}});
    auto const b = MakeAction("//foo:b", "Gen", {"out/x"}, {{"v", 2}});
    auto const output = MakeDerived("out/x");

    auto const ab = ActionConflict{a, b, output};
    auto const ba = ActionConflict{b, a, output};
    CHECK(ab.First() == ba.First());
    CHECK(ab.Second() == ba.Second());
    CHECK(ab.Message() == ba.Message());
}

TEST_CASE("Filter shared actions", "[generating_actions]") {
    ActionRegistry registry{1};
    auto const compile = MakeAction("//foo:a", "Compile", {"out/a.o"});
    auto const link = MakeAction(
        "//foo:a", "Link", {"out/a", "out/a.map"}, {{"static", true}});

    SECTION("repeated registration is dropped") {
        auto const again = MakeAction("//foo:a", "Compile", {"out/a.o"});
        auto result = FilterSharedActionsAndDetectConflicts(
            &registry, {compile, link, again});
        REQUIRE(result);
        REQUIRE(result->actions.size() == 2);
        CHECK(result->actions[0] == compile);
        CHECK(result->actions[1] == link);
        CHECK(result->generating_action_index.at("out/a.o") == 0);
        CHECK(result->generating_action_index.at("out/a") == 1);
        CHECK(result->generating_action_index.at("out/a.map") == 1);
    }

    SECTION("conflict within a target") {
        auto const other =
            MakeAction("//foo:a", "Compile", {"out/a.o"}, {{"opt", "-O2"}});
        auto result =
            FilterSharedActionsAndDetectConflicts(&registry, {compile, other});
        REQUIRE_FALSE(result);
        CHECK(result.error().Output().ExecPath() == "out/a.o");
    }

    SECTION("conflict releases the claims of the target") {
        REQUIRE(FilterSharedActionsAndDetectConflicts(
            &registry,
            {MakeAction("//foo:b", "Link", {"out/a"}, {{"static", false}})}));
        auto result =
            FilterSharedActionsAndDetectConflicts(&registry, {compile, link});
        REQUIRE_FALSE(result);
        CHECK(result.error().Output().ExecPath() == "out/a");
        CHECK(registry.GeneratingAction("out/a.o") == nullptr);
        CHECK(registry.GeneratingAction("out/a.map") == nullptr);
        CHECK(registry.Size() == 1);
    }

    SECTION("shared action of another target") {
        REQUIRE(FilterSharedActionsAndDetectConflicts(&registry, {compile}));
        auto const shared = MakeAction("//foo:b", "Compile", {"out/a.o"});
        auto result =
            FilterSharedActionsAndDetectConflicts(&registry, {shared});
        REQUIRE(result);
        REQUIRE(result->actions.size() == 1);
        CHECK(result->actions[0] == shared);
    }
}

TEST_CASE("Concurrent registration", "[action_registry]") {
    constexpr std::size_t kThreads = 8;
    constexpr std::size_t kOutputs = 200;
    ActionRegistry registry{kThreads};

    SECTION("shared actions never conflict") {
        std::atomic<std::size_t> failures{};
        std::vector<std::thread> threads{};
        threads.reserve(kThreads);
        for (std::size_t t = 0; t < kThreads; ++t) {
            threads.emplace_back([&registry, &failures, t]() {
                for (std::size_t i = 0; i < kOutputs; ++i) {
                    auto action = MakeAction(
                        "//pkg:t" + std::to_string(t),
                        "Gen",
                        {"out/" + std::to_string(i)});
                    if (not registry.Register(action)) {
                        ++failures;
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        CHECK(failures == 0);
        CHECK(registry.Size() == kOutputs);
    }

    SECTION("exactly one of two different actions wins") {
        std::atomic<std::size_t> conflicts{};
        std::vector<std::string> messages(kThreads);
        std::vector<std::thread> threads{};
        threads.reserve(kThreads);
        for (std::size_t t = 0; t < kThreads; ++t) {
            threads.emplace_back([&registry, &conflicts, &messages, t]() {
                // odd and even threads disagree on the action for out/x
                auto action = MakeAction("//pkg:t" + std::to_string(t),
                                         "Gen",
                                         {"out/x"},
                                         {{"variant", t % 2}});
                auto result = registry.Register(action);
                if (not result) {
                    ++conflicts;
                    messages[t] = result.error().Message();
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        CHECK(conflicts == kThreads / 2);
        CHECK(registry.Size() == 1);
        auto const winner = registry.GeneratingAction("out/x");
        REQUIRE(winner != nullptr);
        for (auto const& message : messages) {
            if (not message.empty()) {
                CHECK(message.find(winner->Id()) != std::string::npos);
            }
        }
    }
}
