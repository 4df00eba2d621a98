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

#include "src/targetseal/logging/logger.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "catch2/catch.hpp"
#include "src/targetseal/logging/log_config.hpp"
#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/log_sink.hpp"

// Stores prints from test sink instances
class TestPrints {
    struct PrintData {
        std::mutex mutex{};
        std::atomic<int> counter{};
        std::unordered_map<int, std::vector<std::string>> prints{};
    };

  public:
    static void Print(int sink_id, std::string const& print) noexcept {
        auto& data = Data();
        std::unique_lock lock{data.mutex};
        data.prints[sink_id].push_back(print);
    }
    [[nodiscard]] static auto Read(int sink_id) noexcept
        -> std::vector<std::string> {
        auto& data = Data();
        std::unique_lock lock{data.mutex};
        return data.prints[sink_id];
    }

    static void Clear() noexcept {
        auto& data = Data();
        std::unique_lock lock{data.mutex};
        data.prints.clear();
        data.counter = 0;
    }

    static auto GetId() noexcept -> int { return Data().counter++; }

  private:
    [[nodiscard]] static auto Data() noexcept -> PrintData& {
        static PrintData instance{};
        return instance;
    }
};

// Test sink, prints to TestPrints depending on its own instance id.
class LogSinkTest : public ILogSink {
  public:
    static auto CreateFactory() -> LogSinkFactory {
        return [] { return std::make_shared<LogSinkTest>(); };
    }

    LogSinkTest() noexcept { id_ = TestPrints::GetId(); }

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        auto prefix = LogLevelToString(level);

        if (logger != nullptr) {
            prefix += " (" + logger->Name() + ")";
        }

        TestPrints::Print(id_, prefix + ": " + msg);
    }

  private:
    int id_{};
};

class OneGlobalSinkFixture {
  public:
    OneGlobalSinkFixture() {
        TestPrints::Clear();
        LogConfig::SetLogLimit(LogLevel::Info);
        LogConfig::SetSinks({LogSinkTest::CreateFactory()});
    }
};

class TwoGlobalSinksFixture : public OneGlobalSinkFixture {
  public:
    TwoGlobalSinksFixture() {
        LogConfig::AddSink(LogSinkTest::CreateFactory());
    }
};

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Global static logger with one sink",
                 "[logger]") {
    int instance = 0;

    Logger::Log(LogLevel::Debug, "dropped");
    CHECK(TestPrints::Read(instance).empty());

    SECTION("log within log limit") {
        Logger::Log(LogLevel::Warning, "sealing {} failed", "//pkg:target");
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0] == "WARN: sealing //pkg:target failed");

        SECTION("raise log limit") {
            LogConfig::SetLogLimit(LogLevel::Trace);
            Logger::Log(LogLevel::Trace, "{} action(s)", 3);
            Logger::Log(LogLevel::Trace, [] { return std::string{"lazy"}; });
            auto prints = TestPrints::Read(instance);
            REQUIRE(prints.size() == 3);
            CHECK(prints[1] == "TRACE: 3 action(s)");
            CHECK(prints[2] == "TRACE: lazy");
        }
    }

    SECTION("messages are only created if enabled") {
        bool created{};
        Logger::Log(LogLevel::Trace, [&created] {
            created = true;
            return std::string{"expensive"};
        });
        CHECK_FALSE(created);
    }

    SECTION("malformed format strings are emitted verbatim") {
        Logger::Log(LogLevel::Error, "unbalanced {", 1);
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 1);
        CHECK(prints[0] == "ERROR: unbalanced {");
    }
}

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Local named logger using one global sink",
                 "[logger]") {
    Logger logger("Sealer");
    int instance = 0;

    logger.Emit(LogLevel::Trace, "first");
    CHECK(TestPrints::Read(instance).empty());

    logger.Emit(LogLevel::Info, "sealed {} target(s)", 2);
    auto prints = TestPrints::Read(instance);
    REQUIRE(prints.size() == 1);
    CHECK(prints[0] == "INFO (Sealer): sealed 2 target(s)");

    SECTION("local log limit is independent of the global one") {
        logger.SetLogLimit(LogLevel::Trace);
        logger.Emit(LogLevel::Trace, [] { return std::string{"third"}; });
        Logger::Log(LogLevel::Trace, "not emitted");
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 2);
        CHECK(prints[1] == "TRACE (Sealer): third");
    }

    SECTION("log via optional logger") {
        Logger::Log(&logger, LogLevel::Error, "with logger");
        Logger::Log(nullptr, LogLevel::Error, "without logger");
        auto prints = TestPrints::Read(instance);
        REQUIRE(prints.size() == 3);
        CHECK(prints[1] == "ERROR (Sealer): with logger");
        CHECK(prints[2] == "ERROR: without logger");
    }
}

TEST_CASE_METHOD(OneGlobalSinkFixture,
                 "Local named logger with its own sink instance",
                 "[logger]") {
    Logger logger("OwnSinkLogger", {LogSinkTest::CreateFactory()});

    logger.Emit(LogLevel::Info, "own");
    Logger::Log(LogLevel::Info, "global");
    CHECK(TestPrints::Read(0) == std::vector<std::string>{"INFO: global"});
    CHECK(TestPrints::Read(1) ==
          std::vector<std::string>{"INFO (OwnSinkLogger): own"});
}

TEST_CASE_METHOD(TwoGlobalSinksFixture,
                 "Global static logger with two sinks",
                 "[logger]") {
    Logger::Log(LogLevel::Info, "both");
    CHECK(TestPrints::Read(0) == std::vector<std::string>{"INFO: both"});
    CHECK(TestPrints::Read(1) == std::vector<std::string>{"INFO: both"});
}

TEST_CASE("Log levels", "[logger]") {
    CHECK(ToLogLevel(-1) == LogLevel::Error);
    CHECK(ToLogLevel(2) == LogLevel::Info);
    CHECK(ToLogLevel(42) == LogLevel::Trace);

    CHECK(LogLevelFromString("error") == LogLevel::Error);
    CHECK(LogLevelFromString("warn") == LogLevel::Warning);
    CHECK(LogLevelFromString("warning") == LogLevel::Warning);
    CHECK(LogLevelFromString("trace") == LogLevel::Trace);
    CHECK_FALSE(LogLevelFromString("TRACE"));
    CHECK_FALSE(LogLevelFromString("verbose"));
}
