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

#ifndef INCLUDED_SRC_TEST_UTILS_FIXTURES_HPP
#define INCLUDED_SRC_TEST_UTILS_FIXTURES_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/targetseal/analysis/rule_context.hpp"
#include "src/targetseal/common/action.hpp"
#include "src/targetseal/common/artifact.hpp"
#include "src/targetseal/common/label.hpp"

[[nodiscard]] static inline auto MakeLabel(std::string const& label)
    -> TargetSeal::Label {
    auto parsed = TargetSeal::Label::Parse(label);
    if (not parsed) {
        throw std::invalid_argument{parsed.error()};
    }
    return *std::move(parsed);
}

[[nodiscard]] static inline auto MakeSource(std::string const& path)
    -> TargetSeal::Artifact {
    return TargetSeal::Artifact::Source(path);
}

[[nodiscard]] static inline auto MakeDerived(std::string const& path,
                                             std::string const& owner =
                                                 "//pkg:target")
    -> TargetSeal::Artifact {
    return TargetSeal::Artifact::Derived(path, MakeLabel(owner));
}

[[nodiscard]] static inline auto MakeAction(
    std::string const& owner,
    std::string const& mnemonic,
    std::vector<std::string> const& outputs,
    nlohmann::json arguments = nlohmann::json::object())
    -> TargetSeal::Action::Ptr {
    std::vector<TargetSeal::Artifact> artifacts{};
    for (auto const& output : outputs) {
        artifacts.emplace_back(MakeDerived(output, owner));
    }
    return std::make_shared<TargetSeal::Action const>(
        MakeLabel(owner),
        mnemonic,
        std::move(artifacts),
        std::vector<TargetSeal::Artifact>{},
        std::move(arguments));
}

// Collects diagnostics reported to a rule context.
class DiagnosticCollector {
  public:
    struct Entry {
        std::string message;
        bool fatal;
    };

    [[nodiscard]] auto Logger() -> TargetSeal::DiagnosticLogger {
        return [this](std::string const& msg, bool fatal) {
            std::unique_lock lock{mutex_};
            entries_.push_back(Entry{msg, fatal});
        };
    }

    [[nodiscard]] auto Entries() const -> std::vector<Entry> {
        std::unique_lock lock{mutex_};
        return entries_;
    }

    [[nodiscard]] auto NumErrors() const -> std::size_t {
        std::size_t count{};
        for (auto const& entry : Entries()) {
            count += entry.fatal ? 1 : 0;
        }
        return count;
    }

    [[nodiscard]] auto Contains(std::string const& text) const -> bool {
        for (auto const& entry : Entries()) {
            if (entry.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

  private:
    mutable std::mutex mutex_{};
    std::vector<Entry> entries_{};
};

#endif  // INCLUDED_SRC_TEST_UTILS_FIXTURES_HPP
