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

#include "src/targetseal/common/action.hpp"

#include <exception>
#include <functional>

#include "fmt/core.h"
#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/logger.hpp"

namespace TargetSeal {

namespace {

[[nodiscard]] auto PathsToJson(std::vector<Artifact> const& artifacts)
    -> nlohmann::json {
    auto paths = nlohmann::json::array();
    for (auto const& artifact : artifacts) {
        paths.push_back(artifact.ExecPath());
    }
    return paths;
}

[[nodiscard]] auto ArtifactsFromJson(nlohmann::json const& json,
                                     std::string const& field)
    -> std::optional<std::vector<Artifact>> {
    auto result = std::vector<Artifact>{};
    auto it = json.find(field);
    if (it == json.end()) {
        return result;
    }
    if (not it->is_array()) {
        Logger::Log(LogLevel::Error,
                    "Action field \"{}\" must be a list of artifacts",
                    field);
        return std::nullopt;
    }
    result.reserve(it->size());
    for (auto const& entry : *it) {
        auto artifact = Artifact::FromJson(entry);
        if (not artifact) {
            return std::nullopt;
        }
        result.emplace_back(*std::move(artifact));
    }
    return result;
}

}  // namespace

Action::Action(Label owner,
               std::string mnemonic,
               std::vector<Artifact> outputs,
               std::vector<Artifact> inputs,
               nlohmann::json arguments)
    : owner_{std::move(owner)},
      mnemonic_{std::move(mnemonic)},
      outputs_{std::move(outputs)},
      inputs_{std::move(inputs)},
      arguments_{std::move(arguments)},
      key_{ComputeKey()},
      id_{HashToIdentifier(std::hash<std::string>{}(key_))} {}

auto Action::FromJson(nlohmann::json const& json) noexcept
    -> std::optional<Ptr> {
    try {
        auto owner = Label::FromJson(json.at("owner"));
        if (not owner) {
            Logger::Log(LogLevel::Error,
                        "Action has an invalid owner:\n{}",
                        owner.error());
            return std::nullopt;
        }
        auto mnemonic = json.at("mnemonic").get<std::string>();
        auto outputs = ArtifactsFromJson(json, "outputs");
        auto inputs = ArtifactsFromJson(json, "inputs");
        if (not outputs or not inputs) {
            return std::nullopt;
        }
        if (outputs->empty()) {
            Logger::Log(LogLevel::Error,
                        "Action {} of {} must declare at least one output",
                        mnemonic,
                        owner->ToString());
            return std::nullopt;
        }
        auto arguments = json.value("arguments", nlohmann::json::object());
        return std::make_shared<Action const>(*std::move(owner),
                                              std::move(mnemonic),
                                              *std::move(outputs),
                                              *std::move(inputs),
                                              std::move(arguments));
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "Failed to parse action description {} with error:\n{}",
                    json.dump(),
                    ex.what());
    }
    return std::nullopt;
}

auto Action::Describe() const -> std::string {
    return fmt::format(
        "{} action {} owned by {}", mnemonic_, id_, owner_.ToString());
}

auto Action::ToJson() const -> nlohmann::json {
    auto outputs = nlohmann::json::array();
    for (auto const& output : outputs_) {
        outputs.push_back(output.ToJson());
    }
    auto inputs = nlohmann::json::array();
    for (auto const& input : inputs_) {
        inputs.push_back(input.ToJson());
    }
    return nlohmann::json{{"owner", owner_.ToJson()},
                          {"mnemonic", mnemonic_},
                          {"outputs", outputs},
                          {"inputs", inputs},
                          {"arguments", arguments_}};
}

auto Action::ComputeKey() const -> std::string {
    // nlohmann::json objects are ordered by key, so the dump is canonical
    return nlohmann::json{{"mnemonic", mnemonic_},
                          {"outputs", PathsToJson(outputs_)},
                          {"inputs", PathsToJson(inputs_)},
                          {"arguments", arguments_}}
        .dump();
}

}  // namespace TargetSeal
