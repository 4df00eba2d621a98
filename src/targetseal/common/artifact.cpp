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

#include "src/targetseal/common/artifact.hpp"

#include <exception>

#include "gsl/gsl"
#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/logger.hpp"

namespace TargetSeal {

namespace {

constexpr auto kSourceType = "SOURCE";
constexpr auto kDerivedType = "DERIVED";
constexpr auto kMiddlemanType = "MIDDLEMAN";

[[nodiscard]] auto RootToString(Artifact::Root root) -> std::string {
    switch (root) {
        case Artifact::Root::kSource:
            return kSourceType;
        case Artifact::Root::kDerived:
            return kDerivedType;
        case Artifact::Root::kMiddleman:
            return kMiddlemanType;
    }
    Ensures(false);  // unreachable
}

[[nodiscard]] auto RootFromString(std::string const& type)
    -> std::optional<Artifact::Root> {
    if (type == kSourceType) {
        return Artifact::Root::kSource;
    }
    if (type == kDerivedType) {
        return Artifact::Root::kDerived;
    }
    if (type == kMiddlemanType) {
        return Artifact::Root::kMiddleman;
    }
    return std::nullopt;
}

}  // namespace

auto Artifact::FromJson(nlohmann::json const& json) noexcept
    -> std::optional<Artifact> {
    try {
        auto const type = json.at("type").get<std::string>();
        auto const root = RootFromString(type);
        if (not root) {
            Logger::Log(LogLevel::Error,
                        "Artifact description has unknown type {}",
                        nlohmann::json(type).dump());
            return std::nullopt;
        }
        auto const& data = json.at("data");
        auto path = data.at("path").get<std::string>();
        if (path.empty()) {
            Logger::Log(LogLevel::Error,
                        "Artifact description {} has an empty path",
                        json.dump());
            return std::nullopt;
        }
        std::optional<Label> owner{};
        auto owner_it = data.find("owner");
        if (owner_it != data.end()) {
            auto label = Label::FromJson(*owner_it);
            if (not label) {
                Logger::Log(LogLevel::Error,
                            "Artifact {} has an invalid owner:\n{}",
                            path,
                            label.error());
                return std::nullopt;
            }
            owner = *std::move(label);
        }
        if (*root != Root::kSource and not owner) {
            Logger::Log(LogLevel::Error,
                        "Generated artifact {} must name its owner",
                        path);
            return std::nullopt;
        }
        return Artifact{std::move(path), *root, std::move(owner)};
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "Failed to parse artifact description {} with error:\n{}",
                    json.dump(),
                    ex.what());
    }
    return std::nullopt;
}

auto Artifact::ToJson() const -> nlohmann::json {
    auto data = nlohmann::json{{"path", exec_path_}};
    if (owner_) {
        data["owner"] = owner_->ToJson();
    }
    return nlohmann::json{{"type", RootToString(root_)}, {"data", data}};
}

}  // namespace TargetSeal
