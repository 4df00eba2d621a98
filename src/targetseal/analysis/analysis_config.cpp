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

#include "src/targetseal/analysis/analysis_config.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <string>

#include "src/targetseal/logging/log_level.hpp"
#include "src/targetseal/logging/logger.hpp"

namespace TargetSeal {

namespace {

constexpr auto kEnforceConstraintsKey = "enforce_constraints";
constexpr auto kJobsKey = "jobs";

}  // namespace

auto AnalysisConfig::FromJson(nlohmann::json const& json) noexcept
    -> std::optional<AnalysisConfig> {
    if (not json.is_object()) {
        Logger::Log(LogLevel::Error,
                    "Analysis configuration must be an object, but found {}",
                    json.dump());
        return std::nullopt;
    }
    AnalysisConfig config{};
    for (auto const& [key, value] : json.items()) {
        if (key == kEnforceConstraintsKey) {
            if (not value.is_boolean()) {
                Logger::Log(LogLevel::Error,
                            "Value for {} must be a boolean, but found {}",
                            key,
                            value.dump());
                return std::nullopt;
            }
            config.enforce_constraints = value.get<bool>();
        }
        else if (key == kJobsKey) {
            if (not value.is_number_integer() or
                value.get<std::int64_t>() < 0) {
                Logger::Log(LogLevel::Error,
                            "Value for {} must be a non-negative integer, but "
                            "found {}",
                            key,
                            value.dump());
                return std::nullopt;
            }
            config.jobs = value.get<std::size_t>();
        }
        else {
            Logger::Log(LogLevel::Warning,
                        "Ignoring unknown analysis configuration key {}",
                        nlohmann::json(key).dump());
        }
    }
    return config;
}

auto AnalysisConfig::FromFile(std::filesystem::path const& path) noexcept
    -> std::optional<AnalysisConfig> {
    try {
        std::ifstream file{path};
        if (not file.good()) {
            Logger::Log(LogLevel::Error,
                        "Cannot read analysis configuration {}",
                        path.string());
            return std::nullopt;
        }
        return FromJson(nlohmann::json::parse(file));
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error,
                    "Parsing analysis configuration {} failed with:\n{}",
                    path.string(),
                    ex.what());
    }
    return std::nullopt;
}

}  // namespace TargetSeal
