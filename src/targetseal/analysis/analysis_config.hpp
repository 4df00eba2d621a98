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

#ifndef INCLUDED_SRC_TARGETSEAL_ANALYSIS_ANALYSIS_CONFIG_HPP
#define INCLUDED_SRC_TARGETSEAL_ANALYSIS_ANALYSIS_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <optional>

#include "nlohmann/json.hpp"

namespace TargetSeal {

/// \brief Build-wide settings of the analysis.
struct AnalysisConfig {
    /// \brief Check environment constraints of rules supporting it.
    bool enforce_constraints{true};
    /// \brief Expected number of concurrently analysed targets, 0 for the
    /// number of hardware threads.
    std::size_t jobs{};

    /// \brief Read from a JSON object; missing keys keep their default.
    /// Unknown keys are ignored with a warning.
    [[nodiscard]] static auto FromJson(nlohmann::json const& json) noexcept
        -> std::optional<AnalysisConfig>;

    [[nodiscard]] static auto FromFile(
        std::filesystem::path const& path) noexcept
        -> std::optional<AnalysisConfig>;

    [[nodiscard]] auto ToJson() const -> nlohmann::json {
        return nlohmann::json{{"enforce_constraints", enforce_constraints},
                              {"jobs", jobs}};
    }
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ANALYSIS_ANALYSIS_CONFIG_HPP
