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

#ifndef INCLUDED_SRC_TARGETSEAL_ANALYSIS_ASSEMBLY_ERROR_HPP
#define INCLUDED_SRC_TARGETSEAL_ANALYSIS_ASSEMBLY_ERROR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>  // std::move

#include "src/targetseal/actions/action_conflict.hpp"

namespace TargetSeal {

/// \brief Reason the result of a target could not be assembled.
class AssemblyError {
  public:
    enum class Kind : std::uint8_t {
        kInvariant,      ///< misuse of the builder by the rule implementation
        kExport,         ///< provider with a constructor that is not exported
        kActionConflict  ///< two actions generate the same output
    };

    [[nodiscard]] static auto Invariant(std::string message) -> AssemblyError {
        return AssemblyError{Kind::kInvariant, std::move(message)};
    }

    [[nodiscard]] static auto Export(std::string message) -> AssemblyError {
        return AssemblyError{Kind::kExport, std::move(message)};
    }

    [[nodiscard]] static auto Conflict(ActionConflict conflict)
        -> AssemblyError {
        auto error = AssemblyError{Kind::kActionConflict, conflict.Message()};
        error.conflict_ = std::move(conflict);
        return error;
    }

    [[nodiscard]] auto GetKind() const noexcept -> Kind { return kind_; }
    [[nodiscard]] auto Message() const& noexcept -> std::string const& {
        return message_;
    }
    [[nodiscard]] auto ActionConflictInfo() const& noexcept
        -> std::optional<ActionConflict> const& {
        return conflict_;
    }

  private:
    Kind kind_;
    std::string message_;
    std::optional<ActionConflict> conflict_{};

    AssemblyError(Kind kind, std::string message) noexcept
        : kind_{kind}, message_{std::move(message)} {}
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ANALYSIS_ASSEMBLY_ERROR_HPP
