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

#ifndef INCLUDED_SRC_TARGETSEAL_ACTIONS_ACTION_CONFLICT_HPP
#define INCLUDED_SRC_TARGETSEAL_ACTIONS_ACTION_CONFLICT_HPP

#include <string>
#include <utility>  // std::move, std::swap

#include "fmt/core.h"
#include "gsl/gsl"
#include "nlohmann/json.hpp"
#include "src/targetseal/common/action.hpp"
#include "src/targetseal/common/artifact.hpp"

namespace TargetSeal {

/// \brief Two different actions generating the same output. The pair is
/// stored in a canonical order, so the conflict reads the same no matter
/// which of the actions was registered first.
class ActionConflict {
  public:
    ActionConflict(Action::Ptr first, Action::Ptr second, Artifact output)
        : first_{std::move(first)},
          second_{std::move(second)},
          output_{std::move(output)} {
        Expects(first_ != nullptr and second_ != nullptr);
        auto const rank = [](Action const& action) {
            return std::pair{action.Key(), action.Owner().ToString()};
        };
        if (rank(*second_) < rank(*first_)) {
            std::swap(first_, second_);
        }
    }

    [[nodiscard]] auto First() const& noexcept -> Action::Ptr const& {
        return first_;
    }
    [[nodiscard]] auto Second() const& noexcept -> Action::Ptr const& {
        return second_;
    }
    [[nodiscard]] auto Output() const& noexcept -> Artifact const& {
        return output_;
    }

    [[nodiscard]] auto Message() const -> std::string {
        return fmt::format(
            "Output {} is generated by conflicting actions:\n  - {}\n  - {}",
            nlohmann::json(output_.ExecPath()).dump(),
            first_->Describe(),
            second_->Describe());
    }

  private:
    Action::Ptr first_;
    Action::Ptr second_;
    Artifact output_;
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ACTIONS_ACTION_CONFLICT_HPP
