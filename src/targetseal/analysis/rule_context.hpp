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

#ifndef INCLUDED_SRC_TARGETSEAL_ANALYSIS_RULE_CONTEXT_HPP
#define INCLUDED_SRC_TARGETSEAL_ANALYSIS_RULE_CONTEXT_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>  // std::move
#include <vector>

#include "gsl/gsl"
#include "src/targetseal/actions/action_registry.hpp"
#include "src/targetseal/analysis/analysis_config.hpp"
#include "src/targetseal/common/action.hpp"
#include "src/targetseal/common/label.hpp"
#include "src/targetseal/constraints/constraint_semantics.hpp"

namespace TargetSeal {

/// \brief Receives user-facing diagnostics. The flag tells whether the
/// message is an error that fails the analysis of the target.
using DiagnosticLogger = std::function<void(std::string const&, bool)>;

/// \brief Properties of the rule class a target is an instance of.
struct RuleClassInfo {
    std::string name;
    bool supports_constraint_checking{};
    bool is_test{};
};

/// \brief Attribute values of the target relevant for sealing its result.
struct RuleAttributes {
    int shard_count{};
    bool shard_count_explicit{};
    std::vector<std::string> tags{};
    std::vector<std::string> licenses{};
    std::vector<Label> visibility{};
};

/// \brief State of the analysis of a single target: its identity and
/// attributes, the actions it registered, and the diagnostics reported so
/// far. Used by one thread only.
class RuleContext {
  public:
    RuleContext(Label label,
                RuleClassInfo rule_class,
                RuleAttributes attributes,
                AnalysisConfig config,
                gsl::not_null<ActionRegistry*> const& registry,
                DiagnosticLogger logger,
                IConstraintSemantics::Ptr constraint_semantics = nullptr)
        : label_{std::move(label)},
          rule_class_{std::move(rule_class)},
          attributes_{std::move(attributes)},
          config_{config},
          registry_{registry},
          logger_{std::move(logger)},
          constraint_semantics_{std::move(constraint_semantics)} {}

    [[nodiscard]] auto GetLabel() const& noexcept -> Label const& {
        return label_;
    }
    [[nodiscard]] auto RuleClass() const& noexcept -> RuleClassInfo const& {
        return rule_class_;
    }
    [[nodiscard]] auto Attributes() const& noexcept -> RuleAttributes const& {
        return attributes_;
    }
    [[nodiscard]] auto Config() const& noexcept -> AnalysisConfig const& {
        return config_;
    }
    [[nodiscard]] auto Registry() const noexcept
        -> gsl::not_null<ActionRegistry*> const& {
        return registry_;
    }
    [[nodiscard]] auto ConstraintSemantics() const& noexcept
        -> IConstraintSemantics::Ptr const& {
        return constraint_semantics_;
    }

    void AttributeError(std::string const& attribute,
                        std::string const& message);
    void RuleError(std::string const& message);
    void Warning(std::string const& message);

    [[nodiscard]] auto HasErrors() const noexcept -> bool {
        return num_errors_ > 0;
    }
    [[nodiscard]] auto NumErrors() const noexcept -> std::size_t {
        return num_errors_;
    }

    /// \brief Record an action created while analysing this target.
    void RegisterAction(Action::Ptr action) {
        Expects(action != nullptr);
        actions_.emplace_back(std::move(action));
    }
    [[nodiscard]] auto RegisteredActions() const& noexcept
        -> std::vector<Action::Ptr> const& {
        return actions_;
    }

  private:
    Label label_;
    RuleClassInfo rule_class_;
    RuleAttributes attributes_;
    AnalysisConfig config_;
    gsl::not_null<ActionRegistry*> registry_;
    DiagnosticLogger logger_;
    IConstraintSemantics::Ptr constraint_semantics_;
    std::vector<Action::Ptr> actions_{};
    std::size_t num_errors_{};

    void Report(std::string const& message, bool fatal);
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_ANALYSIS_RULE_CONTEXT_HPP
