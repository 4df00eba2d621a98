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

#ifndef INCLUDED_SRC_TARGETSEAL_CONSTRAINTS_CONSTRAINT_SEMANTICS_HPP
#define INCLUDED_SRC_TARGETSEAL_CONSTRAINTS_CONSTRAINT_SEMANTICS_HPP

#include <memory>
#include <optional>

#include "gsl/gsl"
#include "src/targetseal/constraints/environment_collection.hpp"

namespace TargetSeal {

class RuleContext;

/// \brief Environment constraint algorithm, provided by the embedding build
/// tool.
class IConstraintSemantics {
  public:
    using Ptr = std::shared_ptr<IConstraintSemantics const>;

    IConstraintSemantics() noexcept = default;
    IConstraintSemantics(IConstraintSemantics const&) = delete;
    IConstraintSemantics(IConstraintSemantics&&) = delete;
    auto operator=(IConstraintSemantics const&)
        -> IConstraintSemantics& = delete;
    auto operator=(IConstraintSemantics&&) -> IConstraintSemantics& = delete;
    virtual ~IConstraintSemantics() noexcept = default;

    /// \brief Environments the target declares to support, nullopt if the
    /// rule does not declare any.
    [[nodiscard]] virtual auto GetSupportedEnvironments(
        RuleContext const& context) const
        -> std::optional<EnvironmentCollection> = 0;

    /// \brief Check the dependencies of the target against its declared
    /// environments. Fills the environments that remain supported and, for
    /// each removed one, the dependency responsible. Violations are reported
    /// to the context.
    virtual void CheckConstraints(
        gsl::not_null<RuleContext*> const& context,
        EnvironmentCollection const& declared,
        gsl::not_null<EnvironmentCollection::Builder*> const& refined,
        gsl::not_null<RemovedEnvironmentCulprits*> const& removed) const = 0;
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_CONSTRAINTS_CONSTRAINT_SEMANTICS_HPP
