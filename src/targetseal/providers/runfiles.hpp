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

#ifndef INCLUDED_SRC_TARGETSEAL_PROVIDERS_RUNFILES_HPP
#define INCLUDED_SRC_TARGETSEAL_PROVIDERS_RUNFILES_HPP

#include "src/targetseal/collections/artifact_set.hpp"
#include "src/targetseal/common/artifact.hpp"

namespace TargetSeal {

/// \brief Precomputed files an executable needs at run time. Extra middlemen
/// stand in for runfiles trees of tools used at run time.
struct Runfiles {
    ArtifactSet artifacts{};
    ArtifactSet extra_middlemen{};
};

/// \brief Run-time support of an executable target: its runfiles plus the
/// middleman artifact representing them in the action graph.
struct RunfilesSupport {
    Artifact middleman;
    Runfiles runfiles{};
};

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_PROVIDERS_RUNFILES_HPP
