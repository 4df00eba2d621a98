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

#ifndef INCLUDED_SRC_TARGETSEAL_COMMON_IDENTIFIER_HPP
#define INCLUDED_SRC_TARGETSEAL_COMMON_IDENTIFIER_HPP

#include <cstddef>
#include <string>

#include "fmt/core.h"

namespace TargetSeal {

// Build-wide identity of an artifact: its execution path.
using ArtifactIdentifier = std::string;

// Short, printable identifier of an action, derived from its key.
using ActionIdentifier = std::string;

[[nodiscard]] static inline auto HashToIdentifier(std::size_t hash)
    -> std::string {
    return fmt::format("{:016x}", hash);
}

}  // namespace TargetSeal

#endif  // INCLUDED_SRC_TARGETSEAL_COMMON_IDENTIFIER_HPP
