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

#include "src/targetseal/common/label.hpp"

#include <algorithm>

#include "fmt/core.h"

namespace TargetSeal {

namespace {

[[nodiscard]] auto IsValidPackage(std::string const& package) -> bool {
    if (package.empty()) {
        return true;
    }
    if (package.front() == '/' or package.back() == '/') {
        return false;
    }
    std::size_t start{};
    while (start <= package.size()) {
        auto end = package.find('/', start);
        if (end == std::string::npos) {
            end = package.size();
        }
        auto segment = package.substr(start, end - start);
        if (segment.empty() or segment == "." or segment == "..") {
            return false;
        }
        start = end + 1;
    }
    return package.find(Label::kNameSeparator) == std::string::npos;
}

[[nodiscard]] auto IsValidName(std::string const& name) -> bool {
    return not name.empty() and name.front() != '/' and
           name.find(Label::kNameSeparator) == std::string::npos;
}

}  // namespace

auto Label::Parse(std::string const& label) -> expected<Label, std::string> {
    std::string repository{};
    auto rest = label;
    if (not rest.empty() and rest.front() == kRepositoryMarker) {
        auto pos = rest.find(kPackageMarker);
        if (pos == std::string::npos) {
            return unexpected{fmt::format(
                "Label {} names a repository but no package", label)};
        }
        repository = rest.substr(1, pos - 1);
        if (repository.empty()) {
            return unexpected{
                fmt::format("Label {} has an empty repository name", label)};
        }
        rest = rest.substr(pos);
    }
    if (not rest.starts_with(kPackageMarker)) {
        return unexpected{fmt::format(
            "Label {} must be absolute, i.e., start with '//'", label)};
    }
    rest = rest.substr(2);

    std::string package{};
    std::string name{};
    auto sep = rest.find(kNameSeparator);
    if (sep == std::string::npos) {
        package = rest;
        auto last = package.rfind('/');
        name = last == std::string::npos ? package : package.substr(last + 1);
    }
    else {
        package = rest.substr(0, sep);
        name = rest.substr(sep + 1);
    }

    if (not IsValidPackage(package)) {
        return unexpected{
            fmt::format("Label {} has invalid package '{}'", label, package)};
    }
    if (not IsValidName(name)) {
        return unexpected{
            fmt::format("Label {} has invalid target name '{}'", label, name)};
    }
    return Label{std::move(repository), std::move(package), std::move(name)};
}

auto Label::FromJson(nlohmann::json const& json)
    -> expected<Label, std::string> {
    if (not json.is_string()) {
        return unexpected{
            fmt::format("Expected label string, but found {}", json.dump())};
    }
    return Parse(json.get<std::string>());
}

auto Label::ToString() const -> std::string {
    if (repository_.empty()) {
        return fmt::format("//{}:{}", package_, name_);
    }
    return fmt::format(
        "{}{}//{}:{}", kRepositoryMarker, repository_, package_, name_);
}

}  // namespace TargetSeal
