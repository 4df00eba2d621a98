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

#ifndef INCLUDED_SRC_TARGETSEAL_MULTITHREADING_ATOMIC_VALUE_HPP
#define INCLUDED_SRC_TARGETSEAL_MULTITHREADING_ATOMIC_VALUE_HPP

#include <functional>
#include <mutex>
#include <optional>

// Value that is computed at most once, on first request, and can be read
// concurrently afterwards. If the setter throws, the next request retries.
template <class T>
class AtomicValue {
  public:
    AtomicValue() noexcept = default;
    AtomicValue(AtomicValue const&) = delete;
    AtomicValue(AtomicValue&&) = delete;
    ~AtomicValue() noexcept = default;

    auto operator=(AtomicValue const&) -> AtomicValue& = delete;
    auto operator=(AtomicValue&&) -> AtomicValue& = delete;

    // Blocks concurrent callers until the first setter call has finished.
    [[nodiscard]] auto SetOnceAndGet(
        std::function<T()> const& setter) const& -> T const& {
        std::call_once(once_, [this, &setter]() { data_.emplace(setter()); });
        return *data_;
    }

    [[nodiscard]] auto SetOnceAndGet(std::function<T()> const& setter) && =
        delete;

  private:
    mutable std::once_flag once_{};
    mutable std::optional<T> data_{};
};

#endif  // INCLUDED_SRC_TARGETSEAL_MULTITHREADING_ATOMIC_VALUE_HPP
