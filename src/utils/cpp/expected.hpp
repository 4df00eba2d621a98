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

#ifndef INCLUDED_SRC_UTILS_CPP_EXPECTED_HPP
#define INCLUDED_SRC_UTILS_CPP_EXPECTED_HPP

#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

template <class E>
class unexpected {
  public:
    explicit unexpected(E error) : error_{std::move(error)} {}
    [[nodiscard]] auto error() const& -> E const& { return error_; }
    [[nodiscard]] auto error() && -> E { return std::move(error_); }

  private:
    E error_;
};

template <class T, class E>
class expected;

namespace detail {
template <class X>
struct is_expected : std::false_type {};

template <class T, class E>
struct is_expected<expected<T, E>> : std::true_type {};
}  // namespace detail

/// \brief Value-or-error result. Holds either a value of type T or an error
/// of type E, never both and never none.
template <class T, class E>
class expected {
  public:
    using value_type = T;
    using error_type = E;

    expected(T value) noexcept  // NOLINT
        : value_{std::in_place_index<0>, std::move(value)} {}
    expected(unexpected<E> unexpected) noexcept  // NOLINT
        : value_{std::in_place_index<1>, std::move(unexpected).error()} {}

    [[nodiscard]] auto has_value() const noexcept -> bool {
        return value_.index() == 0;
    }
    [[nodiscard]] operator bool() const noexcept {  // NOLINT
        return has_value();
    }

    [[nodiscard]] auto value() const& -> T const& {
        return std::get<0>(value_);
    }
    [[nodiscard]] auto value() && -> T {
        return std::move(std::get<0>(value_));
    }

    [[nodiscard]] auto value_or(T fallback) const& -> T {
        return has_value() ? value() : std::move(fallback);
    }
    [[nodiscard]] auto value_or(T fallback) && -> T {
        return has_value() ? std::move(*this).value() : std::move(fallback);
    }

    [[nodiscard]] auto operator*() const& noexcept -> T const& {
        return *std::get_if<0>(&value_);
    }
    [[nodiscard]] auto operator*() && noexcept -> T {
        return std::move(*std::get_if<0>(&value_));
    }
    [[nodiscard]] auto operator->() const noexcept -> T const* {
        return std::get_if<0>(&value_);
    }

    [[nodiscard]] auto error() const& noexcept -> E const& {
        return *std::get_if<1>(&value_);
    }
    [[nodiscard]] auto error() && noexcept -> E {
        return std::move(*std::get_if<1>(&value_));
    }

    /// \brief Chain a fallible continuation. The continuation receives the
    /// contained value and must itself return an expected with the same
    /// error type. Errors are passed through unchanged.
    template <class F>
    [[nodiscard]] auto and_then(F&& f) const& {
        using result_t = std::invoke_result_t<F, T const&>;
        static_assert(detail::is_expected<result_t>::value,
                      "continuation must return an expected");
        if (has_value()) {
            return std::invoke(std::forward<F>(f), value());
        }
        return result_t{unexpected<E>{error()}};
    }
    template <class F>
    [[nodiscard]] auto and_then(F&& f) && {
        using result_t = std::invoke_result_t<F, T&&>;
        static_assert(detail::is_expected<result_t>::value,
                      "continuation must return an expected");
        if (has_value()) {
            return std::invoke(std::forward<F>(f), std::move(*this).value());
        }
        return result_t{unexpected<E>{std::move(*this).error()}};
    }

    /// \brief Map the contained value, passing errors through unchanged.
    template <class F>
    [[nodiscard]] auto transform(F&& f) const& {
        using mapped_t = std::remove_cvref_t<std::invoke_result_t<F, T const&>>;
        if (has_value()) {
            return expected<mapped_t, E>{
                std::invoke(std::forward<F>(f), value())};
        }
        return expected<mapped_t, E>{unexpected<E>{error()}};
    }
    template <class F>
    [[nodiscard]] auto transform(F&& f) && {
        using mapped_t = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
        if (has_value()) {
            return expected<mapped_t, E>{
                std::invoke(std::forward<F>(f), std::move(*this).value())};
        }
        return expected<mapped_t, E>{unexpected<E>{std::move(*this).error()}};
    }

    /// \brief Map the contained error, passing values through unchanged.
    template <class F>
    [[nodiscard]] auto transform_error(F&& f) && {
        using mapped_t = std::remove_cvref_t<std::invoke_result_t<F, E&&>>;
        if (has_value()) {
            return expected<T, mapped_t>{std::move(*this).value()};
        }
        return expected<T, mapped_t>{unexpected<mapped_t>{
            std::invoke(std::forward<F>(f), std::move(*this).error())}};
    }

  private:
    std::variant<T, E> value_;
};

#endif  // INCLUDED_SRC_UTILS_CPP_EXPECTED_HPP
