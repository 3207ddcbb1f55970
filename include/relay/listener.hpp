/*
MIT License

Copyright (c) 2026 dakingffo

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/
#if defined(_MSC_VER) && _MSC_VER > 1000 || defined(__clang__) || (defined(__GNUC__) && __GNUC__ >= 3)
#pragma once
#endif

#ifndef RELAY_LISTENER_HPP
#define RELAY_LISTENER_HPP

#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

namespace relay {
    // Distinguished sender/listener value: matches and is matched by everything.
    struct any_t {
        explicit constexpr any_t() = default;

        friend constexpr bool operator==(any_t, any_t) noexcept { return true; }
    };

    inline constexpr any_t any{};

    template <typename T>
    concept listener_value = std::equality_comparable<T> && std::copy_constructible<T>
        && (!std::same_as<std::remove_cvref_t<T>, any_t>);

    // Either `any` or a concrete application value.
    // Equality is exact: `any` only equals `any`. Use `matches` for the dispatch relation.
    template <listener_value T>
    class listener {
    public:
        using value_type = T;

        constexpr listener() noexcept = default;
        constexpr listener(any_t) noexcept {}

        template <typename U>
            requires (std::constructible_from<T, U&&> && !std::same_as<std::remove_cvref_t<U>, any_t>
                && !std::same_as<std::remove_cvref_t<U>, listener>)
        constexpr listener(U&& value) : value_(std::in_place, std::forward<U>(value)) {}

        constexpr bool is_any() const noexcept {
            return !value_.has_value();
        }

        // Throws std::bad_optional_access for `any`.
        constexpr const T& value() const {
            return value_.value();
        }

        friend constexpr bool operator==(const listener& lhs, const listener& rhs) {
            if (lhs.is_any() || rhs.is_any()) {
                return lhs.is_any() && rhs.is_any();
            }
            return *lhs.value_ == *rhs.value_;
        }

        friend constexpr bool operator==(const listener& lhs, any_t) noexcept {
            return lhs.is_any();
        }

    private:
        std::optional<T> value_;
    };

    // Dispatch-time relation: either side being `any` always matches.
    template <typename T>
    constexpr bool matches(const listener<T>& filter, const listener<T>& sender) {
        return filter.is_any() || sender.is_any() || filter.value() == sender.value();
    }
}

#endif // !RELAY_LISTENER_HPP
