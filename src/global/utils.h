#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "macros.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

class NullPointerException final : public std::runtime_error
{
public:
    NullPointerException()
        : std::runtime_error("null pointer")
    {}
};

/// Dereferences a (smart) pointer, throwing instead of crashing on nullptr.
template<typename T>
NODISCARD T &deref(T *const ptr)
{
    if (ptr == nullptr) {
        throw NullPointerException();
    }
    return *ptr;
}

template<typename T>
NODISCARD T &deref(const std::shared_ptr<T> &ptr)
{
    return deref(ptr.get());
}

template<typename T>
NODISCARD T &deref(const std::unique_ptr<T> &ptr)
{
    return deref(ptr.get());
}

template<typename T>
NODISCARD constexpr bool isClamped(const T x, const T lo, const T hi)
{
    return lo <= x && x <= hi;
}

namespace utils {

/// Positive remainder; the result has the sign of the divisor.
NODISCARD inline double floorMod(const double x, const double m)
{
    const double r = std::fmod(x, m);
    return (r < 0.0) ? r + m : r;
}

NODISCARD inline int floorMod(const int x, const int m)
{
    const int r = x % m;
    return (r < 0) ? r + m : r;
}

} // namespace utils
