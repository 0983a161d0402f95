// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sequence_aligner.h
/// @brief Minimal insert/delete alignment of two sequences (Wu's O(NP) algorithm).
///
/// align(a, b) returns the shortest trace of tokens turning `a` into `b`:
///
/// - Copy(n) : the next n elements of a and b are equal
/// - Delete  : drop the next element of a
/// - Insert  : take the next element of b
///
/// coalesce(trace) then turns every lone Delete immediately followed by an
/// Insert into a single Replace token, so that a substituted element can be
/// diffed in place instead of being removed and added again.
///
/// ## Algorithm
///
/// With n = |a| >= m = |b| (operands are swapped otherwise) and
/// delta = n - m, the search keeps for every diagonal k = x - y the
/// furthest point fp[k] reachable with p deletions outside of the
/// mandatory delta ones. For p = 0, 1, ... the diagonals -p..delta-1 are
/// visited upward, delta+p..delta+1 downward and finally delta. Each point
/// comes from the better of fp[k-1] + 1 (Delete) and fp[k+1] (Insert),
/// Insert winning ties, and then slides along the diagonal over equal
/// elements (the snake). The search stops when fp[delta] reaches n.
///
/// Traces are immer vectors, so every diagonal extends the trace of its
/// predecessor without copying it.
///
/// Time is O((n + m) * p) where p is the number of deletions; close
/// sequences align in near linear time.

#pragma once

#include <editscript/api.h>
#include <editscript/editscript_config.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace editscript {

enum class AlignOp : uint8_t { Copy, Delete, Insert, Replace };

struct AlignToken {
    AlignOp op = AlignOp::Copy;
    /// Run length for Copy, 1 otherwise
    std::size_t count = 1;

    static constexpr AlignToken copy(std::size_t n) noexcept { return {AlignOp::Copy, n}; }
    static constexpr AlignToken del() noexcept { return {AlignOp::Delete, 1}; }
    static constexpr AlignToken ins() noexcept { return {AlignOp::Insert, 1}; }
    static constexpr AlignToken rep() noexcept { return {AlignOp::Replace, 1}; }

    friend bool operator==(const AlignToken&, const AlignToken&) = default;
};

using AlignTrace = immer::vector<AlignToken>;

namespace detail {

struct FurthestPoint {
    std::ptrdiff_t x = -1;
    AlignTrace trace;
};

/// Core search, requires a.size() >= b.size()
template <typename Seq>
AlignTrace align_longer_first(const Seq& a, const Seq& b)
{
    const auto n = static_cast<std::ptrdiff_t>(a.size());
    const auto m = static_cast<std::ptrdiff_t>(b.size());
    const std::ptrdiff_t delta = n - m;

    // Diagonals range over [-(m + 1), n + 1]
    const std::ptrdiff_t offset = m + 1;
    std::vector<FurthestPoint> fp(static_cast<std::size_t>(n + m + 3));
    auto at = [&](std::ptrdiff_t k) -> FurthestPoint& {
        return fp[static_cast<std::size_t>(k + offset)];
    };

    auto snake = [&](std::ptrdiff_t k, FurthestPoint start) {
        std::ptrdiff_t x = start.x;
        std::ptrdiff_t y = x - k;
        const std::ptrdiff_t x0 = x;
        while (x < n && y < m &&
               a[static_cast<std::size_t>(x)] == b[static_cast<std::size_t>(y)]) {
            ++x;
            ++y;
        }
        if (x > x0) {
            start.trace = std::move(start.trace).push_back(AlignToken::copy(static_cast<std::size_t>(x - x0)));
        }
        start.x = x;
        return start;
    };

    auto step = [&](std::ptrdiff_t k, std::ptrdiff_t p) {
        if (p == 0 && k == 0) {
            return snake(0, FurthestPoint{0, AlignTrace{}});
        }
        const FurthestPoint& from_delete = at(k - 1);
        const FurthestPoint& from_insert = at(k + 1);
        if (from_delete.x + 1 > from_insert.x) {
            return snake(k, FurthestPoint{from_delete.x + 1, from_delete.trace.push_back(AlignToken::del())});
        }
        return snake(k, FurthestPoint{from_insert.x, from_insert.trace.push_back(AlignToken::ins())});
    };

    for (std::ptrdiff_t p = 0;; ++p) {
        for (std::ptrdiff_t k = -p; k < delta; ++k) {
            at(k) = step(k, p);
        }
        for (std::ptrdiff_t k = delta + p; k > delta; --k) {
            at(k) = step(k, p);
        }
        at(delta) = step(delta, p);
        if (at(delta).x >= n) {
            return at(delta).trace;
        }
    }
}

} // namespace detail

/// Raw minimal trace turning `a` into `b`. `Seq` needs size() and
/// operator[] returning elements comparable with ==.
template <typename Seq>
[[nodiscard]] AlignTrace align(const Seq& a, const Seq& b)
{
    if (a.size() >= b.size()) {
        return detail::align_longer_first(a, b);
    }
    // Align with the longer operand first, then swap Delete and Insert back
    auto swapped = detail::align_longer_first(b, a);
    auto t = AlignTrace{}.transient();
    for (const auto& token : swapped) {
        switch (token.op) {
            case AlignOp::Delete: t.push_back(AlignToken::ins()); break;
            case AlignOp::Insert: t.push_back(AlignToken::del()); break;
            default:              t.push_back(token); break;
        }
    }
    return t.persistent();
}

/// Merge each lone Delete followed by an Insert into one Replace. A
/// Delete that continues a run of deletions is left alone.
[[nodiscard]] EDITSCRIPT_API AlignTrace coalesce(const AlignTrace& trace);

/// align() followed by coalesce()
template <typename Seq>
[[nodiscard]] AlignTrace edit_trace(const Seq& a, const Seq& b)
{
    return coalesce(align(a, b));
}

/// Compact rendering for logs and tests: Copy(3) Delete Insert -> "3 - +", Replace -> "r"
[[nodiscard]] EDITSCRIPT_API std::string trace_to_string(const AlignTrace& trace);

} // namespace editscript
