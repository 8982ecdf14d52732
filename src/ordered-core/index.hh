#pragma once

#include <ordered-core/fwd.hh>

// =========================================================================================================
// Index normalization for collection operations
// =========================================================================================================
//
// Region operations (slice, splice, fill, copy_within, index_of, ...) accept negative indices
// meaning "offset from the end". A negative index i is first normalized to length + i,
// only then clamped into [0, length]. Out-of-range bounds are never an error for these operations.
//
//   normalize_index(-1, 4)     == 3
//   clamp_index(-9, 4)         == 0
//   clamp_index(7, 4)          == 4
//   resolve_range(-2, 4, 4)    == {2, 4}
//   resolve_range(3, 1, 4)     == {3, 3}   (empty, never reversed)
//
// Direct element access (get / set) does NOT go through these helpers.

/// A resolved half-open index range [start, end) with 0 <= start <= end <= length
struct oc::index_range
{
    isize start = 0;
    isize end = 0;

    [[nodiscard]] constexpr isize size() const { return end - start; }
    [[nodiscard]] constexpr bool empty() const { return end == start; }

    [[nodiscard]] friend constexpr bool operator==(index_range const&, index_range const&) = default;
};

namespace oc
{
/// length + index for negative indices, index otherwise (no clamping)
[[nodiscard]] constexpr isize normalize_index(isize index, isize length)
{
    return index < 0 ? length + index : index;
}

/// normalizes, then clamps into [0, length]
[[nodiscard]] constexpr isize clamp_index(isize index, isize length)
{
    auto const i = normalize_index(index, length);
    if (i < 0)
        return 0;
    if (i > length)
        return length;
    return i;
}

/// resolves [start, end) against length
/// both bounds are normalized independently, then clamped; end < start yields an empty range at start
[[nodiscard]] constexpr index_range resolve_range(isize start, isize end, isize length)
{
    auto const s = clamp_index(start, length);
    auto const e = clamp_index(end, length);
    return {s, e < s ? s : e};
}

/// resolves the source range of copy_within
/// a negative start is resolved against a negative end (start = length + end), otherwise against length.
/// With both bounds negative the source range is therefore always empty.
/// An omitted end is passed as length.
[[nodiscard]] constexpr index_range resolve_copy_source(isize start, isize end, isize length)
{
    auto const e = clamp_index(end, length);

    auto s = start;
    if (start < 0)
        s = end < 0 ? e : length + start;

    // s is already normalized here, clamp only
    if (s < 0)
        s = 0;
    if (s > length)
        s = length;

    return {s, e < s ? s : e};
}
} // namespace oc
