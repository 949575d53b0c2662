// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef overlap_matcher_hpp
#define overlap_matcher_hpp

#include <vector>
#include <cstddef>

#include "basics/interval.hpp"
#include "sorted_group.hpp"

namespace rangejoin {

// Positions [low, high) of the other side of a GroupPair.
struct MatchWindow
{
    std::size_t low, high;
    
    std::size_t size() const noexcept { return high > low ? high - low : 0; }
    bool empty() const noexcept { return !(high > low); }
};

/**
 The candidate overlaps of a GroupPair, searched from both sides.
 
 primary_windows[i] indexes the secondary rows starting at or after primary row i and inside it;
 secondary_windows[j] indexes the primary rows starting strictly after secondary row j and inside
 it. Every overlapping pair therefore lies in exactly one window.
 */
struct MatchIndices
{
    std::vector<MatchWindow> primary_windows, secondary_windows;
    std::vector<bool> mask_in_primary, mask_in_secondary;
    std::vector<std::size_t> primary_lengths, secondary_lengths;
};

MatchIndices find_match_indices(const GroupPair& pair, IntervalClosure closure = IntervalClosure::half_open);

std::size_t num_candidate_pairs(const MatchIndices& indices) noexcept;

} // namespace rangejoin

#endif
