// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef missing_overlaps_hpp
#define missing_overlaps_hpp

#include <vector>
#include <cstddef>

#include "join_schema.hpp"
#include "sorted_group.hpp"
#include "overlap_expander.hpp"

namespace rangejoin {

/**
 Returns the positions [0, group_size) that do not appear in matched, in ascending order.
 matched need not be sorted and may contain repeats.
 */
std::vector<std::size_t> unmatched_positions(std::size_t group_size, const std::vector<std::size_t>& matched);

// The primary rows of pair in no overlap, secondary side absent, one row per duplicate.
std::vector<JoinedRow> missing_primary_rows(const GroupPair& pair, const std::vector<OverlapPair>& pairs);

// The secondary rows of pair in no overlap, primary side absent, one row per duplicate.
std::vector<JoinedRow> missing_secondary_rows(const GroupPair& pair, const std::vector<OverlapPair>& pairs);

// Every row of a group that has no counterpart group on the other side.
std::vector<JoinedRow> unpaired_rows(const SortedGroup& group, Side side);

} // namespace rangejoin

#endif
