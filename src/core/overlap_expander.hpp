// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef overlap_expander_hpp
#define overlap_expander_hpp

#include <vector>
#include <cstddef>
#include <ostream>

#include <boost/optional.hpp>

#include "basics/interval.hpp"
#include "basics/table.hpp"
#include "sorted_group.hpp"
#include "overlap_matcher.hpp"

namespace rangejoin {

// Positions into the sorted primary and secondary groups of a GroupPair.
struct OverlapPair
{
    std::size_t primary, secondary;
};

bool operator==(const OverlapPair& lhs, const OverlapPair& rhs) noexcept;
inline bool operator!=(const OverlapPair& lhs, const OverlapPair& rhs) noexcept
{
    return !(lhs == rhs);
}
bool operator<(const OverlapPair& lhs, const OverlapPair& rhs) noexcept;
std::ostream& operator<<(std::ostream& os, const OverlapPair& pair);

// One output row as source table rows. An absent side is null padded.
struct JoinedRow
{
    boost::optional<Table::RowIndex> primary, secondary;
};

bool operator==(const JoinedRow& lhs, const JoinedRow& rhs) noexcept;
inline bool operator!=(const JoinedRow& lhs, const JoinedRow& rhs) noexcept
{
    return !(lhs == rhs);
}
std::ostream& operator<<(std::ostream& os, const JoinedRow& row);

/**
 Pairs every row with each row in its match window and returns the overlapping pairs sorted by
 (primary, secondary).
 
 With half-open closure window entries involving a zero-length interval are dropped, as such an
 interval overlaps nothing.
 */
std::vector<OverlapPair> expand_windows(const GroupPair& pair, const MatchIndices& indices,
                                        IntervalClosure closure = IntervalClosure::half_open);

// Emits count(primary) * count(secondary) rows for each pair.
std::vector<JoinedRow> expand_multiplicities(const GroupPair& pair, const std::vector<OverlapPair>& pairs);

} // namespace rangejoin

#endif
