// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sorted_group_hpp
#define sorted_group_hpp

#include <vector>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <string>
#include <algorithm>
#include <iterator>

#include "basics/interval.hpp"
#include "basics/table.hpp"
#include "basics/value.hpp"

namespace rangejoin {

// Values of the group key columns; empty when the join is ungrouped.
using GroupKey = std::vector<Value>;

// Orders keys with value_less, so NaN key cells form one group of their own.
struct GroupKeyLess
{
    bool operator()(const GroupKey& lhs, const GroupKey& rhs) const noexcept
    {
        return std::lexicographical_compare(std::cbegin(lhs), std::cend(lhs), std::cbegin(rhs), std::cend(rhs),
                                            ValueLess {});
    }
};

inline std::string to_string(const GroupKey& key)
{
    std::string result {};
    for (const auto& value : key) {
        if (!result.empty()) result += ',';
        result += to_string(value);
    }
    return result.empty() ? "*" : result;
}

/**
 The rows of one group on one side of a join, sorted by (start, end). All positions of a join
 are of one Coordinate::Kind.
 
 Each logical row stands for count[i] identical input rows, all represented by the source
 table row rows[i].
 */
struct SortedGroup
{
    using Position = Interval::Position;
    using Count    = std::uint32_t;
    
    GroupKey key;
    std::vector<Position> starts, ends;
    std::vector<Table::RowIndex> rows;
    std::vector<Count> counts;
    
    std::size_t size() const noexcept { return starts.size(); }
    bool empty() const noexcept { return starts.empty(); }
    
    Interval interval(std::size_t i) const { return Interval {starts[i], ends[i]}; }
    
    std::size_t num_input_rows() const
    {
        return std::accumulate(std::cbegin(counts), std::cend(counts), std::size_t {0});
    }
};

// A group present on both sides of the join.
struct GroupPair
{
    SortedGroup primary, secondary;
    
    const GroupKey& key() const noexcept { return primary.key; }
};

} // namespace rangejoin

#endif
