// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef group_partitioner_hpp
#define group_partitioner_hpp

#include <vector>
#include <cstddef>

#include "basics/table.hpp"
#include "join_options.hpp"
#include "join_schema.hpp"
#include "sorted_group.hpp"

namespace rangejoin {

/**
 GroupPartitioner splits the two sides of a join into groups by key, sorts every group by
 (start, end), and pairs up the groups present on both sides.
 
 All validation happens on construction, before any matching work: missing columns throw
 MissingColumnError, and boundaries that mix numbers with strings throw BadColumnTypeError.
 If options.strict, null, NaN or inverted boundaries throw BadIntervalError, otherwise such
 rows are left out.
 
 Key cells are grouped by value_equal, so null keys form one group and NaN keys another.
 
 With options.deduplicate, rows identical in every column are collapsed into one logical row
 carrying the number of duplicates.
 */
class GroupPartitioner
{
public:
    GroupPartitioner() = delete;
    
    GroupPartitioner(const Table& primary, const Table& secondary, const JoinOptions& options);
    
    GroupPartitioner(const GroupPartitioner&)            = default;
    GroupPartitioner& operator=(const GroupPartitioner&) = default;
    GroupPartitioner(GroupPartitioner&&)                 = default;
    GroupPartitioner& operator=(GroupPartitioner&&)      = default;
    
    ~GroupPartitioner() = default;
    
    const JoinSchema& schema() const noexcept;
    
    // Ordered by group key
    const std::vector<GroupPair>& paired_groups() const noexcept;
    const std::vector<SortedGroup>& groups_only_in_primary() const noexcept;
    const std::vector<SortedGroup>& groups_only_in_secondary() const noexcept;
    
    std::size_t num_skipped_rows(Side side) const noexcept;
    
private:
    JoinSchema schema_;
    std::vector<GroupPair> paired_;
    std::vector<SortedGroup> primary_only_, secondary_only_;
    std::size_t primary_skipped_, secondary_skipped_;
};

} // namespace rangejoin

#endif
