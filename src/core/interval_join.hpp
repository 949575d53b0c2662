// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef interval_join_hpp
#define interval_join_hpp

#include "basics/table.hpp"
#include "join_options.hpp"

namespace rangejoin {

/**
 Joins the rows of primary and secondary whose intervals overlap, within groups of equal
 options.by keys.
 
 Output columns are the key columns, then the remaining primary columns, then the remaining
 secondary columns (renamed with options.suffix on collision). Rows without an overlap are
 added null padded as options.how asks.
 */
Table join(const Table& primary, const Table& secondary, const JoinOptions& options = JoinOptions {});

// The primary rows overlapping at least one secondary row, in the primary schema.
Table overlaps(const Table& primary, const Table& secondary, const JoinOptions& options = JoinOptions {});

/**
 The rows overlapping nothing on the other side, in their own schema. options.how selects the
 side: left for primary rows, right for secondary rows. Anything else throws InvalidJoinModeError.
 */
Table nonoverlapping(const Table& primary, const Table& secondary, const JoinOptions& options);

} // namespace rangejoin

#endif
