// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "missing_overlaps.hpp"

#include <algorithm>
#include <iterator>

namespace rangejoin {

std::vector<std::size_t> unmatched_positions(const std::size_t group_size, const std::vector<std::size_t>& matched)
{
    std::vector<bool> is_matched(group_size, false);
    for (const auto position : matched) {
        if (position < group_size) is_matched[position] = true;
    }
    std::vector<std::size_t> result {};
    for (std::size_t position {0}; position < group_size; ++position) {
        if (!is_matched[position]) result.push_back(position);
    }
    return result;
}

namespace {

JoinedRow make_row(const Table::RowIndex row, const Side side)
{
    JoinedRow result {};
    if (side == Side::primary) {
        result.primary = row;
    } else {
        result.secondary = row;
    }
    return result;
}

void append_rows(const SortedGroup& group, const std::vector<std::size_t>& positions, const Side side,
                 std::vector<JoinedRow>& result)
{
    for (const auto position : positions) {
        result.insert(std::end(result), group.counts[position], make_row(group.rows[position], side));
    }
}

std::vector<std::size_t> matched_positions(const std::vector<OverlapPair>& pairs, const Side side)
{
    std::vector<std::size_t> result(pairs.size());
    std::transform(std::cbegin(pairs), std::cend(pairs), std::begin(result),
                   [side] (const OverlapPair& pair) { return side == Side::primary ? pair.primary : pair.secondary; });
    return result;
}

std::vector<JoinedRow> missing_rows(const SortedGroup& group, const std::vector<OverlapPair>& pairs, const Side side)
{
    std::vector<JoinedRow> result {};
    append_rows(group, unmatched_positions(group.size(), matched_positions(pairs, side)), side, result);
    return result;
}

} // namespace

std::vector<JoinedRow> missing_primary_rows(const GroupPair& pair, const std::vector<OverlapPair>& pairs)
{
    return missing_rows(pair.primary, pairs, Side::primary);
}

std::vector<JoinedRow> missing_secondary_rows(const GroupPair& pair, const std::vector<OverlapPair>& pairs)
{
    return missing_rows(pair.secondary, pairs, Side::secondary);
}

std::vector<JoinedRow> unpaired_rows(const SortedGroup& group, const Side side)
{
    std::vector<JoinedRow> result {};
    result.reserve(group.num_input_rows());
    for (std::size_t position {0}; position < group.size(); ++position) {
        result.insert(std::end(result), group.counts[position], make_row(group.rows[position], side));
    }
    return result;
}

} // namespace rangejoin
