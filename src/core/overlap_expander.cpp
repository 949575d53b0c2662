// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "overlap_expander.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>

namespace rangejoin {

bool operator==(const OverlapPair& lhs, const OverlapPair& rhs) noexcept
{
    return lhs.primary == rhs.primary && lhs.secondary == rhs.secondary;
}

bool operator<(const OverlapPair& lhs, const OverlapPair& rhs) noexcept
{
    return lhs.primary < rhs.primary || (lhs.primary == rhs.primary && lhs.secondary < rhs.secondary);
}

std::ostream& operator<<(std::ostream& os, const OverlapPair& pair)
{
    os << '(' << pair.primary << ',' << pair.secondary << ')';
    return os;
}

bool operator==(const JoinedRow& lhs, const JoinedRow& rhs) noexcept
{
    return lhs.primary == rhs.primary && lhs.secondary == rhs.secondary;
}

namespace {

void print(std::ostream& os, const boost::optional<Table::RowIndex>& row)
{
    if (row) {
        os << *row;
    } else {
        os << "NA";
    }
}

bool is_zero_length(const SortedGroup& group, const std::size_t i) noexcept
{
    return is_empty(group.interval(i));
}

} // namespace

std::ostream& operator<<(std::ostream& os, const JoinedRow& row)
{
    os << '(';
    print(os, row.primary);
    os << ',';
    print(os, row.secondary);
    os << ')';
    return os;
}

std::vector<OverlapPair> expand_windows(const GroupPair& pair, const MatchIndices& indices, const IntervalClosure closure)
{
    const auto& primary   = pair.primary;
    const auto& secondary = pair.secondary;
    const bool drop_empty {closure == IntervalClosure::half_open};
    std::vector<OverlapPair> result {};
    result.reserve(num_candidate_pairs(indices));
    for (std::size_t i {0}; i < indices.primary_windows.size(); ++i) {
        if (!indices.mask_in_primary[i]) continue;
        if (drop_empty && is_zero_length(primary, i)) continue;
        const auto& window = indices.primary_windows[i];
        for (auto j = window.low; j < window.high; ++j) {
            if (drop_empty && is_zero_length(secondary, j)) continue;
            result.push_back({i, j});
        }
    }
    for (std::size_t j {0}; j < indices.secondary_windows.size(); ++j) {
        if (!indices.mask_in_secondary[j]) continue;
        if (drop_empty && is_zero_length(secondary, j)) continue;
        const auto& window = indices.secondary_windows[j];
        for (auto i = window.low; i < window.high; ++i) {
            if (drop_empty && is_zero_length(primary, i)) continue;
            result.push_back({i, j});
        }
    }
    std::sort(std::begin(result), std::end(result));
    return result;
}

std::vector<JoinedRow> expand_multiplicities(const GroupPair& pair, const std::vector<OverlapPair>& pairs)
{
    const auto& primary   = pair.primary;
    const auto& secondary = pair.secondary;
    const auto num_rows = std::accumulate(std::cbegin(pairs), std::cend(pairs), std::size_t {0},
                                          [&] (auto curr, const OverlapPair& p) {
                                              return curr + std::size_t {primary.counts[p.primary]} * secondary.counts[p.secondary];
                                          });
    std::vector<JoinedRow> result {};
    result.reserve(num_rows);
    for (const auto& p : pairs) {
        const auto n = std::size_t {primary.counts[p.primary]} * secondary.counts[p.secondary];
        result.insert(std::end(result), n, JoinedRow {primary.rows[p.primary], secondary.rows[p.secondary]});
    }
    return result;
}

} // namespace rangejoin
