// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "overlap_matcher.hpp"

#include <numeric>
#include <iterator>

#include "utils/sorted_search.hpp"

namespace rangejoin {

namespace {

SearchSide end_side(const IntervalClosure closure) noexcept
{
    return closure == IntervalClosure::closed ? SearchSide::rightmost : SearchSide::leftmost;
}

std::vector<MatchWindow> make_windows(const std::vector<std::size_t>& lows, const std::vector<std::size_t>& highs)
{
    std::vector<MatchWindow> result {};
    result.reserve(lows.size());
    for (std::size_t i {0}; i < lows.size(); ++i) {
        result.push_back({lows[i], highs[i]});
    }
    return result;
}

void fill_masks(const std::vector<MatchWindow>& windows, std::vector<bool>& mask, std::vector<std::size_t>& lengths)
{
    mask.reserve(windows.size());
    lengths.reserve(windows.size());
    for (const auto& window : windows) {
        mask.push_back(!window.empty());
        lengths.push_back(window.size());
    }
}

} // namespace

MatchIndices find_match_indices(const GroupPair& pair, const IntervalClosure closure)
{
    const auto& primary   = pair.primary;
    const auto& secondary = pair.secondary;
    MatchIndices result {};
    result.primary_windows = make_windows(search_sorted(secondary.starts, primary.starts, SearchSide::leftmost),
                                          search_sorted(secondary.starts, primary.ends, end_side(closure)));
    result.secondary_windows = make_windows(search_sorted(primary.starts, secondary.starts, SearchSide::rightmost),
                                            search_sorted(primary.starts, secondary.ends, end_side(closure)));
    fill_masks(result.primary_windows, result.mask_in_primary, result.primary_lengths);
    fill_masks(result.secondary_windows, result.mask_in_secondary, result.secondary_lengths);
    return result;
}

std::size_t num_candidate_pairs(const MatchIndices& indices) noexcept
{
    const auto primary_total = std::accumulate(std::cbegin(indices.primary_lengths), std::cend(indices.primary_lengths),
                                               std::size_t {0});
    return std::accumulate(std::cbegin(indices.secondary_lengths), std::cend(indices.secondary_lengths), primary_total);
}

} // namespace rangejoin
