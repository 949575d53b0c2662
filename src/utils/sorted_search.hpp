// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sorted_search_hpp
#define sorted_search_hpp

#include <vector>
#include <cstddef>
#include <algorithm>
#include <iterator>

namespace rangejoin {

enum class SearchSide { leftmost, rightmost };

/**
 Returns the insertion point of value into the sorted range [first, last).
 
 leftmost gives the first position i with !(range[i] < value), rightmost the first position
 with value < range[i].
 */
template <typename RandomIt, typename T>
std::size_t search_sorted(RandomIt first, RandomIt last, const T& value, const SearchSide side)
{
    const auto itr = side == SearchSide::leftmost ? std::lower_bound(first, last, value)
                                                  : std::upper_bound(first, last, value);
    return static_cast<std::size_t>(std::distance(first, itr));
}

template <typename T>
std::size_t search_sorted(const std::vector<T>& sorted, const T& value, const SearchSide side)
{
    return search_sorted(std::cbegin(sorted), std::cend(sorted), value, side);
}

template <typename T>
std::vector<std::size_t> search_sorted(const std::vector<T>& sorted, const std::vector<T>& values,
                                       const SearchSide side)
{
    std::vector<std::size_t> result(values.size());
    std::transform(std::cbegin(values), std::cend(values), std::begin(result),
                   [&] (const T& value) { return search_sorted(sorted, value, side); });
    return result;
}

} // namespace rangejoin

#endif
