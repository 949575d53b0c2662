// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "group_partitioner.hpp"

#include <map>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <iterator>
#include <utility>

#include <boost/optional.hpp>

#include "config/common.hpp"
#include "logging/logging.hpp"
#include "exceptions/bad_column_type_error.hpp"
#include "exceptions/bad_interval_error.hpp"

namespace rangejoin {

namespace {

using Position = Interval::Position;

struct RangeRow
{
    Table::RowIndex row;
    Interval interval;
};

using GroupMap = std::map<GroupKey, std::vector<RangeRow>, GroupKeyLess>;

// Every boundary of a join must be of the first kind seen on either side
class BoundaryReader
{
public:
    // Null and NaN boundaries read as none.
    boost::optional<Position> read(const Table& table, Table::RowIndex row, std::size_t column, Side side);
    
private:
    boost::optional<Coordinate::Kind> kind_;
};

struct CoordinateVisitor : public boost::static_visitor<boost::optional<Position>>
{
    boost::optional<Position> operator()(const Null&) const { return boost::none; }
    boost::optional<Position> operator()(const std::int64_t value) const { return Position {value}; }
    boost::optional<Position> operator()(const double value) const
    {
        if (std::isnan(value)) return boost::none;
        return Position {value};
    }
    boost::optional<Position> operator()(const std::string& value) const { return Position {value}; }
};

boost::optional<Position> BoundaryReader::read(const Table& table, const Table::RowIndex row, const std::size_t column,
                                               const Side side)
{
    const auto& value = table.at(row, column);
    auto result = boost::apply_visitor(CoordinateVisitor {}, value);
    if (result) {
        if (!kind_) {
            kind_ = result->kind();
        } else if (result->kind() != *kind_) {
            throw BadColumnTypeError {table.column_names()[column], to_string(side), row, type_of(value), *kind_};
        }
    }
    return result;
}

GroupKey read_key(const Table& table, const Table::RowIndex row, const std::vector<std::size_t>& key_columns)
{
    GroupKey result {};
    result.reserve(key_columns.size());
    for (const auto column : key_columns) {
        result.push_back(table.at(row, column));
    }
    return result;
}

GroupMap group_rows(const Table& table, const Side side, const JoinSchema& schema, const bool strict,
                    BoundaryReader& boundaries, std::size_t& num_skipped)
{
    GroupMap result {};
    const auto start_column = schema.start_index(side);
    const auto end_column   = schema.end_index(side);
    const auto& key_columns = schema.key_indices(side);
    num_skipped = 0;
    for (Table::RowIndex row {0}; row < table.num_rows(); ++row) {
        const auto start = boundaries.read(table, row, start_column, side);
        const auto end   = boundaries.read(table, row, end_column, side);
        if (!start || !end || *end < *start) {
            if (strict) {
                throw BadIntervalError {to_string(side), row, start, end};
            }
            ++num_skipped;
            continue;
        }
        result[read_key(table, row, key_columns)].push_back({row, Interval {*start, *end}});
    }
    if (num_skipped > 0) {
        logging::WarningLogger log {};
        stream(log) << "Skipped " << num_skipped << " " << to_string(side)
                    << " rows with missing or inverted interval boundaries";
    }
    return result;
}

bool rows_equal(const Table& table, const Table::RowIndex lhs, const Table::RowIndex rhs)
{
    for (std::size_t column {0}; column < table.num_columns(); ++column) {
        if (!value_equal(table.at(lhs, column), table.at(rhs, column))) return false;
    }
    return true;
}

bool row_less(const Table& table, const Table::RowIndex lhs, const Table::RowIndex rhs)
{
    for (std::size_t column {0}; column < table.num_columns(); ++column) {
        const auto& a = table.at(lhs, column);
        const auto& b = table.at(rhs, column);
        if (value_less(a, b)) return true;
        if (value_less(b, a)) return false;
    }
    return false;
}

void append(SortedGroup& group, const RangeRow& range)
{
    group.starts.push_back(range.interval.begin());
    group.ends.push_back(range.interval.end());
    group.rows.push_back(range.row);
    group.counts.push_back(1);
}

SortedGroup make_sorted_group(GroupKey key, std::vector<RangeRow>& ranges, const Table& table, const bool deduplicate)
{
    const auto by_interval = [] (const RangeRow& lhs, const RangeRow& rhs) { return lhs.interval < rhs.interval; };
    if (deduplicate) {
        // Identical rows must be adjacent, and the representative is the first occurrence
        std::sort(std::begin(ranges), std::end(ranges),
                  [&] (const RangeRow& lhs, const RangeRow& rhs) {
                      if (by_interval(lhs, rhs)) return true;
                      if (by_interval(rhs, lhs)) return false;
                      if (row_less(table, lhs.row, rhs.row)) return true;
                      if (row_less(table, rhs.row, lhs.row)) return false;
                      return lhs.row < rhs.row;
                  });
    } else {
        std::stable_sort(std::begin(ranges), std::end(ranges), by_interval);
    }
    SortedGroup result {};
    result.key = std::move(key);
    result.starts.reserve(ranges.size());
    result.ends.reserve(ranges.size());
    result.rows.reserve(ranges.size());
    result.counts.reserve(ranges.size());
    for (const auto& range : ranges) {
        if (deduplicate && !result.empty()
            && result.interval(result.size() - 1) == range.interval
            && rows_equal(table, result.rows.back(), range.row)) {
            ++result.counts.back();
        } else {
            append(result, range);
        }
    }
    return result;
}

} // namespace

GroupPartitioner::GroupPartitioner(const Table& primary, const Table& secondary, const JoinOptions& options)
: schema_ {primary, secondary, options}
, paired_ {}
, primary_only_ {}
, secondary_only_ {}
, primary_skipped_ {0}
, secondary_skipped_ {0}
{
    BoundaryReader boundaries {};
    auto primary_groups   = group_rows(primary, Side::primary, schema_, options.strict, boundaries, primary_skipped_);
    auto secondary_groups = group_rows(secondary, Side::secondary, schema_, options.strict, boundaries, secondary_skipped_);
    const GroupKeyLess key_less {};
    auto primary_itr = std::begin(primary_groups);
    auto secondary_itr = std::begin(secondary_groups);
    while (primary_itr != std::end(primary_groups) || secondary_itr != std::end(secondary_groups)) {
        if (secondary_itr == std::end(secondary_groups)
            || (primary_itr != std::end(primary_groups) && key_less(primary_itr->first, secondary_itr->first))) {
            primary_only_.push_back(make_sorted_group(primary_itr->first, primary_itr->second, primary, options.deduplicate));
            ++primary_itr;
        } else if (primary_itr == std::end(primary_groups) || key_less(secondary_itr->first, primary_itr->first)) {
            secondary_only_.push_back(make_sorted_group(secondary_itr->first, secondary_itr->second, secondary, options.deduplicate));
            ++secondary_itr;
        } else {
            paired_.push_back({make_sorted_group(primary_itr->first, primary_itr->second, primary, options.deduplicate),
                               make_sorted_group(secondary_itr->first, secondary_itr->second, secondary, options.deduplicate)});
            ++primary_itr;
            ++secondary_itr;
        }
    }
    if (auto debug_log = logging::get_debug_log()) {
        stream(*debug_log) << "Partitioned " << primary.num_rows() << " primary and " << secondary.num_rows()
                           << " secondary rows into " << paired_.size() << " paired groups, "
                           << primary_only_.size() << " primary only groups, and "
                           << secondary_only_.size() << " secondary only groups";
    }
}

const JoinSchema& GroupPartitioner::schema() const noexcept
{
    return schema_;
}

const std::vector<GroupPair>& GroupPartitioner::paired_groups() const noexcept
{
    return paired_;
}

const std::vector<SortedGroup>& GroupPartitioner::groups_only_in_primary() const noexcept
{
    return primary_only_;
}

const std::vector<SortedGroup>& GroupPartitioner::groups_only_in_secondary() const noexcept
{
    return secondary_only_;
}

std::size_t GroupPartitioner::num_skipped_rows(const Side side) const noexcept
{
    return side == Side::primary ? primary_skipped_ : secondary_skipped_;
}

} // namespace rangejoin
