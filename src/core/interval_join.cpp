// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "interval_join.hpp"

#include <vector>
#include <string>
#include <algorithm>
#include <iterator>
#include <utility>

#include "config/common.hpp"
#include "logging/logging.hpp"
#include "utils/thread_pool.hpp"
#include "exceptions/invalid_join_mode_error.hpp"
#include "join_schema.hpp"
#include "sorted_group.hpp"
#include "group_partitioner.hpp"
#include "overlap_matcher.hpp"
#include "overlap_expander.hpp"
#include "missing_overlaps.hpp"

namespace rangejoin {

namespace {

struct PairedGroupResult
{
    std::vector<JoinedRow> matched, missing_primary, missing_secondary;
};

void log_group(const GroupPair& pair, const MatchIndices& indices, const std::vector<OverlapPair>& pairs,
               const PairedGroupResult& result)
{
    if (auto trace_log = logging::get_trace_log()) {
        stream(*trace_log) << "Group " << to_string(pair.key()) << ": " << pair.primary.size() << " primary and "
                           << pair.secondary.size() << " secondary sorted rows, "
                           << num_candidate_pairs(indices) << " candidate pairs, " << pairs.size()
                           << " overlapping pairs, " << result.matched.size() << " matched rows, "
                           << result.missing_primary.size() << " missing primary rows, "
                           << result.missing_secondary.size() << " missing secondary rows";
    }
}

PairedGroupResult join_group(const GroupPair& pair, const JoinOptions& options)
{
    const auto indices = find_match_indices(pair, closure(options));
    const auto pairs = expand_windows(pair, indices, closure(options));
    PairedGroupResult result {};
    result.matched = expand_multiplicities(pair, pairs);
    if (includes_missing_primary(options.how)) {
        result.missing_primary = missing_primary_rows(pair, pairs);
    }
    if (includes_missing_secondary(options.how)) {
        result.missing_secondary = missing_secondary_rows(pair, pairs);
    }
    log_group(pair, indices, pairs, result);
    return result;
}

std::vector<PairedGroupResult> join_groups(const std::vector<GroupPair>& groups, const JoinOptions& options)
{
    const auto op = [&options] (const GroupPair& pair) { return join_group(pair, options); };
    if (options.threads > 1 && groups.size() > 1) {
        ThreadPool pool {std::min(static_cast<std::size_t>(options.threads), groups.size())};
        return ordered_transform(pool, groups, op);
    }
    std::vector<PairedGroupResult> result {};
    result.reserve(groups.size());
    std::transform(std::cbegin(groups), std::cend(groups), std::back_inserter(result), op);
    return result;
}

template <typename T>
void append(std::vector<T>&& src, std::vector<T>& dst)
{
    dst.insert(std::end(dst), std::make_move_iterator(std::begin(src)), std::make_move_iterator(std::end(src)));
}

const Value& null_value()
{
    static const Value result {Null {}};
    return result;
}

const Value& lookup(const Table& table, const boost::optional<Table::RowIndex>& row,
                    const boost::optional<std::size_t>& column)
{
    if (row && column) return table.at(*row, *column);
    return null_value();
}

Table materialise(const JoinSchema& schema, const Table& primary, const Table& secondary,
                  const std::vector<JoinedRow>& rows)
{
    std::vector<Table::Column> columns {};
    columns.reserve(schema.output_columns().size());
    for (const auto& column : schema.output_columns()) {
        Table::Column values {};
        values.reserve(rows.size());
        for (const auto& row : rows) {
            if (column.role == FieldRole::group_key) {
                values.push_back(row.primary ? lookup(primary, row.primary, column.primary_index)
                                             : lookup(secondary, row.secondary, column.secondary_index));
            } else if (column.primary_index) {
                values.push_back(lookup(primary, row.primary, column.primary_index));
            } else {
                values.push_back(lookup(secondary, row.secondary, column.secondary_index));
            }
        }
        columns.push_back(std::move(values));
    }
    return Table {schema.output_column_names(), std::move(columns)};
}

// Copies the given rows of one side in that side's own schema.
Table select_rows(const Table& table, const std::vector<JoinedRow>& rows, const Side side)
{
    Table result {table.column_names()};
    result.reserve_rows(rows.size());
    for (const auto& row : rows) {
        result.add_row(table.row(side == Side::primary ? *row.primary : *row.secondary));
    }
    return result;
}

// Only a side kept whole by the join type can contribute rows when the other side is empty
bool has_output_rows(const Table& primary, const Table& secondary, const JoinType how) noexcept
{
    if (!primary.empty() && !secondary.empty()) return true;
    return (includes_missing_primary(how) && !primary.empty())
        || (includes_missing_secondary(how) && !secondary.empty());
}

void log_partition(const GroupPartitioner& partitioner)
{
    if (auto debug_log = logging::get_debug_log()) {
        stream(*debug_log) << "Skipped " << partitioner.num_skipped_rows(Side::primary) << " primary and "
                           << partitioner.num_skipped_rows(Side::secondary) << " secondary rows";
    }
}

void log_result(const std::string& operation, const Table& result)
{
    if (auto debug_log = logging::get_debug_log()) {
        stream(*debug_log) << operation << " produced " << result.num_rows() << " rows with "
                           << result.num_columns() << " columns";
    }
}

} // namespace

Table join(const Table& primary, const Table& secondary, const JoinOptions& options)
{
    const JoinSchema schema {primary, secondary, options};
    if (!has_output_rows(primary, secondary, options.how)) {
        if (auto debug_log = logging::get_debug_log()) {
            stream(*debug_log) << options.how << " join of " << primary.num_rows() << " primary and "
                               << secondary.num_rows() << " secondary rows has no rows";
        }
        return Table {schema.output_column_names()};
    }
    const GroupPartitioner partitioner {primary, secondary, options};
    log_partition(partitioner);
    std::vector<PairedGroupResult> group_results {};
    if (partitioner.paired_groups().empty()) {
        if (auto debug_log = logging::get_debug_log()) {
            stream(*debug_log) << "No groups on both sides, padding unpaired rows only";
        }
    } else {
        group_results = join_groups(partitioner.paired_groups(), options);
    }
    std::vector<JoinedRow> matched {}, missing {};
    for (auto& group_result : group_results) {
        append(std::move(group_result.matched), matched);
    }
    if (includes_missing_primary(options.how)) {
        for (auto& group_result : group_results) {
            append(std::move(group_result.missing_primary), missing);
        }
        for (const auto& group : partitioner.groups_only_in_primary()) {
            append(unpaired_rows(group, Side::primary), missing);
        }
    }
    if (includes_missing_secondary(options.how)) {
        for (auto& group_result : group_results) {
            append(std::move(group_result.missing_secondary), missing);
        }
        for (const auto& group : partitioner.groups_only_in_secondary()) {
            append(unpaired_rows(group, Side::secondary), missing);
        }
    }
    if (auto debug_log = logging::get_debug_log()) {
        stream(*debug_log) << "Found " << matched.size() << " matched and " << missing.size()
                           << " missing rows for " << options.how << " join";
    }
    std::vector<JoinedRow> rows {};
    rows.reserve(matched.size() + missing.size());
    if (options.nulls_last) {
        append(std::move(matched), rows);
        append(std::move(missing), rows);
    } else {
        append(std::move(missing), rows);
        append(std::move(matched), rows);
    }
    auto result = materialise(partitioner.schema(), primary, secondary, rows);
    log_result("join", result);
    return result;
}

Table overlaps(const Table& primary, const Table& secondary, const JoinOptions& options)
{
    const GroupPartitioner partitioner {primary, secondary, options};
    log_partition(partitioner);
    std::vector<JoinedRow> rows {};
    for (const auto& pair : partitioner.paired_groups()) {
        const auto pairs = expand_windows(pair, find_match_indices(pair, closure(options)), closure(options));
        std::vector<std::size_t> matched(pairs.size());
        std::transform(std::cbegin(pairs), std::cend(pairs), std::begin(matched),
                       [] (const OverlapPair& p) { return p.primary; });
        // pairs are sorted by primary position
        matched.erase(std::unique(std::begin(matched), std::end(matched)), std::end(matched));
        for (const auto position : matched) {
            JoinedRow row {};
            row.primary = pair.primary.rows[position];
            rows.insert(std::end(rows), pair.primary.counts[position], row);
        }
    }
    auto result = select_rows(primary, rows, Side::primary);
    log_result("overlaps", result);
    return result;
}

Table nonoverlapping(const Table& primary, const Table& secondary, const JoinOptions& options)
{
    if (options.how != JoinType::left && options.how != JoinType::right) {
        throw InvalidJoinModeError {to_string(options.how), "nonoverlapping"};
    }
    const auto side = options.how == JoinType::left ? Side::primary : Side::secondary;
    const GroupPartitioner partitioner {primary, secondary, options};
    log_partition(partitioner);
    std::vector<JoinedRow> rows {};
    for (const auto& pair : partitioner.paired_groups()) {
        const auto pairs = expand_windows(pair, find_match_indices(pair, closure(options)), closure(options));
        append(side == Side::primary ? missing_primary_rows(pair, pairs) : missing_secondary_rows(pair, pairs), rows);
    }
    const auto& unpaired = side == Side::primary ? partitioner.groups_only_in_primary() : partitioner.groups_only_in_secondary();
    for (const auto& group : unpaired) {
        append(unpaired_rows(group, side), rows);
    }
    auto result = select_rows(side == Side::primary ? primary : secondary, rows, side);
    log_result("nonoverlapping", result);
    return result;
}

} // namespace rangejoin
