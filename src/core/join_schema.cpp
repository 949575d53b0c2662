// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "join_schema.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>
#include <stdexcept>
#include <utility>

#include "exceptions/missing_column_error.hpp"

namespace rangejoin {

std::string to_string(const Side side)
{
    return side == Side::primary ? "primary" : "secondary";
}

namespace {

std::size_t require_column(const Table& table, const std::string& name, const Side side)
{
    const auto result = table.find_column(name);
    if (!result) {
        throw MissingColumnError {name, to_string(side), "JoinSchema"};
    }
    return *result;
}

std::vector<std::string> unique_keys(const JoinOptions& options)
{
    std::vector<std::string> result {};
    if (options.by) {
        for (const auto& key : *options.by) {
            if (std::find(std::cbegin(result), std::cend(result), key) == std::cend(result)) {
                result.push_back(key);
            }
        }
    }
    return result;
}

bool contains(const std::vector<std::size_t>& indices, const std::size_t index)
{
    return std::find(std::cbegin(indices), std::cend(indices), index) != std::cend(indices);
}

FieldRole role_of(const std::size_t column, const std::size_t start, const std::size_t end, const Side side)
{
    if (side == Side::primary) {
        if (column == start) return FieldRole::primary_start;
        if (column == end) return FieldRole::primary_end;
        return FieldRole::primary_payload;
    } else {
        if (column == start) return FieldRole::secondary_start;
        if (column == end) return FieldRole::secondary_end;
        return FieldRole::secondary_payload;
    }
}

} // namespace

JoinSchema::JoinSchema(const Table& primary, const Table& secondary, const JoinOptions& options)
: grouped_ {options.by && !options.by->empty()}
{
    const auto keys = unique_keys(options);
    primary_.start = require_column(primary, options.start_column, Side::primary);
    primary_.end   = require_column(primary, options.end_column, Side::primary);
    for (const auto& key : keys) primary_.keys.push_back(require_column(primary, key, Side::primary));
    secondary_.start = require_column(secondary, options.start_column, Side::secondary);
    secondary_.end   = require_column(secondary, options.end_column, Side::secondary);
    for (const auto& key : keys) secondary_.keys.push_back(require_column(secondary, key, Side::secondary));
    
    std::unordered_set<std::string> used_names {};
    for (std::size_t i {0}; i < keys.size(); ++i) {
        output_.push_back({keys[i], FieldRole::group_key, primary_.keys[i], secondary_.keys[i]});
        used_names.insert(keys[i]);
    }
    const auto& primary_names = primary.column_names();
    for (std::size_t column {0}; column < primary_names.size(); ++column) {
        if (contains(primary_.keys, column)) continue;
        output_.push_back({primary_names[column], role_of(column, primary_.start, primary_.end, Side::primary),
                           column, boost::none});
        used_names.insert(primary_names[column]);
    }
    const auto& secondary_names = secondary.column_names();
    for (std::size_t column {0}; column < secondary_names.size(); ++column) {
        if (contains(secondary_.keys, column)) continue;
        auto name = secondary_names[column];
        if (used_names.count(name) > 0 && options.suffix.empty()) {
            throw std::invalid_argument {"JoinSchema: an empty suffix cannot disambiguate column '" + name + "'"};
        }
        while (used_names.count(name) > 0) name += options.suffix;
        used_names.insert(name);
        output_.push_back({std::move(name), role_of(column, secondary_.start, secondary_.end, Side::secondary),
                           boost::none, column});
    }
}

const JoinSchema::SideFields& JoinSchema::fields(const Side side) const noexcept
{
    return side == Side::primary ? primary_ : secondary_;
}

std::size_t JoinSchema::start_index(const Side side) const noexcept
{
    return fields(side).start;
}

std::size_t JoinSchema::end_index(const Side side) const noexcept
{
    return fields(side).end;
}

const std::vector<std::size_t>& JoinSchema::key_indices(const Side side) const noexcept
{
    return fields(side).keys;
}

bool JoinSchema::is_grouped() const noexcept
{
    return grouped_;
}

const std::vector<OutputColumn>& JoinSchema::output_columns() const noexcept
{
    return output_;
}

std::vector<std::string> JoinSchema::output_column_names() const
{
    std::vector<std::string> result {};
    result.reserve(output_.size());
    std::transform(std::cbegin(output_), std::cend(output_), std::back_inserter(result),
                   [] (const OutputColumn& column) { return column.name; });
    return result;
}

} // namespace rangejoin
