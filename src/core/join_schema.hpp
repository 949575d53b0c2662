// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef join_schema_hpp
#define join_schema_hpp

#include <vector>
#include <string>
#include <cstddef>

#include <boost/optional.hpp>

#include "basics/table.hpp"
#include "join_options.hpp"

namespace rangejoin {

enum class Side { primary, secondary };

std::string to_string(Side side);

enum class FieldRole
{
    group_key,
    primary_start, primary_end, primary_payload,
    secondary_start, secondary_end, secondary_payload
};

/**
 One column of a join result. Group key columns are sourced from whichever side a row has,
 every other column from exactly one side.
 */
struct OutputColumn
{
    std::string name;
    FieldRole role;
    boost::optional<std::size_t> primary_index, secondary_index;
};

/**
 JoinSchema resolves, once, every column a join needs from its two input tables: the interval
 boundaries and group keys of each side, and the layout and names of the result columns.
 
 The result is laid out as group keys, then the remaining primary columns, then the remaining
 secondary columns. A secondary column whose name is already taken has the suffix appended
 until it is unique.
 
 Construction throws MissingColumnError if any referenced column is absent.
 */
class JoinSchema
{
public:
    JoinSchema() = delete;
    
    JoinSchema(const Table& primary, const Table& secondary, const JoinOptions& options);
    
    JoinSchema(const JoinSchema&)            = default;
    JoinSchema& operator=(const JoinSchema&) = default;
    JoinSchema(JoinSchema&&)                 = default;
    JoinSchema& operator=(JoinSchema&&)      = default;
    
    ~JoinSchema() = default;
    
    std::size_t start_index(Side side) const noexcept;
    std::size_t end_index(Side side) const noexcept;
    const std::vector<std::size_t>& key_indices(Side side) const noexcept;
    
    bool is_grouped() const noexcept;
    
    const std::vector<OutputColumn>& output_columns() const noexcept;
    std::vector<std::string> output_column_names() const;
    
private:
    struct SideFields
    {
        std::size_t start, end;
        std::vector<std::size_t> keys;
    };
    
    SideFields primary_, secondary_;
    bool grouped_;
    std::vector<OutputColumn> output_;
    
    const SideFields& fields(Side side) const noexcept;
};

} // namespace rangejoin

#endif
