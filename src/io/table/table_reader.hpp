// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef table_reader_hpp
#define table_reader_hpp

#include <string>

#include <boost/filesystem/path.hpp>

#include "basics/value.hpp"
#include "basics/table.hpp"

namespace rangejoin { namespace io {

/**
 Converts a single delimited field to a Value: an empty field, NA, or . is null, then the
 first of integer, real, or string that consumes the whole field.
 */
Value parse_cell(const std::string& field);

// Reads a delimited file with a header line of unique column names.
Table read_table(const boost::filesystem::path& table_file, char delimiter = '\t');

} // namespace io
} // namespace rangejoin

#endif
