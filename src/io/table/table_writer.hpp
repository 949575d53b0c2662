// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef table_writer_hpp
#define table_writer_hpp

#include <ostream>

#include <boost/filesystem/path.hpp>

#include "basics/table.hpp"

namespace rangejoin { namespace io {

// Writes a header line then one line per row; nulls are written as NA.
void write_table(const Table& table, std::ostream& os, char delimiter = '\t');

void write_table(const Table& table, const boost::filesystem::path& table_file, char delimiter = '\t');

} // namespace io
} // namespace rangejoin

#endif
