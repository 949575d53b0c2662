// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "table_writer.hpp"

#include <fstream>
#include <cstddef>
#include <utility>

#include "exceptions/unwritable_file_error.hpp"
#include "utils/string_utils.hpp"

namespace rangejoin { namespace io {

class UnwritableTableFile : public UnwritableFileError
{
    std::string do_where() const override { return "write_table"; }
public:
    UnwritableTableFile(boost::filesystem::path p) : UnwritableFileError {std::move(p), "table"} {};
};

void write_table(const Table& table, std::ostream& os, const char delimiter)
{
    os << utils::join(table.column_names(), delimiter) << '\n';
    for (Table::RowIndex row {0}; row < table.num_rows(); ++row) {
        for (std::size_t column {0}; column < table.num_columns(); ++column) {
            if (column > 0) os << delimiter;
            print(os, table.at(row, column));
        }
        os << '\n';
    }
}

void write_table(const Table& table, const boost::filesystem::path& table_file, const char delimiter)
{
    std::ofstream table_stream {table_file.string()};
    if (!table_stream) {
        throw UnwritableTableFile {table_file};
    }
    write_table(table, table_stream, delimiter);
    table_stream.flush();
    if (!table_stream) {
        throw UnwritableTableFile {table_file};
    }
}

} // namespace io
} // namespace rangejoin
