// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "table_reader.hpp"

#include <vector>
#include <fstream>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>

#include "config/common.hpp"
#include "logging/logging.hpp"
#include "exceptions/missing_file_error.hpp"
#include "exceptions/malformed_file_error.hpp"
#include "utils/string_utils.hpp"

namespace rangejoin { namespace io {

class MissingTableFile : public MissingFileError
{
    std::string do_where() const override { return "read_table"; }
public:
    MissingTableFile(boost::filesystem::path p) : MissingFileError {std::move(p), "table"} {};
};

class MalformedTableFile : public MalformedFileError
{
    std::string do_where() const override { return "read_table"; }
    std::string do_help() const override
    {
        return "check the file has a header line of unique column names and the same number of fields on every line";
    }
public:
    MalformedTableFile(boost::filesystem::path file) : MalformedFileError {std::move(file), "delimited table"} {}
};

namespace {

struct Line
{
    std::string line_data;
    operator std::string() const { return line_data; }
};

std::istream& operator>>(std::istream& is, Line& data)
{
    std::getline(is, data.line_data);
    if (!data.line_data.empty() && data.line_data.back() == '\r') {
        data.line_data.pop_back();
    }
    return is;
}

bool is_null_token(const std::string& field) noexcept
{
    return field.empty() || field == "NA" || field == ".";
}

auto make_error(const boost::filesystem::path& file, std::string reason, const std::size_t line_number)
{
    MalformedTableFile result {file};
    result.set_reason(std::move(reason));
    result.set_line_number(line_number);
    return result;
}

} // namespace

Value parse_cell(const std::string& field)
{
    if (is_null_token(field)) return Null {};
    std::int64_t integer;
    if (boost::conversion::try_lexical_convert(field, integer)) return integer;
    double real;
    if (boost::conversion::try_lexical_convert(field, real)) return real;
    return field;
}

Table read_table(const boost::filesystem::path& table_file, const char delimiter)
{
    if (!boost::filesystem::exists(table_file)) {
        throw MissingTableFile {table_file};
    }
    std::ifstream table_stream {table_file.string()};
    Line line {};
    std::size_t line_number {1};
    if (!(table_stream >> line) || line.line_data.empty()) {
        throw make_error(table_file, "no header line", line_number);
    }
    auto names = utils::split(line.line_data, delimiter);
    std::vector<Table::Column> columns(names.size());
    while (table_stream >> line) {
        ++line_number;
        if (line.line_data.empty()) continue;
        const auto fields = utils::split(line.line_data, delimiter);
        if (fields.size() != names.size()) {
            throw make_error(table_file, "expected " + std::to_string(names.size()) + " fields but found "
                             + std::to_string(fields.size()), line_number);
        }
        for (std::size_t i {0}; i < fields.size(); ++i) {
            columns[i].push_back(parse_cell(fields[i]));
        }
    }
    try {
        Table result {std::move(names), std::move(columns)};
        if (auto debug_log = logging::get_debug_log()) {
            stream(*debug_log) << "Read " << result.num_rows() << " rows and " << result.num_columns()
                               << " columns from " << table_file;
        }
        return result;
    } catch (const std::invalid_argument& e) {
        throw make_error(table_file, e.what(), 1);
    }
}

} // namespace io
} // namespace rangejoin
