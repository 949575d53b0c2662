// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_collation.hpp"

#include <string>
#include <vector>

#include <boost/filesystem/operations.hpp>

#include "utils/string_utils.hpp"
#include "logging/logging.hpp"

namespace rangejoin { namespace options {

bool is_set(const std::string& option, const OptionMap& options) noexcept
{
    return options.count(option) == 1;
}

// unsigned are banned from the option map to prevent user input errors, but once the option
// map is passed they are all safe
unsigned as_unsigned(const std::string& option, const OptionMap& options)
{
    return static_cast<unsigned>(options.at(option).as<int>());
}

bool is_run_command(const OptionMap& options)
{
    return !is_set("help", options) && !is_set("version", options);
}

bool is_debug_mode(const OptionMap& options)
{
    return is_set("debug", options);
}

bool is_trace_mode(const OptionMap& options)
{
    return is_set("trace", options);
}

namespace {

fs::path resolve_path(const fs::path& path)
{
    return fs::absolute(path);
}

std::string to_operation_name(const Operation operation)
{
    switch (operation) {
        case Operation::join: return "join";
        case Operation::overlaps: return "overlaps";
        case Operation::nonoverlapping: return "nonoverlapping";
    }
    return "join";
}

} // namespace

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options)
{
    if (is_debug_mode(options)) {
        return resolve_path(options.at("debug").as<fs::path>());
    } else {
        return boost::none;
    }
}

boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options)
{
    if (is_trace_mode(options)) {
        return resolve_path(options.at("trace").as<fs::path>());
    } else {
        return boost::none;
    }
}

Operation get_operation(const OptionMap& options)
{
    return options.at("operation").as<Operation>();
}

JoinOptions get_join_options(const OptionMap& options)
{
    JoinOptions result {};
    result.start_column = options.at("start").as<std::string>();
    result.end_column   = options.at("end").as<std::string>();
    if (is_set("by", options)) {
        result.by = options.at("by").as<std::vector<std::string>>();
    }
    result.suffix      = options.at("suffix").as<std::string>();
    result.how         = parse_join_type(options.at("how").as<std::string>(), to_operation_name(get_operation(options)));
    result.closed      = options.at("closed").as<bool>();
    result.deduplicate = options.at("deduplicate").as<bool>();
    result.strict      = !options.at("lenient").as<bool>();
    result.nulls_last  = options.at("nulls-last").as<bool>();
    result.threads     = as_unsigned("threads", options);
    if (!result.strict) {
        logging::InfoLogger log {};
        log << "Rows with missing or inverted interval boundaries will be skipped";
    }
    return result;
}

fs::path get_primary_path(const OptionMap& options)
{
    return resolve_path(options.at("primary").as<fs::path>());
}

fs::path get_secondary_path(const OptionMap& options)
{
    return resolve_path(options.at("secondary").as<fs::path>());
}

boost::optional<fs::path> get_output_path(const OptionMap& options)
{
    if (is_set("output", options)) {
        return resolve_path(options.at("output").as<fs::path>());
    }
    return boost::none;
}

char get_delimiter(const OptionMap& options)
{
    const auto delimiter = options.at("delimiter").as<std::string>();
    if (delimiter == "tab" || delimiter == "\\t") return '\t';
    if (delimiter == "comma") return ',';
    if (delimiter == "space") return ' ';
    return delimiter.front();
}

} // namespace options
} // namespace rangejoin
