// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <iostream>
#include <cstdlib>
#include <string>
#include <exception>

#include "config/config.hpp"
#include "config/common.hpp"
#include "logging/logging.hpp"
#include "logging/main_logging.hpp"
#include "config/option_parser.hpp"
#include "config/option_collation.hpp"
#include "basics/table.hpp"
#include "core/join_options.hpp"
#include "core/interval_join.hpp"
#include "io/table/table_reader.hpp"
#include "io/table/table_writer.hpp"
#include "exceptions/error.hpp"
#include "logging/error_handler.hpp"

using namespace rangejoin;
using namespace rangejoin::options;

namespace {

template <typename E>
auto log_exception(const E& e)
{
    log_error(e);
    log_program_end();
    return EXIT_FAILURE;
}

template <typename E>
auto log_startup_exception(const E& e)
{
    logging::init();
    log_program_startup();
    return log_exception(e);
}

void init_common(const OptionMap& options)
{
    logging::init(get_debug_log_file_name(options), get_trace_log_file_name(options));
    DEBUG_MODE = is_debug_mode(options);
    TRACE_MODE = is_trace_mode(options);
}

Table run_operation(const Operation operation, const Table& primary, const Table& secondary,
                    const JoinOptions& join_options)
{
    switch (operation) {
        case Operation::overlaps: return overlaps(primary, secondary, join_options);
        case Operation::nonoverlapping: return nonoverlapping(primary, secondary, join_options);
        case Operation::join: break;
    }
    return join(primary, secondary, join_options);
}

void run_rangejoin(const OptionMap& options)
{
    logging::InfoLogger info_log {};
    const auto join_options = get_join_options(options);
    const auto delimiter = get_delimiter(options);
    const auto primary_path = get_primary_path(options);
    const auto secondary_path = get_secondary_path(options);
    const auto primary = io::read_table(primary_path, delimiter);
    const auto secondary = io::read_table(secondary_path, delimiter);
    stream(info_log) << "Read " << primary.num_rows() << " primary rows from " << primary_path.filename().string()
                     << " and " << secondary.num_rows() << " secondary rows from " << secondary_path.filename().string();
    const auto operation = get_operation(options);
    log_run_configuration(operation, join_options);
    const auto result = run_operation(operation, primary, secondary, join_options);
    const auto output_path = get_output_path(options);
    if (output_path) {
        io::write_table(result, *output_path, delimiter);
        stream(info_log) << "Wrote " << result.num_rows() << " rows to " << output_path->string();
    } else {
        io::write_table(result, std::cout, delimiter);
        stream(info_log) << "Wrote " << result.num_rows() << " rows";
    }
}

} // namespace

int main(const int argc, const char** argv)
{
    OptionMap options;
    try {
        options = parse_options(argc, argv);
    } catch (const Error& e) {
        return log_startup_exception(e);
    } catch (const std::exception& e) {
        return log_startup_exception(e);
    } catch (...) {
        logging::init();
        log_unknown_error();
        log_program_end();
        return EXIT_FAILURE;
    }
    if (is_run_command(options)) {
        try {
            init_common(options);
            log_program_startup();
            log_command_line(argc, argv, options);
            run_rangejoin(options);
            log_program_end();
        } catch (const Error& e) {
            return log_exception(e);
        } catch (const std::bad_alloc& e) {
            return log_exception(e);
        } catch (const std::exception& e) {
            return log_exception(e);
        } catch (...) {
            log_unknown_error();
            log_program_end();
            return EXIT_FAILURE;
        }
    }
    return EXIT_SUCCESS;
}
