// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_parser.hpp"

#include <vector>
#include <iostream>
#include <stdexcept>
#include <sstream>
#include <fstream>
#include <typeinfo>

#include <boost/version.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>

#include "utils/string_utils.hpp"
#include "exceptions/user_error.hpp"
#include "core/join_options.hpp"
#include "config.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace rangejoin { namespace options {

void parse_config_file(const fs::path& config_file, OptionMap& vm, const po::options_description& options);

// boost::option cannot handle option dependencies so we must do our own checks
void conflicting_options(const OptionMap& vm, const std::string& opt1, const std::string& opt2);
void check_required(const OptionMap& vm, const std::string& option);
void check_strictly_positive(const std::string& option, const OptionMap& vm);
void check_join_mode(const OptionMap& vm);
void check_delimiter(const OptionMap& vm);
void validate(const OptionMap& vm);

po::parsed_options run(po::command_line_parser& parser);
void store_options(const po::parsed_options& parsed, OptionMap& vm);

namespace {

po::options_description make_general_options()
{
    po::options_description general("General");
    general.add_options()
    ("help,h",
     "Report detailed option information")
    
    ("version",
     "Report detailed version information")
    
    ("config",
     po::value<fs::path>(),
     "Config file to populate command line options")
    
    ("debug",
     po::value<fs::path>()->implicit_value("rangejoin_debug.log"),
     "Create log file for debugging")
    
    ("trace",
     po::value<fs::path>()->implicit_value("rangejoin_trace.log"),
     "Create very verbose log file for debugging")
    
    ("threads,t",
     po::value<int>()->default_value(1),
     "Maximum number of threads used to join independent groups")
    ;
    return general;
}

po::options_description make_io_options()
{
    po::options_description io("Input/output");
    io.add_options()
    ("primary,p",
     po::value<fs::path>(),
     "Delimited table file of the primary (left) intervals")
    
    ("secondary,s",
     po::value<fs::path>(),
     "Delimited table file of the secondary (right) intervals")
    
    ("output,o",
     po::value<fs::path>(),
     "File to write the result table to. If not given the result is written to stdout")
    
    ("delimiter",
     po::value<std::string>()->default_value("\t", "tab"),
     "Field delimiter of the input and output tables: a single character, or one of tab, comma, space")
    ;
    return io;
}

po::options_description make_join_options()
{
    po::options_description join("Join");
    join.add_options()
    ("operation",
     po::value<Operation>()->default_value(Operation::join),
     "Operation to perform [JOIN, OVERLAPS, NONOVERLAPPING]")
    
    ("start",
     po::value<std::string>()->default_value("start"),
     "Name of the column holding interval start positions")
    
    ("end",
     po::value<std::string>()->default_value("end"),
     "Name of the column holding interval end positions")
    
    ("by",
     po::value<std::vector<std::string>>()->multitoken(),
     "Columns that must be equal in both tables for two intervals to be compared")
    
    ("suffix",
     po::value<std::string>()->default_value("_right"),
     "Appended to secondary column names that clash with output column names")
    
    ("how",
     po::value<std::string>()->default_value("inner"),
     "Which non-overlapping rows to keep [inner, left, right, outer]")
    
    ("closed",
     po::bool_switch()->default_value(false),
     "Treat intervals as closed, so intervals that only touch at an end point overlap")
    
    ("deduplicate",
     po::value<bool>()->default_value(true),
     "Collapse rows identical in every column before matching")
    
    ("lenient",
     po::bool_switch()->default_value(false),
     "Skip rows with missing or inverted interval boundaries rather than failing; skipped rows appear in no output")
    
    ("nulls-last",
     po::bool_switch()->default_value(false),
     "Write null padded rows after the matched rows rather than before")
    ;
    return join;
}

std::string prepend_dashes(std::string option)
{
    option.insert(0, "--");
    return option;
}

} // namespace

class CommandLineError : public UserError
{
public:
    CommandLineError() = default;
    
    CommandLineError(std::string&& why) : why_ {std::move(why)} {}
    
protected:
    std::string why_;

private:
    virtual std::string do_where() const override
    {
        return "parse_options";
    }
    
    virtual std::string do_why() const override
    {
        return why_;
    }
    
    virtual std::string do_help() const override
    {
        return "use the --help command to view required and allowable options";
    }
};

class BadConfigFile : public CommandLineError
{
public:
    BadConfigFile(fs::path p)
    {
        std::ostringstream ss {};
        ss << "The config file path (" << p << ") given in the option '--config' does not exist";
        why_ = ss.str();
    }
};

class UnknownCommandLineOption : public CommandLineError
{
public:
    UnknownCommandLineOption(std::string option)
    : CommandLineError {"The option you specified '" + prepend_dashes(std::move(option)) + "' is not recognised"}
    {}
};

class MissingRequiredCommandLineArgument : public CommandLineError
{
public:
    MissingRequiredCommandLineArgument(std::string option)
    : CommandLineError {"The command line option '" + prepend_dashes(std::move(option)) + "' is required but is missing"}
    {}
};

class InvalidCommandLineOptionValue : public CommandLineError
{
public:
    InvalidCommandLineOptionValue(std::string option, std::string value, std::string reason)
    : CommandLineError {
    "The argument '" + value + "' given to option '" + prepend_dashes(std::move(option))
    + "' was rejected as it " + reason
    } {}
};

class ConflictingCommandLineOptions : public CommandLineError
{
public:
    ConflictingCommandLineOptions(std::vector<std::string> conflicts)
    {
        std::ostringstream ss {};
        ss << "The options";
        for (const auto& option : conflicts) {
            ss << " " << prepend_dashes(option);
        }
        ss << " are mutually exclusive";
        why_ = ss.str();
    }
};

namespace {

template <typename MakeParser>
OptionMap parse_options(MakeParser make_parser)
{
    po::options_description all("rangejoin command line options");
    all.add(make_general_options()).add(make_io_options()).add(make_join_options());
    
    const auto general = make_general_options();
    OptionMap vm_init;
    auto init_parser = make_parser();
    store_options(run(init_parser.options(general).allow_unregistered()), vm_init);
    
    if (vm_init.count("help") == 1) {
        std::cout << "Usage: rangejoin --primary <file> --secondary <file> [options]\n\n" << all << std::endl;
        return vm_init;
    }
    
    if (vm_init.count("version") == 1) {
        std::cout << "rangejoin version " << config::Version << '\n'
                  << "Boost: " << BOOST_VERSION / 100000 << '.' << BOOST_VERSION / 100 % 1000 << '.' << BOOST_VERSION % 100
                  << std::endl;
        return vm_init;
    }
    
    OptionMap vm;
    
    // Options given on the command line take precedence as po::store never overwrites a stored value
    auto parser = make_parser();
    store_options(run(parser.options(all)), vm);
    if (vm_init.count("config") == 1) {
        parse_config_file(vm_init.at("config").as<fs::path>(), vm, all);
    }
    validate(vm);
    po::notify(vm);
    
    return vm;
}

} // namespace

OptionMap parse_options(const int argc, const char** argv)
{
    return parse_options([=] () { return po::command_line_parser(argc, argv); });
}

OptionMap parse_options(const std::vector<std::string>& arguments)
{
    return parse_options([&] () { return po::command_line_parser(arguments); });
}

void parse_config_file(const fs::path& config_file, OptionMap& vm, const po::options_description& options)
{
    if (!fs::exists(config_file)) {
        throw BadConfigFile {config_file};
    }
    std::ifstream config {config_file.string()};
    if (config) {
        try {
            po::store(po::parse_config_file(config, options), vm);
        } catch (const po::invalid_config_file_syntax& e) {
            throw CommandLineError {e.what()};
        } catch (const po::unknown_option& e) {
            throw UnknownCommandLineOption {po::strip_prefixes(e.get_option_name())};
        } catch (const po::invalid_option_value& e) {
            throw CommandLineError {e.what()};
        } catch (const po::invalid_bool_value& e) {
            throw CommandLineError {e.what()};
        } catch (const po::ambiguous_option& e) {
            throw CommandLineError {e.what()};
        } catch (const po::reading_file& e) {
            throw CommandLineError {e.what()};
        }
    }
}

void conflicting_options(const OptionMap& vm, const std::string& opt1, const std::string& opt2)
{
    if (vm.count(opt1) == 1 && !vm[opt1].defaulted() && vm.count(opt2) == 1 && !vm[opt2].defaulted()) {
        throw ConflictingCommandLineOptions {{opt1, opt2}};
    }
}

void check_required(const OptionMap& vm, const std::string& option)
{
    if (vm.count(option) == 0) {
        throw MissingRequiredCommandLineArgument {option};
    }
}

void check_strictly_positive(const std::string& option, const OptionMap& vm)
{
    if (vm.count(option) == 1) {
        const auto value = vm.at(option).as<int>();
        if (value < 1) {
            throw InvalidCommandLineOptionValue {option, std::to_string(value), "must be greater than zero"};
        }
    }
}

void check_join_mode(const OptionMap& vm)
{
    const auto operation = vm.at("operation").as<Operation>();
    std::ostringstream ss {};
    ss << operation;
    // Throws InvalidJoinModeError
    const auto how = parse_join_type(vm.at("how").as<std::string>(), utils::to_lower(ss.str()));
    if (operation == Operation::nonoverlapping && how != JoinType::left && how != JoinType::right) {
        throw InvalidCommandLineOptionValue {"how", vm.at("how").as<std::string>(),
                                             "must be left or right for the nonoverlapping operation"};
    }
}

void check_delimiter(const OptionMap& vm)
{
    const auto delimiter = vm.at("delimiter").as<std::string>();
    if (delimiter.size() != 1 && delimiter != "tab" && delimiter != "comma" && delimiter != "space" && delimiter != "\\t") {
        throw InvalidCommandLineOptionValue {"delimiter", delimiter, "is not a single character"};
    }
}

po::parsed_options run(po::command_line_parser& parser)
{
    try {
        return parser.run();
    } catch (const po::required_option& e) {
        throw MissingRequiredCommandLineArgument {po::strip_prefixes(e.get_option_name())};
    } catch (const po::unknown_option& e) {
        throw UnknownCommandLineOption {po::strip_prefixes(e.get_option_name())};
    } catch (const po::invalid_option_value& e) {
        throw CommandLineError {e.what()};
    } catch (const po::invalid_bool_value& e) {
        throw CommandLineError {e.what()};
    } catch (const po::ambiguous_option& e) {
        throw CommandLineError {e.what()};
    } catch (const po::reading_file& e) {
        throw CommandLineError {e.what()};
    } catch (const po::invalid_command_line_syntax& e) {
        throw CommandLineError {e.what()};
    } catch (const po::error& e) {
        throw CommandLineError {e.what()};
    }
}

void store_options(const po::parsed_options& parsed, OptionMap& vm)
{
    try {
        po::store(parsed, vm);
    } catch (const po::invalid_option_value& e) {
        throw CommandLineError {e.what()};
    } catch (const po::invalid_bool_value& e) {
        throw CommandLineError {e.what()};
    } catch (const po::multiple_occurrences& e) {
        throw CommandLineError {e.what()};
    } catch (const po::error& e) {
        throw CommandLineError {e.what()};
    }
}

void validate(const OptionMap& vm)
{
    check_required(vm, "primary");
    check_required(vm, "secondary");
    conflicting_options(vm, "debug", "trace");
    check_strictly_positive("threads", vm);
    check_join_mode(vm);
    check_delimiter(vm);
}

std::istream& operator>>(std::istream& in, Operation& result)
{
    std::string token;
    in >> token;
    token = utils::to_lower(token);
    if (token == "join")
        result = Operation::join;
    else if (token == "overlaps")
        result = Operation::overlaps;
    else if (token == "nonoverlapping")
        result = Operation::nonoverlapping;
    else throw po::validation_error {po::validation_error::kind_t::invalid_option_value, token, "operation"};
    return in;
}

std::ostream& operator<<(std::ostream& out, const Operation& operation)
{
    switch (operation) {
        case Operation::join:
            out << "JOIN";
            break;
        case Operation::overlaps:
            out << "OVERLAPS";
            break;
        case Operation::nonoverlapping:
            out << "NONOVERLAPPING";
            break;
    }
    return out;
}

namespace {

template <typename T>
bool is_type(const OptionMap::mapped_type& value)
{
    return value.value().type() == typeid(T);
}

} // namespace

std::ostream& operator<<(std::ostream& os, const OptionMap& options)
{
    std::size_t i {0};
    for (const auto& p : options) {
        const auto& label = p.first;
        const auto& value = p.second;
        const char bullet {value.defaulted() ? '>' : '~'};
        os << bullet << ' ' << label;
        if (value.empty()) {
            os << "(empty)";
        }
        os << "=";
        if (is_type<int>(value)) {
            os << value.as<int>();
        } else if (is_type<bool>(value)) {
            os << (value.as<bool>() ? "yes" : "no");
        } else if (is_type<std::string>(value)) {
            const auto& str = value.as<std::string>();
            os << (str == "\t" ? "tab" : str);
        } else if (is_type<fs::path>(value)) {
            os << value.as<fs::path>().string();
        } else if (is_type<std::vector<std::string>>(value)) {
            os << utils::join(value.as<std::vector<std::string>>(), ',');
        } else if (is_type<Operation>(value)) {
            os << value.as<Operation>();
        } else if (!value.empty()) {
            os << "UnknownType(" << value.value().type().name() << ")";
        }
        if (++i != options.size()) os << '\n';
    }
    return os;
}

std::string to_string(const OptionMap& options, const bool one_line, const bool mark_modified)
{
    std::ostringstream ss {};
    ss << options;
    auto result = ss.str();
    if (one_line) {
        auto chunks = utils::split(result, '\n');
        for (auto& chunk : chunks) {
            if (chunk.size() < 2) continue;
            const bool modified {chunk[0] == '~'};
            chunk[0] = '-';
            chunk[1] = '-';
            if (modified && mark_modified) {
                chunk.insert(0, 1, '*');
            }
            const auto eq = chunk.find('=');
            if (eq != std::string::npos) chunk[eq] = ' ';
        }
        result = utils::join(chunks, ' ');
    }
    return result;
}

} // namespace options
} // namespace rangejoin
