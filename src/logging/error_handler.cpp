// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error_handler.hpp"

#include <string>
#include <vector>
#include <cstddef>
#include <cctype>

#include "exceptions/system_error.hpp"
#include "config/config.hpp"
#include "utils/string_utils.hpp"
#include "logging.hpp"

namespace rangejoin {

namespace {

std::string tidy(std::string message)
{
    utils::capitalise_front(message);
    if (!message.empty() && message.back() != '.') message += '.';
    return message;
}

std::vector<std::string> format_as_paragraph(const std::string& message, const std::size_t max_line_length)
{
    if (message.empty()) return {};
    auto words = utils::split(message, ' ');
    std::vector<std::string> result {};
    std::string cur_line {};
    for (auto& word : words) {
        if (!cur_line.empty() && cur_line.length() + word.length() + 1 > max_line_length) {
            result.push_back(std::move(cur_line));
            cur_line = std::move(word);
        } else {
            if (!cur_line.empty()) cur_line += " ";
            cur_line += std::move(word);
        }
    }
    if (!cur_line.empty()) result.push_back(std::move(cur_line));
    return result;
}

auto tidy_and_format(std::string message, const std::size_t max_line_length)
{
    return format_as_paragraph(tidy(std::move(message)), max_line_length);
}

void log_paragraph(const std::string& message, const std::string& indent, logging::ErrorLogger& log)
{
    for (auto& line : tidy_and_format(message, config::CommandLineWidth - indent.length())) {
        log << indent + line;
    }
}

std::string make_help_message(std::string help)
{
    if (help.empty()) return help;
    help.front() = static_cast<char>(std::tolower(help.front()));
    return "To help resolve this error " + help;
}

class BadAlloc : public SystemError
{
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return "the system could not satisfy a memory request while joining"; }
    std::string do_help() const override
    {
        return "use fewer threads, disable row deduplication, or split the input tables by group key and join each part separately";
    }
};

class UnclassifiedError : public Error
{
    std::string do_type() const override { return "unclassified"; }
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return why_; }
    std::string do_help() const override
    {
        return "submit an error report to " + config::BugReport + " including the rangejoin version and command line";
    }
    
    std::string why_;
    
public:
    UnclassifiedError(std::string why) : why_ {std::move(why)} {}
};

} // namespace

void log_error(const Error& error)
{
    logging::ErrorLogger log {};
    const auto type = error.type();
    stream(log) << (type == "unclassified" ? "An " : "A ") << type
                << " error has occurred in " << error.where() << ':';
    log_empty_line(log);
    log_paragraph(error.why(), "    ", log);
    const auto help = make_help_message(error.help());
    if (!help.empty()) {
        log_empty_line(log);
        log_paragraph(help, "", log);
    }
}

void log_error(const std::bad_alloc&)
{
    const BadAlloc e {};
    log_error(e);
}

void log_error(const std::exception& error)
{
    const UnclassifiedError e {error.what()};
    log_error(e);
}

void log_unknown_error()
{
    const UnclassifiedError e {"unknown"};
    log_error(e);
}

} // namespace rangejoin
