#include "cli/CommandLine.hpp"

#include <charconv>
#include <iostream>
#include <string>

namespace M2M::Cli {

CommandLine::CommandLine() {
    unknown_handler_ = [this](std::string_view token) {
        std::string message = "unknown argument '";
        message.append(token.begin(), token.end());
        message.push_back('\'');
        log_error(message);
        return false;
    };
}

void CommandLine::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

void CommandLine::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) {
    unknown_handler_ = std::move(handler);
}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help          = std::move(option.help);
    entry.expects_value = false;
    entry.flag_handler  = std::move(option.on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help                     = std::move(option.help);
    entry.expects_value            = true;
    entry.allow_leading_dash_value = option.allow_leading_dash_value;
    entry.value_handler            = std::move(option.on_value);
    register_option(std::move(entry));
}

void CommandLine::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.help     = std::move(option.help);
    value_opt.on_value = [stored = std::string(name), handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        if (token.empty()) {
            return stored + " requires an integer value";
        }
        std::int64_t value = 0;
        auto begin = token.data();
        auto end = begin + token.size();
        auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects a numeric value";
        }
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        std::string message = "missing option for alias '";
        message.append(target.begin(), target.end());
        message.push_back('\'');
        log_error(message);
        mark_error();
        return;
    }
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool CommandLine::parse(int argc, char** argv) {
    had_error_ = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view raw_token{argv[i]};
        std::optional<std::string_view> attached_value;
        std::string_view name = raw_token;
        auto equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos && looks_like_option(raw_token)) {
            name = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            if (unknown_handler_ && !unknown_handler_(raw_token)) {
                mark_error();
            }
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                mark_error();
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else {
            if ((i + 1) >= argc) {
                log_error(entry->name + " requires a value");
                mark_error();
                continue;
            }
            std::string_view candidate{argv[i + 1]};
            if (looks_like_option(candidate) && !entry->allow_leading_dash_value) {
                log_error(entry->name + " requires a value");
                mark_error();
                continue;
            }
            ++i;
            value = candidate;
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
                mark_error();
            }
        }
    }
    return !had_error_;
}

bool CommandLine::had_errors() const {
    return had_error_;
}

std::string CommandLine::usage() const {
    std::string text = "usage: " + (program_name_.empty() ? std::string{"m2m"} : program_name_) + " [options]\n";
    for (auto const& option : options_) {
        text.append("  ");
        text.append(option.name);
        if (option.expects_value) {
            text.append(" <value>");
        }
        if (!option.help.empty()) {
            text.append("\n      ");
            text.append(option.help);
        }
        text.push_back('\n');
    }
    return text;
}

CommandLine::OptionEntry* CommandLine::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    auto index = options_.size() - 1;
    option_lookup_.emplace(options_.back().name, index);
}

void CommandLine::log_error(std::string_view message) {
    std::string text = program_name_.empty() ? std::string{"m2m"} : program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool CommandLine::looks_like_option(std::string_view token) const {
    return token.size() > 1 && token.front() == '-' && token[1] == '-';
}

void CommandLine::mark_error() {
    had_error_ = true;
}

} // namespace M2M::Cli
