#include "cli/CommandLine.hpp"

#include <doctest/doctest.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
auto make_argv(std::initializer_list<const char*> list) {
    std::vector<char*> argv;
    argv.reserve(list.size());
    for (auto* value : list) {
        argv.push_back(const_cast<char*>(value));
    }
    return argv;
}
}

TEST_CASE("CommandLine parses flags and integer options") {
    using M2M::Cli::CommandLine;
    CommandLine cli;
    cli.set_program_name("command_line_test");

    bool transit = false;
    std::int64_t indent = 2;
    cli.add_flag("--transit", {.on_set = [&] { transit = true; }});
    cli.add_int("--indent", {.on_value = [&](std::int64_t value) { indent = value; }});

    auto argv = make_argv({"prog", "--transit", "--indent=4"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(transit);
    CHECK(indent == 4);
}

TEST_CASE("CommandLine value options take the next token") {
    using M2M::Cli::CommandLine;
    CommandLine cli;

    std::string target;
    std::vector<std::string> queries;
    cli.add_value("--to", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                               target.assign(value.begin(), value.end());
                               return std::nullopt;
                           }});
    cli.add_value("--query", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                  queries.emplace_back(value);
                                  return std::nullopt;
                              }});

    auto argv = make_argv({"prog", "--to", "cse-in/cnt1", "--query", "rcn=4", "--query=ty=3"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(target == "cse-in/cnt1");
    REQUIRE(queries.size() == 2);
    CHECK(queries[0] == "rcn=4");
    CHECK(queries[1] == "ty=3");
}

TEST_CASE("CommandLine reports missing values and handler errors") {
    using M2M::Cli::CommandLine;
    CommandLine cli;
    std::vector<std::string> errors;
    cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });
    cli.set_program_name("m2m_request");

    cli.add_value("--op", {.on_value = [](std::string_view value) -> CommandLine::ParseError {
                               if (value == "retrieve")
                                   return std::nullopt;
                               return std::string{"unknown operation"};
                           }});
    cli.add_flag("--demo", {});

    auto bad_value = make_argv({"prog", "--op", "explode"});
    CHECK_FALSE(cli.parse(static_cast<int>(bad_value.size()), bad_value.data()));
    CHECK(cli.had_errors());
    REQUIRE_FALSE(errors.empty());
    CHECK(errors.back() == "m2m_request: unknown operation");

    auto missing = make_argv({"prog", "--op", "--demo"});
    CHECK_FALSE(cli.parse(static_cast<int>(missing.size()), missing.data()));
    CHECK(errors.back() == "m2m_request: --op requires a value");

    auto flag_value = make_argv({"prog", "--demo=yes"});
    CHECK_FALSE(cli.parse(static_cast<int>(flag_value.size()), flag_value.data()));

    auto ok = make_argv({"prog", "--op", "retrieve"});
    CHECK(cli.parse(static_cast<int>(ok.size()), ok.data()));
    CHECK_FALSE(cli.had_errors());
}

TEST_CASE("CommandLine integer options reject non numeric input") {
    using M2M::Cli::CommandLine;
    CommandLine cli;
    cli.set_error_logger([](std::string const&) {});
    std::int64_t indent = 0;
    cli.add_int("--indent", {.on_value = [&](std::int64_t value) { indent = value; }});

    auto argv = make_argv({"prog", "--indent", "wide"});
    CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(indent == 0);
}

TEST_CASE("CommandLine aliases and unknown arguments") {
    using M2M::Cli::CommandLine;
    CommandLine cli;
    std::vector<std::string> errors;
    cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });

    bool help = false;
    cli.add_flag("--help", {.on_set = [&] { help = true; }, .help = "Show usage"});
    cli.add_alias("-h", "--help");

    auto argv = make_argv({"prog", "-h"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(help);

    auto unknown = make_argv({"prog", "--bogus"});
    CHECK_FALSE(cli.parse(static_cast<int>(unknown.size()), unknown.data()));
    CHECK(errors.back().find("unknown argument '--bogus'") != std::string::npos);

    std::vector<std::string> positional;
    cli.set_unknown_argument_handler([&](std::string_view token) {
        positional.emplace_back(token);
        return true;
    });
    auto extra = make_argv({"prog", "seed.json"});
    CHECK(cli.parse(static_cast<int>(extra.size()), extra.data()));
    CHECK(positional == std::vector<std::string>{"seed.json"});

    auto const text = cli.usage();
    CHECK(text.find("--help") != std::string::npos);
    CHECK(text.find("Show usage") != std::string::npos);
}
