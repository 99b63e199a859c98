#include "cli/CommandLine.hpp"
#include "config/CseOptions.hpp"
#include "core/ResponseStatusCode.hpp"
#include "request/Request.hpp"
#include "request/RequestArguments.hpp"
#include "runtime/CseRuntime.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct RequestToolOptions {
    std::string                    operation = "retrieve";
    std::string                    to;
    std::optional<std::string>     from;
    std::optional<int>             resourceType;
    std::optional<std::string>     content;
    M2M::QueryParameters           query;
    std::optional<std::filesystem::path> seedFile;
    bool                           demo    = false;
    bool                           transit = false;
    bool                           noAcp   = false;
    int                            indent  = 2;
};

void print_usage(M2M::Cli::CommandLine const& cli) {
    std::cout << cli.usage()
              << "\nSeed files hold a JSON array of {\"to\", \"ty\", \"from\", \"content\"} create requests.\n";
}

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto parse_operation(std::string_view text) -> std::optional<M2M::Operation> {
    auto const name = lower(text);
    if (name == "retrieve" || name == "get")
        return M2M::Operation::Retrieve;
    if (name == "discovery" || name == "discover")
        return M2M::Operation::Discovery;
    if (name == "create" || name == "post")
        return M2M::Operation::Create;
    if (name == "update" || name == "put")
        return M2M::Operation::Update;
    if (name == "delete")
        return M2M::Operation::Delete;
    return std::nullopt;
}

auto make_create(std::string to, std::string from, M2M::ResourceType type, M2M::Json content) -> M2M::Request {
    M2M::Request request;
    request.operation    = M2M::Operation::Create;
    request.to           = std::move(to);
    request.originator   = std::move(from);
    request.contentType  = "application/json";
    request.resourceType = type;
    request.content      = std::move(content);
    return request;
}

auto seed_demo(M2M::CseRuntime& runtime) -> bool {
    using M2M::ResourceType;
    auto const& rn    = runtime.options().cseResourceName;
    auto const& admin = runtime.options().adminOriginator;

    std::vector<M2M::Request> seeds;
    seeds.push_back(make_create(rn, "Cdemo", ResourceType::AE,
                                M2M::Json{{"m2m:ae", {{"rn", "demoAE"}, {"api", "Ndemo"}, {"rr", true}, {"srv", {"3"}}}}}));
    seeds.push_back(make_create(rn + "/demoAE", admin, ResourceType::CNT, M2M::Json{{"m2m:cnt", {{"rn", "cnt1"}, {"lbl", {"demo"}}}}}));
    for (int i = 1; i <= 3; ++i) {
        seeds.push_back(make_create(rn + "/demoAE/cnt1", admin, ResourceType::CIN,
                                    M2M::Json{{"m2m:cin", {{"rn", "cin" + std::to_string(i)}, {"cnf", "text/plain:0"}, {"con", "value " + std::to_string(i)}}}}));
    }
    seeds.push_back(make_create(rn + "/demoAE/cnt1", admin, ResourceType::CNT, M2M::Json{{"m2m:cnt", {{"rn", "sub"}}}}));

    for (auto const& seed : seeds) {
        auto response = runtime.handle(seed);
        if (!response.ok()) {
            std::cerr << "Demo seed to " << seed.to << " failed: " << M2M::responseToJson(response).dump() << std::endl;
            return false;
        }
    }
    return true;
}

auto seed_file(M2M::CseRuntime& runtime, std::filesystem::path const& path) -> bool {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "Failed to open seed file '" << path.string() << "'" << std::endl;
        return false;
    }
    auto const seeds = M2M::Json::parse(stream, nullptr, false);
    if (seeds.is_discarded() || !seeds.is_array()) {
        std::cerr << "Seed file must hold a JSON array" << std::endl;
        return false;
    }
    for (auto const& entry : seeds) {
        if (!entry.is_object() || !entry.contains("to") || !entry.contains("ty") || !entry.contains("content")) {
            std::cerr << "Seed entries need \"to\", \"ty\" and \"content\"" << std::endl;
            return false;
        }
        auto const type = M2M::resourceTypeFromInt(entry["ty"].get<int>());
        if (!type) {
            std::cerr << "Unknown resource type " << entry["ty"].dump() << std::endl;
            return false;
        }
        auto const from = entry.value("from", runtime.options().adminOriginator);
        auto response   = runtime.handle(make_create(entry["to"].get<std::string>(), from, *type, entry["content"]));
        if (!response.ok()) {
            std::cerr << "Seed to " << entry["to"].get<std::string>() << " failed: " << M2M::responseToJson(response).dump() << std::endl;
            return false;
        }
    }
    return true;
}

auto parse_cli(int argc, char** argv, M2M::Cli::CommandLine& cli) -> std::optional<RequestToolOptions> {
    using M2M::Cli::CommandLine;
    RequestToolOptions options;

    cli.set_program_name("m2m_request");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });

    cli.add_value("--op", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                               if (!parse_operation(value))
                                   return "unknown operation '" + std::string{value} + "'";
                               options.operation.assign(value.begin(), value.end());
                               return std::nullopt;
                           },
                           .help = "retrieve | discovery | create | update | delete (default retrieve)"});
    cli.add_value("--to", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                               options.to.assign(value.begin(), value.end());
                               return std::nullopt;
                           },
                           .help = "target address (CSE-relative, ~/<csi>/... or _/<spid>/<csi>/...)"});
    cli.add_value("--from", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                 options.from = std::string{value};
                                 return std::nullopt;
                             },
                             .help = "originator (default: the admin originator)"});
    cli.add_int("--ty", {.on_value = [&](std::int64_t value) { options.resourceType = static_cast<int>(value); },
                         .help = "resource type of a create request"});
    cli.add_value("--content", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                    options.content = std::string{value};
                                    return std::nullopt;
                                },
                                .help = "JSON content of a create or update request"});
    cli.add_value("--query", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                  auto const equals = value.find('=');
                                  if (equals == std::string_view::npos || equals == 0)
                                      return "--query expects key=value";
                                  options.query.emplace_back(std::string{value.substr(0, equals)}, std::string{value.substr(equals + 1)});
                                  return std::nullopt;
                              },
                              .help = "request argument key=value, may repeat (fu, rcn, ty, lbl, ...)"});
    cli.add_value("--seed", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                 options.seedFile = std::filesystem::path(std::string{value});
                                 return std::nullopt;
                             },
                             .help = "JSON file with create requests executed before the request"});
    cli.add_int("--indent", {.on_value = [&](std::int64_t value) { options.indent = static_cast<int>(value); },
                             .help = "JSON indent of the output (-1 for compact)"});
    cli.add_flag("--demo", {.on_set = [&] { options.demo = true; }, .help = "seed a small demo tree"});
    cli.add_flag("--transit", {.on_set = [&] { options.transit = true; }, .help = "allow requests addressed to other CSEs"});
    cli.add_flag("--no-acp", {.on_set = [&] { options.noAcp = true; }, .help = "disable access control checks"});

    auto helpHandler = [&cli] {
        print_usage(cli);
        std::exit(EXIT_SUCCESS);
    };
    cli.add_flag("--help", {.on_set = helpHandler, .help = "show this message"});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv))
        return std::nullopt;
    if (options.to.empty()) {
        std::cerr << "m2m_request: --to is required" << std::endl;
        return std::nullopt;
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    M2M::Cli::CommandLine cli;
    auto toolOptions = parse_cli(argc, argv, cli);
    if (!toolOptions) {
        print_usage(cli);
        return EXIT_FAILURE;
    }

    M2M::CseOptions cseOptions;
    if (!M2M::ApplyCseEnvOverrides(cseOptions))
        return EXIT_FAILURE;
    if (toolOptions->transit)
        cseOptions.enableTransitRequests = true;
    if (toolOptions->noAcp)
        cseOptions.enableAcpChecks = false;

    M2M::CseRuntime runtime(cseOptions);
    if (auto started = runtime.start(); !started) {
        std::cerr << "CSE startup failed: " << M2M::describeError(started.error()) << std::endl;
        return EXIT_FAILURE;
    }
    if (toolOptions->demo && !seed_demo(runtime))
        return EXIT_FAILURE;
    if (toolOptions->seedFile && !seed_file(runtime, *toolOptions->seedFile))
        return EXIT_FAILURE;

    auto operation = *parse_operation(toolOptions->operation);
    if (operation == M2M::Operation::Discovery) {
        operation = M2M::Operation::Retrieve;
        bool const hasUsage = std::any_of(toolOptions->query.begin(), toolOptions->query.end(),
                                          [](auto const& entry) { return entry.first == "fu"; });
        if (!hasUsage)
            toolOptions->query.emplace_back("fu", "1");
    }

    M2M::Request request;
    request.operation  = operation;
    request.to         = toolOptions->to;
    request.originator = toolOptions->from.value_or(cseOptions.adminOriginator);

    auto arguments = M2M::ParseRequestArguments(operation, toolOptions->query);
    if (!arguments) {
        std::cout << M2M::responseToJson(M2M::Response::fromError(arguments.error())).dump(toolOptions->indent) << std::endl;
        return EXIT_FAILURE;
    }
    request.arguments = std::move(*arguments);

    if (toolOptions->resourceType) {
        auto const type = M2M::resourceTypeFromInt(*toolOptions->resourceType);
        if (!type) {
            std::cerr << "m2m_request: unknown resource type " << *toolOptions->resourceType << std::endl;
            return EXIT_FAILURE;
        }
        request.resourceType = *type;
    }
    if (toolOptions->content) {
        auto content = M2M::Json::parse(*toolOptions->content, nullptr, false);
        if (content.is_discarded()) {
            std::cerr << "m2m_request: --content is not valid JSON" << std::endl;
            return EXIT_FAILURE;
        }
        request.content     = std::move(content);
        request.contentType = "application/json";
    }

    auto const response = runtime.handle(request);
    std::cout << M2M::responseToJson(response).dump(toolOptions->indent) << std::endl;
    return response.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}
