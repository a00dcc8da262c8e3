#include <filesystem>
#include <iostream>

#include <clipp.hpp>
#include <cpprom/cpprom.hpp>

#include "config.hpp"
#include "dispatcher.hpp"
#include "log.hpp"
#include "openapi.hpp"
#include "routecompiler.hpp"
#include "shopmiddleware.hpp"

#ifndef BURGER_SHOP_API_DIR
#define BURGER_SHOP_API_DIR "api"
#endif

struct Args : clipp::ArgsBase {
    std::optional<std::string> prefix;
    bool debug = false;
    bool routes = false;
    bool openapi = false;
    bool metrics = false;
    std::optional<std::string> body;
    std::optional<std::string> header;
    std::optional<std::string> arg = BURGER_SHOP_API_DIR;
    std::optional<std::string> request;

    void args()
    {
        flag(prefix, "prefix", 'p').valueNames("PREFIX").help("URL prefix of all routes");
        flag(debug, "debug").help("Enable debug logging and detailed error responses");
        flag(routes, "routes").help("Print the route table");
        flag(openapi, "openapi").help("Print the OpenAPI document");
        flag(metrics, "metrics", 'm').help("Print metrics after dispatching the request");
        flag(body, "body", 'b').valueNames("JSON").help("Request body, sent as application/json");
        flag(header, "header", 'H').valueNames("HEADER").help("Request header ('Name: Value')");
        // Route directory or config file
        positional(arg, "arg").optional();
        // e.g. "GET /api/products?search=cheese"
        positional(request, "request").optional();
    }
};

// Builds the raw request, so it goes through the same parser as a request from a socket
std::optional<std::string> buildRawRequest(const Args& args)
{
    const auto& line = *args.request;
    const auto space = line.find(' ');
    if (space == std::string::npos) {
        slog::error("Request must be 'METHOD TARGET'");
        return std::nullopt;
    }

    std::string raw = line + " HTTP/1.1\r\nHost: localhost\r\n";
    if (args.header) {
        if (args.header->find(':') == std::string::npos) {
            slog::error("Header must be 'Name: Value'");
            return std::nullopt;
        }
        raw.append(*args.header + "\r\n");
    }
    if (args.body) {
        raw.append("Content-Type: application/json\r\n");
        raw.append("Content-Length: " + std::to_string(args.body->size()) + "\r\n");
    }
    raw.append("\r\n");
    if (args.body) {
        raw.append(*args.body);
    }
    return raw;
}

int main(int argc, char** argv)
{
    auto parser = clipp::Parser(argv[0]);
    parser.version("0.1.0");
    const Args args = parser.parse<Args>(argc, argv).value();
    slog::init(args.debug ? slog::Severity::Debug : slog::Severity::Info);

    Config config;
    if (std::filesystem::is_regular_file(args.arg.value())) {
        if (!config.loadFromFile(*args.arg)) {
            return 1;
        }
        if (!args.debug) {
            slog::setLogLevel(config.logLevel);
        }
    } else if (std::filesystem::is_directory(args.arg.value())) {
        config.apiDir = *args.arg;
    } else {
        slog::error("Invalid argument. Must either be a config file or a route directory");
        return 1;
    }

    if (args.prefix) {
        config.prefix = *args.prefix;
    }
    config.debug = config.debug || args.debug;

    slog::info("Route Directory: ", config.apiDir);
    slog::info("Prefix: /", cleanPrefix(config.prefix));
    slog::debug("Route File: ", config.routeFile);
    slog::debug("Access Log: ", config.accessLog);

    auto table = compileRoutes(config.apiDir, ModuleRegistry::getDefault(),
        RouteCompiler::Options { config.prefix, config.routeFile });
    if (!table) {
        slog::fatal("Invalid route directory (", table.error().size(), " error(s))");
        return 1;
    }

    const auto openApiInfo = OpenApiInfo { config.openApi.title, config.openApi.description,
        config.openApi.version };

    if (args.routes) {
        std::cout << table->dump();
    }
    if (args.openapi) {
        std::cout << generateOpenApiDocument(*table, openApiInfo).dump("  ") << std::endl;
    }

    const DocsServer docs(*table, openApiInfo,
        DocsServer::Paths { config.openApi.docsPath, config.openApi.openApiPath });

    DispatcherConfig dispatcherConfig;
    dispatcherConfig.globalMiddleware = { requestLogger, responseTime(), cors("*") };
    dispatcherConfig.debug = config.debug;
    dispatcherConfig.accessLog = config.accessLog;
    const Dispatcher dispatcher(std::move(*table), std::move(dispatcherConfig));

    if (args.request) {
        const auto raw = buildRawRequest(args);
        if (!raw) {
            return 1;
        }
        const auto request = Request::parse(*raw);
        if (!request) {
            slog::error("Could not parse request '", *args.request, "'");
            return 1;
        }

        bool responded = false;
        const auto print = [&responded](Response&& response) {
            responded = true;
            std::cout << response.string() << std::endl;
        };
        if (auto response = docs.handle(*request)) {
            print(std::move(*response));
        } else {
            dispatcher(*request, std::make_unique<CallbackResponder>(print));
        }
        if (!responded) {
            slog::error("Handler did not respond");
            return 1;
        }
    }

    if (args.metrics) {
        std::cout << cpprom::Registry::getDefault().serialize();
    }
    return 0;
}
