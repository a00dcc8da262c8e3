#pragma once

#include <string>
#include <string_view>

#include "log.hpp"

struct Config {
    struct OpenApi {
        std::string title = "Burger API";
        std::string description = "Auto-generated API documentation";
        std::string version = "1.0.0";
        std::string docsPath = "/docs";
        std::string openApiPath = "/openapi.json";
    };

    // A relative path in a config file is relative to the directory of that file
    std::string apiDir = "api";
    std::string prefix = "api";
    std::string routeFile = "route.cpp";
    bool debug = false;
    bool accessLog = false;
    slog::Severity logLevel = slog::Severity::Info;
    OpenApi openApi;

    // ${VAR} and ${VAR:default} are substituted before parsing.
    // On failure the error is logged and the config is left unchanged.
    bool loadFromFile(const std::string& path);
    bool loadFromString(std::string_view source);
};
