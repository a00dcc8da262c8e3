#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "result.hpp"
#include "routemodule.hpp"
#include "routetable.hpp"

struct ConfigurationError {
    std::string path;
    std::string message;

    // "<path>: <message>"
    std::string string() const;
};

// Turns a route directory into a RouteTable:
//   name/    -> literal segment "name"
//   [name]/  -> parameter ":name", at most one per directory
//   (name)/  -> grouping, not part of the URL
//   index/   -> as the last directory maps to its parent
// Every directory containing a route file (route.cpp by default) becomes a route. Its exports
// are provided by the ModuleLoader. All problems found during the walk are reported together.
class RouteCompiler {
public:
    struct Options {
        std::string prefix = "api";
        std::string routeFile = "route.cpp";
    };

    RouteCompiler(const ModuleLoader& loader, Options options);

    Result<RouteTable, std::vector<ConfigurationError>> compile(
        const std::filesystem::path& directory) const;

private:
    struct Walk;

    void walk(Walk& w, const std::filesystem::path& directory,
        const std::filesystem::path& relativeDir, const std::vector<RouteSegment>& segments) const;
    void addRoute(Walk& w, const std::filesystem::path& file,
        const std::filesystem::path& relativeFile, std::vector<RouteSegment> segments) const;

    const ModuleLoader& loader_;
    Options options_;
};

Result<RouteTable, std::vector<ConfigurationError>> compileRoutes(
    const std::filesystem::path& directory, const ModuleLoader& loader,
    RouteCompiler::Options options = {});
