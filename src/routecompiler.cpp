#include "routecompiler.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "log.hpp"
#include "string.hpp"

namespace fs = std::filesystem;

namespace {
enum class DirType { Literal, Param, Group };

DirType getDirType(std::string_view name)
{
    if (name.size() >= 2 && name.front() == '[' && name.back() == ']') {
        return DirType::Param;
    }
    if (name.size() >= 2 && name.front() == '(' && name.back() == ')') {
        return DirType::Group;
    }
    return DirType::Literal;
}

std::string relativeStr(const fs::path& path)
{
    return path.empty() ? std::string(".") : path.generic_string();
}

std::string lowerMethod(Method method)
{
    return toLower(toString(method));
}

bool isRouteMethodName(std::string_view name)
{
    for (const auto method : RouteMethods) {
        if (toString(method) == name) {
            return true;
        }
    }
    return false;
}

bool isRouteMethodKey(std::string_view key)
{
    for (const auto method : RouteMethods) {
        if (lowerMethod(method) == key) {
            return true;
        }
    }
    return false;
}
}

std::string ConfigurationError::string() const
{
    return path + ": " + message;
}

struct RouteCompiler::Walk {
    std::vector<RouteDescriptor> routes;
    std::vector<ConfigurationError> errors;
};

RouteCompiler::RouteCompiler(const ModuleLoader& loader, Options options)
    : loader_(loader)
    , options_(std::move(options))
{
}

Result<RouteTable, std::vector<ConfigurationError>> RouteCompiler::compile(
    const fs::path& directory) const
{
    Walk w;

    std::vector<RouteSegment> prefix;
    for (const auto part : split(cleanPrefix(options_.prefix), '/')) {
        if (!part.empty()) {
            prefix.push_back(RouteSegment { RouteSegment::Type::Literal, std::string(part) });
        }
    }

    std::error_code ec;
    const auto isDir = fs::is_directory(directory, ec);
    if (ec || !isDir) {
        w.errors.push_back(ConfigurationError { directory.string(),
            ec ? "Could not read route directory: " + ec.message()
               : std::string("Route directory does not exist or is not a directory") });
    } else {
        walk(w, directory, fs::path(), prefix);
    }

    // Duplicates are only detected after the walk, because they can be spread over different
    // grouping directories
    std::unordered_map<std::string, const RouteDescriptor*> shapes;
    for (const auto& route : w.routes) {
        const auto [it, inserted] = shapes.emplace(route.pattern.shape(), &route);
        if (!inserted) {
            w.errors.push_back(ConfigurationError { route.file,
                "Route '" + route.pattern.str() + "' conflicts with '" + it->second->pattern.str()
                    + "' defined in '" + it->second->file + "'" });
        }
    }

    if (!w.errors.empty()) {
        for (const auto& err : w.errors) {
            slog::error("Route configuration error: ", err.string());
        }
        return error(std::move(w.errors));
    }

    RouteTable table(std::move(w.routes));
    for (const auto& route : table.routes()) {
        slog::debug(joinMethods(route.methods()), " ", route.pattern.str(), " <- ", route.file);
    }
    slog::info("Compiled ", table.size(), " route(s) from '", directory.string(), "'");
    return table;
}

void RouteCompiler::walk(Walk& w, const fs::path& directory, const fs::path& relativeDir,
    const std::vector<RouteSegment>& segments) const
{
    std::error_code ec;
    auto it = fs::directory_iterator(directory, ec);
    if (ec) {
        w.errors.push_back(ConfigurationError {
            relativeStr(relativeDir), "Could not read directory: " + ec.message() });
        return;
    }

    std::vector<fs::directory_entry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        w.errors.push_back(ConfigurationError {
            relativeStr(relativeDir), "Could not read directory: " + ec.message() });
        return;
    }
    // directory_iterator order is unspecified
    std::sort(entries.begin(), entries.end(),
        [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename() < b.path().filename();
        });

    std::vector<std::string> dynamicDirs;
    for (const auto& entry : entries) {
        const auto name = entry.path().filename().string();
        const auto relative = relativeDir / name;

        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            auto childSegments = segments;
            switch (getDirType(name)) {
            case DirType::Group:
                break;
            case DirType::Param: {
                const auto param = name.substr(1, name.size() - 2);
                if (param.empty()) {
                    w.errors.push_back(
                        ConfigurationError { relativeStr(relative), "Empty parameter name" });
                    continue;
                }
                dynamicDirs.push_back(name);
                childSegments.push_back(RouteSegment { RouteSegment::Type::Param, param });
                break;
            }
            case DirType::Literal:
                childSegments.push_back(RouteSegment { RouteSegment::Type::Literal, name });
                break;
            }
            walk(w, entry.path(), relative, childSegments);
        } else if (name == options_.routeFile) {
            addRoute(w, entry.path(), relative, segments);
        }
    }

    if (dynamicDirs.size() > 1) {
        w.errors.push_back(ConfigurationError { relativeStr(relativeDir),
            "Ambiguous dynamic segments in one directory: " + join(dynamicDirs) });
    }
}

void RouteCompiler::addRoute(Walk& w, const fs::path& file, const fs::path& relativeFile,
    std::vector<RouteSegment> segments) const
{
    const auto relative = relativeStr(relativeFile);

    if (!segments.empty() && segments.back().type == RouteSegment::Type::Literal
        && segments.back().str == "index") {
        segments.pop_back();
    }

    std::unordered_set<std::string> paramNames;
    for (const auto& segment : segments) {
        if (segment.type == RouteSegment::Type::Param && !paramNames.insert(segment.str).second) {
            w.errors.push_back(
                ConfigurationError { relative, "Duplicate parameter name '" + segment.str + "'" });
            return;
        }
    }

    auto routeModule = loader_.load(file.string(), relative);
    if (!routeModule) {
        w.errors.push_back(ConfigurationError { relative, routeModule.error() });
        return;
    }

    RouteDescriptor route;
    route.pattern = RoutePattern(std::move(segments));
    route.file = relative;
    route.middleware = std::move(routeModule->middleware);

    for (auto& [name, handler] : routeModule->handlers) {
        if (!isRouteMethodName(name)) {
            slog::debug("Ignoring export '", name, "' in '", relative, "'");
            continue;
        }
        if (!handler) {
            w.errors.push_back(
                ConfigurationError { relative, "Handler for " + name + " is empty" });
            continue;
        }
        route.handlers.set(*parseMethod(name), std::move(handler));
    }

    for (auto& [key, schema] : routeModule->schema) {
        if (!isRouteMethodKey(key)) {
            slog::debug("Ignoring schema '", key, "' in '", relative, "'");
            continue;
        }
        route.schema.set(*parseMethod(toUpper(key)), std::move(schema));
    }

    for (auto& [key, doc] : routeModule->openapi) {
        if (!isRouteMethodKey(key)) {
            slog::debug("Ignoring documentation '", key, "' in '", relative, "'");
            continue;
        }
        route.docs.set(*parseMethod(toUpper(key)), std::move(doc));
    }

    if (route.handlers.empty()) {
        slog::warning("Route file '", relative, "' does not export any handlers");
    }

    w.routes.push_back(std::move(route));
}

Result<RouteTable, std::vector<ConfigurationError>> compileRoutes(
    const fs::path& directory, const ModuleLoader& loader, RouteCompiler::Options options)
{
    return RouteCompiler(loader, std::move(options)).compile(directory);
}
