#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "middleware.hpp"
#include "result.hpp"
#include "schema.hpp"

// Documentation of a single operation. Empty fields are left out of the OpenAPI document.
struct OperationDoc {
    std::string summary;
    std::string description;
    std::vector<std::string> tags;
    std::string operationId;
};

// Everything a route file exports. The maps are keyed by name, like the exports of a module:
// handlers by upper case method name ("GET"), schema and openapi by lower case method name
// ("get"). Names that are not one of the routable methods are ignored by the compiler.
struct RouteModule {
    std::unordered_map<std::string, Handler> handlers;
    std::vector<Middleware> middleware;
    std::unordered_map<std::string, MethodSchema> schema;
    std::unordered_map<std::string, OperationDoc> openapi;

    RouteModule& handle(std::string method, SyncHandler handler);
    RouteModule& handleAsync(std::string method, Handler handler);
    RouteModule& use(Middleware mw);
};

class ModuleLoader {
public:
    virtual ~ModuleLoader() = default;

    // path is the route file as found on disk, relativePath is relative to the route directory
    virtual Result<RouteModule, std::string> load(
        const std::string& path, const std::string& relativePath) const = 0;
};

// Route modules are compiled into the binary and register a function that fills in their
// exports under their source file path.
class ModuleRegistry : public ModuleLoader {
public:
    using Definition = std::function<void(RouteModule&)>;

    // Returns true, so it can be used to initialize a static variable
    bool add(std::string sourcePath, Definition definition);

    // A module whose absolute source path names the same file as path is used first. Otherwise
    // the modules ending in "/" + relativePath are considered and the one sharing the longest
    // path suffix with path wins. No match and a tie are both errors.
    Result<RouteModule, std::string> load(
        const std::string& path, const std::string& relativePath) const override;

    size_t size() const;

    static ModuleRegistry& getDefault();

private:
    std::vector<std::pair<std::string, Definition>> modules_;
};

#define BURGER_CONCAT_IMPL(a, b) a##b
#define BURGER_CONCAT(a, b) BURGER_CONCAT_IMPL(a, b)

// BURGER_ROUTE_MODULE(route) { route.handle("GET", ...); }
#define BURGER_ROUTE_MODULE(name)                                                                \
    static void BURGER_CONCAT(burgerRouteModule_, __LINE__)(RouteModule&);                        \
    static const bool BURGER_CONCAT(burgerRouteModuleRegistered_, __LINE__)                       \
        = ModuleRegistry::getDefault().add(                                                      \
            __FILE__, &BURGER_CONCAT(burgerRouteModule_, __LINE__));                              \
    static void BURGER_CONCAT(burgerRouteModule_, __LINE__)(RouteModule & name)
