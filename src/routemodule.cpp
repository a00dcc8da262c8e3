#include "routemodule.hpp"

#include <filesystem>

#include "string.hpp"

RouteModule& RouteModule::handle(std::string method, SyncHandler handler)
{
    handlers[std::move(method)] = wrapSyncHandler(std::move(handler));
    return *this;
}

RouteModule& RouteModule::handleAsync(std::string method, Handler handler)
{
    handlers[std::move(method)] = std::move(handler);
    return *this;
}

RouteModule& RouteModule::use(Middleware mw)
{
    middleware.push_back(std::move(mw));
    return *this;
}

bool ModuleRegistry::add(std::string sourcePath, Definition definition)
{
    modules_.emplace_back(std::move(sourcePath), std::move(definition));
    return true;
}

namespace {
std::filesystem::path normalizePath(const std::string& str)
{
    std::error_code ec;
    auto path = std::filesystem::weakly_canonical(str, ec);
    if (ec) {
        return std::filesystem::path(str).lexically_normal();
    }
    return path;
}

// Number of trailing components a and b have in common
size_t commonSuffixLength(const std::filesystem::path& a, const std::filesystem::path& b)
{
    const std::vector<std::filesystem::path> aParts(a.begin(), a.end());
    const std::vector<std::filesystem::path> bParts(b.begin(), b.end());
    size_t n = 0;
    while (n < aParts.size() && n < bParts.size()
        && aParts[aParts.size() - 1 - n] == bParts[bParts.size() - 1 - n]) {
        n++;
    }
    return n;
}
}

Result<RouteModule, std::string> ModuleRegistry::load(
    const std::string& path, const std::string& relativePath) const
{
    const auto diskPath = normalizePath(path);

    std::vector<const std::pair<std::string, Definition>*> exact;
    for (const auto& entry : modules_) {
        if (std::filesystem::path(entry.first).is_absolute()
            && normalizePath(entry.first) == diskPath) {
            exact.push_back(&entry);
        }
    }

    // Without an exact match, the modules ending in relativePath that share the most trailing
    // components with the file on disk are the candidates.
    std::vector<const std::pair<std::string, Definition>*> candidates = exact;
    if (exact.empty()) {
        const auto suffix = "/" + relativePath;
        size_t best = 0;
        for (const auto& entry : modules_) {
            if (!endsWith(entry.first, suffix)) {
                continue;
            }
            const auto sourcePath = std::filesystem::path(entry.first).lexically_normal();
            const auto length = commonSuffixLength(sourcePath, diskPath);
            if (length > best) {
                best = length;
                candidates.clear();
            }
            if (length == best) {
                candidates.push_back(&entry);
            }
        }
    }

    if (candidates.empty()) {
        return error("No route module registered for '" + relativePath + "'");
    }
    if (candidates.size() > 1) {
        std::vector<std::string> sources;
        for (const auto entry : candidates) {
            sources.push_back(entry->first);
        }
        return error("Multiple route modules registered for '" + relativePath
            + "': " + join(sources));
    }

    RouteModule routeModule;
    candidates.front()->second(routeModule);
    return routeModule;
}

size_t ModuleRegistry::size() const
{
    return modules_.size();
}

ModuleRegistry& ModuleRegistry::getDefault()
{
    static ModuleRegistry registry;
    return registry;
}
