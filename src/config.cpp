#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>

#include <joml.hpp>

#include "string.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

namespace {
std::optional<std::string> substituteEnvVars(std::string_view source)
{
    std::string ret;
    size_t cursor = 0;
    while (cursor < source.size()) {
        const auto start = source.find("${", cursor);
        ret.append(source.substr(cursor, start - cursor));
        if (start == std::string_view::npos) {
            break;
        }

        const auto end = source.find("}", start);
        if (end == std::string_view::npos) {
            slog::error("Unmatched environment variable expansion");
            return std::nullopt;
        }

        const auto arg = source.substr(start + 2, end - start - 2);
        const auto colon = arg.find(':');
        const auto var = std::string(colon == std::string_view::npos ? arg : arg.substr(0, colon));
        const auto defaultValue = colon == std::string_view::npos
            ? std::optional<std::string_view> { std::nullopt }
            : std::optional<std::string_view> { arg.substr(colon + 1) };

        const auto envValue = ::getenv(var.c_str());
        if (envValue) {
            ret.append(envValue);
        } else if (defaultValue) {
            ret.append(*defaultValue);
        } else {
            slog::error("Environment variable '", var, "' is not defined.");
            return std::nullopt;
        }

        cursor = end + 1;
    }
    return ret;
}

template <typename T>
bool loadSingle(const joml::Node& value, std::string_view name, std::string_view typeName, T& dest)
{
    if (!value) {
        return true;
    }
    if (!value.is<T>()) {
        slog::error("'", name, "' must be a ", typeName);
        return false;
    }
    dest = value.as<T>();
    return true;
}

bool load(const joml::Node& value, std::string_view name, bool& dest)
{
    return loadSingle(value, name, "boolean", dest);
}

bool load(const joml::Node& value, std::string_view name, std::string& dest)
{
    return loadSingle(value, name, "string", dest);
}

bool load(const joml::Node& value, std::string_view name, slog::Severity& dest)
{
    std::string str;
    if (!load(value, name, str)) {
        return false;
    }
    const auto severity = slog::parseSeverity(str);
    if (!severity) {
        slog::error("'", name, "' must be one of 'debug', 'info', 'warning', 'error', 'fatal'");
        return false;
    }
    dest = *severity;
    return true;
}

// Route and documentation paths must be absolute
bool loadPath(const joml::Node& value, std::string_view name, std::string& dest)
{
    std::string str;
    if (!load(value, name, str)) {
        return false;
    }
    if (!startsWith(str, "/")) {
        slog::error("'", name, "' must start with '/'");
        return false;
    }
    dest = std::move(str);
    return true;
}

bool loadOpenApi(const joml::Node& node, Config::OpenApi& openApi)
{
    if (!node.isDictionary()) {
        slog::error("'openapi' must be a dictionary");
        return false;
    }
    for (const auto& [key, value] : node.asDictionary()) {
        if (key == "title") {
            if (!load(value, "openapi.title", openApi.title)) {
                return false;
            }
        } else if (key == "description") {
            if (!load(value, "openapi.description", openApi.description)) {
                return false;
            }
        } else if (key == "version") {
            if (!load(value, "openapi.version", openApi.version)) {
                return false;
            }
        } else if (key == "docs_path") {
            if (!loadPath(value, "openapi.docs_path", openApi.docsPath)) {
                return false;
            }
        } else if (key == "openapi_path") {
            if (!loadPath(value, "openapi.openapi_path", openApi.openApiPath)) {
                return false;
            }
        } else {
            slog::error("Invalid key 'openapi.", key, "'");
            return false;
        }
    }
    if (openApi.docsPath == openApi.openApiPath) {
        slog::error("'openapi.docs_path' and 'openapi.openapi_path' must differ");
        return false;
    }
    return true;
}
}

bool Config::loadFromFile(const std::string& path)
{
    const auto source = readFile(path);
    if (!source) {
        // already logged
        return false;
    }

    const auto oldApiDir = apiDir;
    apiDir.clear();
    if (!loadFromString(*source)) {
        apiDir = oldApiDir;
        return false;
    }

    if (apiDir.empty()) {
        apiDir = oldApiDir;
    } else if (fs::path(apiDir).is_relative()) {
        apiDir = (fs::path(path).parent_path() / apiDir).lexically_normal().string();
    }
    return true;
}

bool Config::loadFromString(std::string_view source)
{
    const auto substSource = substituteEnvVars(source);
    if (!substSource) {
        return false;
    }

    const auto joml = joml::parse(*substSource);
    if (!joml) {
        const auto err = joml.error();
        slog::error("Could not parse JOML config: ", err.string(), "\n",
            joml::getContextString(*substSource, err.position));
        return false;
    }

    auto copy = *this;
    for (const auto& [key, value] : *joml) {
        if (key == "api_dir") {
            if (!load(value, "api_dir", copy.apiDir)) {
                return false;
            }
        } else if (key == "prefix") {
            if (!load(value, "prefix", copy.prefix)) {
                return false;
            }
        } else if (key == "route_file") {
            if (!load(value, "route_file", copy.routeFile)) {
                return false;
            }
            if (copy.routeFile.empty() || copy.routeFile.find('/') != std::string::npos) {
                slog::error("'route_file' must be a file name");
                return false;
            }
        } else if (key == "debug") {
            if (!load(value, "debug", copy.debug)) {
                return false;
            }
        } else if (key == "access_log") {
            if (!load(value, "access_log", copy.accessLog)) {
                return false;
            }
        } else if (key == "log_level") {
            if (!load(value, "log_level", copy.logLevel)) {
                return false;
            }
        } else if (key == "openapi") {
            if (!loadOpenApi(value, copy.openApi)) {
                return false;
            }
        } else {
            slog::error("Invalid key '", key, "'");
            return false;
        }
    }
    *this = copy;
    return true;
}
