#include "util.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>

#include "log.hpp"

std::optional<std::string> readFile(const std::string& path)
{
    // fopen succeeds for directories, so check the type first
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        slog::error("'", path, "' is not a regular file", ec ? ": " + ec.message() : "");
        return std::nullopt;
    }

    auto f = std::unique_ptr<FILE, decltype(&std::fclose)>(
        std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!f) {
        slog::error("Could not open file: '", path, "'");
        return std::nullopt;
    }

    std::string ret;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f.get())) > 0) {
        ret.append(buf, n);
    }
    if (std::ferror(f.get())) {
        slog::error("Error reading file: '", path, "'");
        return std::nullopt;
    }
    return ret;
}
