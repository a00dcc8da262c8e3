#pragma once

#include <optional>
#include <string>

// Errors are logged
std::optional<std::string> readFile(const std::string& path);
