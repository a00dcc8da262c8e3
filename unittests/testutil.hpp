#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "dispatcher.hpp"
#include "json.hpp"
#include "routemodule.hpp"

// A raw request and the Request parsed from it, which references the raw string
struct TestRequest {
    std::string raw;
    Request request;

    static std::unique_ptr<TestRequest> create(std::string_view method, std::string_view target,
        std::string_view body = "", std::string_view contentType = "application/json");
};

// Dispatches and returns the response if the handler responded synchronously
std::optional<Response> fetch(const Dispatcher& dispatcher, std::string_view method,
    std::string_view target, std::string_view body = "",
    std::string_view contentType = "application/json");

JsonValue parseBody(const Response& response);

// Walks a JSON value along object keys and array indices, e.g. at(json, "errors", 0, "field")
const JsonValue* at(const JsonValue& json, std::string_view key);
const JsonValue* at(const JsonValue& json, size_t index);

template <typename First, typename Second, typename... Rest>
const JsonValue* at(const JsonValue& json, First first, Second second, Rest... rest)
{
    const auto child = at(json, first);
    return child ? at(*child, second, rest...) : nullptr;
}

bool isString(const JsonValue* json, std::string_view str);

// Creates a unique directory and removes it again
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const;

    // Creates the file and all parent directories
    void touch(const std::string& relativePath) const;
    void mkdir(const std::string& relativePath) const;

private:
    std::filesystem::path path_;
};

// Counts calls and always succeeds with the input value
class CountingSchema : public Schema {
public:
    Result<JsonValue, SchemaError> parse(const JsonValue& value) const override;

    mutable size_t calls = 0;
};

// A route module with a GET handler returning text
RouteModule textModule(std::string text, Method method = Method::Get);
