#pragma once

#include <string>
#include <string_view>

#include <minijson.hpp>

#include "http.hpp"
#include "result.hpp"

using JsonValue = minijson::JsonValue;
using JsonObject = minijson::JsonValue::Object;
using JsonArray = minijson::JsonValue::Array;

Result<JsonValue, std::string> parseJson(std::string_view str);

Response jsonResponse(const JsonValue& json, StatusCode status = StatusCode::Ok);

// {"error": message}
JsonValue errorDescriptor(std::string_view message);

// Content-Type is "application/json" (case-insensitive), optionally followed by parameters
bool isJsonContentType(std::string_view contentType);

// A missing key or a non-object yields nullptr
const JsonValue* getMember(const JsonValue& object, const std::string& key);
