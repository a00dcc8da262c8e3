#include "json.hpp"

Result<JsonValue, std::string> parseJson(std::string_view str)
{
    auto json = minijson::parse(str);
    if (!json) {
        return error(json.error().message);
    }
    return std::move(*json);
}

Response jsonResponse(const JsonValue& json, StatusCode status)
{
    return Response(status, json.dump(), "application/json");
}

JsonValue errorDescriptor(std::string_view message)
{
    JsonObject obj;
    obj.emplace("error", JsonValue(std::string(message)));
    return JsonValue(std::move(obj));
}

bool isJsonContentType(std::string_view contentType)
{
    const auto semicolon = contentType.find(';');
    const auto mediaType = httpTrim(contentType.substr(0, semicolon));
    return ciEqual(mediaType, "application/json");
}

const JsonValue* getMember(const JsonValue& object, const std::string& key)
{
    if (!object.isObject()) {
        return nullptr;
    }
    const auto& obj = object.asObject();
    const auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return &it->second;
}
