#include "openapi.hpp"

#include "string.hpp"

namespace {
constexpr std::string_view SwaggerUiCdn = "https://unpkg.com/swagger-ui-dist@5";

// An array with one entry per property of an object JSON schema
JsonArray buildParameters(const Schema& schema, std::string_view location)
{
    JsonArray parameters;
    const auto description = schema.describe();
    const auto properties = getMember(description, "properties");
    if (!properties || !properties->isObject()) {
        return parameters;
    }

    std::vector<std::string> required;
    if (const auto req = getMember(description, "required"); req && req->isArray()) {
        for (const auto& name : req->asArray()) {
            if (name.isString()) {
                required.push_back(name.asString());
            }
        }
    }

    for (const auto& [name, propSchema] : properties->asObject()) {
        bool isRequired = location == "path";
        for (const auto& r : required) {
            isRequired = isRequired || r == name;
        }
        JsonObject param;
        param.emplace("name", JsonValue(name));
        param.emplace("in", JsonValue(std::string(location)));
        param.emplace("required", JsonValue(isRequired));
        param.emplace("schema", propSchema);
        parameters.push_back(JsonValue(std::move(param)));
    }
    return parameters;
}

bool hasParameter(const JsonArray& parameters, const std::string& name)
{
    for (const auto& param : parameters) {
        const auto member = getMember(param, "name");
        if (member && member->isString() && member->asString() == name) {
            return true;
        }
    }
    return false;
}

JsonArray patternParameters(const RoutePattern& pattern)
{
    JsonArray parameters;
    for (const auto& segment : pattern.segments()) {
        if (segment.type != RouteSegment::Type::Param) {
            continue;
        }
        JsonObject schema;
        schema.emplace("type", JsonValue(std::string("string")));
        JsonObject param;
        param.emplace("name", JsonValue(segment.str));
        param.emplace("in", JsonValue(std::string("path")));
        param.emplace("required", JsonValue(true));
        param.emplace("schema", JsonValue(std::move(schema)));
        parameters.push_back(JsonValue(std::move(param)));
    }
    return parameters;
}

JsonValue buildRequestBody(const Schema& schema)
{
    JsonObject media;
    media.emplace("schema", schema.describe());
    JsonObject content;
    content.emplace("application/json", JsonValue(std::move(media)));
    JsonObject body;
    body.emplace("required", JsonValue(true));
    body.emplace("content", JsonValue(std::move(content)));
    return JsonValue(std::move(body));
}

JsonValue buildOperation(const RouteDescriptor& route, Method method, const std::string& path)
{
    const auto doc = route.docs.get(method);
    const auto schema = route.schema.get(method);

    JsonObject operation;
    operation.emplace("summary",
        JsonValue(doc && !doc->summary.empty()
                ? doc->summary
                : "Auto-generated summary for " + toString(method) + " " + path));
    operation.emplace("description", JsonValue(doc ? doc->description : std::string()));
    if (doc && !doc->tags.empty()) {
        JsonArray tags;
        for (const auto& tag : doc->tags) {
            tags.push_back(JsonValue(tag));
        }
        operation.emplace("tags", JsonValue(std::move(tags)));
    }
    if (doc && !doc->operationId.empty()) {
        operation.emplace("operationId", JsonValue(doc->operationId));
    }

    JsonArray parameters;
    if (schema && schema->params) {
        parameters = buildParameters(*schema->params, "path");
    }
    // Pattern parameters the params schema does not describe are still part of the path
    for (auto& param : patternParameters(route.pattern)) {
        if (!hasParameter(parameters, getMember(param, "name")->asString())) {
            parameters.push_back(std::move(param));
        }
    }
    if (schema && schema->query) {
        for (auto& param : buildParameters(*schema->query, "query")) {
            parameters.push_back(std::move(param));
        }
    }
    operation.emplace("parameters", JsonValue(std::move(parameters)));

    if (schema && schema->body) {
        operation.emplace("requestBody", buildRequestBody(*schema->body));
    }

    JsonObject ok;
    ok.emplace("description", JsonValue(std::string("Successful response")));
    JsonObject responses;
    responses.emplace("200", JsonValue(std::move(ok)));
    operation.emplace("responses", JsonValue(std::move(responses)));
    return JsonValue(std::move(operation));
}
}

std::string toOpenApiPath(const RoutePattern& pattern)
{
    std::string path;
    for (const auto& segment : pattern.segments()) {
        path.push_back('/');
        if (segment.type == RouteSegment::Type::Param) {
            path.append("{" + segment.str + "}");
        } else {
            path.append(segment.str);
        }
    }
    return path.empty() ? "/" : path;
}

JsonValue generateOpenApiDocument(const RouteTable& table, const OpenApiInfo& info)
{
    JsonObject paths;
    for (const auto& route : table.routes()) {
        const auto path = toOpenApiPath(route.pattern);
        JsonObject operations;
        for (const auto method : route.methods()) {
            operations.emplace(toLower(toString(method)), buildOperation(route, method, path));
        }
        paths.emplace(path, JsonValue(std::move(operations)));
    }

    JsonObject infoObj;
    infoObj.emplace("title", JsonValue(info.title));
    infoObj.emplace("description", JsonValue(info.description));
    infoObj.emplace("version", JsonValue(info.version));

    JsonObject doc;
    doc.emplace("openapi", JsonValue(std::string("3.0.0")));
    doc.emplace("info", JsonValue(std::move(infoObj)));
    doc.emplace("paths", JsonValue(std::move(paths)));
    return JsonValue(std::move(doc));
}

namespace {
std::string escapeHtml(std::string_view str)
{
    std::string ret;
    ret.reserve(str.size());
    for (const auto ch : str) {
        switch (ch) {
        case '&':
            ret.append("&amp;");
            break;
        case '<':
            ret.append("&lt;");
            break;
        case '>':
            ret.append("&gt;");
            break;
        case '"':
            ret.append("&quot;");
            break;
        default:
            ret.push_back(ch);
        }
    }
    return ret;
}
}

std::string swaggerHtml(std::string_view title, std::string_view openApiPath)
{
    std::string html;
    html.append("<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n");
    html.append("  <meta charset=\"utf-8\" />\n");
    html.append("  <title>").append(escapeHtml(title)).append("</title>\n");
    html.append("  <link rel=\"stylesheet\" href=\"").append(SwaggerUiCdn);
    html.append("/swagger-ui.css\" />\n");
    html.append("</head>\n<body>\n  <div id=\"swagger-ui\"></div>\n");
    html.append("  <script src=\"").append(SwaggerUiCdn);
    html.append("/swagger-ui-bundle.js\"></script>\n");
    html.append("  <script>\n    window.onload = () => {\n");
    html.append("      window.ui = SwaggerUIBundle({ url: \"").append(openApiPath);
    html.append("\", dom_id: \"#swagger-ui\" });\n    };\n  </script>\n</body>\n</html>\n");
    return html;
}

DocsServer::DocsServer(const RouteTable& table, const OpenApiInfo& info, Paths paths)
    : paths_(std::move(paths))
    , document_(generateOpenApiDocument(table, info).dump())
    , html_(swaggerHtml(info.title, paths_.openApi))
{
}

std::optional<Response> DocsServer::handle(const Request& request) const
{
    if (request.method != Method::Get && request.method != Method::Head) {
        return std::nullopt;
    }
    const auto path = normalizePath(request.url.path);
    if (path == normalizePath(paths_.openApi)) {
        return Response(document_, "application/json");
    }
    if (path == normalizePath(paths_.docs)) {
        return Response::html(html_);
    }
    return std::nullopt;
}
