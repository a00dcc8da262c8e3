#pragma once

#include <optional>
#include <string>

#include "http.hpp"
#include "json.hpp"
#include "routetable.hpp"

struct OpenApiInfo {
    std::string title = "Burger API";
    std::string description = "Auto-generated API documentation";
    std::string version = "1.0.0";
};

// "/api/products/:id" -> "/api/products/{id}"
std::string toOpenApiPath(const RoutePattern& pattern);

// OpenAPI 3.0 document of all routes. Path parameters without a params schema are documented
// as required strings.
JsonValue generateOpenApiDocument(const RouteTable& table, const OpenApiInfo& info);

// A Swagger UI page loading the document from openApiPath
std::string swaggerHtml(std::string_view title, std::string_view openApiPath);

// Serves the document and the Swagger UI. Both are rendered once on construction.
class DocsServer {
public:
    struct Paths {
        std::string docs = "/docs";
        std::string openApi = "/openapi.json";
    };

    DocsServer(const RouteTable& table, const OpenApiInfo& info, Paths paths);

    // nullopt if the request is not for one of the paths
    std::optional<Response> handle(const Request& request) const;

private:
    Paths paths_;
    std::string document_;
    std::string html_;
};
