#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "string.hpp"

enum class Method {
    Get,
    Head,
    Post,
    Put,
    Delete,
    Connect,
    Options,
    Trace,
    Patch,
};

constexpr size_t NumMethods = static_cast<size_t>(Method::Patch) + 1;

// The methods a route module may export a handler for. CONNECT and TRACE are parsed, but never
// routed, so they always end up as "method not allowed" on an existing path.
constexpr std::array<Method, 7> RouteMethods {
    Method::Get,
    Method::Post,
    Method::Put,
    Method::Delete,
    Method::Patch,
    Method::Head,
    Method::Options,
};

std::optional<Method> parseMethod(std::string_view method);
std::string toString(Method method);

enum class StatusCode : uint32_t {
    Invalid = 0,

    Ok = 200,
    Created = 201,
    Accepted = 202,
    NoContent = 204,

    MovedPermanently = 301,
    Found = 302,
    SeeOther = 303,
    NotModified = 304,
    TemporaryRedirect = 307,
    PermanentRedirect = 308,

    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    Conflict = 409,
    PayloadTooLarge = 413,
    UnsupportedMediaType = 415,
    UnprocessableEntity = 422,
    TooManyRequests = 429,

    InternalServerError = 500,
    NotImplemented = 501,
    ServiceUnavailable = 503,
};

std::string_view getReasonPhrase(StatusCode status);

template <typename StringType = std::string>
class HeaderMap {
public:
    HeaderMap() = default;
    HeaderMap(std::vector<std::pair<StringType, StringType>> h);

    // Names are compared case-insensitively
    bool contains(std::string_view name) const;
    std::optional<std::string_view> get(std::string_view name) const;

    void add(std::string_view name, std::string_view value);
    // Both return the number of removed entries
    size_t set(std::string_view name, std::string_view value);
    size_t remove(std::string_view name);

    // "Name: value" lines separated by CRLF
    bool parse(std::string_view str);
    void serialize(std::string& str) const;

private:
    std::optional<size_t> find(std::string_view name) const;

    std::vector<std::pair<StringType, StringType>> headers_;
};

extern template class HeaderMap<std::string_view>;
extern template class HeaderMap<std::string>;

// Owns all of its parts, so it can be copied and moved freely
struct Url {
    std::string fullRaw;
    // Dot segments are removed, but it is not percent-decoded
    std::string path;
    std::string query;
    std::string fragment;

    // Origin form ("/path?query") or absolute form ("http://host/path?query")
    static std::optional<Url> parse(std::string_view str);
};

// All views reference the buffer that was parsed, which has to outlive the Request.
struct Request {
    Method method = Method::Get;
    Url url;
    std::string_view version;
    HeaderMap<std::string_view> headers;
    std::string_view body;

    static std::optional<Request> parse(std::string_view str);
};

struct Response {
    StatusCode status = StatusCode::Ok;
    HeaderMap<std::string> headers;
    std::string body = {};

    Response();

    Response(std::string body);

    Response(std::string body, std::string_view contentType);

    Response(StatusCode status);

    Response(StatusCode status, std::string body);

    Response(StatusCode status, std::string body, std::string_view contentType);

    static Response text(std::string body, StatusCode status = StatusCode::Ok);
    static Response html(std::string body, StatusCode status = StatusCode::Ok);
    static Response redirect(std::string_view location, StatusCode status = StatusCode::Found);

    void addServerHeader();

    std::string string(std::string_view httpVersion = "HTTP/1.1") const;
};
