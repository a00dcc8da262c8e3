#include "http.hpp"

#include <algorithm>

#include "log.hpp"

std::optional<Method> parseMethod(std::string_view method)
{
    // RFC2616, 5.1.1: "The method is case-sensitive"
    if (method == "GET") {
        return Method::Get;
    } else if (method == "HEAD") {
        return Method::Head;
    } else if (method == "POST") {
        return Method::Post;
    } else if (method == "PUT") {
        return Method::Put;
    } else if (method == "DELETE") {
        return Method::Delete;
    } else if (method == "CONNECT") {
        return Method::Connect;
    } else if (method == "OPTIONS") {
        return Method::Options;
    } else if (method == "TRACE") {
        return Method::Trace;
    } else if (method == "PATCH") {
        return Method::Patch;
    }
    return std::nullopt;
}

std::string toString(Method method)
{
    switch (method) {
    case Method::Get:
        return "GET";
    case Method::Head:
        return "HEAD";
    case Method::Post:
        return "POST";
    case Method::Put:
        return "PUT";
    case Method::Delete:
        return "DELETE";
    case Method::Connect:
        return "CONNECT";
    case Method::Options:
        return "OPTIONS";
    case Method::Trace:
        return "TRACE";
    case Method::Patch:
        return "PATCH";
    default:
        return "invalid";
    }
}

std::string_view getReasonPhrase(StatusCode status)
{
    switch (status) {
    case StatusCode::Ok:
        return "OK";
    case StatusCode::Created:
        return "Created";
    case StatusCode::Accepted:
        return "Accepted";
    case StatusCode::NoContent:
        return "No Content";
    case StatusCode::MovedPermanently:
        return "Moved Permanently";
    case StatusCode::Found:
        return "Found";
    case StatusCode::SeeOther:
        return "See Other";
    case StatusCode::NotModified:
        return "Not Modified";
    case StatusCode::TemporaryRedirect:
        return "Temporary Redirect";
    case StatusCode::PermanentRedirect:
        return "Permanent Redirect";
    case StatusCode::BadRequest:
        return "Bad Request";
    case StatusCode::Unauthorized:
        return "Unauthorized";
    case StatusCode::Forbidden:
        return "Forbidden";
    case StatusCode::NotFound:
        return "Not Found";
    case StatusCode::MethodNotAllowed:
        return "Method Not Allowed";
    case StatusCode::Conflict:
        return "Conflict";
    case StatusCode::PayloadTooLarge:
        return "Payload Too Large";
    case StatusCode::UnsupportedMediaType:
        return "Unsupported Media Type";
    case StatusCode::UnprocessableEntity:
        return "Unprocessable Entity";
    case StatusCode::TooManyRequests:
        return "Too Many Requests";
    case StatusCode::InternalServerError:
        return "Internal Server Error";
    case StatusCode::NotImplemented:
        return "Not Implemented";
    case StatusCode::ServiceUnavailable:
        return "Service Unavailable";
    default:
        // The reason phrase may be empty
        return "";
    }
}

template <typename StringType>
HeaderMap<StringType>::HeaderMap(std::vector<std::pair<StringType, StringType>> h)
    : headers_(std::move(h))
{
}

template <typename StringType>
std::optional<size_t> HeaderMap<StringType>::find(std::string_view name) const
{
    for (size_t i = 0; i < headers_.size(); ++i) {
        if (ciEqual(headers_[i].first, name)) {
            return i;
        }
    }
    return std::nullopt;
}

template <typename StringType>
bool HeaderMap<StringType>::contains(std::string_view name) const
{
    return find(name).has_value();
}

template <typename StringType>
std::optional<std::string_view> HeaderMap<StringType>::get(std::string_view name) const
{
    if (const auto idx = find(name)) {
        return std::string_view(headers_[*idx].second);
    }
    return std::nullopt;
}

template <typename StringType>
void HeaderMap<StringType>::add(std::string_view name, std::string_view value)
{
    headers_.emplace_back(StringType(name), StringType(value));
}

template <typename StringType>
size_t HeaderMap<StringType>::set(std::string_view name, std::string_view value)
{
    const auto removed = remove(name);
    add(name, value);
    return removed;
}

template <typename StringType>
size_t HeaderMap<StringType>::remove(std::string_view name)
{
    const auto size = headers_.size();
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                       [name](const auto& header) { return ciEqual(header.first, name); }),
        headers_.end());
    return size - headers_.size();
}

template <typename StringType>
bool HeaderMap<StringType>::parse(std::string_view str)
{
    // The last line may or may not be terminated
    while (!str.empty()) {
        const auto lineEnd = str.find("\r\n");
        const auto line = str.substr(0, lineEnd);
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            slog::debug("Header line without colon: '", line, "'");
            return false;
        }
        add(line.substr(0, colon), httpTrim(line.substr(colon + 1)));
        str = lineEnd == std::string_view::npos ? std::string_view() : str.substr(lineEnd + 2);
    }
    return true;
}

template <typename StringType>
void HeaderMap<StringType>::serialize(std::string& str) const
{
    for (const auto& [name, value] : headers_) {
        str.append(name).append(": ").append(value).append("\r\n");
    }
}

template class HeaderMap<std::string_view>;
template class HeaderMap<std::string>;

namespace {
// RFC3986, 5.2.4. Works on whole segments instead of the character-wise algorithm of the RFC.
// path always starts with a slash.
std::string removeDotSegments(std::string_view path)
{
    assert(!path.empty() && path[0] == '/');
    std::vector<std::string_view> segments;
    size_t start = 1;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = slash == std::string_view::npos ? path.size() : slash;
        const auto segment = path.substr(start, end - start);
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else if (segment != ".") {
            segments.push_back(segment);
        }
        start = end + 1;
    }

    std::string ret;
    ret.reserve(path.size());
    for (const auto segment : segments) {
        ret.push_back('/');
        ret.append(segment);
    }
    return ret.empty() ? "/" : ret;
}
}

std::optional<Url> Url::parse(std::string_view str)
{
    constexpr auto npos = std::string_view::npos;

    Url url;
    url.fullRaw = std::string(str);

    if (const auto hash = str.find('#'); hash != npos) {
        url.fragment = std::string(str.substr(hash + 1));
        str = str.substr(0, hash);
    }

    // Absolute form: scheme and authority are irrelevant for routing
    if (const auto scheme = str.find("://"); scheme != npos && scheme < str.find('/')) {
        const auto pathStart = str.find('/', scheme + 3);
        if (pathStart == npos) {
            return std::nullopt;
        }
        str = str.substr(pathStart);
    }

    if (const auto question = str.find('?'); question != npos) {
        url.query = std::string(str.substr(question + 1));
        str = str.substr(0, question);
    }

    if (str.empty() || str[0] != '/') {
        return std::nullopt;
    }
    url.path = removeDotSegments(str);
    return url;
}

std::optional<Request> Request::parse(std::string_view str)
{
    // "POST /api/products HTTP/1.1\r\nContent-Type: application/json\r\n\r\n{...}"
    const auto lineEnd = str.find("\r\n");
    if (lineEnd == std::string_view::npos) {
        slog::debug("Unterminated request line");
        return std::nullopt;
    }
    const auto line = str.substr(0, lineEnd);
    const auto methodEnd = line.find(' ');
    const auto targetEnd = line.rfind(' ');
    if (methodEnd == std::string_view::npos || targetEnd == methodEnd) {
        slog::debug("Malformed request line: '", line, "'");
        return std::nullopt;
    }

    Request req;
    const auto method = parseMethod(line.substr(0, methodEnd));
    if (!method) {
        slog::debug("Invalid method: '", line.substr(0, methodEnd), "'");
        return std::nullopt;
    }
    req.method = *method;

    auto url = Url::parse(line.substr(methodEnd + 1, targetEnd - methodEnd - 1));
    if (!url) {
        slog::debug("Invalid request target in '", line, "'");
        return std::nullopt;
    }
    req.url = std::move(*url);

    req.version = line.substr(targetEnd + 1);
    if (req.version != "HTTP/1.0" && req.version != "HTTP/1.1") {
        slog::debug("Unsupported version: '", req.version, "'");
        return std::nullopt;
    }

    // Without headers the empty line directly follows the request line
    const auto headersEnd = str.find("\r\n\r\n", lineEnd);
    if (headersEnd == std::string_view::npos) {
        slog::debug("Unterminated header block");
        return std::nullopt;
    }
    if (!req.headers.parse(str.substr(lineEnd + 2, headersEnd - lineEnd))) {
        return std::nullopt;
    }
    req.body = str.substr(headersEnd + 4);
    return req;
}

Response::Response()
    : status(StatusCode::Invalid)
{
}

Response::Response(std::string body)
    : body(std::move(body))
{
    addServerHeader();
}

Response::Response(std::string body, std::string_view contentType)
    : body(std::move(body))
{
    addServerHeader();
    headers.add("Content-Type", contentType);
}

Response::Response(StatusCode status, std::string body)
    : status(status)
    , body(std::move(body))
{
    addServerHeader();
}

Response::Response(StatusCode status)
    : status(status)
{
    addServerHeader();
}

Response::Response(StatusCode status, std::string body, std::string_view contentType)
    : status(status)
    , body(std::move(body))
{
    addServerHeader();
    headers.add("Content-Type", contentType);
}

Response Response::text(std::string body, StatusCode status)
{
    return Response(status, std::move(body), "text/plain");
}

Response Response::html(std::string body, StatusCode status)
{
    return Response(status, std::move(body), "text/html");
}

Response Response::redirect(std::string_view location, StatusCode status)
{
    Response resp(status);
    resp.headers.add("Location", location);
    return resp;
}

void Response::addServerHeader()
{
    // No version, so we don't advertise how outdated a deployment is
    headers.add("Server", "burger");
}

std::string Response::string(std::string_view httpVersion) const
{
    std::string s;
    s.reserve(256 + body.size());
    s.append(httpVersion);
    s.append(" ");
    s.append(std::to_string(static_cast<int>(status)));
    // The reason phrase may be empty, but the separator space is not optional
    s.append(" ");
    s.append(getReasonPhrase(status));
    s.append("\r\n");
    headers.serialize(s);
    if (!headers.contains("Content-Length") && !body.empty()) {
        s.append("Content-Length: ");
        s.append(std::to_string(body.size()));
        s.append("\r\n");
    }
    s.append("\r\n");
    s.append(body);
    return s;
}
