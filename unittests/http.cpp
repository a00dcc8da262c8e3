#include "test.hpp"

#include "http.hpp"
#include "json.hpp"

TEST_CASE("Request::parse")
{
    const std::string raw = "POST /api/products?search=x#top HTTP/1.1\r\n"
                            "Host: localhost\r\n"
                            "Content-Type: application/json\r\n"
                            "\r\n"
                            "{\"name\":\"Fries\"}";
    const auto req = Request::parse(raw);
    TEST_REQUIRE(req);
    TEST_CHECK(req->method == Method::Post);
    TEST_CHECK(req->url.path == "/api/products");
    TEST_CHECK(req->url.query == "search=x");
    TEST_CHECK(req->url.fragment == "top");
    TEST_CHECK(req->headers.get("content-type") == "application/json");
    TEST_CHECK(req->body == "{\"name\":\"Fries\"}");
}

TEST_CASE("Request::parse without headers")
{
    const std::string raw = "GET / HTTP/1.0\r\n\r\n";
    const auto req = Request::parse(raw);
    TEST_REQUIRE(req);
    TEST_CHECK(req->url.path == "/");
    TEST_CHECK(req->body.empty());
}

TEST_CASE("Request::parse fails")
{
    TEST_CHECK(!Request::parse("GET /\r\n\r\n"));
    TEST_CHECK(!Request::parse("FETCH / HTTP/1.1\r\n\r\n"));
    TEST_CHECK(!Request::parse("GET / HTTP/2.0\r\n\r\n"));
}

TEST_CASE("Url::parse removes dot segments")
{
    const auto url = Url::parse("/api/./products/../users");
    TEST_REQUIRE(url);
    TEST_CHECK(url->path == "/api/users");

    const auto absolute = Url::parse("http://example.org/api/x?a=1");
    TEST_REQUIRE(absolute);
    TEST_CHECK(absolute->path == "/api/x");
    TEST_CHECK(absolute->query == "a=1");
}

TEST_CASE("Url is copyable")
{
    auto url = Url::parse("/a?b=c").value();
    const auto copy = url;
    url.path = "/changed";
    TEST_CHECK(copy.path == "/a");
    TEST_CHECK(copy.query == "b=c");
}

TEST_CASE("parseMethod")
{
    TEST_CHECK(parseMethod("GET") == Method::Get);
    TEST_CHECK(parseMethod("PATCH") == Method::Patch);
    TEST_CHECK(!parseMethod("get"));
    TEST_CHECK(toString(Method::Delete) == "DELETE");
}

TEST_CASE("Response::string")
{
    const auto resp = Response::text("hi", StatusCode::Created);
    const auto str = resp.string();
    TEST_CHECK(str.find("HTTP/1.1 201 Created\r\n") == 0);
    TEST_CHECK(str.find("Content-Type: text/plain\r\n") != std::string::npos);
    TEST_CHECK(str.find("\r\n\r\nhi") != std::string::npos);
}

TEST_CASE("HeaderMap")
{
    HeaderMap<> headers;
    headers.add("Allow", "GET");
    TEST_CHECK(headers.contains("allow"));
    TEST_CHECK(headers.set("Allow", "GET, POST") == 1);
    TEST_CHECK(headers.get("ALLOW") == "GET, POST");
    TEST_CHECK(headers.remove("Allow") == 1);
    TEST_CHECK(!headers.contains("Allow"));
}

TEST_CASE("isJsonContentType")
{
    TEST_CHECK(isJsonContentType("application/json"));
    TEST_CHECK(isJsonContentType("Application/JSON; charset=utf-8"));
    TEST_CHECK(!isJsonContentType("text/plain"));
    TEST_CHECK(!isJsonContentType("application/jsonp"));
    TEST_CHECK(!isJsonContentType(""));
}

TEST_CASE("Response builders")
{
    const auto redirect = Response::redirect("/docs");
    TEST_CHECK(redirect.status == StatusCode::Found);
    TEST_CHECK(redirect.headers.get("Location") == "/docs");
    TEST_CHECK(redirect.headers.get("Server") == "burger");

    const auto html = Response::html("<p>hi</p>");
    TEST_CHECK(html.headers.get("Content-Type") == "text/html");

    const auto json = jsonResponse(errorDescriptor("nope"), StatusCode::NotFound);
    TEST_CHECK(json.status == StatusCode::NotFound);
    TEST_CHECK(json.headers.get("Content-Type") == "application/json");
    const auto body = parseJson(json.body);
    TEST_REQUIRE(body);
    const auto error = getMember(*body, "error");
    TEST_CHECK(error && error->isString() && error->asString() == "nope");
}
