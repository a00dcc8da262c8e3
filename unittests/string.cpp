#include "test.hpp"

#include "routepattern.hpp"
#include "string.hpp"

TEST_CASE("percentDecode")
{
    TEST_CHECK(percentDecode("abc") == "abc");
    TEST_CHECK(percentDecode("a%20b") == "a b");
    TEST_CHECK(percentDecode("%2F%2f") == "//");
    TEST_CHECK(percentDecode("a+b") == "a+b");
    TEST_CHECK(percentDecode("a+b", true) == "a b");
}

TEST_CASE("percentDecode fails")
{
    TEST_CHECK(!percentDecode("%"));
    TEST_CHECK(!percentDecode("%4"));
    TEST_CHECK(!percentDecode("abc%"));
    TEST_CHECK(!percentDecode("%zz"));
}

TEST_CASE("parseQueryString")
{
    const auto query = parseQueryString("search=cheese+burger&page=2&flag&bad=%zz&a=1&a=2");
    TEST_CHECK(query.at("search") == "cheese burger");
    TEST_CHECK(query.at("page") == "2");
    TEST_CHECK(query.at("flag") == "");
    TEST_CHECK(query.count("bad") == 0);
    TEST_CHECK(query.at("a") == "2");
    TEST_CHECK(parseQueryString("").empty());
}

TEST_CASE("normalizePath")
{
    TEST_CHECK(normalizePath("") == "/");
    TEST_CHECK(normalizePath("/") == "/");
    TEST_CHECK(normalizePath("//") == "/");
    TEST_CHECK(normalizePath("/api/products/") == "/api/products");
    TEST_CHECK(normalizePath("//api///products") == "/api/products");
    TEST_CHECK(normalizePath("api") == "/api");
}

TEST_CASE("splitPath")
{
    TEST_CHECK(splitPath("/").empty());
    const auto segments = splitPath("/api/products/42");
    TEST_REQUIRE(segments.size() == 3);
    TEST_CHECK(segments[0] == "api");
    TEST_CHECK(segments[2] == "42");
}

TEST_CASE("cleanPrefix")
{
    TEST_CHECK(cleanPrefix("api") == "api");
    TEST_CHECK(cleanPrefix("/api/") == "api");
    TEST_CHECK(cleanPrefix("//v1/api//") == "v1/api");
    TEST_CHECK(cleanPrefix("/").empty());
}

TEST_CASE("startsWith/endsWith")
{
    TEST_CHECK(startsWith("/api/x", "/api"));
    TEST_CHECK(!startsWith("/a", "/api"));
    TEST_CHECK(endsWith("route.cpp", ".cpp"));
    TEST_CHECK(!endsWith("cpp", "route.cpp"));
}

TEST_CASE("toLower/toUpper")
{
    TEST_CHECK(toLower("GET") == "get");
    TEST_CHECK(toUpper("delete") == "DELETE");
    TEST_CHECK(ciEqual("Content-Type", "content-type"));
}
