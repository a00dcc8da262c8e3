#include "test.hpp"

#include "routepattern.hpp"

namespace {
std::optional<RouteParams> matchPath(const RoutePattern& pattern, std::string_view path)
{
    const auto normalized = normalizePath(path);
    return pattern.match(splitPath(normalized));
}
}

TEST_CASE("RoutePattern::parse")
{
    const auto pattern = RoutePattern::parse("/api/product/:id");
    TEST_REQUIRE(pattern);
    TEST_REQUIRE(pattern->segments().size() == 3);
    TEST_CHECK(pattern->segments()[1].type == RouteSegment::Type::Literal);
    TEST_CHECK(pattern->segments()[2].type == RouteSegment::Type::Param);
    TEST_CHECK(pattern->segments()[2].str == "id");
    TEST_CHECK(pattern->str() == "/api/product/:id");
    TEST_CHECK(pattern->specificity() == 2);

    TEST_CHECK(RoutePattern::parse("")->str() == "/");
    TEST_CHECK(RoutePattern::parse("//a//b/")->str() == "/a/b");
    TEST_CHECK(!RoutePattern::parse("/a/:"));
}

TEST_CASE("RoutePattern::shape ignores parameter names")
{
    const auto a = RoutePattern::parse("/product/:id").value();
    const auto b = RoutePattern::parse("/product/:slug").value();
    TEST_CHECK(a.shape() == b.shape());
    TEST_CHECK(!(a == b));
    TEST_CHECK(a.shape() != RoutePattern::parse("/product/featured")->shape());
}

TEST_CASE("RoutePattern::match")
{
    const auto pattern = RoutePattern::parse("/api/product/:id").value();
    const auto params = matchPath(pattern, "/api/product/42");
    TEST_REQUIRE(params);
    TEST_CHECK(params->size() == 1);
    TEST_CHECK(params->at("id") == "42");

    TEST_CHECK(!matchPath(pattern, "/api/product"));
    TEST_CHECK(!matchPath(pattern, "/api/product/42/reviews"));
    TEST_CHECK(!matchPath(pattern, "/api/products/42"));
    TEST_CHECK(matchPath(pattern, "/api/product/42/"));
}

TEST_CASE("RoutePattern::match decodes parameters")
{
    const auto pattern = RoutePattern::parse("/files/:name").value();
    const auto params = matchPath(pattern, "/files/my%20file%2Etxt");
    TEST_REQUIRE(params);
    TEST_CHECK(params->at("name") == "my file.txt");

    // Malformed escapes do not match
    TEST_CHECK(!matchPath(pattern, "/files/%zz"));
}

TEST_CASE("RoutePattern::match compares literals verbatim")
{
    const auto pattern = RoutePattern::parse("/my file").value();
    TEST_CHECK(!matchPath(pattern, "/my%20file"));
}

TEST_CASE("RoutePattern root")
{
    const auto root = RoutePattern::parse("/").value();
    TEST_CHECK(root.specificity() == 0);
    TEST_CHECK(matchPath(root, "/"));
    TEST_CHECK(matchPath(root, ""));
    TEST_CHECK(!matchPath(root, "/a"));
}
