#include "test.hpp"

#include "schema.hpp"
#include "testutil.hpp"

namespace {
JsonValue parsed(std::string_view str)
{
    return parseJson(str).value();
}

size_t issueCount(const Result<JsonValue, SchemaError>& res)
{
    const auto issues = at(res.error().detail, "issues");
    return issues && issues->isArray() ? issues->asArray().size() : 0;
}

const JsonValue* issueFor(const Result<JsonValue, SchemaError>& res, std::string_view path)
{
    const auto issues = at(res.error().detail, "issues");
    if (!issues || !issues->isArray()) {
        return nullptr;
    }
    for (const auto& issue : issues->asArray()) {
        if (isString(at(issue, "path"), path)) {
            return at(issue, "message");
        }
    }
    return nullptr;
}
}

TEST_CASE("ObjectSchema accepts valid objects")
{
    auto schema = objectSchema();
    schema->string("name").number("price").integer("stock").boolean("featured").optional();

    const auto res = schema->parse(parsed(R"({"name":"Fries","price":2.5,"stock":3})"));
    TEST_REQUIRE(res);
    TEST_CHECK(isString(at(*res, "name"), "Fries"));
    TEST_CHECK(at(*res, "price")->asNumber() == 2.5);
    TEST_CHECK(at(*res, "stock")->asNumber() == 3.0);
    TEST_CHECK(!at(*res, "featured"));
}

TEST_CASE("ObjectSchema reports one issue per field")
{
    auto schema = objectSchema();
    schema->string("name").number("price").integer("stock");

    const auto res = schema->parse(parsed(R"({"price":"cheap","stock":1.5})"));
    TEST_REQUIRE(!res);
    TEST_CHECK(issueCount(res) == 3);
    TEST_CHECK(isString(issueFor(res, "name"), "Required"));
    TEST_CHECK(isString(issueFor(res, "price"), "Expected number"));
    TEST_CHECK(isString(issueFor(res, "stock"), "Expected integer"));
}

TEST_CASE("ObjectSchema treats null as missing")
{
    auto schema = objectSchema();
    schema->string("name").string("note").optional();

    const auto res = schema->parse(parsed(R"({"name":null,"note":null})"));
    TEST_REQUIRE(!res);
    TEST_CHECK(issueCount(res) == 1);
    TEST_CHECK(isString(issueFor(res, "name"), "Required"));
}

TEST_CASE("ObjectSchema rejects non-objects")
{
    auto schema = objectSchema();
    schema->string("name");
    for (const auto str : { "[]", "\"name\"", "null", "1" }) {
        const auto res = schema->parse(parsed(str));
        TEST_REQUIRE(!res);
        TEST_CHECK(isString(issueFor(res, ""), "Expected object"));
    }
}

TEST_CASE("ObjectSchema checks constraints")
{
    auto schema = objectSchema();
    schema->string("name").minLength(1, "Name is required").number("price").positive();
    schema->string("code").minLength(3);

    const auto res = schema->parse(parsed(R"({"name":"","price":0,"code":"ab"})"));
    TEST_REQUIRE(!res);
    TEST_CHECK(isString(issueFor(res, "name"), "Name is required"));
    TEST_CHECK(isString(issueFor(res, "price"), "Must be greater than 0"));
    TEST_CHECK(isString(issueFor(res, "code"), "Must contain at least 3 character(s)"));

    TEST_CHECK(schema->parse(parsed(R"({"name":"x","price":0.01,"code":"abc"})")));
}

TEST_CASE("ObjectSchema coerces strings")
{
    auto schema = objectSchema();
    schema->integer("id").positive().number("ratio").boolean("flag").coerce();

    const auto res = schema->parse(parsed(R"({"id":"42","ratio":" 0.5 ","flag":"false"})"));
    TEST_REQUIRE(res);
    TEST_CHECK(at(*res, "id")->asNumber() == 42.0);
    TEST_CHECK(at(*res, "ratio")->asNumber() == 0.5);
    TEST_CHECK(at(*res, "flag")->isBool());
    TEST_CHECK(!at(*res, "flag")->asBool());

    const auto bad = schema->parse(parsed(R"({"id":"4.2","ratio":"","flag":"yes"})"));
    TEST_REQUIRE(!bad);
    TEST_CHECK(issueCount(bad) == 3);

    const auto negative = schema->parse(parsed(R"({"id":"-1","ratio":"1","flag":"true"})"));
    TEST_REQUIRE(!negative);
    TEST_CHECK(isString(issueFor(negative, "id"), "Must be greater than 0"));
}

TEST_CASE("ObjectSchema does not coerce by default")
{
    auto schema = objectSchema();
    schema->integer("id");
    const auto res = schema->parse(parsed(R"({"id":"42"})"));
    TEST_REQUIRE(!res);
    TEST_CHECK(isString(issueFor(res, "id"), "Expected integer"));
}

TEST_CASE("ObjectSchema drops or rejects undeclared keys")
{
    auto lenient = objectSchema();
    lenient->string("name");
    const auto res = lenient->parse(parsed(R"({"name":"a","extra":1})"));
    TEST_REQUIRE(res);
    TEST_CHECK(!at(*res, "extra"));

    auto strict = objectSchema();
    strict->string("name").strict();
    const auto rejected = strict->parse(parsed(R"({"name":"a","extra":1})"));
    TEST_REQUIRE(!rejected);
    TEST_CHECK(isString(issueFor(rejected, "extra"), "Unrecognized key"));
}

TEST_CASE("ObjectSchema describes itself as JSON schema")
{
    auto schema = objectSchema();
    schema->string("name").minLength(1).number("price").positive().boolean("featured").optional();

    const auto desc = schema->describe();
    TEST_CHECK(isString(at(desc, "type"), "object"));
    TEST_CHECK(isString(at(desc, "properties", "name", "type"), "string"));
    TEST_CHECK(at(desc, "properties", "name", "minLength")->asNumber() == 1.0);
    TEST_CHECK(isString(at(desc, "properties", "price", "type"), "number"));
    TEST_CHECK(at(desc, "properties", "price", "exclusiveMinimum")->asBool());
    TEST_CHECK(isString(at(desc, "properties", "featured", "type"), "boolean"));

    const auto required = at(desc, "required");
    TEST_REQUIRE(required && required->isArray());
    TEST_CHECK(required->asArray().size() == 2);
    TEST_CHECK(isString(at(*required, 0), "name"));
    TEST_CHECK(isString(at(*required, 1), "price"));
}

TEST_CASE("Custom schemas describe an empty schema")
{
    CountingSchema schema;
    const auto desc = schema.describe();
    TEST_CHECK(desc.isObject());
    TEST_CHECK(desc.asObject().empty());
}

TEST_CASE("MethodSchema is empty without validators")
{
    MethodSchema schema;
    TEST_CHECK(schema.empty());
    schema.query = objectSchema();
    TEST_CHECK(!schema.empty());
}
