#include "test.hpp"

#include "routecompiler.hpp"
#include "testutil.hpp"

namespace {
ModuleRegistry::Definition text(std::string str)
{
    return [str](RouteModule& mod) { mod = textModule(str); };
}

// Succeeds for every file and records the calls
class RecordingLoader : public ModuleLoader {
public:
    Result<RouteModule, std::string> load(
        const std::string& path, const std::string& relativePath) const override
    {
        paths.push_back(path);
        relativePaths.push_back(relativePath);
        return textModule(relativePath);
    }

    mutable std::vector<std::string> paths;
    mutable std::vector<std::string> relativePaths;
};

// The module's label ends up as the GET summary of its route
ModuleRegistry::Definition labeled(std::string label)
{
    return [label](RouteModule& mod) {
        mod = textModule(label);
        mod.openapi["get"] = OperationDoc { label, "", {}, "" };
    };
}

std::string summaryOf(const RouteTable& table, std::string_view pattern)
{
    for (const auto& route : table.routes()) {
        if (route.pattern.str() == pattern) {
            const auto doc = route.docs.get(Method::Get);
            return doc ? doc->summary : "";
        }
    }
    return "";
}

bool containsError(const std::vector<ConfigurationError>& errors, std::string_view needle)
{
    for (const auto& err : errors) {
        if (err.string().find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> patterns(const RouteTable& table)
{
    std::vector<std::string> ret;
    for (const auto& route : table.routes()) {
        ret.push_back(route.pattern.str());
    }
    return ret;
}
}

TEST_CASE("Compiler turns [name] directories into parameters")
{
    TempDir dir;
    dir.touch("api/product/[id]/route.cpp");
    ModuleRegistry registry;
    registry.add("api/product/[id]/route.cpp", text("product"));

    const auto table = compileRoutes(dir.path() / "api", registry);
    TEST_REQUIRE(table);
    TEST_REQUIRE(table->size() == 1);
    const auto& route = table->routes()[0];
    TEST_CHECK(route.pattern.str() == "/api/product/:id");
    TEST_CHECK(route.file == "product/[id]/route.cpp");

    const auto res = table->match("/api/product/42", Method::Get);
    const auto match = std::get_if<RouteTable::Match>(&res);
    TEST_REQUIRE(match);
    TEST_CHECK(match->params.at("id") == "42");
}

TEST_CASE("Compiler hides grouping directories")
{
    TempDir dir;
    dir.touch("api/(admin)/users/route.cpp");
    ModuleRegistry registry;
    registry.add("/src/api/(admin)/users/route.cpp", text("users"));

    const auto table = compileRoutes(dir.path() / "api", registry);
    TEST_REQUIRE(table);
    TEST_CHECK(patterns(*table) == std::vector<std::string> { "/api/users" });
}

TEST_CASE("Compiler rejects dynamic siblings")
{
    TempDir dir;
    dir.touch("product/[id]/route.cpp");
    dir.touch("product/[slug]/route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(!table);
    TEST_CHECK(containsError(table.error(), "Ambiguous dynamic segments"));
    TEST_CHECK(containsError(table.error(), "[id], [slug]"));
}

TEST_CASE("Compiler rejects dynamic siblings without route files")
{
    TempDir dir;
    dir.mkdir("[a]");
    dir.mkdir("[b]");
    dir.touch("route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(!table);
    TEST_CHECK(table.error().size() == 1);
}

TEST_CASE("Compiler allows dynamic directories in different parents")
{
    TempDir dir;
    dir.touch("users/[userId]/route.cpp");
    dir.touch("products/[productId]/route.cpp");
    dir.touch("products/[productId]/reviews/[reviewId]/route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(table);
    TEST_CHECK(table->size() == 3);
}

TEST_CASE("Compiler returns an empty table for an empty tree")
{
    TempDir dir;
    dir.mkdir("api/products");
    dir.touch("api/products/README.md");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(table);
    TEST_CHECK(table->empty());
    TEST_CHECK(loader.paths.empty());
}

TEST_CASE("Compiler fails for a missing directory")
{
    TempDir dir;
    RecordingLoader loader;
    const auto table = compileRoutes(dir.path() / "does-not-exist", loader);
    TEST_REQUIRE(!table);
    TEST_CHECK(table.error().size() == 1);
}

TEST_CASE("Compiler maps index directories to their parent")
{
    TempDir dir;
    dir.touch("index/route.cpp");
    dir.touch("products/index/route.cpp");
    dir.touch("products/[id]/route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(table);
    TEST_CHECK((patterns(*table)
        == std::vector<std::string> { "/api/products", "/api/products/:id", "/api" }));
}

TEST_CASE("Compiler detects duplicate routes")
{
    TempDir dir;
    dir.touch("(a)/x/route.cpp");
    dir.touch("(b)/x/route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(!table);
    TEST_CHECK(containsError(table.error(), "conflicts with"));
}

TEST_CASE("Compiler detects routes differing only in parameter names")
{
    TempDir dir;
    dir.touch("(a)/p/[id]/route.cpp");
    dir.touch("(b)/p/[slug]/route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(!table);
    TEST_CHECK(containsError(table.error(), "conflicts with"));
}

TEST_CASE("Compiler rejects invalid parameters")
{
    TempDir dir;
    dir.touch("[]/route.cpp");
    dir.touch("a/[id]/b/[id]/route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(!table);
    TEST_CHECK(containsError(table.error(), "Empty parameter name"));
    TEST_CHECK(containsError(table.error(), "Duplicate parameter name 'id'"));
}

TEST_CASE("Compiler reports missing modules")
{
    TempDir dir;
    dir.touch("api/orders/route.cpp");
    ModuleRegistry registry;
    registry.add("api/products/route.cpp", text("products"));

    const auto table = compileRoutes(dir.path() / "api", registry);
    TEST_REQUIRE(!table);
    TEST_CHECK(containsError(table.error(), "orders/route.cpp: No route module registered"));
}

TEST_CASE("Compiler reports ambiguous modules")
{
    TempDir dir;
    dir.touch("api/orders/route.cpp");
    ModuleRegistry registry;
    registry.add("shop/api/orders/route.cpp", text("a"));
    registry.add("other/api/orders/route.cpp", text("b"));

    const auto table = compileRoutes(dir.path() / "api", registry);
    TEST_REQUIRE(!table);
    TEST_CHECK(containsError(table.error(), "Multiple route modules"));
}

TEST_CASE("Compiler binds nested route files to their own modules")
{
    TempDir dir;
    dir.touch("api/route.cpp");
    dir.touch("api/users/route.cpp");
    dir.touch("api/admin/users/route.cpp");
    const auto api = dir.path() / "api";
    ModuleRegistry registry;
    registry.add((api / "route.cpp").string(), labeled("root"));
    registry.add((api / "users" / "route.cpp").string(), labeled("users"));
    registry.add((api / "admin" / "users" / "route.cpp").string(), labeled("admin"));

    const auto table = compileRoutes(api, registry);
    TEST_REQUIRE(table);
    TEST_CHECK(table->size() == 3);
    TEST_CHECK(summaryOf(*table, "/api") == "root");
    TEST_CHECK(summaryOf(*table, "/api/users") == "users");
    TEST_CHECK(summaryOf(*table, "/api/admin/users") == "admin");
}

TEST_CASE("Compiler prefers the module with the longest matching suffix")
{
    TempDir dir;
    dir.touch("api/route.cpp");
    dir.touch("api/users/route.cpp");
    dir.touch("api/admin/users/route.cpp");
    ModuleRegistry registry;
    registry.add("/src/api/route.cpp", labeled("root"));
    registry.add("/src/api/users/route.cpp", labeled("users"));
    registry.add("/src/api/admin/users/route.cpp", labeled("admin"));

    const auto table = compileRoutes(dir.path() / "api", registry);
    TEST_REQUIRE(table);
    TEST_CHECK(table->size() == 3);
    TEST_CHECK(summaryOf(*table, "/api") == "root");
    TEST_CHECK(summaryOf(*table, "/api/users") == "users");
    TEST_CHECK(summaryOf(*table, "/api/admin/users") == "admin");
}

TEST_CASE("Compiler reports all errors at once")
{
    TempDir dir;
    dir.touch("[a]/route.cpp");
    dir.touch("[b]/route.cpp");
    dir.touch("missing/route.cpp");
    ModuleRegistry registry;
    registry.add("test/[a]/route.cpp", text("a"));
    registry.add("test/[b]/route.cpp", text("b"));

    const auto table = compileRoutes(dir.path(), registry);
    TEST_REQUIRE(!table);
    TEST_CHECK(table.error().size() >= 2);
    TEST_CHECK(containsError(table.error(), "Ambiguous"));
    TEST_CHECK(containsError(table.error(), "missing/route.cpp"));
}

TEST_CASE("Compiler ignores unknown exports")
{
    TempDir dir;
    dir.touch("x/route.cpp");
    ModuleRegistry registry;
    registry.add("test/x/route.cpp", [](RouteModule& mod) {
        mod.handle("GET", [](RequestContext&) { return Response("get"); });
        mod.handle("get", [](RequestContext&) { return Response("lower"); });
        mod.handle("helper", [](RequestContext&) { return Response("helper"); });
        mod.handle("CONNECT", [](RequestContext&) { return Response("connect"); });
        mod.schema["post"].body = objectSchema();
        mod.schema["bogus"].body = objectSchema();
        mod.openapi["get"] = OperationDoc { "Get x" };
    });

    const auto table = compileRoutes(dir.path(), registry);
    TEST_REQUIRE(table);
    TEST_REQUIRE(table->size() == 1);
    const auto& route = table->routes()[0];
    TEST_CHECK(route.methods() == std::vector<Method> { Method::Get });
    TEST_CHECK(route.schema.get(Method::Post) != nullptr);
    TEST_CHECK(route.schema.keys().size() == 1);
    TEST_REQUIRE(route.docs.get(Method::Get));
    TEST_CHECK(route.docs.get(Method::Get)->summary == "Get x");
}

TEST_CASE("Compiler applies the prefix")
{
    TempDir dir;
    dir.touch("product/[id]/route.cpp");
    RecordingLoader loader;

    const auto bare = compileRoutes(dir.path(), loader, RouteCompiler::Options { "", "route.cpp" });
    TEST_REQUIRE(bare);
    TEST_CHECK(patterns(*bare) == std::vector<std::string> { "/product/:id" });

    const auto nested
        = compileRoutes(dir.path(), loader, RouteCompiler::Options { "/v1/api/", "route.cpp" });
    TEST_REQUIRE(nested);
    TEST_CHECK(patterns(*nested) == std::vector<std::string> { "/v1/api/product/:id" });
}

TEST_CASE("Compiler uses the configured route file name")
{
    TempDir dir;
    dir.touch("a/handler.cpp");
    dir.touch("b/route.cpp");
    RecordingLoader loader;

    const auto table
        = compileRoutes(dir.path(), loader, RouteCompiler::Options { "api", "handler.cpp" });
    TEST_REQUIRE(table);
    TEST_CHECK(patterns(*table) == std::vector<std::string> { "/api/a" });
}

TEST_CASE("Compiler passes disk and relative paths to the loader")
{
    TempDir dir;
    dir.touch("(g)/[id]/route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(table);
    TEST_REQUIRE(loader.paths.size() == 1);
    TEST_CHECK(loader.paths[0] == (dir.path() / "(g)" / "[id]" / "route.cpp").string());
    TEST_CHECK(loader.relativePaths[0] == "(g)/[id]/route.cpp");
}

TEST_CASE("Compiled table prefers static routes")
{
    TempDir dir;
    dir.touch("product/[id]/route.cpp");
    dir.touch("product/featured/route.cpp");
    RecordingLoader loader;

    const auto table = compileRoutes(dir.path(), loader);
    TEST_REQUIRE(table);
    TEST_CHECK((patterns(*table)
        == std::vector<std::string> { "/api/product/featured", "/api/product/:id" }));

    const auto res = table->match("/api/product/featured", Method::Get);
    const auto match = std::get_if<RouteTable::Match>(&res);
    TEST_REQUIRE(match);
    TEST_CHECK(match->route->file == "product/featured/route.cpp");
}
