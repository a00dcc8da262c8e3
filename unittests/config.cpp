#include "test.hpp"

#include <cstdlib>
#include <fstream>

#include "config.hpp"
#include "testutil.hpp"

TEST_CASE("Config has defaults")
{
    const Config config;
    TEST_CHECK(config.apiDir == "api");
    TEST_CHECK(config.prefix == "api");
    TEST_CHECK(config.routeFile == "route.cpp");
    TEST_CHECK(!config.debug);
    TEST_CHECK(config.logLevel == slog::Severity::Info);
    TEST_CHECK(config.openApi.docsPath == "/docs");
    TEST_CHECK(config.openApi.openApiPath == "/openapi.json");
}

TEST_CASE("Config loads all keys")
{
    Config config;
    const auto ok = config.loadFromString(R"(
api_dir = "/srv/routes"
prefix = "v1"
route_file = "handler.cpp"
debug = true
access_log = true
log_level = "debug"
openapi = {
    title = "Shop"
    description = "Things"
    version = "2.0.0"
    docs_path = "/swagger"
    openapi_path = "/spec.json"
}
)");
    TEST_REQUIRE(ok);
    TEST_CHECK(config.apiDir == "/srv/routes");
    TEST_CHECK(config.prefix == "v1");
    TEST_CHECK(config.routeFile == "handler.cpp");
    TEST_CHECK(config.debug);
    TEST_CHECK(config.accessLog);
    TEST_CHECK(config.logLevel == slog::Severity::Debug);
    TEST_CHECK(config.openApi.title == "Shop");
    TEST_CHECK(config.openApi.description == "Things");
    TEST_CHECK(config.openApi.version == "2.0.0");
    TEST_CHECK(config.openApi.docsPath == "/swagger");
    TEST_CHECK(config.openApi.openApiPath == "/spec.json");
}

TEST_CASE("Config is unchanged after a failed load")
{
    const auto invalid = {
        "prefix = \"v1\"\nunknown = 1",
        "prefix = \"v1\"\ndebug = \"yes\"",
        "log_level = \"verbose\"",
        "route_file = \"a/route.cpp\"",
        "route_file = \"\"",
        "openapi = { docs_path = \"docs\" }",
        "openapi = { docs_path = \"/x\"\nopenapi_path = \"/x\" }",
        "openapi = { colour = \"red\" }",
        "openapi = \"yes\"",
        "prefix = ",
    };
    for (const auto source : invalid) {
        Config config;
        TEST_CHECK(!config.loadFromString(source));
        TEST_CHECK(config.prefix == "api");
        TEST_CHECK(!config.debug);
        TEST_CHECK(config.logLevel == slog::Severity::Info);
        TEST_CHECK(config.openApi.docsPath == "/docs");
    }
}

TEST_CASE("Config substitutes environment variables")
{
    ::setenv("BURGER_TEST_PREFIX", "shop", 1);
    ::unsetenv("BURGER_TEST_UNSET");

    Config config;
    TEST_REQUIRE(config.loadFromString("prefix = \"${BURGER_TEST_PREFIX}/v1\"\n"
                                       "route_file = \"${BURGER_TEST_UNSET:r.cpp}\""));
    TEST_CHECK(config.prefix == "shop/v1");
    TEST_CHECK(config.routeFile == "r.cpp");

    TEST_CHECK(!config.loadFromString("prefix = \"${BURGER_TEST_UNSET}\""));
    TEST_CHECK(!config.loadFromString("prefix = \"${BURGER_TEST_PREFIX\""));
    TEST_CHECK(config.prefix == "shop/v1");
}

TEST_CASE("Config resolves api_dir relative to the file")
{
    TempDir dir;
    dir.mkdir("conf");
    const auto path = (dir.path() / "conf" / "burger.joml").string();
    std::ofstream(path) << "api_dir = \"../routes\"\n";

    Config config;
    TEST_REQUIRE(config.loadFromFile(path));
    TEST_CHECK(config.apiDir == (dir.path() / "routes").lexically_normal().string());

    std::ofstream(path) << "api_dir = \"/abs/routes\"\n";
    TEST_REQUIRE(config.loadFromFile(path));
    TEST_CHECK(config.apiDir == "/abs/routes");

    std::ofstream(path) << "debug = true\n";
    TEST_REQUIRE(config.loadFromFile(path));
    TEST_CHECK(config.apiDir == "/abs/routes");
    TEST_CHECK(config.debug);
}

TEST_CASE("Config fails for a missing file")
{
    TempDir dir;
    Config config;
    TEST_CHECK(!config.loadFromFile((dir.path() / "missing.joml").string()));
    TEST_CHECK(config.apiDir == "api");
}
