#include "testutil.hpp"

#include <atomic>

#include <unistd.h>

std::unique_ptr<TestRequest> TestRequest::create(std::string_view method,
    std::string_view target, std::string_view body, std::string_view contentType)
{
    auto req = std::make_unique<TestRequest>();
    req->raw.append(method).append(" ").append(target).append(" HTTP/1.1\r\n");
    req->raw.append("Host: localhost\r\n");
    if (!contentType.empty()) {
        req->raw.append("Content-Type: ").append(contentType).append("\r\n");
    }
    req->raw.append("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n");
    req->raw.append(body);
    req->request = Request::parse(req->raw).value();
    return req;
}

std::optional<Response> fetch(const Dispatcher& dispatcher, std::string_view method,
    std::string_view target, std::string_view body, std::string_view contentType)
{
    const auto req = TestRequest::create(method, target, body, contentType);
    std::optional<Response> ret;
    dispatcher(req->request,
        std::make_unique<CallbackResponder>([&ret](Response&& resp) { ret = std::move(resp); }));
    return ret;
}

JsonValue parseBody(const Response& response)
{
    auto json = parseJson(response.body);
    if (!json) {
        return JsonValue();
    }
    return std::move(*json);
}

const JsonValue* at(const JsonValue& json, std::string_view key)
{
    return getMember(json, std::string(key));
}

const JsonValue* at(const JsonValue& json, size_t index)
{
    if (!json.isArray() || index >= json.asArray().size()) {
        return nullptr;
    }
    return &json.asArray()[index];
}

bool isString(const JsonValue* json, std::string_view str)
{
    return json && json->isString() && json->asString() == str;
}

TempDir::TempDir()
{
    static std::atomic<int> counter { 0 };
    path_ = std::filesystem::temp_directory_path()
        / ("burger-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

const std::filesystem::path& TempDir::path() const
{
    return path_;
}

void TempDir::touch(const std::string& relativePath) const
{
    const auto file = path_ / relativePath;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream(file) << "// route\n";
}

void TempDir::mkdir(const std::string& relativePath) const
{
    std::filesystem::create_directories(path_ / relativePath);
}

Result<JsonValue, SchemaError> CountingSchema::parse(const JsonValue& value) const
{
    calls++;
    return value;
}

RouteModule textModule(std::string text, Method method)
{
    RouteModule mod;
    mod.handle(toString(method), [text = std::move(text)](RequestContext&) {
        return Response::text(text);
    });
    return mod;
}
