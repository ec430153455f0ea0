#include <catch2/catch_test_macros.hpp>
#include "server/capture_middleware.hpp"
#include "audit/audit_pipeline.hpp"
#include "mocks/mock_sink.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <memory>
#include <thread>

using namespace reqlog;
using reqlog::testing::MockSink;

namespace {

AuditPipeline::Config manual_flush() {
    AuditPipeline::Config cfg;
    cfg.queue_capacity = 100;
    cfg.batch_size = 10;
    cfg.flush_interval = std::chrono::hours(1);
    return cfg;
}

httplib::Request make_request(std::string method, std::string path, std::string body = "") {
    httplib::Request req;
    req.method = std::move(method);
    req.path = path;
    req.target = std::move(path);
    req.remote_addr = "::ffff:192.168.1.20";
    req.headers.emplace("Host", "api.local:8080");
    req.headers.emplace("User-Agent", "reqlog-test");
    if (!body.empty()) {
        req.headers.emplace("Content-Type", "application/json");
        req.headers.emplace("Content-Length", std::to_string(body.size()));
        req.body = std::move(body);
    }
    return req;
}

} // anonymous namespace

TEST_CASE("Capture Middleware: register request produces a redacted create entry",
          "[capture][middleware]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(manual_flush(), file, nullptr);
    CaptureMiddleware mw(pipeline, RecordBuilder{});

    auto req = make_request("POST", "/users/register",
                            R"({"email":"new@example.com","password":"s3cret"})");
    httplib::Response res;

    mw.begin(req, res);
    REQUIRE(res.has_header(CaptureMiddleware::kRequestIdHeader));
    const auto id = mw.request_id(req);
    REQUIRE(id.has_value());
    CHECK(res.get_header_value(CaptureMiddleware::kRequestIdHeader) == *id);
    CHECK(mw.in_flight() == 1);

    auto handler = mw.route("/users/register",
        [&mw](const httplib::Request& r, httplib::Response& out) {
            out.status = 201;
            mw.json(r, out, {{"id", 7}, {"email", "new@example.com"}});
        });
    handler(req, res);

    mw.complete(req, res);
    CHECK(mw.in_flight() == 0);
    REQUIRE(pipeline.queue_size() == 1);

    REQUIRE(pipeline.flush_batch().file_written == 1);
    const auto entries = file->entries();
    REQUIRE(entries.size() == 1);
    const auto& entry = entries[0];

    CHECK(entry.id == *id);
    CHECK(entry.status_code == 201);
    CHECK(entry.action == ActionKind::CREATE);
    CHECK(entry.entity == "users");
    CHECK(entry.method == "POST");
    CHECK(entry.hostname == "api.local");
    CHECK(entry.ip == "192.168.1.20");
    CHECK(entry.route == "/users/register");
    CHECK_FALSE(entry.error.has_value());
    CHECK(entry.execution_time_ms.has_value());
    CHECK(entry.details["body"]["password"] == "***HIDDEN***");
    CHECK(entry.details["body"]["email"] == "new@example.com");
    CHECK(entry.response_body["id"] == 7);
    CHECK(entry.response_size == res.body.size());
    CHECK(entry.request_size > 0);
}

TEST_CASE("Capture Middleware: error responses carry status and reason",
          "[capture][middleware]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(manual_flush(), file, nullptr);
    CaptureMiddleware mw(pipeline, RecordBuilder{});

    auto req = make_request("GET", "/api/v1/orders/get?id=404");
    httplib::Response res;

    mw.begin(req, res);
    res.status = 404;
    mw.json(req, res, {{"error", "Order not found"}});
    mw.complete(req, res);

    (void)pipeline.flush_batch();
    const auto entries = file->entries();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].error.has_value());
    CHECK(entries[0].error->code == 404);
    CHECK(entries[0].error->message == "Not Found");
    CHECK(entries[0].entity == "orders");
    CHECK(entries[0].url == "/api/v1/orders/get?id=404");
    CHECK(entries[0].action == ActionKind::READ);
}

TEST_CASE("Capture Middleware: uncaptured bodies are structured from the response",
          "[capture][middleware]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(manual_flush(), file, nullptr);
    CaptureMiddleware mw(pipeline, RecordBuilder{});

    auto req = make_request("GET", "/docs/view");
    httplib::Response res;

    mw.begin(req, res);
    res.status = 200;
    res.set_content("hello", "text/plain");
    mw.complete(req, res);

    (void)pipeline.flush_batch();
    const auto entries = file->entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].response_body == nlohmann::json{{"raw", "hello"}});
}

TEST_CASE("Capture Middleware: first emission wins", "[capture][middleware]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(manual_flush(), file, nullptr);
    CaptureMiddleware mw(pipeline, RecordBuilder{});

    auto req = make_request("GET", "/items/list");
    httplib::Response res;

    mw.begin(req, res);
    mw.json(req, res, {{"first", true}});
    mw.send(req, res, "second", "text/plain");
    mw.complete(req, res);

    (void)pipeline.flush_batch();
    const auto entries = file->entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].response_body["first"] == true);
}

TEST_CASE("Capture Middleware: identity resolver fills user and session",
          "[capture][middleware]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(manual_flush(), file, nullptr);
    CaptureMiddleware mw(pipeline, RecordBuilder{});
    mw.set_identity_resolver([](const httplib::Request& req) {
        CaptureMiddleware::Identity identity;
        if (req.has_header("X-User")) {
            identity.user = req.get_header_value("X-User");
            identity.session_id = "sess-1";
        }
        return identity;
    });

    auto req = make_request("GET", "/profile/show");
    req.headers.emplace("X-User", "alice");
    httplib::Response res;

    mw.begin(req, res);
    mw.complete(req, res);

    (void)pipeline.flush_batch();
    const auto entries = file->entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].user == "alice");
    CHECK(entries[0].session_id == "sess-1");
}

TEST_CASE("Capture Middleware: repeated query keys become arrays", "[capture][middleware]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(manual_flush(), file, nullptr);
    CaptureMiddleware mw(pipeline, RecordBuilder{});

    auto req = make_request("GET", "/items/search?tag=a&tag=b&api_key=k");
    req.path = "/items/search";
    req.params.emplace("tag", "a");
    req.params.emplace("tag", "b");
    req.params.emplace("api_key", "k");
    httplib::Response res;

    mw.begin(req, res);
    mw.complete(req, res);

    (void)pipeline.flush_batch();
    const auto entries = file->entries();
    REQUIRE(entries.size() == 1);
    const auto& query = entries[0].details["query"];
    CHECK(query["tag"] == nlohmann::json::array({"a", "b"}));
    CHECK(query["api_key"] == "***HIDDEN***");
}

TEST_CASE("Capture Middleware: completion without begin is still logged",
          "[capture][middleware]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(manual_flush(), file, nullptr);
    CaptureMiddleware mw(pipeline, RecordBuilder{});

    auto req = make_request("DELETE", "/sessions/delete");
    httplib::Response res;
    res.status = 204;

    CHECK_FALSE(mw.request_id(req).has_value());
    mw.complete(req, res);

    (void)pipeline.flush_batch();
    const auto entries = file->entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].id.size() == 16);
    CHECK(entries[0].action == ActionKind::DELETE);
    CHECK(entries[0].entity == "sessions");
    CHECK_FALSE(entries[0].execution_time_ms.has_value());
}

TEST_CASE("Capture Middleware: hooks installed on a live server", "[capture][middleware]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(manual_flush(), file, nullptr);
    CaptureMiddleware mw(pipeline, RecordBuilder{});

    httplib::Server svr;
    mw.install(svr);
    svr.Post("/users/register", mw.route("/users/register",
        [&mw](const httplib::Request& req, httplib::Response& res) {
            res.status = 201;
            mw.json(req, res, {{"created", true}});
        }));

    const int port = svr.bind_to_any_port("127.0.0.1");
    REQUIRE(port > 0);
    std::thread server_thread([&svr] { svr.listen_after_bind(); });
    svr.wait_until_ready();

    httplib::Client cli("127.0.0.1", port);
    const auto res = cli.Post("/users/register", R"({"password":"pw"})", "application/json");
    REQUIRE(res);
    CHECK(res->status == 201);
    const std::string id = res->get_header_value(CaptureMiddleware::kRequestIdHeader);
    CHECK(id.size() == 16);

    // The logger hook runs after the response is written
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (pipeline.queue_size() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    svr.stop();
    server_thread.join();

    REQUIRE(pipeline.flush_batch().dequeued == 1);
    const auto entries = file->entries();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].id == id);
    CHECK(entries[0].route == "/users/register");
    CHECK(entries[0].ip == "127.0.0.1");
    CHECK(entries[0].details["body"]["password"] == "***HIDDEN***");
    CHECK(entries[0].response_body["created"] == true);
}
