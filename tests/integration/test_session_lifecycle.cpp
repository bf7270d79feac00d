/**
 * End-to-end session lifecycle over the process backend
 *
 * Requests go through the registered routes with real python3 scripts
 * behind them: submit, poll until finished, clean up.
 */

#include <gtest/gtest.h>
#include "http_routes.h"
#include "process_backend.h"
#include "subprocess.h"
#include <json/json.h>
#include <filesystem>
#include <sstream>
#include <thread>

namespace scriptbox {
namespace {

using namespace std::chrono_literals;

class SessionLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!Subprocess::run({"python3", "-c", "pass"}, 10000ms).ok()) {
            GTEST_SKIP() << "python3 not available";
        }

        work_root = std::filesystem::temp_directory_path() / "scriptbox_lifecycle_test";
        std::filesystem::create_directories(work_root);

        config.backend = BackendKind::PROCESS;
        config.work_root = work_root.string();
        config.limits.memory_limit_mb = 512;
        config.limits.wall_timeout = 10s;
        config.stop_grace = 1s;

        service = std::make_unique<ExecutionService>(config);
        register_routes(server, *service);
    }

    void TearDown() override {
        if (service) {
            service->shutdown();
            service.reset();
        }
        std::error_code ec;
        std::filesystem::remove_all(work_root, ec);
    }

    HttpRequest upload(const std::string& field, const std::string& content) {
        const std::string boundary = "------------------------lifecycle";
        HttpRequest req;
        req.method = "POST";
        req.path = "/execute";
        req.headers["Content-Type"] = "multipart/form-data; boundary=" + boundary;
        req.body =
            "--" + boundary + "\r\n"
            "Content-Disposition: form-data; name=\"" + field + "\"; filename=\"main.py\"\r\n"
            "Content-Type: text/x-python\r\n"
            "\r\n" +
            content + "\r\n"
            "--" + boundary + "--\r\n";
        return req;
    }

    HttpRequest request(const std::string& method, const std::string& path) {
        HttpRequest req;
        req.method = method;
        req.path = path;
        return req;
    }

    static Json::Value parse(const std::string& body) {
        Json::Value value;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::istringstream in(body);
        EXPECT_TRUE(Json::parseFromStream(builder, in, &value, &errors)) << errors;
        return value;
    }

    std::string submit(const std::string& content) {
        HttpResponse resp = server.dispatch(upload("file", content));
        EXPECT_EQ(resp.status_code, 200) << resp.body;
        return parse(resp.body)["session_id"].asString();
    }

    // Polls /result until it stops answering 202
    HttpResponse poll_until_done(const std::string& id, std::chrono::seconds limit = 15s) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        HttpResponse resp;
        do {
            resp = server.dispatch(request("GET", "/result/" + id));
            if (resp.status_code != 202) break;
            std::this_thread::sleep_for(50ms);
        } while (std::chrono::steady_clock::now() < deadline);
        return resp;
    }

    std::filesystem::path work_root;
    ServiceConfig config;
    std::unique_ptr<ExecutionService> service;
    HttpServer server{0};
};

TEST_F(SessionLifecycleTest, SubmitPollCleanup) {
    // Given: A submitted hello-world script
    std::string id = submit("print(\"hi\")");
    ASSERT_FALSE(id.empty());

    // When: Polled until it finishes
    HttpResponse result = poll_until_done(id);

    // Then: The logs carry its output
    ASSERT_EQ(result.status_code, 200) << result.body;
    EXPECT_EQ(parse(result.body)["logs"].asString(), "hi\n");

    // And: Polling again answers from the cache with the same logs
    HttpResponse again = server.dispatch(request("GET", "/result/" + id));
    EXPECT_EQ(again.status_code, 200);
    EXPECT_EQ(again.body, result.body);

    // And: Cleanup succeeds once, then the session is gone
    EXPECT_EQ(server.dispatch(request("POST", "/cleanup/" + id)).status_code, 200);
    EXPECT_EQ(server.dispatch(request("POST", "/cleanup/" + id)).status_code, 404);
    EXPECT_EQ(server.dispatch(request("GET", "/result/" + id)).status_code, 404);
    EXPECT_TRUE(std::filesystem::is_empty(work_root));
}

TEST_F(SessionLifecycleTest, LongScriptReportsStillRunning) {
    std::string id = submit("import time\ntime.sleep(5)\nprint('late')");

    HttpResponse resp = server.dispatch(request("GET", "/result/" + id));

    EXPECT_EQ(resp.status_code, 202);
    EXPECT_EQ(parse(resp.body)["status"].asString(), "still running");

    // Cleanup of a running session stops it
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(server.dispatch(request("POST", "/cleanup/" + id)).status_code, 200);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(SessionLifecycleTest, FailingScriptReportsFailure) {
    std::string id = submit("import sys\nprint('before')\nsys.exit(4)");

    HttpResponse resp = poll_until_done(id);

    ASSERT_EQ(resp.status_code, 200);
    Json::Value body = parse(resp.body);
    EXPECT_EQ(body["status"].asString(), "failed");
    EXPECT_EQ(body["exit_code"].asInt(), 4);
    EXPECT_EQ(body["logs"].asString(), "before\n");
}

TEST_F(SessionLifecycleTest, MissingFileIs400) {
    HttpResponse resp = server.dispatch(upload("attachment", "print(1)"));

    EXPECT_EQ(resp.status_code, 400);
    EXPECT_EQ(parse(resp.body)["error"].asString(), "No file provided");
    EXPECT_EQ(service->registry().size(), 0u);
}

TEST_F(SessionLifecycleTest, UnknownSessionIs404) {
    EXPECT_EQ(server.dispatch(request("GET", "/result/abc")).status_code, 404);
    EXPECT_EQ(server.dispatch(request("POST", "/cleanup/abc")).status_code, 404);
}

TEST_F(SessionLifecycleTest, SessionsAreIsolatedFromEachOther) {
    std::string a = submit("open('marker.txt', 'w').write('a')\nprint('a done')");
    ASSERT_EQ(poll_until_done(a).status_code, 200);

    std::string b = submit("import os\nprint(os.path.exists('marker.txt'))");
    HttpResponse resp = poll_until_done(b);

    ASSERT_EQ(resp.status_code, 200);
    EXPECT_EQ(parse(resp.body)["logs"].asString(), "False\n");
}

TEST_F(SessionLifecycleTest, ShutdownTearsDownEverySession) {
    submit("import time\ntime.sleep(30)");
    submit("import time\ntime.sleep(30)");
    ASSERT_EQ(service->registry().size(), 2u);

    EXPECT_EQ(service->shutdown(), 2u);

    EXPECT_EQ(service->registry().size(), 0u);
    EXPECT_TRUE(std::filesystem::is_empty(work_root));
}

} // namespace
} // namespace scriptbox
