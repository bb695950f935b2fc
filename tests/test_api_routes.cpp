#include <gtest/gtest.h>
#include "api_routes.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>

using namespace std::chrono_literals;
using json = nlohmann::json;
namespace fs = std::filesystem;

class ApiRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string tmpl = (fs::temp_directory_path() / "executor-api-XXXXXX").string();
        ASSERT_NE(::mkdtemp(tmpl.data()), nullptr);
        dir = fs::canonical(tmpl);
        ServiceConfig cfg;
        cfg.base_dir = dir;
        cfg.workspace_dir = dir;
        cfg.output_dir = dir / "output";
        cfg.stream_poll = 20ms;
        svc = std::make_unique<ExecutorService>(cfg);
    }
    void TearDown() override {
        svc.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    ApiResponse call(const std::string& method, const std::string& path, const std::string& body = {},
                     std::map<std::string, std::string> query = {}) {
        return handle_api_request(*svc, ApiRequest{method, path, std::move(query), body});
    }
    std::string submit(const std::string& command) {
        auto r = call("POST", "/exec", json{{"command", command}}.dump());
        EXPECT_EQ(r.status, 200);
        return json::parse(r.body).at("job_id").get<std::string>();
    }
    fs::path dir;
    std::unique_ptr<ExecutorService> svc;
};

TEST_F(ApiRoutesTest, Health) {
    auto r = call("GET", "/health");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.content_type, "application/json");
    auto j = json::parse(r.body);
    EXPECT_EQ(j["status"], "ok");
    EXPECT_EQ(j["jobs_count"], 0);
}

TEST_F(ApiRoutesTest, ExecAndResult) {
    auto id = submit("echo hello");
    svc->registry().wait_until_terminal(id, 10s);
    auto r = call("GET", "/result/" + id);
    ASSERT_EQ(r.status, 200);
    auto j = json::parse(r.body);
    EXPECT_EQ(j["job_id"], id);
    EXPECT_EQ(j["status"], "finished");
    EXPECT_EQ(j["stdout"], "hello\n");
    EXPECT_EQ(j["stderr"], "");
    EXPECT_EQ(j["returncode"], 0);
    EXPECT_TRUE(j["error"].is_null());

    auto s = json::parse(call("GET", "/status/" + id).body);
    EXPECT_EQ(s["command"], "echo hello");
    EXPECT_EQ(s["status"], "finished");
}

TEST_F(ApiRoutesTest, ExecRunsInBaseDirWithOptions) {
    auto body = json{{"command", "echo $X; pwd -P"}, {"timeout", 5}, {"env", {{"X", "y"}}}};
    auto r = call("POST", "/exec", body.dump());
    ASSERT_EQ(r.status, 200);
    auto id = json::parse(r.body)["job_id"].get<std::string>();
    svc->registry().wait_until_terminal(id, 10s);
    auto j = json::parse(call("GET", "/result/" + id).body);
    EXPECT_EQ(j["stdout"], "y\n" + dir.string() + "\n");
}

TEST_F(ApiRoutesTest, RejectedCommandIs400) {
    auto r = call("POST", "/exec", R"({"command": "sudo rm -rf /"})");
    EXPECT_EQ(r.status, 400);
    EXPECT_NE(json::parse(r.body)["error"].get<std::string>().find("Blocked"), std::string::npos);
    EXPECT_TRUE(json::parse(call("GET", "/jobs").body)["jobs"].empty());
}

TEST_F(ApiRoutesTest, MalformedBodiesAre400) {
    EXPECT_EQ(call("POST", "/exec", "{not json").status, 400);
    EXPECT_EQ(call("POST", "/exec", R"({"cwd": "/"})").status, 400);
    EXPECT_EQ(call("POST", "/exec", R"({"command": 42})").status, 400);
}

TEST_F(ApiRoutesTest, UnknownJobIs404) {
    for (const char* p : {"/status/nope", "/result/nope"}) {
        auto r = call("GET", p);
        EXPECT_EQ(r.status, 404);
        EXPECT_EQ(json::parse(r.body)["error"], "Job not found");
    }
    EXPECT_EQ(call("POST", "/cancel/nope").status, 404);
}

TEST_F(ApiRoutesTest, RunningResultHasNulls) {
    auto id = submit("sleep 30");
    auto j = json::parse(call("GET", "/result/" + id).body);
    EXPECT_EQ(j["status"], "running");
    EXPECT_TRUE(j["returncode"].is_null());
    EXPECT_TRUE(j["error"].is_null());

    auto c1 = json::parse(call("POST", "/cancel/" + id).body);
    EXPECT_EQ(c1["message"], "Job cancelled");
    EXPECT_EQ(c1["status"], "cancelled");
    auto c2 = json::parse(call("POST", "/cancel/" + id).body);
    EXPECT_EQ(c2["message"], "Job is already cancelled");
}

TEST_F(ApiRoutesTest, JobsListing) {
    auto a = submit("true");
    auto b = submit("echo b");
    auto jobs = json::parse(call("GET", "/jobs").body)["jobs"];
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0]["job_id"], a);
    EXPECT_EQ(jobs[1]["job_id"], b);
    EXPECT_EQ(jobs[1]["command"], "echo b");
    EXPECT_TRUE(jobs[0]["created_at"].is_number());
}

TEST_F(ApiRoutesTest, BrowseAndFiles) {
    fs::create_directory(dir / "output");
    std::ofstream(dir / "output" / "img.png") << "data";

    auto b = call("GET", "/browse");
    ASSERT_EQ(b.status, 200);
    auto j = json::parse(b.body);
    EXPECT_EQ(j["path"], dir.string());
    ASSERT_EQ(j["entries"].size(), 1u);
    EXPECT_EQ(j["entries"][0]["name"], "output");
    EXPECT_EQ(j["entries"][0]["type"], "dir");

    EXPECT_EQ(call("GET", "/browse", {}, {{"path", (dir / "missing").string()}}).status, 404);
    EXPECT_EQ(call("GET", "/browse", {}, {{"path", (dir / "output" / "img.png").string()}}).status, 400);

    auto files = json::parse(call("GET", "/files").body)["files"];
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0]["name"], "img.png");
    EXPECT_EQ(files[0]["size"], 4);
}

TEST_F(ApiRoutesTest, Disk) {
    auto r = call("GET", "/disk");
    ASSERT_EQ(r.status, 200);
    EXPECT_TRUE(json::parse(r.body)["total_gb"].is_number());
}

TEST_F(ApiRoutesTest, UnknownRouteIs404) {
    EXPECT_EQ(call("GET", "/nowhere").status, 404);
    EXPECT_EQ(call("GET", "/exec").status, 404);
}

TEST_F(ApiRoutesTest, StoppingServiceIs503) {
    svc->shutdown();
    EXPECT_EQ(call("POST", "/exec", R"({"command": "true"})").status, 503);
}
