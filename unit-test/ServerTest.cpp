#include <chrono>
#include <filesystem>
#include <future>
#include <thread>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include "gtest/gtest.h"
#include "config.hpp"
#include "server/auth.hpp"
#include "server/server.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace judged;
using namespace judged::server;
using namespace nlohmann;
namespace fs = std::filesystem;

class ServerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    ServerTest() : pool({0}), cache(SPJ_DIR, 4), handler(pool, cache, registry) {}

    static bool run_dir_empty() {
        return fs::is_empty(RUN_DIR);
    }

    string judge_body() {
        json j = {
            {"src", "int main() { return 0; }"},
            {"language_config", {{"run", {{"command", "{exe_path}"}, {"seccomp_rule", nullptr}}}}},
            {"max_cpu_time", 1000},
            {"max_memory", 134217728},
            {"test_case", {{{"input", ""}, {"output", ""}}}}};
        return j.dump();
    }

    cancellation_registry registry;
    worker_pool pool;
    spj_cache cache;
    judge_server handler;
};

TEST_F(ServerTest, WrongTokenTest) {
    string compile_body = R"({"src": "int main() {}", "spj_version": "1", "spj_compile_config": {
        "src_name": "spj.c", "exe_name": "spj", "max_cpu_time": 1000, "max_real_time": 2000,
        "max_memory": 134217728, "compile_command": "/usr/bin/gcc {src_path} -o {exe_path}"}})";

    for (auto &[method, body] : vector<pair<string, string>>{{"judge", judge_body()}, {"ping", ""}, {"compile_spj", compile_body}}) {
        // 未经摘要的令牌也是错误的
        json response = handler.handle(method, TEST_TOKEN, body);
        EXPECT_EQ(response.at("err"), "TokenVerificationFailed") << method;
        response = handler.handle(method, "", body);
        EXPECT_EQ(response.at("err"), "TokenVerificationFailed") << method;
    }
    EXPECT_TRUE(run_dir_empty());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ServerTest, UnknownMethodTest) {
    json response = handler.handle("shutdown", token_digest(TEST_TOKEN), "{}");
    EXPECT_EQ(response.at("err"), "InvalidRequest");
    EXPECT_FALSE(judge_server::is_known_method("shutdown"));
    EXPECT_TRUE(judge_server::is_known_method("compile_spj"));
}

TEST_F(ServerTest, MalformedBodyTest) {
    string token = token_digest(TEST_TOKEN);
    json response = handler.handle("judge", token, "{\"src\": ");
    EXPECT_EQ(response.at("err"), "InvalidRequest");
    EXPECT_TRUE(response.at("data").is_string());

    response = handler.handle("judge", token, R"({"src": "int main() {}"})");
    EXPECT_EQ(response.at("err"), "InvalidRequest");

    response = handler.handle("compile_spj", token, "[]");
    EXPECT_EQ(response.at("err"), "InvalidRequest");
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(ServerTest, MissingTestCaseTest) {
    json j = json::parse(judge_body());
    j.erase("test_case");
    j["test_case_id"] = "does-not-exist";
    json response = handler.handle("judge", token_digest(TEST_TOKEN), j.dump());
    EXPECT_EQ(response.at("err"), "InvalidRequest");
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(ServerTest, SpjNotCompiledTest) {
    json j = json::parse(judge_body());
    j["spj_version"] = "42";
    j["spj_config"] = {{"exe_name", "spj-{spj_version}"}, {"command", "{exe_path} {in_file_path}"}, {"seccomp_rule", nullptr}};
    json response = handler.handle("judge", token_digest(TEST_TOKEN), j.dump());
    EXPECT_EQ(response.at("err"), "SPJCompileError");
    EXPECT_TRUE(run_dir_empty());
}

TEST_F(ServerTest, PingTest) {
    json response = handler.handle("ping", token_digest(TEST_TOKEN), "");
    EXPECT_TRUE(response.at("err").is_null());
    const json &data = response.at("data");
    EXPECT_EQ(data.at("action"), "pong");
    EXPECT_TRUE(data.at("hostname").is_string());
    EXPECT_TRUE(data.at("cpu").is_number());
    EXPECT_TRUE(data.at("cpu_core").is_number_integer());
    EXPECT_TRUE(data.at("memory").is_number());
    EXPECT_JSON_EQ(data.at("version"), json(VERSION));
}

TEST_F(ServerTest, DumpResponseTest) {
    json response = {{"err", nullptr}, {"data", {{{"output", string("\xff\xfe", 2)}}}}};
    string text = dump_response(response);
    json parsed = json::parse(text);
    EXPECT_TRUE(parsed.at("err").is_null());
    EXPECT_TRUE(parsed.at("data").at(0).at("output").is_string());
}

TEST_F(ServerTest, StopWithIdleConnectionTest) {
    http_server server(handler, registry, "127.0.0.1", 0);
    auto running = async(launch::async, [&] { server.run(); });

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::socket idle(ioc);
    idle.connect({boost::asio::ip::make_address("127.0.0.1"), server.port()});

    // 一个 keep-alive 连接处理完一个请求后保持空闲
    boost::asio::ip::tcp::socket keep_alive(ioc);
    keep_alive.connect({boost::asio::ip::make_address("127.0.0.1"), server.port()});
    string request = "POST /ping HTTP/1.1\r\nHost: localhost\r\nX-Judge-Server-Token: " +
                     token_digest(TEST_TOKEN) + "\r\nContent-Length: 0\r\n\r\n";
    boost::asio::write(keep_alive, boost::asio::buffer(request));
    char reply[16];
    boost::asio::read(keep_alive, boost::asio::buffer(reply));
    EXPECT_EQ(string(reply, 12), "HTTP/1.1 200");

    this_thread::sleep_for(chrono::milliseconds(100));
    server.stop();
    ASSERT_EQ(running.wait_for(chrono::seconds(5)), future_status::ready);
    running.get();

    // 服务端已经关闭了连接
    boost::system::error_code ec;
    char byte;
    idle.read_some(boost::asio::buffer(&byte, 1), ec);
    EXPECT_TRUE(ec);
}
