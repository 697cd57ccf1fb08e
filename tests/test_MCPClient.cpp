/**
 * MCPClient: 对一个脚本化的 sh 服务器走完整的管道往返。
 */
#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "mcp/MCPClient.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

class MCPClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / ("anvil_mcpclient_test_" + std::to_string(now));
        fs::create_directories(testDir);
        Logger::getInstance().setLogFile("");
        Logger::getInstance().setConsoleEnabled(false);
        // 子进程提前退出时写管道返回 EPIPE 而不是终止测试进程
        std::signal(SIGPIPE, SIG_IGN);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    // 写出脚本, 返回可交给 MCPClient 的命令
    std::string script(const std::string& name, const std::vector<std::string>& lines) const {
        const fs::path path = testDir / name;
        std::ofstream out(path);
        for (const auto& l : lines) out << l << "\n";
        return "/bin/sh '" + path.string() + "'";
    }

    std::vector<json> seenRequests() const {
        std::vector<json> seen;
        std::ifstream in(testDir / "seen.log");
        std::string line;
        while (std::getline(in, line)) {
            seen.push_back(json::parse(line, nullptr, false));
        }
        return seen;
    }

    fs::path testDir;
};

TEST_F(MCPClientTest, HandshakeThenMatchesResponsesById) {
    const std::string seen = "'" + (testDir / "seen.log").string() + "'";
    MCPClient client(script("server.sh", {
        "read -r init; printf '%s\\n' \"$init\" > " + seen,
        "echo 'starting image server'",
        "echo '{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{}}'",
        "echo '{\"jsonrpc\":\"2.0\",\"id\":99,\"result\":{}}'",
        "echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"protocolVersion\":\"2024-11-05\"}}'",
        "read -r note; printf '%s\\n' \"$note\" >> " + seen,
        "read -r req; printf '%s\\n' \"$req\" >> " + seen,
        "echo '{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"tools\":[{\"name\":\"list_windows\"}]}}'",
        "read -r req; printf '%s\\n' \"$req\" >> " + seen,
        "echo '{\"jsonrpc\":\"2.0\",\"id\":3,\"error\":{\"code\":-32602,\"message\":\"unknown window\"}}'",
        "read -r req; printf '%s\\n' \"$req\" >> " + seen,
        "echo 'not json {'",
        "echo '{\"jsonrpc\":\"2.0\",\"id\":4,\"result\":{\"content\":[{\"type\":\"text\",\"text\":\"captured\"}]}}'",
        "read -r req"
    }));

    json tools = client.listTools();
    ASSERT_FALSE(tools.contains("error")) << tools.dump();
    ASSERT_EQ(tools["tools"].size(), 1u);
    EXPECT_EQ(tools["tools"][0]["name"], "list_windows");

    json failed = client.callTool("screen_capture", {{"window_title", "Nope"}});
    EXPECT_EQ(failed["error"], "unknown window");

    json captured = client.callTool("screen_capture", {{"display", 0}});
    ASSERT_FALSE(captured.contains("error")) << captured.dump();
    EXPECT_EQ(captured["content"][0]["text"], "captured");

    // 服务器读完第 5 个请求后退出
    json closed = client.callTool("screen_capture", json::object());
    ASSERT_TRUE(closed.contains("error"));
    EXPECT_NE(closed["error"].get<std::string>().find("closed the connection"), std::string::npos);

    std::vector<json> requests = seenRequests();
    ASSERT_EQ(requests.size(), 5u);
    EXPECT_EQ(requests[0]["method"], "initialize");
    EXPECT_EQ(requests[0]["id"], 1);
    EXPECT_EQ(requests[0]["params"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(requests[0]["params"]["clientInfo"]["name"], "anvil");
    EXPECT_EQ(requests[1]["method"], "notifications/initialized");
    EXPECT_FALSE(requests[1].contains("id"));
    EXPECT_EQ(requests[2]["method"], "tools/list");
    EXPECT_EQ(requests[3]["method"], "tools/call");
    EXPECT_EQ(requests[3]["params"]["name"], "screen_capture");
    EXPECT_EQ(requests[3]["params"]["arguments"]["window_title"], "Nope");
    EXPECT_EQ(requests[4]["id"], 4);
}

TEST_F(MCPClientTest, ServerThatExitsImmediatelyIsUnavailable) {
    MCPClient client("true");
    json tools = client.listTools();
    ASSERT_TRUE(tools.contains("error"));
    EXPECT_NE(tools["error"].get<std::string>().find("unavailable"), std::string::npos);

    json call = client.callTool("list_windows", json::object());
    EXPECT_TRUE(call.contains("error"));
}
