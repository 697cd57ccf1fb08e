/**
 * StdioServer: JSON-RPC 信封、各 MCP 方法以及 run() 的逐行输出。
 */
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "mcp/StdioServer.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

class StdioServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / ("anvil_server_test_" + std::to_string(now));
        fs::create_directories(testDir);
        Logger::getInstance().setLogFile("");
        Logger::getInstance().setConsoleEnabled(false);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    static json request(int id, const std::string& method, const json& params = json::object()) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    fs::path testDir;
    FileEditStore store;
    WorkflowTracker tracker;
    SchemaValidator validator;
    ToolRegistry registry;
    Dispatcher dispatcher{store, tracker, registry, validator};
};

TEST_F(StdioServerTest, ParseErrorHasNullId) {
    StdioServer server(dispatcher);
    json response = server.handleLine("{ this is not json");
    EXPECT_EQ(response["error"]["code"], JsonRpc::PARSE_ERROR);
    EXPECT_TRUE(response["id"].is_null());
}

TEST_F(StdioServerTest, InitializeAdvertisesCapabilities) {
    ServerInfo info;
    info.name = "anvil-test";
    StdioServer server(dispatcher, info);
    json response = server.handleMessage(request(1, "initialize", {{"protocolVersion", "2024-11-05"},
                                                                   {"clientInfo", {{"name", "gtest"}}}}));
    ASSERT_TRUE(response.contains("result")) << response.dump();
    const json& result = response["result"];
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(result["capabilities"].contains("tools"));
    EXPECT_TRUE(result["capabilities"].contains("resources"));
    EXPECT_TRUE(result["capabilities"].contains("prompts"));
    EXPECT_EQ(result["serverInfo"]["name"], "anvil-test");
    EXPECT_FALSE(result["instructions"].get<std::string>().empty());
}

TEST_F(StdioServerTest, PingReturnsEmptyResult) {
    StdioServer server(dispatcher);
    json response = server.handleMessage(request(7, "ping"));
    EXPECT_EQ(response["id"], 7);
    EXPECT_TRUE(response["result"].is_object());
    EXPECT_TRUE(response["result"].empty());
}

TEST_F(StdioServerTest, NotificationsProduceNoResponse) {
    StdioServer server(dispatcher);
    json note = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    EXPECT_TRUE(server.handleMessage(note).is_null());

    json unknownNote = {{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}, {"params", {{"requestId", 3}}}};
    EXPECT_TRUE(server.handleMessage(unknownNote).is_null());
}

TEST_F(StdioServerTest, UnknownMethodAndBadEnvelope) {
    StdioServer server(dispatcher);
    json missing = server.handleMessage(request(2, "sampling/createMessage"));
    EXPECT_EQ(missing["error"]["code"], JsonRpc::METHOD_NOT_FOUND);
    EXPECT_EQ(missing["id"], 2);

    json noVersion = {{"id", 3}, {"method", "ping"}};
    EXPECT_EQ(server.handleMessage(noVersion)["error"]["code"], JsonRpc::INVALID_REQUEST);

    EXPECT_EQ(server.handleMessage(json::array({1, 2}))["error"]["code"], JsonRpc::INVALID_REQUEST);
}

TEST_F(StdioServerTest, ToolsListShowsCoreTools) {
    StdioServer server(dispatcher);
    json response = server.handleMessage(request(4, "tools/list"));
    std::set<std::string> names;
    for (const auto& tool : response["result"]["tools"]) {
        names.insert(tool["name"].get<std::string>());
    }
    EXPECT_EQ(names, (std::set<std::string>{"text_editor", "workflow"}));
}

TEST_F(StdioServerTest, ToolFailureIsResultNotRpcError) {
    StdioServer server(dispatcher);
    json response = server.handleMessage(request(5, "tools/call", {
        {"name", "text_editor"},
        {"arguments", {{"command", "view"}, {"path", (testDir / "missing.txt").string()}}}
    }));
    ASSERT_TRUE(response.contains("result")) << response.dump();
    EXPECT_FALSE(response.contains("error"));
    EXPECT_TRUE(response["result"]["isError"].get<bool>());
    EXPECT_EQ(response["result"]["error"]["kind"], "NotFound");
}

TEST_F(StdioServerTest, ToolsCallRequiresName) {
    StdioServer server(dispatcher);
    json response = server.handleMessage(request(6, "tools/call", {{"arguments", json::object()}}));
    EXPECT_EQ(response["error"]["code"], JsonRpc::INVALID_PARAMS);
}

TEST_F(StdioServerTest, ResourcesListAndRead) {
    StdioServer server(dispatcher, ServerInfo{}, []() {
        return std::vector<std::string>{"ls -la", "git status"};
    });

    json listed = server.handleMessage(request(8, "resources/list"));
    EXPECT_EQ(listed["result"]["resources"].size(), 2u);

    json workspace = server.handleMessage(request(9, "resources/read", {{"uri", "file://workspace"}}));
    const std::string text = workspace["result"]["contents"][0]["text"].get<std::string>();
    EXPECT_NE(text.find(fs::current_path().string()), std::string::npos);

    json history = server.handleMessage(request(10, "resources/read", {{"uri", "shell://history"}}));
    EXPECT_EQ(history["result"]["contents"][0]["text"], "ls -la\ngit status");
}

TEST_F(StdioServerTest, EmptyShellHistory) {
    StdioServer server(dispatcher);
    json history = server.handleMessage(request(11, "resources/read", {{"uri", "shell://history"}}));
    EXPECT_EQ(history["result"]["contents"][0]["text"], "No shell commands have been run yet");
}

TEST_F(StdioServerTest, UnknownResourceIsNotFound) {
    StdioServer server(dispatcher);
    json response = server.handleMessage(request(12, "resources/read", {{"uri", "db://users"}}));
    EXPECT_EQ(response["error"]["code"], JsonRpc::RESOURCE_NOT_FOUND);
    EXPECT_EQ(response["error"]["data"]["uri"], "db://users");
}

TEST_F(StdioServerTest, PromptsGetNeedsTask) {
    StdioServer server(dispatcher);
    json listed = server.handleMessage(request(13, "prompts/list"));
    EXPECT_EQ(listed["result"]["prompts"][0]["name"], "developer_workflow");

    json missing = server.handleMessage(request(14, "prompts/get", {{"name", "developer_workflow"}}));
    EXPECT_EQ(missing["error"]["code"], JsonRpc::INVALID_PARAMS);

    json ok = server.handleMessage(request(15, "prompts/get", {{"name", "developer_workflow"},
                                                               {"arguments", {{"task", "fix the build"}}}}));
    const std::string prompt = ok["result"]["messages"][0]["content"]["text"].get<std::string>();
    EXPECT_NE(prompt.find("fix the build"), std::string::npos);
}

TEST_F(StdioServerTest, RunAnswersEveryRequestLine) {
    const std::string path = (testDir / "notes.txt").string();
    std::stringstream input;
    input << request(1, "initialize").dump() << "\n";
    input << json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}.dump() << "\n";
    input << "\n";
    input << "garbage\n";
    input << request(2, "tools/call", {{"name", "text_editor"},
                                       {"arguments", {{"command", "write"}, {"path", path},
                                                      {"file_text", "hello"}}}}).dump() << "\n";
    input << request(3, "tools/call", {{"name", "workflow"},
                                       {"arguments", {{"step_description", "s"}, {"step_number", 1},
                                                      {"total_steps", 1}, {"next_step_needed", false}}}}).dump()
          << "\n";
    input << request(4, "ping").dump() << "\n";

    std::stringstream output;
    {
        StdioServer server(dispatcher, ServerInfo{}, nullptr, input, output);
        server.run();
    }

    std::vector<json> responses;
    std::string line;
    while (std::getline(output, line)) {
        json parsed = json::parse(line, nullptr, false);
        ASSERT_FALSE(parsed.is_discarded()) << line;
        responses.push_back(parsed);
    }
    ASSERT_EQ(responses.size(), 5u);

    std::set<int> ids;
    int parseErrors = 0;
    for (const auto& r : responses) {
        if (r["id"].is_null()) {
            EXPECT_EQ(r["error"]["code"], JsonRpc::PARSE_ERROR);
            parseErrors++;
        } else {
            ids.insert(r["id"].get<int>());
            if (r.contains("result") && r["result"].contains("isError")) {
                EXPECT_FALSE(r["result"]["isError"].get<bool>()) << r.dump();
            }
        }
    }
    EXPECT_EQ(parseErrors, 1);
    EXPECT_EQ(ids, (std::set<int>{1, 2, 3, 4}));
    EXPECT_EQ(tracker.stepCount(), 1u);
    EXPECT_EQ(store.view(path).value(), "hello");
}

TEST_F(StdioServerTest, LongSessionKeepsWorkerCountBounded) {
    const std::string path = (testDir / "view.txt").string();
    std::ofstream(path) << "line one\nline two\n";

    const int calls = 200;
    std::stringstream input;
    for (int i = 1; i <= calls; ++i) {
        input << request(i, "tools/call", {{"name", "text_editor"},
                                           {"arguments", {{"command", "view"}, {"path", path}}}}).dump() << "\n";
    }

    std::stringstream output;
    size_t peak = 0;
    {
        StdioServer server(dispatcher, ServerInfo{}, nullptr, input, output);
        server.run();
        peak = server.peakWorkerCount();
    }
    EXPECT_GE(peak, 1u);
    EXPECT_LE(peak, StdioServer::MAX_CONCURRENT_CALLS);

    std::set<int> ids;
    std::string line;
    while (std::getline(output, line)) {
        json parsed = json::parse(line, nullptr, false);
        ASSERT_FALSE(parsed.is_discarded()) << line;
        EXPECT_FALSE(parsed["result"]["isError"].get<bool>()) << line;
        ids.insert(parsed["id"].get<int>());
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(calls));
}
