#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <functional>
#include <iostream>
#include <nlohmann/json.hpp>
#include "mcp/Dispatcher.h"

struct ServerInfo {
    std::string name = "anvil";
    std::string version = ANVIL_VERSION;
    std::string instructions =
        "This server provides developer tools including text editing, shell command execution, "
        "screen capture delegation, and workflow management. Use the text_editor tool to view and "
        "modify files, the shell tool to execute commands, and the workflow tool to manage "
        "multi-step problem-solving processes with branching and revision support.";
};

namespace JsonRpc {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int RESOURCE_NOT_FOUND = -32002;
}

/**
 * @brief 按行分隔的 JSON-RPC 2.0 stdio 服务
 *
 * 每个 tools/call 在独立线程中执行, 其余请求在读循环中同步处理。
 * 同时在跑的调用最多 MAX_CONCURRENT_CALLS 个: 读循环先回收已结束的线程,
 * 仍满额时阻塞等待最早的一个。
 * 响应在 outputMutex 下逐行写出。输入 EOF 后等待所有工作线程结束再返回。
 * 工具失败作为 isError 结果返回, 不影响读循环。
 */
class StdioServer {
public:
    using HistoryProvider = std::function<std::vector<std::string>()>;

    static constexpr size_t MAX_CONCURRENT_CALLS = 16;

    StdioServer(Dispatcher& dispatcher, ServerInfo info = {}, HistoryProvider shellHistory = nullptr,
                std::istream& in = std::cin, std::ostream& out = std::cout);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    void run();

    /**
     * @brief 同步处理一条消息
     * @return 响应对象; 通知返回 null
     */
    nlohmann::json handleMessage(const nlohmann::json& message);

    // 解析并处理一行输入, 解析失败返回 -32700 错误响应
    nlohmann::json handleLine(const std::string& line);

    // run() 期间同时存活的工作线程数峰值
    size_t peakWorkerCount() const { return peakWorkers; }

private:
    Dispatcher& dispatcher;
    ServerInfo info;
    HistoryProvider shellHistory;
    std::istream& in;
    std::ostream& out;

    std::mutex outputMutex;
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::vector<Worker> workers;
    size_t peakWorkers = 0;

    void writeMessage(const nlohmann::json& message);
    void startWorker(nlohmann::json message);
    void reapWorkers();
    void joinWorkers();

    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json handleInitialize(const nlohmann::json& params) const;
    nlohmann::json handleToolsCall(const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json handleResourcesList() const;
    nlohmann::json handleResourcesRead(const nlohmann::json& params, const nlohmann::json& id) const;
    nlohmann::json handlePromptsList() const;
    nlohmann::json handlePromptsGet(const nlohmann::json& params, const nlohmann::json& id) const;

    static nlohmann::json makeResult(const nlohmann::json& id, nlohmann::json result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message,
                                    const nlohmann::json& data = nullptr);
};
