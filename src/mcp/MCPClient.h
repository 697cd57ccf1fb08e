#pragma once
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sys/types.h>

class IMCPClient {
public:
    virtual ~IMCPClient() = default;
    virtual nlohmann::json listTools() = 0;
    virtual nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments) = 0;
};

/**
 * @brief 外部 MCP 服务器客户端: 通过 sh -c 启动子进程, 用管道收发 JSON-RPC
 *
 * 子进程在第一次请求时启动并完成 initialize 握手。
 * 同一时刻只有一个请求在途 (内部互斥), 可被多个 tools/call 线程共享。
 */
class MCPClient : public IMCPClient {
public:
    explicit MCPClient(const std::string& serverCommand);
    ~MCPClient() override;

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    // 返回 JSON-RPC 响应的 result; 失败时返回 {"error": ...}
    nlohmann::json listTools() override;
    nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments) override;

private:
    std::string serverCommand;
    std::mutex requestMutex;
    int requestId = 0;
    int readPipe[2] = {-1, -1};
    int writePipe[2] = {-1, -1};
    pid_t childPid = -1;
    bool initialized = false;
    std::string pending;   // 已读入但尚未消费的字节

    bool startProcess();
    void stopProcess();
    bool writeLine(const std::string& line);
    bool readLine(std::string& line);
    bool ensureStarted();
    nlohmann::json sendRequest(const std::string& method, const nlohmann::json& params);
};
