#include "mcp/MCPClient.h"
#include "utils/Logger.h"
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <cerrno>

MCPClient::MCPClient(const std::string& command) : serverCommand(command) {}

MCPClient::~MCPClient() {
    stopProcess();
}

bool MCPClient::startProcess() {
    if (pipe(readPipe) == -1) {
        return false;
    }
    if (pipe(writePipe) == -1) {
        close(readPipe[0]);
        close(readPipe[1]);
        return false;
    }

    childPid = fork();
    if (childPid == -1) {
        close(readPipe[0]);
        close(readPipe[1]);
        close(writePipe[0]);
        close(writePipe[1]);
        return false;
    }

    if (childPid == 0) { // Child
        dup2(writePipe[0], STDIN_FILENO);
        dup2(readPipe[1], STDOUT_FILENO);

        close(writePipe[1]);
        close(readPipe[0]);

        execl("/bin/sh", "sh", "-c", serverCommand.c_str(), (char*)NULL);
        _exit(127);
    }

    // Parent
    close(writePipe[0]);
    close(readPipe[1]);
    return true;
}

void MCPClient::stopProcess() {
    if (childPid != -1) {
        close(writePipe[1]);
        close(readPipe[0]);
        kill(childPid, SIGTERM);
        waitpid(childPid, NULL, 0);
        childPid = -1;
    }
    initialized = false;
    pending.clear();
}

bool MCPClient::writeLine(const std::string& line) {
    std::string data = line + "\n";
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(writePipe[1], data.data() + offset, data.size() - offset);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        offset += static_cast<size_t>(n);
    }
    return true;
}

bool MCPClient::readLine(std::string& line) {
    char buffer[4096];
    while (true) {
        size_t nl = pending.find('\n');
        if (nl != std::string::npos) {
            line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            return true;
        }
        ssize_t n = read(readPipe[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        pending.append(buffer, static_cast<size_t>(n));
    }
}

nlohmann::json MCPClient::sendRequest(const std::string& method, const nlohmann::json& params) {
    const int id = ++requestId;
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };

    if (!writeLine(request.dump())) {
        stopProcess();
        return {{"error", "Failed to send request to '" + serverCommand + "'"}};
    }

    std::string responseLine;
    while (readLine(responseLine)) {
        // 跳过非 JSON 输出 (日志、警告) 和通知
        if (responseLine.empty() || responseLine[0] != '{') continue;
        nlohmann::json response = nlohmann::json::parse(responseLine, nullptr, false);
        if (response.is_discarded()) continue;
        if (!response.contains("id") || response["id"] != id) continue;

        if (response.contains("error")) {
            const auto& err = response["error"];
            return {{"error", err.is_object() ? err.value("message", err.dump()) : err.dump()}};
        }
        return response.value("result", nlohmann::json::object());
    }

    stopProcess();
    return {{"error", "MCP server '" + serverCommand + "' closed the connection"}};
}

bool MCPClient::ensureStarted() {
    if (initialized) return true;
    if (childPid == -1 && !startProcess()) {
        Logger::getInstance().error("Failed to start MCP server: " + serverCommand);
        return false;
    }

    nlohmann::json params = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "anvil"}, {"version", ANVIL_VERSION}}}
    };
    auto res = sendRequest("initialize", params);
    if (res.contains("error")) {
        Logger::getInstance().error("MCP server initialize failed: " + res["error"].get<std::string>());
        return false;
    }

    nlohmann::json notification = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"},
        {"params", nlohmann::json::object()}
    };
    if (!writeLine(notification.dump())) {
        stopProcess();
        return false;
    }
    initialized = true;
    Logger::getInstance().success("Connected to MCP server: " + serverCommand);
    return true;
}

nlohmann::json MCPClient::listTools() {
    std::lock_guard<std::mutex> lock(requestMutex);
    if (!ensureStarted()) {
        return {{"error", "MCP server unavailable: " + serverCommand}};
    }
    return sendRequest("tools/list", nlohmann::json::object());
}

nlohmann::json MCPClient::callTool(const std::string& name, const nlohmann::json& arguments) {
    std::lock_guard<std::mutex> lock(requestMutex);
    if (!ensureStarted()) {
        return {{"error", "MCP server unavailable: " + serverCommand}};
    }
    return sendRequest("tools/call", {{"name", name}, {"arguments", arguments}});
}
