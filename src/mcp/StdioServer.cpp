#include "mcp/StdioServer.h"
#include "utils/Logger.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const char* PROTOCOL_VERSION = "2024-11-05";

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

StdioServer::StdioServer(Dispatcher& dispatcher, ServerInfo info, HistoryProvider shellHistory,
                         std::istream& in, std::ostream& out)
    : dispatcher(dispatcher), info(std::move(info)), shellHistory(std::move(shellHistory)), in(in), out(out) {}

StdioServer::~StdioServer() {
    joinWorkers();
}

nlohmann::json StdioServer::makeResult(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json StdioServer::makeError(const nlohmann::json& id, int code, const std::string& message,
                                      const nlohmann::json& data) {
    nlohmann::json error = {{"code", code}, {"message", message}};
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
}

void StdioServer::writeMessage(const nlohmann::json& message) {
    const std::string line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(outputMutex);
    out << line << "\n";
    out.flush();
}

void StdioServer::joinWorkers() {
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
    workers.clear();
}

void StdioServer::reapWorkers() {
    auto finished = [](Worker& w) {
        if (!w.done->load()) return false;
        if (w.thread.joinable()) w.thread.join();
        return true;
    };
    workers.erase(std::remove_if(workers.begin(), workers.end(), finished), workers.end());
}

void StdioServer::startWorker(nlohmann::json message) {
    reapWorkers();
    while (workers.size() >= MAX_CONCURRENT_CALLS) {
        if (workers.front().thread.joinable()) workers.front().thread.join();
        workers.erase(workers.begin());
        reapWorkers();
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    workers.push_back({std::thread([this, message = std::move(message), done]() {
        writeMessage(handleMessage(message));
        done->store(true);
    }), done});
    peakWorkers = std::max(peakWorkers, workers.size());
}

void StdioServer::run() {
    auto& logger = Logger::getInstance();
    logger.info("Anvil " + info.version + " listening on stdio");

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            logger.warn("Unparseable message: " + line.substr(0, 200));
            writeMessage(makeError(nullptr, JsonRpc::PARSE_ERROR, "Parse error"));
            continue;
        }

        const bool isToolCall = message.is_object() && message.contains("id") &&
                                message.value("method", "") == "tools/call";
        if (isToolCall) {
            startWorker(std::move(message));
            continue;
        }

        nlohmann::json response = handleMessage(message);
        if (!response.is_null()) {
            writeMessage(response);
        }
    }

    logger.info("stdin closed, waiting for " + std::to_string(workers.size()) + " outstanding call(s)");
    joinWorkers();
}

nlohmann::json StdioServer::handleLine(const std::string& line) {
    nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        return makeError(nullptr, JsonRpc::PARSE_ERROR, "Parse error");
    }
    return handleMessage(message);
}

nlohmann::json StdioServer::handleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return makeError(nullptr, JsonRpc::INVALID_REQUEST, "Invalid Request");
    }

    const bool isNotification = !message.contains("id");
    const nlohmann::json id = isNotification ? nlohmann::json(nullptr) : message["id"];

    if (message.value("jsonrpc", "") != "2.0" || !message.contains("method") || !message["method"].is_string()) {
        return isNotification ? nlohmann::json(nullptr)
                              : makeError(id, JsonRpc::INVALID_REQUEST, "Invalid Request");
    }

    const std::string method = message["method"].get<std::string>();
    const nlohmann::json params = message.contains("params") && !message["params"].is_null()
                                      ? message["params"] : nlohmann::json::object();

    if (isNotification) {
        if (method == "notifications/initialized") {
            Logger::getInstance().success("Client initialized");
        } else {
            Logger::getInstance().debug("Ignoring notification " + method);
        }
        return nullptr;
    }

    if (!params.is_object()) {
        return makeError(id, JsonRpc::INVALID_PARAMS, "params must be an object");
    }

    try {
        return dispatch(method, params, id);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Internal error handling " + method + ": " + e.what());
        return makeError(id, JsonRpc::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

nlohmann::json StdioServer::dispatch(const std::string& method, const nlohmann::json& params,
                                     const nlohmann::json& id) {
    if (method == "initialize") return makeResult(id, handleInitialize(params));
    if (method == "ping") return makeResult(id, nlohmann::json::object());
    if (method == "tools/list") return makeResult(id, {{"tools", dispatcher.listTools()}});
    if (method == "tools/call") return handleToolsCall(params, id);
    if (method == "resources/list") return makeResult(id, handleResourcesList());
    if (method == "resources/read") return handleResourcesRead(params, id);
    if (method == "resources/templates/list") return makeResult(id, {{"resourceTemplates", nlohmann::json::array()}});
    if (method == "prompts/list") return makeResult(id, handlePromptsList());
    if (method == "prompts/get") return handlePromptsGet(params, id);

    return makeError(id, JsonRpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

nlohmann::json StdioServer::handleInitialize(const nlohmann::json& params) const {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        Logger::getInstance().info("Client: " + params["clientInfo"].value("name", "unknown") + " " +
                                   params["clientInfo"].value("version", ""));
    }
    return {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", nlohmann::json::object()},
            {"resources", nlohmann::json::object()},
            {"prompts", nlohmann::json::object()}
        }},
        {"serverInfo", {{"name", info.name}, {"version", info.version}}},
        {"instructions", info.instructions}
    };
}

nlohmann::json StdioServer::handleToolsCall(const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return makeError(id, JsonRpc::INVALID_PARAMS, "tools/call requires a string 'name'");
    }
    const std::string name = params["name"].get<std::string>();
    const nlohmann::json arguments = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
    return makeResult(id, dispatcher.invoke(name, arguments));
}

nlohmann::json StdioServer::handleResourcesList() const {
    return {{"resources", {
        {
            {"uri", "file://workspace"},
            {"name", "workspace"},
            {"description", "Developer workspace with text editing, shell, and workflow tools"},
            {"mimeType", "text/plain"}
        },
        {
            {"uri", "shell://history"},
            {"name", "shell-history"},
            {"description", "Most recent commands run by the shell tool"},
            {"mimeType", "text/plain"}
        }
    }}};
}

nlohmann::json StdioServer::handleResourcesRead(const nlohmann::json& params, const nlohmann::json& id) const {
    if (!params.contains("uri") || !params["uri"].is_string()) {
        return makeError(id, JsonRpc::INVALID_PARAMS, "resources/read requires a string 'uri'");
    }
    const std::string uri = params["uri"].get<std::string>();

    std::string text;
    if (uri == "file://workspace") {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        text = "Developer workspace with text editing, shell, and workflow tools\n"
               "Working directory: " + (ec ? std::string("<unknown>") : cwd.string());
    } else if (uri == "shell://history") {
        std::vector<std::string> history = shellHistory ? shellHistory() : std::vector<std::string>{};
        if (history.empty()) {
            text = "No shell commands have been run yet";
        } else {
            for (const auto& cmd : history) {
                if (!text.empty()) text += "\n";
                text += cmd;
            }
        }
    } else {
        return makeError(id, JsonRpc::RESOURCE_NOT_FOUND, "resource_not_found", {{"uri", uri}});
    }

    return makeResult(id, {{"contents", {{{"uri", uri}, {"mimeType", "text/plain"}, {"text", text}}}}});
}

nlohmann::json StdioServer::handlePromptsList() const {
    return {{"prompts", {
        {
            {"name", "developer_workflow"},
            {"description", "A prompt for common developer workflows"},
            {"arguments", {{
                {"name", "task"},
                {"description", "The development task to perform"},
                {"required", true}
            }}}
        }
    }}};
}

nlohmann::json StdioServer::handlePromptsGet(const nlohmann::json& params, const nlohmann::json& id) const {
    const std::string name = params.value("name", "");
    if (name != "developer_workflow") {
        return makeError(id, JsonRpc::INVALID_PARAMS, "prompt not found");
    }

    const nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
    if (!args.is_object() || !args.contains("task") || !args["task"].is_string()) {
        return makeError(id, JsonRpc::INVALID_PARAMS, "No task provided to developer_workflow");
    }

    const std::string task = args["task"].get<std::string>();
    const std::string prompt = "You are a developer assistant. Help with this task: '" + task +
                               "'. You have access to text editing, shell commands, and workflow tools.";
    return makeResult(id, {{"messages", {{
        {"role", "user"},
        {"content", {{"type", "text"}, {"text", prompt}}}
    }}}});
}
