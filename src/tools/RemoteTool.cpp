#include "tools/RemoteTool.h"
#include "utils/Logger.h"

RemoteTool::RemoteTool(std::string name, std::shared_ptr<IMCPClient> client)
    : name(std::move(name)), client(std::move(client)) {}

nlohmann::json RemoteTool::execute(const nlohmann::json& args) {
    Logger::getInstance().action("delegate: " + name);

    nlohmann::json result = client->callTool(name, args);
    if (!result.is_object()) {
        return {{"error", "Malformed response from delegate for " + name}, {"kind", "IOError"}};
    }
    if (result.contains("error")) {
        const auto& err = result["error"];
        return {{"error", err.is_string() ? err.get<std::string>() : err.dump()}, {"kind", "IOError"}};
    }

    // 远端工具自己报告的失败
    if (result.value("isError", false)) {
        std::string text;
        if (result.contains("content") && result["content"].is_array()) {
            for (const auto& item : result["content"]) {
                if (item.value("type", "") == "text") {
                    if (!text.empty()) text += "\n";
                    text += item.value("text", "");
                }
            }
        }
        return {{"error", text.empty() ? name + " failed" : text}, {"kind", "IOError"}};
    }

    if (!result.contains("content")) {
        return {{"error", "Malformed response from delegate for " + name}, {"kind", "IOError"}};
    }
    return {{"content", result["content"]}};
}
