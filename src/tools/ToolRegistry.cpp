#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include <algorithm>

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    if (tools.count(name)) {
        Logger::getInstance().warn("Tool '" + name + "' registered twice, replacing the earlier one");
    }

    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) const {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) const {
    ITool* tool = getTool(name);
    if (!tool) {
        return {{"error", "Tool not found: " + name}, {"kind", "NotFound"}};
    }

    try {
        return tool->execute(args);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool '" + name + "' failed: " + e.what());
        return {{"error", std::string("Tool execution failed: ") + e.what()}, {"kind", "Internal"}};
    }
}

std::vector<std::string> ToolRegistry::toolNames() const {
    std::vector<std::string> names;
    for (const auto& [name, tool] : tools) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
