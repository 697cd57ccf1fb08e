#include "core/AppContext.h"
#include "tools/RemoteTool.h"
#include "mcp/MCPClient.h"
#include "utils/AccessIgnore.h"
#include "utils/Logger.h"
#include <filesystem>

namespace {

WorkflowConfig toWorkflowConfig(const Config::Workflow& w) {
    WorkflowConfig wc;
    wc.allowBranches = w.allowBranches;
    wc.maxSteps = w.maxSteps;
    wc.logSteps = w.logSteps;
    return wc;
}

ShellConfig toShellConfig(const Config::Shell& s) {
    ShellConfig sc;
    sc.executable = s.executable;
    sc.maxOutputChars = s.maxOutputChars;
    sc.historySize = s.historySize;
    return sc;
}

// .gitignore 规则在前, 配置中的规则在后 (可用 "!" 例外覆盖前者)
std::vector<std::string> accessPatterns(const Config::Editor& editor) {
    std::vector<std::string> patterns;
    if (editor.useGitignore) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (!ec) {
            patterns = AccessIgnoreRules::fromGitignore(cwd / ".gitignore");
            if (!patterns.empty()) {
                Logger::getInstance().info("Loaded " + std::to_string(patterns.size()) +
                                           " rule(s) from " + (cwd / ".gitignore").string());
            }
        }
    }
    patterns.insert(patterns.end(), editor.ignorePatterns.begin(), editor.ignorePatterns.end());
    return patterns;
}

// 配置未列出 tools 时, 启动子进程并用 tools/list 询问
std::vector<std::string> discoverTools(IMCPClient& client, const std::string& serverName) {
    std::vector<std::string> names;
    nlohmann::json listed = client.listTools();
    if (!listed.is_object() || !listed.contains("tools") || !listed["tools"].is_array()) {
        std::string reason = listed.is_object() && listed.contains("error") ? listed["error"].dump() : listed.dump();
        Logger::getInstance().warn("Delegate '" + serverName + "' tool discovery failed: " + reason);
        return names;
    }
    for (const auto& tool : listed["tools"]) {
        if (tool.is_object() && tool.contains("name") && tool["name"].is_string()) {
            names.push_back(tool["name"].get<std::string>());
        }
    }
    return names;
}

} // namespace

AppContext::AppContext(const Config& config)
    : cfg(config),
      ignorePatterns(accessPatterns(config.editor)),
      editStore(config.editor.maxHistory, ignorePatterns),
      workflowTracker(toWorkflowConfig(config.workflow)) {
    auto shell = std::make_unique<ShellTool>(toShellConfig(cfg.shell), ignorePatterns);
    shellTool = shell.get();
    registry.registerTool(std::move(shell));

    registerDelegates();

    toolDispatcher = std::make_unique<Dispatcher>(editStore, workflowTracker, registry, validator);
    Logger::getInstance().info("Registered tools: text_editor, workflow, " +
                               std::to_string(registry.getToolCount()) + " delegate(s); undo history " +
                               std::to_string(editStore.maxHistory()) + " per file");
}

void AppContext::registerDelegates() {
    for (const auto& server : cfg.delegates) {
        auto client = std::make_shared<MCPClient>(server.command);
        std::vector<std::string> toolNames = server.tools;
        if (toolNames.empty()) {
            toolNames = discoverTools(*client, server.name);
        }
        for (const auto& toolName : toolNames) {
            if (toolName == "text_editor" || toolName == "workflow" || toolName == "shell") {
                Logger::getInstance().warn("Delegate '" + server.name + "' cannot provide built-in tool " + toolName);
                continue;
            }
            if (!validator.findContract(toolName)) {
                Logger::getInstance().warn("Delegate '" + server.name + "' lists unknown tool " + toolName);
                continue;
            }
            registry.registerTool(std::make_unique<RemoteTool>(toolName, client));
            Logger::getInstance().info("Tool " + toolName + " -> " + server.name);
        }
    }
}

std::vector<std::string> AppContext::shellHistory() const {
    return shellTool ? shellTool->recentCommands() : std::vector<std::string>{};
}
