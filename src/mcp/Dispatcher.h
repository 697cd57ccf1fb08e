#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "editor/FileEditStore.h"
#include "workflow/WorkflowTracker.h"
#include "tools/SchemaValidator.h"
#include "tools/ToolRegistry.h"

/**
 * @brief tools/call 的路由层
 *
 * 名称查找 -> 参数契约校验 -> 核心处理器 (text_editor / workflow) 或委托工具,
 * 结果统一转换为 MCP CallToolResult:
 *   成功 {"content": [...], "isError": false}
 *   失败 {"content": [{"type":"text","text":"<Kind>: <message>"}], "isError": true, "error": {...}}
 *
 * invoke 可被多个线程同时调用; 资源锁由 FileEditStore (按路径) 和
 * WorkflowTracker (单锁) 在各自的操作内持有。
 */
class Dispatcher {
public:
    Dispatcher(FileEditStore& store, WorkflowTracker& tracker, const ToolRegistry& delegates,
               const SchemaValidator& validator);

    nlohmann::json invoke(const std::string& toolName, const nlohmann::json& arguments);

    // [{name, description, inputSchema}, ...], 只包含可调用的工具
    nlohmann::json listTools() const;

    bool hasTool(const std::string& toolName) const;

    static nlohmann::json successResult(nlohmann::json content);
    static nlohmann::json errorResult(const ToolError& error);

private:
    FileEditStore& store;
    WorkflowTracker& tracker;
    const ToolRegistry& delegates;
    const SchemaValidator& validator;

    Outcome<nlohmann::json> runTextEditor(const TextEditorCommand& command);
    Outcome<nlohmann::json> runWorkflow(const WorkflowStep& step);
    Outcome<nlohmann::json> runDelegate(const DelegateCall& call);
};
