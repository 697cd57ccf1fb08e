#pragma once
#include <memory>
#include "core/ConfigManager.h"
#include "editor/FileEditStore.h"
#include "workflow/WorkflowTracker.h"
#include "tools/SchemaValidator.h"
#include "tools/ToolRegistry.h"
#include "tools/ShellTool.h"
#include "mcp/Dispatcher.h"

/**
 * @brief 进程内唯一的应用上下文
 *
 * 显式持有全部可变状态 (文件历史、工作流日志、委托工具),
 * 由 main 创建并传给 StdioServer; 测试可各自构造独立实例。
 */
class AppContext {
public:
    explicit AppContext(const Config& config);

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    Dispatcher& dispatcher() { return *toolDispatcher; }
    FileEditStore& store() { return editStore; }
    WorkflowTracker& tracker() { return workflowTracker; }
    const Config& config() const { return cfg; }
    const std::vector<std::string>& accessRules() const { return ignorePatterns; }

    // shell://history 的数据源
    std::vector<std::string> shellHistory() const;

private:
    Config cfg;
    std::vector<std::string> ignorePatterns;   // .gitignore + editor.ignore_patterns
    FileEditStore editStore;
    WorkflowTracker workflowTracker;
    SchemaValidator validator;
    ToolRegistry registry;
    ShellTool* shellTool = nullptr;     // 由 registry 持有
    std::unique_ptr<Dispatcher> toolDispatcher;

    void registerDelegates();
};
