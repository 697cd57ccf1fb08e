#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "workflow/WorkflowStep.h"

// text_editor 的四种命令。path 已展开为绝对路径。
struct ViewCommand {
    std::string path;
};

struct WriteCommand {
    std::string path;
    std::string fileText;
};

struct StrReplaceCommand {
    std::string path;
    std::string oldStr;
    std::string newStr;
};

struct UndoEditCommand {
    std::string path;
};

using TextEditorCommand = std::variant<ViewCommand, WriteCommand, StrReplaceCommand, UndoEditCommand>;

/**
 * @brief 委托工具 (shell / list_windows / screen_capture / image_processor) 的调用
 *
 * 执行在核心状态模型之外, 这里只携带校验并规范化后的参数。
 */
struct DelegateCall {
    std::string tool;
    nlohmann::json arguments;
};

using ToolArgs = std::variant<TextEditorCommand, WorkflowStep, DelegateCall>;

// 取出 text_editor 命令里的路径
inline const std::string& commandPath(const TextEditorCommand& cmd) {
    return std::visit([](const auto& c) -> const std::string& { return c.path; }, cmd);
}
