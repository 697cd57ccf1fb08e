#pragma once
#include <string>
#include <vector>
#include <variant>
#include <utility>
#include <nlohmann/json.hpp>

/**
 * @brief 工具调用失败的分类
 *
 * Dispatcher 把它原样写进结构化错误 (error.kind),调用方可据此决定是否重试。
 */
enum class ErrorKind {
    NotFound,                  // 工具、文件或被引用的步骤不存在
    TooLarge,                  // 文件/内容超过大小限制
    NoMatch,                   // str_replace: old_str 未出现
    AmbiguousMatch,            // str_replace: old_str 出现多次
    NoHistory,                 // undo 时历史为空
    InvalidWorkflowReference,  // revises_step / branch_from_step 悬空
    InvalidArgument,
    SchemaValidation,          // 参数契约校验失败
    IOError,
    Internal
};

std::string errorKindName(ErrorKind kind);

// 未知名称返回 Internal
ErrorKind errorKindFromName(const std::string& name);

struct ToolError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::string subject;                // 出错的路径 / 字段 / 工具名
    std::vector<std::string> problems;  // SchemaValidation 的全部问题

    static ToolError make(ErrorKind kind, std::string message, std::string subject = "") {
        ToolError err;
        err.kind = kind;
        err.message = std::move(message);
        err.subject = std::move(subject);
        return err;
    }

    // "<Kind>: <message>"
    std::string describe() const;

    nlohmann::json toJson() const;
};

/**
 * @brief 成功值或 ToolError 二选一
 *
 * 所有核心操作都返回 Outcome,不向 Dispatcher 之外抛异常。
 */
template <typename T>
class Outcome {
public:
    Outcome(T value) : data(std::move(value)) {}
    Outcome(ToolError error) : data(std::move(error)) {}

    bool ok() const { return data.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<0>(data); }
    T& value() { return std::get<0>(data); }

    const ToolError& error() const { return std::get<1>(data); }

private:
    std::variant<T, ToolError> data;
};
