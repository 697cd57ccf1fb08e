#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include "tools/ITool.h"
#include "utils/AccessIgnore.h"

struct ShellConfig {
    std::string executable;           // 空则取 $SHELL, 再退回 bash
    size_t maxOutputChars = 400000;
    size_t historySize = 20;          // shell://history 保留的命令条数
};

/**
 * @brief shell 工具: 在子 shell 中执行命令, 合并 stdout/stderr
 *
 * stdin 重定向到 /dev/null。输出超过 maxOutputChars 个字符时返回 TooLarge,
 * 不截断。参数中指向已存在且被忽略规则命中的路径时拒绝执行。
 */
class ShellTool : public ITool {
public:
    explicit ShellTool(ShellConfig config = {}, std::vector<std::string> ignorePatterns = {});

    std::string getName() const override { return "shell"; }
    nlohmann::json execute(const nlohmann::json& args) override;

    // 最近执行过的命令, 最新的在最后
    std::vector<std::string> recentCommands() const;

    // "<shell> -c '<command> 2>&1' </dev/null"
    std::string buildCommandLine(const std::string& command) const;

private:
    ShellConfig config;
    AccessIgnoreRules ignoreRules;

    mutable std::mutex historyMutex;
    std::deque<std::string> history;

    std::string restrictedArgument(const std::string& command) const;
    void remember(const std::string& command);
};
