#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/ITool.h"

/**
 * @brief 委托工具注册中心
 *
 * 启动时注册, 之后只读, 可被多个 tools/call 线程并发查询。
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief 注册一个工具 (同名工具被覆盖)
     * @param tool 工具实例 (unique_ptr 转移所有权)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief 获取工具实例
     * @return 工具指针 (如果不存在返回 nullptr)
     */
    ITool* getTool(const std::string& name) const;

    /**
     * @brief 执行工具
     *
     * 工具不存在返回 {"error": "Tool not found: xxx", "kind": "NotFound"};
     * 工具抛出的异常被转换为 {"error": ..., "kind": "Internal"}。
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args) const;

    std::vector<std::string> toolNames() const;

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
};
