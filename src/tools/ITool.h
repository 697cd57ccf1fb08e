#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 委托工具接口
 *
 * 委托工具的执行不触及 FileEditStore / WorkflowTracker,
 * 参数在到达 execute 之前已由 SchemaValidator 校验。
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief 工具的唯一名称 (对应 tools/call 的 name)
     */
    virtual std::string getName() const = 0;

    /**
     * @brief 执行工具操作
     * @param args 已校验的参数
     * @return 执行结果
     *
     * 成功:
     * {
     *   "content": [
     *     {"type": "text", "text": "结果内容"}
     *   ]
     * }
     *
     * 失败 (kind 为 ErrorKind 名称, 缺省按 Internal 处理):
     * {
     *   "error": "错误描述",
     *   "kind": "TooLarge"
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
