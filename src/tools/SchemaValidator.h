#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>
#include "tools/ToolArgs.h"
#include "tools/ToolError.h"

enum class ParamType {
    String,
    Integer,
    Boolean
};

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    bool required = false;
    std::string description;
    std::vector<std::string> enumValues;
    std::optional<long long> minimum;
    std::optional<long long> maximum;
    bool absolutePath = false;
};

/**
 * @brief 条件必填: 当 field == equals 时, requiredFields 都必须出现
 */
struct ConditionalRequirement {
    std::string field;
    std::string equals;
    std::vector<std::string> requiredFields;
};

struct ToolContract {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;
    std::vector<ConditionalRequirement> conditionals;

    // MCP tools/list 使用的 inputSchema
    nlohmann::json inputSchema() const;
};

/**
 * @brief 工具参数契约校验器
 *
 * 无状态: 对 (工具名, 参数) 做类型、枚举、取值范围、条件必填和绝对路径检查,
 * 一次性报告所有问题 (不是只报第一个)。校验通过后把松散的 JSON
 * 转成 ToolArgs 里的强类型变体, 下游处理代码不再接触原始 JSON。
 */
class SchemaValidator {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> problems;
    };

    SchemaValidator();

    const ToolContract* findContract(const std::string& toolName) const;
    std::vector<const ToolContract*> contracts() const;

    ValidationResult validate(const ToolContract& contract, const nlohmann::json& args) const;

    /**
     * @brief 校验并解析
     * @return 强类型参数, 或列出全部问题的 SchemaValidation 错误
     *
     * 未知工具名返回 NotFound; 正常流程下 Dispatcher 已先行拦截。
     */
    Outcome<ToolArgs> parse(const std::string& toolName, const nlohmann::json& args) const;

private:
    std::map<std::string, ToolContract> contractsByName;

    void registerContract(ToolContract contract);

    static TextEditorCommand toTextEditorCommand(const nlohmann::json& args);
    static WorkflowStep toWorkflowStep(const nlohmann::json& args);
    static nlohmann::json normalizePaths(const ToolContract& contract, const nlohmann::json& args);
};
