#pragma once
#include <string>
#include <memory>
#include "tools/ITool.h"
#include "mcp/MCPClient.h"

/**
 * @brief 转发到外部 MCP 服务器的委托工具
 *
 * 用于 list_windows / screen_capture / image_processor: 参数已在本地校验,
 * 执行交给配置的外部服务器。多个 RemoteTool 可共享同一个客户端。
 */
class RemoteTool : public ITool {
public:
    RemoteTool(std::string name, std::shared_ptr<IMCPClient> client);

    std::string getName() const override { return name; }
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    std::string name;
    std::shared_ptr<IMCPClient> client;
};
