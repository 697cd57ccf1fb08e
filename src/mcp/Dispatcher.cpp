#include "mcp/Dispatcher.h"
#include "utils/TextUtils.h"
#include "utils/Logger.h"

namespace {

nlohmann::json textItem(const std::string& text) {
    return {{"type", "text"}, {"text", text}};
}

// 重载集合, 供 std::visit 使用
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

Dispatcher::Dispatcher(FileEditStore& store, WorkflowTracker& tracker, const ToolRegistry& delegates,
                       const SchemaValidator& validator)
    : store(store), tracker(tracker), delegates(delegates), validator(validator) {}

bool Dispatcher::hasTool(const std::string& toolName) const {
    if (toolName == "text_editor" || toolName == "workflow") return true;
    return delegates.hasTool(toolName) && validator.findContract(toolName) != nullptr;
}

nlohmann::json Dispatcher::listTools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const ToolContract* contract : validator.contracts()) {
        if (!hasTool(contract->name)) continue;
        tools.push_back({
            {"name", contract->name},
            {"description", contract->description},
            {"inputSchema", contract->inputSchema()}
        });
    }
    return tools;
}

nlohmann::json Dispatcher::successResult(nlohmann::json content) {
    return {{"content", std::move(content)}, {"isError", false}};
}

nlohmann::json Dispatcher::errorResult(const ToolError& error) {
    return {
        {"content", nlohmann::json::array({textItem(error.describe())})},
        {"isError", true},
        {"error", error.toJson()}
    };
}

nlohmann::json Dispatcher::invoke(const std::string& toolName, const nlohmann::json& arguments) {
    auto& logger = Logger::getInstance();

    if (!hasTool(toolName)) {
        ToolError err = ToolError::make(ErrorKind::NotFound, "Unknown tool: " + toolName, toolName);
        logger.warn(err.describe());
        return errorResult(err);
    }

    try {
        if (logger.isDebugEnabled()) {
            logger.debug("tools/call " + toolName + " " +
                         arguments.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        }

        Outcome<ToolArgs> parsed = validator.parse(toolName, arguments);
        if (!parsed) {
            logger.warn(parsed.error().describe());
            return errorResult(parsed.error());
        }

        Outcome<nlohmann::json> outcome = std::visit(Overloaded{
            [this](const TextEditorCommand& cmd) { return runTextEditor(cmd); },
            [this](const WorkflowStep& step) { return runWorkflow(step); },
            [this](const DelegateCall& call) { return runDelegate(call); }
        }, parsed.value());

        if (!outcome) {
            logger.warn(toolName + " failed: " + outcome.error().describe());
            return errorResult(outcome.error());
        }
        return successResult(outcome.value());
    } catch (const std::exception& e) {
        ToolError err = ToolError::make(ErrorKind::Internal,
                                        std::string("Unexpected failure in ") + toolName + ": " + e.what(),
                                        toolName);
        logger.error(err.describe());
        return errorResult(err);
    }
}

Outcome<nlohmann::json> Dispatcher::runTextEditor(const TextEditorCommand& command) {
    return std::visit(Overloaded{
        [this](const ViewCommand& cmd) -> Outcome<nlohmann::json> {
            auto content = store.view(cmd.path);
            if (!content) return content.error();
            return nlohmann::json::array({textItem(TextUtils::formatFileBlock(cmd.path, content.value()))});
        },
        [this](const WriteCommand& cmd) -> Outcome<nlohmann::json> {
            auto content = store.write(cmd.path, cmd.fileText);
            if (!content) return content.error();
            Logger::getInstance().action("write " + cmd.path);
            return nlohmann::json::array({
                textItem("Successfully wrote to " + cmd.path),
                textItem(TextUtils::formatFileBlock(cmd.path, content.value()))
            });
        },
        [this](const StrReplaceCommand& cmd) -> Outcome<nlohmann::json> {
            auto snippet = store.strReplace(cmd.path, cmd.oldStr, cmd.newStr);
            if (!snippet) return snippet.error();
            Logger::getInstance().action("str_replace " + cmd.path);
            const std::string block = "```" + TextUtils::languageForPath(cmd.path) + "\n" +
                                      snippet.value() + "\n```";
            return nlohmann::json::array({
                textItem("The file " + cmd.path + " has been edited, and the section now reads:\n" + block +
                         "\nReview the changes above for errors. Undo and edit the file again if necessary!")
            });
        },
        [this](const UndoEditCommand& cmd) -> Outcome<nlohmann::json> {
            auto content = store.undo(cmd.path);
            if (!content) return content.error();
            Logger::getInstance().action("undo_edit " + cmd.path);
            return nlohmann::json::array({
                textItem("Undid the last edit to " + cmd.path),
                textItem(TextUtils::formatFileBlock(cmd.path, content.value()))
            });
        }
    }, command);
}

Outcome<nlohmann::json> Dispatcher::runWorkflow(const WorkflowStep& step) {
    auto summary = tracker.recordStep(step);
    if (!summary) return summary.error();
    return nlohmann::json::array({textItem(summary.value().toJson().dump(2))});
}

Outcome<nlohmann::json> Dispatcher::runDelegate(const DelegateCall& call) {
    nlohmann::json result = delegates.executeTool(call.tool, call.arguments);
    if (result.contains("error")) {
        const auto& err = result["error"];
        ErrorKind kind = errorKindFromName(result.value("kind", "Internal"));
        return ToolError::make(kind, err.is_string() ? err.get<std::string>() : err.dump(), call.tool);
    }
    if (!result.contains("content")) {
        return ToolError::make(ErrorKind::Internal, "Tool returned no content", call.tool);
    }
    return result["content"];
}
