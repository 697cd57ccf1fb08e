#include "tools/SchemaValidator.h"
#include "utils/TextUtils.h"
#include <algorithm>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

namespace {

std::string typeName(ParamType type) {
    switch (type) {
        case ParamType::String: return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Boolean: return "boolean";
    }
    return "string";
}

bool matchesType(const nlohmann::json& value, ParamType type) {
    switch (type) {
        case ParamType::String: return value.is_string();
        case ParamType::Integer: return value.is_number_integer();
        case ParamType::Boolean: return value.is_boolean();
    }
    return false;
}

// null 与缺省等价
bool present(const nlohmann::json& args, const std::string& field) {
    return args.contains(field) && !args[field].is_null();
}

std::string describeValue(const nlohmann::json& value) {
    if (value.is_string()) return "'" + value.get<std::string>() + "'";
    return value.dump();
}

ParamSpec stringParam(const std::string& name, bool required, const std::string& description) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::String;
    p.required = required;
    p.description = description;
    return p;
}

ParamSpec integerParam(const std::string& name, bool required, long long minimum, const std::string& description) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::Integer;
    p.required = required;
    p.minimum = minimum;
    p.maximum = std::numeric_limits<int>::max();  // 解析后存为 int
    p.description = description;
    return p;
}

ParamSpec booleanParam(const std::string& name, bool required, const std::string& description) {
    ParamSpec p;
    p.name = name;
    p.type = ParamType::Boolean;
    p.required = required;
    p.description = description;
    return p;
}

ToolContract textEditorContract() {
    ToolContract c;
    c.name = "text_editor";
    c.description =
        "Perform text editing operations on files.\n\n"
        "The `command` parameter specifies the operation to perform. Allowed options are:\n"
        "- `view`: View the content of a file.\n"
        "- `write`: Create or overwrite a file with the given content\n"
        "- `str_replace`: Replace a string in a file with a new string.\n"
        "- `undo_edit`: Undo the last edit made to a file.\n\n"
        "To use the write command, you must specify `file_text` which will become the new content of the file. "
        "Be careful with existing files! This is a full overwrite, so you must include everything - not just sections you are modifying.\n\n"
        "To use the str_replace command, you must specify both `old_str` and `new_str` - the `old_str` needs to exactly "
        "match one unique section of the original file, including any whitespace. Make sure to include enough context "
        "that the match is not ambiguous. The entire original string will be replaced with `new_str`.";

    ParamSpec command = stringParam("command", true, "Allowed options are: `view`, `write`, `str_replace`, `undo_edit`.");
    command.enumValues = {"view", "write", "str_replace", "undo_edit"};
    ParamSpec path = stringParam("path", true,
        "Absolute path to the file to operate on, e.g. `/repo/file.py`. "
        "For the `write` command, parent directories will be created if they do not exist.");
    path.absolutePath = true;

    c.params = {
        command,
        path,
        stringParam("file_text", false, "Content to write to the file (required for write command)"),
        stringParam("old_str", false, "String to replace (required for str_replace command)"),
        stringParam("new_str", false, "New string to replace with (required for str_replace command)")
    };
    c.conditionals = {
        {"command", "write", {"file_text"}},
        {"command", "str_replace", {"old_str", "new_str"}}
    };
    return c;
}

ToolContract workflowContract() {
    ToolContract c;
    c.name = "workflow";
    c.description =
        "Workflow Tool: Guiding Complex Problem-Solving\n\n"
        "Manages multi-step problem-solving processes with support for sequential progression, "
        "branching paths, and step revisions. Steps are tracked in order; total_steps can be adjusted "
        "as the workflow progresses; branches create alternative solution paths from a prior step; "
        "revisions mark steps that update or correct a prior step. Workflow state is kept across calls.";
    c.params = {
        stringParam("step_description", true, "Detailed description of what this step accomplishes"),
        integerParam("step_number", true, 1, "Current position in the workflow sequence (e.g., 1 for first step)"),
        integerParam("total_steps", true, 1, "Estimated total number of steps in the complete workflow"),
        booleanParam("next_step_needed", true, "Set to true if another step will follow this one, false if this is the final step"),
        booleanParam("is_step_revision", false, "Set to true if this step revises a previous step"),
        integerParam("revises_step", false, 1, "If revising a previous step, specify which step number is being revised"),
        integerParam("branch_from_step", false, 1, "If creating a branch, specify which step number this branch starts from"),
        stringParam("branch_id", false, "A unique identifier for this branch (required when creating a branch)"),
        booleanParam("needs_more_steps", false, "Indicates whether additional steps are required to complete the workflow")
    };
    return c;
}

ToolContract shellContract() {
    ToolContract c;
    c.name = "shell";
    c.description = "Execute shell commands on the system";
    c.params = {stringParam("command", true, "Command to execute")};
    return c;
}

ToolContract listWindowsContract() {
    ToolContract c;
    c.name = "list_windows";
    c.description =
        "List all available window titles that can be used with screen_capture.\n"
        "Returns a list of window titles that can be used with the window_title parameter\n"
        "of the screen_capture tool.";
    return c;
}

ToolContract screenCaptureContract() {
    ToolContract c;
    c.name = "screen_capture";
    c.description =
        "Capture a screenshot of a specified display or window.\n"
        "You can capture either:\n"
        "1. A full display (monitor) using the display parameter\n"
        "2. A specific window by its title using the window_title parameter\n\n"
        "Only one of display or window_title should be specified.";
    c.params = {
        integerParam("display", false, 0, "The display number to capture (0 is main display)"),
        stringParam("window_title", false,
            "Optional: the exact title of the window to capture. use the list_windows tool to find the available windows.")
    };
    return c;
}

ToolContract imageProcessorContract() {
    ToolContract c;
    c.name = "image_processor";
    c.description =
        "Process an image file from disk. The image will be resized if larger than max width "
        "while maintaining aspect ratio, optionally resized further by 1/2 or 1/4, kept in its "
        "original format and returned as base64 encoded data.";
    ParamSpec path = stringParam("path", true, "Absolute path to the image file to process");
    path.absolutePath = true;
    ParamSpec resize = stringParam("resize", false,
        "Optional resize factor to reduce image size. Allowed values: \"1/2\", \"1/4\"");
    resize.enumValues = {"1/2", "1/4"};
    c.params = {path, resize};
    return c;
}

} // namespace

nlohmann::json ToolContract::inputSchema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& p : params) {
        nlohmann::json prop = {
            {"type", typeName(p.type)},
            {"description", p.description}
        };
        if (!p.enumValues.empty()) {
            prop["enum"] = p.enumValues;
        }
        if (p.minimum) {
            prop["minimum"] = *p.minimum;
        }
        if (p.maximum) {
            prop["maximum"] = *p.maximum;
        }
        properties[p.name] = prop;
        if (p.required) {
            required.push_back(p.name);
        }
    }
    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

SchemaValidator::SchemaValidator() {
    registerContract(textEditorContract());
    registerContract(workflowContract());
    registerContract(shellContract());
    registerContract(listWindowsContract());
    registerContract(screenCaptureContract());
    registerContract(imageProcessorContract());
}

void SchemaValidator::registerContract(ToolContract contract) {
    std::string name = contract.name;
    contractsByName[name] = std::move(contract);
}

const ToolContract* SchemaValidator::findContract(const std::string& toolName) const {
    auto it = contractsByName.find(toolName);
    return it == contractsByName.end() ? nullptr : &it->second;
}

std::vector<const ToolContract*> SchemaValidator::contracts() const {
    std::vector<const ToolContract*> result;
    for (const auto& [name, contract] : contractsByName) {
        result.push_back(&contract);
    }
    return result;
}

SchemaValidator::ValidationResult SchemaValidator::validate(const ToolContract& contract,
                                                            const nlohmann::json& args) const {
    std::vector<std::string> problems;

    if (!args.is_null() && !args.is_object()) {
        return {false, {"arguments: expected a JSON object"}};
    }
    const nlohmann::json obj = args.is_null() ? nlohmann::json::object() : args;

    for (const auto& p : contract.params) {
        if (!present(obj, p.name)) {
            if (p.required) {
                problems.push_back(p.name + ": missing required field");
            }
            continue;
        }

        const auto& value = obj[p.name];
        if (!matchesType(value, p.type)) {
            problems.push_back(p.name + ": expected " + typeName(p.type) + ", got " + value.type_name());
            continue;
        }

        if (!p.enumValues.empty()) {
            const std::string s = value.get<std::string>();
            if (std::find(p.enumValues.begin(), p.enumValues.end(), s) == p.enumValues.end()) {
                std::string allowed;
                for (const auto& e : p.enumValues) {
                    if (!allowed.empty()) allowed += ", ";
                    allowed += e;
                }
                problems.push_back(p.name + ": " + describeValue(value) + " is not one of: " + allowed);
            }
        }

        if (p.type == ParamType::Integer) {
            // 大于 LLONG_MAX 的无符号数转 long long 会回绕
            const bool huge = value.is_number_unsigned() &&
                value.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max());
            if (p.maximum && (huge || value.get<long long>() > *p.maximum)) {
                problems.push_back(p.name + ": must be <= " + std::to_string(*p.maximum) +
                                   ", got " + value.dump());
            } else if (p.minimum && !huge && value.get<long long>() < *p.minimum) {
                problems.push_back(p.name + ": must be >= " + std::to_string(*p.minimum) +
                                   ", got " + value.dump());
            }
        }

        if (p.absolutePath) {
            const std::string raw = value.get<std::string>();
            const std::string expanded = TextUtils::expandUserPath(raw);
            if (!fs::path(expanded).is_absolute()) {
                std::error_code ec;
                fs::path cwd = fs::current_path(ec);
                std::string suggestion = ec ? expanded : (cwd / expanded).string();
                problems.push_back(p.name + ": The path " + raw +
                                   " is not an absolute path, did you possibly mean " + suggestion + "?");
            }
        }
    }

    for (const auto& cond : contract.conditionals) {
        if (!present(obj, cond.field) || !obj[cond.field].is_string() ||
            obj[cond.field].get<std::string>() != cond.equals) {
            continue;
        }
        for (const auto& field : cond.requiredFields) {
            if (!present(obj, field)) {
                problems.push_back(field + ": required when " + cond.field + " is '" + cond.equals + "'");
            }
        }
    }

    return {problems.empty(), problems};
}

Outcome<ToolArgs> SchemaValidator::parse(const std::string& toolName, const nlohmann::json& args) const {
    const ToolContract* contract = findContract(toolName);
    if (!contract) {
        return ToolError::make(ErrorKind::NotFound, "Unknown tool: " + toolName, toolName);
    }

    ValidationResult result = validate(*contract, args);
    if (!result.valid) {
        ToolError err = ToolError::make(ErrorKind::SchemaValidation,
                                        "Invalid arguments for tool '" + toolName + "'", toolName);
        err.problems = result.problems;
        return err;
    }

    nlohmann::json normalized = normalizePaths(*contract, args);
    if (toolName == "text_editor") {
        return ToolArgs{toTextEditorCommand(normalized)};
    }
    if (toolName == "workflow") {
        return ToolArgs{toWorkflowStep(normalized)};
    }
    return ToolArgs{DelegateCall{toolName, normalized}};
}

nlohmann::json SchemaValidator::normalizePaths(const ToolContract& contract, const nlohmann::json& args) {
    nlohmann::json out = args.is_null() ? nlohmann::json::object() : args;
    for (const auto& p : contract.params) {
        if (p.absolutePath && present(out, p.name)) {
            std::string expanded = TextUtils::expandUserPath(out[p.name].get<std::string>());
            out[p.name] = fs::path(expanded).lexically_normal().string();
        }
    }
    return out;
}

TextEditorCommand SchemaValidator::toTextEditorCommand(const nlohmann::json& args) {
    const std::string command = args["command"].get<std::string>();
    const std::string path = args["path"].get<std::string>();

    if (command == "write") {
        return WriteCommand{path, args["file_text"].get<std::string>()};
    }
    if (command == "str_replace") {
        return StrReplaceCommand{path, args["old_str"].get<std::string>(), args["new_str"].get<std::string>()};
    }
    if (command == "undo_edit") {
        return UndoEditCommand{path};
    }
    return ViewCommand{path};
}

WorkflowStep SchemaValidator::toWorkflowStep(const nlohmann::json& args) {
    WorkflowStep step;
    step.description = args["step_description"].get<std::string>();
    step.stepNumber = args["step_number"].get<int>();
    step.totalSteps = args["total_steps"].get<int>();
    step.nextStepNeeded = args["next_step_needed"].get<bool>();

    if (present(args, "is_step_revision")) {
        step.isRevision = args["is_step_revision"].get<bool>();
    }
    if (present(args, "revises_step")) {
        step.revisesStep = args["revises_step"].get<int>();
    }
    if (present(args, "branch_from_step")) {
        step.branchFromStep = args["branch_from_step"].get<int>();
    }
    if (present(args, "branch_id")) {
        step.branchId = args["branch_id"].get<std::string>();
    }
    if (present(args, "needs_more_steps")) {
        step.needsMoreSteps = args["needs_more_steps"].get<bool>();
    }
    return step;
}
