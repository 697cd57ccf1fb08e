#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <optional>
#include <cstdlib>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>

struct Config {
    struct Server {
        std::string name = "anvil";
        std::string version = ANVIL_VERSION;
    } server;

    struct Editor {
        size_t maxHistory = 10;
        /** 访问忽略：正则列表（ECMAScript），路径匹配任一则拒绝；text_editor 与 shell 共用。字面点用 \\. 如 "\\.env$" */
        std::vector<std::string> ignorePatterns;
        bool useGitignore = true;       // 追加工作目录下 .gitignore 的规则
    } editor;

    struct Workflow {
        bool allowBranches = true;
        std::optional<int> maxSteps;
        bool logSteps = true;
    } workflow;

    struct Shell {
        std::string executable;     // 空则使用 $SHELL
        size_t maxOutputChars = 400000;
        size_t historySize = 20;
    } shell;

    struct Log {
        std::string file = "anvil.log";   // 空字符串关闭文件日志
        bool debug = false;
    } log;

    // 外部 MCP 服务器, 承接 list_windows / screen_capture / image_processor
    struct DelegateServer {
        std::string name;
        std::string command;
        std::vector<std::string> tools;
    };
    std::vector<DelegateServer> delegates;

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        if (j.contains("server")) {
            const auto& s = j.at("server");
            cfg.server.name = s.value("name", cfg.server.name);
            cfg.server.version = s.value("version", cfg.server.version);
        }

        if (j.contains("editor")) {
            const auto& e = j.at("editor");
            cfg.editor.maxHistory = e.value("max_history", cfg.editor.maxHistory);
            if (e.contains("ignore_patterns")) {
                cfg.editor.ignorePatterns = e.at("ignore_patterns").get<std::vector<std::string>>();
            }
            cfg.editor.useGitignore = e.value("use_gitignore", true);
        }

        if (j.contains("workflow")) {
            const auto& w = j.at("workflow");
            cfg.workflow.allowBranches = w.value("allow_branches", true);
            cfg.workflow.logSteps = w.value("log_steps", true);
            if (w.contains("max_steps") && !w.at("max_steps").is_null()) {
                cfg.workflow.maxSteps = w.at("max_steps").get<int>();
            }
        }

        if (j.contains("shell")) {
            const auto& s = j.at("shell");
            cfg.shell.executable = s.value("executable", "");
            cfg.shell.maxOutputChars = s.value("max_output_chars", cfg.shell.maxOutputChars);
            cfg.shell.historySize = s.value("history_size", cfg.shell.historySize);
        }

        if (j.contains("log")) {
            const auto& l = j.at("log");
            cfg.log.file = l.value("file", cfg.log.file);
            cfg.log.debug = l.value("debug", false);
        }

        if (j.contains("delegates")) {
            for (const auto& item : j.at("delegates")) {
                DelegateServer d;
                d.name = item.value("name", "");
                d.command = item.value("command", "");
                d.tools = item.value("tools", std::vector<std::string>{});
                if (d.command.empty()) {
                    throw std::runtime_error("Delegate '" + d.name + "' has no command");
                }
                cfg.delegates.push_back(std::move(d));
            }
        }

        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
        }
    }

    /**
     * @brief 环境变量覆盖: TEXT_EDITOR_MAX_HISTORY 为非负整数时替换 editor.max_history
     * @return 是否发生了覆盖
     */
    bool applyEnvironment() {
        const char* raw = std::getenv("TEXT_EDITOR_MAX_HISTORY");
        if (!raw || !*raw) return false;

        std::string value(raw);
        if (value.find_first_not_of("0123456789") != std::string::npos) return false;
        try {
            editor.maxHistory = static_cast<size_t>(std::stoull(value));
        } catch (const std::out_of_range&) {
            return false;
        }
        return true;
    }
};
