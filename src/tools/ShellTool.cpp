#include "tools/ShellTool.h"
#include "utils/TextUtils.h"
#include "utils/Logger.h"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace {

std::string shellQuote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::string defaultShell() {
    const char* shell = std::getenv("SHELL");
    if (shell && *shell) return shell;
    return "bash";
}

} // namespace

ShellTool::ShellTool(ShellConfig config, std::vector<std::string> ignorePatterns)
    : config(std::move(config)), ignoreRules(std::move(ignorePatterns)) {
    if (this->config.executable.empty()) {
        this->config.executable = defaultShell();
    }
}

std::string ShellTool::buildCommandLine(const std::string& command) const {
    return config.executable + " -c " + shellQuote(command + " 2>&1") + " </dev/null";
}

std::string ShellTool::restrictedArgument(const std::string& command) const {
    if (ignoreRules.patternCount() == 0) return "";

    std::istringstream iss(command);
    std::string word;
    bool first = true;
    while (iss >> word) {
        if (first) {
            first = false;
            continue;
        }
        if (word[0] == '-') continue;

        std::error_code ec;
        fs::path p(TextUtils::expandUserPath(word));
        if (!fs::exists(p, ec)) continue;
        if (ignoreRules.isRestricted(fs::absolute(p, ec)) || ignoreRules.isRestricted(p)) {
            return word;
        }
    }
    return "";
}

void ShellTool::remember(const std::string& command) {
    std::lock_guard<std::mutex> lock(historyMutex);
    history.push_back(command);
    while (history.size() > config.historySize) {
        history.pop_front();
    }
}

std::vector<std::string> ShellTool::recentCommands() const {
    std::lock_guard<std::mutex> lock(historyMutex);
    return {history.begin(), history.end()};
}

nlohmann::json ShellTool::execute(const nlohmann::json& args) {
    const std::string command = args.value("command", "");

    std::string restricted = restrictedArgument(command);
    if (!restricted.empty()) {
        return {
            {"error", "The command attempts to access '" + restricted + "' which is restricted by ignore patterns"},
            {"kind", "InvalidArgument"}
        };
    }

    Logger::getInstance().action("shell: " + command);
    remember(command);

    const std::string cmdLine = buildCommandLine(command);
    FILE* pipePtr = popen(cmdLine.c_str(), "r");
    if (!pipePtr) {
        return {{"error", "Failed to spawn command: " + command}, {"kind", "IOError"}};
    }

    std::array<char, 4096> buffer;
    std::string output;
    size_t bytes;
    while ((bytes = fread(buffer.data(), 1, buffer.size(), pipePtr)) > 0) {
        output.append(buffer.data(), bytes);
    }
    int status = pclose(pipePtr);
    int exitCode = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    if (exitCode != 0) {
        Logger::getInstance().debug("shell exit code " + std::to_string(exitCode) + ": " + command);
    }

    std::string normalized = TextUtils::normalizeLineEndings(UTF8Utils::sanitize(output));
    size_t chars = UTF8Utils::codepointCount(normalized);
    if (chars > config.maxOutputChars) {
        return {
            {"error", "Shell output from command '" + command + "' has too many characters (" +
                      std::to_string(chars) + "). Maximum character count is " +
                      std::to_string(config.maxOutputChars) + "."},
            {"kind", "TooLarge"}
        };
    }

    return {{"content", {{{"type", "text"}, {"text", normalized}}}}};
}
