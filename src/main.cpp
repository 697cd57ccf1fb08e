#include <iostream>
#include <string>
#include <csignal>
#include "core/ConfigManager.h"
#include "core/AppContext.h"
#include "mcp/StdioServer.h"
#include "utils/Logger.h"

void printUsage() {
    std::cerr << "Usage: anvil [config_path]\n"
              << "       anvil --list-tools [config_path]\n"
              << "       anvil --version | --help\n\n"
              << "Serves text_editor, workflow and shell tools as JSON-RPC over stdio." << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    bool listTools = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--version") {
            std::cout << "anvil " << ANVIL_VERSION << std::endl;
            return 0;
        } else if (arg == "--list-tools") {
            listTools = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return 1;
        } else {
            configPath = arg;
        }
    }

    Config cfg;
    if (!configPath.empty()) {
        try {
            cfg = Config::load(configPath);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }
    bool envOverride = cfg.applyEnvironment();

    auto& logger = Logger::getInstance();
    logger.setLogFile(cfg.log.file);
    logger.setDebugEnabled(cfg.log.debug);
    if (!configPath.empty()) {
        logger.info("Loaded configuration from: " + configPath);
    }
    if (envOverride) {
        logger.info("TEXT_EDITOR_MAX_HISTORY=" + std::to_string(cfg.editor.maxHistory));
    }

    // 外部 MCP 子进程退出后写管道不应终止本进程
    std::signal(SIGPIPE, SIG_IGN);

    AppContext context(cfg);

    if (listTools) {
        std::cout << context.dispatcher().listTools().dump(2) << std::endl;
        return 0;
    }

    ServerInfo info;
    info.name = cfg.server.name;
    info.version = cfg.server.version;

    StdioServer server(context.dispatcher(), info, [&context]() { return context.shellHistory(); });
    server.run();

    logger.info("Shutting down");
    return 0;
}
