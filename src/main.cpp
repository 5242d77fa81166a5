#include "app.hpp"
#include "config.hpp"
#include "log.hpp"
#include "version.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cerr << "Usage: toolmux [options]\n"
              << "\n"
              << "Serves the tools of every configured provider, plus execute, status\n"
              << "and kill, as JSON-RPC over stdin/stdout.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Configuration file (default: ./.codemode.json)\n"
              << "  -v, --version        Print the version and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLMUX_CONFIG               Configuration file when --config is absent\n"
              << "  TOOLMUX_LOG_LEVEL            error, warn, info or debug\n"
              << "  TOOLMUX_REQUEST_TIMEOUT_MS   Provider request timeout\n"
              << "  TOOLMUX_EXECUTE_TIMEOUT_MS   Default execute timeout\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << toolmux::kServerName << " " << toolmux::kVersion << "\n";
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = toolmux::Config::load(toolmux::Config::resolve_path(config_path));

    if (auto level = toolmux::parse_log_level(config.log_level)) {
        toolmux::set_log_level(*level);
    } else {
        toolmux::log_warn("config", "Unknown log_level '" + config.log_level +
                          "', using info");
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    toolmux::App app(std::move(config));
    app.loop().set_abort_flag(&g_shutdown);
    app.start();
    return app.serve();
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
