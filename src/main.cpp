#include "config.hpp"
#include "editor.hpp"
#include "log.hpp"
#include "tool.hpp"
#include "mcp/server.hpp"
#include "security/validator.hpp"
#include "version.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

// No SA_RESTART: a blocked read on stdin must return so the loop can exit.
static void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

static void print_usage() {
    std::cerr << "Usage: cedarscript-mcp-server [options]\n"
              << "\n"
              << "Serves CEDARScript editing tools over MCP (JSON-RPC on stdin/stdout).\n"
              << "\n"
              << "Options:\n"
              << "  --root DIR           Project root directory (default: $CEDARSCRIPT_ROOT or cwd)\n"
              << "  --read-only          Reject every write operation\n"
              << "  --max-file-size N    Maximum readable file size in bytes (default: 10485760)\n"
              << "  --deny PATTERN       Denylist glob, repeatable; replaces the built-in list\n"
              << "  --log-level LEVEL    DEBUG, INFO, WARNING or ERROR (default: INFO)\n"
              << "  --log-format FMT     text or json (default: text)\n"
              << "  --editor CMD         External CEDARScript editor command\n"
              << "  --config FILE        Config file (default: ~/.cedarmcp/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  CEDARSCRIPT_ROOT, CEDARSCRIPT_READ_ONLY, CEDARSCRIPT_MAX_FILE_SIZE,\n"
              << "  CEDARSCRIPT_DENYLIST (comma separated), CEDARSCRIPT_LOG_LEVEL,\n"
              << "  CEDARSCRIPT_LOG_FORMAT, CEDARSCRIPT_EDITOR, CEDARSCRIPT_EDITOR_TIMEOUT_MS\n";
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string config_path;
    std::string root;
    std::string max_file_size;
    std::string log_level;
    std::string log_format;
    std::string editor;
    std::vector<std::string> deny;
    bool read_only = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            root = argv[++i];
        } else if (std::strcmp(argv[i], "--read-only") == 0) {
            read_only = true;
        } else if (std::strcmp(argv[i], "--max-file-size") == 0 && i + 1 < argc) {
            max_file_size = argv[++i];
        } else if (std::strcmp(argv[i], "--deny") == 0 && i + 1 < argc) {
            deny.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--log-format") == 0 && i + 1 < argc) {
            log_format = argv[++i];
        } else if (std::strcmp(argv[i], "--editor") == 0 && i + 1 < argc) {
            editor = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = cedarmcp::Config::load(config_path);

    // Override config with CLI args
    if (!root.empty()) config.root = root;
    if (read_only) config.read_only = true;
    if (!max_file_size.empty())
        config.max_file_size = cedarmcp::parse_positive_setting(max_file_size, "--max-file-size");
    if (!deny.empty()) config.denylist = deny;
    if (!log_level.empty()) config.log_level = log_level;
    if (!log_format.empty()) config.log_format = log_format;
    if (!editor.empty()) config.editor_command = editor;

    auto level = cedarmcp::parse_log_level(config.log_level);
    auto format = cedarmcp::parse_log_format(config.log_format);
    if (!level || !format) {
        std::cerr << "Invalid log " << (level ? "format: " + config.log_format
                                              : "level: " + config.log_level) << "\n";
        print_usage();
        return 1;
    }
    cedarmcp::log_init(*level, *format);

    // One policy and one engine for the whole session
    const cedarmcp::PathValidator validator(config.effective_root(), config.read_only,
                                            config.max_file_size, config.denylist);
    cedarmcp::ProcessEditEngine engine(config.editor_command, config.editor_timeout_ms);
    cedarmcp::ToolContext ctx{validator, engine};

    cedarmcp::mcp::Server server(cedarmcp::create_builtin_tools(ctx));

    cedarmcp::log_info("main", std::string("Starting ") + cedarmcp::kServerName + " " +
                       cedarmcp::kServerVersion);
    cedarmcp::log_info("main", "  Root: " + validator.root().string());
    cedarmcp::log_info("main", std::string("  Read-only: ") +
                       (validator.read_only() ? "true" : "false"));
    cedarmcp::log_info("main", "  Max file size: " +
                       std::to_string(validator.max_file_size()) + " bytes");
    cedarmcp::log_info("main", "  Denylist: " + std::to_string(validator.denylist().size()) +
                       " pattern(s)");
    cedarmcp::log_info("main", "  Editor: " + config.editor_command);

    install_signal_handlers();
    return server.run(std::cin, std::cout, g_shutdown);
} catch (const cedarmcp::PolicyError& e) {
    cedarmcp::log_error("main", std::string(cedarmcp::policy_error_kind_name(e.kind())) +
                        ": " + e.what());
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
