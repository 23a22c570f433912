#include "chat_node.h"
#include "terminal_cli.h"
#include "display_surface.h"
#include "config_manager.h"
#include "logger.h"
#include "text_utils.h"
#include <chrono>
#include <cmath>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <signal.h>
#include <unistd.h>

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE   Path to configuration file (default: config.json)\n"
              << "  --file PATH     Shared chat log (default: " << ConfigManager::kDefaultChatLogPath << ")\n"
              << "  --nick NAME     Nickname (skips the nickname prompt)\n"
              << "  --log-level LVL Log level: debug|info|warning|error|none (default: none)\n"
              << "  --help          Show this help message\n"
              << "\nIn the chat:\n"
              << "  Enter sends the line, Backspace deletes, Ctrl-C leaves the room.\n"
              << std::endl;
}

// Loads the first config file that parses. An explicitly named file must load.
static bool load_configuration(const std::string& config_path, bool explicit_path, const char* argv0) {
    auto& config = ConfigManager::getInstance();
    if (explicit_path) {
        return config.loadConfig(config_path);
    }

    std::vector<std::string> candidates;
    candidates.push_back(config_path);
    try {
        std::filesystem::path exe_dir = std::filesystem::absolute(argv0).parent_path();
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("MAIN: cannot resolve executable directory: ") + e.what());
    }

    for (const auto& c : candidates) {
        if (std::filesystem::exists(c) && config.loadConfig(c)) {
            return true;
        }
    }
    // Running on defaults is fine
    LOG_INFO("MAIN: no config file found, using defaults");
    return true;
}

static std::string fallback_nickname() {
    return "User-" + std::to_string(::getpid());
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    // Suppress all logs until the configuration says otherwise
    set_log_level(LogLevel::NONE);

    std::string config_path = "config.json";
    bool explicit_config = false;
    std::string log_path_override;
    std::string nick_override;
    bool have_nick = false;
    std::string log_level_override;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
                explicit_config = true;
            } else {
                std::cerr << "Error: --config requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--file") {
            if (i + 1 < argc) {
                log_path_override = argv[++i];
            } else {
                std::cerr << "Error: --file requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--nick") {
            if (i + 1 < argc) {
                nick_override = argv[++i];
                have_nick = true;
            } else {
                std::cerr << "Error: --nick requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                log_level_override = argv[++i];
            } else {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!load_configuration(config_path, explicit_config, argv[0])) {
        std::cerr << "Error: Failed to load configuration from " << config_path << std::endl;
        return 1;
    }

    int exit_code = 0;
    try {
        auto& config = ConfigManager::getInstance();
        if (!log_path_override.empty()) {
            config.setValueAtPath({"chat", "log_file_path"}, log_path_override);
        }
        if (!log_level_override.empty()) {
            config.setValueAtPath({"logging", "level"}, log_level_override);
        }

        const std::string diag_file = config.getLogFilePath();
        if (!diag_file.empty() && !set_log_file(diag_file)) {
            std::cerr << "Warning: cannot open log file " << diag_file << std::endl;
        }
        set_log_level(parse_log_level(config.getLogLevel()));
        if (config.isAsyncLogging()) {
            enable_async_logging();
        }

        const std::string chat_file = config.getChatLogPath();
        const auto poll_interval = std::chrono::milliseconds(
            static_cast<long long>(std::llround(config.getPollIntervalSec() * 1000.0)));
        const size_t max_nick_bytes = static_cast<size_t>(config.getMaxNicknameBytes());

        // The shared log must exist (and be usable by everyone) before the UI starts
        BootstrapResult boot = SharedLog(chat_file).bootstrap();
        if (boot.status == BootstrapStatus::PermissionDenied) {
            std::cerr << "Error: Cannot create chat file at " << chat_file << ". Permission denied." << std::endl;
            std::cerr << "Please run: sudo touch " << chat_file << " && sudo chmod 666 " << chat_file << std::endl;
            disable_async_logging();
            return 1;
        }
        if (boot.status == BootstrapStatus::Failed) {
            std::cerr << "Error: Cannot create chat file at " << chat_file << ": " << boot.error << std::endl;
            disable_async_logging();
            return 1;
        }

        // The UI owns the terminal from here on
        set_console_output(false);
        TerminalCLI cli;
        cli.setup_terminal();
        DisplaySurface display(cli);

        std::string nickname;
        if (have_nick) {
            nickname = trim_copy(utf8_truncate_bytes(nick_override, max_nick_bytes));
        } else {
            auto entered = cli.prompt_nickname(display, max_nick_bytes);
            if (!entered) {
                // Interrupted at the prompt: never joined
                cli.restore_terminal();
                disable_async_logging();
                return 0;
            }
            nickname = *entered;
        }
        if (nickname.empty()) {
            nickname = fallback_nickname();
        }
        setSessionId(nickname);

        // Declared after the display so the watcher is stopped before the screen goes away
        ChatNode node(chat_file, static_cast<size_t>(config.getMaxHistoryLines()), poll_interval);
        if (node.start(nickname, display)) {
            node.run(cli);
            node.stop();
        } else {
            exit_code = 1;
        }
    } catch (const std::exception& e) {
        // TerminalCLI's destructor has already restored the terminal
        std::cerr << "System Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    disable_async_logging();
    return exit_code;
}
