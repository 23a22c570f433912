#include "test_support.h"
#include "config_manager.h"
#include "logger.h"

bool test_defaults() {
    std::cout << "Testing config defaults..." << std::endl;
    auto& config = ConfigManager::getInstance();
    config.reset();

    TEST_ASSERT(config.getChatLogPath() == "/home/chat/chat_history.log", "default log path");
    TEST_ASSERT(config.getPollIntervalSec() == 0.5, "default poll interval");
    TEST_ASSERT(config.getMaxHistoryLines() == 100, "default history lines");
    TEST_ASSERT(config.getMaxNicknameBytes() == 60, "default nickname cap");
    TEST_ASSERT(config.getLogLevel() == "none", "default log level");
    TEST_ASSERT(config.getLogFilePath().empty(), "no log file by default");

    std::cout << "Config defaults Passed!" << std::endl;
    return true;
}

bool test_load_and_override() {
    std::cout << "Testing config load..." << std::endl;
    auto& config = ConfigManager::getInstance();
    config.reset();

    const std::string path = temp_log_path("config");
    {
        std::ofstream out(path);
        out << R"({"chat": {"log_file_path": "/tmp/room.log", "poll_interval_sec": 0.25,
                   "max_history_lines": 20}, "logging": {"level": "debug"}})";
    }
    TEST_ASSERT(config.loadConfig(path), "valid file loads");
    TEST_ASSERT(config.getChatLogPath() == "/tmp/room.log", "log path from file");
    TEST_ASSERT(config.getPollIntervalSec() == 0.25, "poll interval from file");
    TEST_ASSERT(config.getMaxHistoryLines() == 20, "history lines from file");
    TEST_ASSERT(config.getMaxNicknameBytes() == 60, "missing key falls back to default");
    TEST_ASSERT(config.getLogLevel() == "debug", "log level from file");

    TEST_ASSERT(config.setValueAtPath({"chat", "max_history_lines"}, 0), "override");
    TEST_ASSERT(config.getMaxHistoryLines() == 1, "history lines clamped to at least one");
    TEST_ASSERT(config.setValueAtPath({"chat", "poll_interval_sec"}, 0.0), "override");
    TEST_ASSERT(config.getPollIntervalSec() == 0.05, "poll interval clamped");
    TEST_ASSERT(config.setValueAtPath({"new", "nested", "key"}, "v"), "intermediate objects created");

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    TEST_ASSERT(!config.loadConfig(path), "invalid file rejected");
    TEST_ASSERT(config.getChatLogPath() == "/tmp/room.log", "previous values kept after a bad load");
    TEST_ASSERT(!config.loadConfig(path + ".missing"), "missing file rejected");

    remove_file(path);
    config.reset();
    std::cout << "Config load Passed!" << std::endl;
    return true;
}

bool test_wrong_types_fall_back() {
    std::cout << "Testing mistyped config values..." << std::endl;
    auto& config = ConfigManager::getInstance();
    config.reset();

    const std::string path = temp_log_path("config_types");
    {
        std::ofstream out(path);
        out << R"({"chat": {"poll_interval_sec": "fast", "max_history_lines": "many",
                   "log_file_path": 42, "max_nickname_bytes": 12},
                   "logging": {"level": ["debug"], "async": "yes"}})";
    }
    TEST_ASSERT(config.loadConfig(path), "file with odd types still loads");
    TEST_ASSERT(config.getPollIntervalSec() == 0.5, "string poll interval uses the default");
    TEST_ASSERT(config.getMaxHistoryLines() == 100, "string history size uses the default");
    TEST_ASSERT(config.getChatLogPath() == "/home/chat/chat_history.log", "numeric path uses the default");
    TEST_ASSERT(config.getMaxNicknameBytes() == 12, "well-typed keys still apply");
    TEST_ASSERT(config.getLogLevel() == "none", "array level uses the default");
    TEST_ASSERT(!config.isAsyncLogging(), "string flag uses the default");

    TEST_ASSERT(config.setValueAtPath({"chat"}, "not an object"), "override");
    TEST_ASSERT(config.getMaxHistoryLines() == 100, "non-object section uses defaults");

    remove_file(path);
    config.reset();
    std::cout << "Mistyped config values Passed!" << std::endl;
    return true;
}

bool test_log_level_parsing() {
    std::cout << "Testing log level parsing..." << std::endl;
    TEST_ASSERT(parse_log_level("DEBUG") == LogLevel::DEBUG, "debug");
    TEST_ASSERT(parse_log_level("warn") == LogLevel::WARNING, "warn alias");
    TEST_ASSERT(parse_log_level("none") == LogLevel::NONE, "none");
    TEST_ASSERT(parse_log_level("bogus") == LogLevel::ERROR, "unknown falls back to error");

    const std::string path = temp_log_path("diag");
    set_console_output(false);
    TEST_ASSERT(set_log_file(path), "log file opens");
    set_log_level(LogLevel::INFO);
    setSessionId("tester");
    LOG_INFO("written");
    LOG_DEBUG("filtered");
    set_log_file("");
    auto lines = read_file_lines(path);
    TEST_ASSERT(lines.size() == 1, "only the INFO line passes the filter");
    TEST_ASSERT(lines[0].find("[tester] INFO: written") != std::string::npos, "session prefix and level tag");

    set_log_level(LogLevel::NONE);
    remove_file(path);
    std::cout << "Log level parsing Passed!" << std::endl;
    return true;
}

bool test_log_callback_and_async() {
    std::cout << "Testing log callback and async queue..." << std::endl;
    set_console_output(false);
    set_log_level(LogLevel::WARNING);
    setSessionId("sink");

    std::vector<std::string> seen;
    std::mutex seen_mutex;
    setLogCallback([&](const std::string& line) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(line);
    });

    LOG_WARN("sync line");
    LOG_INFO("below the level");
    const size_t sync_count = seen.size();

    enable_async_logging();
    const bool async_on = is_async_logging_enabled();
    for (int i = 0; i < 50; ++i) {
        LOG_ERROR("queued " + std::to_string(i));
    }
    disable_async_logging();
    setLogCallback(nullptr);

    TEST_ASSERT(sync_count == 1 && seen[0] == "[sink] WARN: sync line", "callback gets the formatted line");
    TEST_ASSERT(async_on, "async mode on");
    TEST_ASSERT(!is_async_logging_enabled(), "async mode off");
    TEST_ASSERT(seen.size() == 51, "every queued line delivered before disable returns");
    TEST_ASSERT(seen.back() == "[sink] ERROR: queued 49", "queue keeps order");

    set_log_level(LogLevel::NONE);
    std::cout << "Log callback and async queue Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::NONE);
    std::cout << "Running Config Tests..." << std::endl;

    test_defaults();
    test_load_and_override();
    test_wrong_types_fall_back();
    test_log_level_parsing();
    test_log_callback_and_async();

    if (tests_failed == 0) {
        std::cout << "ALL CONFIG TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
