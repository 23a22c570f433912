#include "logger.h"
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace {

// Sinks and filter settings; guarded by `mutex`
struct LogState {
    std::mutex mutex;
    std::string session = "NO_SESSION";
    LogLevel level = LogLevel::INFO;
    bool console = true;
    std::ofstream file;
    std::function<void(const std::string&)> callback;
};

// Pending lines for the background writer; guarded by `mutex`
struct AsyncQueue {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> lines;
    bool stopping = false;
    std::thread worker;
    std::atomic<bool> enabled{false};
};

LogState& state() {
    static LogState s;
    return s;
}

AsyncQueue& async_queue() {
    static AsyncQueue q;
    return q;
}

std::string wall_clock_stamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char text[32];
    std::strftime(text, sizeof(text), "%Y-%m-%d %H:%M:%S", &local);
    return text;
}

void write_to_sinks(const std::string& line) {
    std::function<void(const std::string&)> callback;
    {
        LogState& s = state();
        std::lock_guard<std::mutex> guard(s.mutex);
        if (s.console) {
            std::cerr << line << '\n';
            std::cerr.flush();
        }
        if (s.file.is_open()) {
            s.file << wall_clock_stamp() << ' ' << line << '\n';
            s.file.flush();
        }
        callback = s.callback;
    }
    // Outside the lock: the callback may log
    if (callback) {
        callback(line);
    }
}

void drain_queue() {
    AsyncQueue& q = async_queue();
    std::unique_lock<std::mutex> guard(q.mutex);
    for (;;) {
        q.cv.wait(guard, [&q] { return q.stopping || !q.lines.empty(); });
        if (q.lines.empty()) {
            return;
        }
        std::string line = std::move(q.lines.front());
        q.lines.pop_front();
        guard.unlock();
        write_to_sinks(line);
        guard.lock();
    }
}

} // namespace

void setSessionId(const std::string& session_id) {
    LogState& s = state();
    std::lock_guard<std::mutex> guard(s.mutex);
    s.session = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    LogState& s = state();
    std::lock_guard<std::mutex> guard(s.mutex);
    s.callback = std::move(callback);
}

bool set_log_file(const std::string& path) {
    LogState& s = state();
    std::lock_guard<std::mutex> guard(s.mutex);
    if (s.file.is_open()) {
        s.file.close();
    }
    if (path.empty()) {
        return true;
    }
    s.file.open(path, std::ios::out | std::ios::app);
    return s.file.is_open();
}

void set_console_output(bool enabled) {
    LogState& s = state();
    std::lock_guard<std::mutex> guard(s.mutex);
    s.console = enabled;
}

void set_log_level(LogLevel level) {
    LogState& s = state();
    std::lock_guard<std::mutex> guard(s.mutex);
    s.level = level;
}

LogLevel get_log_level() {
    LogState& s = state();
    std::lock_guard<std::mutex> guard(s.mutex);
    return s.level;
}

/**
 * @brief Maps a config or command-line level name to a LogLevel.
 * Case-insensitive; "warn" and "warning" are both accepted. Unknown names
 * map to ERROR so a typo still reports failures.
 */
LogLevel parse_log_level(const std::string& value) {
    std::string name;
    name.reserve(value.size());
    for (char c : value) {
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "none") return LogLevel::NONE;
    return LogLevel::ERROR;
}

void enable_async_logging() {
    AsyncQueue& q = async_queue();
    std::lock_guard<std::mutex> guard(q.mutex);
    if (q.enabled) {
        return;
    }
    q.stopping = false;
    q.worker = std::thread(drain_queue);
    q.enabled = true;
}

// Blocks until every queued line has been written
void disable_async_logging() {
    AsyncQueue& q = async_queue();
    {
        std::lock_guard<std::mutex> guard(q.mutex);
        if (!q.enabled) {
            return;
        }
        q.enabled = false;
        q.stopping = true;
    }
    q.cv.notify_all();
    if (q.worker.joinable()) {
        q.worker.join();
    }
}

bool is_async_logging_enabled() {
    return async_queue().enabled.load();
}

void nativeLog(const std::string& message) {
    std::string line;
    {
        LogState& s = state();
        std::lock_guard<std::mutex> guard(s.mutex);
        line = "[" + s.session + "] " + message;
    }

    AsyncQueue& q = async_queue();
    {
        std::lock_guard<std::mutex> guard(q.mutex);
        if (q.enabled) {
            q.lines.push_back(std::move(line));
            q.cv.notify_one();
            return;
        }
    }
    write_to_sinks(line);
}
