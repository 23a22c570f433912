#include "log_watcher.h"
#include "logger.h"
#include <exception>
#include <string>
#include <utility>
#include <vector>

LogWatcher::LogWatcher(const SharedLog& log, DisplaySurface& display, size_t max_lines,
                       std::chrono::milliseconds poll_interval)
    : log_(log)
    , display_(display)
    , max_lines_(max_lines)
    , poll_interval_(poll_interval)
    , running_(false)
    , repaint_count_(0)
{
}

LogWatcher::~LogWatcher() {
    stop();
}

void LogWatcher::start() {
    if (running_) return;
    running_ = true;

    thread_ = std::thread([this]() { run(); });
    LOG_INFO("LogWatcher: watching " + log_.path() + " every " +
             std::to_string(poll_interval_.count()) + "ms");
}

void LogWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_ && !thread_.joinable()) return;
        running_ = false;
    }
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("LogWatcher: stopped");
}

void LogWatcher::run() {
    while (running_) {
        poll_once();

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, poll_interval_, [this] { return !running_; });
    }
}

bool LogWatcher::poll_once() {
    try {
        // Tolerate the file being deleted under us
        if (!log_.ensure_exists()) {
            return false;
        }

        std::optional<FileStamp> stamp = log_.modification_time();
        if (!stamp) {
            return false;
        }
        if (last_stamp_ && *last_stamp_ == *stamp) {
            return false;
        }

        // File I/O happens before the display lock is taken
        std::vector<std::string> window = log_.read_tail(max_lines_);
        last_stamp_ = stamp;

        display_.repaint_history(std::move(window));
        ++repaint_count_;
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(std::string("LogWatcher: poll cycle failed: ") + e.what());
        return false;
    }
}
