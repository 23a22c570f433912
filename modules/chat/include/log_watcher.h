#ifndef FILECHAT_LOG_WATCHER_H
#define FILECHAT_LOG_WATCHER_H

#include "shared_log.h"
#include "display_surface.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>

/**
 * @brief Background poller that mirrors the tail of the SharedLog into the
 * history viewport.
 *
 * Each cycle compares the file's modification time with the last one seen.
 * Only when it differs is the whole file re-read and the last max_lines lines
 * repainted. A file that shrinks or is replaced without a new modification
 * time goes unnoticed until the next write.
 */
class LogWatcher {
public:
    LogWatcher(const SharedLog& log, DisplaySurface& display, size_t max_lines,
               std::chrono::milliseconds poll_interval);
    ~LogWatcher();

    LogWatcher(const LogWatcher&) = delete;
    LogWatcher& operator=(const LogWatcher&) = delete;

    void start();

    // Stops after the current cycle and joins the thread
    void stop();

    bool is_running() const { return running_; }

    /**
     * @brief One poll cycle. Never throws.
     * @return true if the history viewport was repainted.
     */
    bool poll_once();

    size_t repaint_count() const { return repaint_count_; }

private:
    void run();

    const SharedLog& log_;
    DisplaySurface& display_;
    const size_t max_lines_;
    const std::chrono::milliseconds poll_interval_;

    // Touched only by the polling thread
    std::optional<FileStamp> last_stamp_;

    std::atomic<bool> running_;
    std::atomic<size_t> repaint_count_;
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

#endif // FILECHAT_LOG_WATCHER_H
