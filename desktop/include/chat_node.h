#ifndef FILECHAT_CHAT_NODE_H
#define FILECHAT_CHAT_NODE_H

#include "shared_log.h"
#include "log_writer.h"
#include "log_watcher.h"
#include "display_surface.h"
#include "input_engine.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

/**
 * @brief One chat session: identity, the shared log, and the two threads of
 * control that use it.
 *
 * start() announces the user and launches the LogWatcher; run() drives the
 * InputEngine on the calling thread; stop() shuts the watcher down and
 * announces the departure.
 */
class ChatNode {
public:
    ChatNode(const std::string& log_path, size_t max_history_lines,
             std::chrono::milliseconds poll_interval);
    ~ChatNode();

    ChatNode(const ChatNode&) = delete;
    ChatNode& operator=(const ChatNode&) = delete;

    // Writes the join record, draws the empty input box, starts polling
    bool start(const std::string& nickname, DisplaySurface& display);

    // Blocks until the user interrupts or input closes
    void run(InputSource& source);

    // Idempotent
    void stop();

    bool isRunning() const { return running_; }

    static constexpr const char* kJoinMessage = "joined the room";
    static constexpr const char* kLeaveMessage = "left the room";

private:
    SharedLog log_;
    LogWriter writer_;
    const size_t max_history_lines_;
    const std::chrono::milliseconds poll_interval_;

    std::string nickname_;
    std::atomic<bool> running_;
    std::unique_ptr<LogWatcher> watcher_;
    std::unique_ptr<InputEngine> input_;
};

#endif // FILECHAT_CHAT_NODE_H
