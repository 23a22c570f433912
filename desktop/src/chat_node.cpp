#include "chat_node.h"
#include "logger.h"

ChatNode::ChatNode(const std::string& log_path, size_t max_history_lines,
                   std::chrono::milliseconds poll_interval)
    : log_(log_path)
    , writer_(log_)
    , max_history_lines_(max_history_lines)
    , poll_interval_(poll_interval)
    , running_(false)
{
}

ChatNode::~ChatNode() {
    if (running_) {
        stop();
    }
}

bool ChatNode::start(const std::string& nickname, DisplaySurface& display) {
    if (running_) {
        LOG_ERROR("ChatNode: session already running");
        return false;
    }

    nickname_ = nickname;
    LOG_INFO("ChatNode: joining " + log_.path() + " as " + nickname_);

    display.repaint_input("");
    input_ = std::make_unique<InputEngine>(writer_, nickname_, display);
    watcher_ = std::make_unique<LogWatcher>(log_, display, max_history_lines_, poll_interval_);
    watcher_->start();

    // Announced only once the session is up, so every join has a matching leave
    writer_.append(nickname_, kJoinMessage);
    running_ = true;
    return true;
}

void ChatNode::run(InputSource& source) {
    if (!running_ || !input_) {
        LOG_ERROR("ChatNode: run() before start()");
        return;
    }
    input_->run(source);
}

void ChatNode::stop() {
    if (!running_) {
        return;
    }
    // Shutting down: the watcher finishes its current cycle and exits
    running_ = false;
    if (watcher_) {
        watcher_->stop();
    }

    writer_.append(nickname_, kLeaveMessage);
    LOG_INFO("ChatNode: left " + log_.path());
}
