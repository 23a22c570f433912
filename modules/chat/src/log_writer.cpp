#include "log_writer.h"
#include "chat_record.h"
#include "text_utils.h"
#include "logger.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

LogWriter::LogWriter(const SharedLog& log) : log_(log) {}

void LogWriter::append(const std::string& author, const std::string& body) const {
    if (trim_copy(body).empty()) {
        return;
    }

    const std::string line = format_record(make_record(author, body));
    std::string error;
    if (!write_line(line, error)) {
        LOG_WARN("LogWriter: message dropped (" + error + ")");
    }
}

bool LogWriter::write_line(const std::string& line, std::string& error) const {
    int fd = ::open(log_.path().c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, SharedLog::kFileMode);
    if (fd < 0) {
        error = std::string("open: ") + std::strerror(errno);
        return false;
    }

    // Blocks while another process is appending
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno != EINTR) {
            error = std::string("flock: ") + std::strerror(errno);
            ::close(fd);
            return false;
        }
    }

    bool ok = true;
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::string("write: ") + std::strerror(errno);
            ok = false;
            break;
        }
        written += static_cast<size_t>(n);
    }

    if (ok && ::fsync(fd) != 0) {
        error = std::string("fsync: ") + std::strerror(errno);
        ok = false;
    }

    ::flock(fd, LOCK_UN);
    if (::close(fd) != 0 && ok) {
        error = std::string("close: ") + std::strerror(errno);
        ok = false;
    }
    return ok;
}
