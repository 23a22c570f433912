#include "shared_log.h"
#include "text_utils.h"
#include "logger.h"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

SharedLog::SharedLog(std::string path) : path_(std::move(path)) {}

std::string SharedLog::header_line() {
    std::time_t t = std::time(nullptr);
    std::tm tm_{};
    localtime_r(&t, &tm_);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_);
    return std::string("[System] Chat room created at ") + buffer + "\n";
}

BootstrapResult SharedLog::bootstrap() const {
    BootstrapResult result;

    // O_EXCL decides which of several simultaneously starting clients writes the header
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND | O_CLOEXEC, kFileMode);
    if (fd < 0) {
        int err = errno;
        if (err == EEXIST) {
            if (::access(path_.c_str(), R_OK | W_OK) != 0) {
                // Still usable read-only: appends fail quietly later
                LOG_WARN("SharedLog: " + path_ + " is not writable: " + std::strerror(errno));
            }
            result.status = BootstrapStatus::Ready;
            return result;
        }
        result.status = (err == EACCES || err == EPERM || err == EROFS)
            ? BootstrapStatus::PermissionDenied
            : BootstrapStatus::Failed;
        result.error = std::strerror(err);
        return result;
    }

    // Independent of the creator's umask
    if (::fchmod(fd, kFileMode) != 0) {
        LOG_WARN("SharedLog: fchmod failed for " + path_ + ": " + std::strerror(errno));
    }

    const std::string header = header_line();
    bool ok = false;
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno != EINTR) break;
    }
    ssize_t n = ::write(fd, header.data(), header.size());
    if (n == static_cast<ssize_t>(header.size()) && ::fsync(fd) == 0) {
        ok = true;
    } else {
        result.error = std::strerror(errno);
    }
    ::flock(fd, LOCK_UN);
    ::close(fd);

    if (!ok) {
        result.status = BootstrapStatus::Failed;
        return result;
    }
    LOG_INFO("SharedLog: created " + path_);
    result.status = BootstrapStatus::Created;
    return result;
}

bool SharedLog::ensure_exists() const {
    struct stat st;
    if (::stat(path_.c_str(), &st) == 0) {
        return true;
    }
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, kFileMode);
    if (fd < 0) {
        LOG_DEBUG("SharedLog: cannot recreate " + path_ + ": " + std::strerror(errno));
        return false;
    }
    ::close(fd);
    LOG_INFO("SharedLog: recreated missing " + path_);
    return true;
}

std::optional<FileStamp> SharedLog::modification_time() const {
    struct stat st;
    if (::stat(path_.c_str(), &st) != 0) {
        return std::nullopt;
    }
    FileStamp stamp;
    stamp.sec = static_cast<int64_t>(st.st_mtim.tv_sec);
    stamp.nsec = static_cast<int64_t>(st.st_mtim.tv_nsec);
    return stamp;
}

std::vector<std::string> SharedLog::read_lines() const {
    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + path_ + ": " + std::strerror(errno));
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(utf8_sanitize(line));
    }
    if (in.bad()) {
        throw std::runtime_error("read error on " + path_);
    }
    return lines;
}

std::vector<std::string> SharedLog::tail(std::vector<std::string> lines, size_t max_lines) {
    if (lines.size() > max_lines) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(max_lines));
    }
    return lines;
}

std::vector<std::string> SharedLog::read_tail(size_t max_lines) const {
    return tail(read_lines(), max_lines);
}
