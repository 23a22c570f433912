#ifndef FILECHAT_SHARED_LOG_H
#define FILECHAT_SHARED_LOG_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Modification time with nanosecond resolution, compared for equality only
struct FileStamp {
    int64_t sec = 0;
    int64_t nsec = 0;

    bool operator==(const FileStamp& other) const { return sec == other.sec && nsec == other.nsec; }
    bool operator!=(const FileStamp& other) const { return !(*this == other); }
};

enum class BootstrapStatus {
    Ready,             // file already existed
    Created,           // created with the header line
    PermissionDenied,
    Failed
};

struct BootstrapResult {
    BootstrapStatus status = BootstrapStatus::Failed;
    std::string error;
};

/**
 * @brief The append-only chat file shared by every client process.
 *
 * Writes go through LogWriter under an exclusive flock(). Reads take no lock;
 * readers rely on the modification time to notice new records.
 */
class SharedLog {
public:
    explicit SharedLog(std::string path);

    const std::string& path() const { return path_; }

    /**
     * @brief Startup creation. Creates the file with a header line and mode
     * 0666 if it does not exist; reports permission problems to the caller.
     */
    BootstrapResult bootstrap() const;

    // Creates an empty file if it has been removed. Returns false on failure.
    bool ensure_exists() const;

    std::optional<FileStamp> modification_time() const;

    /**
     * @brief Reads every line (without line terminators). Malformed UTF-8 is
     * replaced with U+FFFD. Throws std::runtime_error if the file cannot be read.
     */
    std::vector<std::string> read_lines() const;

    // Last max_lines lines of the file, in file order
    std::vector<std::string> read_tail(size_t max_lines) const;

    static std::vector<std::string> tail(std::vector<std::string> lines, size_t max_lines);

    // First line written by bootstrap()
    static std::string header_line();

    static constexpr unsigned kFileMode = 0666;

private:
    std::string path_;
};

#endif // FILECHAT_SHARED_LOG_H
