#ifndef FILECHAT_LOG_WRITER_H
#define FILECHAT_LOG_WRITER_H

#include "shared_log.h"
#include <string>

/**
 * @brief Appends records to the SharedLog under an exclusive advisory lock.
 *
 * Each append opens the file, blocks in flock(LOCK_EX) until no other writer
 * holds it, writes one whole line, fsyncs, unlocks and closes. The order of
 * records in the file is the order in which writers obtained the lock.
 *
 * Failures are logged and dropped: callers get no result and nothing retries.
 */
class LogWriter {
public:
    explicit LogWriter(const SharedLog& log);

    // No-op if body is empty after trimming
    void append(const std::string& author, const std::string& body) const;

private:
    bool write_line(const std::string& line, std::string& error) const;

    const SharedLog& log_;
};

#endif // FILECHAT_LOG_WRITER_H
