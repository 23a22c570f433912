#ifndef FILECHAT_CHAT_RECORD_H
#define FILECHAT_CHAT_RECORD_H

#include <ctime>
#include <string>

// One chat line: "[HH:MM:SS] <author> body\n"
struct ChatRecord {
    std::string timestamp;  // HH:MM:SS, cosmetic only
    std::string author;
    std::string body;
};

// Local wall-clock time as HH:MM:SS
std::string clock_time_now();
std::string clock_time(std::time_t t);

// Removes CR and LF so a record never spans lines
std::string strip_line_breaks(const std::string& s);

ChatRecord make_record(const std::string& author, const std::string& body);

// Serialized form, including the trailing newline
std::string format_record(const ChatRecord& record);

/**
 * @brief Splits a log line (with or without trailing newline) into its fields.
 * @return false for lines that are not chat records, such as the header line.
 */
bool parse_record(const std::string& line, ChatRecord& out);

#endif // FILECHAT_CHAT_RECORD_H
