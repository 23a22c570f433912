#include "chat_record.h"

std::string clock_time(std::time_t t) {
    std::tm tm_{};
    localtime_r(&t, &tm_);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm_);
    return std::string(buffer);
}

std::string clock_time_now() {
    return clock_time(std::time(nullptr));
}

std::string strip_line_breaks(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '\n' && c != '\r') out.push_back(c);
    }
    return out;
}

ChatRecord make_record(const std::string& author, const std::string& body) {
    ChatRecord r;
    r.timestamp = clock_time_now();
    r.author = strip_line_breaks(author);
    r.body = strip_line_breaks(body);
    return r;
}

std::string format_record(const ChatRecord& record) {
    std::string line;
    line.reserve(record.author.size() + record.body.size() + 16);
    line += '[';
    line += record.timestamp;
    line += "] <";
    line += strip_line_breaks(record.author);
    line += "> ";
    line += strip_line_breaks(record.body);
    line += '\n';
    return line;
}

bool parse_record(const std::string& line, ChatRecord& out) {
    std::string s = line;
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();

    // "[HH:MM:SS] <" is 12 bytes
    if (s.size() < 14 || s[0] != '[' || s[9] != ']' || s[10] != ' ' || s[11] != '<') {
        return false;
    }
    for (size_t i = 1; i < 9; ++i) {
        const bool colon = (i == 3 || i == 6);
        if (colon ? s[i] != ':' : (s[i] < '0' || s[i] > '9')) return false;
    }

    // An author containing "> " is ambiguous; the first occurrence wins.
    size_t close = s.find("> ", 12);
    if (close == std::string::npos) {
        if (s.size() >= 13 && s.back() == '>') {
            // Empty body
            close = s.size() - 1;
        } else {
            return false;
        }
    }

    out.timestamp = s.substr(1, 8);
    out.author = s.substr(12, close - 12);
    out.body = (close + 2 <= s.size()) ? s.substr(close + 2) : std::string();
    return true;
}
