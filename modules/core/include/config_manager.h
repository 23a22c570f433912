#ifndef FILECHAT_CONFIG_MANAGER_H
#define FILECHAT_CONFIG_MANAGER_H

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <initializer_list>

using json = nlohmann::json;

class ConfigManager {
public:
    static ConfigManager& getInstance();

    // Returns false (and keeps the defaults) if the file is missing or invalid
    bool loadConfig(const std::string& config_path);

    // Sets a value at a nested path, creating intermediate objects.
    bool setValueAtPath(std::initializer_list<std::string> path, const json& value);

    // Drops every loaded value so the getters return their defaults
    void reset();

    // Chat
    std::string getChatLogPath() const;
    double getPollIntervalSec() const;
    int getMaxHistoryLines() const;
    int getMaxNicknameBytes() const;

    // Logging
    std::string getLogLevel() const;
    std::string getLogFilePath() const;
    bool isAsyncLogging() const;

    static constexpr const char* kDefaultChatLogPath = "/home/chat/chat_history.log";
    static constexpr double kDefaultPollIntervalSec = 0.5;
    static constexpr int kDefaultMaxHistoryLines = 100;
    static constexpr int kDefaultMaxNicknameBytes = 60;

private:
    ConfigManager() = default;
    json section(const char* name) const;
    template <typename T>
    T lookup(const char* section_name, const char* key, const T& fallback) const;

    json m_config = json::object();
};

#endif // FILECHAT_CONFIG_MANAGER_H
