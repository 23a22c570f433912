#include "config_manager.h"
#include "logger.h"
#include <algorithm>
#include <fstream>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            LOG_WARN("Failed to open config file: " + config_path);
            return false;
        }
        json loaded;
        config_file >> loaded;
        if (!loaded.is_object()) {
            LOG_WARN("Config root is not an object: " + config_path);
            return false;
        }
        m_config = std::move(loaded);
        LOG_INFO("Configuration loaded from: " + config_path);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Config loading failed: ") + e.what());
        return false;
    }
}

bool ConfigManager::setValueAtPath(std::initializer_list<std::string> path, const json& value) {
    if (path.size() == 0) {
        return false;
    }
    json* node = &m_config;
    auto last = path.end() - 1;
    for (auto it = path.begin(); it != last; ++it) {
        if (!node->is_object()) {
            return false;
        }
        json& child = (*node)[*it];
        if (child.is_null()) {
            child = json::object();
        }
        node = &child;
    }
    if (!node->is_object()) {
        return false;
    }
    (*node)[*last] = value;
    return true;
}

void ConfigManager::reset() {
    m_config = json::object();
}

json ConfigManager::section(const char* name) const {
    auto it = m_config.find(name);
    if (it == m_config.end() || !it->is_object()) {
        return json::object();
    }
    return *it;
}

// A key of the wrong type is reported and replaced by the default
template <typename T>
T ConfigManager::lookup(const char* section_name, const char* key, const T& fallback) const {
    try {
        return section(section_name).value(key, fallback);
    } catch (const json::exception& e) {
        LOG_WARN(std::string("Config ") + section_name + "." + key + " ignored: " + e.what());
        return fallback;
    }
}

std::string ConfigManager::getChatLogPath() const {
    return lookup("chat", "log_file_path", std::string(kDefaultChatLogPath));
}

double ConfigManager::getPollIntervalSec() const {
    double v = lookup("chat", "poll_interval_sec", kDefaultPollIntervalSec);
    return std::min(60.0, std::max(0.05, v));
}

int ConfigManager::getMaxHistoryLines() const {
    return std::max(1, lookup("chat", "max_history_lines", kDefaultMaxHistoryLines));
}

int ConfigManager::getMaxNicknameBytes() const {
    return std::max(1, lookup("chat", "max_nickname_bytes", kDefaultMaxNicknameBytes));
}

std::string ConfigManager::getLogLevel() const {
    return lookup("logging", "level", std::string("none"));
}

std::string ConfigManager::getLogFilePath() const {
    return lookup("logging", "file_path", std::string());
}

bool ConfigManager::isAsyncLogging() const {
    return lookup("logging", "async", false);
}
