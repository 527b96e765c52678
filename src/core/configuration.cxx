#include "core/configuration.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace core {
namespace {

// 读取 16 位无符号字段；类型不对或超出 [minimum, 65535] 时告警并保留默认值
uint16_t readUint16(const nlohmann::json& section, const char* key, uint16_t fallback, int64_t minimum) {
    auto it = section.find(key);
    if (it == section.end()) {
        return fallback;
    }
    if (it->is_number_unsigned() && it->get<uint64_t>() <= std::numeric_limits<uint16_t>::max()) {
        const auto value = it->get<uint64_t>();
        if (static_cast<int64_t>(value) >= minimum) {
            return static_cast<uint16_t>(value);
        }
    } else if (it->is_number_integer() && !it->is_number_unsigned()) {
        const auto value = it->get<int64_t>();
        if (value >= minimum && value <= std::numeric_limits<uint16_t>::max()) {
            return static_cast<uint16_t>(value);
        }
    }
    LOG_WARN("config", "Invalid value for '", key, "': ", it->dump(), ", keeping ", fallback);
    return fallback;
}

} // namespace

ConfigurationManager::ConfigurationManager(std::string path)
    : config_()
    , path_(std::move(path)) {
    loadFromDisk();
}

void ConfigurationManager::loadFromDisk() {
    std::ifstream in(path_);

    if (!in.good()) {
        // 文件不存在：写出默认模板，本次使用默认值
        std::error_code ec;
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        std::ofstream out(path_);
        out << defaultJson();
        out.close();
        LOG_WARN("config", "Configuration file missing. A default template was created at ", path_);
        config_ = Configuration{};
        return;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    config_ = fromJson(buffer.str());
}

Configuration ConfigurationManager::fromJson(const std::string& jsonText) {
    Configuration cfg;
    try {
        auto json = nlohmann::json::parse(jsonText);

        if (auto it = json.find("database"); it != json.end()) {
            cfg.database.host = it->value("host", cfg.database.host);
            cfg.database.user = it->value("user", cfg.database.user);
            cfg.database.password = it->value("password", cfg.database.password);
            cfg.database.schema = it->value("schema", cfg.database.schema);
            cfg.database.port = readUint16(*it, "port", cfg.database.port, 1);
            cfg.database.instance = it->value("instance", cfg.database.instance);
            cfg.database.maxConnectionRetries = readUint16(*it, "maxConnectionRetries", cfg.database.maxConnectionRetries, 1);
            cfg.database.connectTimeoutSeconds = readUint16(*it, "connectTimeoutSeconds", cfg.database.connectTimeoutSeconds, 0);
        }

        if (auto it = json.find("logging"); it != json.end()) {
            const auto levelText = it->value("level", std::string(levelToString(cfg.logging.level)));
            if (auto level = parseLogLevel(levelText)) {
                cfg.logging.level = *level;
            } else {
                LOG_WARN("config", "Unknown log level '", levelText, "', keeping ", levelToString(cfg.logging.level));
            }
            cfg.logging.file = it->value("file", cfg.logging.file);
            cfg.logging.console = it->value("console", cfg.logging.console);
        }

    } catch (const std::exception& ex) {
        LOG_ERROR("config", "Failed to parse configuration. Using defaults. Error: ", ex.what());
        return Configuration{};
    }
    return cfg;
}

std::string ConfigurationManager::defaultJson() {
    nlohmann::json json{
        {"database",
         {{"host", "127.0.0.1"},
          {"user", "root"},
          {"password", "password"},
          {"schema", "testdb"},
          {"port", 3306},
          {"instance", ""},
          {"maxConnectionRetries", 5},
          {"connectTimeoutSeconds", 10}}},
        {"logging",
         {{"level", "info"},
          {"file", ""},
          {"console", true}}}
    };

    return json.dump(4);
}

} // namespace core
