#pragma once

#include <cstdint>
#include <string>

#include "core/logger.hpp"

namespace core {

// 数据库配置
struct DatabaseConfig {
    std::string host = "127.0.0.1";
    std::string user = "root";
    std::string password = "password";
    std::string schema = "testdb";  // 数据库名称
    uint16_t port = 3306;
    std::string instance;   // 实例标签，仅用于日志和描述，不参与连接
    uint16_t maxConnectionRetries = 5;  // 计数器到达该值即放弃（实际尝试 max - 1 次）
    uint16_t connectTimeoutSeconds = 10;    // 单次建连超时，0 表示使用驱动默认值
};

// 日志配置
struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::string file;   // 为空则不写文件
    bool console = true;
};

// 聚合所有配置
struct Configuration {
    DatabaseConfig database;
    LoggingConfig logging;
};

// 配置管理器
class ConfigurationManager {
public:
    // 加载配置文件，文件不存在时生成默认模板
    explicit ConfigurationManager(std::string path);

    const Configuration& get() const { return config_; }
    const std::string& path() const { return path_; }

    // 从 JSON 文本解析配置（缺失的字段保留默认值，解析失败返回全部默认值）
    static Configuration fromJson(const std::string& jsonText);

    // 默认配置模板
    static std::string defaultJson();

private:
    void loadFromDisk();

    Configuration config_;
    std::string path_;
};

} // namespace core
