// 命令行入口：读取配置，连接数据库，执行参数里（或标准输入里）的 SQL，把结果输出到标准输出
//
// 用法：query_bridge [--config <path>] [<sql> ...]

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "app/query_runner.hpp"
#include "core/configuration.hpp"
#include "core/logger.hpp"
#include "infrastructure/database/mariadb_driver.hpp"
#include "services/connection_manager.hpp"

namespace {

constexpr const char* kDefaultConfigPath = "config/query_bridge.json";

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <path>] [<sql> ...]\n"
              << "Without SQL arguments, statements are read from stdin (one per line).\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = kDefaultConfigPath;
    std::vector<std::string> statements;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return EXIT_FAILURE;
            }
            configPath = argv[++i];
            continue;
        }
        statements.push_back(arg);
    }

    core::ConfigurationManager configManager(configPath);
    const auto& config = configManager.get();

    core::Logger::instance().configure(config.logging.level, config.logging.file, config.logging.console);

    infrastructure::database::MariaDbDriver driver(config.database.connectTimeoutSeconds);

    int failures = 0;
    {
        // 作用域结束时管理器析构，自动断开连接
        services::ConnectionManager manager(driver, config.database);
        LOG_DEBUG("bootstrap", manager.describe());

        app::QueryRunner runner(manager, std::cout);
        if (statements.empty()) {
            failures = runner.runScript(std::cin);
        } else {
            for (const auto& sql : statements) {
                if (!runner.run(sql)) {
                    ++failures;
                }
            }
        }
    }

    if (failures > 0) {
        LOG_ERROR("bootstrap", failures, " statement(s) failed");
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
