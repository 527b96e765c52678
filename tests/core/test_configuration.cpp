#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/configuration.hpp"

namespace fs = std::filesystem;

namespace {

// 每个用例一个临时目录
class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("query_bridge_cfg_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        core::Logger::instance().configure(core::LogLevel::Critical, "", false);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
        core::Logger::instance().configure(core::LogLevel::Info, "", true);
    }

    std::string write(const std::string& name, const std::string& text) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << text;
        return path.string();
    }

    fs::path dir_;
};

} // namespace

TEST_F(ConfigurationTest, ParsesDatabaseAndLogging) {
    auto cfg = core::ConfigurationManager::fromJson(R"({
        "database": {"host": "db.internal", "user": "svc", "password": "pw",
                     "schema": "orders", "port": 3307, "instance": "eu-1",
                     "maxConnectionRetries": 8, "connectTimeoutSeconds": 3},
        "logging": {"level": "debug", "file": "logs/q.log", "console": false}
    })");

    EXPECT_EQ(cfg.database.host, "db.internal");
    EXPECT_EQ(cfg.database.user, "svc");
    EXPECT_EQ(cfg.database.password, "pw");
    EXPECT_EQ(cfg.database.schema, "orders");
    EXPECT_EQ(cfg.database.port, 3307);
    EXPECT_EQ(cfg.database.instance, "eu-1");
    EXPECT_EQ(cfg.database.maxConnectionRetries, 8);
    EXPECT_EQ(cfg.database.connectTimeoutSeconds, 3);
    EXPECT_EQ(cfg.logging.level, core::LogLevel::Debug);
    EXPECT_EQ(cfg.logging.file, "logs/q.log");
    EXPECT_FALSE(cfg.logging.console);
}

TEST_F(ConfigurationTest, MissingKeysKeepDefaults) {
    auto cfg = core::ConfigurationManager::fromJson(R"({"database": {"host": "only-host"}})");

    core::Configuration defaults;
    EXPECT_EQ(cfg.database.host, "only-host");
    EXPECT_EQ(cfg.database.port, 3306);
    EXPECT_EQ(cfg.database.schema, defaults.database.schema);
    EXPECT_EQ(cfg.database.maxConnectionRetries, 5);
    EXPECT_EQ(cfg.logging.level, core::LogLevel::Info);
    EXPECT_TRUE(cfg.logging.console);
}

TEST_F(ConfigurationTest, UnknownLogLevelKeepsDefault) {
    auto cfg = core::ConfigurationManager::fromJson(R"({"logging": {"level": "chatty"}})");
    EXPECT_EQ(cfg.logging.level, core::LogLevel::Info);
}

TEST_F(ConfigurationTest, MalformedJsonFallsBackToDefaults) {
    auto cfg = core::ConfigurationManager::fromJson("{ not json");
    EXPECT_EQ(cfg.database.host, "127.0.0.1");
    EXPECT_EQ(cfg.database.port, 3306);
}

TEST_F(ConfigurationTest, MissingFileWritesTemplate) {
    auto path = (dir_ / "nested" / "query_bridge.json").string();

    core::ConfigurationManager manager(path);

    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(manager.get().database.port, 3306);

    // 生成的模板可以被再次读取
    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    auto reparsed = core::ConfigurationManager::fromJson(text.str());
    EXPECT_EQ(reparsed.database.host, "127.0.0.1");
    EXPECT_EQ(reparsed.database.maxConnectionRetries, 5);
}

TEST_F(ConfigurationTest, LoadsFromDisk) {
    auto path = write("cfg.json", R"({"database": {"host": "from-disk", "port": 3310}})");

    core::ConfigurationManager manager(path);

    EXPECT_EQ(manager.get().database.host, "from-disk");
    EXPECT_EQ(manager.get().database.port, 3310);
}

TEST_F(ConfigurationTest, OutOfRangeNumbersKeepDefaults) {
    auto cfg = core::ConfigurationManager::fromJson(R"({
        "database": {"host": "db.internal", "port": 70000,
                     "maxConnectionRetries": -1, "connectTimeoutSeconds": 65536}
    })");

    EXPECT_EQ(cfg.database.host, "db.internal");
    EXPECT_EQ(cfg.database.port, 3306);
    EXPECT_EQ(cfg.database.maxConnectionRetries, 5);
    EXPECT_EQ(cfg.database.connectTimeoutSeconds, 10);
}

TEST_F(ConfigurationTest, BoundaryNumbersAreAccepted) {
    auto cfg = core::ConfigurationManager::fromJson(R"({
        "database": {"port": 65535, "maxConnectionRetries": 1, "connectTimeoutSeconds": 0}
    })");

    EXPECT_EQ(cfg.database.port, 65535);
    EXPECT_EQ(cfg.database.maxConnectionRetries, 1);
    EXPECT_EQ(cfg.database.connectTimeoutSeconds, 0);
}

TEST_F(ConfigurationTest, ZeroPortAndWrongTypesKeepDefaults) {
    auto cfg = core::ConfigurationManager::fromJson(R"({
        "database": {"port": 0, "maxConnectionRetries": "many", "connectTimeoutSeconds": 2.5}
    })");

    EXPECT_EQ(cfg.database.port, 3306);
    EXPECT_EQ(cfg.database.maxConnectionRetries, 5);
    EXPECT_EQ(cfg.database.connectTimeoutSeconds, 10);
}
