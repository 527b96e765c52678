// ConnectionManager（单个数据库连接的生命周期管理）
//
// 负责：
//   构造时立即连接（有限次重试，失败后锁存错误状态）
//   第一次查询时创建游标，之后复用
//   执行 SQL 并把所有单元格转成字符串
//   析构时断开连接（RAII，任何退出路径都会执行）
//
// 单线程使用，不做内部加锁

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/configuration.hpp"
#include "domain/connection_state.hpp"
#include "domain/sql_value.hpp"
#include "infrastructure/database/driver.hpp"

namespace services {

class ConnectionManager {
public:
    // 计数器到达该值时放弃连接（所以实际只会尝试 kMaxConnectionRetries - 1 次）
    static constexpr int kMaxConnectionRetries = 5;
    static constexpr unsigned int kDefaultPort = 3306;

    // driver 由调用方持有，必须比管理器活得久
    ConnectionManager(infrastructure::database::DbDriver& driver,
                      std::string dbName,
                      std::string host,
                      std::string username,
                      std::string password,
                      unsigned int port = kDefaultPort,
                      std::optional<std::string> instance = std::nullopt);

    // 从配置文件的数据库段构造（包括重试上限）
    ConnectionManager(infrastructure::database::DbDriver& driver, const core::DatabaseConfig& cfg);

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;
    ConnectionManager(ConnectionManager&&) = delete;
    ConnectionManager& operator=(ConnectionManager&&) = delete;

    // 建立连接；已连接或已锁存失败时什么也不做，失败不抛异常
    void connect();

    // 锁存了连接错误 -> ConnectionFailed（不做任何 I/O）
    // 没有连接 -> connect()
    domain::ManagerError verifyConnection();

    // 没有游标则创建；创建失败 -> CursorFailed（不重试）
    domain::ManagerError verifyCursor();

    // 执行查询，返回字符串化的行
    // 空结果和执行失败都返回空数组，需要区分时用 tryExecuteQuery
    std::vector<domain::TextRow> executeQuery(const std::string& query);

    // 执行查询，返回结构化结果
    domain::QueryOutcome tryExecuteQuery(const std::string& query);

    // 断开连接；关闭出错只记日志，可重复调用
    void disconnect();

    domain::ConnectionStatus status() const { return status_; }
    bool connectionError() const { return status_ == domain::ConnectionStatus::Failed; }
    bool isConnected() const { return connection_ != nullptr; }
    bool hasCursor() const { return cursor_ != nullptr; }
    int maxConnectionRetries() const { return maxConnectionRetries_; }
    const std::optional<std::string>& instance() const { return instance_; }

    // 目标和状态的一行描述（密码打码）
    std::string describe() const;

private:
    void setMaxConnectionRetries(int value);

    infrastructure::database::DbDriver& driver_;
    infrastructure::database::ConnectParams params_;
    std::optional<std::string> instance_;
    int maxConnectionRetries_{kMaxConnectionRetries};

    // 声明顺序保证析构时游标先于连接释放
    std::unique_ptr<infrastructure::database::DbConnection> connection_;
    std::unique_ptr<infrastructure::database::DbCursor> cursor_;
    domain::ConnectionStatus status_{domain::ConnectionStatus::Idle};
};

} // namespace services
