#include "services/connection_manager.hpp"

#include <sstream>

#include "core/logger.hpp"

namespace services {

using domain::ConnectionStatus;
using domain::ManagerError;
using infrastructure::database::DriverError;
using infrastructure::database::InterfaceError;

ConnectionManager::ConnectionManager(infrastructure::database::DbDriver& driver,
                                     std::string dbName,
                                     std::string host,
                                     std::string username,
                                     std::string password,
                                     unsigned int port,
                                     std::optional<std::string> instance)
    : driver_(driver)
    , instance_(std::move(instance)) {
    params_.database = std::move(dbName);
    params_.host = std::move(host);
    params_.user = std::move(username);
    params_.password = std::move(password);
    params_.port = port;

    connect();
}

ConnectionManager::ConnectionManager(infrastructure::database::DbDriver& driver, const core::DatabaseConfig& cfg)
    : driver_(driver) {
    params_.database = cfg.schema;
    params_.host = cfg.host;
    params_.user = cfg.user;
    params_.password = cfg.password;
    params_.port = cfg.port;
    if (!cfg.instance.empty()) {
        instance_ = cfg.instance;
    }
    setMaxConnectionRetries(cfg.maxConnectionRetries);

    connect();
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

void ConnectionManager::setMaxConnectionRetries(int value) {
    // 上限为 1 表示一次都不尝试，再小没有意义
    maxConnectionRetries_ = value < 1 ? 1 : value;
}

void ConnectionManager::connect() {
    if (connection_ || status_ == ConnectionStatus::Failed) {
        return;
    }

    status_ = ConnectionStatus::Attempting;
    int retryCount = 1;

    while (true) {
        // 计数器到达上限就放弃，不再做任何网络 I/O
        if (retryCount >= maxConnectionRetries_) {
            LOG_ERROR("connection", "Max retry count exceeded. Terminating operation.");
            status_ = ConnectionStatus::Failed;
            return;
        }

        LOG_DEBUG("connection", "Connecting to ", params_.host, ":", params_.port, " | Attempt: ", retryCount);

        try {
            connection_ = driver_.open(params_);
            status_ = ConnectionStatus::Connected;
            LOG_DEBUG("connection", "Connection succeeded!");
            return;
        } catch (const InterfaceError& ex) {
            LOG_ERROR("connection", "Connection failed (interface): ", ex.what(), ". Retrying...");
        } catch (const DriverError& ex) {
            LOG_ERROR("connection", "Connection failed: ", ex.what(), ". Retrying...");
        }
        // 立即重试，不退避
        ++retryCount;
    }
}

ManagerError ConnectionManager::verifyConnection() {
    if (connectionError()) {
        return ManagerError::ConnectionFailed;
    }
    if (!connection_) {
        connect();
    }
    return connectionError() ? ManagerError::ConnectionFailed : ManagerError::None;
}

ManagerError ConnectionManager::verifyCursor() {
    if (cursor_) {
        return ManagerError::None;
    }
    if (!connection_) {
        LOG_ERROR("connection", "Cursor creation failed: no live connection");
        return ManagerError::CursorFailed;
    }

    try {
        cursor_ = connection_->cursor();
    } catch (const DriverError& ex) {
        LOG_ERROR("connection", "Cursor creation failed: ", ex.what());
        return ManagerError::CursorFailed;
    }
    return ManagerError::None;
}

domain::QueryOutcome ConnectionManager::tryExecuteQuery(const std::string& query) {
    domain::QueryOutcome outcome;

    outcome.error = verifyConnection();
    if (outcome.error != ManagerError::None) {
        outcome.message = "connection to " + params_.host + " is in a failed state";
        return outcome;
    }

    outcome.error = verifyCursor();
    if (outcome.error != ManagerError::None) {
        outcome.message = "cursor creation failed";
        return outcome;
    }

    try {
        cursor_->execute(query);
        outcome.rows = domain::toTextRows(cursor_->fetchAll());
    } catch (const DriverError& ex) {
        LOG_ERROR("query", "Failed to execute query: ", ex.what());
        outcome.error = ManagerError::QueryFailed;
        outcome.message = ex.what();
        outcome.rows.clear();
        return outcome;
    }

    LOG_INFO("query", query, " ->");
    if (outcome.rows.empty()) {
        LOG_DEBUG("query", "Query executed successfully.");
    } else {
        LOG_DEBUG("query", outcome.rows.size(), " row(s) | ", domain::formatRows(outcome.rows));
    }
    return outcome;
}

std::vector<domain::TextRow> ConnectionManager::executeQuery(const std::string& query) {
    auto outcome = tryExecuteQuery(query);
    if (outcome.fatal()) {
        LOG_CRITICAL("query", "Query not executed (", domain::toString(outcome.error), "): ", outcome.message);
    }
    return std::move(outcome.rows);
}

void ConnectionManager::disconnect() {
    if (!connection_) {
        return;
    }

    // 游标不能比连接活得久，先释放
    cursor_.reset();
    try {
        connection_->close();
        LOG_DEBUG("connection", "Disconnected from database.");
    } catch (const DriverError& ex) {
        LOG_ERROR("connection", "Disconnection process failed: ", ex.what());
    }
    connection_.reset();

    if (status_ == ConnectionStatus::Connected) {
        status_ = ConnectionStatus::Idle;
    }
}

std::string ConnectionManager::describe() const {
    std::ostringstream oss;
    oss << "ConnectionManager{db=" << params_.database
        << ", host=" << params_.host << ":" << params_.port
        << ", user=" << params_.user
        << ", password=" << (params_.password.empty() ? "" : "****")
        << ", instance=" << instance_.value_or("-")
        << ", status=" << domain::toString(status_)
        << ", cursor=" << (cursor_ ? "open" : "none")
        << "}";
    return oss.str();
}

} // namespace services
