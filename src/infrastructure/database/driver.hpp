// 数据库驱动抽象（连接管理器只依赖这里的接口）
//
// DbDriver
//   │
//   └─ open()  ──> DbConnection（一次数据库会话）
//                     │
//                     ├─ cursor() ──> DbCursor（执行 SQL、取结果）
//                     └─ close()
//
// 所有失败都以 DriverError / InterfaceError 异常报告

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/sql_value.hpp"

namespace infrastructure::database {

// 通用驱动错误（服务端报错、SQL 错误等）
class DriverError : public std::runtime_error {
public:
    explicit DriverError(const std::string& message, unsigned int code = 0)
        : std::runtime_error(message), code_(code) {}

    // 驱动错误号（MySQL errno），未知时为 0
    unsigned int code() const noexcept { return code_; }

private:
    unsigned int code_;
};

// 接口 / 传输层错误（连不上、连接断开、句柄已关闭）
class InterfaceError : public DriverError {
public:
    using DriverError::DriverError;
};

// 连接参数
struct ConnectParams {
    std::string host;
    unsigned int port{3306};
    std::string user;
    std::string password;
    std::string database;
};

class DbCursor {
public:
    virtual ~DbCursor() = default;

    // 执行一条 SQL
    virtual void execute(const std::string& sql) = 0;

    // 取出上一次 execute 的全部结果行（没有结果集则返回空）
    virtual std::vector<domain::Row> fetchAll() = 0;
};

class DbConnection {
public:
    virtual ~DbConnection() = default;

    // 创建游标；游标不能比创建它的连接活得更久
    virtual std::unique_ptr<DbCursor> cursor() = 0;

    virtual void close() = 0;
};

class DbDriver {
public:
    virtual ~DbDriver() = default;

    virtual std::unique_ptr<DbConnection> open(const ConnectParams& params) = 0;
};

} // namespace infrastructure::database
