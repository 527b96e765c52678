// MariaDB Connector/C 驱动实现

#pragma once

#include <mariadb/mysql.h>
#include <memory>
#include <string>
#include <vector>

#include "infrastructure/database/driver.hpp"

// mysql API 基础概念
// MYSQL* handle
//   ├─ mysql_init()          创建句柄
//   ├─ mysql_real_connect()  建立真实连接
//   ├─ mysql_real_query()    执行 SQL
//   ├─ mysql_store_result()  把结果集完整拉到客户端
//   └─ mysql_close()         关闭连接
//
// MYSQL_RES* 结果集
//   ├─ mysql_fetch_fields()  列元信息（类型、UNSIGNED 标志）
//   ├─ mysql_fetch_row()     逐行读取（char** 数组，NULL 列为 nullptr）
//   ├─ mysql_fetch_lengths() 每列的字节长度（二进制安全）
//   └─ mysql_free_result()   释放

namespace infrastructure::database {

class MariaDbCursor : public DbCursor {
public:
    // handle 归 MariaDbConnection 所有，这里只借用
    explicit MariaDbCursor(MYSQL* handle);
    ~MariaDbCursor() override;

    MariaDbCursor(const MariaDbCursor&) = delete;
    MariaDbCursor& operator=(const MariaDbCursor&) = delete;

    void execute(const std::string& sql) override;
    std::vector<domain::Row> fetchAll() override;

private:
    void releaseResult();

    MYSQL* handle_{nullptr};
    MYSQL_RES* pending_{nullptr};   // 上一次 execute 留下的结果集
};

class MariaDbConnection : public DbConnection {
public:
    explicit MariaDbConnection(MYSQL* handle);
    ~MariaDbConnection() override;

    MariaDbConnection(const MariaDbConnection&) = delete;
    MariaDbConnection& operator=(const MariaDbConnection&) = delete;

    std::unique_ptr<DbCursor> cursor() override;
    void close() override;

    bool isOpen() const { return handle_ != nullptr; }

private:
    MYSQL* handle_{nullptr};
};

class MariaDbDriver : public DbDriver {
public:
    // connectTimeoutSeconds 为 0 时使用驱动默认值
    explicit MariaDbDriver(unsigned int connectTimeoutSeconds = 0);

    std::unique_ptr<DbConnection> open(const ConnectParams& params) override;

private:
    unsigned int connectTimeoutSeconds_{0};
};

// 把结果集中的一个单元格按列类型转换成 SqlValue（data 为 nullptr 表示 NULL）
domain::SqlValue convertField(const MYSQL_FIELD& field, const char* data, unsigned long length);

} // namespace infrastructure::database
