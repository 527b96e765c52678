#include "infrastructure/database/mariadb_driver.hpp"

#include <mariadb/errmsg.h>

#include <charconv>

#include "core/logger.hpp"

namespace infrastructure::database {
namespace {

// 2000~2999 是客户端错误号（连不上、连接断开、协议错误），归为接口错误
[[noreturn]] void throwFromHandle(MYSQL* handle, const std::string& where) {
    const unsigned int code = mysql_errno(handle);
    std::string message = where + ": " + mysql_error(handle);
    if (code >= CR_MIN_ERROR && code <= CR_MAX_ERROR) {
        throw InterfaceError(message, code);
    }
    throw DriverError(message, code);
}

bool isIntegerType(enum_field_types type) {
    switch (type) {
    case MYSQL_TYPE_TINY:
    case MYSQL_TYPE_SHORT:
    case MYSQL_TYPE_LONG:
    case MYSQL_TYPE_INT24:
    case MYSQL_TYPE_LONGLONG:
    case MYSQL_TYPE_YEAR:
        return true;
    default:
        return false;
    }
}

bool isFloatingType(enum_field_types type) {
    return type == MYSQL_TYPE_FLOAT || type == MYSQL_TYPE_DOUBLE;
}

} // namespace

domain::SqlValue convertField(const MYSQL_FIELD& field, const char* data, unsigned long length) {
    if (data == nullptr) {
        return std::monostate{};
    }

    const char* end = data + length;
    if (isIntegerType(field.type)) {
        if (field.flags & UNSIGNED_FLAG) {
            std::uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(data, end, value);
            if (ec == std::errc{} && ptr == end) {
                return value;
            }
        } else {
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(data, end, value);
            if (ec == std::errc{} && ptr == end) {
                return value;
            }
        }
    } else if (isFloatingType(field.type)) {
        // 服务端总是用 '.' 作小数点，不能受进程 locale 影响
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(data, end, value);
        if (ec == std::errc{} && ptr == end) {
            return value;
        }
    }

    // DECIMAL、日期时间、字符串、二进制，以及无法解析的数值，原样保留文本
    return std::string(data, length);
}

// ---------------- MariaDbCursor ----------------

MariaDbCursor::MariaDbCursor(MYSQL* handle) : handle_(handle) {}

MariaDbCursor::~MariaDbCursor() {
    releaseResult();
}

void MariaDbCursor::releaseResult() {
    if (pending_ != nullptr) {
        mysql_free_result(pending_);
        pending_ = nullptr;
    }
}

void MariaDbCursor::execute(const std::string& sql) {
    // 上一次没取走的结果必须先释放，否则连接会报 "Commands out of sync"
    releaseResult();

    if (mysql_real_query(handle_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        throwFromHandle(handle_, "mysql_real_query");
    }

    // 必须在 mysql_real_query 成功后立即调用
    pending_ = mysql_store_result(handle_);
    if (pending_ == nullptr && mysql_field_count(handle_) != 0) {
        // 本应有结果集却拿不到
        throwFromHandle(handle_, "mysql_store_result");
    }
    // pending_ 为空且列数为 0：INSERT / UPDATE 等没有结果集的语句
}

std::vector<domain::Row> MariaDbCursor::fetchAll() {
    std::vector<domain::Row> rows;
    if (pending_ == nullptr) {
        return rows;
    }

    const unsigned int columns = mysql_num_fields(pending_);
    const MYSQL_FIELD* fields = mysql_fetch_fields(pending_);
    rows.reserve(static_cast<std::size_t>(mysql_num_rows(pending_)));

    MYSQL_ROW raw;
    while ((raw = mysql_fetch_row(pending_)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(pending_);
        domain::Row row;
        row.reserve(columns);
        for (unsigned int i = 0; i < columns; ++i) {
            row.push_back(convertField(fields[i], raw[i], lengths[i]));
        }
        rows.push_back(std::move(row));
    }

    releaseResult();
    return rows;
}

// ---------------- MariaDbConnection ----------------

MariaDbConnection::MariaDbConnection(MYSQL* handle) : handle_(handle) {}

// 确保连接被关闭，避免资源泄漏
MariaDbConnection::~MariaDbConnection() {
    close();
}

std::unique_ptr<DbCursor> MariaDbConnection::cursor() {
    if (handle_ == nullptr) {
        throw InterfaceError("cursor(): connection is closed", CR_SERVER_LOST);
    }
    return std::make_unique<MariaDbCursor>(handle_);
}

void MariaDbConnection::close() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

// ---------------- MariaDbDriver ----------------

MariaDbDriver::MariaDbDriver(unsigned int connectTimeoutSeconds)
    : connectTimeoutSeconds_(connectTimeoutSeconds) {}

std::unique_ptr<DbConnection> MariaDbDriver::open(const ConnectParams& params) {
    // 这一步不会建立真实连接，只是初始化结构体
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        throw InterfaceError("mysql_init() failed", CR_OUT_OF_MEMORY);
    }

    if (connectTimeoutSeconds_ > 0) {
        unsigned int timeout = connectTimeoutSeconds_;
        if (mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &timeout) != 0) {
            LOG_WARN("mariadb", "Could not set connect timeout, using driver default");
        }
    }

    MYSQL* result = mysql_real_connect(
        handle,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.c_str(),
        params.port,
        nullptr,
        0);

    if (result == nullptr) {
        const unsigned int code = mysql_errno(handle);
        std::string message = std::string("mysql_real_connect: ") + mysql_error(handle);
        mysql_close(handle);
        if (code >= CR_MIN_ERROR && code <= CR_MAX_ERROR) {
            throw InterfaceError(message, code);
        }
        throw DriverError(message, code);
    }

    LOG_DEBUG("mariadb", "Session opened to ", params.host, ":", params.port, "/", params.database);
    return std::make_unique<MariaDbConnection>(handle);
}

} // namespace infrastructure::database
