// 连接生命周期状态、管理器错误类型、查询结果

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "domain/sql_value.hpp"

namespace domain {

// 连接状态机
//   Idle ──connect()──> Attempting ──成功──> Connected ──disconnect()──> Idle
//                           │
//                           └──重试耗尽──> Failed（锁存，之后不再改变）
enum class ConnectionStatus {
    Idle,
    Attempting,
    Connected,
    Failed
};

// 管理器返回给调用方的错误
enum class ManagerError {
    None,
    ConnectionFailed,   // 重试耗尽，连接错误已锁存（致命）
    CursorFailed,       // 游标创建失败（致命，不重试）
    QueryFailed         // 执行或取结果失败（可恢复）
};

inline std::string_view toString(ConnectionStatus status)
{
    switch (status) {
    case ConnectionStatus::Idle: return "Idle";
    case ConnectionStatus::Attempting: return "Attempting";
    case ConnectionStatus::Connected: return "Connected";
    case ConnectionStatus::Failed: return "Failed";
    }
    return "Unknown";
}

inline std::string_view toString(ManagerError error)
{
    switch (error) {
    case ManagerError::None: return "None";
    case ManagerError::ConnectionFailed: return "ConnectionFailed";
    case ManagerError::CursorFailed: return "CursorFailed";
    case ManagerError::QueryFailed: return "QueryFailed";
    }
    return "Unknown";
}

// 致命错误：由进程边界决定是否终止
inline bool isFatal(ManagerError error)
{
    return error == ManagerError::ConnectionFailed || error == ManagerError::CursorFailed;
}

// 一次查询的结构化结果（区分“成功但无行”和“失败”）
struct QueryOutcome {
    ManagerError error{ManagerError::None};
    std::string message;    // 失败原因（成功时为空）
    std::vector<TextRow> rows;

    bool ok() const { return error == ManagerError::None; }
    bool fatal() const { return isFatal(error); }
};

} // namespace domain
