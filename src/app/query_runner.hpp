// QueryRunner（进程边界：执行查询、输出结果、致命错误时终止进程）

#pragma once

#include <functional>
#include <istream>
#include <ostream>
#include <string>

#include "domain/connection_state.hpp"
#include "services/connection_manager.hpp"

namespace app {

class QueryRunner {
public:
    // 终止函数，默认 std::exit
    using TerminateFn = std::function<void(int)>;

    static constexpr int kFatalExitCode = 1;

    QueryRunner(services::ConnectionManager& manager, std::ostream& out);
    QueryRunner(services::ConnectionManager& manager, std::ostream& out, TerminateFn terminate);

    // 执行一条语句，成功返回 true
    // 连接错误已锁存或游标创建失败时先断开连接，再调用终止函数（退出码 1）
    bool run(const std::string& sql);

    // 逐行执行脚本（跳过空行和 "--" 注释行），返回失败的语句数
    int runScript(std::istream& in);

private:
    void printRows(const std::vector<domain::TextRow>& rows);

    services::ConnectionManager& manager_;
    std::ostream& out_;
    TerminateFn terminate_;
};

} // namespace app
