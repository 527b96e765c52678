#include "app/query_runner.hpp"

#include <cstdlib>

#include "core/logger.hpp"

namespace app {
namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

QueryRunner::QueryRunner(services::ConnectionManager& manager, std::ostream& out)
    : QueryRunner(manager, out, [](int code) { std::exit(code); }) {}

QueryRunner::QueryRunner(services::ConnectionManager& manager, std::ostream& out, TerminateFn terminate)
    : manager_(manager)
    , out_(out)
    , terminate_(std::move(terminate)) {}

bool QueryRunner::run(const std::string& sql) {
    auto outcome = manager_.tryExecuteQuery(sql);

    if (outcome.fatal()) {
        LOG_CRITICAL("runner", domain::toString(outcome.error), ": ", outcome.message, ". Exiting.");
        out_.flush();
        // std::exit 不展开栈，管理器的析构不会执行，退出前主动断开
        manager_.disconnect();
        terminate_(kFatalExitCode);
        return false;   // 只有注入的终止函数会返回到这里
    }
    if (!outcome.ok()) {
        return false;
    }

    printRows(outcome.rows);
    return true;
}

int QueryRunner::runScript(std::istream& in) {
    int failures = 0;
    std::string line;
    while (std::getline(in, line)) {
        const std::string sql = trim(line);
        if (sql.empty() || sql.rfind("--", 0) == 0) {
            continue;
        }
        if (!run(sql)) {
            ++failures;
        }
    }
    return failures;
}

// 每行一条记录，列之间用制表符分隔
void QueryRunner::printRows(const std::vector<domain::TextRow>& rows) {
    for (const auto& row : rows) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out_ << '\t';
            out_ << row[i];
        }
        out_ << '\n';
    }
    out_.flush();
}

} // namespace app
