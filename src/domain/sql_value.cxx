#include "domain/sql_value.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <sstream>

namespace domain {
namespace {

// 与解释器 repr(float) 一致：最短往返的有效数字，
// 十进制指数在 [-4, 16) 内用定点写法（整数值补 ".0"），其余用科学计数法
std::string doubleToText(double value)
{
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    // 形如 "-1.2345e+17"、"1e-05"、"0e+00"
    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                   std::chars_format::scientific);
    if (ec != std::errc{}) {
        std::ostringstream oss;
        oss.precision(17);
        oss << value;
        return oss.str();
    }
    const std::string scientific(buf.data(), end);

    const auto ePos = scientific.find('e');
    int exponent = 0;
    std::from_chars(scientific.data() + ePos + (scientific[ePos + 1] == '+' ? 2 : 1),
                    scientific.data() + scientific.size(), exponent);
    if (exponent < -4 || exponent >= 16) {
        return scientific;
    }

    std::string sign;
    std::string digits;
    for (std::size_t i = 0; i < ePos; ++i) {
        const char c = scientific[i];
        if (c == '-') {
            sign = "-";
        } else if (c != '.') {
            digits += c;
        }
    }

    if (exponent < 0) {
        return sign + "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
    }
    const auto intDigits = static_cast<std::size_t>(exponent) + 1;
    if (digits.size() <= intDigits) {
        return sign + digits + std::string(intDigits - digits.size(), '0') + ".0";
    }
    return sign + digits.substr(0, intDigits) + "." + digits.substr(intDigits);
}

// std::visit 的重载辅助
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

bool isNull(const SqlValue& value)
{
    return std::holds_alternative<std::monostate>(value);
}

std::string toText(const SqlValue& value)
{
    return std::visit(overloaded{
        [](std::monostate) { return std::string(kNullText); },
        [](std::int64_t v) { return std::to_string(v); },
        [](std::uint64_t v) { return std::to_string(v); },
        [](double v) { return doubleToText(v); },
        [](const std::string& v) { return v; },
    }, value);
}

TextRow toTextRow(const Row& row)
{
    TextRow out;
    out.reserve(row.size());
    for (const auto& value : row) {
        out.push_back(toText(value));
    }
    return out;
}

std::vector<TextRow> toTextRows(const std::vector<Row>& rows)
{
    std::vector<TextRow> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(toTextRow(row));
    }
    return out;
}

std::string formatRows(const std::vector<TextRow>& rows)
{
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << '(';
        for (std::size_t j = 0; j < rows[i].size(); ++j) {
            if (j > 0) oss << ", ";
            oss << rows[i][j];
        }
        oss << ')';
    }
    oss << ']';
    return oss.str();
}

} // namespace domain
