// 驱动边界上的单元格类型，以及统一转成字符串的规则

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace domain {

// 一个单元格的值
// monostate = SQL NULL
// DECIMAL、日期时间、字符串、二进制等都以文本形式到达
using SqlValue = std::variant<std::monostate, std::int64_t, std::uint64_t, double, std::string>;

using Row = std::vector<SqlValue>;  // 驱动返回的一行
using TextRow = std::vector<std::string>;   // 规范化之后的一行

// NULL 规范化后的文本
inline constexpr std::string_view kNullText = "None";

bool isNull(const SqlValue& value);

// 把任意单元格转成字符串：
//   NULL   -> "None"
//   整数   -> 十进制
//   浮点   -> 最短往返表示，整数值补 ".0"（3.5 -> "3.5"，2 -> "2.0"，1e16 -> "1e+16"）
//   文本   -> 原样
std::string toText(const SqlValue& value);

// 整行规范化
TextRow toTextRow(const Row& row);
std::vector<TextRow> toTextRows(const std::vector<Row>& rows);

// 日志里打印结果用：[(1, abc, None), (2, xyz, 3.5)]
std::string formatRows(const std::vector<TextRow>& rows);

} // namespace domain
