#pragma once

#include <string>
#include "common/status.hpp"
#include "config.hpp"

namespace bayview {

/**
 * @brief 删除文本中所有的空格、'\n' 和 '\r'
 * 制表符等其他空白字符保持不变
 */
std::string normalize_output(const std::string &text);

/**
 * @brief 比较选手输出与标准答案
 * @param actual 选手程序的输出
 * @param expected 标准答案
 * @param mode 比较方式
 * @return ACCEPTED 或 WRONG_ANSWER
 */
status compare_output(const std::string &actual, const std::string &expected, compare_mode mode = compare_mode::COLLAPSE);

}  // namespace bayview
