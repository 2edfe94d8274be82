#pragma once

#include <string>

namespace bayview {

/**
 * @brief 将二进制数据编码为标准 base64（带 '=' 填充）
 */
std::string encode_base64(const std::string &binary);

/**
 * @brief 解码标准 base64 文本
 * 编码文本中的 '\r' 和 '\n' 会被忽略，其他非法字符、长度不是 4 的倍数、
 * 填充字符不在末尾等情况均视为编码错误
 * @param encoded base64 文本
 * @return 解码后的二进制数据
 * @throw std::invalid_argument 编码不正确
 */
std::string decode_base64(const std::string &encoded);

}  // namespace bayview
