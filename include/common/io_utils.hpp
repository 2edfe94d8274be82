#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace bayview {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将内容写入文件，文件已存在时覆盖
 * @param path 文件路径
 * @param content 文件内容，按字节原样写入
 * @throw std::system_error 打开或写入文件失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 在 PATH 环境变量中查找可执行文件
 * @param program 程序名，如果包含 '/' 则直接检查该路径
 * @return 可执行文件路径，找不到时返回空
 */
std::optional<std::filesystem::path> find_program(const std::string &program);

}  // namespace bayview
