#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "grader/language.hpp"
#include "grader/source.hpp"

namespace bayview {

/**
 * @brief 可以直接运行的选手程序
 * 对于编译型语言是编译产物，对于解释型语言是解释器加源文件
 */
struct executable_artifact {
    /**
     * @brief 运行命令，已经展开所有占位符
     */
    std::vector<std::string> command;

    /**
     * @brief 运行时的工作路径
     */
    std::filesystem::path work_dir;
};

/**
 * @brief 编译选手程序
 * 编译器在编译单元的文件夹内运行，stdout 和 stderr 合并后作为编译信息。
 * 不需要编译的语言直接返回运行命令。
 * @param unit 已经落地的编译单元
 * @param strategy 语言的编译运行方式
 * @return 可以运行的选手程序
 * @throw compilation_error 编译器返回非 0、编译超时或编译器无法启动，
 * error_log 保存编译器的输出，保证非空
 */
executable_artifact build(const compilation_unit &unit, const language_strategy &strategy);

}  // namespace bayview
