#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "grader/submission.hpp"

namespace bayview {

/**
 * @brief 入口点重命名规则
 * 比如 Java 要求 public class 的类名与文件名一致，为了避免并发评测时
 * 文件名冲突，我们把 "class Main" 替换为 "class C<token>"。
 * 替换是纯文本替换，不检查语法：代码中没有 placeholder 时什么也不做，
 * 错误将在编译或运行时暴露出来。
 */
struct entry_point_rewrite {
    std::string placeholder;

    /**
     * @brief 替换后的文本，可以使用命令模板中的占位符
     */
    std::string replacement;
};

/**
 * @brief 一种编程语言的编译及运行方式
 *
 * 命令模板中可以使用以下占位符：
 * {token}: 本次评测的随机 token
 * {entry}: 入口点名称（可执行文件名或 Java 主类名）
 * {source}: 源代码文件名（相对于工作路径）
 * {workdir}: 本次评测的工作路径（绝对路径）
 */
struct language_strategy {
    language lang;

    /**
     * @brief 源代码文件名模板，比如 "{token}.cpp"
     */
    std::string source_file;

    /**
     * @brief 入口点名称模板，比如 "C{token}"
     */
    std::string entry_point;

    /**
     * @brief 编译命令模板，为空表示该语言不需要编译（解释型语言）
     */
    std::vector<std::string> build_command;

    /**
     * @brief 运行命令模板
     */
    std::vector<std::string> run_command;

    std::optional<entry_point_rewrite> rewrite;

    bool has_build_step() const;
};

/**
 * @brief 所有编程语言的编译及运行方式
 * 新增语言只需要在这里添加一条 language_strategy，评测流程的各个阶段都不需要修改
 */
struct language_table {
    /**
     * @brief 构造包含默认配置的语言表
     * c/c++ 使用 gcc/g++，java 使用 javac/java，python 使用 python3
     */
    language_table();

    const language_strategy &get(language lang) const;

    void set(const language_strategy &strategy);

    /**
     * @brief 替换编译命令中的编译器
     */
    void set_build_program(language lang, const std::string &program);

    /**
     * @brief 替换运行命令中的程序，比如解释器
     */
    void set_run_program(language lang, const std::string &program);

    /**
     * @brief 从 JSON 配置中覆盖语言配置
     * @code{.json}
     * {
     *     "c++": {
     *         "build": ["g++", "-O2", "-std=c++17", "{source}", "-o", "{entry}"],
     *         "run": ["{workdir}/{entry}"]
     *     },
     *     "python": { "run": ["pypy3", "{source}"] }
     * }
     * @endcode
     * @throw invalid_request 配置格式不正确或语言不支持
     */
    void load(const nlohmann::json &config);

    void load(const std::filesystem::path &config_file);

private:
    std::map<language, language_strategy> strategies;
};

}  // namespace bayview
