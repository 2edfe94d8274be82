#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "grader/language.hpp"
#include "grader/submission.hpp"

namespace bayview {

/**
 * @brief 一次评测的编译单元
 * 独占 RUN_DIR/<token> 文件夹，析构时删除该文件夹及其中的所有文件
 * （源代码、编译产物、Java 的 .class 文件）。
 * 因此只要编译单元的生命周期覆盖了编译和运行，评测结束后就不会残留文件。
 */
struct compilation_unit {
    compilation_unit(const std::filesystem::path &dir, const std::string &token,
                     const std::string &source_name, const std::string &entry_point);
    compilation_unit(compilation_unit &&other) noexcept;
    compilation_unit(const compilation_unit &) = delete;
    ~compilation_unit();

    compilation_unit &operator=(const compilation_unit &) = delete;

    const std::string &token() const;

    /**
     * @brief 本次评测的工作路径，编译和运行都在这里进行
     */
    const std::filesystem::path &directory() const;

    /**
     * @brief 源代码文件名（不含路径）
     */
    const std::string &source_name() const;

    std::filesystem::path source_path() const;

    /**
     * @brief 入口点名称，即可执行文件名或 Java 主类名
     */
    const std::string &entry_point() const;

    /**
     * @brief 展开命令模板中的 {token}、{entry}、{source}、{workdir} 占位符
     * @throw internal_error 模板格式不正确或使用了未知的占位符
     */
    std::string expand(const std::string &pattern) const;

    std::vector<std::string> expand(const std::vector<std::string> &command) const;

private:
    std::filesystem::path dir;
    std::string token_, source_name_, entry_point_;
};

/**
 * @brief 将选手代码落地为编译单元
 * 1. 生成随机 token，创建 run_dir/<token> 文件夹；
 * 2. 如果代码经过 base64 编码，解码得到源代码；
 * 3. 如果语言需要重命名入口点（Java），对源代码做文本替换；
 * 4. 将源代码写入文件。
 * 任何一步失败时，已经创建的文件夹都会被删除。
 * @param request 评测请求
 * @param strategy 评测请求的语言的编译运行方式
 * @param run_dir 存放编译单元的根目录
 * @throw materialization_error 代码编码不正确，或者无法创建文件夹、写入文件
 */
compilation_unit materialize(const submission_request &request, const language_strategy &strategy,
                             const std::filesystem::path &run_dir);

}  // namespace bayview
