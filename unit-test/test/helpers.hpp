#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "grader/runner.hpp"
#include "grader/submission.hpp"

namespace bayview {

/**
 * @brief 测试使用的运行根目录
 */
std::filesystem::path test_run_dir();

/**
 * @brief 初始化测试环境，创建 RUN_DIR
 */
void setup_test_environment();

/**
 * @brief PATH 中是否有该程序，用于跳过缺少工具链的测试
 */
bool has_program(const std::string &program);

/**
 * @brief 运行根目录下的文件夹数量，用于检查评测结束后是否有残留
 */
std::size_t count_run_dir_entries();

submission_request make_request(language lang, const std::string &source, const std::string &input,
                                const std::string &expected, int time_limit = 1);

/**
 * @brief 记录调用次数的运行器，实际运行交给 process_runner
 */
struct counting_runner : public runner {
    int calls = 0;
    std::vector<executable_artifact> artifacts;

    execution_result run(const executable_artifact &artifact, const std::string &input,
                         std::chrono::seconds time_limit) override;

private:
    process_runner delegate;
};

}  // namespace bayview
