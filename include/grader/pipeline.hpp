#pragma once

#include <filesystem>
#include "config.hpp"
#include "grader/language.hpp"
#include "grader/runner.hpp"
#include "grader/submission.hpp"
#include "grader/verdict.hpp"

namespace bayview {

/**
 * @brief 评测流程
 * 对一个评测请求依次执行：落地代码、编译、运行、比较输出，
 * 任何一个阶段失败都会直接产生最终的评测结果，后续阶段不再执行。
 *
 * judge 函数可以并发调用：每次评测使用独立的随机 token 和工作文件夹，
 * 不同评测之间不共享任何可变状态。
 */
struct grading_pipeline {
    /**
     * @param languages 语言配置，评测期间不得修改
     * @param exec 运行选手程序的方式，必须可以并发调用
     * @param run_dir 存放编译单元的根目录
     * @param mode 比较选手输出的方式
     */
    grading_pipeline(const language_table &languages, runner &exec,
                     const std::filesystem::path &run_dir, compare_mode mode = compare_mode::COLLAPSE);

    /**
     * @brief 评测一个提交
     * 不会抛出异常，所有的错误都会被转换为评测结果
     * @return 评测结果，每个请求恰好产生一个
     */
    verdict judge(const submission_request &request) const;

private:
    const language_table &languages;
    runner &exec;
    std::filesystem::path run_dir;
    compare_mode mode;

    verdict judge_unchecked(const submission_request &request) const;
};

}  // namespace bayview
