#pragma once

#include <ostream>
#include <string>
#include "common/status.hpp"

namespace bayview {

/**
 * @brief 一次评测的最终结果
 * 每个 submission_request 恰好产生一个 verdict
 */
struct verdict {
    bayview::status status = bayview::status::RUNTIME_ERROR;

    /**
     * @brief 是否是评测系统或运行环境的错误
     * 只有 RUNTIME_ERROR 会设置该标记
     */
    bool other_error = false;

    /**
     * @brief 诊断信息
     * 编译错误时为编译器输出，运行错误时为错误原因
     */
    std::string error_content;

    /**
     * @brief 用户程序的运行时间（毫秒）
     * 没有运行用户程序时为 0
     */
    int time = 0;

    /**
     * @brief 分数，目前总是 0
     */
    int score = 0;

    /**
     * @brief 出错的测试点，目前总是 0
     */
    int error_at = 0;

    bool accepted() const;

    static verdict make_accepted(int time);
    static verdict make_wrong_answer(int time);
    static verdict make_compilation_error(const std::string &error_log);
    static verdict make_time_limit_exceeded(int time);
    static verdict make_runtime_error(const std::string &message, int time = 0);
};

std::ostream &operator<<(std::ostream &os, const verdict &v);

}  // namespace bayview
