#pragma once

#include <functional>
#include "grader/submission.hpp"
#include "grader/verdict.hpp"

namespace bayview::message {

/**
 * @brief 发送给 worker 的评测任务
 */
struct judge_task {
    submission_request request;

    /**
     * @brief 评测完成后在 worker 线程中调用
     * 回调函数需要自行将结果转交给其他线程，比如通过 asio::post 发回连接所在的线程
     */
    std::function<void(const verdict &)> callback;
};

}  // namespace bayview::message
