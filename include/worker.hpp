#pragma once

#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "grader/pipeline.hpp"

/**
 * 评测 worker 相关函数
 * HTTP 服务端或命令行将评测任务推送到 task_queue 中，每个 worker 线程
 * 从队列中取出评测任务，执行评测流程，再通过任务的回调函数返回评测结果。
 * worker 的数量决定了同时运行的评测数量。
 */
namespace bayview {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 循环时会检查标记，
 * 如果停止，则在评测队列为空时退出。
 */
void stop_workers();

/**
 * @brief 启动评测 worker 线程
 * 启动 worker 会清除停止标记，之前调用过 stop_workers 的线程池可以重新启动。
 * @param worker_id worker 的编号，只用于记录日志
 * @param task_queue 评测任务队列
 * @param pipeline 评测流程，生命周期必须覆盖 worker 线程
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, concurrent_queue<message::judge_task> &task_queue, const grading_pipeline &pipeline);

}  // namespace bayview
