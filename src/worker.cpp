#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <atomic>
#include <chrono>

namespace bayview {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop = false;

void stop_workers() {
    stop = true;
}

/**
 * @brief 评测 worker 线程函数
 * 从队列中读取评测任务，评测完成后调用任务的回调函数。
 * 评测流程不会抛出异常，回调函数抛出的异常会被记录并忽略，
 * 因此单个评测任务不会导致 worker 退出。
 */
static void worker_loop(size_t worker_id, concurrent_queue<message::judge_task> &task_queue, const grading_pipeline &pipeline) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        message::judge_task task;
        if (!task_queue.try_pop_for(task, chrono::milliseconds(100))) {
            if (stop) {
                // 停止时不再有新的评测任务，队列为空时自然退出 worker。
                break;
            }
            continue;
        }

        verdict result = pipeline.judge(task.request);

        if (task.callback) {
            try {
                task.callback(result);
            } catch (std::exception &ex) {
                LOG(ERROR) << "Worker " << worker_id << " failed to report verdict, " << boost::diagnostic_information(ex);
            }
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<message::judge_task> &task_queue, const grading_pipeline &pipeline) {
    stop = false;
    return thread([worker_id, &task_queue, &pipeline] {
        worker_loop(worker_id, task_queue, pipeline);
    });
}

}  // namespace bayview
