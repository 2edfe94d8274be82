#pragma once

#include <chrono>
#include <string>
#include "grader/compiler.hpp"
#include "grader/process.hpp"

namespace bayview {

/**
 * @brief 运行选手程序的方式
 * 评测流程只依赖于该接口，以便在测试中替换为模拟实现，
 * 或者接入沙箱等其他运行方式。
 */
struct runner {
    /**
     * @brief 运行选手程序
     * 将 input 全部写入程序的 stdin，收集程序在时间限制内的全部 stdout。
     * 超时后程序及其创建的所有进程都会被杀死。
     * @param artifact 选手程序
     * @param input 程序的标准输入
     * @param time_limit 时钟时间限制
     * @return 运行结果
     */
    virtual execution_result run(const executable_artifact &artifact, const std::string &input,
                                 std::chrono::seconds time_limit) = 0;

    virtual ~runner();
};

/**
 * @brief 直接以子进程的方式运行选手程序
 * 不限制内存、不隔离文件系统，只限制时钟时间
 */
struct process_runner : public runner {
    execution_result run(const executable_artifact &artifact, const std::string &input,
                         std::chrono::seconds time_limit) override;
};

}  // namespace bayview
