#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace bayview {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是系统调用失败（pipe、fork、poll），或者配置不正确
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法将选手代码落地为编译单元
 * 比如代码的 base64 编码不正确，或者写入文件失败（权限不足、磁盘已满）
 */
struct materialization_error : public judge_exception {
    materialization_error();
    explicit materialization_error(const std::string &message);
};

/**
 * @brief 表示选手程序编译错误
 * error_log 保存编译器的输出，将原样返回给选手
 */
struct compilation_error : public judge_exception {
    const std::string error_log;

    explicit compilation_error(const std::string &message, const std::string &error_log);
};

/**
 * @brief 表示无法启动子进程
 * 比如程序不存在、没有执行权限、工作路径不存在
 */
struct launch_error : public judge_exception {
    launch_error();
    explicit launch_error(const std::string &message);
};

/**
 * @brief 表示评测请求不合法
 * 比如缺少字段、不支持的语言、时间限制不是正整数
 */
struct invalid_request : public judge_exception {
    invalid_request();
    explicit invalid_request(const std::string &message);
};

}  // namespace bayview
