#pragma once

namespace bayview {

/**
 * @brief 表示一次提交的评测结果
 */
enum class status {
    /**
     * @brief 用户程序通过评测
     * 比较时会忽略所有的空格、换行和回车，因此空白字符不匹配时也会返回 AC。
     */
    ACCEPTED = 0,

    /**
     * @brief 用户程序编译错误
     * 用户程序无法通过编译，或者编译器无法启动
     */
    COMPILATION_ERROR = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * 只比较时钟时间
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 答案错误
     */
    WRONG_ANSWER = 3,

    /**
     * @brief 用户程序无法运行，或者评测系统内部出错
     * 比如解释器不存在、代码编码错误、无法写入临时文件
     */
    RUNTIME_ERROR = 4
};

const char *get_display_message(status);

}  // namespace bayview
