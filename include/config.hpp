#pragma once

#include <cstddef>
#include <filesystem>

namespace bayview {

/**
 * @brief 评测结果比较方式
 */
enum class compare_mode {
    /**
     * @brief 删除所有的空格、换行符和回车符后精确比较
     * 默认的比较方式，"1 2" 和 "12" 被认为是相同的输出
     */
    COLLAPSE,

    /**
     * @brief 按空白字符切分成 token 后逐个比较
     * 比 COLLAPSE 严格：不会把 "1 2" 和 "12" 认为是相同的输出
     */
    TOKENS
};

/**
 * @brief 选手程序编译及运行的根目录
 * 未指定时由 main 设置为系统临时文件夹下的 bayview 文件夹。
 * 每次评测都会在这里创建一个以随机 token 命名的临时文件夹，
 * 评测结束后（无论评测结果如何）该文件夹都会被删除。
 *
 * RUN_DIR
 * ├── 3f2a...e91c // 随机生成的 token
 * │   ├── 3f2a...e91c.cpp // 选手程序的代码
 * │   └── 3f2a...e91c // 编译生成的可执行文件
 * ├── 0b7d...41aa
 * │   ├── C0b7d...41aa.java // Java 程序的主类被重命名为 C<token>
 * │   └── C0b7d...41aa.class
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 编译器的运行时间限制（秒）
 * 为 0 时表示不限制编译时间
 */
extern int COMPILE_TIME_LIMIT;

/**
 * @brief 判断选手输出是否正确的比较方式
 */
extern compare_mode COMPARE_MODE;

/**
 * @brief 选手程序 stderr 最多保存多少字节，超出部分被丢弃
 * stderr 只用于记录日志，不参与评测
 */
extern std::size_t STDERR_LIMIT;

/**
 * @brief 选手程序 stdout 最多允许输出多少字节，为 0 时不限制
 * 超出限制时选手程序被立刻杀死，评测结果为运行错误
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 选手程序退出后，继续读取其进程组遗留输出的最长时间（毫秒）
 */
extern int KILL_GRACE_MS;

}  // namespace bayview
