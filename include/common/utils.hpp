#pragma once

#include <chrono>
#include <string>

namespace bayview {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成一个随机的 token，可以用于文件名和 Java 类名
 * 使用随机 uuid 而不是时间戳，避免并发评测时产生相同的文件名
 * @return 32 位小写十六进制字符串
 */
std::string random_token();

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace bayview
