#pragma once

#include <string>

namespace bayview {

/**
 * @brief 评测系统支持的编程语言
 */
enum class language {
    C,
    CPP,
    JAVA,
    PYTHON
};

/**
 * @brief 获得编程语言的标识符，比如 "c++"、"java"
 */
const char *get_language_tag(language lang);

/**
 * @brief 根据标识符查找编程语言
 * 除了标准的标识符，还接受常见的别名，比如 "cpp"、"python3"
 * @param tag 编程语言标识符，不区分大小写
 * @throw invalid_request 不支持的编程语言
 */
language parse_language(const std::string &tag);

/**
 * @brief 源代码文本的编码方式
 */
enum class source_encoding {
    /**
     * @brief 源代码没有经过编码
     */
    PLAIN,

    /**
     * @brief 源代码经过标准 base64 编码，评测时由 materializer 解码
     */
    BASE64
};

/**
 * @brief 一次评测请求
 * 一个 submission_request 只会被一次评测使用，评测过程中不会被修改
 */
struct submission_request {
    /**
     * @brief 题目 id，只用于记录日志
     */
    std::string prob_id;

    /**
     * @brief 提交者 id，只用于记录日志
     */
    std::string user_id;

    /**
     * @brief 选手代码
     * 编码方式由 encoding 决定
     */
    std::string source;

    source_encoding encoding = source_encoding::PLAIN;

    language lang = language::CPP;

    /**
     * @brief 选手程序的标准输入
     */
    std::string input;

    /**
     * @brief 标准答案
     */
    std::string expected_output;

    /**
     * @brief 时间限制（秒），必须为正整数
     */
    int time_limit = 1;
};

}  // namespace bayview
