#pragma once

#include <nlohmann/json.hpp>
#include "grader/submission.hpp"
#include "grader/verdict.hpp"

/**
 * 评测请求与评测结果的 JSON 格式
 *
 * 评测请求：
 * @code{.json}
 * {
 *     "problemID": "1001",
 *     "userID": "alice",
 *     "inputCode": "I2luY2x1ZGUg...", // base64 编码的选手代码
 *     "lang": "c++", // c, c++, java, python
 *     "input": "1 2\n",
 *     "output": "3\n",
 *     "timelimit": 2 // 秒
 * }
 * @endcode
 *
 * 评测结果：
 * @code{.json}
 * {
 *     "accepted": false,
 *     "time": 0, // 毫秒
 *     "isCompileError": true,
 *     "errorContent": "a.cpp:1:1: error: ...",
 *     "isTLE": false,
 *     "score": 0,
 *     "errorAt": 0,
 *     "otherError": false
 * }
 * @endcode
 */
namespace bayview::server {

/**
 * @brief 从 JSON 中读取评测请求
 * 选手代码保持 base64 编码，由评测流程解码
 * @throw invalid_request 缺少字段、字段类型不正确、语言不支持或时间限制不是正整数
 */
submission_request request_from_json(const nlohmann::json &j);

/**
 * @brief 从 JSON 文本中读取评测请求
 * @throw invalid_request JSON 格式不正确，或者评测请求不合法
 */
submission_request parse_request(const std::string &body);

nlohmann::json verdict_to_json(const verdict &v);

}  // namespace bayview::server
