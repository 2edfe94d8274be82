#include "server/messages.hpp"
#include <cstdint>
#include <limits>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace bayview::server {
using namespace std;

/**
 * @brief 读取时间限制，必须是 [1, INT_MAX] 内的整数
 * 超出 int64 的无符号整数和负数一样直接拒绝，不做截断
 */
static int parse_time_limit(const nlohmann::json &j) {
    if (!j.count("timelimit") || !j.at("timelimit").is_number_integer())
        throw invalid_argument("timelimit should be an integer");
    auto &value = j.at("timelimit");
    if (value.is_number_unsigned()) {
        auto limit = value.get<uint64_t>();
        if (limit > (uint64_t)numeric_limits<int>::max())
            throw invalid_argument("timelimit is too large, got " + to_string(limit));
        return (int)limit;
    }
    auto limit = value.get<int64_t>();
    if (limit <= 0)
        throw invalid_argument("timelimit should be positive, got " + to_string(limit));
    if (limit > numeric_limits<int>::max())
        throw invalid_argument("timelimit is too large, got " + to_string(limit));
    return (int)limit;
}

submission_request request_from_json(const nlohmann::json &j) {
    if (!j.is_object()) throw invalid_request("Submission request should be a JSON object");

    submission_request request;
    try {
        request.prob_id = nlohmann::get_value<string>(j, "problemID");
        request.user_id = nlohmann::get_value<string>(j, "userID");
        request.source = nlohmann::get_value<string>(j, "inputCode");
        request.encoding = source_encoding::BASE64;
        request.lang = parse_language(nlohmann::get_value<string>(j, "lang"));
        request.input = nlohmann::get_value<string>(j, "input");
        request.expected_output = nlohmann::get_value<string>(j, "output");
        request.time_limit = parse_time_limit(j);
    } catch (invalid_argument &ex) {
        throw invalid_request(ex.what());
    }
    return request;
}

submission_request parse_request(const string &body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (nlohmann::json::parse_error &ex) {
        throw invalid_request(string("Malformed JSON: ") + ex.what());
    }
    return request_from_json(j);
}

nlohmann::json verdict_to_json(const verdict &v) {
    return {
        {"accepted", v.status == status::ACCEPTED},
        {"time", v.time},
        {"isCompileError", v.status == status::COMPILATION_ERROR},
        {"errorContent", v.error_content},
        {"isTLE", v.status == status::TIME_LIMIT_EXCEEDED},
        {"score", v.score},
        {"errorAt", v.error_at},
        {"otherError", v.other_error}};
}

}  // namespace bayview::server
