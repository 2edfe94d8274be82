#include "grader/verdict.hpp"

namespace bayview {
using namespace std;

bool verdict::accepted() const {
    return status == status::ACCEPTED;
}

verdict verdict::make_accepted(int time) {
    verdict v;
    v.status = status::ACCEPTED;
    v.time = time;
    return v;
}

verdict verdict::make_wrong_answer(int time) {
    verdict v;
    v.status = status::WRONG_ANSWER;
    v.time = time;
    return v;
}

verdict verdict::make_compilation_error(const string &error_log) {
    verdict v;
    v.status = status::COMPILATION_ERROR;
    v.error_content = error_log;
    return v;
}

verdict verdict::make_time_limit_exceeded(int time) {
    verdict v;
    v.status = status::TIME_LIMIT_EXCEEDED;
    v.time = time;
    return v;
}

verdict verdict::make_runtime_error(const string &message, int time) {
    verdict v;
    v.status = status::RUNTIME_ERROR;
    v.other_error = true;
    v.error_content = message;
    v.time = time;
    return v;
}

ostream &operator<<(ostream &os, const verdict &v) {
    os << get_display_message(v.status) << " (" << v.time << "ms)";
    if (!v.error_content.empty())
        os << ": " << v.error_content;
    return os;
}

}  // namespace bayview
