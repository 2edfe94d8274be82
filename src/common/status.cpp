#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace bayview {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

}  // namespace bayview
