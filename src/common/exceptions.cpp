#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace bayview {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

materialization_error::materialization_error()
    : judge_exception() {}

materialization_error::materialization_error(const string &message)
    : judge_exception(message) {}

compilation_error::compilation_error(const string &message, const string &error_log)
    : judge_exception(message), error_log(error_log) {}

launch_error::launch_error()
    : judge_exception() {}

launch_error::launch_error(const string &message)
    : judge_exception(message) {}

invalid_request::invalid_request()
    : judge_exception() {}

invalid_request::invalid_request(const string &message)
    : judge_exception(message) {}

}  // namespace bayview
