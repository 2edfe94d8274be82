#include "test/helpers.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "config.hpp"

namespace bayview {
using namespace std;

filesystem::path test_run_dir() {
    return filesystem::temp_directory_path() / "bayview-test" / "run";
}

void setup_test_environment() {
    RUN_DIR = test_run_dir();
    filesystem::create_directories(RUN_DIR);
    CHECK(filesystem::is_directory(RUN_DIR))
        << "Run directory " << RUN_DIR << " does not exist";
}

bool has_program(const string &program) {
    return find_program(program).has_value();
}

size_t count_run_dir_entries() {
    return distance(filesystem::directory_iterator(test_run_dir()), filesystem::directory_iterator());
}

submission_request make_request(language lang, const string &source, const string &input, const string &expected, int time_limit) {
    submission_request request;
    request.prob_id = "1001";
    request.user_id = "tester";
    request.source = source;
    request.lang = lang;
    request.input = input;
    request.expected_output = expected;
    request.time_limit = time_limit;
    return request;
}

execution_result counting_runner::run(const executable_artifact &artifact, const string &input, chrono::seconds time_limit) {
    ++calls;
    artifacts.push_back(artifact);
    return delegate.run(artifact, input, time_limit);
}

}  // namespace bayview
