#include "grader/runner.hpp"
#include <glog/logging.h>
#include "config.hpp"

namespace bayview {
using namespace std;

runner::~runner() = default;

execution_result process_runner::run(const executable_artifact &artifact, const string &input, chrono::seconds time_limit) {
    process_options opt;
    opt.command = artifact.command;
    opt.work_dir = artifact.work_dir;
    opt.stderr_limit = STDERR_LIMIT;
    opt.output_limit = OUTPUT_LIMIT;

    execution_result result = run_process(opt, input, time_limit);
    if (!result.error_output.empty())
        VLOG(1) << "Program " << artifact.command[0] << " wrote to stderr: " << result.error_output;
    return result;
}

}  // namespace bayview
