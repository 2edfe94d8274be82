#include "grader/compiler.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <optional>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "grader/process.hpp"

namespace bayview {
using namespace std;

executable_artifact build(const compilation_unit &unit, const language_strategy &strategy) {
    executable_artifact artifact{unit.expand(strategy.run_command), unit.directory()};
    if (!strategy.has_build_step()) return artifact;

    process_options opt;
    opt.command = unit.expand(strategy.build_command);
    opt.work_dir = unit.directory();
    opt.merge_stderr = true;

    optional<chrono::milliseconds> time_limit;
    if (COMPILE_TIME_LIMIT > 0) time_limit = chrono::seconds(COMPILE_TIME_LIMIT);

    VLOG(1) << "Compiling " << unit.token() << ": " << boost::algorithm::join(opt.command, " ");
    execution_result result = run_process(opt, "", time_limit);

    switch (result.outcome) {
        case execution_outcome::FAILED_TO_START:
            throw compilation_error("Compiler failed to start",
                                    fmt::format("Unable to start compiler {}: {}", opt.command[0], result.error));
        case execution_outcome::TIMED_OUT:
            throw compilation_error("Compilation timed out",
                                    fmt::format("Compilation exceeded time limit of {} seconds", COMPILE_TIME_LIMIT));
        case execution_outcome::OUTPUT_LIMIT_EXCEEDED:
        case execution_outcome::COMPLETED:
            break;
    }

    if (result.exit_code != 0) {
        string error_log = result.output;
        if (error_log.empty()) {
            if (result.signal)
                error_log = fmt::format("Compiler {} was killed by signal {}", opt.command[0], result.signal);
            else
                error_log = fmt::format("Compiler {} exited with code {}", opt.command[0], result.exit_code);
        }
        throw compilation_error("Compilation failed", error_log);
    }

    if (!result.output.empty())
        VLOG(1) << "Compiler output of " << unit.token() << ": " << result.output;
    return artifact;
}

}  // namespace bayview
