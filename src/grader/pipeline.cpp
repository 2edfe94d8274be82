#include "grader/pipeline.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "grader/comparator.hpp"
#include "grader/compiler.hpp"
#include "grader/source.hpp"

namespace bayview {
using namespace std;

grading_pipeline::grading_pipeline(const language_table &languages, runner &exec, const filesystem::path &run_dir, compare_mode mode)
    : languages(languages), exec(exec), run_dir(run_dir), mode(mode) {}

verdict grading_pipeline::judge(const submission_request &request) const {
    LOG(INFO) << "Received submission from user " << request.user_id << " for problem " << request.prob_id
              << " [" << get_language_tag(request.lang) << "]";

    elapsed_time timer;
    verdict result;
    try {
        result = judge_unchecked(request);
    } catch (materialization_error &ex) {
        LOG(WARNING) << "Unable to materialize submission of user " << request.user_id << ": " << ex.what();
        result = verdict::make_runtime_error(ex.what());
    } catch (compilation_error &ex) {
        result = verdict::make_compilation_error(ex.error_log);
    } catch (judge_exception &ex) {
        LOG(ERROR) << "Judging submission of user " << request.user_id << " failed" << endl << ex;
        result = verdict::make_runtime_error(ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Judging submission of user " << request.user_id << " failed, "
                   << boost::diagnostic_information(ex);
        result = verdict::make_runtime_error(ex.what());
    }

    LOG(INFO) << "Submission of user " << request.user_id << " for problem " << request.prob_id
              << ": " << get_display_message(result.status) << " (" << result.time << "ms), judged in "
              << timer.duration<chrono::milliseconds>().count() << "ms";
    return result;
}

verdict grading_pipeline::judge_unchecked(const submission_request &request) const {
    if (request.time_limit <= 0)
        throw invalid_request("Time limit should be a positive integer, got " + to_string(request.time_limit));

    const language_strategy &strategy = languages.get(request.lang);
    compilation_unit unit = materialize(request, strategy, run_dir);

    executable_artifact artifact;
    try {
        artifact = build(unit, strategy);
    } catch (compilation_error &ex) {
        LOG(INFO) << "Compilation of " << unit.token() << " failed: " << ex.what();
        throw;
    }
    LOG(INFO) << "Compiled " << unit.token();

    execution_result result = exec.run(artifact, request.input, chrono::seconds(request.time_limit));
    int elapsed = (int)result.elapsed.count();
    switch (result.outcome) {
        case execution_outcome::TIMED_OUT:
            LOG(INFO) << "Program " << unit.token() << " timed out after " << elapsed << "ms";
            return verdict::make_time_limit_exceeded(elapsed);
        case execution_outcome::OUTPUT_LIMIT_EXCEEDED:
            LOG(INFO) << "Program " << unit.token() << " exceeded output limit after " << elapsed << "ms";
            return verdict::make_runtime_error("Output limit exceeded", elapsed);
        case execution_outcome::FAILED_TO_START:
            LOG(WARNING) << "Program " << unit.token() << " failed to start: " << result.error;
            return verdict::make_runtime_error(result.error, elapsed);
        case execution_outcome::COMPLETED:
            break;
    }

    LOG(INFO) << "Program " << unit.token() << " exited with code " << result.exit_code << " in " << elapsed << "ms";
    if (compare_output(result.output, request.expected_output, mode) == status::ACCEPTED)
        return verdict::make_accepted(elapsed);
    else
        return verdict::make_wrong_answer(elapsed);
}

}  // namespace bayview
