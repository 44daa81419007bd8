#include "judge/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/compilation.hpp"
#include "judge/scorer.hpp"

namespace codegrade {
using namespace std;

static bool valid_limits(const resource_limits &limits) {
    return isfinite(limits.time_limit) && limits.time_limit > 0 && limits.memory_limit > 0;
}

static bool within(const resource_limits &limits, const resource_limits &max) {
    return limits.time_limit <= max.time_limit && limits.memory_limit <= max.memory_limit;
}

vector<test_case> resolve_test_cases(const problem &prob, const vector<test_case> &cases) {
    if (!cases.empty()) return cases;

    test_case sample;
    sample.id = 0;
    sample.input = prob.sample_input;
    sample.expected_output = prob.sample_output;
    return {sample};
}

submission_orchestrator::submission_orchestrator(sandbox &box, const language_registry &languages, orchestrator_options options)
    : box(box), languages(languages), opts(move(options)) {
    if (!valid_limits(opts.compile_limits))
        throw invalid_argument("compile limits must be positive");
    if (!valid_limits(opts.max_limits) || !within(opts.max_limits, sandbox_max_limits()))
        throw invalid_argument("largest problem limits must be positive and supported by the sandbox");
}

const orchestrator_options &submission_orchestrator::options() const {
    return opts;
}

double submission_orchestrator::deadline_seconds(const resource_limits &limits, size_t n) const {
    return opts.compile_limits.time_limit + n * (limits.time_limit + opts.wall_grace + opts.run_overhead) + opts.slack;
}

const language &submission_orchestrator::validate(const submission &submit, const problem &prob) const {
    if (boost::algorithm::trim_copy(submit.code).empty())
        throw invalid_input("code must not be empty");
    if (submit.code.size() > opts.max_code_size)
        throw invalid_input(fmt::format("code is {} bytes, at most {} bytes are accepted", submit.code.size(), opts.max_code_size));

    const language *lang = languages.find(submit.language);
    if (!lang)
        throw invalid_input(fmt::format("unsupported language \"{}\", supported languages are {}",
                                        submit.language, boost::algorithm::join(languages.names(), ", ")));

    if (!valid_limits(prob.limits))
        throw invalid_input(fmt::format("limits must be positive, got time limit {} and memory limit {}",
                                        prob.limits.time_limit, prob.limits.memory_limit));
    if (!within(prob.limits, opts.max_limits))
        throw invalid_input(fmt::format("limits must be at most {} seconds and {} MB, got time limit {} and memory limit {}",
                                        opts.max_limits.time_limit, opts.max_limits.memory_limit,
                                        prob.limits.time_limit, prob.limits.memory_limit));
    return *lang;
}

judge_report submission_orchestrator::judge(const submission &submit,
                                            const problem &prob,
                                            const vector<test_case> &cases,
                                            const cancellation_token &token) {
    const language &lang = validate(submit, prob);
    vector<test_case> effective = resolve_test_cases(prob, cases);

    elapsed_time timer;
    double budget = deadline_seconds(prob.limits, effective.size());
    auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(budget));
    cancellation_token judging = token.with_deadline(deadline, fmt::format("judging exceeded the overall deadline of {} seconds", budget));

    judge_report report;
    compilation_result compiled = compile_submission(box, lang, submit.code, opts.compile_limits, judging);
    if (compiled.kind == outcome_kind::COMPILE_FAILED) {
        report = compile_error_report(compiled.diagnostic);
    } else if (compiled.kind != outcome_kind::SUCCESS) {
        // nothing can run, but every test case still gets its verdict
        vector<verdict> verdicts;
        for (auto &tc : effective)
            verdicts.push_back(system_error_verdict(tc, compiled.diagnostic));
        report = summarize(move(verdicts));
    } else {
        test_harness harness(box, opts.harness);
        report = summarize(harness.judge(*compiled.artifact, effective, prob.limits, judging));
    }

    if (judging.cancelled() && report.status == status::SYSTEM_ERROR)
        report.runtime_error = judging.reason();

    LOG(INFO) << "Judged " << lang.name << " submission against " << effective.size() << " test cases: "
              << get_display_message(report.status) << ", score " << report.score
              << " in " << timer.duration<chrono::milliseconds>().count() << "ms";
    return report;
}

}  // namespace codegrade
