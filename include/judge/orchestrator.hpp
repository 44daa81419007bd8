#pragma once

#include <cstddef>
#include <vector>
#include "judge/harness.hpp"
#include "judge/submission.hpp"
#include "language/language.hpp"
#include "sandbox/sandbox.hpp"

namespace codegrade {

struct orchestrator_options {
    /**
     * @brief Limits of the compiler run, independent of the problem limits.
     */
    resource_limits compile_limits{10, 512};

    /**
     * @brief Largest limits a problem may ask for, larger ones are invalid input.
     */
    resource_limits max_limits{60, 1 << 16};

    /**
     * @brief Seconds of sandbox bookkeeping budgeted per test case.
     */
    double run_overhead = 0.5;

    /**
     * @brief Seconds added once to the overall deadline.
     */
    double slack = 5;

    /**
     * @brief Seconds a program may run past its time limit before it is killed.
     * Must match the sandbox, so that the deadline never fires before the
     * sandbox kills a program itself.
     */
    double wall_grace = 1;

    /**
     * @brief Largest accepted source code in bytes.
     */
    std::size_t max_code_size = 1 << 20;

    harness_options harness;
};

/**
 * @brief Judges submissions from validation to the final report.
 *
 * A submission is compiled once, then its artifact is run against every
 * test case and the verdicts are scored. Judging as a whole is bounded by a
 * deadline derived from the limits and the number of test cases; when the
 * deadline passes, or the caller cancels, outstanding runs are killed and
 * the report becomes a SYSTEM_ERROR.
 *
 * Neither the sandbox nor the registry is owned, both must outlive the
 * orchestrator. judge may be called from several threads at once.
 */
struct submission_orchestrator {
    submission_orchestrator(sandbox &box, const language_registry &languages, orchestrator_options options = {});

    /**
     * @param cases the test cases of the problem, may be empty, in which
     *        case the sample of the problem is judged as test case 0
     * @throw invalid_input if the submission or the limits are rejected,
     *        before any program ran. Limits must be positive and within
     *        max_limits.
     */
    judge_report judge(const submission &submit,
                       const problem &prob,
                       const std::vector<test_case> &cases,
                       const cancellation_token &token = cancellation_token());

    /**
     * @brief Seconds judging n test cases under limits may take at most.
     */
    double deadline_seconds(const resource_limits &limits, std::size_t n) const;

    const orchestrator_options &options() const;

private:
    const language &validate(const submission &submit, const problem &prob) const;

    sandbox &box;
    const language_registry &languages;
    orchestrator_options opts;
};

/**
 * @brief The test cases to judge: cases, or the sample of prob as test case 0
 * if there is none.
 */
std::vector<test_case> resolve_test_cases(const problem &prob, const std::vector<test_case> &cases);

}  // namespace codegrade
