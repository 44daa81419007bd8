#pragma once

#include <cstddef>
#include <vector>
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"

namespace codegrade {

struct harness_options {
    /**
     * @brief Test cases of one submission run at the same time.
     * 1 judges them one after another. Each run still gets its own
     * scratch directory, and a slot_pool keeps the global ceiling.
     */
    std::size_t parallelism = 1;
};

/**
 * @brief Runs a compiled program against every test case.
 *
 * Judging never stops early: every test case gets a verdict, in test case
 * order, whatever happened to the others. A failure while judging one test
 * case only turns that verdict into a SYSTEM_ERROR. Once the token fires,
 * test cases not started yet get a SYSTEM_ERROR verdict with its reason.
 */
struct test_harness {
    explicit test_harness(sandbox &box, harness_options options = {});

    std::vector<verdict> judge(const compiled_artifact &artifact,
                               const std::vector<test_case> &cases,
                               const resource_limits &limits,
                               const cancellation_token &token);

    /**
     * @brief Judge one test case, failures of the sandbox included.
     */
    verdict judge_one(const compiled_artifact &artifact,
                      const test_case &tc,
                      const resource_limits &limits,
                      const cancellation_token &token);

private:
    verdict judge_safely(const compiled_artifact &artifact,
                         const test_case &tc,
                         const resource_limits &limits,
                         const cancellation_token &token);

    sandbox &box;
    harness_options options;
};

/**
 * @brief Verdict of a test case that could not be judged.
 */
verdict system_error_verdict(const test_case &tc, const std::string &reason);

}  // namespace codegrade
