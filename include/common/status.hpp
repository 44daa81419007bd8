#pragma once

namespace codegrade {

/**
 * @brief Overall result of a judged submission.
 * When several conditions hold, the one listed first wins.
 */
enum class status {
    /**
     * @brief The program could not be compiled, no test case was run.
     */
    COMPILATION_ERROR = 0,

    /**
     * @brief The sandbox failed for at least one run, or judging timed out
     * or was cancelled. Not the fault of the submitted program.
     */
    SYSTEM_ERROR = 1,

    /**
     * @brief At least one test case crashed, exited with a non-zero code
     * or exceeded the memory limit.
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief At least one test case exceeded the time limit.
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief Every test case passed.
     */
    ACCEPTED = 4,

    /**
     * @brief Some output did not match, and nothing above applies.
     */
    REJECTED = 5
};

/**
 * @return the name of s in reports, like "Accepted" or "TimeLimitExceeded"
 */
const char *get_display_message(status s);

}  // namespace codegrade
