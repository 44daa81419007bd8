#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/outcome.hpp"

namespace codegrade {

/**
 * @brief One instructor defined input/expected output pair.
 */
struct test_case {
    /**
     * @brief Identifier chosen by the caller.
     * 0 is reserved for the case synthesized from the sample of a problem,
     * which callers must not persist.
     */
    int64_t id = 0;

    std::string input;

    std::string expected_output;
};

struct problem {
    resource_limits limits;

    std::string statement;

    /**
     * @brief Judged against when the problem declares no test case.
     */
    std::string sample_input;
    std::string sample_output;
};

struct submission {
    std::string code;

    /**
     * @brief Name of a language of the language_registry.
     */
    std::string language;
};

/**
 * @brief Outcome of one test case.
 */
struct verdict {
    int64_t test_case_id = 0;

    bool passed = false;

    std::string actual_output;

    std::string expected_output;

    int64_t execution_time_ms = 0;

    /**
     * @brief Peak memory, 0 when the sandbox could not measure it.
     */
    int64_t memory_used_kb = 0;

    /**
     * @brief Why the test case failed, unset for passed tests and wrong answers.
     */
    std::optional<std::string> diagnostic;

    outcome_kind kind = outcome_kind::SYSTEM_ERROR;
};

/**
 * @brief Complete result of judging one submission.
 */
struct judge_report {
    /**
     * @brief One verdict per test case, in test case order.
     * Empty when compilation failed.
     */
    std::vector<verdict> verdicts;

    /**
     * @brief floor(100 * passed / total), 0 without verdicts.
     */
    int score = 0;

    codegrade::status status = codegrade::status::REJECTED;

    std::optional<std::string> compile_error;

    /**
     * @brief Diagnostic of the first verdict explaining status, for display.
     * Only set for SYSTEM_ERROR, RUNTIME_ERROR and TIME_LIMIT_EXCEEDED.
     */
    std::optional<std::string> runtime_error;

    /**
     * @brief Verdicts callers may store, that is all but the synthesized sample case.
     */
    std::vector<const verdict *> persistable_verdicts() const;
};

}  // namespace codegrade
