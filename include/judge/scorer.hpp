#pragma once

#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace codegrade {

/**
 * @brief floor(100 * passed / total), 0 without verdicts.
 */
int compute_score(const std::vector<verdict> &verdicts);

/**
 * @brief Turn the verdicts of a compiled submission into a report.
 *
 * Status precedence, first match wins:
 * 1. SYSTEM_ERROR, some verdict could not be judged
 * 2. RUNTIME_ERROR, some verdict crashed or exceeded the memory limit
 * 3. TIME_LIMIT_EXCEEDED, some verdict timed out
 * 4. ACCEPTED, score is 100
 * 5. REJECTED
 * For the first three, runtime_error carries the diagnostic of the first
 * verdict in test case order matching the status.
 */
judge_report summarize(std::vector<verdict> verdicts);

/**
 * @brief Report of a submission that did not compile.
 */
judge_report compile_error_report(const std::string &diagnostic);

}  // namespace codegrade
