#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "feedback/feedback.hpp"
#include "judge/submission.hpp"

namespace codegrade {

/**
 * @brief Everything needed to judge one submission.
 */
struct judge_request {
    codegrade::submission submission;
    codegrade::problem problem;
    std::vector<test_case> test_cases;
};

void from_json(const nlohmann::json &j, resource_limits &limits);
void from_json(const nlohmann::json &j, test_case &tc);
void from_json(const nlohmann::json &j, problem &prob);
void from_json(const nlohmann::json &j, judge_request &request);

void to_json(nlohmann::json &j, const verdict &v);
void to_json(nlohmann::json &j, const judge_report &report);
void to_json(nlohmann::json &j, const feedback_result &feedback);

/**
 * @brief Parse a request document.
 * @code{.json}
 * {
 *     "code": "#include <stdio.h>\nint main() { ... }",
 *     "language": "c",
 *     "problem": {
 *         "time_limit": 2,
 *         "memory_limit": 128,
 *         "statement": "Add two numbers",
 *         "sample_input": "1 2\n",
 *         "sample_output": "3\n"
 *     },
 *     "test_cases": [
 *         { "id": 1, "input": "3 4\n", "expected_output": "7\n" }
 *     ]
 * }
 * @endcode
 * @throw invalid_input if the document is not JSON or a field is missing
 *        or malformed
 */
judge_request parse_request(const std::string &document);

/**
 * @brief Serialize a document that may carry program output or compiler
 * messages. Bytes that are not valid UTF-8 are written as U+FFFD.
 */
std::string dump_document(const nlohmann::json &j, int indent = 4);

}  // namespace codegrade
