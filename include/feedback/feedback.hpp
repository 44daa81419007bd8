#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace codegrade {

/**
 * @brief Explanation of a report for the student, or why there is none.
 */
struct feedback_result {
    bool available = false;

    /**
     * @brief The explanation, only when available.
     */
    std::string text;

    /**
     * @brief Why no explanation is available.
     */
    std::string reason;

    static feedback_result ready(const std::string &text);
    static feedback_result unavailable(const std::string &reason);
};

/**
 * @brief Something that explains a final report, like an external tutor.
 * Feedback is asked for after judging finished and never changes the report.
 */
struct feedback_provider {
    virtual ~feedback_provider();

    virtual feedback_result explain(const judge_report &report, const submission &submit, const problem &prob) = 0;
};

/**
 * @brief Provider used when no feedback generator is configured.
 */
struct unavailable_feedback : public feedback_provider {
    explicit unavailable_feedback(std::string reason = "feedback generation is not configured");

    feedback_result explain(const judge_report &report, const submission &submit, const problem &prob) override;

private:
    std::string reason;
};

/**
 * @brief Asks an external command for feedback.
 *
 * The command is invoked as `command... request.json feedback.txt`. The
 * request holds the report, the code and the problem statement. The command
 * writes its explanation to the second file and exits with 0. Every call
 * uses its own pair of files under work_dir, so calls may overlap.
 */
struct command_feedback : public feedback_provider {
    command_feedback(std::vector<std::string> command, std::filesystem::path work_dir, int timeout_seconds = 60);

    feedback_result explain(const judge_report &report, const submission &submit, const problem &prob) override;

private:
    std::vector<std::string> command;
    std::filesystem::path work_dir;
    int timeout_seconds;
};

/**
 * @brief Ask provider for feedback, whatever the provider does.
 * @return the feedback, or unavailable with the failure as reason
 */
feedback_result request_feedback(feedback_provider &provider, const judge_report &report,
                                 const submission &submit, const problem &prob);

}  // namespace codegrade
