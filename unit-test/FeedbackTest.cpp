#include <filesystem>
#include "common/io_utils.hpp"
#include "feedback/feedback.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace std;
using namespace codegrade;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

struct mock_feedback : public feedback_provider {
    MOCK_METHOD(feedback_result, explain, (const judge_report &, const submission &, const problem &), (override));
};

class FeedbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_dir = filesystem::temp_directory_path() / "codegrade-feedback-test";
        filesystem::create_directories(work_dir);
        report.status = status::REJECTED;
        report.score = 50;
        submit = {"print(1)", "python3"};
        prob.statement = "Print one";
    }

    void TearDown() override {
        filesystem::remove_all(work_dir);
    }

    /**
     * @brief Write a shell script into the work directory.
     * @return the command running it
     */
    vector<string> script(const string &body) {
        filesystem::path file = work_dir / "explain.sh";
        write_file_content(file, "#!/bin/sh\n" + body);
        return {"sh", file.string()};
    }

    size_t leftover_files() {
        size_t count = 0;
        for (auto &entry : filesystem::directory_iterator(work_dir))
            if (entry.path().filename() != "explain.sh") ++count;
        return count;
    }

    filesystem::path work_dir;
    judge_report report;
    submission submit;
    problem prob;
};

TEST_F(FeedbackTest, NotConfigured) {
    unavailable_feedback provider;
    feedback_result result = request_feedback(provider, report, submit, prob);
    EXPECT_FALSE(result.available);
    EXPECT_EQ(result.reason, "feedback generation is not configured");
}

TEST_F(FeedbackTest, ProviderFailureBecomesUnavailable) {
    mock_feedback provider;
    EXPECT_CALL(provider, explain(_, _, _)).WillOnce(Throw(runtime_error("connection refused")));

    judge_report before = report;
    feedback_result result = request_feedback(provider, report, submit, prob);
    EXPECT_FALSE(result.available);
    EXPECT_THAT(result.reason, HasSubstr("connection refused"));
    EXPECT_EQ(report.score, before.score);
    EXPECT_EQ(report.status, before.status);
}

TEST_F(FeedbackTest, ProviderResultIsPassedThrough) {
    mock_feedback provider;
    EXPECT_CALL(provider, explain(_, _, _)).WillOnce(Return(feedback_result::ready("Almost there")));

    feedback_result result = request_feedback(provider, report, submit, prob);
    EXPECT_TRUE(result.available);
    EXPECT_EQ(result.text, "Almost there");
}

TEST_F(FeedbackTest, CommandReceivesReportAndWritesFeedback) {
    command_feedback provider(script(R"(grep -q '"statement": "Print one"' "$1" || exit 3
grep -q '"status": "Rejected"' "$1" || exit 4
echo "Check the edge cases" > "$2"
)"), work_dir);

    feedback_result result = request_feedback(provider, report, submit, prob);
    EXPECT_TRUE(result.available) << result.reason;
    EXPECT_EQ(result.text, "Check the edge cases\n");
    EXPECT_EQ(leftover_files(), 0u);
}

TEST_F(FeedbackTest, FailingCommandIsUnavailable) {
    command_feedback provider(script("exit 2\n"), work_dir);
    feedback_result result = request_feedback(provider, report, submit, prob);
    EXPECT_FALSE(result.available);
    EXPECT_EQ(result.reason, "feedback command exited with code 2");
    EXPECT_EQ(leftover_files(), 0u);
}

TEST_F(FeedbackTest, SilentCommandIsUnavailable) {
    command_feedback provider(script("exit 0\n"), work_dir);
    feedback_result result = request_feedback(provider, report, submit, prob);
    EXPECT_FALSE(result.available);
    EXPECT_EQ(result.reason, "feedback command produced no feedback");
}

TEST_F(FeedbackTest, EmptyCommandIsRejected) {
    EXPECT_THROW(command_feedback({}, work_dir), invalid_argument);
}
