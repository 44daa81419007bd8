#include "gtest/gtest.h"
#include "judge/scorer.hpp"

using namespace std;
using namespace codegrade;

static verdict make_verdict(int64_t id, outcome_kind kind, bool passed, optional<string> diagnostic = nullopt) {
    verdict v;
    v.test_case_id = id;
    v.kind = kind;
    v.passed = passed;
    v.diagnostic = diagnostic;
    return v;
}

TEST(ScorerTest, ScoreIsFlooredPercentage) {
    vector<verdict> verdicts = {
        make_verdict(1, outcome_kind::SUCCESS, true),
        make_verdict(2, outcome_kind::SUCCESS, false),
        make_verdict(3, outcome_kind::SUCCESS, false)};
    EXPECT_EQ(compute_score(verdicts), 33);

    verdicts[1].passed = true;
    EXPECT_EQ(compute_score(verdicts), 66);

    EXPECT_EQ(compute_score({}), 0);
}

TEST(ScorerTest, AllPassedIsAccepted) {
    judge_report report = summarize({make_verdict(1, outcome_kind::SUCCESS, true),
                                     make_verdict(2, outcome_kind::SUCCESS, true)});
    EXPECT_EQ(report.score, 100);
    EXPECT_EQ(report.status, status::ACCEPTED);
    EXPECT_FALSE(report.compile_error);
    EXPECT_FALSE(report.runtime_error);
}

TEST(ScorerTest, WrongAnswerIsRejected) {
    judge_report report = summarize({make_verdict(1, outcome_kind::SUCCESS, true),
                                     make_verdict(2, outcome_kind::SUCCESS, false)});
    EXPECT_EQ(report.score, 50);
    EXPECT_EQ(report.status, status::REJECTED);
    EXPECT_FALSE(report.runtime_error);
}

TEST(ScorerTest, NoVerdictIsRejected) {
    judge_report report = summarize({});
    EXPECT_EQ(report.score, 0);
    EXPECT_EQ(report.status, status::REJECTED);
}

TEST(ScorerTest, RuntimeErrorWinsOverTimeout) {
    judge_report report = summarize({make_verdict(1, outcome_kind::TIME_EXCEEDED, false, "time limit of 1 seconds exceeded"),
                                     make_verdict(2, outcome_kind::RUNTIME_ERROR, false, "exited with code 3"),
                                     make_verdict(3, outcome_kind::SUCCESS, true)});
    EXPECT_EQ(report.score, 33);
    EXPECT_EQ(report.status, status::RUNTIME_ERROR);
    EXPECT_EQ(report.runtime_error, "exited with code 3");
}

TEST(ScorerTest, MemoryExceededCountsAsRuntimeError) {
    judge_report report = summarize({make_verdict(1, outcome_kind::MEMORY_EXCEEDED, false, "memory limit of 64 MB exceeded")});
    EXPECT_EQ(report.status, status::RUNTIME_ERROR);
    EXPECT_EQ(report.runtime_error, "memory limit of 64 MB exceeded");
}

TEST(ScorerTest, TimeoutAloneIsTimeLimitExceeded) {
    judge_report report = summarize({make_verdict(1, outcome_kind::SUCCESS, true),
                                     make_verdict(2, outcome_kind::TIME_EXCEEDED, false, "first"),
                                     make_verdict(3, outcome_kind::TIME_EXCEEDED, false, "second")});
    EXPECT_EQ(report.status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(report.runtime_error, "first");
}

TEST(ScorerTest, SystemErrorWinsOverEverythingButCompileError) {
    judge_report report = summarize({make_verdict(1, outcome_kind::RUNTIME_ERROR, false, "exited with code 1"),
                                     make_verdict(2, outcome_kind::SYSTEM_ERROR, false, "sandbox failure: no space left"),
                                     make_verdict(3, outcome_kind::TIME_EXCEEDED, false, "timeout")});
    EXPECT_EQ(report.status, status::SYSTEM_ERROR);
    EXPECT_EQ(report.runtime_error, "sandbox failure: no space left");
    EXPECT_FALSE(report.compile_error);
}

TEST(ScorerTest, MissingDiagnosticFallsBackToOutcomeName) {
    judge_report report = summarize({make_verdict(1, outcome_kind::RUNTIME_ERROR, false)});
    EXPECT_EQ(report.runtime_error, "RuntimeError");
}

TEST(ScorerTest, CompileErrorReport) {
    judge_report report = compile_error_report("main.c:1:1: error: expected ';'");
    EXPECT_EQ(report.status, status::COMPILATION_ERROR);
    EXPECT_EQ(report.score, 0);
    EXPECT_TRUE(report.verdicts.empty());
    EXPECT_EQ(report.compile_error, "main.c:1:1: error: expected ';'");
    EXPECT_FALSE(report.runtime_error);
}

TEST(ScorerTest, PersistableVerdictsSkipSampleCase) {
    judge_report report = summarize({make_verdict(0, outcome_kind::SUCCESS, true),
                                     make_verdict(7, outcome_kind::SUCCESS, true)});
    auto persistable = report.persistable_verdicts();
    ASSERT_EQ(persistable.size(), 1u);
    EXPECT_EQ(persistable[0]->test_case_id, 7);
}
