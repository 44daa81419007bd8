#include <mutex>
#include <set>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/harness.hpp"
#include "test/fake_sandbox.hpp"

using namespace std;
using namespace codegrade;
using namespace codegrade::test;
using ::testing::Contains;
using ::testing::ElementsAre;

class HarnessTest : public ::testing::Test {
protected:
    HarnessTest() : artifact("/nonexistent/codegrade-fake-artifact", language{"c", "main.c", {"gcc"}, {"main"}, {"./main"}}, true) {}

    static vector<test_case> make_cases(size_t n) {
        vector<test_case> cases;
        for (size_t i = 1; i <= n; ++i)
            cases.push_back({(int64_t)i, to_string(i) + "\n", to_string(i)});
        return cases;
    }

    static vector<int64_t> ids(const vector<verdict> &verdicts) {
        vector<int64_t> result;
        for (auto &v : verdicts) result.push_back(v.test_case_id);
        return result;
    }

    fake_sandbox box;
    compiled_artifact artifact;
    resource_limits limits;
    cancellation_token token;
};

TEST_F(HarnessTest, MatchingOutputPasses) {
    test_harness harness(box);
    auto verdicts = harness.judge(artifact, make_cases(3), limits, token);

    ASSERT_EQ(verdicts.size(), 3u);
    for (auto &v : verdicts) {
        EXPECT_TRUE(v.passed);
        EXPECT_EQ(v.kind, outcome_kind::SUCCESS);
        EXPECT_FALSE(v.diagnostic);
        EXPECT_EQ(v.execution_time_ms, 12);
        EXPECT_EQ(v.memory_used_kb, 1024);
    }
    EXPECT_EQ(verdicts[1].actual_output, "2\n");
    EXPECT_EQ(verdicts[1].expected_output, "2");
    EXPECT_EQ(box.run_calls.load(), 3);
}

TEST_F(HarnessTest, WrongAnswerHasNoDiagnostic) {
    box.on_run = [](const string &, const resource_limits &, const cancellation_token &) {
        return make_outcome(outcome_kind::SUCCESS, "42");
    };
    test_harness harness(box);
    auto verdicts = harness.judge(artifact, make_cases(1), limits, token);

    ASSERT_EQ(verdicts.size(), 1u);
    EXPECT_FALSE(verdicts[0].passed);
    EXPECT_EQ(verdicts[0].kind, outcome_kind::SUCCESS);
    EXPECT_EQ(verdicts[0].actual_output, "42");
    EXPECT_FALSE(verdicts[0].diagnostic);
}

TEST_F(HarnessTest, FailuresDoNotStopJudging) {
    box.on_run = [](const string &input, const resource_limits &, const cancellation_token &) {
        if (input == "1\n") return make_outcome(outcome_kind::RUNTIME_ERROR, "", "killed by signal 11 (Segmentation fault)");
        if (input == "2\n") return make_outcome(outcome_kind::TIME_EXCEEDED, "", "time limit of 5 seconds exceeded");
        return make_outcome(outcome_kind::SUCCESS, input);
    };
    test_harness harness(box);
    auto verdicts = harness.judge(artifact, make_cases(3), limits, token);

    ASSERT_EQ(verdicts.size(), 3u);
    EXPECT_EQ(verdicts[0].kind, outcome_kind::RUNTIME_ERROR);
    EXPECT_EQ(verdicts[0].diagnostic, "killed by signal 11 (Segmentation fault)");
    EXPECT_FALSE(verdicts[0].passed);
    EXPECT_EQ(verdicts[1].kind, outcome_kind::TIME_EXCEEDED);
    EXPECT_FALSE(verdicts[1].passed);
    EXPECT_TRUE(verdicts[2].passed);
}

TEST_F(HarnessTest, ExceptionOnlyAffectsItsTestCase) {
    box.on_run = [](const string &input, const resource_limits &, const cancellation_token &) -> execution_outcome {
        if (input == "2\n") throw runtime_error("disk on fire");
        return make_outcome(outcome_kind::SUCCESS, input);
    };
    test_harness harness(box);
    auto verdicts = harness.judge(artifact, make_cases(3), limits, token);

    ASSERT_EQ(verdicts.size(), 3u);
    EXPECT_TRUE(verdicts[0].passed);
    EXPECT_EQ(verdicts[1].kind, outcome_kind::SYSTEM_ERROR);
    EXPECT_EQ(verdicts[1].diagnostic, "internal error: disk on fire");
    EXPECT_EQ(verdicts[1].test_case_id, 2);
    EXPECT_TRUE(verdicts[2].passed);
}

TEST_F(HarnessTest, CancelledTokenFillsRemainingVerdicts) {
    box.on_run = [this](const string &input, const resource_limits &, const cancellation_token &) {
        token.cancel("judging exceeded the overall deadline of 3 seconds");
        return make_outcome(outcome_kind::SUCCESS, input);
    };
    test_harness harness(box);
    auto verdicts = harness.judge(artifact, make_cases(4), limits, token);

    ASSERT_EQ(verdicts.size(), 4u);
    EXPECT_TRUE(verdicts[0].passed);
    for (size_t i = 1; i < 4; ++i) {
        EXPECT_EQ(verdicts[i].kind, outcome_kind::SYSTEM_ERROR);
        EXPECT_EQ(verdicts[i].diagnostic, "judging exceeded the overall deadline of 3 seconds");
    }
    EXPECT_EQ(box.run_calls.load(), 1);
}

TEST_F(HarnessTest, LimitsArePassedToSandbox) {
    limits.time_limit = 2.5;
    limits.memory_limit = 64;
    box.on_run = [](const string &input, const resource_limits &l, const cancellation_token &) {
        EXPECT_DOUBLE_EQ(l.time_limit, 2.5);
        EXPECT_EQ(l.memory_limit, 64);
        return make_outcome(outcome_kind::SUCCESS, input);
    };
    test_harness harness(box);
    harness.judge(artifact, make_cases(2), limits, token);
    EXPECT_EQ(box.run_calls.load(), 2);
}

TEST_F(HarnessTest, ParallelJudgingKeepsOrder) {
    box.on_run = [](const string &input, const resource_limits &, const cancellation_token &) {
        // later test cases finish first
        this_thread::sleep_for(chrono::milliseconds(10 * (10 - stoi(input))));
        return make_outcome(outcome_kind::SUCCESS, input);
    };
    test_harness harness(box, harness_options{4});
    auto verdicts = harness.judge(artifact, make_cases(6), limits, token);

    EXPECT_THAT(ids(verdicts), ElementsAre(1, 2, 3, 4, 5, 6));
    for (auto &v : verdicts) EXPECT_TRUE(v.passed);
    EXPECT_EQ(box.run_calls.load(), 6);
}

TEST_F(HarnessTest, CallingThreadJudgesAlongsideWorkers) {
    mutex mut;
    set<thread::id> runners;
    box.on_run = [&](const string &input, const resource_limits &, const cancellation_token &) {
        {
            scoped_lock guard(mut);
            runners.insert(this_thread::get_id());
        }
        this_thread::sleep_for(20ms);
        return make_outcome(outcome_kind::SUCCESS, input);
    };
    test_harness harness(box, harness_options{2});
    auto verdicts = harness.judge(artifact, make_cases(8), limits, token);

    EXPECT_THAT(ids(verdicts), ElementsAre(1, 2, 3, 4, 5, 6, 7, 8));
    for (auto &v : verdicts) EXPECT_TRUE(v.passed);
    // one extra thread, the caller does the rest of the work
    EXPECT_EQ(runners.size(), 2u);
    EXPECT_THAT(runners, Contains(this_thread::get_id()));
}

TEST_F(HarnessTest, EmptyTestSetGivesNoVerdict) {
    test_harness harness(box, harness_options{4});
    EXPECT_TRUE(harness.judge(artifact, {}, limits, token).empty());
    EXPECT_EQ(box.run_calls.load(), 0);
}
