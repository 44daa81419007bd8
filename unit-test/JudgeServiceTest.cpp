#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/fake_sandbox.hpp"
#include "worker.hpp"

using namespace std;
using namespace codegrade;
using namespace codegrade::test;

static judge_request make_request(const string &code, const string &output) {
    judge_request request;
    request.submission = {code, "c"};
    request.test_cases = {{1, "", output}};
    return request;
}

class JudgeServiceTest : public ::testing::Test {
protected:
    JudgeServiceTest() : languages(language_registry::defaults()), orchestrator(box, languages) {}

    fake_sandbox box;
    language_registry languages;
    submission_orchestrator orchestrator;
};

TEST_F(JudgeServiceTest, JudgesConcurrentRequests) {
    box.on_run = [](const string &, const resource_limits &, const cancellation_token &) {
        this_thread::sleep_for(20ms);
        return make_outcome(outcome_kind::SUCCESS, "ok");
    };
    judge_service service(orchestrator, 4);
    EXPECT_EQ(service.worker_count(), 4u);

    vector<future<judge_report>> reports;
    for (int i = 0; i < 10; ++i)
        reports.push_back(service.submit(make_request("int main() {}", i % 2 ? "ok" : "wrong")));

    for (int i = 0; i < 10; ++i) {
        judge_report report = reports[i].get();
        EXPECT_EQ(report.status, i % 2 ? status::ACCEPTED : status::REJECTED) << "request " << i;
    }
    EXPECT_EQ(box.compile_calls.load(), 10);
}

TEST_F(JudgeServiceTest, InvalidRequestFailsItsFuture) {
    judge_service service(orchestrator, 1);
    auto rejected = service.submit(make_request("   ", "ok"));
    auto accepted = service.submit(make_request("int main() {}", ""));

    EXPECT_THROW(rejected.get(), invalid_input);
    EXPECT_EQ(accepted.get().status, status::ACCEPTED);
}

TEST_F(JudgeServiceTest, StopCancelsJudging) {
    box.on_run = [](const string &, const resource_limits &, const cancellation_token &token) {
        for (int i = 0; i < 500 && !token.cancelled(); ++i)
            this_thread::sleep_for(10ms);
        return execution_outcome::system_error(token.reason());
    };
    judge_service service(orchestrator, 1);
    auto running = service.submit(make_request("int main() {}", "ok"));
    auto queued = service.submit(make_request("int main() {}", "ok"));

    this_thread::sleep_for(50ms);
    auto start = chrono::steady_clock::now();
    service.stop();
    EXPECT_LT(chrono::steady_clock::now() - start, 3s);

    judge_report first = running.get();
    EXPECT_EQ(first.status, status::SYSTEM_ERROR);
    EXPECT_EQ(first.runtime_error, "judge service is shutting down");
    EXPECT_EQ(queued.get().status, status::SYSTEM_ERROR);

    EXPECT_THROW(service.submit(make_request("int main() {}", "ok")), internal_error);
    service.stop();
}

TEST_F(JudgeServiceTest, ZeroWorkersIsRejected) {
    EXPECT_THROW(judge_service(orchestrator, 0), invalid_argument);
}
