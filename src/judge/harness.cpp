#include "judge/harness.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "judge/compare.hpp"

namespace codegrade {
using namespace std;

verdict system_error_verdict(const test_case &tc, const string &reason) {
    verdict v;
    v.test_case_id = tc.id;
    v.passed = false;
    v.expected_output = tc.expected_output;
    v.kind = outcome_kind::SYSTEM_ERROR;
    v.diagnostic = reason;
    return v;
}

test_harness::test_harness(sandbox &box, harness_options options)
    : box(box), options(options) {}

verdict test_harness::judge_one(const compiled_artifact &artifact,
                                const test_case &tc,
                                const resource_limits &limits,
                                const cancellation_token &token) {
    if (token.cancelled())
        return system_error_verdict(tc, token.reason());

    execution_outcome outcome = box.run(&artifact, tc.input, limits, token);

    verdict v;
    v.test_case_id = tc.id;
    v.actual_output = outcome.output;
    v.expected_output = tc.expected_output;
    v.execution_time_ms = llround(outcome.wall_time * 1000);
    v.memory_used_kb = outcome.memory_kb;
    v.kind = outcome.kind;

    if (outcome.kind == outcome_kind::SUCCESS) {
        v.passed = outputs_match(outcome.output, tc.expected_output);
    } else {
        v.passed = false;
        v.diagnostic = outcome.diagnostic.empty() ? string(get_display_message(outcome.kind)) : outcome.diagnostic;
    }

    DLOG(INFO) << "Test case " << tc.id << ": " << get_display_message(v.kind)
               << (v.passed ? " passed" : " failed") << " in " << v.execution_time_ms << "ms";
    return v;
}

verdict test_harness::judge_safely(const compiled_artifact &artifact,
                                   const test_case &tc,
                                   const resource_limits &limits,
                                   const cancellation_token &token) {
    try {
        return judge_one(artifact, tc, limits, token);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Judging test case " << tc.id << " failed: " << ex.what();
        return system_error_verdict(tc, fmt::format("internal error: {}", ex.what()));
    }
}

vector<verdict> test_harness::judge(const compiled_artifact &artifact,
                                    const vector<test_case> &cases,
                                    const resource_limits &limits,
                                    const cancellation_token &token) {
    vector<verdict> verdicts(cases.size());

    size_t parallelism = min(max<size_t>(options.parallelism, 1), cases.size());
    if (parallelism <= 1) {
        for (size_t i = 0; i < cases.size(); ++i)
            verdicts[i] = judge_safely(artifact, cases[i], limits, token);
        return verdicts;
    }

    // verdicts are stored by index, so test case order survives
    atomic<size_t> next{0};
    auto take_cases = [&] {
        for (size_t i = next++; i < cases.size(); i = next++)
            verdicts[i] = judge_safely(artifact, cases[i], limits, token);
    };

    // the calling thread is one of the workers, so every case is judged
    // even when no further thread can be started
    {
        vector<thread> workers;
        defer {
            for (auto &worker : workers)
                worker.join();
        };
        try {
            for (size_t w = 1; w < parallelism; ++w)
                workers.emplace_back(take_cases);
        } catch (std::system_error &ex) {
            LOG(WARNING) << "Judging with " << workers.size() + 1 << " of " << parallelism << " threads: " << ex.what();
        }
        take_cases();
    }
    return verdicts;
}

}  // namespace codegrade
