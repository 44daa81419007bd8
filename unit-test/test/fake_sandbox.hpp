#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace codegrade::test {

inline execution_outcome make_outcome(outcome_kind kind, const std::string &output = "", const std::string &diagnostic = "") {
    execution_outcome outcome;
    outcome.kind = kind;
    outcome.output = output;
    outcome.diagnostic = diagnostic;
    outcome.exitcode = kind == outcome_kind::SUCCESS ? 0 : 1;
    outcome.wall_time = 0.012;
    outcome.memory_kb = 1024;
    return outcome;
}

/**
 * @brief Sandbox answering from scripts instead of running programs.
 * Compilation succeeds by default, and runs echo their input.
 */
struct fake_sandbox : public sandbox {
    using compile_script = std::function<execution_outcome(const source_payload &)>;
    using run_script = std::function<execution_outcome(const std::string &input, const resource_limits &, const cancellation_token &)>;

    compile_script on_compile = [](const source_payload &src) {
        execution_outcome outcome = make_outcome(outcome_kind::SUCCESS);
        outcome.artifact = std::make_unique<compiled_artifact>("/nonexistent/codegrade-fake-artifact", src.lang, true);
        return outcome;
    };

    run_script on_run = [](const std::string &input, const resource_limits &, const cancellation_token &) {
        return make_outcome(outcome_kind::SUCCESS, input);
    };

    std::atomic<int> compile_calls{0};
    std::atomic<int> run_calls{0};

    execution_outcome run(const sandbox_payload &payload,
                          const std::string &input,
                          const resource_limits &limits,
                          const cancellation_token &token) override {
        if (auto src = std::get_if<source_payload>(&payload)) {
            ++compile_calls;
            {
                std::scoped_lock guard(mut);
                compiled_sources.push_back(src->source);
            }
            return on_compile(*src);
        }
        ++run_calls;
        {
            std::scoped_lock guard(mut);
            inputs.push_back(input);
        }
        return on_run(input, limits, token);
    }

    std::vector<std::string> sources() {
        std::scoped_lock guard(mut);
        return compiled_sources;
    }

    std::vector<std::string> run_inputs() {
        std::scoped_lock guard(mut);
        return inputs;
    }

private:
    std::mutex mut;
    std::vector<std::string> compiled_sources;
    std::vector<std::string> inputs;
};

}  // namespace codegrade::test
