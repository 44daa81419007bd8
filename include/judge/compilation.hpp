#pragma once

#include <memory>
#include <string>
#include "language/language.hpp"
#include "sandbox/sandbox.hpp"

namespace codegrade {

struct compilation_result {
    /**
     * @brief SUCCESS, COMPILE_FAILED or SYSTEM_ERROR.
     */
    outcome_kind kind = outcome_kind::SYSTEM_ERROR;

    /**
     * @brief The program to run, only set on SUCCESS.
     */
    std::unique_ptr<compiled_artifact> artifact;

    /**
     * @brief Compiler messages on COMPILE_FAILED, the reason on SYSTEM_ERROR.
     * Never empty unless compilation succeeded.
     */
    std::string diagnostic;
};

/**
 * @brief Build a submission once, in one sandbox run.
 * @param limits limits of the compiler, independent of the problem limits
 * @return the artifact, or why there is none. Nothing is thrown: a failure
 * of the sandbox is a SYSTEM_ERROR result.
 */
compilation_result compile_submission(sandbox &box, const language &lang, const std::string &code,
                                      const resource_limits &limits, const cancellation_token &token);

}  // namespace codegrade
