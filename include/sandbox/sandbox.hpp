#pragma once

#include <string>
#include <variant>
#include "sandbox/cancellation.hpp"
#include "sandbox/outcome.hpp"

namespace codegrade {

/**
 * @brief Source code to compile with the given language.
 */
struct source_payload {
    language lang;
    std::string source;
};

/**
 * @brief What a sandbox run executes.
 * source_payload compiles, a compiled_artifact runs a previously built program.
 */
using sandbox_payload = std::variant<source_payload, const compiled_artifact *>;

/**
 * @brief An isolated, resource bounded environment for untrusted programs.
 *
 * Every run gets a fresh scratch directory, no network, and bounded CPU time,
 * wall time, memory and output. Nothing of a run survives its return: all of
 * its processes are killed and its scratch directory is removed, whether it
 * succeeded, failed, timed out or was cancelled.
 *
 * Implementations must be safe to call from several threads at once.
 */
struct sandbox {
    virtual ~sandbox() = default;

    /**
     * @brief Compile or run a program.
     * @param payload source code to compile, or an artifact to run
     * @param input data fed to the standard input of the program
     * @param limits time and memory ceilings of this run
     * @param token the run is killed and reported as SYSTEM_ERROR once it fires
     * @return the classified outcome. Failures of the backend itself are
     * reported as SYSTEM_ERROR outcomes rather than thrown.
     */
    virtual execution_outcome run(const sandbox_payload &payload,
                                  const std::string &input,
                                  const resource_limits &limits,
                                  const cancellation_token &token) = 0;
};

}  // namespace codegrade
