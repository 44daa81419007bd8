#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include "language/language.hpp"

namespace codegrade {

/**
 * @brief Resource ceilings of one sandbox run.
 */
struct resource_limits {
    /**
     * @brief CPU and wall clock time limit in seconds, must be positive.
     */
    double time_limit = 5;

    /**
     * @brief Memory limit in MB, must be positive.
     */
    int64_t memory_limit = 256;
};

/**
 * @brief Largest limits a sandbox can enforce: one day of time, and a
 * memory limit whose size in bytes still fits in int64_t.
 */
inline resource_limits sandbox_max_limits() {
    return resource_limits{86400, std::numeric_limits<int64_t>::max() >> 20};
}

/**
 * @brief How a sandbox run ended.
 */
enum class outcome_kind {
    /**
     * @brief The compiler rejected the program, or ran out of time or memory.
     */
    COMPILE_FAILED = 0,

    /**
     * @brief The program exited with code 0 within its limits.
     */
    SUCCESS = 1,

    /**
     * @brief The program exited with a non-zero code or was killed by a signal.
     * Exceeding the memory limit without cgroup support also ends here,
     * since the allocation failure is all the program sees.
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief CPU or wall clock time exceeded the time limit.
     */
    TIME_EXCEEDED = 3,

    /**
     * @brief The memory cgroup killed the program.
     */
    MEMORY_EXCEEDED = 4,

    /**
     * @brief The sandbox could not run the program at all, or the run was cancelled.
     * Not attributable to the submitted program.
     */
    SYSTEM_ERROR = 5
};

const char *get_display_message(outcome_kind);

/**
 * @brief A compiled program, kept in its own directory under RUN_DIR/artifacts.
 * The directory is removed when the artifact is destroyed, so the artifact
 * lives exactly as long as the judging of its submission.
 */
struct compiled_artifact {
    /**
     * @param keep leave the directory behind on destruction, for debugging
     */
    compiled_artifact(std::filesystem::path dir, language lang, bool keep = false);
    ~compiled_artifact();

    compiled_artifact(const compiled_artifact &) = delete;
    compiled_artifact &operator=(const compiled_artifact &) = delete;

    const std::filesystem::path &directory() const;

    /**
     * @brief The language the artifact was built with, which knows how to run it.
     */
    const language &lang() const;

private:
    std::filesystem::path dir;
    language lang_;
    bool keep;
};

/**
 * @brief Result of one sandbox run.
 */
struct execution_outcome {
    outcome_kind kind = outcome_kind::SYSTEM_ERROR;

    /**
     * @brief Captured stdout, at most the configured output limit.
     */
    std::string output;

    /**
     * @brief Captured stderr, at most the configured output limit.
     */
    std::string error;

    /**
     * @brief Human readable explanation of a failure, empty on success.
     * Compiler messages for COMPILE_FAILED, exit status and stderr for
     * RUNTIME_ERROR, the reason for SYSTEM_ERROR.
     */
    std::string diagnostic;

    int exitcode = -1;
    int signal = -1;

    double wall_time = 0;  // seconds
    double cpu_time = 0;   // seconds

    /**
     * @brief Peak memory in KB, 0 when unmeasured.
     */
    int64_t memory_kb = 0;

    bool output_truncated = false;

    /**
     * @brief The built program, only set by a successful compilation.
     */
    std::unique_ptr<compiled_artifact> artifact;

    static execution_outcome system_error(const std::string &reason);
};

}  // namespace codegrade
