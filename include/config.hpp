#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace codegrade {

/**
 * @brief Root directory of every sandbox run.
 *
 * RUN_DIR
 * ├── scratch // one fresh directory per sandbox run, named by a random uuid
 * │   └── 6f1c... // working directory of the running program, removed after the run
 * └── artifacts // compiled programs, one directory per judged submission
 *     └── 0a7d... // removed when the submission has been judged
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief Time limit in seconds of the compilation step.
 * Independent of the problem limits, the default is 10 seconds.
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief Memory limit in MB of the compilation step, default to 512MB.
 */
extern int64_t COMPILE_MEMORY_LIMIT;

/**
 * @brief Largest time limit in seconds a problem may ask for.
 */
extern double MAX_TIME_LIMIT;

/**
 * @brief Largest memory limit in MB a problem may ask for,
 * 0 for the physical memory of the host.
 */
extern int64_t MAX_MEMORY_LIMIT;

/**
 * @brief Bytes of stdout and stderr kept per run, the rest is discarded.
 */
extern int64_t OUTPUT_LIMIT;

/**
 * @brief Bytes of compiler diagnostic kept in a report.
 */
extern int64_t DIAGNOSTIC_LIMIT;

/**
 * @brief Maximum size in bytes of any file written by a sandboxed program.
 */
extern int64_t FILE_LIMIT;

/**
 * @brief Extra wall clock seconds before the watchdog kills a run that
 * exceeded its time limit while sleeping or blocked.
 */
extern double WALL_GRACE;

/**
 * @brief Whether sandbox runs are placed in a memory cgroup.
 * Requires root and a cgroup v1 memory hierarchy. Without it the
 * memory limit is enforced with RLIMIT_AS and exceeding it shows up
 * as a runtime error.
 */
extern bool USE_CGROUP;

/**
 * @brief User and group sandboxed programs run as, -1 keeps the current ones.
 */
extern int RUN_USER_ID;
extern int RUN_GROUP_ID;

/**
 * @brief Whether DEBUG mode is on.
 * In DEBUG mode the judge does not require root privileges and keeps
 * scratch directories after the run so that they can be inspected.
 */
extern bool DEBUG;

}  // namespace codegrade
