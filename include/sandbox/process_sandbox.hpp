#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

struct runguard_options;

namespace codegrade {

struct sandbox_options {
    /**
     * @brief Directory holding scratch and artifact directories.
     * @see RUN_DIR
     */
    std::filesystem::path run_dir;

    /**
     * @brief Enforce and measure memory through a cgroup, see USE_CGROUP.
     */
    bool use_cgroup = false;

    int user_id = -1;
    int group_id = -1;

    /**
     * @brief Bytes kept of stdout and of stderr, excess output is discarded.
     */
    int64_t output_limit = 1 << 20;

    /**
     * @brief Bytes kept of compiler messages and runtime error output.
     */
    int64_t diagnostic_limit = 1 << 14;

    int64_t file_limit = 1 << 26;

    /**
     * @brief Processes a program may own, only applied with a dedicated run user.
     */
    size_t process_limit = 64;

    /**
     * @brief Wall clock seconds on top of the time limit before the watchdog kills.
     */
    double wall_grace = 1;

    bool isolate_network = true;

    /**
     * @brief Run programs under their own PID namespace, so that nothing
     * they fork survives the run, even outside their process group.
     */
    bool isolate_processes = true;

    /**
     * @brief Leave scratch and artifact directories behind for inspection.
     */
    bool keep_workspace = false;
};

/**
 * @brief Sandbox backed by guarded child processes on the local host.
 *
 * Each run forks a child into its own process group and namespaces (no network,
 * a PID namespace whose init takes every leftover process down with it),
 * under RLIMIT_CPU and a wall clock watchdog, with memory bounded by a cgroup
 * or RLIMIT_AS, inside a fresh scratch directory RUN_DIR/scratch/<uuid>.
 *
 * Compilation writes the source into the scratch directory, runs the compile
 * command of the language and moves the artifact files to RUN_DIR/artifacts/<uuid>.
 * Execution copies the artifact files into a new scratch directory and runs
 * the run command of the language there.
 */
struct process_sandbox : public sandbox {
    explicit process_sandbox(sandbox_options options);

    /**
     * @brief Check that runs can be provisioned on this host.
     * Prepares the run directory and starts a trivial program with all
     * isolation enabled.
     * @throw sandbox_unavailable with the reason when they cannot
     */
    void probe();

    execution_outcome run(const sandbox_payload &payload,
                          const std::string &input,
                          const resource_limits &limits,
                          const cancellation_token &token) override;

    const sandbox_options &options() const;

private:
    execution_outcome compile(const source_payload &src, const resource_limits &limits, const cancellation_token &token);

    execution_outcome execute(const compiled_artifact &artifact, const std::string &input,
                              const resource_limits &limits, const cancellation_token &token);

    std::filesystem::path create_workspace(const std::filesystem::path &parent);

    void remove_workspace(const std::filesystem::path &dir);

    runguard_options build_options(const std::filesystem::path &workdir,
                                   const std::vector<std::string> &command,
                                   const std::string &input,
                                   const resource_limits &limits,
                                   const cancellation_token &token);

    sandbox_options opts;
};

}  // namespace codegrade
