#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

struct runguard_options {
    /**
     * @brief Name of the cgroup to create for this run, empty to run without cgroup.
     * Must be unique among concurrent runs.
     */
    std::string cgroupname;

    /**
     * @brief Working directory of the command.
     */
    std::string work_dir;

    size_t nproc = 0;    // 0 for unlimited
    int user_id = -1;    // -1 keeps the user of the watchdog
    int group_id = -1;

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;   // CPU time

    int64_t memory_limit = -1;  // Memory limit in bytes
    int64_t file_limit = -1;    // Output file size limit in bytes
    int64_t stream_size = -1;   // Bytes of stdout/stderr kept, -1 for unlimited
    bool no_core_dumps = true;

    /**
     * @brief Move the command into fresh network, IPC and UTS namespaces.
     * Without root privileges this goes through a new user namespace.
     */
    bool isolate_network = true;

    /**
     * @brief Run the command under an init process of a fresh PID namespace.
     * When that init ends the kernel kills every process left in the
     * namespace, including those that escaped the process group by setsid.
     */
    bool isolate_processes = true;

    /**
     * @brief Data written to the standard input of the command.
     */
    std::string stdin_data;

    bool preserve_sys_env = false;
    std::vector<std::string> env;

    std::vector<std::string> command;

    /**
     * @brief Polled by the watchdog while the command runs.
     * When it returns true the whole process tree is killed.
     */
    std::function<bool()> should_abort;
};

struct runguard_result {
    int exitcode = -1;

    /**
     * @brief Signal that terminated the command, -1 if it exited normally.
     */
    int signal = -1;

    /**
     * @brief Times in seconds. CPU time of multithreaded programs
     * accumulates over all threads.
     */
    double wall_time = 0;
    double user_time = 0;
    double sys_time = 0;
    double cpu_time = 0;

    /**
     * @brief Peak memory usage in bytes, -1 when unknown.
     */
    int64_t memory = -1;

    /**
     * @brief Whether the cgroup OOM killer fired.
     */
    bool oom = false;

    /**
     * @brief "", "soft-timelimit" or "hard-timelimit".
     */
    std::string time_result;

    /**
     * @brief Whether the run was killed because should_abort returned true.
     */
    bool aborted = false;

    /**
     * @brief Why the command could not be started, empty when it was.
     */
    std::string internal_error;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    size_t stdin_bytes = 0;
    size_t stdout_bytes = 0;
    size_t stderr_bytes = 0;
};
