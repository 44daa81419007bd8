#pragma once

#include <sys/types.h>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>

/**
 * @brief A libcgroup call failed.
 */
struct cgroup_exception : public std::runtime_error {
    /**
     * @param call the failed call and its arguments
     * @param err libcgroup error code, ECGOTHER takes the errno of libcgroup
     */
    cgroup_exception(const std::string &call, int err);
};

/**
 * @brief What the processes of a run consumed, as accounted by its cgroup.
 */
struct cgroup_usage {
    int64_t memory_peak = -1;  // bytes of RAM and swap
    double cpu_time = 0;       // seconds, summed over all processes
    bool oom = false;          // whether the OOM killer fired
};

/**
 * @brief The cgroup v1 of one run, in the memory and cpuacct hierarchies.
 *
 * The memory controller bounds RAM and swap of every process of the run
 * together, cpuacct accounts their CPU time. Both follow processes that
 * leave the process group of the command.
 *
 * The object only names the cgroup; create() and remove() change the kernel.
 */
struct run_cgroup {
    /**
     * @param name kernel name of the cgroup, like "/codegrade/<uuid>",
     *        unique among concurrent runs
     */
    explicit run_cgroup(std::string name);

    /**
     * @brief Initialize libcgroup, once per process.
     * @throw cgroup_exception when no cgroup hierarchy is mounted
     */
    static void init();

    /**
     * @brief Create the cgroup with equal RAM and RAM+swap limits, so that
     * the run cannot swap.
     * @param memory_limit bytes, negative for unlimited
     */
    void create(int64_t memory_limit);

    void attach(pid_t pid);

    std::set<pid_t> tasks() const;

    /**
     * @brief SIGKILL every task until none is left.
     * @return false if tasks survived repeated attempts
     */
    bool kill_all();

    cgroup_usage usage() const;

    /**
     * @brief Delete the cgroup, remaining tasks move to the parent.
     */
    void remove();

    const std::string &name() const;

private:
    std::string cgname;
};
