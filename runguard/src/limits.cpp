#include "limits.hpp"
#include <grp.h>
#include <math.h>
#include <sched.h>
#include <sys/resource.h>
#include <unistd.h>

using namespace std;

const char *restriction_step_name(int step) {
    static const char *names[] = {
        "none",
        "unable to setsid",
        "unable to unshare namespaces",
        "setrlimit",
        "unable to set group id",
        "unable to set user id",
        "unable to chdir to workdir",
        "redirecting standard streams",
        "unable to start command",
        "waiting for watchdog",
        "unable to fork namespace init"};
    if (step < 0 || step > STEP_FORK) return "unknown";
    return names[step];
}

static bool set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0;
}

int enter_namespaces(const struct runguard_options &opt) {
    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        return STEP_SETSID;

    /*
     * CLONE_NEWNET: the command gets a network namespace with only a
     *               loopback device that is down, so no network at all.
     * CLONE_NEWIPC, CLONE_NEWUTS: no IPC objects or hostname shared with the host.
     * CLONE_NEWPID: the command cannot see or signal host processes, and
     *               nothing it forks outlives the namespace init.
     * Without root privileges the namespaces can only be created inside
     * a new user namespace, which grants no privilege on the host.
     */
    int flags = 0;
    if (opt.isolate_network)
        flags |= CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;
    if (opt.isolate_processes)
        flags |= CLONE_NEWPID;
    if (flags == 0)
        return STEP_NONE;
    if (geteuid() != 0)
        flags |= CLONE_NEWUSER;
    if (unshare(flags) != 0)
        return STEP_UNSHARE;
    return STEP_NONE;
}

int set_restrictions(const struct runguard_options &opt) {
    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
           higher: at the soft limit the kernel will send SIGXCPU at
           the hard limit a SIGKILL. The SIGXCPU can be caught, but is
           not by default and gives us a reliable way to detect if the
           CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        if (!set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1))
            return STEP_RLIMIT;
    }

    // with a cgroup the memory limit is handled by the memory controller
    if (opt.memory_limit > 0 && opt.cgroupname.empty()) {
        if (!set_rlimit(RLIMIT_AS, opt.memory_limit, opt.memory_limit))
            return STEP_RLIMIT;
    }

    if (opt.file_limit > 0 && !set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit))
        return STEP_RLIMIT;
    if (opt.nproc > 0 && !set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc))
        return STEP_RLIMIT;
    if (opt.no_core_dumps && !set_rlimit(RLIMIT_CORE, 0, 0))
        return STEP_RLIMIT;

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            return STEP_SETGID;
        gid_t aux_groups[1];
        aux_groups[0] = opt.group_id;
        if (setgroups(1, aux_groups))
            return STEP_SETGID;
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            return STEP_SETUID;
    }

    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0)
        return STEP_CHDIR;

    return STEP_NONE;
}
