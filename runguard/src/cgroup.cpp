#include "cgroup.hpp"

#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <sys/resource.h>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>

using namespace std;

static string describe_error(const string &call, int err) {
    if (err == ECGOTHER)
        return fmt::format("libcgroup: {}: {}", call, cgroup_strerror(cgroup_get_last_errno()));
    return fmt::format("{}: {}", call, cgroup_strerror(err));
}

cgroup_exception::cgroup_exception(const string &call, int err)
    : runtime_error(describe_error(call, err)) {}

static void check(int err, const string &call) {
    if (err != 0) throw cgroup_exception(call, err);
}

struct cgroup_deleter {
    void operator()(struct cgroup *cg) const {
        cgroup_free(&cg);
    }
};

// a libcgroup handle is either filled by us or read from the kernel, never both
using cgroup_handle = unique_ptr<struct cgroup, cgroup_deleter>;

static cgroup_handle new_handle(const string &name) {
    cgroup_handle cg(cgroup_new_cgroup(name.c_str()));
    if (!cg) throw cgroup_exception(fmt::format("cgroup_new_cgroup({})", name), cgroup_get_last_errno());
    return cg;
}

static cgroup_handle read_handle(const string &name) {
    cgroup_handle cg = new_handle(name);
    check(cgroup_get_cgroup(cg.get()), fmt::format("cgroup_get_cgroup({})", name));
    return cg;
}

static struct cgroup_controller *add_controller(struct cgroup *cg, const char *controller) {
    struct cgroup_controller *ctrl = cgroup_add_controller(cg, controller);
    if (!ctrl) throw cgroup_exception(fmt::format("cgroup_add_controller({})", controller), cgroup_get_last_errno());
    return ctrl;
}

static int64_t read_value(struct cgroup *cg, const char *controller, const char *key) {
    struct cgroup_controller *ctrl = cgroup_get_controller(cg, controller);
    if (!ctrl) throw cgroup_exception(fmt::format("cgroup_get_controller({})", controller), cgroup_get_last_errno());
    int64_t value;
    check(cgroup_get_value_int64(ctrl, key, &value), fmt::format("cgroup_get_value_int64({})", key));
    return value;
}

run_cgroup::run_cgroup(string name) : cgname(move(name)) {}

void run_cgroup::init() {
    static once_flag flag;
    static int err = 0;
    call_once(flag, [] {
        err = cgroup_init();
        if (err != 0)
            LOG(ERROR) << describe_error("cgroup_init", err);
    });
    check(err, "cgroup_init");
}

void run_cgroup::create(int64_t memory_limit) {
    cgroup_handle cg = new_handle(cgname);

    struct cgroup_controller *memory = add_controller(cg.get(), "memory");
    if (memory_limit < 0) memory_limit = RLIM_INFINITY;
    check(cgroup_add_value_int64(memory, "memory.limit_in_bytes", memory_limit), "memory.limit_in_bytes");
    check(cgroup_add_value_int64(memory, "memory.memsw.limit_in_bytes", memory_limit), "memory.memsw.limit_in_bytes");

    add_controller(cg.get(), "cpuacct");

    check(cgroup_create_cgroup(cg.get(), 1), fmt::format("cgroup_create_cgroup({})", cgname));
}

void run_cgroup::attach(pid_t pid) {
    cgroup_handle cg = read_handle(cgname);
    check(cgroup_attach_task_pid(cg.get(), pid), fmt::format("cgroup_attach_task_pid({}, {})", cgname, pid));
}

set<pid_t> run_cgroup::tasks() const {
    set<pid_t> result;
    void *handle = nullptr;
    pid_t pid;
    int ret = cgroup_get_task_begin(cgname.c_str(), "memory", &handle, &pid);
    while (ret == 0) {
        result.insert(pid);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
    return result;
}

bool run_cgroup::kill_all() {
    // killed processes take a moment to leave the task list
    for (int round = 0; round < 50; ++round) {
        set<pid_t> alive = tasks();
        if (alive.empty()) return true;
        for (pid_t task : alive)
            kill(task, SIGKILL);
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    return false;
}

cgroup_usage run_cgroup::usage() const {
    cgroup_handle cg = read_handle(cgname);

    cgroup_usage result;
    result.memory_peak = read_value(cg.get(), "memory", "memory.memsw.max_usage_in_bytes");
    result.cpu_time = read_value(cg.get(), "cpuacct", "cpuacct.usage") / 1e9;

    // "oom_kill <count>" is one line of a multi-line value libcgroup cannot read
    ifstream fin("/sys/fs/cgroup/memory" + cgname + "/memory.oom_control");
    string key;
    int64_t count;
    while (fin >> key >> count) {
        if (key == "oom_kill") result.oom = count > 0;
    }
    return result;
}

void run_cgroup::remove() {
    cgroup_handle cg = new_handle(cgname);
    add_controller(cg.get(), "cpuacct");
    add_controller(cg.get(), "memory");
    check(cgroup_delete_cgroup_ext(cg.get(), CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE),
          fmt::format("cgroup_delete_cgroup({})", cgname));
}

const string &run_cgroup::name() const {
    return cgname;
}
