#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "cgroup.hpp"
#include "limits.hpp"

using namespace std;

extern char **environ;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const int TIMELIMIT_SOFT = 1;
const int TIMELIMIT_HARD = 2;

const int POLL_INTERVAL_MS = 20;

// output of processes killed at the end of a run is still collected this long
const chrono::milliseconds DRAIN_TIMEOUT(200);

template <typename... Args>
[[noreturn]] void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

/**
 * @brief Written by the child to the error pipe when it fails before exec.
 */
struct child_failure {
    int step;
    int err;
};

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief Everything a run holds on the watchdog side.
 * Destruction kills and reaps a child that is still alive, closes every
 * pipe and deletes the control group, so any exception leaves nothing behind.
 */
struct child_resources {
    const runguard_options &opt;
    unique_ptr<run_cgroup> cgroup;
    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int error_pipefd[2] = {-1, -1};
    int sync_pipefd[2] = {-1, -1};
    int status_pipefd[2] = {-1, -1};
    pid_t child_pid = -1;
    bool reaped = false;

    explicit child_resources(const runguard_options &opt) : opt(opt) {}

    ~child_resources() {
        if (child_pid > 0 && !reaped) {
            kill(-child_pid, SIGKILL);
            kill(child_pid, SIGKILL);
            while (waitpid(child_pid, nullptr, 0) < 0 && errno == EINTR)
                ;
        }

        for (auto &fds : child_pipefd) {
            close_fd(fds[PIPE_IN]);
            close_fd(fds[PIPE_OUT]);
        }
        for (int i = 0; i < 2; ++i) {
            close_fd(error_pipefd[i]);
            close_fd(sync_pipefd[i]);
            close_fd(status_pipefd[i]);
        }

        if (cgroup) {
            try {
                if (!cgroup->kill_all())
                    LOG(WARNING) << "processes survived in cgroup " << cgroup->name();
                cgroup->remove();
            } catch (const exception &e) {
                LOG(ERROR) << "unable to clean up cgroup " << cgroup->name() << ": " << e.what();
            }
        }
    }
};

static string resolve_program(const string &name) {
    // relative paths are resolved against work_dir by execve after chdir
    if (name.find('/') != string::npos) return name;

    const char *env_path = getenv("PATH");
    string path = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == string::npos) end = path.size();
        string dir = path.substr(start, end - start);
        if (!dir.empty()) {
            string candidate = dir + "/" + name;
            struct stat st;
            if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0)
                return candidate;
        }
        start = end + 1;
    }
    return "";
}

static vector<string> build_env(const runguard_options &opt) {
    vector<string> env;
    if (opt.preserve_sys_env) {
        for (char **entry = environ; *entry; ++entry)
            env.emplace_back(*entry);
    } else if (const char *path = getenv("PATH")) {
        env.push_back(string("PATH=") + path);
    }
    for (auto &entry : opt.env)
        env.push_back(entry);
    return env;
}

[[noreturn]] static void report_failure(int error_fd, int step) {
    child_failure failure{step, errno};
    ssize_t r = write(error_fd, &failure, sizeof(failure));
    (void)r;
    _exit(127);
}

static void close_child_pipes(int child_pipefd[3][2]) {
    for (int i = 0; i < 3; ++i) {
        close(child_pipefd[i][PIPE_IN]);
        close(child_pipefd[i][PIPE_OUT]);
    }
}

[[noreturn]] static void exec_command(const runguard_options &opt, const char *program,
                                      char *const argv[], char *const envp[],
                                      int child_pipefd[3][2], int error_fd) {
    int step = set_restrictions(opt);
    if (step != STEP_NONE) report_failure(error_fd, step);

    if (dup2(child_pipefd[STDIN_FILENO][PIPE_OUT], STDIN_FILENO) < 0 ||
        dup2(child_pipefd[STDOUT_FILENO][PIPE_IN], STDOUT_FILENO) < 0 ||
        dup2(child_pipefd[STDERR_FILENO][PIPE_IN], STDERR_FILENO) < 0)
        report_failure(error_fd, STEP_REDIRECT);

    execve(program, argv, envp);
    report_failure(error_fd, STEP_EXEC);
}

/**
 * @brief Init of the PID namespace of the run.
 * Reaps orphans until the command ends, hands its wait status to the
 * watchdog and exits, which makes the kernel kill the rest of the namespace.
 */
[[noreturn]] static void run_init(const runguard_options &opt, const char *program,
                                  char *const argv[], char *const envp[],
                                  int child_pipefd[3][2], int error_fd, int status_fd) {
    pid_t command_pid = fork();
    if (command_pid == -1) report_failure(error_fd, STEP_FORK);
    if (command_pid == 0) exec_command(opt, program, argv, envp, child_pipefd, error_fd);

    close(error_fd);
    close_child_pipes(child_pipefd);

    int status = 0;
    while (true) {
        int st;
        pid_t pid = waitpid(-1, &st, 0);
        if (pid == command_pid) {
            status = st;
            break;
        }
        if (pid < 0 && errno != EINTR) _exit(127);
    }

    ssize_t r = write(status_fd, &status, sizeof(status));
    _exit(r == (ssize_t)sizeof(status) ? 0 : 127);
}

[[noreturn]] static void run_child(const runguard_options &opt, const char *program,
                                   char *const argv[], char *const envp[],
                                   int child_pipefd[3][2], int error_fd, int sync_fd, int status_fd) {
    // the mask and the ignored SIGPIPE of the watchdog thread are inherited
    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = SIG_DFL;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGPIPE, &sigact, nullptr);

    // wait until the watchdog has put us into the control group
    char go;
    ssize_t n;
    do {
        n = read(sync_fd, &go, 1);
    } while (n < 0 && errno == EINTR);
    if (n != 1) {
        errno = EPIPE;
        report_failure(error_fd, STEP_SYNC);
    }

    int step = enter_namespaces(opt);
    if (step != STEP_NONE) report_failure(error_fd, step);

    if (!opt.isolate_processes)
        exec_command(opt, program, argv, envp, child_pipefd, error_fd);

    pid_t init_pid = fork();
    if (init_pid == -1) report_failure(error_fd, STEP_FORK);
    if (init_pid == 0) run_init(opt, program, argv, envp, child_pipefd, error_fd, status_fd);

    close(error_fd);
    close(status_fd);
    close_child_pipes(child_pipefd);

    int status;
    while (waitpid(init_pid, &status, 0) < 0) {
        if (errno != EINTR) _exit(127);
    }
    // the command status travels through the status pipe, this one only
    // matters when the init itself was killed
    if (WIFSIGNALED(status)) {
        struct rlimit no_core = {0, 0};
        setrlimit(RLIMIT_CORE, &no_core);
        sigaction(WTERMSIG(status), &sigact, nullptr);
        kill(getpid(), WTERMSIG(status));
    }
    _exit(WIFEXITED(status) ? WEXITSTATUS(status) : 127);
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "fcntl, setting flags of fd {}", fd);
}

static void pump_input(int &fd, const string &data, size_t &written) {
    while (fd >= 0 && written < data.size()) {
        ssize_t nwritten = write(fd, data.data() + written, min<size_t>(BUF_SIZE * 16, data.size() - written));
        if (nwritten == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            // the command closed its stdin without reading everything
            if (errno == EPIPE) break;
            error(errno, "writing stdin of command");
        }
        written += nwritten;
    }
    close_fd(fd);
}

static void pump_output(int &fd, string &data, size_t &total, bool &truncated, int64_t stream_size) {
    char buf[BUF_SIZE];
    // bounded, so that a command flooding its output cannot starve the watchdog
    for (int round = 0; round < 16 && fd >= 0; ++round) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            error(errno, "copying data fd {}", fd);
        }
        if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            close_fd(fd);
            return;
        }
        total += nread;

        /* Throw away data if we're at the output limit, but
           still count how much data we consumed */
        size_t keep = nread;
        if (stream_size >= 0) {
            size_t room = data.size() < (size_t)stream_size ? (size_t)stream_size - data.size() : 0;
            if (keep > room) {
                keep = room;
                truncated = true;
            }
        }
        data.append(buf, keep);
    }
}

static void wait_child(pid_t pid, int &status, struct rusage &usage) {
    while (wait4(pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) error(errno, "waiting on child");
    }
}

static void kill_child(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to command");
}

runguard_result runit(const struct runguard_options &opt) {
    // the command may exit without reading its stdin, the watchdog must
    // see EPIPE instead of dying from SIGPIPE
    static once_flag sigpipe_flag;
    call_once(sigpipe_flag, [] { signal(SIGPIPE, SIG_IGN); });

    if (opt.command.empty())
        throw invalid_argument("runit: no command given");

    runguard_result result;

    string program = resolve_program(opt.command[0]);
    if (program.empty()) {
        result.internal_error = fmt::format("unable to start command {}: not found", opt.command[0]);
        LOG(WARNING) << result.internal_error;
        return result;
    }

    // the child cannot allocate after fork, prepare everything here
    vector<string> env = build_env(opt);
    vector<string> command = opt.command;
    vector<char *> argv, envp;
    for (auto &arg : command) argv.push_back(arg.data());
    argv.push_back(nullptr);
    for (auto &entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);

    child_resources res(opt);

    if (!opt.cgroupname.empty()) {
        run_cgroup::init();
        auto cgroup = make_unique<run_cgroup>(opt.cgroupname);
        cgroup->create(opt.memory_limit);
        res.cgroup = move(cgroup);
    }

    for (int i = 0; i < 3; i++) {
        if (pipe2(res.child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(res.error_pipefd, O_CLOEXEC) != 0) error(errno, "creating error pipe");
    if (pipe2(res.sync_pipefd, O_CLOEXEC) != 0) error(errno, "creating sync pipe");
    if (pipe2(res.status_pipefd, O_CLOEXEC | O_NONBLOCK) != 0) error(errno, "creating status pipe");

    switch (res.child_pid = fork()) {
        case -1:
            error(errno, "unable to fork");
        case 0:
            run_child(opt, program.c_str(), argv.data(), envp.data(),
                      res.child_pipefd, res.error_pipefd[PIPE_IN], res.sync_pipefd[PIPE_OUT],
                      res.status_pipefd[PIPE_IN]);
        default:
            break;
    }

    /* Close unused file descriptors */
    close_fd(res.child_pipefd[STDIN_FILENO][PIPE_OUT]);
    close_fd(res.child_pipefd[STDOUT_FILENO][PIPE_IN]);
    close_fd(res.child_pipefd[STDERR_FILENO][PIPE_IN]);
    close_fd(res.error_pipefd[PIPE_IN]);
    close_fd(res.sync_pipefd[PIPE_OUT]);
    close_fd(res.status_pipefd[PIPE_IN]);

    if (res.cgroup)
        res.cgroup->attach(res.child_pid);

    if (write(res.sync_pipefd[PIPE_IN], "x", 1) != 1)
        error(errno, "releasing child");
    close_fd(res.sync_pipefd[PIPE_IN]);

    {
        // the error pipe is closed on exec, EOF means the command is running
        child_failure failure;
        ssize_t n;
        do {
            n = read(res.error_pipefd[PIPE_OUT], &failure, sizeof(failure));
        } while (n < 0 && errno == EINTR);
        close_fd(res.error_pipefd[PIPE_OUT]);

        if (n == (ssize_t)sizeof(failure)) {
            if (failure.step == STEP_EXEC)
                result.internal_error = fmt::format("{} {}: {}", restriction_step_name(failure.step), opt.command[0], system_category().message(failure.err));
            else
                result.internal_error = fmt::format("{}: {}", restriction_step_name(failure.step), system_category().message(failure.err));
            LOG(WARNING) << result.internal_error;
            int status;
            struct rusage usage;
            wait_child(res.child_pid, status, usage);
            res.reaped = true;
            return result;
        }
    }

    auto starttime = chrono::steady_clock::now();

    int &stdin_fd = res.child_pipefd[STDIN_FILENO][PIPE_IN];
    int &stdout_fd = res.child_pipefd[STDOUT_FILENO][PIPE_OUT];
    int &stderr_fd = res.child_pipefd[STDERR_FILENO][PIPE_OUT];
    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);
    if (opt.stdin_data.empty()) close_fd(stdin_fd);

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    int walllimit = 0, cpulimit = 0;

    auto pump = [&]() {
        if (stdin_fd >= 0) pump_input(stdin_fd, opt.stdin_data, result.stdin_bytes);
        if (stdout_fd >= 0) pump_output(stdout_fd, result.stdout_data, result.stdout_bytes, result.stdout_truncated, opt.stream_size);
        if (stderr_fd >= 0) pump_output(stderr_fd, result.stderr_data, result.stderr_bytes, result.stderr_truncated, opt.stream_size);
    };

    auto poll_pipes = [&](int timeout_ms) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (stdin_fd >= 0) fds[nfds++] = {stdin_fd, POLLOUT, 0};
        if (stdout_fd >= 0) fds[nfds++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[nfds++] = {stderr_fd, POLLIN, 0};
        if (nfds == 0) {
            this_thread::sleep_for(chrono::milliseconds(timeout_ms));
            return;
        }
        if (poll(fds, nfds, timeout_ms) < 0 && errno != EINTR)
            error(errno, "waiting for child data");
    };

    if (opt.use_wall_limit)
        DLOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);

    while (true) {
        poll_pipes(POLL_INTERVAL_MS);
        pump();

        pid_t pid = wait4(res.child_pid, &status, WNOHANG, &usage);
        if (pid < 0 && errno != EINTR) error(errno, "waiting on child");
        if (pid == res.child_pid) break;

        double elapsed = chrono::duration<double>(chrono::steady_clock::now() - starttime).count();
        if (opt.use_wall_limit && elapsed > opt.wall_limit.hard) {
            walllimit |= TIMELIMIT_HARD;
            LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
            kill_child(res.child_pid);
            wait_child(res.child_pid, status, usage);
            break;
        }
        if (opt.should_abort && opt.should_abort()) {
            result.aborted = true;
            LOG(WARNING) << "run aborted: killing command";
            kill_child(res.child_pid);
            wait_child(res.child_pid, status, usage);
            break;
        }
    }
    res.reaped = true;
    auto endtime = chrono::steady_clock::now();

    if (opt.isolate_processes) {
        // the reaped child is the outer process, the namespace init
        // reports how the command itself ended
        int command_status;
        ssize_t n;
        do {
            n = read(res.status_pipefd[PIPE_OUT], &command_status, sizeof(command_status));
        } while (n < 0 && errno == EINTR);
        if (n == (ssize_t)sizeof(command_status)) status = command_status;
    }

    // no process of the run may survive it, leftovers would also hold the pipes open
    if (kill(-res.child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process group " << res.child_pid << ": " << system_category().message(errno);
    if (res.cgroup && !res.cgroup->kill_all())
        LOG(WARNING) << "processes survived in cgroup " << opt.cgroupname;

    close_fd(stdin_fd);
    auto drain_deadline = chrono::steady_clock::now() + DRAIN_TIMEOUT;
    while ((stdout_fd >= 0 || stderr_fd >= 0) && chrono::steady_clock::now() < drain_deadline) {
        poll_pipes(POLL_INTERVAL_MS);
        pump();
    }
    if (stdout_fd >= 0 || stderr_fd >= 0)
        LOG(WARNING) << "output of command " << opt.command[0] << " still open after it was killed";

    result.wall_time = chrono::duration<double>(endtime - starttime).count();
    result.user_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec * 1E-6;
    result.sys_time = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec * 1E-6;
    result.cpu_time = result.user_time + result.sys_time;
    result.memory = (int64_t)usage.ru_maxrss * 1024;

    if (res.cgroup) {
        try {
            cgroup_usage accounted = res.cgroup->usage();
            result.memory = accounted.memory_peak;
            result.cpu_time = accounted.cpu_time;
            result.oom = accounted.oom;
        } catch (const cgroup_exception &e) {
            LOG(WARNING) << "unable to read usage of cgroup " << opt.cgroupname << ": " << e.what();
        }
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (result.signal == SIGXCPU) {
            cpulimit |= TIMELIMIT_HARD;
            LOG(WARNING) << "Time Limit Exceeded (hard limit)";
        }
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    DLOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}, cpu {:.3f}",
                              result.wall_time, result.user_time, result.sys_time, result.cpu_time);

    if (opt.use_wall_limit && result.wall_time > opt.wall_limit.soft) {
        walllimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft wall time)";
    }

    if (opt.use_cpu_limit && result.cpu_time > opt.cpu_limit.soft) {
        cpulimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
    }

    static const char output_timelimit_str[4][16] = {
        "",
        "soft-timelimit",
        "hard-timelimit",
        "hard-timelimit"};
    result.time_result = output_timelimit_str[walllimit | cpulimit];

    return result;
}
