#include "sandbox/process_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "cgroup.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "run.hpp"

namespace codegrade {
using namespace std;

static execution_outcome make_outcome(runguard_result &result) {
    execution_outcome outcome;
    outcome.output = move(result.stdout_data);
    outcome.error = move(result.stderr_data);
    outcome.exitcode = result.exitcode;
    outcome.signal = result.signal;
    outcome.wall_time = result.wall_time;
    outcome.cpu_time = result.cpu_time;
    outcome.memory_kb = result.memory > 0 ? result.memory / 1024 : 0;
    outcome.output_truncated = result.stdout_truncated || result.stderr_truncated;
    return outcome;
}

static string describe_exit(const runguard_result &result) {
    if (result.signal >= 0)
        return fmt::format("killed by signal {} ({})", result.signal, strsignal(result.signal));
    return fmt::format("exited with code {}", result.exitcode);
}

process_sandbox::process_sandbox(sandbox_options options) : opts(move(options)) {
    if (opts.run_dir.empty())
        throw invalid_argument("sandbox needs a run directory");
    opts.run_dir = filesystem::absolute(opts.run_dir);
}

const sandbox_options &process_sandbox::options() const {
    return opts;
}

void process_sandbox::probe() {
    filesystem::path workdir;
    try {
        filesystem::create_directories(opts.run_dir / "scratch");
        filesystem::create_directories(opts.run_dir / "artifacts");
        if (opts.use_cgroup)
            run_cgroup::init();
        workdir = create_workspace(opts.run_dir / "scratch");
    } catch (std::exception &ex) {
        throw sandbox_unavailable(fmt::format("unable to prepare run directory {}: {}", opts.run_dir, ex.what()));
    }
    defer { remove_workspace(workdir); };

    runguard_result result;
    try {
        resource_limits limits;
        limits.time_limit = 5;
        limits.memory_limit = 64;
        result = runit(build_options(workdir, {"true"}, "", limits, cancellation_token()));
    } catch (std::exception &ex) {
        throw sandbox_unavailable(fmt::format("sandbox cannot start programs: {}", ex.what()));
    }

    if (!result.internal_error.empty())
        throw sandbox_unavailable(fmt::format("sandbox cannot start programs: {}", result.internal_error));
    if (result.exitcode != 0)
        throw sandbox_unavailable(fmt::format("probe program {}", describe_exit(result)));

    LOG(INFO) << "Sandbox ready in " << opts.run_dir
              << (opts.use_cgroup ? " with cgroup" : " without cgroup")
              << (opts.isolate_network ? "" : ", network isolation disabled")
              << (opts.isolate_processes ? "" : ", PID namespace disabled");
}

execution_outcome process_sandbox::run(const sandbox_payload &payload,
                                       const string &input,
                                       const resource_limits &limits,
                                       const cancellation_token &token) {
    if (token.cancelled())
        return execution_outcome::system_error(token.reason());

    resource_limits max = sandbox_max_limits();
    if (!(limits.time_limit > 0 && limits.time_limit <= max.time_limit &&
          limits.memory_limit > 0 && limits.memory_limit <= max.memory_limit))
        return execution_outcome::system_error(fmt::format("unsupported limits: time limit {} and memory limit {}",
                                                           limits.time_limit, limits.memory_limit));

    try {
        return visit(overloaded{
                         [&](const source_payload &src) { return compile(src, limits, token); },
                         [&](const compiled_artifact *artifact) {
                             if (!artifact) throw internal_error("no artifact to run");
                             return execute(*artifact, input, limits, token);
                         }},
                     payload);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Sandbox run failed: " << ex.what();
        return execution_outcome::system_error(fmt::format("sandbox failure: {}", ex.what()));
    }
}

execution_outcome process_sandbox::compile(const source_payload &src, const resource_limits &limits, const cancellation_token &token) {
    filesystem::path workdir = create_workspace(opts.run_dir / "scratch");
    defer { remove_workspace(workdir); };

    write_file_content(workdir / assert_safe_path(src.lang.source_file), src.source);

    runguard_result result = runit(build_options(workdir, src.lang.compile_command, "", limits, token));
    if (!result.internal_error.empty())
        return execution_outcome::system_error(result.internal_error);
    if (result.aborted)
        return execution_outcome::system_error(token.reason());

    execution_outcome outcome = make_outcome(result);
    outcome.kind = outcome_kind::COMPILE_FAILED;
    if (result.oom) {
        outcome.diagnostic = fmt::format("compilation exceeded the memory limit of {} MB", limits.memory_limit);
        return outcome;
    }
    if (!result.time_result.empty()) {
        outcome.diagnostic = fmt::format("compilation exceeded the time limit of {} seconds", limits.time_limit);
        return outcome;
    }
    if (result.exitcode != 0) {
        // gcc reports to stderr, other toolchains use stdout
        string message = outcome.error + outcome.output;
        if (message.empty()) message = "compiler " + describe_exit(result);
        outcome.diagnostic = truncate_text(message, opts.diagnostic_limit);
        return outcome;
    }

    filesystem::path artifact_dir = create_workspace(opts.run_dir / "artifacts");
    auto artifact = make_unique<compiled_artifact>(artifact_dir, src.lang, opts.keep_workspace);
    for (auto &file : src.lang.artifact_files) {
        filesystem::path built = workdir / file;
        if (!filesystem::is_regular_file(built)) {
            outcome.diagnostic = fmt::format("compiler did not produce {}", file);
            return outcome;
        }
        filesystem::path target = artifact_dir / file;
        filesystem::create_directories(target.parent_path());
        filesystem::rename(built, target);
    }

    DLOG(INFO) << "Compiled " << src.lang.name << " program into " << artifact_dir;
    outcome.kind = outcome_kind::SUCCESS;
    outcome.artifact = move(artifact);
    return outcome;
}

execution_outcome process_sandbox::execute(const compiled_artifact &artifact, const string &input,
                                           const resource_limits &limits, const cancellation_token &token) {
    filesystem::path workdir = create_workspace(opts.run_dir / "scratch");
    defer { remove_workspace(workdir); };

    for (auto &file : artifact.lang().artifact_files) {
        filesystem::path target = workdir / file;
        filesystem::create_directories(target.parent_path());
        filesystem::copy_file(artifact.directory() / file, target);
    }

    runguard_result result = runit(build_options(workdir, artifact.lang().run_command, input, limits, token));
    if (!result.internal_error.empty())
        return execution_outcome::system_error(result.internal_error);
    if (result.aborted)
        return execution_outcome::system_error(token.reason());

    execution_outcome outcome = make_outcome(result);
    if (result.oom) {
        outcome.kind = outcome_kind::MEMORY_EXCEEDED;
        outcome.diagnostic = fmt::format("memory limit of {} MB exceeded", limits.memory_limit);
    } else if (!result.time_result.empty() || result.signal == SIGXCPU) {
        outcome.kind = outcome_kind::TIME_EXCEEDED;
        outcome.diagnostic = fmt::format("time limit of {} seconds exceeded", limits.time_limit);
    } else if (result.exitcode != 0 || result.signal >= 0) {
        outcome.kind = outcome_kind::RUNTIME_ERROR;
        outcome.diagnostic = describe_exit(result);
        if (!outcome.error.empty())
            outcome.diagnostic += "\n" + truncate_text(outcome.error, opts.diagnostic_limit);
    } else {
        outcome.kind = outcome_kind::SUCCESS;
    }
    return outcome;
}

filesystem::path process_sandbox::create_workspace(const filesystem::path &parent) {
    // random_generator is not thread safe
    thread_local boost::uuids::random_generator generator;
    filesystem::path dir = parent / boost::uuids::to_string(generator());
    filesystem::create_directories(dir);
    if (opts.user_id >= 0 && chown(dir.c_str(), opts.user_id, opts.group_id) != 0)
        throw system_error(errno, system_category(), fmt::format("unable to chown {}", dir));
    return dir;
}

void process_sandbox::remove_workspace(const filesystem::path &dir) {
    if (dir.empty() || opts.keep_workspace) return;

    error_code ec;
    filesystem::remove_all(dir, ec);
    if (ec)
        LOG(ERROR) << "Unable to remove workspace " << dir << ": " << ec.message();
}

runguard_options process_sandbox::build_options(const filesystem::path &workdir,
                                                const vector<string> &command,
                                                const string &input,
                                                const resource_limits &limits,
                                                const cancellation_token &token) {
    runguard_options opt;
    if (opts.use_cgroup)
        opt.cgroupname = "/codegrade/" + workdir.filename().string();
    opt.work_dir = workdir.string();
    opt.user_id = opts.user_id;
    opt.group_id = opts.group_id;
    // RLIMIT_NPROC counts every process of the user, only meaningful for a dedicated one
    if (opts.user_id >= 0)
        opt.nproc = opts.process_limit;

    opt.use_wall_limit = true;
    opt.wall_limit = {limits.time_limit, limits.time_limit + opts.wall_grace};
    opt.use_cpu_limit = true;
    opt.cpu_limit = {limits.time_limit, limits.time_limit};

    opt.memory_limit = limits.memory_limit * 1024 * 1024;
    opt.file_limit = opts.file_limit;
    opt.stream_size = opts.output_limit;
    opt.no_core_dumps = true;
    opt.isolate_network = opts.isolate_network;
    opt.isolate_processes = opts.isolate_processes;

    opt.stdin_data = input;
    opt.env = {"HOME=" + workdir.string(), "TMPDIR=" + workdir.string()};
    opt.command = command;
    opt.should_abort = [token] { return token.cancelled(); };
    return opt;
}

}  // namespace codegrade
