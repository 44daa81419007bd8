#include <glog/logging.h>
#include <pthread.h>
#include <signal.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/system.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "feedback/feedback.hpp"
#include "judge/json.hpp"
#include "judge/orchestrator.hpp"
#include "language/language.hpp"
#include "sandbox/process_sandbox.hpp"
#include "sandbox/slot_pool.hpp"
#include "worker.hpp"
using namespace std;

/**
 * @brief One request file of the command line and its fate.
 */
struct pending_request {
    filesystem::path file;
    codegrade::judge_request request;
    future<codegrade::judge_report> report;
    string error;
};

/**
 * @brief Stop the judge service on SIGINT or SIGTERM.
 * Signals are taken with sigwait by a dedicated thread, so stopping the
 * service does not happen inside a signal handler. SIGUSR1 ends the thread.
 */
static thread start_signal_thread(codegrade::judge_service &service, sigset_t signals) {
    return thread([&service, signals] {
        while (true) {
            int signum;
            if (sigwait(&signals, &signum) != 0 || signum == SIGUSR1) return;
            LOG(ERROR) << "Received " << strsignal(signum) << ", stopping workers";
            service.stop();
        }
    });
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codegrade options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<vector<string>>(), "judge the request in given JSON file, can be given multiple times")
        ("output-dir", po::value<string>(), "write the report of request <name>.json to <name>.report.json in given directory instead of printing all reports to stdout")
        ("workers", po::value<size_t>()->default_value(1), "number of submissions judged at the same time")
        ("sandbox-slots", po::value<size_t>(), "number of programs running at the same time, default to the number of cores")
        ("parallel-tests", po::value<size_t>()->default_value(1), "number of test cases of one submission judged at the same time")
        ("run-dir", po::value<string>(), "set the directory to run user programs, store compiled user program. You can either pass it from environ RUNDIR")
        ("compile-time-limit", po::value<double>(), "set time limit in seconds for compilers, default to 10(10 second)")
        ("compile-memory-limit", po::value<int64_t>(), "set memory limit in MB for compilers, default to 512(512MB)")
        ("max-time-limit", po::value<double>(), "set largest time limit in seconds a problem may ask for, default to 60(60 second)")
        ("max-memory-limit", po::value<int64_t>(), "set largest memory limit in MB a problem may ask for, default to the physical memory of the host")
        ("output-limit", po::value<int64_t>(), "set bytes of stdout and stderr kept per program run, default to 1048576(1MB)")
        ("diagnostic-limit", po::value<int64_t>(), "set bytes of compiler messages kept in a report, default to 16384(16KB)")
        ("file-limit", po::value<int64_t>(), "set maximum size in bytes of files written by user programs, default to 67108864(64MB)")
        ("wall-grace", po::value<double>(), "set seconds a program may run past its time limit before it is killed, default to 1")
        ("cgroup", "limit memory of user programs with cgroup, requires root and a cgroup v1 memory hierarchy")
        ("no-network-isolation", "do not move user programs into a network namespace, for hosts without namespace support")
        ("no-pid-namespace", "do not run user programs under their own PID namespace, processes leaving the process group of a program may then survive it unless --cgroup is given")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("language-config", po::value<string>(), "add or replace languages with the JSON table in given file")
        ("feedback-command", po::value<string>(), "explain every report with given command, invoked as <command> request.json feedback.txt")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode, and not to delete run directories to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    po::positional_options_description positional;
    positional.add("request", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codegrade: Judge submissions against test cases in a sandbox" << endl
             << "Usage: " << argv[0] << " [options] request.json..." << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codegrade 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        codegrade::DEBUG = true;
    } else if (getenv("DEBUG")) {
        codegrade::DEBUG = true;
    }

    if (vm.count("run-dir")) {
        codegrade::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        codegrade::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    CHECK(!codegrade::RUN_DIR.empty())
        << "Run directory should be specified by --run-dir or environ RUNDIR";
    CHECK(filesystem::is_directory(codegrade::RUN_DIR))
        << "Run directory " << codegrade::RUN_DIR << " does not exist";

    if (vm.count("compile-time-limit"))
        codegrade::COMPILE_TIME_LIMIT = vm["compile-time-limit"].as<double>();
    if (vm.count("compile-memory-limit"))
        codegrade::COMPILE_MEMORY_LIMIT = vm["compile-memory-limit"].as<int64_t>();
    if (vm.count("max-time-limit"))
        codegrade::MAX_TIME_LIMIT = vm["max-time-limit"].as<double>();
    if (vm.count("max-memory-limit"))
        codegrade::MAX_MEMORY_LIMIT = vm["max-memory-limit"].as<int64_t>();
    else
        codegrade::MAX_MEMORY_LIMIT = (int64_t)sysconf(_SC_PHYS_PAGES) * sysconf(_SC_PAGESIZE) / (1 << 20);
    if (vm.count("output-limit"))
        codegrade::OUTPUT_LIMIT = vm["output-limit"].as<int64_t>();
    if (vm.count("diagnostic-limit"))
        codegrade::DIAGNOSTIC_LIMIT = vm["diagnostic-limit"].as<int64_t>();
    if (vm.count("file-limit"))
        codegrade::FILE_LIMIT = vm["file-limit"].as<int64_t>();
    if (vm.count("wall-grace"))
        codegrade::WALL_GRACE = vm["wall-grace"].as<double>();
    CHECK(codegrade::COMPILE_TIME_LIMIT > 0 && codegrade::COMPILE_MEMORY_LIMIT > 0)
        << "Compile limits should be positive";
    CHECK(codegrade::MAX_TIME_LIMIT > 0 && codegrade::MAX_MEMORY_LIMIT > 0)
        << "Largest problem limits should be positive";
    CHECK(codegrade::OUTPUT_LIMIT > 0 && codegrade::DIAGNOSTIC_LIMIT > 0 && codegrade::FILE_LIMIT > 0)
        << "Output, diagnostic and file limits should be positive";
    CHECK(codegrade::WALL_GRACE >= 0) << "Wall grace should not be negative";

    codegrade::USE_CGROUP = vm.count("cgroup") > 0;
    if (codegrade::USE_CGROUP && getuid() != 0) {
        cerr << "You should run this program in privileged mode to use cgroup" << endl;
        if (!codegrade::DEBUG) return EXIT_FAILURE;
    }

    string runuser = vm.count("run-user") ? vm["run-user"].as<string>() : codegrade::get_env("RUNUSER", "");
    string rungroup = vm.count("run-group") ? vm["run-group"].as<string>() : codegrade::get_env("RUNGROUP", "");
    if (!runuser.empty()) {
        codegrade::RUN_USER_ID = codegrade::get_userid(runuser.c_str());
        CHECK(codegrade::RUN_USER_ID >= 0) << "Run user " << runuser << " does not exist";
        // the group defaults to the one of the same name
        if (rungroup.empty()) rungroup = runuser;
    }
    if (!rungroup.empty()) {
        codegrade::RUN_GROUP_ID = codegrade::get_groupid(rungroup.c_str());
        CHECK(codegrade::RUN_GROUP_ID >= 0) << "Run group " << rungroup << " does not exist";
    }
    if (codegrade::RUN_USER_ID >= 0 && getuid() != 0) {
        cerr << "You should run this program in privileged mode to switch to run user " << runuser << endl;
        return EXIT_FAILURE;
    }

    // only the judge may write to the files it creates
    umask(0022);

    codegrade::language_registry languages = codegrade::language_registry::defaults();
    if (vm.count("language-config")) {
        filesystem::path config(vm["language-config"].as<string>());
        CHECK(filesystem::is_regular_file(config))
            << "Language configuration file " << config << " does not exist";
        try {
            languages.load(config);
        } catch (std::exception& e) {
            LOG(FATAL) << "Language configuration file " << config << " is malformed: " << e.what();
        }
    }

    codegrade::sandbox_options sandbox_opts;
    sandbox_opts.run_dir = codegrade::RUN_DIR;
    sandbox_opts.use_cgroup = codegrade::USE_CGROUP;
    sandbox_opts.user_id = codegrade::RUN_USER_ID;
    sandbox_opts.group_id = codegrade::RUN_GROUP_ID;
    sandbox_opts.output_limit = codegrade::OUTPUT_LIMIT;
    sandbox_opts.diagnostic_limit = codegrade::DIAGNOSTIC_LIMIT;
    sandbox_opts.file_limit = codegrade::FILE_LIMIT;
    sandbox_opts.wall_grace = codegrade::WALL_GRACE;
    sandbox_opts.isolate_network = vm.count("no-network-isolation") == 0;
    sandbox_opts.isolate_processes = vm.count("no-pid-namespace") == 0;
    sandbox_opts.keep_workspace = codegrade::DEBUG;

    codegrade::process_sandbox box(sandbox_opts);
    try {
        box.probe();
    } catch (codegrade::sandbox_unavailable& e) {
        LOG(ERROR) << "Sandbox is unavailable: " << e.what();
        cerr << "Sandbox is unavailable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    size_t slots = vm.count("sandbox-slots") ? vm["sandbox-slots"].as<size_t>() : max(1u, thread::hardware_concurrency());
    CHECK(slots > 0) << "Sandbox slots should be positive";
    codegrade::slot_pool pool(slots);
    codegrade::pooled_sandbox pooled(box, pool);

    codegrade::orchestrator_options orchestrator_opts;
    orchestrator_opts.compile_limits.time_limit = codegrade::COMPILE_TIME_LIMIT;
    orchestrator_opts.compile_limits.memory_limit = codegrade::COMPILE_MEMORY_LIMIT;
    orchestrator_opts.max_limits.time_limit = codegrade::MAX_TIME_LIMIT;
    orchestrator_opts.max_limits.memory_limit = codegrade::MAX_MEMORY_LIMIT;
    orchestrator_opts.wall_grace = codegrade::WALL_GRACE;
    orchestrator_opts.harness.parallelism = max<size_t>(1, vm["parallel-tests"].as<size_t>());
    codegrade::submission_orchestrator orchestrator(pooled, languages, orchestrator_opts);

    unique_ptr<codegrade::feedback_provider> feedback;
    if (vm.count("feedback-command")) {
        vector<string> command;
        string line = boost::trim_copy(vm["feedback-command"].as<string>());
        boost::split(command, line, boost::is_any_of(" "), boost::token_compress_on);
        feedback = make_unique<codegrade::command_feedback>(command, codegrade::RUN_DIR / "feedback");
    }

    filesystem::path output_dir;
    if (vm.count("output-dir")) {
        output_dir = vm["output-dir"].as<string>();
        filesystem::create_directories(output_dir);
    }

    size_t workers = vm["workers"].as<size_t>();
    CHECK(workers > 0) << "Worker count should be positive";

    // block the signals before any thread starts, so only the signal thread takes them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    codegrade::judge_service service(orchestrator, workers);
    thread signal_thread = start_signal_thread(service, signals);

    vector<pending_request> requests;
    for (auto& file : vm.count("request") ? vm["request"].as<vector<string>>() : vector<string>()) {
        pending_request& pending = requests.emplace_back();
        pending.file = file;
        try {
            pending.request = codegrade::parse_request(codegrade::read_file_content(pending.file));
            pending.report = service.submit(pending.request);
        } catch (std::exception& e) {
            LOG(WARNING) << "Request " << pending.file << " is rejected: " << e.what();
            pending.error = e.what();
        }
    }

    nlohmann::json all = nlohmann::json::array();
    for (auto& pending : requests) {
        nlohmann::json result;
        if (pending.error.empty()) {
            try {
                codegrade::judge_report report = pending.report.get();
                result = report;
                if (feedback)
                    result["feedback"] = codegrade::request_feedback(*feedback, report, pending.request.submission, pending.request.problem);
            } catch (std::exception& e) {
                pending.error = e.what();
            }
        }
        if (!pending.error.empty())
            result = {{"error", pending.error}};

        if (output_dir.empty()) {
            all.push_back(result);
        } else {
            filesystem::path target = output_dir / (pending.file.stem().string() + ".report.json");
            codegrade::write_file_content(target, codegrade::dump_document(result));
        }
    }
    if (output_dir.empty())
        cout << codegrade::dump_document(all) << endl;

    service.stop();
    pthread_kill(signal_thread.native_handle(), SIGUSR1);
    signal_thread.join();
    return EXIT_SUCCESS;
}
