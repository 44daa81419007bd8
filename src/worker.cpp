#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"

namespace codegrade {
using namespace std;

judge_service::judge_service(submission_orchestrator &orchestrator, size_t worker_count)
    : orchestrator(orchestrator) {
    if (worker_count == 0)
        throw invalid_argument("judge service needs at least one worker");
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
}

judge_service::~judge_service() {
    stop();
}

size_t judge_service::worker_count() const {
    return workers.size();
}

future<judge_report> judge_service::submit(judge_request request) {
    auto job = make_unique<judge_job>();
    job->request = move(request);
    future<judge_report> result = job->promise.get_future();
    {
        scoped_lock guard(stop_mutex);
        if (stopped)
            throw internal_error("judge service has been stopped");
        queue.push(move(job));
    }
    return result;
}

void judge_service::stop() {
    {
        scoped_lock guard(stop_mutex);
        if (stopped) return;
        stopped = true;
    }

    shutdown.cancel("judge service is shutting down");
    // one empty job per worker tells it to exit
    for (size_t i = 0; i < workers.size(); ++i)
        queue.push(nullptr);
    for (auto &worker : workers)
        worker.join();
    LOG(INFO) << "Judge service stopped";
}

void judge_service::worker_loop(size_t worker_id) {
    DLOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        unique_ptr<judge_job> job = queue.pop();
        if (!job) break;

        judge_request &request = job->request;
        try {
            job->promise.set_value(orchestrator.judge(request.submission, request.problem, request.test_cases, shutdown));
        } catch (invalid_input &ex) {
            LOG(WARNING) << "Worker " << worker_id << " rejected a request: " << ex.what();
            job->promise.set_exception(current_exception());
        } catch (judge_exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging, " << ex;
            job->promise.set_exception(current_exception());
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            job->promise.set_exception(current_exception());
        }
    }

    DLOG(INFO) << "Worker " << worker_id << " exited";
}

}  // namespace codegrade
