#pragma once

#include <future>
#include <mutex>
#include <memory>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/json.hpp"
#include "judge/orchestrator.hpp"

namespace codegrade {

/**
 * @brief A fixed number of worker threads judging queued requests.
 *
 * Requests are judged in the order they were submitted, up to
 * worker_count at a time. How many programs run at once is still
 * bounded by the slot pool of the sandbox, not by the workers.
 */
struct judge_service {
    /**
     * @param orchestrator must outlive the service
     * @param worker_count number of worker threads, at least 1
     */
    judge_service(submission_orchestrator &orchestrator, std::size_t worker_count);

    /**
     * @brief Stops the workers, see stop().
     */
    ~judge_service();

    judge_service(const judge_service &) = delete;
    judge_service &operator=(const judge_service &) = delete;

    /**
     * @brief Queue a request.
     * @return the report, or the invalid_input thrown for the request
     */
    std::future<judge_report> submit(judge_request request);

    /**
     * @brief Stop accepting requests and wait for the workers.
     * Judging in progress is cancelled and reported as SYSTEM_ERROR, queued
     * requests are still answered the same way. Calling stop twice is harmless.
     */
    void stop();

    std::size_t worker_count() const;

private:
    struct judge_job {
        judge_request request;
        std::promise<judge_report> promise;
    };

    void worker_loop(std::size_t worker_id);

    submission_orchestrator &orchestrator;
    concurrent_queue<std::unique_ptr<judge_job>> queue;
    std::vector<std::thread> workers;
    cancellation_token shutdown;
    std::mutex stop_mutex;
    bool stopped = false;
};

}  // namespace codegrade
