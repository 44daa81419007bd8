#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include "sandbox/sandbox.hpp"

namespace codegrade {

/**
 * @brief Counting semaphore bounding how many sandbox runs execute at once.
 * Sized to the capacity of the host, one pool is shared by every judge of
 * the process. Callers beyond capacity wait in line.
 */
struct slot_pool {
    explicit slot_pool(std::size_t capacity);

    /**
     * @brief Take a slot, waiting while all of them are in use.
     * @return false if token fired before a slot became free
     */
    bool acquire(const cancellation_token &token);

    void release();

    std::size_t capacity() const;

    std::size_t in_use() const;

private:
    const std::size_t slots;
    std::size_t used = 0;
    mutable std::mutex mut;
    std::condition_variable cond;
};

/**
 * @brief Sandbox decorator holding a pool slot for the duration of each run.
 * The deadline of the run token is paused while the run waits for a slot,
 * so a busy pool delays judging without failing it.
 */
struct pooled_sandbox : public sandbox {
    pooled_sandbox(sandbox &inner, slot_pool &pool);

    execution_outcome run(const sandbox_payload &payload,
                          const std::string &input,
                          const resource_limits &limits,
                          const cancellation_token &token) override;

private:
    sandbox &inner;
    slot_pool &pool;
};

}  // namespace codegrade
