#include "sandbox/slot_pool.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "common/defer.hpp"

namespace codegrade {
using namespace std;

// how often a waiting caller checks its cancellation token
static const chrono::milliseconds WAIT_INTERVAL(50);

slot_pool::slot_pool(size_t capacity) : slots(capacity) {
    if (capacity == 0)
        throw invalid_argument("slot pool needs at least one slot");
}

bool slot_pool::acquire(const cancellation_token &token) {
    unique_lock<mutex> lock(mut);
    while (used >= slots) {
        if (token.cancelled()) return false;
        cond.wait_for(lock, WAIT_INTERVAL);
    }
    if (token.cancelled()) return false;
    ++used;
    return true;
}

void slot_pool::release() {
    {
        scoped_lock lock(mut);
        --used;
    }
    cond.notify_one();
}

size_t slot_pool::capacity() const {
    return slots;
}

size_t slot_pool::in_use() const {
    scoped_lock lock(mut);
    return used;
}

pooled_sandbox::pooled_sandbox(sandbox &inner, slot_pool &pool)
    : inner(inner), pool(pool) {}

execution_outcome pooled_sandbox::run(const sandbox_payload &payload,
                                      const string &input,
                                      const resource_limits &limits,
                                      const cancellation_token &token) {
    // waiting in line is not spent judging, the deadline clock stops meanwhile
    token.pause_deadline();
    bool acquired = pool.acquire(token);
    token.resume_deadline();
    if (!acquired) {
        LOG(WARNING) << "Cancelled while waiting for a sandbox slot: " << token.reason();
        return execution_outcome::system_error(token.reason());
    }
    defer { pool.release(); };
    return inner.run(payload, input, limits, token);
}

}  // namespace codegrade
