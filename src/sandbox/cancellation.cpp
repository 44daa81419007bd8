#include "sandbox/cancellation.hpp"
#include <atomic>
#include <mutex>
#include <optional>

namespace codegrade {
using namespace std;

struct cancellation_token::state {
    atomic<bool> flag{false};
    mutable mutex mut;
    string reason;

    optional<chrono::steady_clock::time_point> deadline;
    string deadline_reason;

    // guarded by mut
    int pauses = 0;
    chrono::steady_clock::time_point paused_since;
    chrono::steady_clock::duration paused_total{0};

    shared_ptr<state> parent;

    bool deadline_passed() const {
        if (!deadline) return false;
        scoped_lock guard(mut);
        auto now = pauses > 0 ? paused_since : chrono::steady_clock::now();
        return now >= *deadline + paused_total;
    }

    bool fired() const {
        if (flag.load()) return true;
        if (deadline_passed()) return true;
        return parent && parent->fired();
    }

    string why() const {
        if (flag.load()) {
            scoped_lock guard(mut);
            return reason;
        }
        if (deadline_passed()) return deadline_reason;
        if (parent) return parent->why();
        return "";
    }
};

cancellation_token::cancellation_token() : s(make_shared<state>()) {}

cancellation_token::cancellation_token(shared_ptr<state> s) : s(move(s)) {}

void cancellation_token::cancel(const string &reason) const {
    scoped_lock guard(s->mut);
    if (s->flag.load()) return;
    s->reason = reason;
    s->flag.store(true);
}

bool cancellation_token::cancelled() const {
    return s->fired();
}

string cancellation_token::reason() const {
    return s->why();
}

cancellation_token cancellation_token::with_deadline(chrono::steady_clock::time_point deadline, const string &reason) const {
    auto child = make_shared<state>();
    child->deadline = deadline;
    child->deadline_reason = reason;
    child->parent = s;
    return cancellation_token(child);
}

void cancellation_token::pause_deadline() const {
    auto now = chrono::steady_clock::now();
    for (state *st = s.get(); st; st = st->parent.get()) {
        scoped_lock guard(st->mut);
        if (st->pauses++ == 0) st->paused_since = now;
    }
}

void cancellation_token::resume_deadline() const {
    auto now = chrono::steady_clock::now();
    for (state *st = s.get(); st; st = st->parent.get()) {
        scoped_lock guard(st->mut);
        if (st->pauses > 0 && --st->pauses == 0) st->paused_total += now - st->paused_since;
    }
}

}  // namespace codegrade
