#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace codegrade {

/**
 * @brief Shared flag telling sandbox runs to stop.
 * Copies refer to the same flag. A token fires when cancel() was called on
 * it, when its deadline passed, or when the token it was derived from fired.
 * The sandbox polls the token while supervising a program and kills the
 * program as soon as it fires.
 */
struct cancellation_token {
    cancellation_token();

    /**
     * @brief Fire the token. Only the first reason is kept.
     */
    void cancel(const std::string &reason) const;

    bool cancelled() const;

    /**
     * @brief Why the token fired, empty while it has not.
     */
    std::string reason() const;

    /**
     * @brief Derive a token that also fires at deadline.
     * Cancelling the derived token leaves this one untouched.
     */
    cancellation_token with_deadline(std::chrono::steady_clock::time_point deadline, const std::string &reason) const;

    /**
     * @brief Stop the deadline clocks of this token and the tokens it was
     * derived from until the matching resume_deadline().
     * Pauses nest, the clocks run again once every pause is resumed.
     * The time spent paused is added to the deadlines. cancel() still
     * fires the token while paused.
     */
    void pause_deadline() const;

    void resume_deadline() const;

private:
    struct state;
    explicit cancellation_token(std::shared_ptr<state> s);

    std::shared_ptr<state> s;
};

}  // namespace codegrade
