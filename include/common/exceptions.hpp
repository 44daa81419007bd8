#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace codegrade {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief Internal failure of the judge itself, not attributable to the submission.
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief The request was rejected before any sandbox work started.
 * Raised for empty code, an unsupported language, non-positive limits
 * or a malformed request document.
 */
struct invalid_input : public judge_exception {
    invalid_input();
    explicit invalid_input(const std::string &message);
};

/**
 * @brief The sandbox backend cannot provision runs on this host.
 * Only raised by the startup probe; during judging the same condition
 * is reported as a SYSTEM_ERROR outcome.
 */
struct sandbox_unavailable : public judge_exception {
    sandbox_unavailable();
    explicit sandbox_unavailable(const std::string &message);
};

}  // namespace codegrade
