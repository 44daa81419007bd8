#include "sandbox/outcome.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>

namespace codegrade {
using namespace std;

// clang-format off
static const unordered_map<outcome_kind, const char *> outcome_string = boost::assign::map_list_of
    (outcome_kind::COMPILE_FAILED, "CompileFailed")
    (outcome_kind::SUCCESS, "Success")
    (outcome_kind::RUNTIME_ERROR, "RuntimeError")
    (outcome_kind::TIME_EXCEEDED, "TimeExceeded")
    (outcome_kind::MEMORY_EXCEEDED, "MemoryExceeded")
    (outcome_kind::SYSTEM_ERROR, "SystemError");
// clang-format on

const char *get_display_message(outcome_kind kind) {
    return outcome_string.at(kind);
}

compiled_artifact::compiled_artifact(filesystem::path dir, language lang, bool keep)
    : dir(move(dir)), lang_(move(lang)), keep(keep) {}

compiled_artifact::~compiled_artifact() {
    if (keep) return;

    error_code ec;
    filesystem::remove_all(dir, ec);
    if (ec)
        LOG(ERROR) << "Unable to remove artifact directory " << dir << ": " << ec.message();
}

const filesystem::path &compiled_artifact::directory() const {
    return dir;
}

const language &compiled_artifact::lang() const {
    return lang_;
}

execution_outcome execution_outcome::system_error(const string &reason) {
    execution_outcome outcome;
    outcome.kind = outcome_kind::SYSTEM_ERROR;
    outcome.diagnostic = reason;
    return outcome;
}

}  // namespace codegrade
