#include "judge/compilation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>

namespace codegrade {
using namespace std;

static compilation_result system_error(const string &reason) {
    compilation_result result;
    result.kind = outcome_kind::SYSTEM_ERROR;
    result.diagnostic = reason.empty() ? "sandbox failed while compiling" : reason;
    return result;
}

compilation_result compile_submission(sandbox &box, const language &lang, const string &code,
                                      const resource_limits &limits, const cancellation_token &token) {
    execution_outcome outcome;
    try {
        outcome = box.run(source_payload{lang, code}, "", limits, token);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Compiling " << lang.name << " submission failed: " << ex.what();
        return system_error(fmt::format("sandbox failed while compiling: {}", ex.what()));
    }

    compilation_result result;
    switch (outcome.kind) {
        case outcome_kind::SUCCESS:
            if (!outcome.artifact)
                return system_error("sandbox produced no artifact");
            result.kind = outcome_kind::SUCCESS;
            result.artifact = move(outcome.artifact);
            return result;
        case outcome_kind::SYSTEM_ERROR:
            return system_error(outcome.diagnostic);
        default:
            // a backend may classify a failed compiler run like any other program
            result.kind = outcome_kind::COMPILE_FAILED;
            result.diagnostic = outcome.diagnostic;
            if (result.diagnostic.empty())
                result.diagnostic = fmt::format("compilation failed ({})", get_display_message(outcome.kind));
            return result;
    }
}

}  // namespace codegrade
