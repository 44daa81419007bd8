#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codegrade {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::COMPILATION_ERROR, "CompileError")
    (status::SYSTEM_ERROR, "SystemError")
    (status::RUNTIME_ERROR, "RuntimeError")
    (status::TIME_LIMIT_EXCEEDED, "TimeLimitExceeded")
    (status::ACCEPTED, "Accepted")
    (status::REJECTED, "Rejected");
// clang-format on

const char *get_display_message(status s) {
    return status_string.at(s);
}

}  // namespace codegrade
