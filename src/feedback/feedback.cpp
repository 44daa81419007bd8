#include "feedback/feedback.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "judge/json.hpp"

namespace codegrade {
using namespace std;

feedback_result feedback_result::ready(const string &text) {
    feedback_result result;
    result.available = true;
    result.text = text;
    return result;
}

feedback_result feedback_result::unavailable(const string &reason) {
    feedback_result result;
    result.available = false;
    result.reason = reason;
    return result;
}

feedback_provider::~feedback_provider() = default;

unavailable_feedback::unavailable_feedback(string reason) : reason(move(reason)) {}

feedback_result unavailable_feedback::explain(const judge_report &, const submission &, const problem &) {
    return feedback_result::unavailable(reason);
}

command_feedback::command_feedback(vector<string> command, filesystem::path work_dir, int timeout_seconds)
    : command(move(command)), work_dir(move(work_dir)), timeout_seconds(timeout_seconds) {
    if (this->command.empty())
        throw invalid_argument("feedback command must not be empty");
}

feedback_result command_feedback::explain(const judge_report &report, const submission &submit, const problem &prob) {
    thread_local boost::uuids::random_generator generator;
    string id = boost::uuids::to_string(generator());
    filesystem::path request_file = work_dir / (id + ".request.json");
    filesystem::path feedback_file = work_dir / (id + ".feedback.txt");

    filesystem::create_directories(work_dir);
    defer {
        error_code ec;
        filesystem::remove(request_file, ec);
        filesystem::remove(feedback_file, ec);
    };

    nlohmann::json request = {
        {"report", report},
        {"code", submit.code},
        {"language", submit.language},
        {"statement", prob.statement}};
    write_file_content(request_file, dump_document(request, 2));

    int exitcode = call_process("timeout", timeout_seconds, command, request_file, feedback_file);
    if (exitcode != 0)
        return feedback_result::unavailable(fmt::format("feedback command exited with code {}", exitcode));

    string text = read_file_content(feedback_file, "");
    if (boost::algorithm::trim_copy(text).empty())
        return feedback_result::unavailable("feedback command produced no feedback");
    return feedback_result::ready(text);
}

feedback_result request_feedback(feedback_provider &provider, const judge_report &report,
                                 const submission &submit, const problem &prob) {
    try {
        return provider.explain(report, submit, prob);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to generate feedback: " << ex.what();
        return feedback_result::unavailable(fmt::format("feedback generation failed: {}", ex.what()));
    }
}

}  // namespace codegrade
