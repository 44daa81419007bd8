#include "judge/json.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codegrade {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, resource_limits &limits) {
    resource_limits def;
    limits.time_limit = get_value_def<double>(j, def.time_limit, "time_limit");
    limits.memory_limit = get_value_def<int64_t>(j, def.memory_limit, "memory_limit");
}

void from_json(const json &j, test_case &tc) {
    tc.id = get_value<int64_t>(j, "id");
    tc.input = get_value_def<string>(j, "", "input");
    tc.expected_output = get_value<string>(j, "expected_output");
}

void from_json(const json &j, problem &prob) {
    j.get_to(prob.limits);
    prob.statement = get_value_def<string>(j, "", "statement");
    prob.sample_input = get_value_def<string>(j, "", "sample_input");
    prob.sample_output = get_value_def<string>(j, "", "sample_output");
}

void from_json(const json &j, judge_request &request) {
    request.submission.code = get_value<string>(j, "code");
    request.submission.language = get_value<string>(j, "language");
    request.problem = get_value<problem>(j, "problem");
    request.test_cases = get_value_def<vector<test_case>>(j, {}, "test_cases");
}

void to_json(json &j, const verdict &v) {
    j = {
        {"test_case_id", v.test_case_id},
        {"passed", v.passed},
        {"actual_output", v.actual_output},
        {"expected_output", v.expected_output},
        {"execution_time_ms", v.execution_time_ms},
        {"memory_used_kb", v.memory_used_kb},
        {"outcome", get_display_message(v.kind)}};
    if (v.diagnostic)
        j["diagnostic"] = *v.diagnostic;
}

void to_json(json &j, const judge_report &report) {
    j = {
        {"verdicts", report.verdicts},
        {"score", report.score},
        {"status", get_display_message(report.status)}};
    if (report.compile_error)
        j["compile_error"] = *report.compile_error;
    if (report.runtime_error)
        j["runtime_error"] = *report.runtime_error;
}

void to_json(json &j, const feedback_result &feedback) {
    j = {{"available", feedback.available}};
    if (feedback.available)
        j["text"] = feedback.text;
    else
        j["reason"] = feedback.reason;
}

judge_request parse_request(const string &document) {
    try {
        return json::parse(document).get<judge_request>();
    } catch (json::exception &ex) {
        throw invalid_input(string("malformed request: ") + ex.what());
    } catch (invalid_argument &ex) {
        throw invalid_input(string("malformed request: ") + ex.what());
    }
}

string dump_document(const json &j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace codegrade
