#include "judge/scorer.hpp"
#include <algorithm>

namespace codegrade {
using namespace std;

static status classify(outcome_kind kind) {
    switch (kind) {
        case outcome_kind::RUNTIME_ERROR:
        case outcome_kind::MEMORY_EXCEEDED:
            return status::RUNTIME_ERROR;
        case outcome_kind::TIME_EXCEEDED:
            return status::TIME_LIMIT_EXCEEDED;
        case outcome_kind::SUCCESS:
            return status::ACCEPTED;
        default:
            // a verdict that never got a program run
            return status::SYSTEM_ERROR;
    }
}

int compute_score(const vector<verdict> &verdicts) {
    if (verdicts.empty()) return 0;
    size_t passed = count_if(verdicts.begin(), verdicts.end(), [](const verdict &v) { return v.passed; });
    return (int)(100 * passed / verdicts.size());
}

judge_report summarize(vector<verdict> verdicts) {
    judge_report report;
    report.score = compute_score(verdicts);
    report.verdicts = move(verdicts);

    // status values are ordered by precedence
    const verdict *culprit = nullptr;
    status worst = status::ACCEPTED;
    for (auto &v : report.verdicts) {
        status s = classify(v.kind);
        if (s < worst) {
            worst = s;
            culprit = &v;
        }
    }

    if (culprit) {
        report.status = worst;
        report.runtime_error = culprit->diagnostic.value_or(get_display_message(culprit->kind));
    } else if (report.score == 100) {
        report.status = status::ACCEPTED;
    } else {
        report.status = status::REJECTED;
    }
    return report;
}

judge_report compile_error_report(const string &diagnostic) {
    judge_report report;
    report.score = 0;
    report.status = status::COMPILATION_ERROR;
    report.compile_error = diagnostic.empty() ? "compilation failed" : diagnostic;
    return report;
}

}  // namespace codegrade
