#include "judge/submission.hpp"

namespace codegrade {
using namespace std;

vector<const verdict *> judge_report::persistable_verdicts() const {
    vector<const verdict *> result;
    for (auto &v : verdicts)
        if (v.test_case_id != 0)
            result.push_back(&v);
    return result;
}

}  // namespace codegrade
