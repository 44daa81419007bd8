#include "judge/compare.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace codegrade {
using namespace std;

string trim_output(const string &text) {
    return boost::algorithm::trim_copy(text);
}

bool outputs_match(const string &actual, const string &expected) {
    return trim_output(actual) == trim_output(expected);
}

}  // namespace codegrade
