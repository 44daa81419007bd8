#pragma once

#include <string>

namespace codegrade {

/**
 * @brief Strip leading and trailing whitespace (spaces, tabs, newlines).
 */
std::string trim_output(const std::string &text);

/**
 * @brief Whether a program output matches the expected output.
 * Only leading and trailing whitespace is ignored, "1 2 3" does not
 * match "1  2  3".
 */
bool outputs_match(const std::string &actual, const std::string &expected);

}  // namespace codegrade
