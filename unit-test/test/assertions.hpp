#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "gtest/gtest.h"

namespace codegrade::test {

inline std::string pretty(const nlohmann::json &doc) {
    // documents under test may carry program output that is not UTF-8
    return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

/**
 * @brief Compare two JSON documents, printing both and the JSON patch
 * turning the actual one into the expected one when they differ.
 */
inline ::testing::AssertionResult json_equal(const char *actual_expression,
                                             const char *expected_expression,
                                             const nlohmann::json &actual,
                                             const nlohmann::json &expected) {
    if (actual == expected)
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << actual_expression << " differs from " << expected_expression << "\n"
           << "  actual:\n" << pretty(actual) << "\n"
           << "  expected:\n" << pretty(expected) << "\n"
           << "  patch:\n" << pretty(nlohmann::json::diff(actual, expected));
}

}  // namespace codegrade::test

#define EXPECT_JSON_EQ(actual, expected) \
    EXPECT_PRED_FORMAT2(::codegrade::test::json_equal, actual, expected)
