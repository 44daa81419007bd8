#include <thread>
#include "gtest/gtest.h"
#include "sandbox/cancellation.hpp"

using namespace std;
using namespace codegrade;

TEST(CancellationTest, FreshTokenIsNotCancelled) {
    cancellation_token token;
    EXPECT_FALSE(token.cancelled());
    EXPECT_EQ(token.reason(), "");
}

TEST(CancellationTest, FirstReasonWins) {
    cancellation_token token;
    token.cancel("first");
    token.cancel("second");
    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(token.reason(), "first");
}

TEST(CancellationTest, CopiesShareTheFlag) {
    cancellation_token token;
    cancellation_token copy = token;
    copy.cancel("stop");
    EXPECT_TRUE(token.cancelled());
    EXPECT_EQ(token.reason(), "stop");
}

TEST(CancellationTest, DeadlineFires) {
    cancellation_token token;
    auto derived = token.with_deadline(chrono::steady_clock::now() + 50ms, "too slow");
    EXPECT_FALSE(derived.cancelled());
    this_thread::sleep_for(100ms);
    EXPECT_TRUE(derived.cancelled());
    EXPECT_EQ(derived.reason(), "too slow");
    EXPECT_FALSE(token.cancelled());
}

TEST(CancellationTest, ParentCancellationReachesDerivedToken) {
    cancellation_token token;
    auto derived = token.with_deadline(chrono::steady_clock::now() + 1h, "too slow");
    token.cancel("shutting down");
    EXPECT_TRUE(derived.cancelled());
    EXPECT_EQ(derived.reason(), "shutting down");
}

TEST(CancellationTest, DerivedCancellationStaysLocal) {
    cancellation_token token;
    auto derived = token.with_deadline(chrono::steady_clock::now() + 1h, "too slow");
    derived.cancel("abandoned");
    EXPECT_TRUE(derived.cancelled());
    EXPECT_FALSE(token.cancelled());
}

TEST(CancellationTest, PausedDeadlineDoesNotFire) {
    cancellation_token token;
    auto derived = token.with_deadline(chrono::steady_clock::now() + 100ms, "too slow");
    derived.pause_deadline();
    this_thread::sleep_for(200ms);
    EXPECT_FALSE(derived.cancelled());
    derived.resume_deadline();
    EXPECT_FALSE(derived.cancelled());
    this_thread::sleep_for(200ms);
    EXPECT_TRUE(derived.cancelled());
    EXPECT_EQ(derived.reason(), "too slow");
}

TEST(CancellationTest, PausesNest) {
    auto token = cancellation_token().with_deadline(chrono::steady_clock::now() + 50ms, "too slow");
    token.pause_deadline();
    token.pause_deadline();
    token.resume_deadline();
    this_thread::sleep_for(100ms);
    EXPECT_FALSE(token.cancelled());
    token.resume_deadline();
    this_thread::sleep_for(100ms);
    EXPECT_TRUE(token.cancelled());
}

TEST(CancellationTest, PassedDeadlineStaysFiredWhilePaused) {
    auto token = cancellation_token().with_deadline(chrono::steady_clock::now() - 1ms, "too slow");
    token.pause_deadline();
    EXPECT_TRUE(token.cancelled());
    token.resume_deadline();
}

TEST(CancellationTest, CancelFiresWhilePaused) {
    cancellation_token token;
    auto derived = token.with_deadline(chrono::steady_clock::now() + 1h, "too slow");
    derived.pause_deadline();
    token.cancel("shutting down");
    EXPECT_TRUE(derived.cancelled());
    EXPECT_EQ(derived.reason(), "shutting down");
    derived.resume_deadline();
}
