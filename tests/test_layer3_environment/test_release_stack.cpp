/**
 * @file test_release_stack.cpp
 * @brief Reverse-order release, continuation past failures and the error reporting policy.
 */
#include "sfl_environment.hpp"
#include "test_patterns.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace servefleet::env;

class ReleaseStackTest : public servefleet::tests::PureApiTest
{
};

TEST_F(ReleaseStackTest, ReleasesInReverseOrder)
{
    std::vector<std::string> order;
    ReleaseStack stack;
    stack.push("a", [&] { order.push_back("a"); });
    stack.push("b", [&] { order.push_back("b"); });
    stack.push("c", [&] { order.push_back("c"); });

    EXPECT_EQ(stack.names(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(stack.size(), 3u);

    stack.release();
    EXPECT_EQ(order, (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_TRUE(stack.empty());
}

TEST_F(ReleaseStackTest, SingleFailureIsRethrownUnchanged)
{
    std::vector<std::string> order;
    ReleaseStack stack;
    stack.push("first", [&] { order.push_back("first"); });
    stack.push("broken", [] { throw std::out_of_range("broken step"); });
    stack.push("last", [&] { order.push_back("last"); });

    try
    {
        stack.release();
        FAIL() << "expected the step's own exception";
    }
    catch (const std::out_of_range &e)
    {
        EXPECT_STREQ(e.what(), "broken step");
    }
    // Every other step still ran.
    EXPECT_EQ(order, (std::vector<std::string>{"last", "first"}));
    EXPECT_TRUE(stack.empty());
}

TEST_F(ReleaseStackTest, MultipleFailuresBecomeTeardownError)
{
    ReleaseStack stack;
    stack.push("a", [] { throw std::runtime_error("a failed"); });
    stack.push("b", [] {});
    stack.push("c", [] { throw std::runtime_error("c failed"); });

    try
    {
        stack.release();
        FAIL() << "expected TeardownError";
    }
    catch (const TeardownError &e)
    {
        ASSERT_EQ(e.failures().size(), 2u);
        EXPECT_EQ(e.failures()[0].step, "c");
        EXPECT_EQ(e.failures()[1].step, "a");
        EXPECT_FALSE(e.in_flight());
        EXPECT_STREQ(e.what(), "Teardown failed in 2 step(s): c: c failed; a: a failed");
    }
}

TEST_F(ReleaseStackTest, FailureWithInFlightKeepsOriginal)
{
    ReleaseStack stack;
    stack.push("only", [] { throw std::runtime_error("release failed"); });

    std::exception_ptr in_flight = std::make_exception_ptr(std::invalid_argument("test body"));
    try
    {
        stack.release(in_flight);
        FAIL() << "expected TeardownError";
    }
    catch (const TeardownError &e)
    {
        EXPECT_EQ(e.in_flight(), in_flight);
        EXPECT_STREQ(e.what(),
                     "Teardown failed in 1 step(s): only: release failed (while handling: test body)");
    }
}

TEST_F(ReleaseStackTest, ContextStepSeesInFlightException)
{
    std::string seen;
    ReleaseStack stack;
    stack.push_with_exception("extra", [&](std::exception_ptr ep) { seen = describe_exception(ep); });
    stack.release(std::make_exception_ptr(std::runtime_error("boom")));
    EXPECT_EQ(seen, "boom");

    stack.push_with_exception("extra", [&](std::exception_ptr ep) { seen = describe_exception(ep); });
    stack.release();
    EXPECT_EQ(seen, "no exception");
}

TEST_F(ReleaseStackTest, UnwindReportsWithoutThrowing)
{
    ReleaseStack stack;
    stack.push("x", [] { throw 42; });
    std::vector<TeardownError::Failure> failures = stack.unwind(nullptr);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].step, "x");
    EXPECT_EQ(failures[0].message, "unknown exception");
    EXPECT_TRUE(failures[0].error);
}

TEST_F(ReleaseStackTest, MovedFromStackIsEmpty)
{
    int released = 0;
    ReleaseStack a;
    a.push("one", [&] { ++released; });
    ReleaseStack b = std::move(a);
    b.release();
    EXPECT_EQ(released, 1);
}
