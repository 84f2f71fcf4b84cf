//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/support/ExpectedTests.cpp
// Purpose: Verify the Expected result wrapper used for error propagation.
// Key invariants: Exactly one of value or error is present.
// Ownership/Lifetime: Values are owned by the Expected instance.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using ember::support::Diag;
using ember::support::Expected;
using ember::support::makeError;

namespace
{
Expected<int> parseDigit(char c)
{
    if (c < '0' || c > '9')
        return makeError({}, std::string("not a digit: ") + c);
    return c - '0';
}

Expected<void> requireEven(int n)
{
    if (n % 2 != 0)
        return makeError({}, "odd");
    return {};
}
} // namespace

TEST(ExpectedTest, HoldsValueOrError)
{
    auto ok = parseDigit('7');
    ASSERT_TRUE(ok.hasValue());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.value(), 7);

    auto bad = parseDigit('x');
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().message, "not a digit: x");
}

TEST(ExpectedTest, VoidSpecialisation)
{
    EXPECT_TRUE(requireEven(4).hasValue());
    auto odd = requireEven(3);
    ASSERT_FALSE(odd.hasValue());
    EXPECT_EQ(odd.error().severity, ember::support::Severity::Error);
}

TEST(ExpectedTest, CustomErrorTypeAndMoveOnlyValue)
{
    struct Failure
    {
        int code;
    };
    Expected<std::unique_ptr<int>, Failure> ok(std::make_unique<int>(5));
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(*ok.value(), 5);

    Expected<std::unique_ptr<int>, Failure> failed(Failure{3});
    ASSERT_FALSE(failed.hasValue());
    EXPECT_EQ(failed.error().code, 3);
}
