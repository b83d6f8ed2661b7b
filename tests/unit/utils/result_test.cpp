#include <gtest/gtest.h>
#include "applink/utils/result.hpp"
#include <string>
#include <vector>

namespace applink {
namespace utils {
namespace {

Result<int> parsePositive(int value) {
    if (value <= 0) {
        return Result<int>(std::string("not positive"));
    }
    return value;
}

Result<std::string> describe(bool ok) {
    if (!ok) {
        return fail("no description");
    }
    return std::string("described");
}

TEST(ResultTest, HoldsValue) {
    auto result = parsePositive(5);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result.has_error());
    EXPECT_EQ(result.value(), 5);
}

TEST(ResultTest, HoldsError) {
    auto result = parsePositive(-1);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), "not positive");
}

TEST(ResultTest, FailDisambiguatesStringValueFromStringError) {
    auto good = describe(true);
    ASSERT_TRUE(good.has_value());
    EXPECT_EQ(good.value(), "described");

    auto bad = describe(false);
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.error(), "no description");
}

TEST(ResultTest, VoidSpecialization) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> failed(std::string("broken"));
    EXPECT_TRUE(failed.has_error());
    EXPECT_EQ(failed.error(), "broken");
}

TEST(ResultTest, CustomErrorType) {
    struct Problem {
        int code;
    };
    Result<std::vector<int>, Problem> failed(fail(Problem{42}));
    ASSERT_TRUE(failed.has_error());
    EXPECT_EQ(failed.error().code, 42);
}

} // namespace
} // namespace utils
} // namespace applink
