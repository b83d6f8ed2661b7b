#include <gtest/gtest.h>
#include "applink/utils/encoding.hpp"

namespace applink {
namespace utils {
namespace {

TEST(EncodingTest, Base64MatchesRfc4648Vectors) {
    EXPECT_EQ(base64Encode(std::string()), "");
    EXPECT_EQ(base64Encode(std::string("f")), "Zg==");
    EXPECT_EQ(base64Encode(std::string("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(std::string("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(std::string("foobar")), "Zm9vYmFy");
}

TEST(EncodingTest, Base64UrlUsesSafeAlphabet) {
    std::vector<uint8_t> data = {0xfb, 0xff, 0xbf};
    EXPECT_EQ(base64Encode(data), "+/+/");
    EXPECT_EQ(base64UrlEncode(data), "-_-_");
}

TEST(EncodingTest, HtmlEscapeNeutralizesMarkup) {
    EXPECT_EQ(htmlEscape("<script>alert('x') & \"y\"</script>"),
              "&lt;script&gt;alert(&#39;x&#39;) &amp; &#34;y&#34;&lt;/script&gt;");
    EXPECT_EQ(htmlEscape("plain text"), "plain text");
}

TEST(EncodingTest, ParseQueryDecodesPlusAndPercent) {
    auto parsed = parseQueryString("error=access_denied&error_description=user+cancelled%21");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().at("error"), "access_denied");
    EXPECT_EQ(parsed.value().at("error_description"), "user cancelled!");
}

TEST(EncodingTest, ParseQueryKeepsFirstValueAndEmptyValues) {
    auto parsed = parseQueryString("code=first&code=second&state=&flag");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().at("code"), "first");
    EXPECT_EQ(parsed.value().at("state"), "");
    EXPECT_EQ(parsed.value().at("flag"), "");
}

TEST(EncodingTest, ParseEmptyQuery) {
    auto parsed = parseQueryString("");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed.value().empty());

    auto separators = parseQueryString("&&");
    ASSERT_TRUE(separators.has_value());
    EXPECT_TRUE(separators.value().empty());
}

} // namespace
} // namespace utils
} // namespace applink
