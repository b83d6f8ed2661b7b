#include <gtest/gtest.h>
#include "applink/utils/curl_helpers.hpp"

namespace applink {
namespace utils {
namespace {

TEST(CurlHelpersTest, SearchParamsPercentEncodesValues) {
    UrlSearchParams params;
    params.append("redirect_uri", "http://localhost:8888/callback");
    params.append("scope", "read write");

    auto encoded = params.toString();
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded.value(), "redirect_uri=http%3A%2F%2Flocalhost%3A8888%2Fcallback&scope=read%20write");
}

TEST(CurlHelpersTest, UrlHandleAppendsToExistingQuery) {
    CurlUrlHandle url;
    ASSERT_TRUE(url.setUrl("https://example.com/oauth/authorize?owner=user").has_value());
    ASSERT_TRUE(url.appendQuery("client_id=abc").has_value());

    auto rendered = url.url();
    ASSERT_TRUE(rendered.has_value());
    EXPECT_EQ(rendered.value(), "https://example.com/oauth/authorize?owner=user&client_id=abc");
    EXPECT_EQ(url.query(), "owner=user&client_id=abc");
}

TEST(CurlHelpersTest, UrlHandleRejectsRelativeUrl) {
    CurlUrlHandle url;
    auto result = url.setUrl("not a url");
    EXPECT_TRUE(result.has_error());
}

TEST(CurlHelpersTest, StringWriterAppends) {
    std::string sink = "a";
    char data[] = "bcd";
    EXPECT_EQ(curlStringWriter(data, 1, 3, &sink), 3u);
    EXPECT_EQ(sink, "abcd");
}

} // namespace
} // namespace utils
} // namespace applink
