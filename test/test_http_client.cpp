#include "http_client.hpp"

#include <gtest/gtest.h>

using namespace placelist;

TEST(HttpClientTest, HtmlContentTypes) {
	EXPECT_TRUE(IsHtmlContentType("text/html"));
	EXPECT_TRUE(IsHtmlContentType("text/html; charset=UTF-8"));
	EXPECT_TRUE(IsHtmlContentType(" Text/HTML ;charset=utf-8"));
	EXPECT_TRUE(IsHtmlContentType("application/xhtml+xml"));
	// Unknown is not reported
	EXPECT_TRUE(IsHtmlContentType(""));

	EXPECT_FALSE(IsHtmlContentType("application/json"));
	EXPECT_FALSE(IsHtmlContentType("text/plain; charset=utf-8"));
	EXPECT_FALSE(IsHtmlContentType("image/png"));
}

TEST(HttpClientTest, ListUrlValidation) {
	EXPECT_EQ(GetListUrlValidationError("https://maps.app.goo.gl/abc"), "");
	EXPECT_EQ(GetListUrlValidationError("http://www.google.com/maps/placelists/list/abc"), "");
	EXPECT_EQ(GetListUrlValidationError("file:///tmp/list.html"), "");

	EXPECT_NE(GetListUrlValidationError(""), "");
	EXPECT_NE(GetListUrlValidationError("maps.app.goo.gl/abc"), "");
	EXPECT_NE(GetListUrlValidationError("ftp://example.com/list"), "");
	EXPECT_NE(GetListUrlValidationError("https:///path"), "");
	EXPECT_NE(GetListUrlValidationError("file://"), "");
}

TEST(HttpClientTest, FileUrls) {
	EXPECT_TRUE(IsFileUrl("file:///tmp/list.html"));
	EXPECT_TRUE(IsFileUrl("FILE:///tmp/list.html"));
	EXPECT_FALSE(IsFileUrl("https://maps.app.goo.gl/abc"));
	EXPECT_FALSE(IsFileUrl("file"));

	EXPECT_EQ(FileUrlToPath("file:///tmp/list.html"), "/tmp/list.html");
	EXPECT_EQ(FileUrlToPath("file://localhost/tmp/list.html"), "/tmp/list.html");
}
