#include "rangeserve/http-request-head.hpp"

#include <gtest/gtest.h>

#include <string_view>

#include "rangeserve/http-method.hpp"
#include "rangeserve/http-status-code.hpp"

namespace rangeserve::http {

TEST(HttpRequestHead, ParsesRequestLineAndHeaders) {
  RequestHead head;
  ASSERT_EQ(head.parse("GET /movies/a%20b.mkv?x=1#frag HTTP/1.1\r\nHost: localhost\r\nRange:  bytes=0-99 \r\n"
                       "X-Empty:"),
            StatusCodeOK);
  EXPECT_EQ(head.method(), Method::GET);
  EXPECT_EQ(head.methodStr(), "GET");
  EXPECT_EQ(head.path(), "/movies/a%20b.mkv");
  EXPECT_EQ(head.version(), "HTTP/1.1");
  EXPECT_EQ(head.headerValue("host"), "localhost");
  EXPECT_EQ(head.headerValue("RANGE"), "bytes=0-99");
  EXPECT_EQ(head.headerValue("X-Empty"), "");
  EXPECT_FALSE(head.headerValue("Accept").has_value());
}

TEST(HttpRequestHead, Methods) {
  RequestHead head;
  ASSERT_EQ(head.parse("HEAD / HTTP/1.1"), StatusCodeOK);
  EXPECT_EQ(head.method(), Method::HEAD);
  ASSERT_EQ(head.parse("DELETE /file HTTP/1.1"), StatusCodeOK);
  EXPECT_EQ(head.method(), Method::OTHER);
  ASSERT_EQ(head.parse("get / HTTP/1.1"), StatusCodeOK);
  EXPECT_EQ(head.method(), Method::OTHER);
}

TEST(HttpRequestHead, MalformedRequestLine) {
  RequestHead head;
  for (std::string_view raw : {"", "GET", "GET /", "GET  / HTTP/1.1", "GET / HTTP/1.1 extra", "GET file HTTP/1.1",
                               "G(T / HTTP/1.1", "GET / FTP/1.0"}) {
    EXPECT_EQ(head.parse(raw), StatusCodeBadRequest) << raw;
  }
}

TEST(HttpRequestHead, MalformedHeaderField) {
  RequestHead head;
  EXPECT_EQ(head.parse("GET / HTTP/1.1\r\nNoColonHere"), StatusCodeBadRequest);
  EXPECT_EQ(head.parse("GET / HTTP/1.1\r\nBad Name: value"), StatusCodeBadRequest);
  EXPECT_EQ(head.parse("GET / HTTP/1.1\r\n: value"), StatusCodeBadRequest);
}

TEST(HttpRequestHead, UnsupportedVersion) {
  RequestHead head;
  EXPECT_EQ(head.parse("GET / HTTP/2.0"), StatusCodeHTTPVersionNotSupported);
  EXPECT_EQ(head.parse("GET / HTTP/0.9"), StatusCodeHTTPVersionNotSupported);
}

TEST(HttpRequestHead, KeepAlive) {
  RequestHead head;
  ASSERT_EQ(head.parse("GET / HTTP/1.1"), StatusCodeOK);
  EXPECT_TRUE(head.wantsKeepAlive());
  ASSERT_EQ(head.parse("GET / HTTP/1.1\r\nConnection: Close"), StatusCodeOK);
  EXPECT_FALSE(head.wantsKeepAlive());
  ASSERT_EQ(head.parse("GET / HTTP/1.0"), StatusCodeOK);
  EXPECT_FALSE(head.wantsKeepAlive());
  ASSERT_EQ(head.parse("GET / HTTP/1.0\r\nConnection: keep-alive"), StatusCodeOK);
  EXPECT_TRUE(head.wantsKeepAlive());
}

}  // namespace rangeserve::http
