#include <gtest/gtest.h>
#include "medusa/proto/line.hpp"

#include <string>
#include <vector>

using namespace medusa;

namespace {

LineParseResult parse(const std::string& s, std::size_t max_line = 64 * 1024) {
    return parse_line(s.data(), s.size(), max_line);
}

std::vector<std::string> tokens(const std::string& s) {
    std::vector<std::string> out;
    EXPECT_TRUE(tokenize(s, out)) << s;
    return out;
}

} // namespace

using V = std::vector<std::string>;

TEST(LineProtocolTest, SplitsOnWhitespace) {
    EXPECT_EQ(tokens("SET key value"), (V{ "SET", "key", "value" }));
    EXPECT_EQ(tokens("  GET\t key  "), (V{ "GET", "key" }));
    EXPECT_TRUE(tokens("").empty());
    EXPECT_TRUE(tokens("   ").empty());
}

TEST(LineProtocolTest, QuotesGroupTokens) {
    EXPECT_EQ(tokens("SET msg \"hello world\""), (V{ "SET", "msg", "hello world" }));
    EXPECT_EQ(tokens("HSET user:1 name 'John Doe'"), (V{ "HSET", "user:1", "name", "John Doe" }));
    EXPECT_EQ(tokens("SET k \"\""), (V{ "SET", "k", "" }));
    EXPECT_EQ(tokens("SET k pre\"mid dle\"post"), (V{ "SET", "k", "premid dlepost" }));
}

TEST(LineProtocolTest, EscapesInsideQuotes) {
    EXPECT_EQ(tokens(R"(SET k "a\"b")"), (V{ "SET", "k", "a\"b" }));
    EXPECT_EQ(tokens(R"(SET k "tab\there")"), (V{ "SET", "k", "tab\there" }));
    EXPECT_EQ(tokens(R"(SET k "back\\slash")"), (V{ "SET", "k", "back\\slash" }));
}

TEST(LineProtocolTest, UnbalancedQuoteFails) {
    std::vector<std::string> out;
    EXPECT_FALSE(tokenize("SET k \"open", out));
}

TEST(LineProtocolTest, IncompleteLineNeedsMore) {
    auto r = parse("SET key val");
    EXPECT_FALSE(r.req.has_value());
    EXPECT_TRUE(r.error.empty());
    EXPECT_EQ(r.consumed, 0u);
}

TEST(LineProtocolTest, ParsesOneLineAtATime) {
    std::string buf = "SET a 1\nGET a\n";
    auto r = parse(buf);
    ASSERT_TRUE(r.req.has_value());
    EXPECT_EQ(r.req->args, (V{ "SET", "a", "1" }));
    EXPECT_EQ(r.consumed, 8u);

    buf.erase(0, r.consumed);
    r = parse(buf);
    ASSERT_TRUE(r.req.has_value());
    EXPECT_EQ(r.req->args, (V{ "GET", "a" }));
    EXPECT_EQ(r.consumed, buf.size());
}

TEST(LineProtocolTest, StripsCarriageReturn) {
    auto r = parse("PING\r\n");
    ASSERT_TRUE(r.req.has_value());
    EXPECT_EQ(r.req->args, (V{ "PING" }));
    EXPECT_EQ(r.consumed, 6u);
}

TEST(LineProtocolTest, BlankLineHasNoArgs) {
    auto r = parse("\n");
    ASSERT_TRUE(r.req.has_value());
    EXPECT_TRUE(r.req->args.empty());
}

TEST(LineProtocolTest, UnbalancedQuoteIsRecoverable) {
    auto r = parse("SET k \"oops\nPING\n");
    EXPECT_FALSE(r.req.has_value());
    EXPECT_FALSE(r.error.empty());
    EXPECT_FALSE(r.fatal);
    EXPECT_EQ(r.consumed, 12u);
}

TEST(LineProtocolTest, OverlongLineIsFatal) {
    std::string big(100, 'x');
    auto r = parse(big, 10);
    EXPECT_TRUE(r.fatal);
    EXPECT_FALSE(r.error.empty());

    r = parse(big + "\n", 10);
    EXPECT_TRUE(r.fatal);
}

TEST(LineProtocolTest, ReplyFormatting) {
    EXPECT_EQ(reply_ok("done"), "OK: done\n");
    EXPECT_EQ(reply_null("nothing"), "NULL: nothing\n");
    EXPECT_EQ(reply_true("yes"), "TRUE: yes\n");
    EXPECT_EQ(reply_false("no"), "FALSE: no\n");
    EXPECT_EQ(reply_error("bad"), "ERROR: bad\n");
    EXPECT_EQ(reply_raw("PONG"), "PONG\n");
    EXPECT_EQ(join({ "a", "b", "c" }), "a, b, c");
    EXPECT_EQ(join({}), "");
}
