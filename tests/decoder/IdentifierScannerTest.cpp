#include "decoder/IdentifierScanner.hpp"
#include "support/PayloadBuilder.hpp"

#include <gtest/gtest.h>

using namespace mld::decoder;
using mld::config::IdentifierPattern;
using mld::testing::PayloadBuilder;
using mld::testing::category_token;
using mld::testing::to_bytes;

namespace {

IdentifierPattern plain_pattern(std::string prefix = "#") {
    IdentifierPattern p;
    p.prefix = std::move(prefix);
    p.encoding = "plain";
    return p;
}

} // namespace

TEST(IdentifierScanner, FindsGlobalIdToken) {
    auto token = category_token(4821);
    PayloadBuilder b;
    b.zeros(8).token(token).f32(1.5f);

    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 1u);
    const auto& t = scan.tokens[0];
    EXPECT_EQ(t.numeric_id, 4821u);
    EXPECT_EQ(t.byte_offset, 8u);
    EXPECT_EQ(t.byte_length, token.size());
    EXPECT_EQ(t.raw_token, token);
    EXPECT_EQ(t.category_id, token);
    EXPECT_EQ(scan.rejected, 0u);
}

TEST(IdentifierScanner, ToleratesPaddedToken) {
    // 22 bytes of global id, so the encoding ends in "=="
    std::string gid = "gid://hs3/Category/123";
    auto padded = base64_encode(to_bytes(gid));
    ASSERT_EQ(padded.back(), '=');

    PayloadBuilder b;
    b.token(padded);

    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 1u);
    EXPECT_EQ(scan.tokens[0].numeric_id, 123u);
    EXPECT_EQ(scan.tokens[0].raw_token, padded);
    EXPECT_EQ(scan.tokens[0].byte_length, padded.size());
    EXPECT_EQ(scan.tokens[0].category_id, category_token(123));
}

TEST(IdentifierScanner, FindsTokensInOffsetOrder) {
    PayloadBuilder b;
    b.token(category_token(9)).f32(2.0f).token(category_token(10)).token(category_token(9));

    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 3u);
    EXPECT_EQ(scan.tokens[0].numeric_id, 9u);
    EXPECT_EQ(scan.tokens[1].numeric_id, 10u);
    EXPECT_EQ(scan.tokens[2].numeric_id, 9u);
    EXPECT_LT(scan.tokens[0].byte_offset, scan.tokens[1].byte_offset);
    EXPECT_LT(scan.tokens[1].byte_offset, scan.tokens[2].byte_offset);
}

TEST(IdentifierScanner, TokensNeverOverlap) {
    PayloadBuilder b;
    for (uint64_t id = 100; id < 110; ++id) {
        b.token(category_token(id));
    }

    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 10u);
    for (std::size_t i = 1; i < scan.tokens.size(); ++i) {
        EXPECT_LE(scan.tokens[i - 1].end_offset(), scan.tokens[i].byte_offset);
    }
}

TEST(IdentifierScanner, RejectsPrefixWithoutNumericId) {
    // Matches the prefix but has no digits after the marker
    std::string gid = "gid://hs3/Category/:x";
    auto text = base64_encode(to_bytes(gid));

    PayloadBuilder b;
    b.token(text).token(category_token(5));

    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 1u);
    EXPECT_EQ(scan.tokens[0].numeric_id, 5u);
    EXPECT_EQ(scan.rejected, 1u);
}

TEST(IdentifierScanner, GreedyMatchDoesNotLeakIntoToken) {
    // Base64-alphabet bytes right after the token are swept up by the raw match
    auto token = category_token(77);
    PayloadBuilder b;
    b.bytes(token).bytes("ABCD").zeros(4);

    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 1u);
    EXPECT_EQ(scan.tokens[0].raw_token, token + "ABCD");
    EXPECT_EQ(scan.tokens[0].category_id, token);
    EXPECT_EQ(scan.tokens[0].byte_length, token.size());
}

TEST(IdentifierScanner, AdjacentTokensAreBothFound) {
    auto first = category_token(4821);    // 31 chars
    auto second = category_token(90210);  // 32 chars
    PayloadBuilder b;
    b.bytes(first).bytes(second).zeros(4);

    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 2u);
    EXPECT_EQ(scan.tokens[0].numeric_id, 4821u);
    EXPECT_EQ(scan.tokens[0].byte_offset, 0u);
    EXPECT_EQ(scan.tokens[0].byte_length, first.size());
    EXPECT_EQ(scan.tokens[0].category_id, first);
    EXPECT_EQ(scan.tokens[1].numeric_id, 90210u);
    EXPECT_EQ(scan.tokens[1].byte_offset, first.size());
    EXPECT_EQ(scan.tokens[1].byte_length, second.size());
    EXPECT_EQ(scan.rejected, 0u);
}

TEST(IdentifierScanner, TokenAtOddOffset) {
    auto token = category_token(4821);
    PayloadBuilder b;
    b.bytes("\x01").bytes(token).zeros(1).packed_f32(24.5f);

    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 1u);
    EXPECT_EQ(scan.tokens[0].byte_offset, 1u);
    EXPECT_EQ(scan.tokens[0].end_offset(), 32u);
}

TEST(IdentifierScanner, EmptyAndTokenlessBuffers) {
    IdentifierScanner scanner{IdentifierPattern{}};
    EXPECT_TRUE(scanner.scan(mld::domain::ByteBuffer{}).tokens.empty());

    auto scan = scanner.scan(to_bytes("no identifiers in here at all"));
    EXPECT_TRUE(scan.tokens.empty());
    EXPECT_EQ(scan.rejected, 0u);
}

TEST(IdentifierScanner, TruncatedPrefixAtBufferEnd) {
    IdentifierScanner scanner{IdentifierPattern{}};
    auto scan = scanner.scan(to_bytes("Z2lkOi8vaHMzL0NhdGVn"));
    EXPECT_TRUE(scan.tokens.empty());
}

TEST(IdentifierScanner, PlainDigitsTokens) {
    PayloadBuilder b;
    b.token("#7").f32(1.5f).token("#1234");

    IdentifierScanner scanner{plain_pattern()};
    auto scan = scanner.scan(b.buffer());

    ASSERT_EQ(scan.tokens.size(), 2u);
    EXPECT_EQ(scan.tokens[0].byte_offset, 0u);
    EXPECT_EQ(scan.tokens[0].byte_length, 2u);
    EXPECT_EQ(scan.tokens[0].numeric_id, 7u);
    EXPECT_EQ(scan.tokens[0].category_id, "#7");
    EXPECT_EQ(scan.tokens[1].numeric_id, 1234u);
}

TEST(IdentifierScanner, PlainPrefixWithoutDigitsIsRejected) {
    PayloadBuilder b;
    b.token("#x").token("#");

    IdentifierScanner scanner{plain_pattern()};
    auto scan = scanner.scan(b.buffer());

    EXPECT_TRUE(scan.tokens.empty());
    EXPECT_EQ(scan.rejected, 2u);
}

TEST(IdentifierScanner, OverflowingIdIsRejected) {
    IdentifierScanner scanner{plain_pattern()};
    auto scan = scanner.scan(to_bytes("#99999999999999999999999"));
    EXPECT_TRUE(scan.tokens.empty());
    EXPECT_EQ(scan.rejected, 1u);
}

TEST(IdentifierScanner, ThrowsOnBadPattern) {
    IdentifierPattern empty_prefix;
    empty_prefix.prefix = "";
    EXPECT_THROW(IdentifierScanner{empty_prefix}, std::invalid_argument);

    IdentifierPattern bad_encoding;
    bad_encoding.encoding = "hex";
    EXPECT_THROW(IdentifierScanner{bad_encoding}, std::invalid_argument);
}
