#include "decoder/RecordAssembler.hpp"

#include <gtest/gtest.h>

using namespace mld::decoder;
using namespace mld::domain;
using mld::config::DecoderSettings;

namespace {

IdentifierToken token_at(std::size_t offset, uint64_t id, std::size_t length = 2) {
    std::string raw = "#" + std::to_string(id);
    return IdentifierToken{raw, raw, id, offset, length};
}

NumericCandidate at(std::size_t offset, double value) {
    return NumericCandidate{offset, value};
}

class RecordAssemblerTest : public ::testing::Test {
protected:
    DecoderSettings settings;

    RecordAssembler make() const {
        return RecordAssembler(settings, std::make_shared<PositionalRoleAssigner>());
    }
};

} // namespace

TEST_F(RecordAssemblerTest, PairsTokenWithFollowingFields) {
    auto assembly = make().assemble({token_at(0, 1)},
                                    {at(4, 24.5), at(8, 1.87), at(12, 1.95)}, 16);

    ASSERT_EQ(assembly.records.size(), 1u);
    const auto& r = assembly.records[0];
    EXPECT_EQ(r.numeric_id(), 1u);
    EXPECT_EQ(r.category_id(), "#1");
    EXPECT_DOUBLE_EQ(r.final_line().value(), 24.5);
    EXPECT_DOUBLE_EQ(r.top_over_value().value(), 1.87);
    EXPECT_DOUBLE_EQ(r.top_under_value().value(), 1.95);
}

TEST_F(RecordAssemblerTest, FieldsBeforeFirstTokenAreIgnored) {
    auto assembly = make().assemble({token_at(8, 1)}, {at(0, 3.0), at(4, 4.0), at(12, 5.0)}, 16);

    ASSERT_EQ(assembly.records.size(), 1u);
    EXPECT_DOUBLE_EQ(assembly.records[0].final_line().value(), 5.0);
    EXPECT_FALSE(assembly.records[0].top_over_value().has_value());
}

TEST_F(RecordAssemblerTest, WindowStopsAtNextToken) {
    auto assembly = make().assemble({token_at(0, 1), token_at(8, 2)},
                                    {at(4, 1.5), at(12, 2.0), at(16, 3.0)}, 20);

    ASSERT_EQ(assembly.records.size(), 2u);
    EXPECT_DOUBLE_EQ(assembly.records[0].final_line().value(), 1.5);
    EXPECT_FALSE(assembly.records[0].top_over_value().has_value());
    EXPECT_DOUBLE_EQ(assembly.records[1].final_line().value(), 2.0);
    EXPECT_DOUBLE_EQ(assembly.records[1].top_over_value().value(), 3.0);
}

TEST_F(RecordAssemblerTest, FieldStraddlingNextTokenBelongsToNeither) {
    auto assembly = make().assemble({token_at(0, 1), token_at(6, 2)}, {at(4, 1.5)}, 12);

    ASSERT_EQ(assembly.records.size(), 2u);
    EXPECT_TRUE(assembly.records[0].is_empty());
    EXPECT_TRUE(assembly.records[1].is_empty());
}

TEST_F(RecordAssemblerTest, BackToBackTokensLeaveFirstEmpty) {
    auto assembly = make().assemble({token_at(0, 1, 4), token_at(4, 2)}, {at(8, 1.5)}, 12);

    ASSERT_EQ(assembly.records.size(), 2u);
    EXPECT_TRUE(assembly.records[0].is_empty());
    EXPECT_DOUBLE_EQ(assembly.records[1].final_line().value(), 1.5);
}

TEST_F(RecordAssemblerTest, LookaheadWindowLimitsFields) {
    settings.lookahead_window = 8;
    // Window is [2, 10): the field at 8 would end at 12
    auto assembly = make().assemble({token_at(0, 1)}, {at(4, 1.5), at(8, 2.5)}, 16);

    ASSERT_EQ(assembly.records.size(), 1u);
    EXPECT_DOUBLE_EQ(assembly.records[0].final_line().value(), 1.5);
    EXPECT_FALSE(assembly.records[0].top_over_value().has_value());
}

TEST_F(RecordAssemblerTest, FieldsPastBufferEndAreIgnored) {
    auto assembly = make().assemble({token_at(0, 1)}, {at(4, 1.5), at(12, 2.5)}, 14);

    ASSERT_EQ(assembly.records.size(), 1u);
    EXPECT_FALSE(assembly.records[0].top_over_value().has_value());
}

TEST_F(RecordAssemblerTest, KeepsEmptyRecordsByDefault) {
    auto assembly = make().assemble({token_at(0, 1)}, {}, 4);

    ASSERT_EQ(assembly.records.size(), 1u);
    EXPECT_TRUE(assembly.records[0].is_empty());
    EXPECT_EQ(assembly.dropped_empty, 0u);
}

TEST_F(RecordAssemblerTest, DropsEmptyRecordsWhenConfigured) {
    settings.keep_empty_records = false;
    auto assembly = make().assemble({token_at(0, 1), token_at(4, 2)}, {at(8, 1.5)}, 12);

    ASSERT_EQ(assembly.records.size(), 1u);
    EXPECT_EQ(assembly.records[0].numeric_id(), 2u);
    EXPECT_EQ(assembly.dropped_empty, 1u);
}

TEST_F(RecordAssemblerTest, PriceScaleAppliesToPricesOnly) {
    settings.price_scale_constant = 2.0;
    auto assembly = make().assemble({token_at(0, 1)}, {at(4, 24.5), at(8, 1.5), at(12, 2.5)}, 16);

    ASSERT_EQ(assembly.records.size(), 1u);
    EXPECT_DOUBLE_EQ(assembly.records[0].final_line().value(), 24.5);
    EXPECT_DOUBLE_EQ(assembly.records[0].top_over_value().value(), 3.0);
    EXPECT_DOUBLE_EQ(assembly.records[0].top_under_value().value(), 5.0);
}

TEST_F(RecordAssemblerTest, UnsortedInputIsOrderedByOffset) {
    auto assembly = make().assemble({token_at(8, 2), token_at(0, 1)},
                                    {at(12, 2.0), at(4, 1.0)}, 16);

    ASSERT_EQ(assembly.records.size(), 2u);
    EXPECT_EQ(assembly.records[0].numeric_id(), 1u);
    EXPECT_DOUBLE_EQ(assembly.records[0].final_line().value(), 1.0);
    EXPECT_EQ(assembly.records[1].numeric_id(), 2u);
    EXPECT_DOUBLE_EQ(assembly.records[1].final_line().value(), 2.0);
}

TEST_F(RecordAssemblerTest, EachCandidateUsedAtMostOnce) {
    std::vector<IdentifierToken> tokens{token_at(0, 1), token_at(8, 2), token_at(20, 3)};
    std::vector<NumericCandidate> candidates{at(4, 1.0), at(12, 2.0), at(16, 3.0), at(24, 4.0)};
    auto assembly = make().assemble(tokens, candidates, 28);

    std::size_t used = 0;
    for (const auto& r : assembly.records) {
        used += r.final_line().has_value() + r.top_over_value().has_value() +
                r.top_under_value().has_value();
    }
    EXPECT_EQ(used, candidates.size());
}

TEST_F(RecordAssemblerTest, FieldGridStartsAtTokenOffset) {
    // 31-byte token at offset 1 and a separator byte: fields at 33, 37, 41
    auto assembly = make().assemble({token_at(1, 4821, 31)},
                                    {at(32, 9.0), at(33, 24.5), at(37, 1.875), at(41, 1.5)}, 45);

    ASSERT_EQ(assembly.records.size(), 1u);
    const auto& r = assembly.records[0];
    EXPECT_DOUBLE_EQ(r.final_line().value(), 24.5);
    EXPECT_DOUBLE_EQ(r.top_over_value().value(), 1.875);
    EXPECT_DOUBLE_EQ(r.top_under_value().value(), 1.5);
}

TEST_F(RecordAssemblerTest, BufferAnchorKeepsBufferGrid) {
    settings.field_anchor = "buffer";
    auto assembly = make().assemble({token_at(1, 4821, 31)},
                                    {at(32, 9.0), at(33, 24.5), at(36, 2.0)}, 40);

    ASSERT_EQ(assembly.records.size(), 1u);
    EXPECT_DOUBLE_EQ(assembly.records[0].final_line().value(), 9.0);
    EXPECT_DOUBLE_EQ(assembly.records[0].top_over_value().value(), 2.0);
    EXPECT_FALSE(assembly.records[0].top_under_value().has_value());
}

TEST_F(RecordAssemblerTest, EachTokenHasItsOwnGrid) {
    // Second token starts at 9, so its fields sit at 9 + 4k
    auto assembly = make().assemble({token_at(0, 1), token_at(9, 2, 3)},
                                    {at(4, 1.5), at(12, 6.0), at(13, 2.5), at(17, 3.5)}, 21);

    ASSERT_EQ(assembly.records.size(), 2u);
    EXPECT_DOUBLE_EQ(assembly.records[0].final_line().value(), 1.5);
    EXPECT_FALSE(assembly.records[0].top_over_value().has_value());
    EXPECT_DOUBLE_EQ(assembly.records[1].final_line().value(), 2.5);
    EXPECT_DOUBLE_EQ(assembly.records[1].top_over_value().value(), 3.5);
}

TEST_F(RecordAssemblerTest, WindowsFollowTokenOrder) {
    settings.lookahead_window = 16;
    auto windows = make().windows({token_at(40, 2, 3), token_at(1, 1, 31)}, 100);

    ASSERT_EQ(windows.size(), 2u);
    EXPECT_EQ(windows[0], (FieldWindow{1, 32, 40}));
    EXPECT_EQ(windows[1], (FieldWindow{40, 43, 59}));

    settings.field_anchor = "buffer";
    EXPECT_EQ(make().windows({token_at(1, 1, 31)}, 100)[0], (FieldWindow{0, 32, 48}));
}

TEST_F(RecordAssemblerTest, ThrowsWithoutAssigner) {
    EXPECT_THROW(RecordAssembler(settings, nullptr), std::invalid_argument);
}

TEST_F(RecordAssemblerTest, ThrowsOnNonPositiveLookahead) {
    settings.lookahead_window = 0;
    EXPECT_THROW(make(), std::invalid_argument);
}

TEST_F(RecordAssemblerTest, ThrowsOnNonPositiveStride) {
    settings.byte_stride = 0;
    EXPECT_THROW(make(), std::invalid_argument);
}

TEST_F(RecordAssemblerTest, ThrowsOnUnknownFieldAnchor) {
    settings.field_anchor = "page";
    EXPECT_THROW(make(), std::invalid_argument);
}
