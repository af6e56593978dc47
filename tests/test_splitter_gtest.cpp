// ==============================================================================
// test_splitter_gtest.cpp - Тесты Section Splitter (GoogleTest)
// ==============================================================================
//
// - parse_boundary: распознавание маркеров --<id>-<letter>--
// - BoundaryShape: строки с id другой длины считаются содержимым
// - Автомат: завершение по Z, отбрасывание незавершённых транзакций
//
// ==============================================================================

#include <auditview/splitter.hpp>

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace auditview::io::test {

namespace {

/// Прогнать текст через splitter построчно
std::vector<RawTransaction> split(const std::string& text, SplitterStats* stats = nullptr) {
    std::vector<RawTransaction> out;
    SectionSplitter splitter([&](RawTransaction&& tx) { out.push_back(std::move(tx)); });
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        splitter.feed_line(line);
    }
    splitter.finish();
    if (stats != nullptr) {
        *stats = splitter.stats();
    }
    return out;
}

}  // anonymous namespace

// ==============================================================================
// parse_boundary
// ==============================================================================

TEST(BoundaryTest, ParsesMarker) {
    auto b = parse_boundary("--a1b2c3d4-A--");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->id, "a1b2c3d4");
    EXPECT_EQ(b->letter, 'A');
}

TEST(BoundaryTest, IgnoresTrailingCarriageReturnAndSpaces) {
    auto b = parse_boundary("--XyZ0912-H-- \r");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->id, "XyZ0912");
    EXPECT_EQ(b->letter, 'H');
}

TEST(BoundaryTest, RejectsNonMarkers) {
    EXPECT_FALSE(parse_boundary("").has_value());
    EXPECT_FALSE(parse_boundary("--a1-a--").has_value());      // строчная буква
    EXPECT_FALSE(parse_boundary("--a_1-A--").has_value());     // недопустимый символ id
    EXPECT_FALSE(parse_boundary("--a1-AB--").has_value());     // две буквы
    EXPECT_FALSE(parse_boundary("a1-A--").has_value());
    EXPECT_FALSE(parse_boundary("--a1-A").has_value());
    EXPECT_FALSE(parse_boundary("---A--").has_value());        // пустой id
    EXPECT_FALSE(parse_boundary("----------").has_value());
}

TEST(BoundaryTest, ShapeMatchesLengthOnly) {
    auto shape = BoundaryShape::learn("a1b2c3d4");
    EXPECT_TRUE(shape.matches("ZZZZ9999"));
    EXPECT_FALSE(shape.matches("a1b2"));
    EXPECT_FALSE(shape.matches("a1b2c3d4e5"));
}

// ==============================================================================
// SectionSplitter
// ==============================================================================

TEST(SplitterTest, SingleTransaction) {
    SplitterStats stats;
    auto txs = split(
        "--abcd1234-A--\n"
        "[19/Oct/2026:18:52:07 +0200] uid 10.0.0.1 1234\n"
        "--abcd1234-B--\n"
        "GET / HTTP/1.1\n"
        "Host: example.com\n"
        "\n"
        "--abcd1234-Z--\n",
        &stats);

    ASSERT_EQ(txs.size(), 1u);
    EXPECT_EQ(txs[0].id, "abcd1234");
    ASSERT_EQ(txs[0].sections.size(), 3u);
    EXPECT_EQ(txs[0].sections[0].letter, 'A');
    EXPECT_EQ(txs[0].sections[0].content, "[19/Oct/2026:18:52:07 +0200] uid 10.0.0.1 1234\n");
    EXPECT_EQ(txs[0].sections[1].content, "GET / HTTP/1.1\nHost: example.com\n\n");
    EXPECT_EQ(txs[0].sections[2].letter, 'Z');
    EXPECT_TRUE(txs[0].sections[2].content.empty());

    EXPECT_EQ(stats.transactions, 1u);
    EXPECT_EQ(stats.sections, 3u);
    EXPECT_EQ(stats.lines, 7u);
    EXPECT_EQ(stats.incomplete_discarded, 0u);
}

TEST(SplitterTest, TextBeforeFirstMarkerIgnored) {
    auto txs = split(
        "stray line\n"
        "--abcd1234-A--\n"
        "a\n"
        "--abcd1234-Z--\n");
    ASSERT_EQ(txs.size(), 1u);
    EXPECT_EQ(txs[0].sections[0].content, "a\n");
}

TEST(SplitterTest, IncompleteTransactionDiscardedOnNewId) {
    SplitterStats stats;
    auto txs = split(
        "--aaaa1111-A--\n"
        "first\n"
        "--aaaa1111-B--\n"
        "cut off here\n"
        "--bbbb2222-A--\n"
        "second\n"
        "--bbbb2222-Z--\n",
        &stats);

    ASSERT_EQ(txs.size(), 1u);
    EXPECT_EQ(txs[0].id, "bbbb2222");
    ASSERT_EQ(txs[0].sections.size(), 2u);
    EXPECT_EQ(txs[0].sections[0].content, "second\n");
    EXPECT_EQ(stats.incomplete_discarded, 1u);
}

TEST(SplitterTest, IncompleteTransactionDiscardedAtEnd) {
    SplitterStats stats;
    auto txs = split(
        "--aaaa1111-A--\n"
        "a\n"
        "--aaaa1111-Z--\n"
        "--bbbb2222-A--\n"
        "b\n",
        &stats);
    ASSERT_EQ(txs.size(), 1u);
    EXPECT_EQ(txs[0].id, "aaaa1111");
    EXPECT_EQ(stats.incomplete_discarded, 1u);
}

TEST(SplitterTest, MarkerOfDifferentLengthIsContent) {
    auto txs = split(
        "--abcd1234-A--\n"
        "x\n"
        "--abcd1234-C--\n"
        "--ff-A--\n"
        "--abcd1234-Z--\n");
    ASSERT_EQ(txs.size(), 1u);
    ASSERT_EQ(txs[0].sections.size(), 3u);
    EXPECT_EQ(txs[0].sections[1].letter, 'C');
    EXPECT_EQ(txs[0].sections[1].content, "--ff-A--\n");
}

TEST(SplitterTest, RepeatedTerminalMarkerIgnored) {
    SplitterStats stats;
    auto txs = split(
        "--abcd1234-A--\n"
        "a\n"
        "--abcd1234-Z--\n"
        "--abcd1234-Z--\n"
        "--efef5678-A--\n"
        "b\n"
        "--efef5678-Z--\n",
        &stats);
    ASSERT_EQ(txs.size(), 2u);
    EXPECT_EQ(txs[1].id, "efef5678");
    EXPECT_EQ(stats.incomplete_discarded, 0u);
}

TEST(SplitterTest, CrLfLinesStripped) {
    auto txs = split(
        "--abcd1234-A--\r\n"
        "value\r\n"
        "--abcd1234-Z--\r\n");
    ASSERT_EQ(txs.size(), 1u);
    EXPECT_EQ(txs[0].sections[0].content, "value\n");
}

TEST(SplitterTest, OrderPreserved) {
    auto txs = split(
        "--11111111-A--\n--11111111-Z--\n"
        "--22222222-A--\n--22222222-Z--\n"
        "--33333333-A--\n--33333333-Z--\n");
    ASSERT_EQ(txs.size(), 3u);
    EXPECT_EQ(txs[0].id, "11111111");
    EXPECT_EQ(txs[1].id, "22222222");
    EXPECT_EQ(txs[2].id, "33333333");
}

TEST(SplitterTest, ShapeLearnedFromFirstMarker) {
    SectionSplitter splitter(nullptr);
    EXPECT_FALSE(splitter.shape().has_value());
    splitter.feed_line("--abcdef-A--");
    ASSERT_TRUE(splitter.shape().has_value());
    EXPECT_EQ(splitter.shape()->length, 6u);
}

}  // namespace auditview::io::test
