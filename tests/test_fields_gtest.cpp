// ==============================================================================
// test_fields_gtest.cpp - Тесты модели транзакции и Field Extractor (GoogleTest)
// ==============================================================================
//
// - Timestamp: разбор метки аудит-лога и ISO 8601, нормализация к UTC
// - split_fields / parse_metadata: позиционные поля секции A
// - extract_host / extract_status / extract_rule_ids / extract_rule_file
// - extract: значения по умолчанию при повреждённых секциях
// - Колонки и raw_content
//
// ==============================================================================

#include <auditview/audit.hpp>

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace auditview::test {

namespace {

AuditGroup make_group() {
    std::vector<AuditEntry> sections;
    sections.push_back(
        {'A', "[19/Oct/2026:18:52:07 +0200] YWJjZGVm 203.0.113.77 51234 10.0.0.5 443\n"});
    sections.push_back({'B', "GET /login HTTP/1.1\nHost: shop.example.com\nAccept: */*\n\n"});
    sections.push_back({'F', "HTTP/1.1 403 Forbidden\nContent-Length: 199\n\n"});
    sections.push_back({'H',
                        "Message: Access denied [file \"/etc/crs/REQUEST-942.conf\"] "
                        "[line \"45\"] [id \"942100\"] [msg \"SQLi\"]\n"
                        "Message: Inbound anomaly [file \"/etc/crs/REQUEST-949.conf\"] "
                        "[id \"949110\"]\n"
                        "Message: repeated [id \"942100\"]\n\n"});
    sections.push_back({'Z', ""});
    return fields::extract("a1b2c3d4", std::move(sections));
}

}  // anonymous namespace

// ==============================================================================
// Timestamp
// ==============================================================================

TEST(TimestampTest, ParseLog_AppliesOffset) {
    auto ts = Timestamp::parse_log("19/Oct/2026:18:52:07 +0200");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->year, 2026);
    EXPECT_EQ(ts->month, 10);
    EXPECT_EQ(ts->day, 19);
    EXPECT_EQ(ts->hour, 16);
    EXPECT_EQ(ts->minute, 52);
    EXPECT_EQ(ts->second, 7);
    EXPECT_EQ(ts->to_string(), "2026-10-19T16:52:07Z");
}

TEST(TimestampTest, ParseLog_NegativeOffsetCrossesDay) {
    auto ts = Timestamp::parse_log("31/Dec/2025:22:30:00 -0300");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->to_string(), "2026-01-01T01:30:00Z");
}

TEST(TimestampTest, ParseLog_FractionalSeconds) {
    auto ts = Timestamp::parse_log("19/Oct/2026:18:52:07.123456 +0000");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(ts->microsecond, 123456);
    EXPECT_EQ(ts->to_string(), "2026-10-19T18:52:07.123456Z");
}

TEST(TimestampTest, ParseLog_RejectsGarbage) {
    EXPECT_FALSE(Timestamp::parse_log("").has_value());
    EXPECT_FALSE(Timestamp::parse_log("19/Foo/2026:18:52:07 +0200").has_value());
    EXPECT_FALSE(Timestamp::parse_log("19/Oct/2026 18:52:07 +0200").has_value());
    EXPECT_FALSE(Timestamp::parse_log("32/Oct/2026:18:52:07 +0200").has_value());
}

TEST(TimestampTest, ParseIso_AcceptsSpaceAndZulu) {
    auto a = Timestamp::parse_iso("2026-10-19T16:52:07Z");
    auto b = Timestamp::parse_iso("2026-10-19 16:52:07");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, *b);
    EXPECT_EQ(a->to_display_string(), "2026-10-19 16:52:07");
}

TEST(TimestampTest, Ordering) {
    auto early = Timestamp::parse_iso("2026-10-19T10:00:00");
    auto late = Timestamp::parse_iso("2026-10-19T10:00:01");
    ASSERT_TRUE(early && late);
    EXPECT_TRUE(*early < *late);
    EXPECT_TRUE(*late > *early);
    EXPECT_TRUE(*early <= *early);
    EXPECT_NE(*early, *late);
}

// ==============================================================================
// Секция A
// ==============================================================================

TEST(FieldsTest, SplitFields_KeepsBracketedTimestamp) {
    auto parts = fields::split_fields("[19/Oct/2026:18:52:07 +0200] abc 10.0.0.1 5555");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "[19/Oct/2026:18:52:07 +0200]");
    EXPECT_EQ(parts[1], "abc");
    EXPECT_EQ(parts[2], "10.0.0.1");
    EXPECT_EQ(parts[3], "5555");
}

TEST(FieldsTest, ParseMetadata_AllFields) {
    auto meta = fields::parse_metadata(
        "[19/Oct/2026:18:52:07 +0200] YWJjZGVm 203.0.113.77 51234 10.0.0.5 443\n");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->timestamp_text, "19/Oct/2026:18:52:07 +0200");
    EXPECT_EQ(meta->unique_id, "YWJjZGVm");
    EXPECT_EQ(meta->client_address, "203.0.113.77");
    EXPECT_EQ(meta->client_port, 51234);
    EXPECT_EQ(meta->server_address, "10.0.0.5");
    EXPECT_EQ(meta->server_port, 443);
}

TEST(FieldsTest, ParseMetadata_Ipv6ClientByPosition) {
    auto meta = fields::parse_metadata("[19/Oct/2026:18:52:07 +0200] id1 2001:db8::1 8080\n");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->client_address, "2001:db8::1");
    EXPECT_EQ(meta->client_port, 8080);
    EXPECT_FALSE(meta->server_address.has_value());
}

TEST(FieldsTest, ParseMetadata_RejectsShortHeader) {
    EXPECT_FALSE(fields::parse_metadata("[19/Oct/2026:18:52:07 +0200] only\n").has_value());
    EXPECT_FALSE(fields::parse_metadata("no brackets here at all\n").has_value());
    EXPECT_FALSE(fields::parse_metadata("").has_value());
}

TEST(FieldsTest, ParseMetadata_BadPortIsAbsent) {
    auto meta = fields::parse_metadata("[19/Oct/2026:18:52:07 +0200] id1 10.0.0.1 99999\n");
    ASSERT_TRUE(meta.has_value());
    EXPECT_FALSE(meta->client_port.has_value());
}

// ==============================================================================
// Секции B / F / H
// ==============================================================================

TEST(FieldsTest, ExtractHost_CaseInsensitiveName) {
    EXPECT_EQ(fields::extract_host("GET / HTTP/1.1\nhOsT:  Example.org \n\n"), "Example.org");
}

TEST(FieldsTest, ExtractHost_SkipsRequestLine) {
    EXPECT_FALSE(fields::extract_host("Host: fake\n").has_value());
    EXPECT_FALSE(fields::extract_host("GET / HTTP/1.1\nAccept: */*\n").has_value());
}

TEST(FieldsTest, ExtractStatus_FirstStatusLine) {
    EXPECT_EQ(fields::extract_status("HTTP/1.1 502 Bad Gateway\n"), 502);
    EXPECT_EQ(fields::extract_status("HTTP/2 200\r\n"), 200);
}

TEST(FieldsTest, ExtractStatus_RequiresThreeDigits) {
    EXPECT_FALSE(fields::extract_status("HTTP/1.1 20 OK\n").has_value());
    EXPECT_FALSE(fields::extract_status("HTTP/1.1 2000 OK\n").has_value());
    EXPECT_FALSE(fields::extract_status("Content-Type: text/html\n").has_value());
}

TEST(FieldsTest, ExtractRuleIds_DeduplicatedInOrder) {
    auto ids = fields::extract_rule_ids(
        "[id \"942100\"] [id \"949110\"] [id \"942100\"] [id \"abc\"] [id \"\"]");
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "942100");
    EXPECT_EQ(ids[1], "949110");
}

TEST(FieldsTest, ExtractRuleFile_First) {
    EXPECT_EQ(fields::extract_rule_file("[file \"/a.conf\"] [file \"/b.conf\"]"), "/a.conf");
    EXPECT_FALSE(fields::extract_rule_file("[id \"1\"]").has_value());
}

// ==============================================================================
// extract
// ==============================================================================

TEST(FieldsTest, Extract_FullTransaction) {
    AuditGroup group = make_group();
    EXPECT_EQ(group.transaction_id, "a1b2c3d4");
    ASSERT_TRUE(group.timestamp.has_value());
    EXPECT_EQ(group.timestamp->to_string(), "2026-10-19T16:52:07Z");
    EXPECT_EQ(group.client_address, "203.0.113.77");
    EXPECT_EQ(group.host, "shop.example.com");
    EXPECT_EQ(group.status, 403);
    EXPECT_EQ(group.rule_ids, (std::vector<std::string>{"942100", "949110"}));
    EXPECT_EQ(group.rule_file, "/etc/crs/REQUEST-942.conf");
    EXPECT_EQ(group.unique_id, "YWJjZGVm");
    EXPECT_EQ(group.server_port, 443);
    ASSERT_EQ(group.sections.size(), 5u);
    EXPECT_EQ(group.sections.back().letter, 'Z');
}

TEST(FieldsTest, Extract_DefaultsWhenSectionsMissing) {
    AuditGroup group = fields::extract("deadbeef", {{'A', "garbage\n"}, {'Z', ""}});
    EXPECT_EQ(group.client_address, kUnknownAddress);
    EXPECT_EQ(group.host, kUnknownHost);
    EXPECT_FALSE(group.timestamp.has_value());
    EXPECT_FALSE(group.status.has_value());
    EXPECT_TRUE(group.rule_ids.empty());
    EXPECT_FALSE(group.rule_file.has_value());
}

TEST(FieldsTest, Extract_BadTimestampKeepsAddress) {
    AuditGroup group =
        fields::extract("x1", {{'A', "[not a time] uid 198.51.100.4 1000\n"}, {'Z', ""}});
    EXPECT_FALSE(group.timestamp.has_value());
    EXPECT_EQ(group.client_address, "198.51.100.4");
}

TEST(FieldsTest, Extract_RepeatedLetterUsesFirst) {
    AuditGroup group = fields::extract(
        "x2", {{'B', "GET / HTTP/1.1\nHost: first\n"}, {'B', "GET / HTTP/1.1\nHost: second\n"},
               {'Z', ""}});
    EXPECT_EQ(group.host, "first");
}

// ==============================================================================
// Проекции
// ==============================================================================

TEST(ProjectionTest, RawContent_ReconstructsMarkers) {
    AuditGroup group = fields::extract("ab12", {{'A', "line a\n"}, {'H', "line h\n"}, {'Z', ""}});
    EXPECT_EQ(raw_content(group), "--ab12-A--\nline a\n--ab12-H--\nline h\n--ab12-Z--\n");
}

TEST(ProjectionTest, ParseColumns_NamesAndSynonyms) {
    auto cols = parse_columns("id, ip ,Host,status,file");
    ASSERT_TRUE(cols.has_value());
    EXPECT_EQ(*cols, (std::vector<Column>{Column::AuditId, Column::ClientAddress, Column::Domain,
                                          Column::Status, Column::RuleFile}));
    EXPECT_FALSE(parse_columns("id,bogus").has_value());
}

TEST(ProjectionTest, ColumnValue_RuleIdsTruncated) {
    AuditGroup group = make_group();
    ColumnOptions opts;
    opts.max_rule_ids = 1;
    EXPECT_EQ(column_value(group, Column::RuleIds, opts), "942100 (+1)");
    opts.max_rule_ids = 0;
    EXPECT_EQ(column_value(group, Column::RuleIds, opts), "942100, 949110");
}

TEST(ProjectionTest, ColumnValue_MissingValuesShowNa) {
    AuditGroup group = fields::extract("x3", {{'Z', ""}});
    EXPECT_EQ(column_value(group, Column::Timestamp), "N/A");
    EXPECT_EQ(column_value(group, Column::Status), "N/A");
    EXPECT_EQ(column_value(group, Column::RuleFile), "N/A");
    EXPECT_EQ(column_value(group, Column::Domain), kUnknownHost);
}

TEST(ProjectionTest, ColumnValues_DefaultColumns) {
    AuditGroup group = make_group();
    auto row = column_values(group, default_columns());
    ASSERT_EQ(row.size(), default_columns().size());
    EXPECT_EQ(row[0], "a1b2c3d4");
    EXPECT_EQ(row[1], "2026-10-19 16:52:07");
    EXPECT_EQ(row[2], "shop.example.com");
    EXPECT_EQ(row[3], "203.0.113.77");
    EXPECT_EQ(row[4], "403");
}

TEST(ProjectionTest, GroupIndexFind) {
    GroupIndex index;
    index.groups.push_back(make_group());
    index.groups.push_back(fields::extract("ffff0000", {{'Z', ""}}));
    EXPECT_EQ(index.find("ffff0000"), 1u);
    EXPECT_FALSE(index.find("missing").has_value());
}

}  // namespace auditview::test
