// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (GoogleTest)
// ==============================================================================
//
// - parse_config: значения по умолчанию, частичная конфигурация, ошибки типов
// - load_config / resolve_config: явный путь, auditview.yml в каталоге
//
// ==============================================================================

#include <auditview/config.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace auditview::config::test {

// ==============================================================================
// parse_config
// ==============================================================================

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    auto result = parse_config("");
    ASSERT_TRUE(result) << result.error;
    EXPECT_TRUE(result.config.geo.enabled);
    EXPECT_EQ(result.config.geo.endpoint, geo::kDefaultEndpoint);
    EXPECT_EQ(result.config.geo.timeout_ms, 5000);
    EXPECT_EQ(result.config.display.columns, default_columns());
    EXPECT_EQ(result.config.display.column_width, 40u);
    EXPECT_EQ(result.config.display.max_rule_ids, 3u);
    EXPECT_FALSE(result.config.display.newest_first);
    EXPECT_FALSE(result.config.source.has_value());
}

TEST(ConfigTest, FullDocument) {
    auto result = parse_config(R"(
geo:
  enabled: false
  endpoint: http://geo.internal/json
  timeout_ms: 1500
display:
  columns: [id, status, file]
  column_width: 60
  max_rule_ids: 0
  newest_first: true
)");
    ASSERT_TRUE(result) << result.error;
    const Config& c = result.config;
    EXPECT_FALSE(c.geo.enabled);
    EXPECT_EQ(c.geo.endpoint, "http://geo.internal/json");
    EXPECT_EQ(c.geo.timeout_ms, 1500);
    EXPECT_EQ(c.display.columns,
              (std::vector<Column>{Column::AuditId, Column::Status, Column::RuleFile}));
    EXPECT_EQ(c.display.column_width, 60u);
    EXPECT_EQ(c.display.max_rule_ids, 0u);
    EXPECT_TRUE(c.display.newest_first);
}

TEST(ConfigTest, ColumnsAsCommaString) {
    auto result = parse_config("display:\n  columns: \"timestamp, ip\"\n");
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.config.display.columns,
              (std::vector<Column>{Column::Timestamp, Column::ClientAddress}));
}

TEST(ConfigTest, UnknownKeysIgnored) {
    auto result = parse_config("theme: dark\ngeo:\n  colour: blue\n");
    ASSERT_TRUE(result) << result.error;
    EXPECT_TRUE(result.config.geo.enabled);
}

TEST(ConfigTest, InvalidValueNamesKey) {
    auto result = parse_config("display:\n  column_width: wide\n");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("display.column_width"), std::string::npos);
}

TEST(ConfigTest, InvalidBoolean) {
    auto result = parse_config("geo:\n  enabled: maybe\n");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("geo.enabled"), std::string::npos);
}

TEST(ConfigTest, UnknownColumnRejected) {
    auto result = parse_config("display:\n  columns: [id, colour]\n");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("display.columns"), std::string::npos);
}

TEST(ConfigTest, NegativeTimeoutRejected) {
    EXPECT_FALSE(parse_config("geo:\n  timeout_ms: -1\n"));
}

TEST(ConfigTest, SectionMustBeMapping) {
    EXPECT_FALSE(parse_config("geo: yes\n"));
    EXPECT_FALSE(parse_config("- a\n- b\n"));
}

TEST(ConfigTest, MalformedYaml) {
    auto result = parse_config("geo: [unterminated\n");
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.error.empty());
}

// ==============================================================================
// load_config / resolve_config
// ==============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = fs::temp_directory_path() /
                    (std::string("auditview_config_") + info->name() + "_" +
                     std::to_string(
#ifdef _WIN32
                         GetCurrentProcessId()
#else
                         getpid()
#endif
                             ));
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path write(const std::string& name, const std::string& content) {
        fs::path p = temp_dir_ / name;
        std::ofstream out(p);
        out << content;
        return p;
    }

    fs::path temp_dir_;
};

TEST_F(ConfigFileTest, LoadRecordsSource) {
    auto path = write("custom.yml", "display:\n  newest_first: true\n");
    auto result = load_config(path);
    ASSERT_TRUE(result) << result.error;
    EXPECT_TRUE(result.config.display.newest_first);
    ASSERT_TRUE(result.config.source.has_value());
    EXPECT_EQ(result.config.source->string(), path.string());
}

TEST_F(ConfigFileTest, LoadMissingFileFails) {
    auto result = load_config(temp_dir_ / "absent.yml");
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("could not open configuration file"), std::string::npos);
}

TEST_F(ConfigFileTest, LoadErrorIncludesPath) {
    auto path = write("bad.yml", "display:\n  max_rule_ids: many\n");
    auto result = load_config(path);
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("bad.yml"), std::string::npos);
    EXPECT_NE(result.error.find("display.max_rule_ids"), std::string::npos);
}

TEST_F(ConfigFileTest, ResolveExplicitPathMustExist) {
    auto result = resolve_config(temp_dir_ / "absent.yml", temp_dir_);
    EXPECT_FALSE(result);
}

TEST_F(ConfigFileTest, ResolveFindsDefaultFileInDirectory) {
    write(kDefaultConfigFile, "geo:\n  enabled: false\n");
    auto result = resolve_config(std::nullopt, temp_dir_);
    ASSERT_TRUE(result) << result.error;
    EXPECT_FALSE(result.config.geo.enabled);
    EXPECT_TRUE(result.config.source.has_value());
}

TEST_F(ConfigFileTest, ResolveFallsBackToDefaults) {
    auto result = resolve_config(std::nullopt, temp_dir_);
    ASSERT_TRUE(result) << result.error;
    EXPECT_TRUE(result.config.geo.enabled);
    EXPECT_FALSE(result.config.source.has_value());
}

}  // namespace auditview::config::test
