// ==============================================================================
// test_ingest_gtest.cpp - Тесты загрузки аудит-лога (GoogleTest)
// ==============================================================================
//
// - ingest_text: индекс, статистика, фазы прогресса
// - ingest: ошибки файловой системы (IngestErrorKind)
//
// ==============================================================================

#include <auditview/ingest.hpp>
#include <auditview/platform.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace auditview::io::test {

namespace {

const char* kTwoTransactions =
    "--a1b2c3d4-A--\n"
    "[19/Oct/2026:18:52:07 +0200] uid1 203.0.113.77 51234 10.0.0.5 443\n"
    "--a1b2c3d4-B--\n"
    "GET / HTTP/1.1\n"
    "Host: shop.example.com\n"
    "\n"
    "--a1b2c3d4-F--\n"
    "HTTP/1.1 200 OK\n"
    "\n"
    "--a1b2c3d4-Z--\n"
    "\n"
    "--e5f6a7b8-A--\n"
    "[19/Oct/2026:18:53:00 +0200] uid2 198.51.100.9 40000 10.0.0.5 443\n"
    "--e5f6a7b8-H--\n"
    "Message: [file \"/etc/crs/REQUEST-942.conf\"] [id \"942100\"]\n"
    "--e5f6a7b8-Z--\n"
    "--c9d0e1f2-A--\n"
    "[19/Oct/2026:18:54:00 +0200] uid3 192.0.2.1 1 10.0.0.5 443\n";

}  // anonymous namespace

// ==============================================================================
// ingest_text
// ==============================================================================

TEST(IngestTextTest, BuildsIndexInFileOrder) {
    auto index = ingest_text(kTwoTransactions);
    ASSERT_NE(index, nullptr);
    ASSERT_EQ(index->size(), 2u);
    EXPECT_EQ((*index)[0].transaction_id, "a1b2c3d4");
    EXPECT_EQ((*index)[0].host, "shop.example.com");
    EXPECT_EQ((*index)[0].status, 200);
    EXPECT_EQ((*index)[1].transaction_id, "e5f6a7b8");
    EXPECT_EQ((*index)[1].client_address, "198.51.100.9");
    EXPECT_EQ((*index)[1].rule_ids, std::vector<std::string>{"942100"});
}

TEST(IngestTextTest, Stats) {
    auto index = ingest_text(kTwoTransactions);
    const auto& stats = index->stats;
    EXPECT_EQ(stats.bytes, std::string(kTwoTransactions).size());
    EXPECT_EQ(stats.transactions, 2u);
    EXPECT_EQ(stats.sections, 7u);
    EXPECT_EQ(stats.incomplete_discarded, 1u);
    EXPECT_EQ(stats.lines, 18u);
}

TEST(IngestTextTest, EmptyInput) {
    auto index = ingest_text("");
    ASSERT_NE(index, nullptr);
    EXPECT_TRUE(index->empty());
    EXPECT_EQ(index->stats.transactions, 0u);
}

TEST(IngestTextTest, ProgressPhasesInOrder) {
    std::vector<Progress> seen;
    ingest_text(kTwoTransactions, [&](const Progress& p) { seen.push_back(p); });

    ASSERT_GE(seen.size(), 4u);
    EXPECT_EQ(seen.front().phase, ProgressPhase::Split);
    EXPECT_EQ(seen.front().current, 0u);
    EXPECT_EQ(seen.back().phase, ProgressPhase::Extract);
    EXPECT_EQ(seen.back().current, 2u);
    EXPECT_EQ(seen.back().total, 2u);

    bool extract_started = false;
    for (const auto& p : seen) {
        if (p.phase == ProgressPhase::Extract) {
            extract_started = true;
        } else {
            EXPECT_FALSE(extract_started) << "split reported after extraction began";
        }
        EXPECT_LE(p.current, p.total);
    }
}

TEST(IngestTextTest, ProgressReportedEveryThousandLines) {
    std::string text;
    for (int i = 0; i < 600; ++i) {
        char id[16];
        std::snprintf(id, sizeof(id), "%08d", i);
        text += std::string("--") + id + "-A--\n";
        text += "[19/Oct/2026:18:52:07 +0200] u 10.0.0.1 1\n";
        text += std::string("--") + id + "-Z--\n";
    }
    int split_reports = 0;
    ingest_text(text, [&](const Progress& p) {
        if (p.phase == ProgressPhase::Split) {
            ++split_reports;
        }
    });
    // 1800 строк: старт, 1000, финиш
    EXPECT_EQ(split_reports, 3);
}

TEST(IngestTextTest, PhaseNames) {
    EXPECT_STREQ(progress_phase_name(ProgressPhase::Read), "Reading");
    EXPECT_STREQ(progress_phase_name(ProgressPhase::Split), "Splitting");
    EXPECT_STREQ(progress_phase_name(ProgressPhase::Extract), "Indexing");
}

// ==============================================================================
// ingest (файлы)
// ==============================================================================

class IngestFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("auditview_ingest_") + info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        temp_dir_ = fs::temp_directory_path() / unique_name;
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        fs::path p = temp_dir_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

    fs::path temp_dir_;
};

TEST_F(IngestFileTest, LoadsFile) {
    auto path = write_file("modsec_audit.log", kTwoTransactions);
    std::vector<ProgressPhase> phases;
    auto result = ingest(path, [&](const Progress& p) {
        if (phases.empty() || phases.back() != p.phase) {
            phases.push_back(p.phase);
        }
    });

    ASSERT_TRUE(result);
    ASSERT_NE(result.index, nullptr);
    EXPECT_EQ(result.index->size(), 2u);
    EXPECT_EQ(phases, (std::vector<ProgressPhase>{ProgressPhase::Read, ProgressPhase::Split,
                                                   ProgressPhase::Extract}));
}

TEST_F(IngestFileTest, EmptyFileGivesEmptyIndex) {
    auto path = write_file("empty.log", "");
    auto result = ingest(path);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.index->empty());
}

TEST_F(IngestFileTest, MissingFile) {
    auto result = ingest(temp_dir_ / "nope.log");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, IngestErrorKind::FileNotFound);
    EXPECT_EQ(result.index, nullptr);
    EXPECT_NE(result.error.format().find("failed to load file '"), std::string::npos);
    EXPECT_NE(result.error.format().find("nope.log"), std::string::npos);
}

TEST_F(IngestFileTest, DirectoryIsNotAFile) {
    auto result = ingest(temp_dir_);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, IngestErrorKind::NotAFile);
    EXPECT_STREQ(ingest_error_kind_to_string(result.error.kind), "NotAFile");
}

#ifndef _WIN32
TEST_F(IngestFileTest, UnreadableFile) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root ignores file permissions";
    }
    auto path = write_file("locked.log", kTwoTransactions);
    fs::permissions(path, fs::perms::none);
    auto result = ingest(path);
    fs::permissions(path, fs::perms::owner_all);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, IngestErrorKind::PermissionDenied);
}
#endif

}  // namespace auditview::io::test
