// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ProgressLedger
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

#include "progress_ledger.hpp"
#include "test_helpers.hpp"

using namespace ais::uploader;
using namespace ais::uploader::test;
using json = nlohmann::json;

class ProgressLedgerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = createTempDir("ais_ledger_");
    ledger_path_ = dir_ + "/progress.json";
  }

  void TearDown() override {
    std::filesystem::remove_all(dir_);
  }

  FileDescriptor file(
    const std::string& name, uint64_t size, const std::string& year = "2024",
    const std::string& month = "03"
  ) {
    FileDescriptor f;
    f.local_path = "/archive/" + year + "/" + month + "/" + name;
    f.filename = name;
    f.size = size;
    f.year = year;
    f.month = month;
    f.remote_key = makeRemoteKey(year, month, name);
    return f;
  }

  void writeLedgerText(const std::string& text) {
    std::ofstream out(ledger_path_);
    out << text;
  }

  std::string dir_;
  std::string ledger_path_;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(ProgressLedgerTest, MissingFileStartsEmpty) {
  ProgressLedger ledger(ledger_path_);

  EXPECT_EQ(ledger.loadStatus(), LedgerLoadStatus::MISSING);
  EXPECT_EQ(ledger.size(), 0u);
  EXPECT_FALSE(ledger.isUploaded(file("a.rar", 10)));
}

TEST_F(ProgressLedgerTest, CorruptFileStartsEmpty) {
  writeLedgerText("{ this is not json");
  ProgressLedger ledger(ledger_path_);

  EXPECT_EQ(ledger.loadStatus(), LedgerLoadStatus::CORRUPT);
  EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(ProgressLedgerTest, NonObjectDocumentIsCorrupt) {
  writeLedgerText("[1, 2, 3]");
  ProgressLedger ledger(ledger_path_);

  EXPECT_EQ(ledger.loadStatus(), LedgerLoadStatus::CORRUPT);
}

TEST_F(ProgressLedgerTest, MalformedEntryIsSkipped) {
  writeLedgerText(R"({
    "/archive/2024/03/good.rar": {"filename": "good.rar", "s3_key": "2024/03/good.rar",
                                  "size": 42, "upload_time": "2024-03-01T00:00:00Z",
                                  "s3_etag": "abc", "year": "2024", "month": "03"},
    "/archive/2024/03/bad.rar": {"filename": "bad.rar", "size": "forty-two"},
    "/archive/2024/03/nosize.rar": {"filename": "nosize.rar"}
  })");
  ProgressLedger ledger(ledger_path_);

  EXPECT_EQ(ledger.loadStatus(), LedgerLoadStatus::LOADED);
  EXPECT_EQ(ledger.size(), 1u);
  EXPECT_TRUE(ledger.isUploaded(file("good.rar", 42)));
  EXPECT_FALSE(ledger.get("/archive/2024/03/bad.rar").has_value());
}

TEST_F(ProgressLedgerTest, NegativeOrFractionalSizeIsSkipped) {
  writeLedgerText(R"({
    "/archive/2024/03/good.rar": {"size": 42},
    "/archive/2024/03/negative.rar": {"size": -1},
    "/archive/2024/03/fraction.rar": {"size": 1.5}
  })");
  ProgressLedger ledger(ledger_path_);

  EXPECT_EQ(ledger.loadStatus(), LedgerLoadStatus::LOADED);
  EXPECT_EQ(ledger.size(), 1u);
  EXPECT_FALSE(ledger.get("/archive/2024/03/negative.rar").has_value());
  EXPECT_FALSE(ledger.get("/archive/2024/03/fraction.rar").has_value());
}

TEST_F(ProgressLedgerTest, MissingOptionalFieldsDefault) {
  writeLedgerText(R"({"/archive/2023/11/x.rar": {"size": 7}})");
  ProgressLedger ledger(ledger_path_);

  auto record = ledger.get("/archive/2023/11/x.rar");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->filename, "x.rar");
  EXPECT_EQ(record->size, 7u);
  EXPECT_TRUE(record->remote_etag.empty());
}

// ============================================================================
// Recording and persistence
// ============================================================================

TEST_F(ProgressLedgerTest, RecordSuccessPersistsImmediately) {
  {
    ProgressLedger ledger(ledger_path_);
    ASSERT_TRUE(ledger.recordSuccess(file("a.rar", 100), "etag-a"));
  }

  ProgressLedger reloaded(ledger_path_);
  EXPECT_EQ(reloaded.loadStatus(), LedgerLoadStatus::LOADED);
  EXPECT_TRUE(reloaded.isUploaded(file("a.rar", 100)));

  auto record = reloaded.get("/archive/2024/03/a.rar");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->remote_key, "2024/03/a.rar");
  EXPECT_EQ(record->remote_etag, "etag-a");
  EXPECT_EQ(record->year, "2024");
  EXPECT_EQ(record->month, "03");
  EXPECT_EQ(record->upload_time.size(), 20u);  // YYYY-MM-DDTHH:MM:SSZ
  EXPECT_FALSE(std::filesystem::exists(ledger_path_ + ".tmp"));
}

TEST_F(ProgressLedgerTest, WritesCompatibleJsonKeys) {
  ProgressLedger ledger(ledger_path_);
  ASSERT_TRUE(ledger.recordSuccess(file("a.rar", 100), "etag-a"));

  std::ifstream in(ledger_path_);
  json document = json::parse(in);
  const auto& entry = document.at("/archive/2024/03/a.rar");
  EXPECT_EQ(entry.at("filename"), "a.rar");
  EXPECT_EQ(entry.at("s3_key"), "2024/03/a.rar");
  EXPECT_EQ(entry.at("size"), 100);
  EXPECT_EQ(entry.at("s3_etag"), "etag-a");
  EXPECT_TRUE(entry.contains("upload_time"));
}

TEST_F(ProgressLedgerTest, NonUtf8NamesRoundTripExactly) {
  // Latin-1 "cafe" with an acute e, as a filesystem may hand it back
  const std::string latin1_name = "caf\xe9.rar";
  {
    ProgressLedger ledger(ledger_path_);
    ASSERT_TRUE(ledger.recordSuccess(file("good.rar", 5), "etag-good"));
    ASSERT_TRUE(ledger.recordSuccess(file(latin1_name, 10), "etag-latin1"));
  }

  // The file on disk stays valid JSON and keeps the earlier record
  std::ifstream in(ledger_path_);
  json document = json::parse(in);
  EXPECT_TRUE(document.contains("/archive/2024/03/good.rar"));

  ProgressLedger reloaded(ledger_path_);
  EXPECT_EQ(reloaded.loadStatus(), LedgerLoadStatus::LOADED);
  EXPECT_EQ(reloaded.size(), 2u);
  EXPECT_TRUE(reloaded.isUploaded(file("good.rar", 5)));
  EXPECT_TRUE(reloaded.isUploaded(file(latin1_name, 10)));

  auto record = reloaded.get("/archive/2024/03/" + latin1_name);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->filename, latin1_name);
  EXPECT_EQ(record->remote_key, "2024/03/" + latin1_name);
  EXPECT_EQ(record->remote_etag, "etag-latin1");
}

TEST_F(ProgressLedgerTest, SizeDriftMeansNotUploaded) {
  ProgressLedger ledger(ledger_path_);
  ASSERT_TRUE(ledger.recordSuccess(file("a.rar", 100), "etag-a"));

  EXPECT_TRUE(ledger.isUploaded(file("a.rar", 100)));
  EXPECT_FALSE(ledger.isUploaded(file("a.rar", 101)));
}

TEST_F(ProgressLedgerTest, RecordOverwritesPreviousEntry) {
  ProgressLedger ledger(ledger_path_);
  ASSERT_TRUE(ledger.recordSuccess(file("a.rar", 100), "old"));
  ASSERT_TRUE(ledger.recordSuccess(file("a.rar", 150), "new"));

  EXPECT_EQ(ledger.size(), 1u);
  EXPECT_EQ(ledger.get("/archive/2024/03/a.rar")->remote_etag, "new");
  EXPECT_TRUE(ledger.isUploaded(file("a.rar", 150)));
}

TEST_F(ProgressLedgerTest, CreatesParentDirectories) {
  std::string nested = dir_ + "/state/nested/progress.json";
  ProgressLedger ledger(nested);

  ASSERT_TRUE(ledger.recordSuccess(file("a.rar", 1), "e"));
  EXPECT_TRUE(std::filesystem::exists(nested));
}

TEST_F(ProgressLedgerTest, PersistFailureIsReported) {
  // A regular file where the parent directory should be
  std::ofstream(dir_ + "/blocker") << "x";
  ProgressLedger ledger(dir_ + "/blocker/progress.json");

  EXPECT_FALSE(ledger.recordSuccess(file("a.rar", 1), "e"));
  // The in-memory record is kept for the rest of the run
  EXPECT_TRUE(ledger.isUploaded(file("a.rar", 1)));
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(ProgressLedgerTest, SnapshotGroupsByYearAndMonth) {
  ProgressLedger ledger(ledger_path_);
  ledger.recordSuccess(file("b.rar", 1, "2024", "03"), "e");
  ledger.recordSuccess(file("a.rar", 1, "2024", "03"), "e");
  ledger.recordSuccess(file("c.rar", 1, "2024", "11"), "e");
  ledger.recordSuccess(file("d.rar", 1, "2023", "01"), "e");

  auto snapshot = ledger.snapshot();

  ASSERT_EQ(snapshot.size(), 2u);
  ASSERT_EQ(snapshot["2024"].size(), 2u);
  ASSERT_EQ(snapshot["2024"]["03"].size(), 2u);
  EXPECT_EQ(snapshot["2024"]["03"][0].filename, "a.rar");
  EXPECT_EQ(snapshot["2024"]["03"][1].filename, "b.rar");
  EXPECT_EQ(snapshot["2024"]["11"].size(), 1u);
  EXPECT_EQ(snapshot["2023"]["01"].size(), 1u);
}

TEST_F(ProgressLedgerTest, RecordsAreSortedByPath) {
  ProgressLedger ledger(ledger_path_);
  ledger.recordSuccess(file("z.rar", 1), "e");
  ledger.recordSuccess(file("m.rar", 1), "e");

  auto records = ledger.records();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_LT(records[0].local_path, records[1].local_path);
}

TEST(TimestampTest, IsIso8601Utc) {
  auto stamp = currentTimestampUtc();
  ASSERT_EQ(stamp.size(), 20u);
  EXPECT_EQ(stamp[4], '-');
  EXPECT_EQ(stamp[10], 'T');
  EXPECT_EQ(stamp.back(), 'Z');
}
