// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for PartTransferWorker
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>

#include "local_files_impl.hpp"
#include "part_transfer_worker.hpp"
#include "test_helpers.hpp"
#include "uploader_mocks.hpp"

using namespace ais::uploader;
using namespace ais::uploader::test;
using ::testing::_;
using ::testing::Eq;
using ::testing::Field;
using ::testing::Return;

class PartTransferWorkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = createTempDir("ais_worker_");
    path_ = createArchiveFile(dir_ + "/part.rar", 3000);
    content_ = readWholeFile(path_);
    handle_ = {"bucket", "2024/03/part.rar", "upload-1"};
  }

  void TearDown() override {
    std::filesystem::remove_all(dir_);
  }

  PartSpec spec(int number, uint64_t start, uint64_t end) {
    PartSpec s;
    s.part_number = number;
    s.start = start;
    s.end = end;
    return s;
  }

  std::string dir_;
  std::string path_;
  std::string content_;
  MultipartHandle handle_;
  ArchiveReaderFactory readers_;
  MockObjectStore store_;
};

TEST_F(PartTransferWorkerTest, SendsRangeAndBuildsReceipt) {
  std::string sent;
  EXPECT_CALL(store_, uploadPart(Field(&MultipartHandle::upload_id, Eq("upload-1")), 2, _, 1000))
    .WillOnce([&](const MultipartHandle&, int, const char* data, uint64_t size) {
      sent.assign(data, static_cast<size_t>(size));
      return StoreResult::Success("\"abc\"");
    });

  PartTransferWorker worker(store_, readers_);
  auto result = worker.transferPart(path_, spec(2, 1000, 2000), handle_);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.receipt.part_number, 2);
  EXPECT_EQ(result.receipt.size, 1000u);
  EXPECT_EQ(result.receipt.etag, "\"abc\"");
  EXPECT_EQ(sent, content_.substr(1000, 1000));
}

TEST_F(PartTransferWorkerTest, StoreFailureKeepsKind) {
  EXPECT_CALL(store_, uploadPart(_, 1, _, _))
    .WillOnce(Return(StoreResult::Failure("timed out", "RequestTimeout")));

  PartTransferWorker worker(store_, readers_);
  auto result = worker.transferPart(path_, spec(1, 0, 1000), handle_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.receipt.part_number, 1);
  EXPECT_EQ(result.kind, FailureKind::NETWORK);
}

TEST_F(PartTransferWorkerTest, ReadFailureNeverReachesStore) {
  EXPECT_CALL(store_, uploadPart(_, _, _, _)).Times(0);

  PartTransferWorker worker(store_, readers_);
  // Range extends past the 3000-byte file
  auto result = worker.transferPart(path_, spec(3, 2000, 4000), handle_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.kind, FailureKind::LOCAL_IO);
}

TEST_F(PartTransferWorkerTest, RejectsInvalidSpec) {
  EXPECT_CALL(store_, uploadPart(_, _, _, _)).Times(0);

  PartTransferWorker worker(store_, readers_);
  EXPECT_EQ(worker.transferPart(path_, spec(0, 0, 10), handle_).kind, FailureKind::INVALID_INPUT);
  EXPECT_EQ(worker.transferPart(path_, spec(1, 10, 10), handle_).kind, FailureKind::INVALID_INPUT);
}
