#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "infrastructure/file_transfer.hpp"
#include "infrastructure/transfer_stager.hpp"
#include "test_support.hpp"

namespace conversion_service {
namespace {

using test_support::GeneratedTransfer;
using test_support::TempDir;

constexpr std::uint64_t kMiB = 1024 * 1024;

class TransferStagerTest : public ::testing::Test {
protected:
  TransferStager makeStager(std::shared_ptr<TransferService> extra = nullptr) {
    std::vector<std::shared_ptr<TransferService>> services{std::make_shared<FileTransfer>(64 * 1024)};
    if (extra) {
      services.insert(services.begin(), extra);
    }
    return TransferStager(services, {64 * 1024, std::chrono::milliseconds(0), "file://" + (dir / "outbox").string()});
  }

  std::vector<ProgressUpdate> updates;
  ProgressCallback record = [this](const ProgressUpdate& update) { updates.push_back(update); };
  CancellationToken cancel;
  TempDir dir;
};

TEST_F(TransferStagerTest, DownloadsLocalFileInChunks) {
  auto source = test_support::writeFile(dir / "in" / "clip.mkv", 300 * 1024);
  auto stager = makeStager();
  auto destination = dir / "source.mkv";

  auto result = stager.download({"file://" + source.string(), "clip.mkv", "video/x-matroska", std::nullopt, ""},
                                destination, kMiB, record, cancel);
  ASSERT_TRUE(result.has_value()) << result.error().debug();
  EXPECT_EQ(*result, 300u * 1024);
  EXPECT_EQ(std::filesystem::file_size(destination), 300u * 1024);

  ASSERT_FALSE(updates.empty());
  EXPECT_TRUE(updates.back().final);
  EXPECT_DOUBLE_EQ(updates.back().fraction, 1.0);
  for (std::size_t i = 1; i < updates.size(); ++i) {
    EXPECT_GE(updates[i].fraction, updates[i - 1].fraction);
  }
}

TEST_F(TransferStagerTest, DeclaredSizeOverLimitFailsBeforeFetching) {
  auto generated = std::make_shared<GeneratedTransfer>(10 * kMiB, 64 * 1024, true);
  auto stager = makeStager(generated);
  auto destination = dir / "source.mp4";

  // 2.5 GB declared against a 2 GB ceiling
  auto result = stager.download({"gen://big.mp4", "big.mp4", "video/mp4", 2684354560ULL, ""},
                                destination, 2147483648ULL, record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::SizeLimitExceeded);
  EXPECT_EQ(result.error().message, "file is too large (limit 2.00 GB)");
  EXPECT_EQ(generated->fetch_calls.load(), 0);
  EXPECT_FALSE(std::filesystem::exists(destination));
}

TEST_F(TransferStagerTest, StreamedSourceAbortsAsSoonAsCeilingIsCrossed) {
  auto generated = std::make_shared<GeneratedTransfer>(5 * kMiB, 64 * 1024, false);
  auto stager = makeStager(generated);
  auto destination = dir / "source.mp4";

  auto result = stager.download({"gen://stream.mp4", "stream.mp4", "video/mp4", std::nullopt, ""},
                                destination, 4 * kMiB, record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::SizeLimitExceeded);
  // stopped at the first chunk past the ceiling, not at the end of the stream
  EXPECT_LE(generated->bytes_offered.load(), 4 * kMiB + 64 * 1024);
  EXPECT_FALSE(std::filesystem::exists(destination));
}

TEST_F(TransferStagerTest, ReportedLengthOverLimitAbortsImmediately) {
  auto generated = std::make_shared<GeneratedTransfer>(8 * kMiB, 64 * 1024, true);
  auto stager = makeStager(generated);

  auto result = stager.download({"gen://long.mp4", "", "", std::nullopt, ""},
                                dir / "source", 4 * kMiB, record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::SizeLimitExceeded);
  EXPECT_EQ(generated->bytes_offered.load(), 0u);
}

TEST_F(TransferStagerTest, LocalFileOverLimitIsRejected) {
  auto source = test_support::writeFile(dir / "in" / "big.mp4", 2 * kMiB);
  auto stager = makeStager();
  auto result = stager.download({source.string(), "big.mp4", "", std::nullopt, ""},
                                dir / "source.mp4", kMiB, record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::SizeLimitExceeded);
}

TEST_F(TransferStagerTest, DeclaredSizeMismatchIsTransferError) {
  auto source = test_support::writeFile(dir / "in" / "short.mp4", 1000);
  auto stager = makeStager();
  auto destination = dir / "source.mp4";
  auto result = stager.download({source.string(), "short.mp4", "", 2000, ""},
                                destination, kMiB, record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Transfer);
  EXPECT_FALSE(std::filesystem::exists(destination));
}

TEST_F(TransferStagerTest, MissingSourceIsTransferError) {
  auto stager = makeStager();
  auto result = stager.download({(dir / "nope.mp4").string(), "", "", std::nullopt, ""},
                                dir / "source.mp4", kMiB, record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Transfer);
}

TEST_F(TransferStagerTest, UnsupportedSchemeIsValidationError) {
  auto stager = makeStager();
  EXPECT_FALSE(stager.canFetch("ftp://host/file.mp4"));
  auto result = stager.download({"ftp://host/file.mp4", "", "", std::nullopt, ""},
                                dir / "source.mp4", kMiB, record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST_F(TransferStagerTest, CancelledDuringDownload) {
  auto generated = std::make_shared<GeneratedTransfer>(64 * kMiB, 64 * 1024, false);
  generated->delay_per_chunk = std::chrono::milliseconds(5);
  auto stager = makeStager(generated);
  auto destination = dir / "source.mp4";

  std::jthread canceller([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.cancel();
  });
  auto result = stager.download({"gen://slow.mp4", "", "", std::nullopt, ""},
                                destination, 128 * kMiB, record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
  EXPECT_FALSE(std::filesystem::exists(destination));
  EXPECT_LT(generated->bytes_offered.load(), 64 * kMiB);
}

TEST_F(TransferStagerTest, UploadStoresUnderOutputEndpoint) {
  auto output = test_support::writeFile(dir / "ws" / "output.mp4", 200 * 1024, 'o');
  auto stager = makeStager();

  auto result = stager.upload(output, "job-1/clip.mp4", record, cancel);
  ASSERT_TRUE(result.has_value()) << result.error().debug();
  EXPECT_EQ(result->name, "clip.mp4");
  EXPECT_EQ(result->size, 200u * 1024);
  EXPECT_THAT(result->uri, ::testing::StartsWith("file://"));
  EXPECT_THAT(result->uri, ::testing::EndsWith("job-1/clip.mp4"));

  auto stored = dir / "outbox" / "job-1" / "clip.mp4";
  EXPECT_EQ(test_support::readFile(stored), test_support::readFile(output));
  EXPECT_FALSE(std::filesystem::exists(dir / "outbox" / "job-1" / "clip.mp4.part"));
  ASSERT_FALSE(updates.empty());
  EXPECT_EQ(updates.back().stage, JobState::Uploading);
  EXPECT_TRUE(updates.back().final);
}

TEST_F(TransferStagerTest, UploadOfMissingFileIsResourceError) {
  auto stager = makeStager();
  auto result = stager.upload(dir / "ws" / "missing.mp4", "job-2/x.mp4", record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Resource);
}

TEST_F(TransferStagerTest, CancelledUploadLeavesNoArtifact) {
  auto output = test_support::writeFile(dir / "ws" / "output.mp4", 200 * 1024, 'o');
  auto stager = makeStager();
  cancel.cancel();
  auto result = stager.upload(output, "job-3/clip.mp4", record, cancel);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
  EXPECT_FALSE(std::filesystem::exists(dir / "outbox" / "job-3" / "clip.mp4"));
}

} // namespace
} // namespace conversion_service
