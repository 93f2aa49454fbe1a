#include <gtest/gtest.h>

#include "core/copy_engine/copy_engine.hpp"
#include "test_utils.hpp"

using fcopy::core::CopyEngine;
using fcopy::infra::Config;
using fcopy::infra::ErrorCode;
using fcopy::infra::TransferStats;
using fcopy::test_utils::RecordingReporter;
using fcopy::test_utils::TempDir;
using fcopy::test_utils::make_payload;
using fcopy::test_utils::perms_of;
using fcopy::test_utils::read_file;
using fcopy::test_utils::write_file;

namespace stdfs = std::filesystem;

class FileCopyTest : public ::testing::Test {
protected:
    auto copy(const stdfs::path& src, const stdfs::path& dst, TransferStats& stats)
    {
        CopyEngine engine(config_, reporter_);
        return engine.copy_file(src, dst, stats);
    }

    TempDir tmp_;
    Config config_{};
    RecordingReporter reporter_;
    stdfs::path src_ = tmp_.path() / "source.bin";
    stdfs::path dst_ = tmp_.path() / "out" / "dest.bin";
};

TEST_F(FileCopyTest, CopiesBytesAndPermissions)
{
    const auto payload = make_payload(250'000);
    write_file(src_, payload);
    stdfs::permissions(src_, stdfs::perms::owner_read | stdfs::perms::owner_write |
                             stdfs::perms::group_read);

    TransferStats stats{};
    auto copied = copy(src_, dst_, stats);

    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_EQ(*copied, payload.size());
    EXPECT_EQ(stats.transferred, payload.size());
    EXPECT_EQ(read_file(dst_), payload);
    EXPECT_EQ(perms_of(dst_), perms_of(src_));
}

TEST_F(FileCopyTest, CreatesMissingParentDirectories)
{
    write_file(src_, "hello");
    const auto nested = tmp_.path() / "x" / "y" / "z" / "file.txt";

    TransferStats stats{};
    ASSERT_TRUE(copy(src_, nested, stats).has_value());
    EXPECT_EQ(read_file(nested), "hello");
}

TEST_F(FileCopyTest, EmptyFileIsCopied)
{
    write_file(src_, "");

    TransferStats stats{};
    auto copied = copy(src_, dst_, stats);
    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_EQ(*copied, 0u);
    EXPECT_TRUE(stdfs::exists(dst_));
    EXPECT_EQ(stdfs::file_size(dst_), 0u);
}

TEST_F(FileCopyTest, RefusesToOverwriteWithoutForce)
{
    write_file(src_, "new content");
    write_file(dst_, "old content");

    TransferStats stats{};
    auto copied = copy(src_, dst_, stats);

    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(read_file(dst_), "old content");
    EXPECT_EQ(stats.transferred, 0u);
}

TEST_F(FileCopyTest, ForceTruncatesLongerDestination)
{
    write_file(src_, "short");
    write_file(dst_, "a much longer previous content");
    config_.with_force();

    TransferStats stats{};
    ASSERT_TRUE(copy(src_, dst_, stats).has_value());
    EXPECT_EQ(read_file(dst_), "short");
}

TEST_F(FileCopyTest, ForceIsIdempotent)
{
    const auto payload = make_payload(70'000, 7);
    write_file(src_, payload);
    config_.with_force();

    TransferStats first{};
    ASSERT_TRUE(copy(src_, dst_, first).has_value());
    TransferStats second{};
    ASSERT_TRUE(copy(src_, dst_, second).has_value());

    EXPECT_EQ(read_file(dst_), payload);
    EXPECT_EQ(first.transferred, second.transferred);
}

TEST_F(FileCopyTest, MissingSourceFails)
{
    TransferStats stats{};
    auto copied = copy(tmp_.path() / "absent", dst_, stats);

    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code, ErrorCode::FileNotFound);
    EXPECT_NE(copied.error().message.find("failure in opening source file"), std::string::npos);
    EXPECT_TRUE(static_cast<bool>(copied.error().cause));
    EXPECT_STREQ(copied.error().what(), copied.error().message.c_str());
    EXPECT_FALSE(stdfs::exists(dst_));
}

TEST_F(FileCopyTest, ResumeAppendsOnlyTheMissingTail)
{
    const auto payload = make_payload(100'000, 3);
    write_file(src_, payload);

    // Marker bytes stand in for the already transferred prefix; they must survive.
    constexpr std::size_t kDone = 30'000;
    write_file(dst_, std::string(kDone, 'X'));

    config_.with_resume().with_progress().with_block_size(16 * 1024);
    TransferStats stats{};
    auto copied = copy(src_, dst_, stats);

    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_EQ(*copied, payload.size());
    EXPECT_EQ(stats.transferred, payload.size());

    const auto result = read_file(dst_);
    ASSERT_EQ(result.size(), payload.size());
    EXPECT_EQ(result.substr(0, kDone), std::string(kDone, 'X'));
    EXPECT_EQ(result.substr(kDone), payload.substr(kDone));

    ASSERT_FALSE(reporter_.calls.empty());
    EXPECT_EQ(reporter_.calls.front().file_transferred, kDone + 16 * 1024);
    EXPECT_EQ(reporter_.calls.back().file_transferred, payload.size());
}

TEST_F(FileCopyTest, ResumeCompletesFromEveryInterruptionPoint)
{
    const auto payload = make_payload(10'000, 5);
    write_file(src_, payload);
    config_.with_resume();

    for (std::size_t done : {std::size_t{0}, std::size_t{1}, std::size_t{4096}, std::size_t{9'999}}) {
        write_file(dst_, payload.substr(0, done));

        TransferStats stats{};
        auto copied = copy(src_, dst_, stats);
        ASSERT_TRUE(copied.has_value()) << "interrupted at " << done << ": " << copied.error().message;
        EXPECT_EQ(read_file(dst_), payload) << "interrupted at " << done;
        EXPECT_EQ(stats.transferred, payload.size());
    }
}

TEST_F(FileCopyTest, ResumeOfCompleteFileTransfersNothing)
{
    const auto payload = make_payload(5'000);
    write_file(src_, payload);
    write_file(dst_, payload);
    config_.with_resume().with_progress();

    TransferStats stats{};
    auto copied = copy(src_, dst_, stats);

    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_EQ(*copied, payload.size());
    EXPECT_TRUE(reporter_.calls.empty());
    EXPECT_EQ(read_file(dst_), payload);
}

TEST_F(FileCopyTest, ResumeWithoutDestinationCopiesEverything)
{
    const auto payload = make_payload(20'000);
    write_file(src_, payload);
    config_.with_resume();

    TransferStats stats{};
    ASSERT_TRUE(copy(src_, dst_, stats).has_value());
    EXPECT_EQ(read_file(dst_), payload);
}

TEST_F(FileCopyTest, ResumeFinalizesSourcePermissions)
{
    const auto payload = make_payload(8'000);
    write_file(src_, payload);
    write_file(dst_, payload.substr(0, 100));
    stdfs::permissions(src_, stdfs::perms::owner_read | stdfs::perms::owner_write |
                             stdfs::perms::group_read | stdfs::perms::others_read);
    stdfs::permissions(dst_, stdfs::perms::owner_read | stdfs::perms::owner_write);
    config_.with_resume();

    TransferStats stats{};
    ASSERT_TRUE(copy(src_, dst_, stats).has_value());
    EXPECT_EQ(perms_of(dst_), perms_of(src_));
}

TEST_F(FileCopyTest, ResumeOntoLargerDestinationIsAMismatch)
{
    write_file(src_, "abc");
    write_file(dst_, "abcdef");
    config_.with_resume();

    TransferStats stats{};
    auto copied = copy(src_, dst_, stats);

    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code, ErrorCode::ByteMismatch);
    EXPECT_NE(copied.error().message.find("3 bytes more"), std::string::npos);
}

TEST_F(FileCopyTest, ShortReadIsAMismatch)
{
    // sysfs attributes report a page-sized st_size but read back far less
    const stdfs::path short_source = "/sys/kernel/mm/transparent_hugepage/enabled";
    std::error_code ec;
    if (!stdfs::is_regular_file(short_source, ec)) {
        GTEST_SKIP() << short_source << " not available";
    }

    TransferStats stats{};
    auto copied = copy(short_source, dst_, stats);

    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code, ErrorCode::ByteMismatch);
    EXPECT_NE(copied.error().message.find("missing"), std::string::npos);
    EXPECT_NE(copied.error().message.find("bytes in destination"), std::string::npos);
    EXPECT_LT(stats.transferred, stdfs::file_size(short_source));
}

TEST_F(FileCopyTest, ReportsProgressPerBlock)
{
    const auto payload = make_payload(10'000);
    write_file(src_, payload);
    config_.with_progress().with_block_size(4096);

    TransferStats stats{};
    stats.total = payload.size();
    ASSERT_TRUE(copy(src_, dst_, stats).has_value());

    ASSERT_EQ(reporter_.calls.size(), 3u);
    EXPECT_EQ(reporter_.calls[0].file_transferred, 4096u);
    EXPECT_EQ(reporter_.calls[1].file_transferred, 8192u);
    EXPECT_EQ(reporter_.calls[2].file_transferred, 10'000u);
    for (const auto& call : reporter_.calls) {
        EXPECT_EQ(call.file_total, 10'000u);
        EXPECT_EQ(call.source, src_);
        EXPECT_EQ(call.destination, dst_);
        EXPECT_EQ(call.stats.transferred, call.file_transferred);
        EXPECT_EQ(call.stats.total, 10'000u);
    }
}

TEST_F(FileCopyTest, NoProgressCallsUnlessEnabled)
{
    write_file(src_, make_payload(10'000));
    config_.with_block_size(1024);

    TransferStats stats{};
    ASSERT_TRUE(copy(src_, dst_, stats).has_value());
    EXPECT_TRUE(reporter_.calls.empty());
}

TEST_F(FileCopyTest, AccumulatesIntoSharedStats)
{
    write_file(src_, make_payload(1'000));
    const auto other = tmp_.path() / "other.bin";
    write_file(other, make_payload(2'500));

    TransferStats stats{};
    ASSERT_TRUE(copy(src_, dst_, stats).has_value());
    ASSERT_TRUE(copy(other, tmp_.path() / "out" / "other.bin", stats).has_value());
    EXPECT_EQ(stats.transferred, 3'500u);
}
