/**
 * @file test_rankingpresenter.cpp
 * @brief Unit tests for RankingPresenter and the presentation helpers
 *
 * @see RankingPresenter
 * @see FileRecord
 * @see formatBytes
 */

#include <gtest/gtest.h>
#include "rankingpresenter.hpp"
#include "utils.hpp"

#include <chrono>

namespace fs = std::filesystem;

namespace {

DuplicateGroup makeGroup(const std::string& fingerprint, std::uintmax_t size,
                         int count) {
    DuplicateGroup group;
    group.fingerprint = fingerprint;
    group.size = size;
    for (int i = 0; i < count; ++i) {
        group.files.emplace_back("/data/" + fingerprint + "_" + std::to_string(i) + ".bin",
                                 size);
    }
    return group;
}

std::chrono::hours days(int n) { return std::chrono::hours(24 * n); }

} // namespace

/**
 * @class RankingPresenterTest
 * @brief Fixture with a fixed reference time for the age labels
 */
class RankingPresenterTest : public ::testing::Test {
protected:
    fs::file_time_type now = fs::file_time_type::clock::now();
};

/**
 * @test OrdersByWastedBytesDescending
 */
TEST_F(RankingPresenterTest, OrdersByWastedBytesDescending) {
    std::vector<DuplicateGroup> groups = {
        makeGroup("small", 10, 2),   // 10 wasted
        makeGroup("large", 100, 3),  // 200 wasted
        makeGroup("medium", 50, 2)}; // 50 wasted

    RankingPresenter presenter;
    auto result = presenter.present(groups, 7, std::chrono::milliseconds(5), now);

    ASSERT_EQ(result.groups.size(), 3u);
    EXPECT_EQ(result.groups[0].wastedBytes, 200u);
    EXPECT_EQ(result.groups[1].wastedBytes, 50u);
    EXPECT_EQ(result.groups[2].wastedBytes, 10u);
    EXPECT_EQ(result.filesScanned, 7u);
    EXPECT_EQ(result.elapsed.count(), 5);
}

/**
 * @test TiesKeepInputOrder
 * @brief Equal wasted bytes keep the order of the input
 */
TEST_F(RankingPresenterTest, TiesKeepInputOrder) {
    std::vector<DuplicateGroup> groups = {makeGroup("first", 100, 2),
                                          makeGroup("second", 50, 3),
                                          makeGroup("third", 25, 5)};

    auto result = RankingPresenter().present(groups, 0, std::chrono::milliseconds(0), now);

    ASSERT_EQ(result.groups.size(), 3u);
    EXPECT_EQ(result.groups[0].fingerprint, "first");
    EXPECT_EQ(result.groups[1].fingerprint, "second");
    EXPECT_EQ(result.groups[2].fingerprint, "third");
}

/**
 * @test CapDoesNotShrinkTotals
 * @brief 150 groups are cut to 100 for display, totals still cover all 150
 */
TEST_F(RankingPresenterTest, CapDoesNotShrinkTotals) {
    std::vector<DuplicateGroup> groups;
    std::uintmax_t expectedWasted = 0;
    for (int i = 1; i <= 150; ++i) {
        groups.push_back(makeGroup("g" + std::to_string(i), static_cast<std::uintmax_t>(i), 3));
        expectedWasted += static_cast<std::uintmax_t>(i) * 2;
    }

    auto result = RankingPresenter(100).present(groups, 450, std::chrono::milliseconds(0), now);

    EXPECT_EQ(result.groups.size(), 100u);
    EXPECT_EQ(result.totalDuplicates, 300u);
    EXPECT_EQ(result.totalWasted, expectedWasted);

    // The largest groups survive the cap
    EXPECT_EQ(result.groups.front().size, 150u);
    EXPECT_EQ(result.groups.back().size, 51u);
}

/**
 * @test PresentsFiles
 * @brief Per-file fields and group counters are filled in
 */
TEST_F(RankingPresenterTest, PresentsFiles) {
    DuplicateGroup group;
    group.fingerprint = "0123456789abcdef0123456789abcdef";
    group.size = 1000;
    group.files.emplace_back("/home/u/Videos/movie.mp4", 1000, now - days(3));
    group.files.emplace_back("/home/u/Downloads/README", 1000);

    auto result = RankingPresenter().present({group}, 2, std::chrono::milliseconds(0), now);

    ASSERT_EQ(result.groups.size(), 1u);
    const auto& presented = result.groups[0];
    EXPECT_EQ(presented.fingerprint, "0123456789abcdef");
    EXPECT_EQ(presented.count, 2u);
    EXPECT_EQ(presented.size, 1000u);
    EXPECT_EQ(presented.wastedBytes, 1000u);

    ASSERT_EQ(presented.files.size(), 2u);
    EXPECT_EQ(presented.files[0].path, "/home/u/Videos/movie.mp4");
    EXPECT_EQ(presented.files[0].size, 1000u);
    EXPECT_EQ(presented.files[0].age, "3d ago");
    EXPECT_EQ(presented.files[0].extension, "mp4");
    EXPECT_EQ(presented.files[1].age, "unknown");
    EXPECT_EQ(presented.files[1].extension, "");
}

/**
 * @test EmptyInput
 */
TEST_F(RankingPresenterTest, EmptyInput) {
    auto result = RankingPresenter().present({}, 12, std::chrono::milliseconds(0), now);
    EXPECT_TRUE(result.groups.empty());
    EXPECT_EQ(result.totalDuplicates, 0u);
    EXPECT_EQ(result.totalWasted, 0u);
    EXPECT_EQ(result.filesScanned, 12u);
}

/**
 * @test AgeLabelThresholds
 * @brief Day, month and year buckets switch at 1, 30 and 365 days
 */
TEST_F(RankingPresenterTest, AgeLabelThresholds) {
    EXPECT_EQ(RankingPresenter::ageLabel(now, now), "today");
    EXPECT_EQ(RankingPresenter::ageLabel(now - std::chrono::hours(23), now), "today");
    EXPECT_EQ(RankingPresenter::ageLabel(now - days(1), now), "1d ago");
    EXPECT_EQ(RankingPresenter::ageLabel(now - days(29), now), "29d ago");
    EXPECT_EQ(RankingPresenter::ageLabel(now - days(30), now), "1mo ago");
    EXPECT_EQ(RankingPresenter::ageLabel(now - days(75), now), "2mo ago");
    EXPECT_EQ(RankingPresenter::ageLabel(now - days(364), now), "12mo ago");
    EXPECT_EQ(RankingPresenter::ageLabel(now - days(365), now), "1y ago");
    EXPECT_EQ(RankingPresenter::ageLabel(now - days(800), now), "2y ago");
}

/**
 * @test AgeLabelEdgeCases
 * @brief Future timestamps count as today, missing ones are unknown
 */
TEST_F(RankingPresenterTest, AgeLabelEdgeCases) {
    EXPECT_EQ(RankingPresenter::ageLabel(now + days(10), now), "today");
    EXPECT_EQ(RankingPresenter::ageLabel(std::nullopt, now), "unknown");
}

/**
 * @test FileRecordNameAndExtension
 */
TEST(FileRecordTest, FileRecordNameAndExtension) {
    FileRecord archive("/data/backup.tar.gz", 10);
    EXPECT_EQ(archive.getFileName(), "backup.tar.gz");
    EXPECT_EQ(archive.getExtension(), "gz");

    FileRecord dotfile("/home/u/.bashrc", 10);
    EXPECT_EQ(dotfile.getFileName(), ".bashrc");
    EXPECT_EQ(dotfile.getExtension(), "");

    FileRecord plain("/data/Makefile", 10);
    EXPECT_EQ(plain.getExtension(), "");
    EXPECT_FALSE(plain.getModified().has_value());
}

/**
 * @test FormatBytes
 * @brief Binary units with one decimal place
 */
TEST(FormatBytesTest, FormatBytes) {
    EXPECT_EQ(formatBytes(0), "0 B");
    EXPECT_EQ(formatBytes(512), "512.0 B");
    EXPECT_EQ(formatBytes(1536), "1.5 KB");
    EXPECT_EQ(formatBytes(1048576), "1.0 MB");
    EXPECT_EQ(formatBytes(1073741824ULL * 3), "3.0 GB");
}

/**
 * @test ParseByteCount
 * @brief Plain digits only; signs, junk and overflow are rejected
 */
TEST(ParseByteCountTest, ParseByteCount) {
    EXPECT_EQ(parseByteCount("0").value_or(1), 0u);
    EXPECT_EQ(parseByteCount("4096").value_or(0), 4096u);
    EXPECT_EQ(parseByteCount("18446744073709551615").value_or(0),
              18446744073709551615ULL);

    EXPECT_FALSE(parseByteCount("-5").has_value());
    EXPECT_FALSE(parseByteCount("+5").has_value());
    EXPECT_FALSE(parseByteCount(" 5").has_value());
    EXPECT_FALSE(parseByteCount("5k").has_value());
    EXPECT_FALSE(parseByteCount("").has_value());
    EXPECT_FALSE(parseByteCount("18446744073709551616").has_value());
}
