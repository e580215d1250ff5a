#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "cleaner.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace SimGroup {

namespace fs = std::filesystem;
using namespace simgroup;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class CleanerTest : public ::testing::Test {
protected:
    fs::path tempDir;

    void SetUp() override {
        tempDir = fs::temp_directory_path() / ("simgroup_clean_" + std::to_string(std::random_device{}()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        if (fs::exists(tempDir)) fs::remove_all(tempDir);
    }

    std::string createFile(const std::string& name, const std::string& content = "0123456789") {
        const auto path = tempDir / name;
        std::ofstream(path, std::ios::binary) << content;
        return path.string();
    }
};

TEST_F(CleanerTest, ReadDeletionListSkipsBlankLinesAndCarriageReturns)
{
    const auto list = tempDir / "to_delete.txt";
    std::ofstream(list, std::ios::binary) << "/a.jpg\r\n\r\n   \n/b c.jpg\n";

    const auto paths = readDeletionList(list);
    ASSERT_TRUE(paths.has_value());
    EXPECT_THAT(*paths, ElementsAre("/a.jpg", "/b c.jpg"));
}

TEST_F(CleanerTest, MissingListReadsAsNothing)
{
    EXPECT_FALSE(readDeletionList(tempDir / "absent.txt").has_value());

    const auto summary = Cleaner().cleanFromFile(tempDir / "absent.txt");
    EXPECT_FALSE(summary.listFound);
    EXPECT_EQ(summary.deleted, 0u);
}

TEST_F(CleanerTest, DeletesExistingAndSkipsMissing)
{
    const auto a = createFile("a.jpg", "12345");
    const auto b = createFile("b.jpg", "123");
    const auto gone = (tempDir / "gone.jpg").string();

    const auto summary = Cleaner().clean({ a, gone, b });

    EXPECT_TRUE(summary.listFound);
    EXPECT_EQ(summary.deleted, 2u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.freedBytes, 8u);
    EXPECT_THAT(summary.deletedPaths, ElementsAre(a, b));
    EXPECT_THAT(summary.skippedPaths, ElementsAre(gone));
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(b));
}

TEST_F(CleanerTest, FailedRemovalIsRecordedAndBatchContinues)
{
    // A non-empty directory cannot be removed by a single remove()
    const auto busy = tempDir / "busy";
    fs::create_directories(busy / "inner");
    const auto after = createFile("after.jpg");

    const auto summary = Cleaner().clean({ busy.string(), after });

    EXPECT_EQ(summary.failed, 1u);
    ASSERT_EQ(summary.failures.size(), 1u);
    EXPECT_EQ(summary.failures[0].path, busy.string());
    EXPECT_FALSE(summary.failures[0].reason.empty());
    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_FALSE(fs::exists(after));
    EXPECT_TRUE(fs::exists(busy));
}

TEST_F(CleanerTest, DryRunDeletesNothing)
{
    const auto a = createFile("a.jpg", "1234");

    const auto summary = Cleaner(true).clean({ a });

    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_EQ(summary.freedBytes, 4u);
    EXPECT_TRUE(fs::exists(a));
}

TEST_F(CleanerTest, CleanFromFileDeletesListedPaths)
{
    const auto a = createFile("a.jpg");
    const auto list = tempDir / "to_delete.txt";
    std::ofstream(list) << a << '\n';

    const auto summary = Cleaner().cleanFromFile(list);

    EXPECT_TRUE(summary.listFound);
    EXPECT_EQ(summary.deleted, 1u);
    EXPECT_THAT(summary.failures, IsEmpty());
    EXPECT_FALSE(fs::exists(a));
}

} // namespace SimGroup
