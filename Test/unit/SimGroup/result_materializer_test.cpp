#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "result_materializer.hpp"
#include "simgroup.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace SimGroup {

namespace fs = std::filesystem;
using namespace simgroup;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

class ResultMaterializerTest : public ::testing::Test {
protected:
    fs::path tempDir;
    fs::path sourceDir;
    fs::path outputDir;

    void SetUp() override {
        tempDir = fs::temp_directory_path() / ("simgroup_mat_" + std::to_string(std::random_device{}()));
        sourceDir = tempDir / "src";
        outputDir = tempDir / "out";
        fs::create_directories(sourceDir);
    }

    void TearDown() override {
        if (fs::exists(tempDir)) fs::remove_all(tempDir);
    }

    std::string createFile(const fs::path& path, const std::string& content = "image data") {
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
        return path.string();
    }

    std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::vector<std::string> filenamesIn(const fs::path& dir) {
        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(dir)) names.push_back(entry.path().filename().string());
        return names;
    }
};

TEST(SafeFilenameTest, ReplacesSeparatorsAndSpaces)
{
    EXPECT_EQ(pathToSafeFilename("/home/user/My Photos/img 1.jpg"), "home_user_My_Photos_img_1.jpg");
}

TEST(SafeFilenameTest, CollapsesAndTrimsSubstitutes)
{
    EXPECT_EQ(pathToSafeFilename("//data//(copy)  x.png"), "data_copy_x.png");
    EXPECT_EQ(pathToSafeFilename("keep-dash_and.dots"), "keep-dash_and.dots");
}

TEST(SafeFilenameTest, KeepsMultibyteCharacters)
{
    EXPECT_EQ(pathToSafeFilename("/fotos/\xc3\xa9t\xc3\xa9.jpg"), "fotos_\xc3\xa9t\xc3\xa9.jpg");
}

TEST(SafeFilenameTest, FallsBackToBaseNameWhenTooLong)
{
    const fs::path longPath = fs::path("/") / std::string(kMaxSafeNameLength, 'd') / "photo.jpg";
    EXPECT_EQ(pathToSafeFilename(longPath), "photo.jpg");
}

TEST(SafeFilenameTest, FallsBackToLiteralWhenNothingIsLeft)
{
    EXPECT_EQ(pathToSafeFilename("///"), kUnknownFileName);
    EXPECT_EQ(pathToSafeFilename(""), kUnknownFileName);
}

TEST_F(ResultMaterializerTest, ResolveCollisionAppendsCounterBeforeExtension)
{
    const auto desired = tempDir / "photo.jpg";
    EXPECT_EQ(resolveCollision(desired, {}), desired);

    const std::unordered_set<std::string> taken{ desired.string() };
    EXPECT_EQ(resolveCollision(desired, taken), tempDir / "photo_1.jpg");

    createFile(tempDir / "photo_1.jpg");
    EXPECT_EQ(resolveCollision(desired, taken), tempDir / "photo_2.jpg");
}

TEST_F(ResultMaterializerTest, SameBaseNameInDifferentFoldersGetsSuffix)
{
    // Paths long enough that both fall back to the base name
    const std::string dirA(kMaxSafeNameLength, 'a');
    const std::string dirB(kMaxSafeNameLength, 'b');
    const auto first = createFile(sourceDir / dirA / "photo.jpg", "first");
    const auto second = createFile(sourceDir / dirB / "photo.jpg", "second");

    ResultMaterializer materializer(outputDir);
    const auto report = materializer.materialize({ { first, second } });

    EXPECT_THAT(filenamesIn(outputDir / "1"), UnorderedElementsAre("photo.jpg", "photo_1.jpg"));
    EXPECT_EQ(report.mapping.destinationOf(first), (outputDir / "1" / "photo.jpg").string());
    EXPECT_EQ(report.mapping.destinationOf(second), (outputDir / "1" / "photo_1.jpg").string());
    EXPECT_EQ(readFile(outputDir / "1" / "photo_1.jpg"), "second");
}

TEST_F(ResultMaterializerTest, NamesThatCollapseTogetherGetSuffix)
{
    const auto spaced = createFile(sourceDir / "a b.jpg");
    const auto underscored = createFile(sourceDir / "a_b.jpg");

    ResultMaterializer materializer(outputDir);
    const auto report = materializer.materialize({ { spaced, underscored } });

    ASSERT_EQ(report.copied, 2u);
    const fs::path firstCopy = *report.mapping.destinationOf(spaced);
    const fs::path secondCopy = *report.mapping.destinationOf(underscored);
    EXPECT_EQ(secondCopy.stem().string(), firstCopy.stem().string() + "_1");
    EXPECT_EQ(secondCopy.extension(), ".jpg");
}

TEST_F(ResultMaterializerTest, GroupsAreNumberedFromOne)
{
    const auto a = createFile(sourceDir / "a.jpg");
    const auto b = createFile(sourceDir / "b.jpg");
    const auto c = createFile(sourceDir / "c.jpg");
    const auto d = createFile(sourceDir / "d.jpg");

    ResultMaterializer materializer(outputDir);
    const auto report = materializer.materialize({ { a, b }, { c, d } });

    EXPECT_EQ(report.groupDirectories, 2u);
    EXPECT_EQ(report.copied, 4u);
    EXPECT_THAT(report.failures, IsEmpty());
    EXPECT_THAT(filenamesIn(outputDir), UnorderedElementsAre("1", "2"));
    EXPECT_EQ(fs::path(*report.mapping.destinationOf(c)).parent_path(), outputDir / "2");

    for (const auto& entry : report.mapping) {
        EXPECT_TRUE(fs::is_regular_file(entry.destination)) << entry.destination;
        EXPECT_EQ(readFile(entry.destination), readFile(entry.original));
    }
}

TEST_F(ResultMaterializerTest, MissingSourceIsReportedAndSkipped)
{
    const auto present = createFile(sourceDir / "present.jpg");
    const auto other = createFile(sourceDir / "other.jpg");
    const auto missing = (sourceDir / "missing.jpg").string();

    ProgressTracker progress(0, 3);
    ResultMaterializer materializer(outputDir, 1, &progress);
    const auto report = materializer.materialize({ { present, missing, other } });

    EXPECT_EQ(report.copied, 2u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].path, missing);
    EXPECT_FALSE(report.mapping.destinationOf(missing).has_value());

    const auto info = progress.getProgress();
    EXPECT_EQ(info.copyCompleted, 2u);
    EXPECT_EQ(info.failedItems, 1u);
}

TEST_F(ResultMaterializerTest, OutputRootIsRecreated)
{
    createFile(outputDir / "7" / "stale.jpg");
    const auto a = createFile(sourceDir / "a.jpg");
    const auto b = createFile(sourceDir / "b.jpg");

    ResultMaterializer materializer(outputDir);
    materializer.materialize({ { a, b } });

    EXPECT_FALSE(fs::exists(outputDir / "7"));
    EXPECT_THAT(filenamesIn(outputDir), ElementsAre("1"));
}

TEST_F(ResultMaterializerTest, NoGroupsLeavesOutputUntouched)
{
    const auto stale = createFile(outputDir / "1" / "kept.jpg");

    ResultMaterializer materializer(outputDir);
    const auto report = materializer.materialize({});

    EXPECT_TRUE(report.mapping.empty());
    EXPECT_TRUE(fs::exists(stale));
}

TEST_F(ResultMaterializerTest, ModificationTimeIsPreserved)
{
    const auto a = createFile(sourceDir / "a.jpg");
    const auto b = createFile(sourceDir / "b.jpg");
    fs::last_write_time(a, fs::last_write_time(a) - std::chrono::hours(24 * 30));

    ResultMaterializer materializer(outputDir);
    const auto report = materializer.materialize({ { a, b } });

    EXPECT_TRUE(fs::last_write_time(*report.mapping.destinationOf(a)) == fs::last_write_time(a));
}

TEST_F(ResultMaterializerTest, ParallelCopyMatchesSequential)
{
    std::vector<Group> groups(3);
    for (size_t g = 0; g < groups.size(); ++g) {
        for (int i = 0; i < 10; ++i) {
            const auto name = "g" + std::to_string(g) + "_" + std::to_string(i) + ".jpg";
            groups[g].push_back(createFile(sourceDir / name, name));
        }
    }

    ProgressTracker progress(0, 30);
    const auto parallel = ResultMaterializer(outputDir, 4, &progress).materialize(groups);
    EXPECT_EQ(parallel.copied, 30u);
    EXPECT_EQ(progress.getProgress().copyCompleted, 30u);

    for (const auto& entry : parallel.mapping) {
        EXPECT_EQ(readFile(entry.destination), fs::path(entry.original).filename().string());
    }

    const auto sequential = ResultMaterializer(outputDir, 1).materialize(groups);
    EXPECT_EQ(parallel.mapping, sequential.mapping);
}

TEST_F(ResultMaterializerTest, MaterializePersistsTheRealizedMapping)
{
    const auto a = createFile(sourceDir / "a.jpg");
    const auto b = createFile(sourceDir / "b.jpg");
    const MappingStore store(tempDir / "info.json");

    const auto report = materialize({ { a, b } }, outputDir, store);

    EXPECT_TRUE(report.mappingSaved);
    const auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, report.mapping);
}

TEST_F(ResultMaterializerTest, MaterializeWithoutGroupsWritesNothing)
{
    const MappingStore store(tempDir / "info.json");

    const auto report = materialize({}, outputDir, store);

    EXPECT_FALSE(report.mappingSaved);
    EXPECT_FALSE(fs::exists(store.file()));
    EXPECT_FALSE(fs::exists(outputDir));
}

} // namespace SimGroup
