#include <gtest/gtest.h>

#include "arguments.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace App {

namespace fs = std::filesystem;
using namespace simgroup_app;

class ArgumentsTest : public ::testing::Test {
protected:
    fs::path tempDir;
    fs::path hashFile;

    void SetUp() override {
        tempDir = fs::temp_directory_path() / ("simgroup_args_" + std::to_string(std::random_device{}()));

        std::error_code ec;
        fs::create_directories(tempDir, ec);
        ASSERT_FALSE(ec) << "Failed to create temp directory: " << ec.message();

        hashFile = tempDir / "hashes.csv";
        std::ofstream(hashFile) << "filepath,phash_hex\n";
    }

    void TearDown() override {
        if (!tempDir.empty() && fs::exists(tempDir)) {
            std::error_code ec;
            fs::remove_all(tempDir, ec);
        }
    }

    RawArguments createValidRawArgs() {
        RawArguments raw;
        raw.hashFile = hashFile.string();
        raw.outputDir = (tempDir / "output_dir").string();
        raw.mappingFile = (tempDir / "info.json").string();
        raw.deleteList = (tempDir / "to_delete.txt").string();
        return raw;
    }
};

// Tests for valid construction
TEST_F(ArgumentsTest, ConstructorWithValidGroupCommand) {
    const Arguments args(createValidRawArgs(), Arguments::Command::Group);

    EXPECT_EQ(args.command, Arguments::Command::Group);
    EXPECT_EQ(args.hashFile, fs::weakly_canonical(hashFile));
    EXPECT_EQ(args.outputDir, fs::weakly_canonical(tempDir / "output_dir"));
    EXPECT_EQ(args.mappingFile, fs::weakly_canonical(tempDir / "info.json"));
    EXPECT_EQ(args.deleteList, fs::weakly_canonical(tempDir / "to_delete.txt"));
    EXPECT_EQ(args.logFile, defaults::LOG_FILE);
    EXPECT_EQ(args.threshold, defaults::THRESHOLD);
    EXPECT_EQ(args.threads, defaults::THREADS);
    EXPECT_EQ(args.logLevel, defaults::LOG_LEVEL);
    EXPECT_EQ(args.printOnly, defaults::PRINT_ONLY);
    EXPECT_EQ(args.dryRun, defaults::DRY_RUN);
    EXPECT_EQ(args.assumeYes, defaults::ASSUME_YES);
}

TEST_F(ArgumentsTest, ConstructorWithCustomValues) {
    RawArguments raw = createValidRawArgs();
    raw.threshold = 12;
    raw.threads = 8;
    raw.logLevel = 1;
    raw.printOnly = true;

    const Arguments args(raw, Arguments::Command::Group);

    EXPECT_EQ(args.threshold, 12);
    EXPECT_EQ(args.threads, 8);
    EXPECT_EQ(args.logLevel, 1);
    EXPECT_TRUE(args.printOnly);
}

TEST_F(ArgumentsTest, RelativePathsBecomeAbsolute) {
    RawArguments raw = createValidRawArgs();
    raw.mappingFile = "info.json";

    const Arguments args(raw, Arguments::Command::CheckDeleted);

    EXPECT_TRUE(args.mappingFile.is_absolute());
    EXPECT_EQ(args.mappingFile.filename(), "info.json");
}

TEST_F(ArgumentsTest, OutputDirMayNotExistYet) {
    RawArguments raw = createValidRawArgs();
    raw.outputDir = (tempDir / "a" / "b" / "c").string();

    EXPECT_NO_THROW((void)Arguments(raw, Arguments::Command::Group));
}

TEST_F(ArgumentsTest, CheckDeletedAndCleanupDoNotNeedHashFile) {
    RawArguments raw = createValidRawArgs();
    raw.hashFile.clear();
    raw.threshold = 9999;

    EXPECT_NO_THROW((void)Arguments(raw, Arguments::Command::CheckDeleted));

    raw.dryRun = true;
    raw.assumeYes = true;
    const Arguments cleanup(raw, Arguments::Command::Cleanup);
    EXPECT_TRUE(cleanup.dryRun);
    EXPECT_TRUE(cleanup.assumeYes);
}

// Hash file validation
TEST_F(ArgumentsTest, MissingHashFileThrows) {
    RawArguments raw = createValidRawArgs();
    raw.hashFile.clear();
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);

    raw.hashFile = (tempDir / "absent.csv").string();
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);
}

TEST_F(ArgumentsTest, HashFileMustBeAFile) {
    RawArguments raw = createValidRawArgs();
    raw.hashFile = tempDir.string();
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);
}

// Output directory validation
TEST_F(ArgumentsTest, OutputDirCannotBeAFile) {
    RawArguments raw = createValidRawArgs();
    raw.outputDir = hashFile.string();
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);
}

TEST_F(ArgumentsTest, OutputDirCannotContainHashFile) {
    RawArguments raw = createValidRawArgs();
    raw.outputDir = tempDir.string();
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);
}

TEST_F(ArgumentsTest, OutputDirCannotBeRoot) {
    RawArguments raw = createValidRawArgs();
    raw.outputDir = fs::path(tempDir).root_path().string();
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::CheckDeleted), std::invalid_argument);
}

TEST_F(ArgumentsTest, EmptyPathsThrow) {
    RawArguments raw = createValidRawArgs();
    raw.mappingFile.clear();
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::CheckDeleted), std::invalid_argument);

    raw = createValidRawArgs();
    raw.deleteList.clear();
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Cleanup), std::invalid_argument);
}

// Numeric range validation
TEST_F(ArgumentsTest, ThresholdRange) {
    RawArguments raw = createValidRawArgs();

    raw.threshold = 0;
    EXPECT_NO_THROW((void)Arguments(raw, Arguments::Command::Group));
    raw.threshold = 256;
    EXPECT_NO_THROW((void)Arguments(raw, Arguments::Command::Group));

    raw.threshold = -1;
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);
    raw.threshold = 257;
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);
}

TEST_F(ArgumentsTest, ThreadsMustBeAutoOrPositive) {
    RawArguments raw = createValidRawArgs();

    raw.threads = -1;
    EXPECT_NO_THROW((void)Arguments(raw, Arguments::Command::Group));
    raw.threads = 1;
    EXPECT_NO_THROW((void)Arguments(raw, Arguments::Command::Group));

    raw.threads = 0;
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);
    raw.threads = -2;
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Group), std::invalid_argument);
}

TEST_F(ArgumentsTest, LogLevelRange) {
    RawArguments raw = createValidRawArgs();

    raw.logLevel = 1;
    EXPECT_NO_THROW((void)Arguments(raw, Arguments::Command::Cleanup));
    raw.logLevel = 5;
    EXPECT_NO_THROW((void)Arguments(raw, Arguments::Command::Cleanup));

    raw.logLevel = 0;
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Cleanup), std::invalid_argument);
    raw.logLevel = 6;
    EXPECT_THROW((void)Arguments(raw, Arguments::Command::Cleanup), std::invalid_argument);
}

TEST_F(ArgumentsTest, ErrorMessageNamesTheFlag) {
    RawArguments raw = createValidRawArgs();
    raw.threshold = 300;

    try {
        Arguments args(raw, Arguments::Command::Group);
        FAIL() << "Expected std::invalid_argument";
    }
    catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("--threshold"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("300"), std::string::npos);
    }
}

} // namespace App
