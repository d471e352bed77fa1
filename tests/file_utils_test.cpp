#include "test_base.hpp"
#include "core/file_utils.hpp"

class FileUtilsTest : public TestBase
{
};

TEST_F(FileUtilsTest, ReadableFileChecks)
{
    std::string path = createDummyFile("clip.mp4");
    EXPECT_TRUE(FileUtils::isReadableFile(path));
    EXPECT_FALSE(FileUtils::isReadableFile(testPath("missing.mp4")));
    EXPECT_FALSE(FileUtils::isReadableFile(getTestFilesDir()));
    EXPECT_FALSE(FileUtils::isReadableFile(""));
}

TEST_F(FileUtilsTest, DescribeArtifact)
{
    std::string path = createDummyFile("clip.mp4", "abc");
    auto artifact = FileUtils::describeArtifact(path);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->path, path);
    EXPECT_EQ(artifact->size_bytes, 3u);
    // SHA-256 of "abc"
    EXPECT_EQ(artifact->sha256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    EXPECT_FALSE(FileUtils::describeArtifact(testPath("missing.mp4")).has_value());
}

TEST_F(FileUtilsTest, HashChangesWithContent)
{
    std::string a = createDummyFile("a.mp4", "first");
    std::string b = createDummyFile("b.mp4", "second");
    EXPECT_NE(FileUtils::computeFileHash(a), FileUtils::computeFileHash(b));
    EXPECT_EQ(FileUtils::computeFileHash(a), FileUtils::computeFileHash(a));
    EXPECT_EQ(FileUtils::computeFileHash(testPath("missing.mp4")), "");
}

TEST_F(FileUtilsTest, ContainerExtensions)
{
    EXPECT_EQ(FileUtils::getFileExtension("/tmp/Movie.MP4"), "mp4");
    EXPECT_EQ(FileUtils::getFileExtension("noext"), "");
    EXPECT_TRUE(FileUtils::isSupportedContainer("final.mkv"));
    EXPECT_TRUE(FileUtils::isSupportedContainer("final.MOV"));
    EXPECT_FALSE(FileUtils::isSupportedContainer("notes.txt"));
    EXPECT_FALSE(FileUtils::getSupportedContainers().empty());
}
