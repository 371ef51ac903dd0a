#include <gtest/gtest.h>
#include "../include/media_resolver.hpp"
#include "../include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

class MediaResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        qrplay::Logger::set_output(&log_output);

        test_dir = "test_media_files";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directory(test_dir);

        create_test_file(test_dir + "/bluey-s1e1.mp4");
        create_test_file(test_dir + "/Peppa.MKV");
        create_test_file(test_dir + "/notes.txt");
        std::filesystem::create_directory(test_dir + "/nested");
        create_test_file(test_dir + "/nested/hidden.mp4");

        resolver = qrplay::create_media_resolver(test_dir, {".mp4", ".mkv", ".avi", ".webm", ".mov", ".m4v", ".ts", ".flv"});
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        qrplay::Logger::set_output(nullptr);
    }

    void create_test_file(const std::string& path) {
        std::ofstream file(path);
        file << "dummy content";
        file.close();
    }

    std::ostringstream log_output;
    std::unique_ptr<qrplay::IMediaResolver> resolver;
    std::string test_dir;
};

TEST_F(MediaResolverTest, SupportedFormats) {
    EXPECT_TRUE(resolver->is_supported_format("a.mp4"));
    EXPECT_TRUE(resolver->is_supported_format("a.MP4"));
    EXPECT_TRUE(resolver->is_supported_format("a.webm"));
    EXPECT_TRUE(resolver->is_supported_format("a.ts"));
    EXPECT_TRUE(resolver->is_supported_format("a.flv"));

    EXPECT_FALSE(resolver->is_supported_format("a.txt"));
    EXPECT_FALSE(resolver->is_supported_format("a.mp3"));
    EXPECT_FALSE(resolver->is_supported_format("mp4"));
}

TEST_F(MediaResolverTest, ResolvesExactStem) {
    auto path = resolver->resolve("bluey-s1e1");

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(std::filesystem::path(*path).filename().string(), "bluey-s1e1.mp4");
}

TEST_F(MediaResolverTest, MatchIsCaseInsensitive) {
    auto upper = resolver->resolve("BLUEY-S1E1");
    auto mixed = resolver->resolve("peppa");

    ASSERT_TRUE(upper.has_value());
    ASSERT_TRUE(mixed.has_value());
    EXPECT_EQ(std::filesystem::path(*mixed).filename().string(), "Peppa.MKV");
}

TEST_F(MediaResolverTest, UnsupportedExtensionIsNotFound) {
    EXPECT_FALSE(resolver->resolve("notes").has_value());
}

TEST_F(MediaResolverTest, DoesNotDescendIntoSubdirectories) {
    EXPECT_FALSE(resolver->resolve("hidden").has_value());
    EXPECT_FALSE(resolver->resolve("nested").has_value());
}

TEST_F(MediaResolverTest, UnknownReferenceIsNotFound) {
    EXPECT_FALSE(resolver->resolve("not-a-real-show").has_value());
    EXPECT_FALSE(resolver->resolve("").has_value());
}

TEST_F(MediaResolverTest, EachSupportedExtensionResolves) {
    const char* extensions[] = {".avi", ".webm", ".mov", ".m4v", ".ts", ".flv"};
    for (const char* extension : extensions) {
        std::string stem = std::string("clip") + (extension + 1);
        create_test_file(test_dir + "/" + stem + extension);
        EXPECT_TRUE(resolver->resolve(stem).has_value()) << extension;
    }
}

TEST_F(MediaResolverTest, StemCollisionPicksFirstSortedPath) {
    create_test_file(test_dir + "/x.mp4");
    create_test_file(test_dir + "/X.mkv");

    auto path = resolver->resolve("x");

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(std::filesystem::path(*path).filename().string(), "X.mkv");
}

TEST_F(MediaResolverTest, SeesFilesAddedAfterConstruction) {
    EXPECT_FALSE(resolver->resolve("new-episode").has_value());
    create_test_file(test_dir + "/new-episode.webm");
    EXPECT_TRUE(resolver->resolve("new-episode").has_value());
}

TEST_F(MediaResolverTest, BuildIndexListsSupportedFiles) {
    auto index = resolver->build_index();

    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.count("bluey-s1e1"), 1u);
    EXPECT_EQ(index.count("peppa"), 1u);
}

TEST_F(MediaResolverTest, NonExistentDirectory) {
    auto missing = qrplay::create_media_resolver("non_existent_media_dir", {".mp4"});

    EXPECT_TRUE(missing->build_index().empty());
    EXPECT_FALSE(missing->resolve("bluey").has_value());
    EXPECT_NE(log_output.str().find("non_existent_media_dir"), std::string::npos);
}
