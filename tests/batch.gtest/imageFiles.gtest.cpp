#include "mangasplit/batch/imageFiles.hpp"

#include "tempDirectory.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace mangasplit::batch {
namespace gtest {

namespace fs = std::filesystem;

using ImageFiles = TempDirectoryTest;

TEST(ImageFilesNames, SupportedExtensions) {
	EXPECT_TRUE(isSupportedImage("scan.png"));
	EXPECT_TRUE(isSupportedImage("scan.jpg"));
	EXPECT_TRUE(isSupportedImage("scan.jpeg"));
	EXPECT_TRUE(isSupportedImage("scan.webp"));
	EXPECT_TRUE(isSupportedImage("dir/SCAN.PNG"));
	EXPECT_TRUE(isSupportedImage("scan.JpEg"));

	EXPECT_FALSE(isSupportedImage("scan.gif"));
	EXPECT_FALSE(isSupportedImage("scan.tiff"));
	EXPECT_FALSE(isSupportedImage("scan"));
	EXPECT_FALSE(isSupportedImage("png"));
	EXPECT_FALSE(isSupportedImage("scan.png.txt"));
}

TEST(ImageFilesNames, OutputNames) {
	using core::SplitMode;

	EXPECT_EQ(outputNamesFor("vol1/p012.jpg", SplitMode::Split), (std::vector<std::string>{"p012_R.jpg", "p012_L.jpg"}));
	EXPECT_EQ(outputNamesFor("vol1/p012.jpg", SplitMode::FallbackCenter), (std::vector<std::string>{"p012_R.jpg", "p012_L.jpg"}));
	EXPECT_EQ(outputNamesFor("vol1/cover.PNG", SplitMode::CoverTrim), (std::vector<std::string>{"cover_cover.PNG"}));
	EXPECT_TRUE(outputNamesFor("vol1/p013.png", SplitMode::Skip).empty());

	EXPECT_EQ(outputNamesFor("raw", SplitMode::Split), (std::vector<std::string>{"raw_R.png", "raw_L.png"}));
}

TEST_F(ImageFiles, WalksDirectoryRecursively) {
	writeText("b.png", "");
	writeText("a.JPG", "");
	writeText("notes.txt", "");
	writeText("chapter1/c.webp", "");
	writeText("chapter1/deep/d.jpeg", "");
	writeText("chapter1/thumbs.db", "");

	const std::vector<fs::path> images = collectSupportedImages(root());
	const std::vector<fs::path> expected = {
	        root() / "a.JPG",
	        root() / "b.png",
	        root() / "chapter1/c.webp",
	        root() / "chapter1/deep/d.jpeg",
	};
	EXPECT_EQ(images, expected);
}

TEST_F(ImageFiles, SingleFileYieldsItself) {
	const fs::path image = writeText("spread.png", "");
	const fs::path text  = writeText("spread.txt", "");

	EXPECT_EQ(collectSupportedImages(image), (std::vector<fs::path>{image}));
	EXPECT_TRUE(collectSupportedImages(text).empty());
}

TEST_F(ImageFiles, SkipsExcludedDirectory) {
	writeText("a.png", "");
	writeText("out/a_R.png", "");
	writeText("out/nested/a_L.png", "");
	writeText("outtakes/b.png", "");

	EXPECT_EQ(collectSupportedImages(root(), root() / "out"), (std::vector<fs::path>{root() / "a.png", root() / "outtakes/b.png"}));
	EXPECT_EQ(collectSupportedImages(root()).size(), 4u);

	// Missing or unrelated directories exclude nothing.
	EXPECT_EQ(collectSupportedImages(root(), root() / "missing").size(), 4u);
	EXPECT_EQ(collectSupportedImages(root() / "out", root() / "outtakes").size(), 2u);
}

TEST_F(ImageFiles, EmptyDirectory) {
	EXPECT_TRUE(collectSupportedImages(root()).empty());
}

} // namespace gtest
} // namespace mangasplit::batch
