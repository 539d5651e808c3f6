#include "mangasplit/core/debugVisualizer.hpp"
#include "mangasplit/core/pageExtractor.hpp"

#include "syntheticImages.hpp"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

namespace mangasplit::core {
namespace gtest {

using mangasplit::gtest::drawBlock;
using mangasplit::gtest::makeCanvas;
using mangasplit::gtest::makeMask;

//! 400x200 spread. Left block darker than the right one so the pages can be told apart.
struct SyntheticSpread {
	cv::Mat image;
	cv::Mat mask;
};

static SyntheticSpread makeSpread() {
	SyntheticSpread spread{makeCanvas(400, 200), makeMask(400, 200, {cv::Rect(40, 40, 120, 120), cv::Rect(240, 40, 120, 120)})};
	drawBlock(spread.image, 40, 40, 160, 160, 20);
	drawBlock(spread.image, 240, 40, 360, 160, 120);
	return spread;
}

static bool isSameImage(const cv::Mat& a, const cv::Mat& b) {
	return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

TEST(PageExtractor, PaddingIsAtLeastOnePixel) {
	const Padding padding = paddingFor(cv::Size(800, 500), 0.015);
	EXPECT_EQ(padding.x, 12);
	EXPECT_EQ(padding.y, 7);

	const Padding tiny = paddingFor(cv::Size(10, 10), 0.015);
	EXPECT_EQ(tiny.x, 1);
	EXPECT_EQ(tiny.y, 1);

	const Padding none = paddingFor(cv::Size(800, 500), 0.0);
	EXPECT_EQ(none.x, 1);
	EXPECT_EQ(none.y, 1);
}

TEST(PageExtractor, CropAddsPadding) {
	const cv::Mat image = makeCanvas(100, 80);

	const cv::Mat crop = cropRegion(image, BoundingBox{10, 10, 20, 20}, Padding{2, 3});
	EXPECT_EQ(crop.cols, 14);
	EXPECT_EQ(crop.rows, 16);
}

TEST(PageExtractor, CropClampsToImage) {
	const cv::Mat image = makeCanvas(100, 80);

	const cv::Mat full = cropRegion(image, BoundingBox{0, 0, 100, 80}, Padding{5, 5});
	EXPECT_EQ(full.size(), image.size());

	const cv::Mat corner = cropRegion(image, BoundingBox{95, 75, 100, 80}, Padding{10, 10});
	EXPECT_EQ(corner.cols, 15);
	EXPECT_EQ(corner.rows, 15);
}

TEST(PageExtractor, DegenerateBoxYieldsFullImage) {
	const cv::Mat image = makeCanvas(100, 80);

	const cv::Mat crop = cropRegion(image, BoundingBox{50, 10, 50, 20}, Padding{0, 0});
	EXPECT_TRUE(isSameImage(crop, image));
}

TEST(PageExtractor, CropIsACopy) {
	const cv::Mat image    = makeCanvas(100, 80);
	const cv::Mat original = image.clone();

	cv::Mat crop = cropRegion(image, BoundingBox{10, 10, 50, 50}, Padding{1, 1});
	crop.setTo(cv::Scalar::all(0));

	EXPECT_TRUE(isSameImage(image, original));
}

TEST(PageExtractor, PagesAreRightThenLeft) {
	const SyntheticSpread spread = makeSpread();

	const std::vector<cv::Mat> pages = extractSpreadPages(spread.image, spread.mask, 200, Padding{2, 2});
	ASSERT_EQ(pages.size(), 2u);

	EXPECT_TRUE(isSameImage(pages[0], spread.image(cv::Rect(238, 38, 124, 124))));
	EXPECT_TRUE(isSameImage(pages[1], spread.image(cv::Rect(38, 38, 124, 124))));
}

TEST(PageExtractor, EmptySideKeepsItsColumns) {
	SyntheticSpread spread = makeSpread();
	spread.mask(cv::Rect(240, 40, 120, 120)).setTo(0);

	const std::vector<cv::Mat> pages = extractSpreadPages(spread.image, spread.mask, 200, Padding{2, 2});
	ASSERT_EQ(pages.size(), 2u);

	// Right side has no ink: columns [200, 400) padded on the left, full height.
	EXPECT_TRUE(isSameImage(pages[0], spread.image(cv::Rect(198, 0, 202, 200))));
	EXPECT_TRUE(isSameImage(pages[1], spread.image(cv::Rect(38, 38, 124, 124))));
}

TEST(PageExtractor, SplitColumnIsClamped) {
	const SyntheticSpread spread = makeSpread();

	const std::vector<cv::Mat> pages = extractSpreadPages(spread.image, spread.mask, -50, Padding{2, 2});
	ASSERT_EQ(pages.size(), 2u);

	// Everything lands on the right. The left side is the single first column plus padding.
	EXPECT_TRUE(isSameImage(pages[0], spread.image(cv::Rect(38, 38, 324, 124))));
	EXPECT_EQ(pages[1].cols, 3);
	EXPECT_EQ(pages[1].rows, 200);
}

TEST(PageExtractor, RecordsPages) {
	const SyntheticSpread spread = makeSpread();

	DebugVisualizer debugger;
	extractSpreadPages(spread.image, spread.mask, 200, Padding{2, 2}, &debugger);

	ASSERT_EQ(debugger.stages().size(), 1u);
	EXPECT_EQ(debugger.stages().front().name, "Pages");
	ASSERT_EQ(debugger.stepCount(), 2u);
	EXPECT_EQ(debugger.stages().front().steps[0].name, "Right");
	EXPECT_EQ(debugger.stages().front().steps[1].name, "Left");
}

} // namespace gtest
} // namespace mangasplit::core
