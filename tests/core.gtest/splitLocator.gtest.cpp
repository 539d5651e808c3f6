#include "mangasplit/core/debugVisualizer.hpp"
#include "mangasplit/core/splitLocator.hpp"

#include "syntheticImages.hpp"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

#include <array>
#include <cmath>
#include <vector>

namespace mangasplit::core {
namespace gtest {

using mangasplit::gtest::makeMask;

//! Projection that is `value` on every column in [x0, x1) and zero elsewhere.
static void fillRange(std::vector<float>& projection, const int x0, const int x1, const float value) {
	for (int x = x0; x < x1; ++x) {
		projection[static_cast<std::size_t>(x)] = value;
	}
}

//! Two equal blocks of ink with an empty gutter at [180, 220).
static std::vector<float> makeTwoBlockProjection() {
	std::vector<float> projection(400, 0.0f);
	fillRange(projection, 60, 180, 100.0f);
	fillRange(projection, 220, 340, 100.0f);
	return projection;
}

//! Flat plateau of 100 with a triangular valley of the given depth, 40 columns wide, centred at 200.
static std::vector<float> makeValleyProjection(const float depth) {
	std::vector<float> projection(400, 100.0f);
	for (int x = 180; x <= 220; ++x) {
		const float distance                     = static_cast<float>(std::abs(x - 200)) / 20.0f;
		projection[static_cast<std::size_t>(x)] = 100.0f - depth * (1.0f - distance);
	}
	return projection;
}

TEST(SplitLocator, ProjectionCountsPixels) {
	cv::Mat mask = makeMask(10, 6, {cv::Rect(2, 0, 3, 6), cv::Rect(7, 1, 1, 2)});
	mask.at<uchar>(5, 9) = 1; // Any non-zero value is ink.

	const std::vector<float> projection = columnProjection(mask);
	const std::vector<float> expected   = {0, 0, 6, 6, 6, 0, 0, 2, 0, 1};
	EXPECT_EQ(projection, expected);
	EXPECT_TRUE(columnProjection(cv::Mat{}).empty());
}

TEST(SplitLocator, SmoothingKeepsConstantProjection) {
	const std::vector<float> smoothed = smoothProjection(std::vector<float>(300, 5.0f));
	ASSERT_EQ(smoothed.size(), 300u);
	for (const float value: smoothed) {
		EXPECT_NEAR(value, 5.0f, 1e-4f);
	}
}

TEST(SplitLocator, EdgeMargin) {
	const SplitConfig config{};
	EXPECT_EQ(edgeMarginFor(800, config), 96);
	EXPECT_EQ(edgeMarginFor(820, config), 98);
	EXPECT_EQ(edgeMarginFor(20, config), 5);

	SplitConfig noExclusion{};
	noExclusion.edgeExclusionRatio = 0.0;
	EXPECT_EQ(edgeMarginFor(800, noExclusion), 5);
}

TEST(SplitLocator, CollectValleys) {
	const std::vector<float> data = {3, 1, 2, 2, 2, 0, 4};

	EXPECT_EQ(collectValleys(data, 0, 7), (std::vector<int>{1, 3, 5}));
	EXPECT_EQ(collectValleys(data, 2, 5), (std::vector<int>{3}));
	EXPECT_TRUE(collectValleys(data, 4, 4).empty());
	EXPECT_TRUE(collectValleys(std::vector<float>{1, 2, 3, 4}, 0, 4).empty());
}

TEST(SplitLocator, FindsGutterBetweenBlocks) {
	const SplitCandidate candidate = locateSplitInProjection(makeTwoBlockProjection(), SplitConfig{});

	ASSERT_TRUE(candidate.splitX.has_value());
	EXPECT_GE(*candidate.splitX, 180);
	EXPECT_LT(*candidate.splitX, 220);
	EXPECT_GT(candidate.confidence, 0.99);
	EXPECT_LE(candidate.confidence, 1.0);
	EXPECT_NEAR(candidate.imbalance, 0.0, 1e-3);
	EXPECT_EQ(candidate.edgeMargin, 48);
	EXPECT_NEAR(candidate.totalMass, 24000.0, 1.0);
	EXPECT_GT(candidate.valleyCount, 0u);
}

TEST(SplitLocator, MassIsAccumulatedInSinglePrecision) {
	// Uneven values whose running sum loses digits in float.
	std::vector<float> projection(1000, 0.0f);
	for (std::size_t i = 0u; i < projection.size(); ++i) {
		projection[i] = 1000.0f + static_cast<float>(i % 7) * 0.37f + (i > 480u && i < 520u ? -900.0f : 0.0f);
	}

	float expected = 0.0f;
	for (const float value: smoothProjection(projection)) {
		expected += value;
	}

	const SplitCandidate candidate = locateSplitInProjection(projection, SplitConfig{});
	ASSERT_TRUE(candidate.splitX.has_value());
	EXPECT_EQ(candidate.totalMass, static_cast<double>(expected));
}

TEST(SplitLocator, TiesKeepLowestColumn) {
	// Every column of the empty gutter that the blur does not reach scores the same.
	const std::vector<float> projection = makeTwoBlockProjection();
	const std::vector<float> smoothed   = smoothProjection(projection);

	int firstEmpty = -1;
	for (int x = 180; x < 220; ++x) {
		if (smoothed[static_cast<std::size_t>(x)] == 0.0f) {
			firstEmpty = x;
			break;
		}
	}
	ASSERT_GE(firstEmpty, 0);

	const SplitCandidate candidate = locateSplitInProjection(projection, SplitConfig{});
	ASSERT_TRUE(candidate.splitX.has_value());
	EXPECT_EQ(*candidate.splitX, firstEmpty);
}

TEST(SplitLocator, ConfidenceGrowsWithValleyDepth) {
	const std::array<float, 5> depths = {10.0f, 30.0f, 50.0f, 70.0f, 90.0f};

	double previous = -1.0;
	for (const float depth: depths) {
		const SplitCandidate candidate = locateSplitInProjection(makeValleyProjection(depth), SplitConfig{});
		ASSERT_TRUE(candidate.splitX.has_value()) << "depth " << depth;
		EXPECT_NEAR(*candidate.splitX, 200, 2) << "depth " << depth;
		EXPECT_GE(candidate.confidence, previous) << "depth " << depth;
		EXPECT_GE(candidate.confidence, 0.0);
		EXPECT_LE(candidate.confidence, 1.0);
		previous = candidate.confidence;
	}
	EXPECT_GT(previous, 0.5);
}

TEST(SplitLocator, FlatProjectionHasZeroConfidence) {
	const SplitCandidate candidate = locateSplitInProjection(std::vector<float>(400, 50.0f), SplitConfig{});

	ASSERT_TRUE(candidate.splitX.has_value());
	EXPECT_LT(candidate.confidence, 1e-3);
}

TEST(SplitLocator, NoCandidateWithoutInk) {
	const SplitCandidate candidate = locateSplitInProjection(std::vector<float>(400, 0.0f), SplitConfig{});

	EXPECT_FALSE(candidate.splitX.has_value());
	EXPECT_DOUBLE_EQ(candidate.confidence, 0.0);
	EXPECT_FALSE(locateSplitInProjection({}, SplitConfig{}).splitX.has_value());
}

TEST(SplitLocator, NoCandidateWhenWindowCollapses) {
	// Margin of 5 on both sides leaves nothing of 10 columns.
	EXPECT_FALSE(locateSplitInProjection(std::vector<float>(10, 3.0f), SplitConfig{}).splitX.has_value());

	SplitConfig wideMargin{};
	wideMargin.edgeExclusionRatio = 0.5;
	EXPECT_FALSE(locateSplitInProjection(makeTwoBlockProjection(), wideMargin).splitX.has_value());
}

TEST(SplitLocator, LocatesGutterInMask) {
	const cv::Mat mask = makeMask(800, 400, {cv::Rect(40, 40, 320, 320), cv::Rect(440, 40, 320, 320)});

	DebugVisualizer debugger;
	const SplitCandidate candidate = locateSplit(mask, SplitConfig{}, &debugger);

	ASSERT_TRUE(candidate.splitX.has_value());
	EXPECT_GE(*candidate.splitX, 360);
	EXPECT_LT(*candidate.splitX, 440);
	EXPECT_EQ(candidate.edgeMargin, 96);

	ASSERT_EQ(debugger.stages().size(), 1u);
	EXPECT_EQ(debugger.stages().front().name, "Split Locator");
	ASSERT_EQ(debugger.stepCount(), 1u);
	EXPECT_EQ(debugger.stages().front().steps.front().name, "Projection");
}

TEST(SplitLocator, CenterOffset) {
	EXPECT_FALSE(exceedsCenterOffset(400, 800, 0.1));
	EXPECT_FALSE(exceedsCenterOffset(470, 800, 0.1));
	EXPECT_TRUE(exceedsCenterOffset(300, 800, 0.1));
	EXPECT_TRUE(exceedsCenterOffset(481, 800, 0.1));

	// Zero ratio still tolerates one column.
	EXPECT_FALSE(exceedsCenterOffset(401, 800, 0.0));
	EXPECT_TRUE(exceedsCenterOffset(402, 800, 0.0));

	// Ratios above 0.5 allow every column.
	EXPECT_FALSE(exceedsCenterOffset(0, 800, 0.9));
	EXPECT_FALSE(exceedsCenterOffset(0, 1, 0.1));
}

} // namespace gtest
} // namespace mangasplit::core
