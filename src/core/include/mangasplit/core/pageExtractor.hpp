#pragma once

#include "mangasplit/core/contentMetrics.hpp"
#include "mangasplit/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace mangasplit::core {

//! Safety margin added around a crop, in pixels.
struct Padding {
	int x{1};
	int y{1};
};

//! max(1, floor(paddingRatio * dimension)) per axis.
Padding paddingFor(const cv::Size& imageSize, double paddingRatio);

//! Copy of the box grown by the padding and clamped to the image. Never fails: a degenerate box yields the full image.
cv::Mat cropRegion(const cv::Mat& image, const BoundingBox& box, const Padding& padding);

/*! Cut a spread into its two pages at splitX.
 *  Each side is cropped to the ink found on that side (see computeRegionBox) plus padding.
 *
 * \param [in]     image    Original spread.
 * \param [in]     mask     Foreground mask of the spread.
 * \param [in]     splitX   Gutter column. Clamped to [1, width - 1].
 * \param [in]     padding  Padding applied to both pages.
 * \param [in,out] debugger Optional debug visualizer.
 * \return         {right page, left page}. Right first: manga is read right to left.
 */
std::vector<cv::Mat> extractSpreadPages(const cv::Mat& image, const cv::Mat& mask, int splitX, const Padding& padding,
                                        DebugVisualizer* debugger = nullptr);

} // namespace mangasplit::core
