#pragma once

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <optional>

namespace mangasplit::core {

//! Axis aligned box with exclusive upper bounds. Valid boxes satisfy x0 < x1 and y0 < y1.
struct BoundingBox {
	int x0{0};
	int y0{0};
	int x1{0}; //!< Exclusive.
	int y1{0}; //!< Exclusive.

	int width() const {
		return x1 - x0;
	}
	int height() const {
		return y1 - y0;
	}
	cv::Rect toRect() const {
		return {x0, y0, width(), height()};
	}
	bool operator==(const BoundingBox&) const = default;
};

//! Geometry of the ink found in a foreground mask.
struct ContentMetrics {
	BoundingBox bbox;              //!< Tight box around every foreground pixel.
	double foregroundRatio{0.0};   //!< Fraction of pixels that are foreground.
	double contentWidthRatio{0.0}; //!< bbox width / image width.
	double bboxHeightRatio{0.0};   //!< bbox height / image height.
};

//! Fraction of non-zero pixels in the mask. 0 for an empty matrix.
double foregroundRatio(const cv::Mat& mask);

//! Measure the ink in a CV_8UC1 mask.
//! \returns std::nullopt if the mask holds no foreground pixel. There is no box to measure then.
std::optional<ContentMetrics> computeContentMetrics(const cv::Mat& mask);

/*! Tight box around the foreground inside the column range [xStart, xEnd).
 *  The range is clamped to the mask. If the slice holds no foreground the box spans the slice columns and the full height.
 */
BoundingBox computeRegionBox(const cv::Mat& mask, int xStart, int xEnd);

} // namespace mangasplit::core
