#include "mangasplit/core/contentMetrics.hpp"

#include <algorithm>

#include <opencv2/imgproc.hpp>

namespace mangasplit::core {

double foregroundRatio(const cv::Mat& mask) {
	if (mask.empty()) {
		return 0.0;
	}
	return static_cast<double>(cv::countNonZero(mask)) / static_cast<double>(mask.total());
}

std::optional<ContentMetrics> computeContentMetrics(const cv::Mat& mask) {
	if (mask.empty() || cv::countNonZero(mask) == 0) {
		return std::nullopt;
	}

	const cv::Rect rect = cv::boundingRect(mask);

	ContentMetrics metrics{};
	metrics.bbox              = {rect.x, rect.y, rect.x + rect.width, rect.y + rect.height};
	metrics.foregroundRatio   = foregroundRatio(mask);
	metrics.contentWidthRatio = static_cast<double>(rect.width) / static_cast<double>(mask.cols);
	metrics.bboxHeightRatio   = static_cast<double>(rect.height) / static_cast<double>(mask.rows);
	return metrics;
}

BoundingBox computeRegionBox(const cv::Mat& mask, const int xStart, const int xEnd) {
	if (mask.empty()) {
		return {};
	}

	const int start = std::clamp(xStart, 0, mask.cols - 1);
	const int end   = std::max(std::min(xEnd, mask.cols), start + 1);

	const cv::Mat slice = mask(cv::Range::all(), cv::Range(start, end));
	if (cv::countNonZero(slice) == 0) {
		return {start, 0, end, mask.rows};
	}

	const cv::Rect rect = cv::boundingRect(slice);
	return {start + rect.x, rect.y, start + rect.x + rect.width, rect.y + rect.height};
}

} // namespace mangasplit::core
