#include "mangasplit/core/pageExtractor.hpp"

#include <algorithm>

namespace mangasplit::core {

Padding paddingFor(const cv::Size& imageSize, const double paddingRatio) {
	return {
	        std::max(1, static_cast<int>(paddingRatio * imageSize.width)),
	        std::max(1, static_cast<int>(paddingRatio * imageSize.height)),
	};
}

cv::Mat cropRegion(const cv::Mat& image, const BoundingBox& box, const Padding& padding) {
	const int x0 = std::clamp(box.x0 - padding.x, 0, std::max(0, image.cols - 1));
	const int y0 = std::clamp(box.y0 - padding.y, 0, std::max(0, image.rows - 1));
	const int x1 = std::min(box.x1 + padding.x, image.cols);
	const int y1 = std::min(box.y1 + padding.y, image.rows);

	if (x1 <= x0 || y1 <= y0) {
		return image.clone();
	}
	return image(cv::Rect(x0, y0, x1 - x0, y1 - y0)).clone();
}

std::vector<cv::Mat> extractSpreadPages(const cv::Mat& image, const cv::Mat& mask, const int splitX, const Padding& padding, DebugVisualizer* debugger) {
	const int width = mask.cols;
	const int split = std::clamp(splitX, 1, std::max(1, width - 1));

	const BoundingBox rightBox = computeRegionBox(mask, split, width);
	const BoundingBox leftBox  = computeRegionBox(mask, 0, split);

	std::vector<cv::Mat> pages{
	        cropRegion(image, rightBox, padding),
	        cropRegion(image, leftBox, padding),
	};

	if (debugger) {
		debugger->beginStage("Pages");
		debugger->add("Right", pages[0]);
		debugger->add("Left", pages[1]);
		debugger->endStage();
	}

	return pages;
}

} // namespace mangasplit::core
