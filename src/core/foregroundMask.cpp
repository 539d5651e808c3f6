#include "mangasplit/core/foregroundMask.hpp"

#include "mangasplit/core/errors.hpp"

#include <string>

#include <opencv2/imgproc.hpp>

namespace mangasplit::core {

namespace {

static constexpr int BLUR_KERNEL_SIZE  = 5;
static constexpr double CLAHE_CLIP     = 2.0;
static constexpr int CLAHE_TILES       = 8;
static constexpr int MORPH_KERNEL_SIZE = 5;

} // namespace

void requireSupportedImage(const cv::Mat& image) {
	if (image.empty() || image.cols <= 0 || image.rows <= 0) {
		throw InvalidInputError("Image has zero area.");
	}
	if (image.depth() != CV_8U) {
		throw InvalidInputError("Image must have 8 bit depth.");
	}
	const int channels = image.channels();
	if (channels != 1 && channels != 3 && channels != 4) {
		throw InvalidInputError("Unsupported channel count: " + std::to_string(channels));
	}
}

cv::Mat toLuminance(const cv::Mat& image) {
	requireSupportedImage(image);

	cv::Mat gray;
	switch (image.channels()) {
	case 1:
		gray = image.clone();
		break;
	case 3:
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
		break;
	case 4:
		cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
		break;
	default:
		break;
	}
	return gray;
}

cv::Mat buildForegroundMask(const cv::Mat& image, DebugVisualizer* debugger) {
	const cv::Mat gray = toLuminance(image);

	if (debugger) {
		debugger->beginStage("Foreground Mask");
		debugger->add("Luminance", gray);
	}

	cv::Mat blurred;
	cv::GaussianBlur(gray, blurred, cv::Size(BLUR_KERNEL_SIZE, BLUR_KERNEL_SIZE), 0.0);
	if (debugger)
		debugger->add("Gaussian Blur", blurred);

	cv::Mat equalized;
	const cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(CLAHE_CLIP, cv::Size(CLAHE_TILES, CLAHE_TILES));
	clahe->apply(blurred, equalized);
	if (debugger)
		debugger->add("CLAHE", equalized);

	// Ink is darker than paper: inverted threshold makes ink the foreground.
	cv::Mat binary;
	cv::threshold(equalized, binary, 0.0, 255.0, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
	if (debugger)
		debugger->add("Otsu (inverted)", binary);

	const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(MORPH_KERNEL_SIZE, MORPH_KERNEL_SIZE));

	cv::Mat opened, cleaned;
	cv::morphologyEx(binary, opened, cv::MORPH_OPEN, kernel, cv::Point(-1, -1), 1);
	cv::morphologyEx(opened, cleaned, cv::MORPH_CLOSE, kernel, cv::Point(-1, -1), 1);
	if (debugger) {
		debugger->add("Open", opened);
		debugger->add("Close", cleaned);
		debugger->endStage();
	}

	return cleaned;
}

} // namespace mangasplit::core
