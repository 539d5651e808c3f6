#include "mangasplit/core/splitLocator.hpp"

#include "debugLog.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include <opencv2/imgproc.hpp>

namespace mangasplit::core {
namespace debugging {

//! Plot raw (gray) and smoothed (green) projection. Excluded margins are shaded, the chosen column is drawn in red.
static cv::Mat plotProjection(const std::vector<float>& raw, const std::vector<float>& smoothed, const int start, const int end,
                              const std::optional<int> splitX) {
	static constexpr int PLOT_H = 240;

	const int width    = static_cast<int>(raw.size());
	const float maxRaw = std::max(1.0f, *std::max_element(raw.begin(), raw.end()));
	const auto toY     = [maxRaw](const float value) { return PLOT_H - 1 - static_cast<int>(std::lround((PLOT_H - 1) * value / maxRaw)); };

	cv::Mat plot(PLOT_H, width, CV_8UC3, cv::Scalar(255, 255, 255));
	plot(cv::Rect(0, 0, std::min(start, width), PLOT_H)).setTo(cv::Scalar(210, 210, 210));
	plot(cv::Rect(std::max(0, end), 0, width - std::max(0, end), PLOT_H)).setTo(cv::Scalar(210, 210, 210));

	for (int x = 1; x < width; ++x) {
		cv::line(plot, {x - 1, toY(raw[x - 1])}, {x, toY(raw[x])}, cv::Scalar(140, 140, 140), 1);
		cv::line(plot, {x - 1, toY(smoothed[x - 1])}, {x, toY(smoothed[x])}, cv::Scalar(0, 160, 0), 2);
	}
	if (splitX) {
		cv::line(plot, {*splitX, 0}, {*splitX, PLOT_H - 1}, cv::Scalar(0, 0, 255), 2);
	}
	return plot;
}

} // namespace debugging

std::vector<float> columnProjection(const cv::Mat& mask) {
	if (mask.empty()) {
		return {};
	}

	// Count pixels, not intensities: any non-zero value is one unit of ink.
	const cv::Mat binary = (mask > 0) / 255;

	cv::Mat sums;
	cv::reduce(binary, sums, 0, cv::REDUCE_SUM, CV_32F);
	return std::vector<float>(sums.begin<float>(), sums.end<float>());
}

std::vector<float> smoothProjection(const std::vector<float>& projection) {
	if (projection.empty()) {
		return {};
	}

	const double sigma = std::max(static_cast<double>(projection.size()) / 200.0, 1.0);

	const cv::Mat row(1, static_cast<int>(projection.size()), CV_32F, const_cast<float*>(projection.data()));
	cv::Mat smoothed;
	cv::GaussianBlur(row, smoothed, cv::Size(0, 0), sigma, sigma, cv::BORDER_REPLICATE);
	return std::vector<float>(smoothed.begin<float>(), smoothed.end<float>());
}

int edgeMarginFor(const int width, const SplitConfig& config) {
	return std::max(static_cast<int>(width * config.edgeExclusionRatio), 5);
}

std::vector<int> collectValleys(const std::vector<float>& data, const int start, const int end) {
	std::vector<int> valleys;
	const int upper = std::min(end, static_cast<int>(data.size()) - 1);
	for (int i = std::max(start, 1); i < upper; ++i) {
		if (data[i] <= data[i - 1] && data[i] <= data[i + 1]) {
			valleys.push_back(i);
		}
	}
	return valleys;
}

SplitCandidate locateSplitInProjection(const std::vector<float>& projection, const SplitConfig& config, DebugVisualizer* debugger) {
	static constexpr double EPS          = 1e-6;
	static constexpr double DEPTH_WEIGHT = 0.1;

	const int width = static_cast<int>(projection.size());
	if (width == 0 || *std::max_element(projection.begin(), projection.end()) <= 0.0f) {
		return {};
	}

	const std::vector<float> smoothed = smoothProjection(projection);

	// Gutters right at the outer edge are implausible and the image border produces spurious minima.
	const int edgeMargin = edgeMarginFor(width, config);
	if (edgeMargin * 2 >= width) {
		return {};
	}
	const int start = edgeMargin;
	const int end   = width - edgeMargin;

	std::vector<int> candidates    = collectValleys(smoothed, start, end);
	const std::size_t valleyCount = candidates.size();
	if (candidates.empty()) {
		const auto minIt = std::min_element(smoothed.begin() + start, smoothed.begin() + end);
		candidates.push_back(static_cast<int>(std::distance(smoothed.begin(), minIt)));
	}

	// Running mass in single precision, like the projection itself. Scores are evaluated in double.
	std::vector<float> cumulative(smoothed.size());
	float running = 0.0f;
	for (std::size_t i = 0u; i < smoothed.size(); ++i) {
		running += smoothed[i];
		cumulative[i] = running;
	}
	const double total  = cumulative.back();
	const double maxVal = *std::max_element(smoothed.begin() + start, smoothed.begin() + end);

	// Balance: prefer splits that leave half of the ink on each side. Depth: prefer pronounced valleys.
	int bestIdx      = candidates.front();
	double bestScore = std::numeric_limits<double>::infinity();
	for (const int idx: candidates) {
		const double balanceScore = std::abs(cumulative[idx] / (total + EPS) - 0.5);
		const double depthScore   = smoothed[idx] / (maxVal + EPS);
		const double score        = balanceScore + DEPTH_WEIGHT * depthScore;
		if (score < bestScore) {
			bestScore = score;
			bestIdx   = idx;
		}
	}

	const double leftMass  = cumulative[bestIdx];
	const double rightMass = total - leftMass;

	SplitCandidate result{};
	result.splitX      = bestIdx;
	result.confidence  = std::clamp((maxVal - smoothed[bestIdx]) / (maxVal + EPS), 0.0, 1.0);
	result.imbalance   = std::abs(leftMass - rightMass) / (total + EPS);
	result.edgeMargin  = edgeMargin;
	result.totalMass   = total;
	result.valleyCount = valleyCount;

	if (splitDebugEnabled()) {
		std::cerr << "[split-debug] projection width=" << width << " window=[" << start << "," << end << ") valleys=" << valleyCount
		          << " split=" << bestIdx << " score=" << bestScore << " confidence=" << result.confidence << '\n';
	}

	if (debugger) {
		debugger->add("Projection", debugging::plotProjection(projection, smoothed, start, end, result.splitX));
	}

	return result;
}

SplitCandidate locateSplit(const cv::Mat& mask, const SplitConfig& config, DebugVisualizer* debugger) {
	if (debugger) {
		debugger->beginStage("Split Locator");
	}

	SplitCandidate result = locateSplitInProjection(columnProjection(mask), config, debugger);

	if (debugger) {
		debugger->endStage();
	}
	return result;
}

bool exceedsCenterOffset(const int splitX, const int width, const double maxRatio) {
	if (width <= 1) {
		return false;
	}

	const double center    = width / 2.0;
	const double maxOffset = std::max(width * std::clamp(maxRatio, 0.0, 0.5), 1.0);
	return std::abs(splitX - center) > maxOffset;
}

} // namespace mangasplit::core
