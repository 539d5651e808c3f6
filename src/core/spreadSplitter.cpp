#include "mangasplit/core/spreadSplitter.hpp"

#include "mangasplit/core/contentMetrics.hpp"
#include "mangasplit/core/errors.hpp"
#include "mangasplit/core/foregroundMask.hpp"
#include "mangasplit/core/pageExtractor.hpp"
#include "mangasplit/core/splitLocator.hpp"

#include "debugLog.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace mangasplit::core {

namespace {

//! Content must cover more than this fraction of the height to be treated as a cover.
static constexpr double COVER_MIN_HEIGHT_RATIO = 0.8;

static SplitResult makeSkip(const char* reason, nlohmann::json metadata = nlohmann::json::object()) {
	SplitResult result{};
	result.mode               = SplitMode::Skip;
	result.metadata           = std::move(metadata);
	result.metadata["reason"] = reason;
	return result;
}

static nlohmann::json bboxToJson(const BoundingBox& box) {
	return {
	        {"x", box.x0},
	        {"y", box.y0},
	        {"width", box.width()},
	        {"height", box.height()},
	};
}

//! Draw the ink box on a copy of the spread.
static cv::Mat drawBox(const cv::Mat& image, const BoundingBox& box) {
	cv::Mat vis;
	if (image.channels() == 1) {
		cv::cvtColor(image, vis, cv::COLOR_GRAY2BGR);
	} else if (image.channels() == 4) {
		cv::cvtColor(image, vis, cv::COLOR_BGRA2BGR);
	} else {
		vis = image.clone();
	}
	const int thickness = std::max(2, std::min(image.cols, image.rows) / 200);
	cv::rectangle(vis, box.toRect(), cv::Scalar(0, 0, 255), thickness);
	return vis;
}

} // namespace

std::string_view toString(const SplitMode mode) {
	switch (mode) {
	case SplitMode::Skip:
		return "skip";
	case SplitMode::CoverTrim:
		return "cover-trim";
	case SplitMode::Split:
		return "split";
	case SplitMode::FallbackCenter:
		return "fallback-center";
	}
	return "unknown";
}

SplitResult splitSpread(const cv::Mat& image, const SplitConfig& config, DebugVisualizer* debugger) {
	requireSupportedImage(image);
	if (!isValidConfig(config)) {
		throw InvalidInputError("Invalid split config: ratios must lie in [0, 1] and minAspectRatio must be >= 1.");
	}

	const int width  = image.cols;
	const int height = image.rows;

	// 1) Shape: portrait and square scans are single pages.
	if (width < height * config.minAspectRatio) {
		return makeSkip("aspect_ratio");
	}

	// 2) Ink.
	const cv::Mat mask   = buildForegroundMask(image, debugger);
	const double fgRatio = foregroundRatio(mask);

	std::optional<ContentMetrics> metricsOpt;
	if (fgRatio >= config.minForegroundRatio) {
		metricsOpt = computeContentMetrics(mask);
	}
	if (!metricsOpt) {
		if (splitDebugEnabled()) {
			std::cerr << "[split-debug] no foreground ratio=" << fgRatio << '\n';
		}
		return makeSkip("no_foreground", {{"foreground_ratio", fgRatio}});
	}
	const ContentMetrics& metrics = *metricsOpt;

	if (debugger) {
		debugger->beginStage("Content Metrics");
		debugger->add("Ink Box", drawBox(image, metrics.bbox));
		debugger->endStage();
	}

	nlohmann::json metadata = {
	        {"foreground_ratio", metrics.foregroundRatio},
	        {"bbox", bboxToJson(metrics.bbox)},
	};

	const Padding padding = paddingFor(image.size(), config.paddingRatio);

	if (splitDebugEnabled()) {
		std::cerr << "[split-debug] size=" << width << "x" << height << " fg=" << metrics.foregroundRatio << " bbox=" << metrics.bbox.toRect()
		          << " widthRatio=" << metrics.contentWidthRatio << " heightRatio=" << metrics.bboxHeightRatio << '\n';
	}

	// 3) A narrow but tall block of ink is one cover on a wide canvas, not two pages.
	if (metrics.contentWidthRatio < config.coverContentRatio && metrics.bboxHeightRatio > COVER_MIN_HEIGHT_RATIO) {
		SplitResult result{};
		result.mode              = SplitMode::CoverTrim;
		result.confidence        = 1.0;
		result.contentWidthRatio = metrics.contentWidthRatio;
		result.pages.push_back(cropRegion(image, metrics.bbox, padding));

		metadata["splitMode"]           = std::string(toString(SplitMode::CoverTrim));
		metadata["content_width_ratio"] = metrics.contentWidthRatio;
		metadata["bbox_height_ratio"]   = metrics.bboxHeightRatio;
		result.metadata                 = std::move(metadata);

		if (debugger) {
			debugger->beginStage("Pages");
			debugger->add("Cover", result.pages.front());
			debugger->endStage();
		}
		return result;
	}

	// 4) Gutter search with a centred fallback.
	const SplitCandidate candidate = locateSplit(mask, config, debugger);
	if (candidate.splitX) {
		metadata["projection_imbalance"]    = candidate.imbalance;
		metadata["projection_edge_margin"]  = candidate.edgeMargin;
		metadata["projection_total_mass"]   = candidate.totalMass;
		metadata["projection_valley_count"] = candidate.valleyCount;
	}

	SplitMode mode    = SplitMode::Split;
	int splitX        = width / 2;
	double confidence = std::max(candidate.confidence, 0.0);

	if (!candidate.splitX || candidate.confidence < config.confidenceThreshold) {
		mode = SplitMode::FallbackCenter;
	} else if (config.maxCenterOffsetRatio && exceedsCenterOffset(*candidate.splitX, width, *config.maxCenterOffsetRatio)) {
		// Gutter too far off centre to be trusted.
		mode                      = SplitMode::FallbackCenter;
		confidence                = 0.0;
		metadata["split_clamped"] = true;
	} else {
		splitX = *candidate.splitX;
	}

	// 5) Pages.
	SplitResult result{};
	result.mode              = mode;
	result.splitX            = splitX;
	result.confidence        = confidence;
	result.contentWidthRatio = metrics.contentWidthRatio;
	result.pages             = extractSpreadPages(image, mask, splitX, padding, debugger);

	metadata["splitMode"]           = std::string(toString(mode));
	metadata["split_x"]             = splitX;
	metadata["confidence"]          = confidence;
	metadata["content_width_ratio"] = metrics.contentWidthRatio;
	result.metadata                 = std::move(metadata);

	if (splitDebugEnabled()) {
		std::cerr << "[split-debug] mode=" << toString(mode) << " split=" << splitX << " confidence=" << confidence << '\n';
	}

	return result;
}

} // namespace mangasplit::core
