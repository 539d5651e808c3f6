#include "analyser.hpp"

#include "mangasplit/core/contentMetrics.hpp"
#include "mangasplit/core/debugVisualizer.hpp"
#include "mangasplit/core/errors.hpp"
#include "mangasplit/core/foregroundMask.hpp"
#include "mangasplit/core/splitLocator.hpp"
#include "mangasplit/core/spreadSplitter.hpp"

#include <opencv2/imgproc.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace mangasplit {


static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}


Analyser::Analyser(cv::Mat image, core::SplitConfig config) : m_original(std::move(image)), m_config(config) {
}

cv::Mat Analyser::analyse(const PipelineStep step) const {
	if (m_original.empty()) {
		return buildInfoTile("Input Error", "Could not load image.");
	}

	core::DebugVisualizer debugger;
	if (const auto reason = record(step, debugger)) {
		return buildInfoTile(std::string(toLabel(step)), *reason);
	}

	const cv::Mat mosaic = debugger.buildMosaic();
	if (mosaic.empty()) {
		return buildInfoTile("No Debug Output", "Selected stage produced no visuals.");
	}
	return mosaic;
}

std::optional<std::string> Analyser::record(const PipelineStep step, core::DebugVisualizer& debugger) const {
	try {
		switch (step) {
		case PipelineStep::Mask:
			core::buildForegroundMask(m_original, &debugger);
			break;

		case PipelineStep::Metrics: {
			const cv::Mat mask = core::buildForegroundMask(m_original);
			const auto metrics = core::computeContentMetrics(mask);
			if (!metrics) {
				return "No foreground found in this image.";
			}
			cv::Mat vis;
			cv::cvtColor(core::toLuminance(m_original), vis, cv::COLOR_GRAY2BGR);
			cv::rectangle(vis, metrics->bbox.toRect(), cv::Scalar(0, 0, 255), 3);
			debugger.beginStage("Content Metrics");
			debugger.add("Mask", mask);
			debugger.add("Ink Box", vis);
			debugger.endStage();
			break;
		}

		case PipelineStep::Projection:
			core::locateSplit(core::buildForegroundMask(m_original), m_config, &debugger);
			break;

		case PipelineStep::Pages: {
			// Show what splitSpread() emits, including fallback and clamped cuts.
			const core::SplitResult result = core::splitSpread(m_original, m_config);
			if (result.pages.empty()) {
				return "No pages: mode " + std::string(core::toString(result.mode)) + ".";
			}
			debugger.beginStage("Pages (" + std::string(core::toString(result.mode)) + ")");
			if (result.pages.size() == 2u) {
				debugger.add("Right", result.pages[0]);
				debugger.add("Left", result.pages[1]);
			} else {
				debugger.add("Cover", result.pages.front());
			}
			debugger.endStage();
			break;
		}

		case PipelineStep::All:
			core::splitSpread(m_original, m_config, &debugger);
			break;
		}
	} catch (const core::InvalidInputError& e) {
		return std::string(e.what());
	}
	return std::nullopt;
}

std::string Analyser::summary() const {
	if (m_original.empty()) {
		return "No image loaded.";
	}

	try {
		const core::SplitResult result = core::splitSpread(m_original, m_config);

		std::ostringstream out;
		out << m_original.cols << "x" << m_original.rows << "  mode: " << core::toString(result.mode);
		if (result.splitX) {
			out << "  split: " << *result.splitX;
		}
		out << "  confidence: " << result.confidence << "  pages: " << result.pages.size();
		return out.str();
	} catch (const core::InvalidInputError& e) {
		return e.what();
	}
}


} // namespace mangasplit
