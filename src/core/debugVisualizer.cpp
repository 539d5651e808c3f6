#include "mangasplit/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace mangasplit::core {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	// Steps outside a stage are collected in an unnamed one.
	if (!m_hasActiveStage) {
		beginStage("");
	}
	m_currentStage.steps.push_back(DebugStep{std::move(name), img.clone()});
}

const std::vector<DebugStage>& DebugVisualizer::stages() const {
	return m_stages;
}

std::size_t DebugVisualizer::stepCount() const {
	std::size_t count = 0u;
	for (const auto& stage: m_stages) {
		count += stage.steps.size();
	}
	return count;
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic(const int tileWidth) {
	static constexpr int ROW_LABEL_W  = 160;
	static constexpr int TILE_LABEL_H = 24;
	static constexpr int TILE_PAD     = 4;

	static const cv::Scalar BG(24, 24, 24);
	static const cv::Scalar LABEL_BG(0, 0, 0);
	static const cv::Scalar LABEL_FG(255, 255, 255);

	endStage();

	std::size_t maxSteps = 0u;
	for (const auto& stage: m_stages) {
		maxSteps = std::max(maxSteps, stage.steps.size());
	}
	if (m_stages.empty() || maxSteps == 0u) {
		return {};
	}

	// Spreads are wide. Tiles keep a 2:1 aspect so the pages stay readable.
	const int tileW   = std::max(32, tileWidth);
	const int tileH   = tileW / 2 + TILE_LABEL_H;
	const int mosaicW = ROW_LABEL_W + tileW * static_cast<int>(maxSteps);
	const int mosaicH = tileH * static_cast<int>(m_stages.size());

	cv::Mat mosaic(mosaicH, mosaicW, CV_8UC3, BG);

	for (std::size_t row = 0u; row < m_stages.size(); ++row) {
		const auto& stage = m_stages[row];
		const int y       = static_cast<int>(row) * tileH;

		cv::Mat label = mosaic(cv::Rect(0, y, ROW_LABEL_W, tileH));
		label.setTo(LABEL_BG);
		const std::string stageName = stage.name.empty() ? "Stage " + std::to_string(row + 1) : stage.name;
		cv::putText(label, stageName, cv::Point(TILE_PAD, tileH / 2), cv::FONT_HERSHEY_SIMPLEX, 0.5, LABEL_FG, 1, cv::LINE_AA);

		for (std::size_t col = 0u; col < stage.steps.size(); ++col) {
			const auto& step = stage.steps[col];
			cv::Mat cell     = mosaic(cv::Rect(ROW_LABEL_W + static_cast<int>(col) * tileW, y, tileW, tileH));

			cv::rectangle(cell, cv::Rect(0, 0, cell.cols, TILE_LABEL_H), LABEL_BG, cv::FILLED);
			cv::putText(cell, step.name, cv::Point(TILE_PAD, TILE_LABEL_H - 7), cv::FONT_HERSHEY_SIMPLEX, 0.45, LABEL_FG, 1, cv::LINE_AA);

			if (step.image.empty()) {
				continue;
			}

			const int availW = std::max(1, tileW - 2 * TILE_PAD);
			const int availH = std::max(1, tileH - TILE_LABEL_H - 2 * TILE_PAD);

			const cv::Mat vis  = toBgr8U(step.image);
			const double scale = std::min(static_cast<double>(availW) / vis.cols, static_cast<double>(availH) / vis.rows);
			const int w        = std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, availW);
			const int h        = std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, availH);

			cv::Mat resized;
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);

			const int x0 = TILE_PAD + (availW - w) / 2;
			const int y0 = TILE_LABEL_H + TILE_PAD + (availH - h) / 2;
			resized.copyTo(cell(cv::Rect(x0, y0, w, h)));
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;

	// Masks and projections arrive as bool-like or float data. Stretch to the full 8 bit range.
	if (in.depth() != CV_8U) {
		double minV = 0.0, maxV = 0.0;
		cv::minMaxLoc(in.reshape(1), &minV, &maxV);
		if (maxV - minV < 1e-9) {
			in.convertTo(out, CV_8U);
		} else {
			in.convertTo(out, CV_8U, 255.0 / (maxV - minV), -minV * 255.0 / (maxV - minV));
		}
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

} // namespace mangasplit::core
