#pragma once

#include "mangasplit/core/debugVisualizer.hpp"
#include "mangasplit/core/splitConfig.hpp"

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <optional>
#include <vector>

// Gutter search.
// The gutter between two pages is a vertical band with little ink. Summing the mask down each column gives a 1D
// projection in which the gutter shows up as a valley. We smooth the projection, ignore both outer margins and choose the
// valley that splits the ink mass most evenly, with a small bonus for deep valleys.
namespace mangasplit::core {

//! Outcome of the gutter search.
struct SplitCandidate {
	std::optional<int> splitX;   //!< Located gutter column. Empty if the projection holds no usable valley.
	double confidence{0.0};      //!< Relative valley depth in [0, 1]. 0 for a flat projection, 1 for an empty gutter column.
	double imbalance{0.0};       //!< |left mass - right mass| / total mass at splitX.
	int edgeMargin{0};           //!< Columns excluded on each side.
	double totalMass{0.0};       //!< Sum of the smoothed projection.
	std::size_t valleyCount{0u}; //!< Local minima found inside the search window.
};

//! Ink mass per column of a CV_8UC1 mask (number of foreground pixels).
std::vector<float> columnProjection(const cv::Mat& mask);

//! Gaussian smoothing with sigma = max(size / 200, 1) and replicated borders.
std::vector<float> smoothProjection(const std::vector<float>& projection);

//! Columns excluded from the search at each edge: max(5, floor(width * edgeExclusionRatio)).
int edgeMarginFor(int width, const SplitConfig& config);

//! Indices i in [start, end) with data[i] <= data[i - 1] and data[i] <= data[i + 1]. First and last element are never reported.
std::vector<int> collectValleys(const std::vector<float>& data, int start, int end);

/*! Locate the gutter in a raw column projection.
 * \param [in]     projection Raw (unsmoothed) ink mass per column.
 * \param [in]     config     Only edgeExclusionRatio is used.
 * \param [in,out] debugger   Optional debug visualizer. Adds a projection plot to the active stage.
 * \note           Ties in the score keep the valley with the lowest column index.
 */
SplitCandidate locateSplitInProjection(const std::vector<float>& projection, const SplitConfig& config, DebugVisualizer* debugger = nullptr);

//! Locate the gutter in a foreground mask. See locateSplitInProjection().
SplitCandidate locateSplit(const cv::Mat& mask, const SplitConfig& config, DebugVisualizer* debugger = nullptr);

//! True if splitX is further than max(1, width * maxRatio) from the image centre. maxRatio is clamped to [0, 0.5].
bool exceedsCenterOffset(int splitX, int width, double maxRatio);

} // namespace mangasplit::core
