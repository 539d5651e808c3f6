#pragma once

#include <optional>

namespace mangasplit::core {

//! Thresholds driving the spread classification and the gutter search.
//! \note Values are empirically tuned. Keep them as they are unless the whole pipeline is re-tuned.
struct SplitConfig {
	double minAspectRatio{1.2};                   //!< width < height * minAspectRatio is not a spread (skip).
	double paddingRatio{0.015};                   //!< Safety padding around each crop (fraction of the dimension).
	double confidenceThreshold{0.1};              //!< Minimum valley contrast required to accept a located gutter.
	double coverContentRatio{0.45};               //!< Content narrower than this (fraction of width) may be a single cover.
	double edgeExclusionRatio{0.12};              //!< Fraction of width ignored at each edge when searching for a gutter.
	double minForegroundRatio{0.01};              //!< Skip images with less ink than this.
	std::optional<double> maxCenterOffsetRatio{}; //!< Reject gutters further than this from the centre. Disabled if unset.
};

//! Ratios within [0, 1], minAspectRatio >= 1.
bool isValidConfig(const SplitConfig& config);

} // namespace mangasplit::core
