#include "mangasplit/core/splitConfig.hpp"

namespace mangasplit::core {

static bool isRatio(const double value) {
	return value >= 0.0 && value <= 1.0;
}

bool isValidConfig(const SplitConfig& config) {
	if (!(config.minAspectRatio >= 1.0)) {
		return false;
	}
	if (!isRatio(config.paddingRatio) || !isRatio(config.confidenceThreshold) || !isRatio(config.coverContentRatio) ||
	    !isRatio(config.edgeExclusionRatio) || !isRatio(config.minForegroundRatio)) {
		return false;
	}
	return !config.maxCenterOffsetRatio.has_value() || isRatio(*config.maxCenterOffsetRatio);
}

} // namespace mangasplit::core
