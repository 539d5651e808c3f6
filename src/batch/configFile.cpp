#include "mangasplit/batch/configFile.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace mangasplit::batch {

static void readNumber(const nlohmann::json& overrides, const char* key, double& target) {
	const auto it = overrides.find(key);
	if (it == overrides.end()) {
		return;
	}
	if (!it->is_number()) {
		throw std::runtime_error(std::string("Config value '") + key + "' must be a number.");
	}
	target = it->get<double>();
}

core::SplitConfig applyConfigOverrides(const nlohmann::json& overrides, core::SplitConfig base) {
	if (!overrides.is_object()) {
		throw std::runtime_error("Config overrides must be a JSON object.");
	}

	readNumber(overrides, "minAspectRatio", base.minAspectRatio);
	readNumber(overrides, "paddingRatio", base.paddingRatio);
	readNumber(overrides, "confidenceThreshold", base.confidenceThreshold);
	readNumber(overrides, "coverContentRatio", base.coverContentRatio);
	readNumber(overrides, "edgeExclusionRatio", base.edgeExclusionRatio);
	readNumber(overrides, "minForegroundRatio", base.minForegroundRatio);

	// null switches the centre limit off.
	if (const auto it = overrides.find("maxCenterOffsetRatio"); it != overrides.end()) {
		if (it->is_null()) {
			base.maxCenterOffsetRatio.reset();
		} else {
			double ratio = 0.0;
			readNumber(overrides, "maxCenterOffsetRatio", ratio);
			base.maxCenterOffsetRatio = ratio;
		}
	}

	return base;
}

core::SplitConfig loadConfigOverrides(const std::filesystem::path& path, core::SplitConfig base) {
	std::ifstream file(path);
	if (!file) {
		throw std::runtime_error("Cannot open config file: " + path.string());
	}

	const nlohmann::json overrides = nlohmann::json::parse(file, nullptr, false);
	if (overrides.is_discarded()) {
		throw std::runtime_error("Config file is not valid JSON: " + path.string());
	}
	return applyConfigOverrides(overrides, base);
}

} // namespace mangasplit::batch
