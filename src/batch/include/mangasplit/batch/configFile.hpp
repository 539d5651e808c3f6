#pragma once

#include "mangasplit/core/splitConfig.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace mangasplit::batch {

/*! Apply threshold overrides to a base config.
 *  Recognised keys: minAspectRatio, paddingRatio, confidenceThreshold, coverContentRatio, edgeExclusionRatio,
 *  minForegroundRatio, maxCenterOffsetRatio. Missing keys keep the base value. Unknown keys are ignored.
 *  maxCenterOffsetRatio may be null to disable the centre limit.
 * \throws std::runtime_error if overrides is not an object or a recognised key is not a number.
 */
core::SplitConfig applyConfigOverrides(const nlohmann::json& overrides, core::SplitConfig base = {});

//! Read a JSON override file and apply it to base. See applyConfigOverrides().
//! \throws std::runtime_error if the file cannot be read or parsed.
core::SplitConfig loadConfigOverrides(const std::filesystem::path& path, core::SplitConfig base = {});

} // namespace mangasplit::batch
