#pragma once

#include "mangasplit/batch/batchRunner.hpp"
#include "mangasplit/core/splitConfig.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace mangasplit::batch {

//! Threshold flags given on the command line. Applied on top of the config file.
struct ThresholdFlags {
	std::optional<double> paddingRatio{};
	std::optional<double> coverContentRatio{};
	std::optional<double> confidenceThreshold{};
	std::optional<double> edgeExclusionRatio{};
	std::optional<double> minForegroundRatio{};
	std::optional<double> maxCenterOffsetRatio{};
};

struct CliArguments {
	BatchOptions options{};                            //!< options.config is filled by buildConfig().
	std::optional<std::filesystem::path> configPath{}; //!< --config
	ThresholdFlags thresholds{};
};

/*! Parse the arguments after the program name.
 *  Exactly one positional argument (the input). Option values follow their flag as the next argument.
 * \throws std::invalid_argument on unknown options, missing or malformed values and a missing or second input.
 */
CliArguments parseArguments(const std::vector<std::string>& args);

/*! Config file first, then command line flags.
 * \throws std::runtime_error if the config file is unusable or the result fails core::isValidConfig().
 */
core::SplitConfig buildConfig(const CliArguments& args);

void printUsage(std::ostream& out, const std::string& program);

} // namespace mangasplit::batch
