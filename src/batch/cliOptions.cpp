#include "mangasplit/batch/cliOptions.hpp"

#include "mangasplit/batch/configFile.hpp"

#include <cerrno>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string_view>

namespace mangasplit::batch {

static double parseNumber(const std::string& flag, const std::string& value) {
	const char* begin   = value.c_str();
	char* end           = nullptr;
	errno               = 0;
	const double number = std::strtod(begin, &end);
	if (value.empty() || end != begin + value.size() || errno == ERANGE) {
		throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
	}
	return number;
}

static unsigned parseCount(const std::string& flag, const std::string& value) {
	const char* begin         = value.c_str();
	char* end                 = nullptr;
	errno                     = 0;
	const unsigned long count = std::strtoul(begin, &end, 10);
	// strtoul accepts a sign. Counts are plain digits.
	if (value.empty() || value.front() < '0' || value.front() > '9' || end != begin + value.size() || errno == ERANGE ||
	    count > 1024ul) {
		throw std::invalid_argument(flag + " expects a count between 0 and 1024, got '" + value + "'");
	}
	return static_cast<unsigned>(count);
}

CliArguments parseArguments(const std::vector<std::string>& args) {
	CliArguments parsed{};
	bool hasInput = false;

	for (std::size_t i = 0u; i < args.size(); ++i) {
		const std::string& arg = args[i];

		if (arg == "--overwrite") {
			parsed.options.overwrite = true;
			continue;
		}
		if (arg == "--dry-run") {
			parsed.options.dryRun = true;
			continue;
		}

		if (std::string_view(arg).starts_with("--")) {
			if (i + 1u >= args.size()) {
				throw std::invalid_argument("Missing value for " + arg);
			}
			const std::string& value = args[++i];

			if (arg == "--output") {
				parsed.options.outputDir = value;
			} else if (arg == "--report") {
				parsed.options.reportPath = std::filesystem::path(value);
			} else if (arg == "--config") {
				parsed.configPath = std::filesystem::path(value);
			} else if (arg == "--jobs") {
				parsed.options.workers = parseCount(arg, value);
			} else if (arg == "--padding-ratio") {
				parsed.thresholds.paddingRatio = parseNumber(arg, value);
			} else if (arg == "--cover-threshold") {
				parsed.thresholds.coverContentRatio = parseNumber(arg, value);
			} else if (arg == "--confidence-threshold") {
				parsed.thresholds.confidenceThreshold = parseNumber(arg, value);
			} else if (arg == "--edge-exclusion") {
				parsed.thresholds.edgeExclusionRatio = parseNumber(arg, value);
			} else if (arg == "--min-foreground") {
				parsed.thresholds.minForegroundRatio = parseNumber(arg, value);
			} else if (arg == "--max-center-offset") {
				parsed.thresholds.maxCenterOffsetRatio = parseNumber(arg, value);
			} else {
				throw std::invalid_argument("Unknown option: " + arg);
			}
		} else if (!hasInput) {
			parsed.options.input = arg;
			hasInput             = true;
		} else {
			throw std::invalid_argument("Unexpected argument: " + arg);
		}
	}

	if (!hasInput) {
		throw std::invalid_argument("No input given.");
	}
	return parsed;
}

core::SplitConfig buildConfig(const CliArguments& args) {
	core::SplitConfig config = args.configPath ? loadConfigOverrides(*args.configPath) : core::SplitConfig{};

	const ThresholdFlags& flags = args.thresholds;
	config.paddingRatio         = flags.paddingRatio.value_or(config.paddingRatio);
	config.coverContentRatio    = flags.coverContentRatio.value_or(config.coverContentRatio);
	config.confidenceThreshold  = flags.confidenceThreshold.value_or(config.confidenceThreshold);
	config.edgeExclusionRatio   = flags.edgeExclusionRatio.value_or(config.edgeExclusionRatio);
	config.minForegroundRatio   = flags.minForegroundRatio.value_or(config.minForegroundRatio);
	if (flags.maxCenterOffsetRatio) {
		config.maxCenterOffsetRatio = flags.maxCenterOffsetRatio;
	}

	if (!core::isValidConfig(config)) {
		throw std::runtime_error("Invalid thresholds: ratios must lie in [0, 1] and minAspectRatio must be at least 1.");
	}
	return config;
}

void printUsage(std::ostream& out, const std::string& program) {
	out << "Usage: " << program << " <input> [options]\n"
	    << "  <input>                    Image file or directory to process.\n"
	    << "  --output DIR               Directory for pages and report (default: split-output).\n"
	    << "  --report FILE              Report path (default: <output>/split-report.json).\n"
	    << "  --config FILE              JSON file with threshold overrides.\n"
	    << "  --padding-ratio F          Padding around crops (fraction of dimension).\n"
	    << "  --cover-threshold F        Maximum content width ratio classified as cover.\n"
	    << "  --confidence-threshold F   Minimum valley contrast to accept a located gutter.\n"
	    << "  --edge-exclusion F         Fraction of width ignored near the edges.\n"
	    << "  --min-foreground F         Skip images with less foreground than this ratio.\n"
	    << "  --max-center-offset F      Reject gutters further than F * width from the centre.\n"
	    << "  --jobs N                   Images processed in parallel (0 = all cores, default 1).\n"
	    << "  --overwrite                Overwrite existing output files.\n"
	    << "  --dry-run                  Analyse without writing pages.\n";
}

} // namespace mangasplit::batch
