#include "mangasplit/batch/batchRunner.hpp"

#include "mangasplit/batch/imageFiles.hpp"
#include "mangasplit/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <thread>

#include <opencv2/imgcodecs.hpp>

namespace mangasplit::batch {

namespace fs = std::filesystem;

namespace {

//! Everything one image contributes to the batch outcome.
struct ItemOutcome {
	std::optional<nlohmann::json> item{};
	std::optional<core::SplitMode> mode{};
	std::size_t emitted{0u};
	bool unreadable{false};
	std::vector<std::string> warnings{};
};

//! Write one page. Conflicts and encoder failures become warnings.
static bool writePage(const fs::path& target, const cv::Mat& page, const bool overwrite, std::vector<std::string>& warnings) {
	std::error_code ec;
	if (!overwrite && fs::exists(target, ec)) {
		warnings.push_back("Output file already exists: " + target.string());
		return false;
	}

	try {
		if (!cv::imwrite(target.string(), page)) {
			warnings.push_back("Failed to write image: " + target.string());
			return false;
		}
	} catch (const cv::Exception& e) {
		warnings.push_back("Failed to write image: " + target.string() + " (" + e.what() + ")");
		return false;
	}
	return true;
}

static ItemOutcome processImage(const fs::path& source, const fs::path* nameOwner, const BatchOptions& options) {
	ItemOutcome outcome{};

	const cv::Mat image = cv::imread(source.string(), cv::IMREAD_COLOR);
	if (image.empty()) {
		outcome.unreadable = true;
		outcome.warnings.push_back("Skipping unreadable image: " + source.string());
		return outcome;
	}

	core::SplitResult result;
	try {
		result = options.splitter ? options.splitter(image, options.config) : core::splitSpread(image, options.config);
	} catch (const core::InvalidInputError& e) {
		outcome.unreadable = true;
		outcome.warnings.push_back("Skipping invalid image: " + source.string() + " (" + e.what() + ")");
		return outcome;
	} catch (const std::exception& e) { // cv::Exception, std::bad_alloc, ...
		outcome.unreadable = true;
		outcome.warnings.push_back("Failed to process image: " + source.string() + " (" + e.what() + ")");
		return outcome;
	}

	std::vector<std::string> outputs;
	if (!options.dryRun) {
		const std::vector<std::string> names = outputNamesFor(source, result.mode);
		const std::size_t count              = std::min(names.size(), result.pages.size());
		if (nameOwner != nullptr && count > 0u) {
			outcome.warnings.push_back("Output names of " + source.string() + " already used by " + nameOwner->string());
		} else {
			for (std::size_t i = 0u; i < count; ++i) {
				if (writePage(options.outputDir / names[i], result.pages[i], options.overwrite, outcome.warnings)) {
					outputs.push_back(names[i]);
					++outcome.emitted;
				}
			}
		}
	}

	std::error_code ec;
	const fs::path absolute = fs::absolute(source, ec);

	outcome.mode = result.mode;
	outcome.item = makeReportItem(ec ? source : absolute, result, outputs);
	return outcome;
}

//! Page names derive from the file name only. Sources sharing one would overwrite each other's pages.
//! \returns Per source the earlier source owning its names, or null if it owns them itself.
static std::vector<const fs::path*> findNameOwners(const std::vector<fs::path>& sources) {
	std::vector<const fs::path*> owners(sources.size(), nullptr);
	std::map<fs::path, std::size_t> firstByName;
	for (std::size_t i = 0u; i < sources.size(); ++i) {
		const auto [it, inserted] = firstByName.emplace(sources[i].filename(), i);
		if (!inserted) {
			owners[i] = &sources[it->second];
		}
	}
	return owners;
}

static unsigned resolveWorkerCount(const unsigned requested, const std::size_t jobs) {
	unsigned workers = requested == 0u ? std::thread::hardware_concurrency() : requested;
	workers          = std::max(1u, workers);
	return static_cast<unsigned>(std::min<std::size_t>(workers, std::max<std::size_t>(jobs, 1u)));
}

} // namespace

nlohmann::json makeReportItem(const fs::path& source, const core::SplitResult& result, const std::vector<std::string>& outputs) {
	nlohmann::json item = {
	        {"source", source.string()},
	        {"mode", std::string(core::toString(result.mode))},
	        {"split_x", nullptr},
	        {"confidence", result.confidence},
	        {"content_width_ratio", result.contentWidthRatio},
	        {"outputs", outputs},
	        {"metadata", result.metadata},
	};
	if (result.splitX) {
		item["split_x"] = *result.splitX;
	}
	return item;
}

nlohmann::json makeSummary(const BatchOutcome& outcome) {
	return {
	        {"analyzed_files", outcome.analyzedFiles},
	        {"emitted_files", outcome.emittedFiles},
	        {"skipped_files", outcome.skippedFiles},
	        {"split_pages", outcome.splitPages},
	        {"cover_trims", outcome.coverTrims},
	        {"fallback_splits", outcome.fallbackSplits},
	        {"warnings", outcome.warnings},
	};
}

BatchOutcome runBatch(const BatchOptions& options) {
	if (!fs::exists(options.input)) {
		throw std::runtime_error("Input path does not exist: " + options.input.string());
	}

	const std::vector<fs::path> sources           = collectSupportedImages(options.input, options.outputDir);
	const std::vector<const fs::path*> nameOwners = findNameOwners(sources);

	if (!options.dryRun) {
		fs::create_directories(options.outputDir);
	}

	// Images are independent. Workers pull the next index and write into their own slot.
	std::vector<ItemOutcome> outcomes(sources.size());
	std::atomic<std::size_t> cursor{0u};
	const auto work = [&]() {
		for (std::size_t index = cursor.fetch_add(1u); index < sources.size(); index = cursor.fetch_add(1u)) {
			outcomes[index] = processImage(sources[index], nameOwners[index], options);
		}
	};

	const unsigned workerCount = resolveWorkerCount(options.workers, sources.size());
	if (workerCount <= 1u) {
		work();
	} else {
		std::vector<std::thread> threads;
		threads.reserve(workerCount);
		for (unsigned i = 0u; i < workerCount; ++i) {
			threads.emplace_back(work);
		}
		for (auto& thread: threads) {
			thread.join();
		}
	}

	BatchOutcome result{};
	result.reportPath = options.reportPath.value_or(options.outputDir / "split-report.json");

	for (auto& outcome: outcomes) {
		for (auto& warning: outcome.warnings) {
			std::cerr << "[warn] " << warning << '\n';
			result.warnings.push_back(std::move(warning));
		}
		result.emittedFiles += outcome.emitted;

		if (outcome.unreadable || !outcome.mode) {
			++result.skippedFiles;
			continue;
		}

		++result.analyzedFiles;
		switch (*outcome.mode) {
		case core::SplitMode::Skip:
			++result.skippedFiles;
			break;
		case core::SplitMode::CoverTrim:
			++result.coverTrims;
			break;
		case core::SplitMode::FallbackCenter:
			++result.fallbackSplits;
			++result.splitPages;
			break;
		case core::SplitMode::Split:
			++result.splitPages;
			break;
		}
		result.items.push_back(std::move(*outcome.item));
	}

	if (result.reportPath.has_parent_path()) {
		fs::create_directories(result.reportPath.parent_path());
	}
	std::ofstream report(result.reportPath);
	if (!report) {
		throw std::runtime_error("Cannot write report: " + result.reportPath.string());
	}
	const nlohmann::json document = {
	        {"items", result.items},
	        {"summary", makeSummary(result)},
	};
	report << document.dump(2) << '\n';

	return result;
}

} // namespace mangasplit::batch
