#pragma once

#include "mangasplit/core/splitConfig.hpp"
#include "mangasplit/core/spreadSplitter.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Batch driver around the split pipeline: file discovery, decoding, page output and the JSON report.
// The pipeline itself never touches the file system. All I/O problems end up here as warnings.
namespace mangasplit::batch {

//! Splits one decoded image. Defaults to core::splitSpread.
using SpreadSplitter = std::function<core::SplitResult(const cv::Mat&, const core::SplitConfig&)>;

struct BatchOptions {
	std::filesystem::path input;                       //!< Image file or directory (walked recursively).
	std::filesystem::path outputDir{"split-output"};   //!< Pages and the default report go here.
	std::optional<std::filesystem::path> reportPath{}; //!< Defaults to outputDir / "split-report.json".
	core::SplitConfig config{};                        //!< Thresholds passed to every split.
	bool overwrite{false};                             //!< Replace existing page files.
	bool dryRun{false};                                //!< Analyse and report, but write no pages.
	unsigned workers{1u};                              //!< Images processed in parallel. 0 -> hardware concurrency.
	SpreadSplitter splitter{};                         //!< Empty -> core::splitSpread.
};

struct BatchOutcome {
	std::size_t analyzedFiles{0u};  //!< Images decoded and split.
	std::size_t emittedFiles{0u};   //!< Page files written.
	std::size_t skippedFiles{0u};   //!< Skip results plus unreadable or invalid images.
	std::size_t splitPages{0u};     //!< Split and FallbackCenter results.
	std::size_t coverTrims{0u};     //!< CoverTrim results.
	std::size_t fallbackSplits{0u}; //!< FallbackCenter results.
	std::filesystem::path reportPath;
	nlohmann::json items = nlohmann::json::array(); //!< Report items in input order.
	std::vector<std::string> warnings{};
};

//! Report entry for one image: source, mode, split_x (null if none), confidence, content_width_ratio, outputs, metadata.
nlohmann::json makeReportItem(const std::filesystem::path& source, const core::SplitResult& result, const std::vector<std::string>& outputs);

//! Summary block of the report.
nlohmann::json makeSummary(const BatchOutcome& outcome);

/*! Split every supported image below options.input and write pages plus report.
 *  Unreadable images, images that fail to process and output conflicts are recorded in BatchOutcome::warnings and do
 *  not stop the run. Sources sharing a file name write to the same page names: the first one in path order keeps them,
 *  later ones are reported without outputs. The result does not depend on options.workers.
 *  options.outputDir is not searched for input images.
 * \throws std::runtime_error if the input does not exist or the report cannot be written.
 */
BatchOutcome runBatch(const BatchOptions& options);

} // namespace mangasplit::batch
