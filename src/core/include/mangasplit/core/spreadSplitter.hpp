#pragma once

#include "mangasplit/core/debugVisualizer.hpp"
#include "mangasplit/core/splitConfig.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core/mat.hpp>

#include <optional>
#include <string_view>
#include <vector>

// Splitting a scanned manga spread:
//   1) Foreground mask (buildForegroundMask): ink vs paper.
//   2) Content metrics (computeContentMetrics): tight ink box and coverage ratios.
//   3) Classification: not a spread / no ink -> Skip. Narrow tall content -> CoverTrim. Everything else goes on.
//   4) Gutter search (locateSplit). A weak or missing gutter falls back to the image centre.
//   5) Page extraction (extractSpreadPages): right page first, then left page.
namespace mangasplit::core {

//! How a spread was handled. Every mode is a regular outcome, not an error.
enum class SplitMode {
	Skip,           //!< Not spread shaped or no ink. No pages.
	CoverTrim,      //!< Single cover on a wide canvas. One page cropped to the content.
	Split,          //!< Gutter located with enough confidence. Two pages.
	FallbackCenter, //!< No trustworthy gutter. Two pages cut at width / 2.
};

//! Stable name used in reports: "skip", "cover-trim", "split", "fallback-center".
std::string_view toString(SplitMode mode);

//! Result of splitSpread(). Owns its pages.
struct SplitResult {
	SplitMode mode{SplitMode::Skip};
	std::optional<int> splitX{};    //!< Cut column for Split and FallbackCenter.
	double confidence{0.0};         //!< Trust in splitX. 1 for CoverTrim, 0 for Skip.
	double contentWidthRatio{0.0};  //!< Ink box width / image width. 0 when skipped.
	std::vector<cv::Mat> pages{};   //!< 0, 1 or 2 pages. Two pages are ordered right, left.
	nlohmann::json metadata = nlohmann::json::object(); //!< Diagnostics (reason, bbox, projection statistics, ...).
};

/*! Decide how to split a spread and extract the pages.
 * \param [in]     image    8 bit BGR, BGRA or gray image. Not modified.
 * \param [in]     config   Thresholds. Must satisfy isValidConfig().
 * \param [in,out] debugger Optional debug visualizer collecting the intermediate images of every stage.
 * \throws         InvalidInputError for zero area images, unsupported pixel formats or an invalid config.
 * \note           Pure function of its inputs. Safe to call concurrently on different images.
 */
SplitResult splitSpread(const cv::Mat& image, const SplitConfig& config = SplitConfig{}, DebugVisualizer* debugger = nullptr);

} // namespace mangasplit::core
