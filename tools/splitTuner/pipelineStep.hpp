#pragma once

#include <array>
#include <string_view>

namespace mangasplit {

//! Pipeline stage whose intermediate images the tuner shows.
enum class PipelineStep {
	Mask,       //!< Foreground mask construction.
	Metrics,    //!< Ink box on top of the spread.
	Projection, //!< Column projection and the located gutter.
	Pages,      //!< Extracted pages.
	All,        //!< Full splitSpread() run.
};

inline constexpr std::array<PipelineStep, 5> PIPELINE_STEPS = {PipelineStep::Mask, PipelineStep::Metrics, PipelineStep::Projection,
                                                               PipelineStep::Pages, PipelineStep::All};

constexpr std::string_view toLabel(const PipelineStep step) {
	switch (step) {
	case PipelineStep::Mask:
		return "Foreground Mask";
	case PipelineStep::Metrics:
		return "Content Metrics";
	case PipelineStep::Projection:
		return "Projection";
	case PipelineStep::Pages:
		return "Pages";
	case PipelineStep::All:
		return "All";
	}
	return "";
}

} // namespace mangasplit
