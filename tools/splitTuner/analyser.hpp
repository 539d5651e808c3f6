#pragma once

#include "pipelineStep.hpp"

#include "mangasplit/core/debugVisualizer.hpp"
#include "mangasplit/core/splitConfig.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>
#include <string>

namespace mangasplit {

//! Runs the split pipeline with the DebugVisualizer attached to the desired PipelineStep.
class Analyser {
public:
	explicit Analyser(cv::Mat image, core::SplitConfig config = {});

	//! Mosaic of the step, or an info tile if the step has nothing to show.
	cv::Mat analyse(const PipelineStep step) const;

	//! Record the images of one step.
	//! \returns Reason if the step has nothing to show for this image.
	std::optional<std::string> record(const PipelineStep step, core::DebugVisualizer& debugger) const;

	//! One line summary of the full splitSpread() run. Shown in the status bar.
	std::string summary() const;

private:
	cv::Mat m_original;
	core::SplitConfig m_config;
};

} // namespace mangasplit
