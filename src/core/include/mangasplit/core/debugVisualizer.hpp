#pragma once

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace mangasplit::core {

//! Single intermediate image of a pipeline stage.
struct DebugStep {
	std::string name; //!< Short label shown above the tile.
	cv::Mat image;    //!< Deep copy of the image produced by the step.
};

//! The split pipeline runs in stages (mask, metrics, projection, pages). Each stage collects its own steps.
struct DebugStage {
	std::string name;               //!< Name of the stage.
	std::vector<DebugStep> steps{}; //!< Steps in the order they were added.
};

//! Optional sink for intermediate images. Pass a pointer into the pipeline functions to record what every stage saw.
//! \note Not thread-safe. Use one visualizer per image.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< Start a new stage. Ends the active one.
	void add(std::string name, const cv::Mat& img); //!< Add a step image to the active stage.
	void endStage();                                //!< Close the active stage. No-op if none is active.

	//! Render all stages into one BGR image. One row per stage, one tile per step. Ends the active stage.
	//! \returns Empty matrix if nothing was recorded.
	cv::Mat buildMosaic(int tileWidth = 320);

	const std::vector<DebugStage>& stages() const; //!< Closed stages, in order.
	std::size_t stepCount() const;                 //!< Number of steps across all closed stages.
	void clear();

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	DebugStage m_currentStage{};        //!< Currently active stage.
	bool m_hasActiveStage{false};       //!< A stage is active.
	std::vector<DebugStage> m_stages{}; //!< Closed stages.
};

} // namespace mangasplit::core
