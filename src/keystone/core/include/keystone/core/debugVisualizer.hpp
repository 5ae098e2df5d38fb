#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace keystone::core {

//! One named intermediate image.
struct DebugStep {
	std::string name;
	cv::Mat image;
};

//! Images collected while one pipeline stage ran (e.g. "Find Markers").
struct DebugStage {
	std::string name;
	std::vector<DebugStep> steps{};
};

//! Optional sink for intermediate images. Pass a pointer into the pipeline to collect them.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< Starts a new stage, closing an open one.
	void add(std::string name, const cv::Mat& img); //!< Adds a copy of img to the open stage.
	void endStage();
	void clear();

	const std::vector<DebugStage>& stages() const { return m_stages; }

	//! One row per stage, one tile per step. Closes an open stage. Empty if nothing was collected.
	//! Tiles smaller than the label band are enlarged to fit it.
	cv::Mat buildMosaic(int tileSize = 320);

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	DebugStage m_currentStage{};
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{};
};

} // namespace keystone::core
