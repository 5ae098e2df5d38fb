#include "keystone/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace keystone::core {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}
	m_stages.push_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		std::cerr << "[Warning] Debug image '" << name << "' added outside of a stage. Ignored.\n";
		return;
	}
	m_currentStage.steps.push_back(DebugStep{std::move(name), img.clone()});
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic(const int requestedTileSize) {
	static constexpr int HEADER_W = 220;
	static constexpr int LABEL_H  = 24;
	static constexpr int PAD      = 4;

	static const cv::Scalar BG(20, 20, 20);
	static const cv::Scalar FG(255, 255, 255);

	// Room for the label and at least one image row.
	const int tileSize = std::max(requestedTileSize, LABEL_H + 2 * PAD + 1);

	endStage();

	std::size_t maxSteps = 0u;
	for (const auto& stage: m_stages) {
		maxSteps = std::max(maxSteps, stage.steps.size());
	}
	if (maxSteps == 0u) {
		return {};
	}

	const int rows = static_cast<int>(m_stages.size());
	const int cols = static_cast<int>(maxSteps);
	cv::Mat mosaic(rows * tileSize, HEADER_W + cols * tileSize, CV_8UC3, BG);

	for (int r = 0; r < rows; ++r) {
		const auto& stage = m_stages[static_cast<std::size_t>(r)];
		const int y       = r * tileSize;
		cv::putText(mosaic, stage.name, cv::Point(PAD * 2, y + tileSize / 2), cv::FONT_HERSHEY_SIMPLEX, 0.6, FG, 1, cv::LINE_AA);

		for (std::size_t s = 0u; s < stage.steps.size(); ++s) {
			const auto& step = stage.steps[s];
			cv::Mat cell     = mosaic(cv::Rect(HEADER_W + static_cast<int>(s) * tileSize, y, tileSize, tileSize));
			cv::putText(cell, step.name, cv::Point(PAD, LABEL_H - 8), cv::FONT_HERSHEY_SIMPLEX, 0.5, FG, 1, cv::LINE_AA);

			if (step.image.empty()) {
				continue;
			}

			const int availW   = tileSize - 2 * PAD;
			const int availH   = tileSize - LABEL_H - 2 * PAD;
			const cv::Mat vis  = toBgr8U(step.image);
			const double scale = std::min(static_cast<double>(availW) / vis.cols, static_cast<double>(availH) / vis.rows);
			const int w        = std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, availW);
			const int h        = std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, availH);

			cv::Mat resized;
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
			resized.copyTo(cell(cv::Rect(PAD + (availW - w) / 2, LABEL_H + PAD + (availH - h) / 2, w, h)));
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;
	if (in.depth() != CV_8U) {
		cv::normalize(in, out, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

} // namespace keystone::core
