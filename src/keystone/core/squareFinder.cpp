#include "keystone/core/squareFinder.hpp"

#include <opencv2/imgproc.hpp>

namespace keystone::core {

namespace {

//! Foreground value of the threshold image. Anything non-zero works for findContours.
static constexpr double INK_VALUE = 128.0;

static bool isAreaInBand(const std::vector<cv::Point>& contour, const double fullArea, const SquareFinderConfig& config) {
	const double area = cv::contourArea(contour) / fullArea;
	return config.minArea < area && area < config.maxArea;
}

static bool isAspectInBand(const std::vector<cv::Point>& contour, const SquareFinderConfig& config) {
	const cv::Rect box = cv::boundingRect(contour);
	if (box.height == 0) {
		return false;
	}
	const double ratio = static_cast<double>(box.width) / static_cast<double>(box.height);
	return 1.0 / config.maxRatio < ratio && ratio < config.maxRatio;
}

} // namespace

cv::Mat thresholdInk(const cv::Mat& gray, const SquareFinderConfig& config) {
	cv::Mat binary;
	cv::adaptiveThreshold(gray, binary, INK_VALUE, cv::ADAPTIVE_THRESH_MEAN_C, cv::THRESH_BINARY_INV, config.thresholdBlockSize, config.thresholdOffset);
	return binary;
}

std::vector<std::vector<cv::Point>> findSquares(const cv::Mat& binary, const SquareFinderConfig& config) {
	std::vector<std::vector<cv::Point>> candidates;
	if (binary.empty()) {
		return candidates;
	}

	const double fullArea = static_cast<double>(binary.rows) * static_cast<double>(binary.cols);

	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(binary.clone(), contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

	std::vector<cv::Point> polygon;
	for (const auto& contour: contours) {
		if (contour.size() < 4u) {
			continue;
		}
		if (!isAreaInBand(contour, fullArea, config) || !isAspectInBand(contour, config)) {
			continue;
		}

		const double perimeter = cv::arcLength(contour, true);
		cv::approxPolyDP(contour, polygon, perimeter * config.approxEpsilon, true);
		if (polygon.size() == 4u && cv::isContourConvex(polygon)) {
			candidates.push_back(polygon);
		}
	}

	return candidates;
}

} // namespace keystone::core
