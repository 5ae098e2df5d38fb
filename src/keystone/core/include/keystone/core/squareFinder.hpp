#pragma once

#include <opencv2/core/mat.hpp>

#include <vector>

namespace keystone::core {

//! Filter bands for glyph candidates. Areas are fractions of the full image area so they hold across resolutions.
struct SquareFinderConfig {
	double minArea{0.0001};         //!< Exclusive lower bound of contour area / image area.
	double maxArea{0.001};          //!< Exclusive upper bound of contour area / image area.
	double maxRatio{2.2};           //!< Bounding box aspect must lie in (1/maxRatio, maxRatio).
	double approxEpsilon{0.02};     //!< Polygon approximation tolerance as fraction of the perimeter.
	int thresholdBlockSize{31};     //!< Adaptive threshold neighbourhood (odd).
	double thresholdOffset{8.0};    //!< Constant subtracted from the neighbourhood mean.
};

//! Inverted adaptive mean threshold. Ink becomes foreground (non-zero).
cv::Mat thresholdInk(const cv::Mat& gray, const SquareFinderConfig& config = SquareFinderConfig{});

/*! Find convex quadrilaterals in a binary image that could be glyphs.
 * \param [in] binary Binary image as produced by thresholdInk().
 * \return     Four-point polygons in contour order. The order of the list carries no meaning.
 */
std::vector<std::vector<cv::Point>> findSquares(const cv::Mat& binary, const SquareFinderConfig& config = SquareFinderConfig{});

} // namespace keystone::core
