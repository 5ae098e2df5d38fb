#include "keystone/core/pageRectifier.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>

namespace keystone::core {

namespace {

//! Enable per-candidate diagnostics via environment variable.
static bool markerDebugEnabled() {
	const char* env = std::getenv("KEYSTONE_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

//! Convert image to grayscale independent of channel format.
static bool convertToGray(const cv::Mat& image, cv::Mat& outGray) {
	if (image.channels() == 1) {
		outGray = image.clone();
		return true;
	}
	if (image.channels() == 3) {
		cv::cvtColor(image, outGray, cv::COLOR_BGR2GRAY);
		return true;
	}
	if (image.channels() == 4) {
		cv::cvtColor(image, outGray, cv::COLOR_BGRA2GRAY);
		return true;
	}
	return false;
}

static std::string_view sideName(const PageSide side) {
	return side == PageSide::Right ? "right" : "left";
}

static std::string joinIds(const std::vector<int>& ids) {
	std::ostringstream os;
	for (std::size_t i = 0u; i < ids.size(); ++i) {
		os << (i == 0u ? "" : ", ") << ids[i];
	}
	return os.str();
}

//! Outline and label every decoded glyph. Point 0 gets a dot.
static cv::Mat drawMarkers(const cv::Mat& gray, const MarkerSet& markers) {
	cv::Mat canvas;
	cv::cvtColor(gray, canvas, cv::COLOR_GRAY2BGR);
	for (const auto& [id, marker]: markers) {
		std::vector<cv::Point> poly;
		for (const auto& p: marker.points) {
			poly.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
		}
		cv::polylines(canvas, poly, true, cv::Scalar(0, 200, 0), 2);
		cv::circle(canvas, poly[0], 4, cv::Scalar(0, 0, 255), cv::FILLED);
		cv::putText(canvas, std::to_string(id), poly[0] + cv::Point(6, -6), cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(255, 0, 0), 2, cv::LINE_AA);
	}
	return canvas;
}

} // namespace

PageRectifier::PageRectifier(RectifierConfig config) : m_config{std::move(config)} {
}

PageRectifier::PageRectifier(const cv::Mat& image, RectifierConfig config) : m_config{std::move(config)} {
	loadImage(image);
}

void PageRectifier::loadImage(const cv::Mat& image, DebugVisualizer* debugger) {
	// Own copy: the marker set must keep describing the pixels that get warped.
	m_image = image.clone();
	buildMarkers(debugger);
}

void PageRectifier::buildMarkers(DebugVisualizer* debugger) {
	MarkerSet markers;
	std::vector<int> duplicates;

	const auto finish = [&]() {
		m_markers      = std::move(markers);
		m_duplicateIds = std::move(duplicates);
		if (debugger) {
			debugger->endStage();
		}
	};

	if (debugger) {
		debugger->beginStage("Find Markers");
	}

	if (m_image.empty()) {
		std::cerr << "[Error] No image loaded.\n";
		return finish();
	}

	cv::Mat gray;
	if (m_image.depth() != CV_8U || !convertToGray(m_image, gray)) {
		std::cerr << "[Error] Unsupported image format. Expected 8-bit with 1, 3 or 4 channels.\n";
		return finish();
	}

	const cv::Mat binary = thresholdInk(gray, m_config.squares);
	const auto squares   = findSquares(binary, m_config.squares);
	if (debugger) {
		debugger->add("Grayscale", gray);
		debugger->add("Threshold", binary);

		cv::Mat drawnSquares;
		cv::cvtColor(gray, drawnSquares, cv::COLOR_GRAY2BGR);
		cv::polylines(drawnSquares, squares, true, cv::Scalar(0, 0, 255), 2);
		debugger->add("Candidates", drawnSquares);
	}

	const bool verbose = markerDebugEnabled();
	for (std::size_t i = 0u; i < squares.size(); ++i) {
		MarkerDecodeResult decoded = decodeMarker(gray, squares[i], m_config.marker);
		if (!decoded.marker.has_value()) {
			if (verbose) {
				std::cout << "[marker-debug] candidate=" << i << " at " << squares[i][0] << " reject=" << failureText(decoded.failure) << '\n';
			}
			continue;
		}

		const int id = decoded.marker->id;
		if (verbose) {
			std::cout << "[marker-debug] candidate=" << i << " accept=" << *decoded.marker << " code=" << decoded.marker->rawCode << '\n';
		}
		if (markers.count(id) != 0u) {
			std::cerr << "[Warning] Marker " << id << " detected more than once. Keeping the later detection.\n";
			if (std::find(duplicates.begin(), duplicates.end(), id) == duplicates.end()) {
				duplicates.push_back(id);
			}
		}
		markers[id] = std::move(*decoded.marker);
	}

	std::sort(duplicates.begin(), duplicates.end());
	std::cout << "Decoded " << markers.size() << " markers from " << squares.size() << " candidates.\n";

	if (debugger) {
		debugger->add("Markers", drawMarkers(gray, markers));
	}
	finish();
}

std::vector<int> PageRectifier::findMissing(const std::array<MarkerTarget, MARKERS_PER_PAGE>& targets) const {
	std::vector<int> missing;
	for (const auto& target: targets) {
		if (m_markers.count(target.id) == 0u) {
			missing.push_back(target.id);
		}
	}
	return missing;
}

PageImage PageRectifier::warpPage(const LayoutInfo& layout, const PageSide side, DebugVisualizer* debugger) const {
	PageImage result{};

	if (!isValidLayout(layout)) {
		std::cerr << "[Error] Invalid layout " << layout << " for " << sideName(side) << " page.\n";
		return result;
	}

	const auto targets = layout.destinationMarkerPositions(side);
	result.missingIds  = findMissing(targets);
	if (!result.missingIds.empty()) {
		std::cerr << "[Error] Missing marker(s) " << joinIds(result.missingIds) << " for " << sideName(side) << " page.\n";
		return result;
	}

	std::vector<cv::Point2f> dstPoints;
	std::vector<cv::Point2f> srcPoints;
	for (const auto& target: targets) {
		dstPoints.emplace_back(layout.toPixel(target.position));
		srcPoints.push_back(m_markers.at(target.id).points[0]);
	}

	// Output frame -> source frame, so the warp runs as an inverse map.
	result.H = cv::findHomography(dstPoints, srcPoints);
	if (result.H.empty()) {
		std::cerr << "[Error] Degenerate marker positions for " << sideName(side) << " page.\n";
		return result;
	}

	cv::warpPerspective(m_image, result.image, result.H, layout.outputSize(), cv::INTER_LINEAR | cv::WARP_INVERSE_MAP);
	result.success = !result.image.empty();

	if (debugger) {
		debugger->beginStage(side == PageSide::Right ? "Warp Right Page" : "Warp Left Page");
		debugger->add("Warped", result.image);
		debugger->endStage();
	}
	return result;
}

PageSizeEstimate PageRectifier::estimatePageSize(const PageSide side) const {
	PageSizeEstimate estimate{};

	// Unit page: glyph corners at 0/1 coordinates.
	const auto targets  = LayoutInfo(Margins{}, 1.0, 1.0).destinationMarkerPositions(side);
	estimate.missingIds = findMissing(targets);
	if (!estimate.missingIds.empty()) {
		std::cerr << "[Error] Missing marker(s) " << joinIds(estimate.missingIds) << " for " << sideName(side) << " page size estimate.\n";
		return estimate;
	}

	std::vector<cv::Point2f> imagePoints;
	std::vector<cv::Point2f> unitPoints;
	for (const auto& target: targets) {
		imagePoints.push_back(m_markers.at(target.id).points[0]);
		unitPoints.emplace_back(target.position);
	}

	const cv::Mat H = cv::findHomography(imagePoints, unitPoints);
	if (H.empty()) {
		std::cerr << "[Error] Degenerate marker positions for " << sideName(side) << " page size estimate.\n";
		return estimate;
	}

	std::vector<double> widths;
	std::vector<double> heights;
	for (const auto& target: targets) {
		const auto& corners = m_markers.at(target.id).points;
		std::vector<cv::Point2f> tp;
		cv::perspectiveTransform(std::vector<cv::Point2f>(corners.begin(), corners.end()), tp, H);

		// Unrotated corners run top-left, bottom-left, bottom-right, top-right: edges 0-1/2-3 are heights.
		// A glyph mounted at 90 or 270 degrees swaps the pairs, so pick them by direction in the page frame.
		const cv::Point2f a0 = tp[1] - tp[0];
		const cv::Point2f a1 = tp[2] - tp[3];
		const cv::Point2f b0 = tp[3] - tp[0];
		const cv::Point2f b1 = tp[2] - tp[1];
		const bool swapped   = std::abs(a0.x) + std::abs(a1.x) > std::abs(b0.x) + std::abs(b1.x);

		const std::array<cv::Point2f, 2> widthEdges  = swapped ? std::array<cv::Point2f, 2>{a0, a1} : std::array<cv::Point2f, 2>{b0, b1};
		const std::array<cv::Point2f, 2> heightEdges = swapped ? std::array<cv::Point2f, 2>{b0, b1} : std::array<cv::Point2f, 2>{a0, a1};
		for (std::size_t k = 0u; k < 2u; ++k) {
			widths.push_back(cv::norm(widthEdges[k]));
			heights.push_back(cv::norm(heightEdges[k]));
		}
	}

	const SampleStats w = describe(widths);
	const SampleStats h = describe(heights);
	if (!(w.mean > 0.0) || !(h.mean > 0.0)) {
		std::cerr << "[Error] Degenerate marker sizes for " << sideName(side) << " page size estimate.\n";
		return estimate;
	}

	estimate.width        = m_config.markerSize / w.mean;
	estimate.height       = m_config.markerSize / h.mean;
	estimate.widthStdDev  = w.stddev;
	estimate.heightStdDev = h.stddev;
	estimate.success      = true;
	return estimate;
}

LayoutGuess PageRectifier::guessLayouts(const Margins& margins, const double dpi) const {
	LayoutGuess guess{};

	const PageSizeEstimate left  = estimatePageSize(PageSide::Left);
	const PageSizeEstimate right = estimatePageSize(PageSide::Right);

	guess.missingIds = left.missingIds;
	guess.missingIds.insert(guess.missingIds.end(), right.missingIds.begin(), right.missingIds.end());
	if (!left.success || !right.success) {
		return guess;
	}

	const double commonHeight = 0.5 * (left.height + right.height);
	guess.left                = LayoutInfo(margins, left.width, commonHeight, dpi);
	guess.right               = LayoutInfo(margins, right.width, commonHeight, dpi);
	guess.success             = true;
	return guess;
}

bool isValidPage(const PageImage& page) {
	return page.success && !page.image.empty() && !page.H.empty();
}

} // namespace keystone::core
