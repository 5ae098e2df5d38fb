#include "keystone/core/marker.hpp"

#include <algorithm>
#include <array>

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>

namespace keystone::core {

namespace {

//! Payload code -> canonical id. Glyph ids on the printed sheet are not assigned in code order.
static constexpr std::array<int, 16> ID_LOOKUP = {8, 2, 4, 15, 6, 13, 11, 1, 0, 10, 12, 7, 14, 5, 3, 9};

//! Orientation cells in the 6x6 grid.
static constexpr int NEAR = 1;
static constexpr int FAR  = GLYPH_GRID - 2;

static bool isBlack(const cv::Mat& grid, int row, int col) {
	return grid.at<uchar>(row, col) == 0;
}

static bool hasBlackBorder(const cv::Mat& grid) {
	for (int i = 0; i < GLYPH_GRID; ++i) {
		if (!isBlack(grid, 0, i) || !isBlack(grid, GLYPH_GRID - 1, i) || !isBlack(grid, i, 0) || !isBlack(grid, i, GLYPH_GRID - 1)) {
			return false;
		}
	}
	return true;
}

//! Inner ring without its four corner (orientation) cells.
static bool hasWhiteInner(const cv::Mat& grid) {
	for (int i = NEAR + 1; i < FAR; ++i) {
		if (isBlack(grid, NEAR, i) || isBlack(grid, FAR, i) || isBlack(grid, i, NEAR) || isBlack(grid, i, FAR)) {
			return false;
		}
	}
	return true;
}

static std::optional<RotationClass> findOrientation(const cv::Mat& grid) {
	const bool topLeft     = isBlack(grid, NEAR, NEAR);
	const bool topRight    = isBlack(grid, NEAR, FAR);
	const bool bottomRight = isBlack(grid, FAR, FAR);
	const bool bottomLeft  = isBlack(grid, FAR, NEAR);

	if (topLeft + topRight + bottomRight + bottomLeft != 1) {
		return std::nullopt;
	}

	if (topRight) {
		return RotationClass::Rot90;
	}
	if (bottomRight) {
		return RotationClass::Rot180;
	}
	if (bottomLeft) {
		return RotationClass::Rot270;
	}
	return RotationClass::Rot0;
}

//! Rotate so the orientation cell ends up top-left.
static cv::Mat normalizeGrid(const cv::Mat& grid, RotationClass rotation) {
	cv::Mat out;
	switch (rotation) {
	case RotationClass::Rot0:
		out = grid.clone();
		break;
	case RotationClass::Rot90:
		cv::rotate(grid, out, cv::ROTATE_90_COUNTERCLOCKWISE);
		break;
	case RotationClass::Rot180:
		cv::rotate(grid, out, cv::ROTATE_180);
		break;
	case RotationClass::Rot270:
		cv::rotate(grid, out, cv::ROTATE_90_CLOCKWISE);
		break;
	}
	return out;
}

//! Central 2x2 payload, 1 = black.
static cv::Mat payloadBits(const cv::Mat& normalized) {
	cv::Mat bits(2, 2, CV_8U);
	for (int r = 0; r < 2; ++r) {
		for (int c = 0; c < 2; ++c) {
			bits.at<uchar>(r, c) = isBlack(normalized, NEAR + 1 + r, NEAR + 1 + c) ? 1u : 0u;
		}
	}
	return bits;
}

static int packBits(const cv::Mat& bits) {
	int code = 0;
	for (int r = 0; r < 2; ++r) {
		for (int c = 0; c < 2; ++c) {
			code = (code << 1) | (bits.at<uchar>(r, c) != 0 ? 1 : 0);
		}
	}
	return code;
}

static bool insideImage(const std::vector<cv::Point>& candidate, const cv::Size size) {
	return std::all_of(candidate.begin(), candidate.end(),
	                   [&](const cv::Point& p) { return p.x >= 0 && p.y >= 0 && p.x < size.width && p.y < size.height; });
}

} // namespace

int markerIdFromCode(const int rawCode) {
	CV_Assert(rawCode >= 0 && rawCode < static_cast<int>(ID_LOOKUP.size()));
	return ID_LOOKUP[static_cast<std::size_t>(rawCode)];
}

int markerCodeFromId(const int id) {
	const auto it = std::find(ID_LOOKUP.begin(), ID_LOOKUP.end(), id);
	CV_Assert(it != ID_LOOKUP.end());
	return static_cast<int>(it - ID_LOOKUP.begin());
}

GridDecodeResult decodeGrid(const cv::Mat& grid) {
	CV_Assert(grid.type() == CV_8UC1 && grid.rows == GLYPH_GRID && grid.cols == GLYPH_GRID);

	GridDecodeResult result{};
	if (!hasBlackBorder(grid)) {
		result.failure = DecodeFailure::NoBlackBorder;
		return result;
	}
	if (!hasWhiteInner(grid)) {
		result.failure = DecodeFailure::NoWhiteInner;
		return result;
	}

	const auto rotation = findOrientation(grid);
	if (!rotation.has_value()) {
		result.failure = DecodeFailure::AmbiguousOrientation;
		return result;
	}

	result.rotation   = *rotation;
	result.normalized = normalizeGrid(grid, *rotation);
	result.rawCode    = packBits(payloadBits(result.normalized));
	result.id         = markerIdFromCode(result.rawCode);
	return result;
}

MarkerDecodeResult decodeMarker(const cv::Mat& gray, const std::vector<cv::Point>& candidate, const MarkerConfig& config) {
	CV_Assert(gray.type() == CV_8UC1);

	if (candidate.size() != 4u || !insideImage(candidate, gray.size())) {
		return {std::nullopt, DecodeFailure::InvalidCandidate};
	}

	std::vector<cv::Point2f> corners(candidate.begin(), candidate.end());
	const cv::TermCriteria term(cv::TermCriteria::EPS | cv::TermCriteria::COUNT, config.subPixMaxIter, config.subPixEpsilon);
	cv::cornerSubPix(gray, corners, cv::Size(config.subPixWindow, config.subPixWindow), cv::Size(-1, -1), term);

	// Contours run down the left edge first, so this keeps the patch unmirrored.
	const auto size                    = static_cast<float>(config.patchSize);
	const std::vector<cv::Point2f> dst = {{0.f, 0.f}, {0.f, size}, {size, size}, {size, 0.f}};

	cv::Mat H = cv::findHomography(corners, dst);
	if (H.empty()) {
		return {std::nullopt, DecodeFailure::InvalidCandidate};
	}

	cv::Mat patch;
	cv::warpPerspective(gray, patch, H, cv::Size(config.patchSize, config.patchSize));

	cv::Mat sampled;
	cv::resize(patch, sampled, cv::Size(GLYPH_GRID, GLYPH_GRID));

	cv::Mat grid;
	cv::threshold(sampled, grid, 0.0, 255.0, cv::THRESH_BINARY | cv::THRESH_OTSU);

	GridDecodeResult decoded = decodeGrid(grid);
	if (decoded.failure != DecodeFailure::None) {
		return {std::nullopt, decoded.failure};
	}

	Marker marker{};
	marker.id       = decoded.id;
	marker.rawCode  = decoded.rawCode;
	marker.rotation = decoded.rotation;
	marker.bits     = payloadBits(decoded.normalized);
	marker.H        = H;

	const auto shift = static_cast<std::size_t>(decoded.rotation);
	for (std::size_t i = 0u; i < 4u; ++i) {
		marker.points[i] = corners[(i + 4u - shift) % 4u];
	}

	return {std::move(marker), DecodeFailure::None};
}

std::string_view rotationText(const RotationClass rotation) {
	switch (rotation) {
	case RotationClass::Rot0:
		return "0°";
	case RotationClass::Rot90:
		return "90°";
	case RotationClass::Rot180:
		return "180°";
	case RotationClass::Rot270:
		return "270°";
	}
	return "?";
}

std::string_view failureText(const DecodeFailure failure) {
	switch (failure) {
	case DecodeFailure::None:
		return "none";
	case DecodeFailure::InvalidCandidate:
		return "invalid candidate";
	case DecodeFailure::NoBlackBorder:
		return "no black border";
	case DecodeFailure::NoWhiteInner:
		return "no white inner";
	case DecodeFailure::AmbiguousOrientation:
		return "ambiguous orientation";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Marker& marker) {
	return os << '#' << marker.id << ' ' << rotationText(marker.rotation);
}

} // namespace keystone::core
