#pragma once

#include <opencv2/core/mat.hpp>

#include <array>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace keystone::core {

//! Number of cells along one edge of a glyph (border ring included).
static constexpr int GLYPH_GRID = 6;

//! Rotation that was undone to bring the orientation cell to the top-left.
enum class RotationClass { Rot0, Rot90, Rot180, Rot270 };

//! Reason a candidate quadrilateral is not a glyph.
enum class DecodeFailure {
	None,
	InvalidCandidate,     //!< Not 4 points or no usable image patch.
	NoBlackBorder,        //!< Outer ring of the 6x6 grid is not entirely black.
	NoWhiteInner,         //!< Inner ring (orientation cells excluded) is not entirely white.
	AmbiguousOrientation, //!< Zero or more than one orientation cell is black.
};

//! Parameters for rectifying and sampling one candidate.
struct MarkerConfig {
	int patchSize{180};        //!< Edge length of the canonical square patch in pixels.
	int subPixWindow{3};       //!< Half size of the cornerSubPix search window.
	int subPixMaxIter{20};     //!< Termination: maximal iterations of the corner refinement.
	double subPixEpsilon{0.03}; //!< Termination: corner movement below which refinement stops.
};

//! One identified, rotation normalised glyph.
struct Marker {
	int id{-1};                            //!< Canonical glyph id in [0, 15].
	int rawCode{0};                        //!< 4-bit payload code before the id permutation.
	RotationClass rotation{RotationClass::Rot0};
	cv::Mat bits;                          //!< 2x2 CV_8U payload, 1 = black.
	std::array<cv::Point2f, 4> points{};   //!< Refined corners. points[0] is the corner next to the orientation cell.
	cv::Mat H;                             //!< Homography from the candidate quad to the canonical patch.
};

//! Outcome of decoding one candidate. Exactly one of marker/failure is set.
struct MarkerDecodeResult {
	std::optional<Marker> marker;
	DecodeFailure failure{DecodeFailure::None};
};

//! Grid level decode: structure check, orientation and id lookup on a binarised 6x6 grid.
struct GridDecodeResult {
	DecodeFailure failure{DecodeFailure::None};
	RotationClass rotation{RotationClass::Rot0};
	int rawCode{0};
	int id{-1};
	cv::Mat normalized; //!< The grid after undoing the rotation.
};

/*! Decode a binarised glyph grid.
 * \param [in] grid 6x6 CV_8UC1 grid, 0 = black and anything else = white.
 * \return     Rotation, payload code and id, or the failure kind.
 */
GridDecodeResult decodeGrid(const cv::Mat& grid);

/*! Decode one candidate quadrilateral into a glyph.
 *  Corners are refined to sub-pixel accuracy, the patch is rectified to a square, sampled down to the 6x6 grid and
 *  binarised with Otsu before decodeGrid() runs on it.
 * \param [in] gray      8-bit single channel source image.
 * \param [in] candidate Four corners in contour order.
 * \param [in] config    Sampling and refinement parameters.
 */
MarkerDecodeResult decodeMarker(const cv::Mat& gray, const std::vector<cv::Point>& candidate, const MarkerConfig& config = MarkerConfig{});

//! Canonical id of a 4-bit payload code. Codes are packed in raster order, top-left cell is the most significant bit.
int markerIdFromCode(int rawCode);

//! Inverse of markerIdFromCode().
int markerCodeFromId(int id);

std::string_view rotationText(RotationClass rotation);
std::string_view failureText(DecodeFailure failure);

std::ostream& operator<<(std::ostream& os, const Marker& marker);

} // namespace keystone::core
