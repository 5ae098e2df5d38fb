#pragma once

#include "keystone/core/debugVisualizer.hpp"
#include "keystone/core/layoutInfo.hpp"
#include "keystone/core/marker.hpp"
#include "keystone/core/squareFinder.hpp"

#include <opencv2/core/mat.hpp>

#include <array>
#include <map>
#include <vector>

namespace keystone::core {

//! Decoded glyphs of one image, keyed by id.
using MarkerSet = std::map<int, Marker>;

//! Full rectifier configuration.
struct RectifierConfig {
	SquareFinderConfig squares{};
	MarkerConfig marker{};
	double markerSize{0.5}; //!< Printed glyph edge length in page units.
};

//! Rectified page. On failure the image is empty and missingIds lists the absent glyphs.
struct PageImage {
	bool success{false};
	cv::Mat image;               //!< Output page, size == layout.outputSize().
	cv::Mat H;                   //!< Output pixel -> source pixel.
	std::vector<int> missingIds; //!< Sorted required ids not found in the image.
};

//! Page size inferred from glyph geometry.
struct PageSizeEstimate {
	bool success{false};
	double width{0.0};           //!< Page width in glyph units (markerSize based).
	double height{0.0};
	double widthStdDev{0.0};     //!< Spread of the 8 raw glyph width measurements (unit square frame).
	double heightStdDev{0.0};
	std::vector<int> missingIds;
};

//! Layouts for both sides from estimated sizes. Both share the averaged height.
struct LayoutGuess {
	bool success{false};
	LayoutInfo left{};
	LayoutInfo right{};
	std::vector<int> missingIds; //!< Union over both sides.
};

/*! Finds the glyphs framing a book spread and rectifies each page.
 *  Process:
 *   - loadImage() thresholds the image, collects quadrilateral candidates and decodes them into a MarkerSet. The set is
 *     replaced as a whole on every call.
 *   - warpPage() maps the four glyphs of one side to the corners of a LayoutInfo and warps the photo into it.
 *   - estimatePageSize()/guessLayouts() are used when the physical page size is unknown.
 */
class PageRectifier {
public:
	explicit PageRectifier(RectifierConfig config = RectifierConfig{});
	explicit PageRectifier(const cv::Mat& image, RectifierConfig config = RectifierConfig{});

	//! Copy a new source image (8-bit, 1/3/4 channels) and rebuild the marker set.
	void loadImage(const cv::Mat& image, DebugVisualizer* debugger = nullptr);

	const cv::Mat& image() const { return m_image; }
	const MarkerSet& markers() const { return m_markers; }
	const std::vector<int>& duplicateIds() const { return m_duplicateIds; }
	const RectifierConfig& config() const { return m_config; }

	//! Warp one side of the spread into the layout's output frame.
	PageImage warpPage(const LayoutInfo& layout, PageSide side, DebugVisualizer* debugger = nullptr) const;

	//! Infer width/height of one page from the glyph sizes. Unit is the one of markerSize.
	PageSizeEstimate estimatePageSize(PageSide side) const;

	//! Estimate both sides and build layouts with the given margins and dpi.
	LayoutGuess guessLayouts(const Margins& margins = Margins{0.0, 0.5, 0.5, 0.5}, double dpi = 600.0) const;

private:
	void buildMarkers(DebugVisualizer* debugger);
	std::vector<int> findMissing(const std::array<MarkerTarget, MARKERS_PER_PAGE>& targets) const;

private:
	RectifierConfig m_config;
	cv::Mat m_image;                  //!< Source image as loaded.
	MarkerSet m_markers{};            //!< Rebuilt by loadImage().
	std::vector<int> m_duplicateIds{}; //!< Ids decoded more than once in the current image.
};

bool isValidPage(const PageImage& page);

} // namespace keystone::core
