#pragma once

#include <opencv2/core/types.hpp>

#include <array>
#include <ostream>

namespace keystone::core {

//! Which page of the spread. Left uses glyphs 0-3, right uses glyphs 4-7.
enum class PageSide { Left, Right };

//! Number of glyphs framing one page.
static constexpr int MARKERS_PER_PAGE = 4;

//! Crop offsets in page units. Positive values move the crop edge right/down.
struct Margins {
	double left{0.0};
	double top{0.0};
	double right{0.0};
	double bottom{0.0};
};

//! A glyph id and the page position of its first corner.
struct MarkerTarget {
	int id;
	cv::Point2d position;
};

/*! Physical page frame to output pixel frame.
 *  The page frame has its origin at the first corner of the top-left glyph and uses the unit of width/height (inches
 *  usually). The crop rectangle is [left, width + right] x [top, height + bottom] and is sampled at dpi.
 */
class LayoutInfo {
public:
	LayoutInfo() = default;
	LayoutInfo(const Margins& margins, double width, double height, double dpi = 600.0);

	//! Page frame targets for the glyphs of one side, in clockwise order from the top-left.
	std::array<MarkerTarget, MARKERS_PER_PAGE> destinationMarkerPositions(PageSide side) const;

	//! Page frame -> output pixel frame.
	cv::Point2d toPixel(const cv::Point2d& point) const;

	//! Output image size, each dimension rounded to the nearest pixel.
	cv::Size outputSize() const;

	double left() const { return m_left; }
	double top() const { return m_top; }
	double right() const { return m_right; }
	double bottom() const { return m_bottom; }
	double width() const { return m_width; }
	double height() const { return m_height; }
	double dpi() const { return m_dpi; }

private:
	double m_left{0.0};
	double m_top{0.0};
	double m_right{0.0};  //!< Right crop bound (offset + width).
	double m_bottom{0.0}; //!< Bottom crop bound (offset + height).
	double m_width{0.0};
	double m_height{0.0};
	double m_dpi{0.0};
};

//! Positive size and resolution, non-empty output.
bool isValidLayout(const LayoutInfo& layout);

//! First glyph id of a side.
int firstMarkerId(PageSide side);

std::ostream& operator<<(std::ostream& os, const LayoutInfo& layout);

} // namespace keystone::core
