#include "keystone/core/layoutInfo.hpp"

#include <cmath>

namespace keystone::core {

LayoutInfo::LayoutInfo(const Margins& margins, const double width, const double height, const double dpi)
    : m_left{margins.left}, m_top{margins.top}, m_right{margins.right + width}, m_bottom{margins.bottom + height}, m_width{width}, m_height{height},
      m_dpi{dpi} {
}

std::array<MarkerTarget, MARKERS_PER_PAGE> LayoutInfo::destinationMarkerPositions(const PageSide side) const {
	const int first = firstMarkerId(side);
	return {{
	        {first + 0, {0.0, 0.0}},
	        {first + 1, {m_width, 0.0}},
	        {first + 2, {m_width, m_height}},
	        {first + 3, {0.0, m_height}},
	}};
}

cv::Point2d LayoutInfo::toPixel(const cv::Point2d& point) const {
	return {(point.x - m_left) * m_dpi, (point.y - m_top) * m_dpi};
}

cv::Size LayoutInfo::outputSize() const {
	return {static_cast<int>(std::lround((m_right - m_left) * m_dpi)), static_cast<int>(std::lround((m_bottom - m_top) * m_dpi))};
}

bool isValidLayout(const LayoutInfo& layout) {
	if (!(layout.dpi() > 0.0) || !(layout.width() > 0.0) || !(layout.height() > 0.0)) {
		return false;
	}
	const cv::Size size = layout.outputSize();
	return size.width > 0 && size.height > 0;
}

int firstMarkerId(const PageSide side) {
	return side == PageSide::Right ? MARKERS_PER_PAGE : 0;
}

std::ostream& operator<<(std::ostream& os, const LayoutInfo& layout) {
	return os << "LayoutInfo(" << layout.left() << ',' << layout.top() << ',' << layout.right() << ',' << layout.bottom() << ',' << layout.width() << ','
	          << layout.height() << ',' << layout.dpi() << ')';
}

} // namespace keystone::core
