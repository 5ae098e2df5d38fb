#pragma once

#include "keystone/core/layoutInfo.hpp"
#include "keystone/core/pageRectifier.hpp"

#include <QStringList>

#include <array>
#include <filesystem>
#include <ostream>
#include <string>

namespace keystone::cli {

//! Per page settings from the command line.
struct SideOptions {
	bool enabled{true};
	core::Margins offsets{};
	std::filesystem::path output;
};

//! Validated command line.
struct CliOptions {
	std::filesystem::path input;
	double pageWidth{6.0};
	double pageHeight{9.5};
	double dpi{600.0};
	bool guessSize{false};
	bool offsetsGiven{false}; //!< At least one offset option was passed explicitly.
	bool verbose{false};
	std::filesystem::path debugMosaic; //!< Empty if no mosaic is requested.
	std::array<SideOptions, 2> sides{}; //!< Indexed by PageSide.
};

enum class ParseStatus { Ok, Help, Version, Error };

struct ParseResult {
	ParseStatus status{ParseStatus::Error};
	CliOptions options{};
	std::string message; //!< Error description, or the help text for ParseStatus::Help.
};

//! Parse and validate arguments (first entry is the program name). Checks the file system for input/output paths.
ParseResult parseOptions(const QStringList& arguments);

//! True for file extensions OpenCV can read and write (case insensitive).
bool isSupportedImage(const std::filesystem::path& path);

//! Layout of one side from explicit page size and the side's offsets.
core::LayoutInfo layoutFor(const CliOptions& options, core::PageSide side, double width, double height);

const SideOptions& sideOptions(const CliOptions& options, core::PageSide side);

/*! Layouts of both sides, indexed by PageSide. Without --guess-size they come from the page size options.
 *  With it, the sizes are estimated from the glyphs of the enabled sides only, so a disabled side never needs its glyphs.
 *  Explicit offsets replace the default guess margins.
 */
bool resolveLayouts(const CliOptions& options, const core::PageRectifier& rectifier, std::array<core::LayoutInfo, 2>& outLayouts);

std::ostream& operator<<(std::ostream& os, const CliOptions& options);

} // namespace keystone::cli
