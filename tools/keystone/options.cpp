#include "options.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>

namespace keystone::cli {

namespace {

static constexpr std::array<std::string_view, 15> IMAGE_EXTENSIONS = {"bmp", "dib", "jpg",  "jpeg", "jpe", "jp2", "png", "webp",
                                                                      "pbm", "pgm", "ppm", "sr",   "ras", "tiff", "tif"};

static constexpr double MAX_DPI = 1200.0;

//! Margins used for guessed layouts when no offset is given.
static constexpr core::Margins GUESS_MARGINS{0.0, 0.5, 0.5, 0.5};

//! One offset option per side and edge.
struct OffsetOption {
	core::PageSide side;
	double core::Margins::*edge;
	const char* name;
};

static const std::array<OffsetOption, 8> OFFSET_OPTIONS = {{
        {core::PageSide::Left, &core::Margins::left, "offset-left-page-left-side"},
        {core::PageSide::Left, &core::Margins::right, "offset-left-page-right-side"},
        {core::PageSide::Left, &core::Margins::top, "offset-left-page-top-side"},
        {core::PageSide::Left, &core::Margins::bottom, "offset-left-page-bottom-side"},
        {core::PageSide::Right, &core::Margins::left, "offset-right-page-left-side"},
        {core::PageSide::Right, &core::Margins::right, "offset-right-page-right-side"},
        {core::PageSide::Right, &core::Margins::top, "offset-right-page-top-side"},
        {core::PageSide::Right, &core::Margins::bottom, "offset-right-page-bottom-side"},
}};

static std::size_t sideIndex(const core::PageSide side) {
	return side == core::PageSide::Right ? 1u : 0u;
}

static std::optional<double> toDouble(const QString& text) {
	bool ok             = false;
	const double value  = text.toDouble(&ok);
	return ok ? std::optional<double>(value) : std::nullopt;
}

static std::filesystem::path toPath(const QString& text) {
	return std::filesystem::path(text.toStdString());
}

static ParseResult fail(std::string message) {
	return {ParseStatus::Error, CliOptions{}, std::move(message)};
}

} // namespace

bool isSupportedImage(const std::filesystem::path& path) {
	std::string ext = path.extension().string();
	if (!ext.empty() && ext.front() == '.') {
		ext.erase(0, 1);
	}
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return std::find(IMAGE_EXTENSIONS.begin(), IMAGE_EXTENSIONS.end(), ext) != IMAGE_EXTENSIONS.end();
}

const SideOptions& sideOptions(const CliOptions& options, const core::PageSide side) {
	return options.sides[sideIndex(side)];
}

core::LayoutInfo layoutFor(const CliOptions& options, const core::PageSide side, const double width, const double height) {
	return core::LayoutInfo(sideOptions(options, side).offsets, width, height, options.dpi);
}

bool resolveLayouts(const CliOptions& options, const core::PageRectifier& rectifier, std::array<core::LayoutInfo, 2>& outLayouts) {
	static constexpr std::array<core::PageSide, 2> SIDES = {core::PageSide::Left, core::PageSide::Right};

	if (!options.guessSize) {
		for (const core::PageSide side: SIDES) {
			outLayouts[sideIndex(side)] = layoutFor(options, side, options.pageWidth, options.pageHeight);
		}
		return true;
	}

	if (options.sides[0].enabled && options.sides[1].enabled) {
		const core::LayoutGuess guess = rectifier.guessLayouts(GUESS_MARGINS, options.dpi);
		if (!guess.success) {
			std::cerr << "[Error] Could not estimate the page size.\n";
			return false;
		}
		std::cout << "Estimated page size: left " << guess.left.width() << " x " << guess.left.height() << ", right " << guess.right.width()
		          << " x " << guess.right.height() << "\n";

		outLayouts = {guess.left, guess.right};
		if (options.offsetsGiven) {
			for (const core::PageSide side: SIDES) {
				const core::LayoutInfo& guessed = outLayouts[sideIndex(side)];
				outLayouts[sideIndex(side)]     = layoutFor(options, side, guessed.width(), guessed.height());
			}
		}
		return true;
	}

	// A single page is sized from its own glyphs.
	for (const core::PageSide side: SIDES) {
		if (!sideOptions(options, side).enabled) {
			continue;
		}
		const core::PageSizeEstimate estimate = rectifier.estimatePageSize(side);
		if (!estimate.success) {
			std::cerr << "[Error] Could not estimate the page size.\n";
			return false;
		}
		std::cout << "Estimated page size: " << (side == core::PageSide::Left ? "left " : "right ") << estimate.width << " x " << estimate.height
		          << "\n";

		outLayouts[sideIndex(side)] = options.offsetsGiven ? layoutFor(options, side, estimate.width, estimate.height)
		                                                   : core::LayoutInfo(GUESS_MARGINS, estimate.width, estimate.height, options.dpi);
	}
	return true;
}

ParseResult parseOptions(const QStringList& arguments) {
	QCommandLineParser parser;
	parser.setApplicationDescription("Detects the glyphs framing a two page book spread, removes the keystone distortion and writes "
	                                 "each page as a separate, cropped image of known physical size.");
	const QCommandLineOption helpOption    = parser.addHelpOption();
	const QCommandLineOption versionOption = parser.addVersionOption();

	const QCommandLineOption inputOption({"i", "input-image"}, "The input image.", "input_image");
	const QCommandLineOption widthOption({"w", "page-width"}, "Width of each page (in any unit).", "page_width", "6.0");
	const QCommandLineOption heightOption({"t", "page-height"}, "Height of each page (in the unit of the width).", "page_height", "9.5");
	const QCommandLineOption dpiOption({"d", "dpi"}, "Resolution of the output images.", "dpi", "600.0");
	const QCommandLineOption noLeftOption("no-left-page", "Only process the right page (glyphs 4-7).");
	const QCommandLineOption noRightOption("no-right-page", "Only process the left page (glyphs 0-3).");
	const QCommandLineOption guessOption("guess-size", "Estimate page width and height from the glyph sizes.");
	const QCommandLineOption verboseOption("verbose", "Print every option value and the page layouts.");
	const QCommandLineOption mosaicOption("debug-mosaic", "Write intermediate images as one mosaic.", "file");

	for (const auto& option: {inputOption, widthOption, heightOption, dpiOption, noLeftOption, noRightOption, guessOption, verboseOption, mosaicOption}) {
		parser.addOption(option);
	}

	std::vector<QCommandLineOption> offsetOptions;
	for (const auto& offset: OFFSET_OPTIONS) {
		offsetOptions.emplace_back(QString(offset.name), "Crop offset in page units, positive or negative.", "offset", "0.00");
		parser.addOption(offsetOptions.back());
	}

	parser.addPositionalArgument("output_image_one", "Output image of the first processed page (the right page with --no-left-page).",
	                             "[<output_image_one>]");
	parser.addPositionalArgument("output_image_two", "Output image of the right page when both pages are processed.", "[<output_image_two>]");

	if (!parser.parse(arguments)) {
		return fail(parser.errorText().toStdString());
	}
	if (parser.isSet(helpOption)) {
		return {ParseStatus::Help, CliOptions{}, parser.helpText().toStdString()};
	}
	if (parser.isSet(versionOption)) {
		return {ParseStatus::Version, CliOptions{}, {}};
	}

	CliOptions options{};
	options.guessSize = parser.isSet(guessOption);
	options.verbose   = parser.isSet(verboseOption);

	const auto dpi = toDouble(parser.value(dpiOption));
	if (!dpi || !(*dpi > 0.0 && *dpi <= MAX_DPI)) {
		return fail("Please enter a dpi value greater than 0 and at most 1200");
	}
	options.dpi = *dpi;

	const auto width  = toDouble(parser.value(widthOption));
	const auto height = toDouble(parser.value(heightOption));
	if (!width || !(*width > 0.0)) {
		return fail("Please enter the width as a positive float");
	}
	if (!height || !(*height > 0.0)) {
		return fail("Please enter the height as a positive float");
	}
	options.pageWidth  = *width;
	options.pageHeight = *height;

	for (std::size_t i = 0u; i < OFFSET_OPTIONS.size(); ++i) {
		const auto value = toDouble(parser.value(offsetOptions[i]));
		if (!value) {
			return fail(std::string("Please enter the offset as a float: --") + OFFSET_OPTIONS[i].name);
		}
		options.sides[sideIndex(OFFSET_OPTIONS[i].side)].offsets.*OFFSET_OPTIONS[i].edge = *value;
		options.offsetsGiven |= parser.isSet(offsetOptions[i]);
	}

	if (!parser.isSet(inputOption) || parser.value(inputOption).isEmpty()) {
		return fail("No input image given");
	}
	options.input = toPath(parser.value(inputOption));
	if (!std::filesystem::exists(options.input)) {
		return fail("File \"" + options.input.string() + "\" does not exist");
	}
	if (!isSupportedImage(options.input)) {
		return fail("Wrong image file extension \"" + options.input.extension().string() + "\"");
	}

	options.sides[0].enabled = !parser.isSet(noLeftOption);
	options.sides[1].enabled = !parser.isSet(noRightOption);

	// Outputs are handed to the enabled sides in order.
	const QStringList outputs = parser.positionalArguments();
	int next                  = 0;
	for (auto& side: options.sides) {
		if (!side.enabled) {
			continue;
		}
		if (next >= outputs.size()) {
			return fail(next == 0 ? "You either have to specify --no-left-page and --no-right-page or <output_image_one>"
			                      : "You either have to specify --no-right-page or <output_image_two>");
		}
		side.output = toPath(outputs[next++]);
		if (std::filesystem::exists(side.output)) {
			return fail("File \"" + side.output.string() + "\" already exists");
		}
		if (!isSupportedImage(side.output)) {
			return fail("Wrong image file extension \"" + side.output.extension().string() + "\"");
		}
	}
	if (next < outputs.size()) {
		return fail("Too many output images given");
	}

	if (parser.isSet(mosaicOption)) {
		options.debugMosaic = toPath(parser.value(mosaicOption));
		if (!isSupportedImage(options.debugMosaic)) {
			return fail("Wrong image file extension \"" + options.debugMosaic.extension().string() + "\"");
		}
	}

	return {ParseStatus::Ok, std::move(options), {}};
}

std::ostream& operator<<(std::ostream& os, const CliOptions& options) {
	os << "--input-image: " << options.input.string() << '\n'
	   << "--page-width: " << options.pageWidth << '\n'
	   << "--page-height: " << options.pageHeight << '\n'
	   << "--dpi: " << options.dpi << '\n'
	   << "--guess-size: " << std::boolalpha << options.guessSize << '\n'
	   << "--no-left-page: " << !options.sides[0].enabled << '\n'
	   << "--no-right-page: " << !options.sides[1].enabled << '\n'
	   << "--debug-mosaic: " << options.debugMosaic.string() << '\n';
	for (const auto& offset: OFFSET_OPTIONS) {
		os << "--" << offset.name << ": " << options.sides[sideIndex(offset.side)].offsets.*offset.edge << '\n';
	}
	os << "<output_image_one>: " << options.sides[0].output.string() << '\n' << "<output_image_two>: " << options.sides[1].output.string() << '\n';
	return os;
}

} // namespace keystone::cli
