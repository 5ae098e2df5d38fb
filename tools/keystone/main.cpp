#include <array>
#include <filesystem>
#include <iostream>

#include <QCoreApplication>

#include <opencv2/imgcodecs.hpp>

#include "keystone/core/pageRectifier.hpp"
#include "options.hpp"

namespace keystone::cli {

enum ExitCode { EXIT_OK = 0, EXIT_USAGE = 1, EXIT_PROCESSING = 2 };

static int process(const CliOptions& options) {
	const cv::Mat image = cv::imread(options.input.string());
	if (image.empty()) {
		std::cerr << "[Error] Failed to load image: " << options.input << "\n";
		return EXIT_PROCESSING;
	}

	core::DebugVisualizer debug;
	core::DebugVisualizer* debugger = options.debugMosaic.empty() ? nullptr : &debug;

	core::PageRectifier rectifier;
	rectifier.loadImage(image, debugger);

	std::array<core::LayoutInfo, 2> layouts{};
	if (!resolveLayouts(options, rectifier, layouts)) {
		return EXIT_PROCESSING;
	}

	int exitCode = EXIT_OK;
	for (const core::PageSide side: {core::PageSide::Left, core::PageSide::Right}) {
		const SideOptions& settings = sideOptions(options, side);
		if (!settings.enabled) {
			continue;
		}

		const core::LayoutInfo& layout = layouts[static_cast<std::size_t>(side)];
		if (options.verbose) {
			std::cout << (side == core::PageSide::Left ? "Left" : "Right") << " page: " << layout << "\n";
		}

		const core::PageImage page = rectifier.warpPage(layout, side, debugger);
		if (!core::isValidPage(page)) {
			exitCode = EXIT_PROCESSING;
			continue;
		}
		if (!cv::imwrite(settings.output.string(), page.image)) {
			std::cerr << "[Error] Could not write " << settings.output << "\n";
			exitCode = EXIT_PROCESSING;
			continue;
		}
		std::cout << "Wrote " << settings.output.string() << " (" << page.image.cols << "x" << page.image.rows << ")\n";
	}

	if (debugger) {
		const cv::Mat mosaic = debug.buildMosaic();
		if (mosaic.empty() || !cv::imwrite(options.debugMosaic.string(), mosaic)) {
			std::cerr << "[Warning] Could not write debug mosaic " << options.debugMosaic << "\n";
		}
	}
	return exitCode;
}

} // namespace keystone::cli

int main(int argc, char** argv) {
	QCoreApplication application(argc, argv);
	QCoreApplication::setApplicationName("keystone");
	QCoreApplication::setApplicationVersion(KEYSTONE_VERSION);

	const keystone::cli::ParseResult parsed = keystone::cli::parseOptions(QCoreApplication::arguments());
	switch (parsed.status) {
	case keystone::cli::ParseStatus::Help:
		std::cout << parsed.message;
		return keystone::cli::EXIT_OK;
	case keystone::cli::ParseStatus::Version:
		std::cout << "keystone " << KEYSTONE_VERSION << "\n";
		return keystone::cli::EXIT_OK;
	case keystone::cli::ParseStatus::Error:
		std::cerr << "[Error] " << parsed.message << "\n";
		return keystone::cli::EXIT_USAGE;
	case keystone::cli::ParseStatus::Ok:
		break;
	}

	if (parsed.options.verbose) {
		std::cout << parsed.options;
	}
	return keystone::cli::process(parsed.options);
}
