#include "options.hpp"

#include "syntheticGlyphs.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace keystone::cli {
namespace gtest {

//! Scratch directory with an (empty) input image, removed after each test.
class OptionsTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_dir = std::filesystem::temp_directory_path() / ("keystone_options_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
		                                                  ::testing::UnitTest::GetInstance()->current_test_info()->name());
		std::filesystem::create_directories(m_dir);
		std::ofstream(m_dir / "spread.jpg").put('x');
	}

	void TearDown() override {
		std::error_code ec;
		std::filesystem::remove_all(m_dir, ec);
	}

	QString path(const char* name) const { return QString::fromStdString((m_dir / name).string()); }

	ParseResult parse(QStringList args) const {
		args.prepend("keystone");
		return parseOptions(args);
	}

	std::filesystem::path m_dir;
};

TEST_F(OptionsTest, Defaults) {
	const ParseResult result = parse({"-i", path("spread.jpg"), path("left.png"), path("right.png")});
	ASSERT_EQ(result.status, ParseStatus::Ok) << result.message;

	const CliOptions& options = result.options;
	EXPECT_DOUBLE_EQ(options.pageWidth, 6.0);
	EXPECT_DOUBLE_EQ(options.pageHeight, 9.5);
	EXPECT_DOUBLE_EQ(options.dpi, 600.0);
	EXPECT_FALSE(options.guessSize);
	EXPECT_FALSE(options.offsetsGiven);
	EXPECT_FALSE(options.verbose);
	EXPECT_TRUE(options.debugMosaic.empty());
	EXPECT_TRUE(options.sides[0].enabled);
	EXPECT_TRUE(options.sides[1].enabled);
	EXPECT_EQ(options.sides[0].output, m_dir / "left.png");
	EXPECT_EQ(options.sides[1].output, m_dir / "right.png");

	const core::LayoutInfo layout = layoutFor(options, core::PageSide::Left, options.pageWidth, options.pageHeight);
	EXPECT_EQ(layout.outputSize(), cv::Size(3600, 5700));
}

TEST_F(OptionsTest, Explicit_Values_And_Offsets) {
	const ParseResult result = parse({"-i", path("spread.jpg"), "-w", "5.5", "--page-height", "8.25", "-d", "300", "--offset-right-page-top-side", "-0.25",
	                                  "--offset-left-page-right-side", "0.5", "--guess-size", path("left.png"), path("right.tif")});
	ASSERT_EQ(result.status, ParseStatus::Ok) << result.message;

	const CliOptions& options = result.options;
	EXPECT_DOUBLE_EQ(options.pageWidth, 5.5);
	EXPECT_DOUBLE_EQ(options.pageHeight, 8.25);
	EXPECT_DOUBLE_EQ(options.dpi, 300.0);
	EXPECT_TRUE(options.guessSize);
	EXPECT_TRUE(options.offsetsGiven);
	EXPECT_DOUBLE_EQ(sideOptions(options, core::PageSide::Right).offsets.top, -0.25);
	EXPECT_DOUBLE_EQ(sideOptions(options, core::PageSide::Left).offsets.right, 0.5);
	EXPECT_DOUBLE_EQ(sideOptions(options, core::PageSide::Left).offsets.top, 0.0);

	const core::LayoutInfo layout = layoutFor(options, core::PageSide::Left, options.pageWidth, options.pageHeight);
	EXPECT_DOUBLE_EQ(layout.right(), 6.0);
	EXPECT_EQ(layout.outputSize(), cv::Size(1800, 2475));
}

TEST_F(OptionsTest, Dpi_Out_Of_Range) {
	for (const char* dpi: {"0", "-20", "1200.5", "abc"}) {
		const ParseResult result = parse({"-i", path("spread.jpg"), "-d", dpi, path("left.png"), path("right.png")});
		EXPECT_EQ(result.status, ParseStatus::Error) << "dpi " << dpi;
	}
	EXPECT_EQ(parse({"-i", path("spread.jpg"), "-d", "1200", path("left.png"), path("right.png")}).status, ParseStatus::Ok);
}

TEST_F(OptionsTest, Non_Positive_Page_Size) {
	EXPECT_EQ(parse({"-i", path("spread.jpg"), "-w", "0", path("left.png"), path("right.png")}).status, ParseStatus::Error);
	EXPECT_EQ(parse({"-i", path("spread.jpg"), "-t", "x", path("left.png"), path("right.png")}).status, ParseStatus::Error);
}

TEST_F(OptionsTest, Input_Checks) {
	EXPECT_EQ(parse({path("left.png"), path("right.png")}).status, ParseStatus::Error);

	const ParseResult missing = parse({"-i", path("nothere.jpg"), path("left.png"), path("right.png")});
	EXPECT_EQ(missing.status, ParseStatus::Error);
	EXPECT_NE(missing.message.find("does not exist"), std::string::npos);

	std::ofstream(m_dir / "spread.txt").put('x');
	const ParseResult extension = parse({"-i", path("spread.txt"), path("left.png"), path("right.png")});
	EXPECT_EQ(extension.status, ParseStatus::Error);
	EXPECT_NE(extension.message.find("extension"), std::string::npos);
}

TEST_F(OptionsTest, Output_Checks) {
	std::ofstream(m_dir / "left.png").put('x');
	const ParseResult exists = parse({"-i", path("spread.jpg"), path("left.png"), path("right.png")});
	EXPECT_EQ(exists.status, ParseStatus::Error);
	EXPECT_NE(exists.message.find("already exists"), std::string::npos);

	EXPECT_EQ(parse({"-i", path("spread.jpg"), path("a.png"), path("b.gif")}).status, ParseStatus::Error);
	EXPECT_EQ(parse({"-i", path("spread.jpg"), path("a.png"), path("b.png"), path("c.png")}).status, ParseStatus::Error);
}

TEST_F(OptionsTest, Required_Outputs) {
	const ParseResult none = parse({"-i", path("spread.jpg")});
	EXPECT_EQ(none.status, ParseStatus::Error);
	EXPECT_NE(none.message.find("--no-left-page"), std::string::npos);

	const ParseResult one = parse({"-i", path("spread.jpg"), path("a.png")});
	EXPECT_EQ(one.status, ParseStatus::Error);
	EXPECT_NE(one.message.find("--no-right-page"), std::string::npos);

	const ParseResult rightOnly = parse({"-i", path("spread.jpg"), "--no-left-page"});
	EXPECT_EQ(rightOnly.status, ParseStatus::Error);
	EXPECT_NE(rightOnly.message.find("<output_image_one>"), std::string::npos);
}

// A single output goes to the only enabled side.
TEST_F(OptionsTest, Single_Side) {
	const ParseResult right = parse({"-i", path("spread.jpg"), "--no-left-page", path("page.png")});
	ASSERT_EQ(right.status, ParseStatus::Ok) << right.message;
	EXPECT_FALSE(right.options.sides[0].enabled);
	EXPECT_TRUE(right.options.sides[0].output.empty());
	EXPECT_EQ(right.options.sides[1].output, m_dir / "page.png");

	const ParseResult left = parse({"-i", path("spread.jpg"), "--no-right-page", path("page.png")});
	ASSERT_EQ(left.status, ParseStatus::Ok) << left.message;
	EXPECT_EQ(left.options.sides[0].output, m_dir / "page.png");
	EXPECT_FALSE(left.options.sides[1].enabled);

	EXPECT_EQ(parse({"-i", path("spread.jpg"), "--no-left-page", "--no-right-page"}).status, ParseStatus::Ok);
}

TEST_F(OptionsTest, Unknown_Option) {
	EXPECT_EQ(parse({"-i", path("spread.jpg"), "--frobnicate", path("a.png"), path("b.png")}).status, ParseStatus::Error);
}

TEST_F(OptionsTest, Printing) {
	const ParseResult result = parse({"-i", path("spread.jpg"), "--verbose", "--debug-mosaic", path("mosaic.png"), path("a.png"), path("b.png")});
	ASSERT_EQ(result.status, ParseStatus::Ok) << result.message;
	EXPECT_TRUE(result.options.verbose);
	EXPECT_EQ(result.options.debugMosaic, m_dir / "mosaic.png");

	std::ostringstream os;
	os << result.options;
	EXPECT_NE(os.str().find("--dpi: 600"), std::string::npos);
	EXPECT_NE(os.str().find("--offset-right-page-bottom-side: 0"), std::string::npos);
	EXPECT_NE(os.str().find("--no-left-page: false"), std::string::npos);
}

TEST(Options, Layouts_From_Page_Size) {
	CliOptions options{};
	options.pageWidth              = 5.0;
	options.pageHeight             = 8.0;
	options.dpi                    = 100.0;
	options.sides[1].offsets.right = 0.5;

	std::array<core::LayoutInfo, 2> layouts{};
	ASSERT_TRUE(resolveLayouts(options, core::PageRectifier(), layouts));
	EXPECT_EQ(layouts[0].outputSize(), cv::Size(500, 800));
	EXPECT_EQ(layouts[1].outputSize(), cv::Size(550, 800));
}

// With glyph 5 missing, the right page cannot be sized but the left page alone still can.
TEST(Options, Guess_Size_Single_Page) {
	core::gtest::SpreadSpec spec{};
	spec.skipIds = {5};
	const core::PageRectifier rectifier(core::gtest::makeSpread(spec));

	CliOptions options{};
	options.guessSize        = true;
	options.dpi              = 100.0;
	options.sides[1].enabled = false;

	std::array<core::LayoutInfo, 2> layouts{};
	ASSERT_TRUE(resolveLayouts(options, rectifier, layouts));
	const core::LayoutInfo& left = layouts[0];
	EXPECT_NEAR(left.width(), 6.0, 0.05);
	EXPECT_NEAR(left.height(), 9.5, 0.05);
	EXPECT_DOUBLE_EQ(left.left(), 0.0);
	EXPECT_DOUBLE_EQ(left.top(), 0.5);
	EXPECT_DOUBLE_EQ(left.dpi(), 100.0);
	EXPECT_TRUE(core::isValidPage(rectifier.warpPage(left, core::PageSide::Left)));

	// Explicit offsets replace the guess margins.
	options.offsetsGiven          = true;
	options.sides[0].offsets.top  = 0.25;
	options.sides[0].offsets.left = -0.1;
	ASSERT_TRUE(resolveLayouts(options, rectifier, layouts));
	EXPECT_DOUBLE_EQ(layouts[0].top(), 0.25);
	EXPECT_DOUBLE_EQ(layouts[0].left(), -0.1);

	// The page that depends on the missing glyph still fails, alone or together.
	options.sides[0].enabled = false;
	options.sides[1].enabled = true;
	EXPECT_FALSE(resolveLayouts(options, rectifier, layouts));
	options.sides[0].enabled = true;
	EXPECT_FALSE(resolveLayouts(options, rectifier, layouts));
}

TEST(Options, Supported_Extensions) {
	EXPECT_TRUE(isSupportedImage("a/b/page.PNG"));
	EXPECT_TRUE(isSupportedImage("scan.tif"));
	EXPECT_TRUE(isSupportedImage("scan.jpe"));
	EXPECT_FALSE(isSupportedImage("scan.gif"));
	EXPECT_FALSE(isSupportedImage("scan"));
}

} // namespace gtest
} // namespace keystone::cli
