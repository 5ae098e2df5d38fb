#include "keystone/core/debugVisualizer.hpp"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

namespace keystone::core {
namespace gtest {

TEST(DebugVisualizer, Mosaic_Rows_Per_Stage) {
	DebugVisualizer debugger;
	debugger.beginStage("First");
	debugger.add("Gray", cv::Mat(50, 80, CV_8UC1, cv::Scalar(128)));
	debugger.add("Float", cv::Mat(40, 40, CV_32FC1, cv::Scalar(0.5f)));
	debugger.add("Empty", cv::Mat());
	debugger.beginStage("Second"); // Closes "First".
	debugger.add("Color", cv::Mat(30, 30, CV_8UC4, cv::Scalar(0, 0, 255, 255)));

	const cv::Mat mosaic = debugger.buildMosaic(100);
	ASSERT_EQ(debugger.stages().size(), 2u);
	EXPECT_EQ(debugger.stages()[0].steps.size(), 3u);
	EXPECT_EQ(debugger.stages()[1].name, "Second");

	EXPECT_EQ(mosaic.type(), CV_8UC3);
	EXPECT_EQ(mosaic.rows, 2 * 100);
	EXPECT_EQ(mosaic.cols, 220 + 3 * 100);
}

// Tiles too small for the label band grow to the smallest usable size.
TEST(DebugVisualizer, Tiny_Tiles_Enlarged) {
	DebugVisualizer debugger;
	debugger.beginStage("Stage");
	debugger.add("Wide", cv::Mat(20, 200, CV_8UC1, cv::Scalar(200)));
	debugger.add("Tall", cv::Mat(200, 20, CV_8UC3, cv::Scalar(0, 200, 0)));

	for (const int tileSize: {0, 10, 32}) {
		const cv::Mat mosaic = debugger.buildMosaic(tileSize);
		ASSERT_FALSE(mosaic.empty()) << "tile " << tileSize;
		EXPECT_EQ(mosaic.rows, 33);
		EXPECT_EQ(mosaic.cols, 220 + 2 * 33);
	}
}

// Images are stored as copies.
TEST(DebugVisualizer, Add_Clones) {
	DebugVisualizer debugger;
	cv::Mat image(10, 10, CV_8UC1, cv::Scalar(0));

	debugger.beginStage("Stage");
	debugger.add("Image", image);
	debugger.endStage();
	image.setTo(255);

	ASSERT_EQ(debugger.stages().size(), 1u);
	EXPECT_EQ(cv::countNonZero(debugger.stages()[0].steps[0].image), 0);
}

TEST(DebugVisualizer, Add_Outside_Stage_Ignored) {
	DebugVisualizer debugger;
	debugger.add("Lost", cv::Mat(10, 10, CV_8UC1));
	EXPECT_TRUE(debugger.stages().empty());
	EXPECT_TRUE(debugger.buildMosaic().empty());
}

} // namespace gtest
} // namespace keystone::core
