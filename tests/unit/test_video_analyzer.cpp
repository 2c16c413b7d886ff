#include <gtest/gtest.h>
#include "diagnostics/video_analyzer.hpp"
#include "utils/error_handler.hpp"
#include "test_data_generator.hpp"
#include <memory>
#include <stdexcept>

using namespace streamready::diagnostics;

namespace {

// Tainted canvas: dimensions are known but pixel reads are refused
class TaintedPixelSource : public PixelSource {
public:
    int width() const override { return 64; }
    int height() const override { return 48; }
    void readRegion(int, int, int, int, std::vector<uint8_t>&) const override {
        throw std::runtime_error("surface is tainted");
    }
};

} // namespace

class VideoAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<FramePixelSource>();
        analyzer_ = std::make_unique<VideoAnalyzer>(VideoAnalyzerConfig(), source_);
    }

    VideoAnalysis analyzeFrame(const RgbaFrame& frame) {
        source_->setFrame(frame);
        return analyzer_->analyze();
    }

    std::shared_ptr<FramePixelSource> source_;
    std::unique_ptr<VideoAnalyzer> analyzer_;
    fixtures::TestDataGenerator generator_;
};

TEST_F(VideoAnalyzerTest, BlackFrameIsTooDark) {
    VideoAnalysis analysis = analyzeFrame(generator_.generateSolidFrame(64, 64, 0));

    EXPECT_FLOAT_EQ(analysis.brightness, 0.0f);
    EXPECT_FLOAT_EQ(analysis.uniformityStandardDev, 0.0f);
    EXPECT_FLOAT_EQ(analysis.uniformityScore, 1.0f);
    EXPECT_EQ(analysis.status, VideoStatus::TOO_DARK);
}

TEST_F(VideoAnalyzerTest, FailedReadGivesNeutralAnalysis) {
    using streamready::utils::ErrorCategory;
    using streamready::utils::ErrorHandler;

    ErrorHandler::getInstance().clearErrorHistory();
    VideoAnalyzer analyzer(VideoAnalyzerConfig(), std::make_shared<TaintedPixelSource>());

    VideoAnalysis analysis;
    ASSERT_NO_THROW(analysis = analyzer.analyze());

    EXPECT_FLOAT_EQ(analysis.brightness, 0.0f);
    EXPECT_EQ(analysis.status, VideoStatus::OK);
    EXPECT_EQ(ErrorHandler::getInstance().getErrorCount(ErrorCategory::VIDEO_CAPTURE), 1u);
    EXPECT_EQ(ErrorHandler::getInstance().getRecentErrors(1)[0].context, "VideoAnalyzer");

    ErrorHandler::getInstance().clearErrorHistory();
}

TEST_F(VideoAnalyzerTest, MidGrayFrameIsOk) {
    VideoAnalysis analysis = analyzeFrame(generator_.generateSolidFrame(64, 64, 128));

    EXPECT_NEAR(analysis.brightness, 128.0f, 0.01f);
    EXPECT_FLOAT_EQ(analysis.uniformityScore, 1.0f);
    EXPECT_FLOAT_EQ(analysis.fluctuation, 0.0f);
    EXPECT_EQ(analysis.status, VideoStatus::OK);
}

TEST_F(VideoAnalyzerTest, BrightFrameIsOverexposed) {
    VideoAnalysis analysis = analyzeFrame(generator_.generateSolidFrame(64, 64, 220));

    EXPECT_NEAR(analysis.brightness, 220.0f, 0.01f);
    EXPECT_EQ(analysis.status, VideoStatus::OVEREXPOSED);
}

TEST_F(VideoAnalyzerTest, SplitLightingIsUneven) {
    VideoAnalysis analysis = analyzeFrame(generator_.generateSplitFrame(64, 64, 20, 230));

    EXPECT_NEAR(analysis.brightness, 125.0f, 0.05f);
    EXPECT_NEAR(analysis.uniformityStandardDev, 105.0f, 0.05f);
    EXPECT_NEAR(analysis.uniformityScore, 1.0f - 105.0f / 255.0f, 1e-3f);
    EXPECT_EQ(analysis.status, VideoStatus::UNEVEN_LIGHTING);
}

TEST_F(VideoAnalyzerTest, BrightnessSwingRequestsCameraAdjustment) {
    VideoAnalysis first = analyzeFrame(generator_.generateSolidFrame(64, 64, 70));
    EXPECT_EQ(first.status, VideoStatus::OK);

    VideoAnalysis second = analyzeFrame(generator_.generateSolidFrame(64, 64, 150));
    EXPECT_NEAR(second.fluctuation, 40.0f, 0.05f);
    EXPECT_EQ(second.status, VideoStatus::ADJUST_CAMERA);
    EXPECT_EQ(analyzer_->brightnessHistory().size(), 2u);
}

TEST_F(VideoAnalyzerTest, StatusPriorityChain) {
    EXPECT_EQ(analyzer_->resolveStatus(200.0f, 100.0f, 50.0f), VideoStatus::OVEREXPOSED);
    EXPECT_EQ(analyzer_->resolveStatus(10.0f, 100.0f, 50.0f), VideoStatus::TOO_DARK);
    EXPECT_EQ(analyzer_->resolveStatus(100.0f, 31.0f, 50.0f), VideoStatus::UNEVEN_LIGHTING);
    EXPECT_EQ(analyzer_->resolveStatus(100.0f, 30.0f, 16.0f), VideoStatus::ADJUST_CAMERA);
    EXPECT_EQ(analyzer_->resolveStatus(30.0f, 30.0f, 15.0f), VideoStatus::OK);
    EXPECT_EQ(analyzer_->resolveStatus(180.0f, 0.0f, 0.0f), VideoStatus::OK);
}

TEST_F(VideoAnalyzerTest, NoSurfaceGivesNeutralAnalysis) {
    VideoAnalyzer analyzer;
    VideoAnalysis analysis = analyzer.analyze();

    EXPECT_FALSE(analyzer.hasSource());
    EXPECT_FLOAT_EQ(analysis.brightness, 0.0f);
    EXPECT_EQ(analysis.status, VideoStatus::OK);
}

TEST_F(VideoAnalyzerTest, EmptySurfaceGivesNeutralAnalysis) {
    VideoAnalysis analysis = analyzeFrame(RgbaFrame());

    EXPECT_FLOAT_EQ(analysis.brightness, 0.0f);
    EXPECT_EQ(analysis.status, VideoStatus::OK);
    EXPECT_TRUE(analyzer_->brightnessHistory().empty());
}

TEST_F(VideoAnalyzerTest, ResetClearsBrightnessHistory) {
    analyzeFrame(generator_.generateSolidFrame(64, 64, 70));
    analyzeFrame(generator_.generateSolidFrame(64, 64, 150));
    analyzer_->reset();

    EXPECT_TRUE(analyzer_->brightnessHistory().empty());
    EXPECT_EQ(analyzeFrame(generator_.generateSolidFrame(64, 64, 150)).status, VideoStatus::OK);
}

TEST(LuminanceGridTest, GridOnUnevenDimensions) {
    fixtures::TestDataGenerator generator;
    FramePixelSource source(generator.generateSplitFrame(10, 10, 0, 200));

    // Cells start at 0, 2, 5, 7 and span 3 pixels; the right half starts at x = 5
    std::vector<float> cells = sampleLuminanceGrid(source, 4);

    ASSERT_EQ(cells.size(), 16u);
    for (int row = 0; row < 4; ++row) {
        EXPECT_FLOAT_EQ(cells[row * 4], 0.0f);
        EXPECT_FLOAT_EQ(cells[row * 4 + 1], 0.0f);
        EXPECT_NEAR(cells[row * 4 + 2], 200.0f, 0.01f);
        EXPECT_NEAR(cells[row * 4 + 3], 200.0f, 0.01f);
    }
}

TEST(LuminanceGridTest, CellsStraddlingTheSplitAverage) {
    fixtures::TestDataGenerator generator;
    FramePixelSource source(generator.generateSplitFrame(10, 10, 0, 200));

    // Cells start at 0, 3, 6 and span 4 pixels
    std::vector<float> cells = sampleLuminanceGrid(source, 3);

    ASSERT_EQ(cells.size(), 9u);
    EXPECT_FLOAT_EQ(cells[0], 0.0f);
    EXPECT_NEAR(cells[1], 100.0f, 0.01f);
    EXPECT_NEAR(cells[2], 200.0f, 0.01f);
}

TEST(LuminanceGridTest, SurfaceSmallerThanGrid) {
    FramePixelSource source(RgbaFrame(3, 3, 90, 90, 90));
    std::vector<float> cells = sampleLuminanceGrid(source, 16);

    ASSERT_EQ(cells.size(), 256u);
    for (float cell : cells) {
        EXPECT_NEAR(cell, 90.0f, 0.01f);
    }
}

TEST(LuminanceGridTest, EmptySurfaceHasNoCells) {
    FramePixelSource source;
    EXPECT_TRUE(sampleLuminanceGrid(source, 16).empty());
}

TEST(LuminanceGridTest, Rec709Weights) {
    EXPECT_NEAR(rgbToLuminance(255.0f, 255.0f, 255.0f), 255.0f, 0.01f);
    EXPECT_NEAR(rgbToLuminance(255.0f, 0.0f, 0.0f), 54.213f, 0.01f);
    EXPECT_NEAR(rgbToLuminance(0.0f, 255.0f, 0.0f), 182.376f, 0.01f);
    EXPECT_NEAR(rgbToLuminance(0.0f, 0.0f, 255.0f), 18.411f, 0.01f);
}
