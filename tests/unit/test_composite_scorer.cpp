#include <gtest/gtest.h>
#include "diagnostics/composite_scorer.hpp"

using namespace streamready::diagnostics;

class CompositeScorerTest : public ::testing::Test {
protected:
    AudioAnalysis audioWith(AudioStatus status, float rms = 0.08f) {
        AudioAnalysis audio;
        audio.status = status;
        audio.rms = rms;
        return audio;
    }

    VideoAnalysis videoWith(VideoStatus status, float uniformityScore = 1.0f) {
        VideoAnalysis video;
        video.status = status;
        video.uniformityScore = uniformityScore;
        return video;
    }

    NetworkAnalysis networkWith(NetworkStatus status, int stabilityScore) {
        NetworkAnalysis network;
        network.status = status;
        network.stabilityScore = stabilityScore;
        return network;
    }

    CompositeScorer scorer_;
};

TEST_F(CompositeScorerTest, OkAudioScoresByDistanceFromOptimalLevel) {
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::OK, 0.08f)), 100);
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::OK, 0.078125f)), 99);
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::OK, 0.1f)), 90);
}

TEST_F(CompositeScorerTest, OkAudioNeverFallsBelowFloor) {
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::OK, 0.5f)), 85);
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::OK, 0.0f)), 85);
}

TEST_F(CompositeScorerTest, AudioStatusLookup) {
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::BACKGROUND_NOISE)), 70);
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::TOO_QUIET)), 50);
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::TOO_LOUD)), 40);
    EXPECT_EQ(scorer_.audioStatusToScore(audioWith(AudioStatus::CLIPPING)), 0);
}

TEST_F(CompositeScorerTest, VideoStatusLookup) {
    EXPECT_EQ(scorer_.videoStatusToScore(videoWith(VideoStatus::OK, 1.0f)), 100);
    EXPECT_EQ(scorer_.videoStatusToScore(videoWith(VideoStatus::OK, 0.5f)), 93);
    EXPECT_EQ(scorer_.videoStatusToScore(videoWith(VideoStatus::OK, 0.0f)), 85);
    EXPECT_EQ(scorer_.videoStatusToScore(videoWith(VideoStatus::ADJUST_CAMERA)), 70);
    EXPECT_EQ(scorer_.videoStatusToScore(videoWith(VideoStatus::UNEVEN_LIGHTING)), 60);
    EXPECT_EQ(scorer_.videoStatusToScore(videoWith(VideoStatus::TOO_DARK)), 50);
    EXPECT_EQ(scorer_.videoStatusToScore(videoWith(VideoStatus::OVEREXPOSED)), 40);
}

TEST_F(CompositeScorerTest, WeightedOverallQuality) {
    QualityScore score = scorer_.calculateQualityScore(audioWith(AudioStatus::TOO_QUIET),
                                                       videoWith(VideoStatus::TOO_DARK),
                                                       networkWith(NetworkStatus::GOOD, 90));

    EXPECT_EQ(score.audioScore, 50);
    EXPECT_EQ(score.videoScore, 50);
    EXPECT_EQ(score.networkScore, 90);
    // 0.4 * 50 + 0.4 * 50 + 0.2 * 90
    EXPECT_EQ(score.overallQuality, 58);
}

TEST_F(CompositeScorerTest, OverallBlendsUnroundedSubScores) {
    // audio 100 - 500 * 0.0012 = 99.4; 0.4 * 100 + 0.4 * 99.4 + 0.2 * 99 = 99.56
    QualityScore score = scorer_.calculateQualityScore(audioWith(AudioStatus::OK, 0.0812f),
                                                       videoWith(VideoStatus::OK, 1.0f),
                                                       networkWith(NetworkStatus::GOOD, 99));

    EXPECT_EQ(score.audioScore, 99);
    EXPECT_EQ(score.videoScore, 100);
    EXPECT_EQ(score.networkScore, 99);
    EXPECT_EQ(score.overallQuality, 100);
}

TEST_F(CompositeScorerTest, IdealInputsScoreHighAndGood) {
    const AudioAnalysis audio = audioWith(AudioStatus::OK, 0.08f);
    const VideoAnalysis video = videoWith(VideoStatus::OK, 1.0f);
    const NetworkAnalysis network = networkWith(NetworkStatus::GOOD, 99);

    QualityScore score = scorer_.calculateQualityScore(audio, video, network);

    EXPECT_GE(score.overallQuality, 80);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(audio.status, video.status, network.status),
              OverallStatus::GOOD);
}

TEST_F(CompositeScorerTest, SubScoresAreClamped) {
    QualityScore high = scorer_.calculateQualityScore(audioWith(AudioStatus::OK), videoWith(VideoStatus::OK),
                                                      networkWith(NetworkStatus::GOOD, 150));
    EXPECT_EQ(high.networkScore, 100);
    EXPECT_LE(high.overallQuality, 100);

    QualityScore low = scorer_.calculateQualityScore(audioWith(AudioStatus::CLIPPING),
                                                     videoWith(VideoStatus::OVEREXPOSED),
                                                     networkWith(NetworkStatus::CRITICAL, -20));
    EXPECT_EQ(low.networkScore, 0);
    EXPECT_GE(low.overallQuality, 0);
}

TEST_F(CompositeScorerTest, CustomWeights) {
    CompositeScorerConfig config;
    config.videoWeight = 0.0;
    config.audioWeight = 0.0;
    config.networkWeight = 1.0;
    CompositeScorer scorer(config);

    QualityScore score = scorer.calculateQualityScore(audioWith(AudioStatus::CLIPPING),
                                                      videoWith(VideoStatus::TOO_DARK),
                                                      networkWith(NetworkStatus::GOOD, 77));
    EXPECT_EQ(score.overallQuality, 77);
}

TEST(OverallStatusTest, CriticalStatusesDominate) {
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::TOO_LOUD, VideoStatus::OK, NetworkStatus::GOOD),
              OverallStatus::CRITICAL);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::OK, VideoStatus::TOO_DARK, NetworkStatus::GOOD),
              OverallStatus::CRITICAL);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::OK, VideoStatus::OK, NetworkStatus::CRITICAL),
              OverallStatus::CRITICAL);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::TOO_QUIET, VideoStatus::TOO_DARK,
                                                      NetworkStatus::UNSTABLE),
              OverallStatus::CRITICAL);
}

TEST(OverallStatusTest, PoorStatuses) {
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::TOO_QUIET, VideoStatus::OK, NetworkStatus::GOOD),
              OverallStatus::POOR);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::CLIPPING, VideoStatus::OK, NetworkStatus::GOOD),
              OverallStatus::POOR);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::OK, VideoStatus::OVEREXPOSED, NetworkStatus::GOOD),
              OverallStatus::POOR);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::OK, VideoStatus::OK, NetworkStatus::UNSTABLE),
              OverallStatus::POOR);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::BACKGROUND_NOISE, VideoStatus::UNEVEN_LIGHTING,
                                                      NetworkStatus::UNSTABLE),
              OverallStatus::POOR);
}

TEST(OverallStatusTest, MildIssuesAreModerate) {
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::BACKGROUND_NOISE, VideoStatus::OK,
                                                      NetworkStatus::GOOD),
              OverallStatus::MODERATE);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::OK, VideoStatus::UNEVEN_LIGHTING,
                                                      NetworkStatus::GOOD),
              OverallStatus::MODERATE);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::OK, VideoStatus::ADJUST_CAMERA,
                                                      NetworkStatus::GOOD),
              OverallStatus::MODERATE);
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::OK, VideoStatus::OK, NetworkStatus::MODERATE),
              OverallStatus::MODERATE);
}

TEST(OverallStatusTest, AllBestIsGood) {
    EXPECT_EQ(CompositeScorer::calculateOverallStatus(AudioStatus::OK, VideoStatus::OK, NetworkStatus::GOOD),
              OverallStatus::GOOD);
}
