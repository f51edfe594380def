#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include "Exceptions.hpp"
#include "SampleSet.hpp"

namespace {

Config::Sampling config(int capacity, int bins) {
    Config::Sampling cfg;
    cfg.capacity = capacity;
    cfg.bins = bins;
    cfg.noveltyThreshold = 0.1;
    cfg.sufficientSamples = 1000;
    cfg.readinessThreshold = 1.0;
    return cfg;
}

SampleDescriptor desc(double x, double y, double size, double skew) {
    SampleDescriptor d;
    d.x = x;
    d.y = y;
    d.size = size;
    d.skew = skew;
    return d;
}

Detection tagged(uint64_t seq) {
    Detection det;
    det.frameSequence = seq;
    det.frameSize = cv::Size(640, 480);
    return det;
}

// With the default ranges and two bins: x, y split at 0.5, size at 0.22, skew at 0.3.
const SampleDescriptor kLowA  = desc(0.20, 0.20, 0.05, 0.05);
const SampleDescriptor kLowB  = desc(0.30, 0.30, 0.10, 0.10);
const SampleDescriptor kLowC  = desc(0.40, 0.40, 0.15, 0.15);
const SampleDescriptor kHighA = desc(0.70, 0.70, 0.35, 0.45);
const SampleDescriptor kHighB = desc(0.80, 0.80, 0.40, 0.55);

} // namespace

TEST(SampleSet, FirstSampleIsNovel) {
    SampleSet set(config(10, 10));
    AdmissionDecision d = set.offer(tagged(1), desc(0.5, 0.5, 0.2, 0.3));
    EXPECT_EQ(d.verdict, Admission::AcceptedNovel);
    EXPECT_EQ(set.size(), 1u);
    EXPECT_TRUE(set.isConsistent());
    EXPECT_DOUBLE_EQ(d.nearest, -1.0);
}

TEST(SampleSet, DuplicateIsRedundant) {
    SampleSet set(config(10, 10));
    SampleDescriptor a = desc(0.51, 0.51, 0.23, 0.31);
    set.offer(tagged(1), a);
    AdmissionDecision d = set.offer(tagged(2), a);
    EXPECT_EQ(d.verdict, Admission::RejectedRedundant);
    EXPECT_DOUBLE_EQ(d.nearest, 0.0);
    EXPECT_EQ(set.size(), 1u);
}

TEST(SampleSet, DistinctSampleInSameBinsUsesRoom) {
    SampleSet set(config(10, 10));
    set.offer(tagged(1), desc(0.51, 0.51, 0.23, 0.31));
    AdmissionDecision d = set.offer(tagged(2), desc(0.565, 0.565, 0.23, 0.31));
    EXPECT_EQ(d.verdict, Admission::AcceptedRoom);
    EXPECT_GE(d.nearest, 0.1);
    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.isConsistent());
}

TEST(SampleSet, EvaluateHasNoSideEffects) {
    SampleSet set(config(10, 10));
    set.offer(tagged(1), kLowA);
    AdmissionDecision d = set.evaluate(kHighA);
    EXPECT_EQ(d.verdict, Admission::AcceptedNovel);
    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(set.tracker().total(Dimension::X), 1);
}

TEST(SampleSet, DuplicateRejectedAtCapacityWithUniformCoverage) {
    SampleSet set(config(4, 2));
    ASSERT_TRUE(isAccepted(set.offer(tagged(1), desc(0.2, 0.2, 0.05, 0.05)).verdict));
    ASSERT_TRUE(isAccepted(set.offer(tagged(2), desc(0.8, 0.8, 0.40, 0.55)).verdict));
    ASSERT_TRUE(isAccepted(set.offer(tagged(3), desc(0.2, 0.8, 0.05, 0.55)).verdict));
    ASSERT_TRUE(isAccepted(set.offer(tagged(4), desc(0.8, 0.2, 0.40, 0.05)).verdict));
    ASSERT_EQ(set.size(), 4u);
    ASSERT_DOUBLE_EQ(set.tracker().coverage().readiness, 1.0);

    std::vector<uint64_t> before;
    for (const auto& s : set.samples()) before.push_back(s.detection.frameSequence);

    AdmissionDecision d = set.offer(tagged(5), desc(0.2, 0.2, 0.05, 0.05));
    EXPECT_EQ(d.verdict, Admission::RejectedRedundant);
    ASSERT_EQ(set.size(), 4u);
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(set.samples()[i].detection.frameSequence, before[i]);
    }
    EXPECT_TRUE(set.isConsistent());
}

TEST(SampleSet, ReplacesOldestSampleOfMostCrowdedBins) {
    SampleSet set(config(4, 2));
    set.offer(tagged(1), kLowA);
    set.offer(tagged(2), kLowB);
    set.offer(tagged(3), kLowC);
    set.offer(tagged(4), kHighA);
    ASSERT_EQ(set.size(), 4u);

    // Low bins hold three samples each; all three tie, the oldest goes.
    EXPECT_EQ(set.evictionCandidate(kHighB), 0);

    AdmissionDecision d = set.offer(tagged(5), kHighB);
    EXPECT_EQ(d.verdict, Admission::AcceptedReplacing);
    EXPECT_EQ(d.evictIndex, 0);
    ASSERT_EQ(set.size(), 4u);

    std::vector<uint64_t> seqs;
    for (const auto& s : set.samples()) seqs.push_back(s.detection.frameSequence);
    EXPECT_EQ(seqs, (std::vector<uint64_t>{2, 3, 4, 5}));
    EXPECT_TRUE(set.isConsistent());
    EXPECT_DOUBLE_EQ(set.tracker().coverage().readiness, 1.0);
}

TEST(SampleSet, LessInformativeSampleIsRejectedAtCapacity) {
    SampleSet set(config(4, 2));
    set.offer(tagged(1), desc(0.2, 0.2, 0.05, 0.05));
    set.offer(tagged(2), desc(0.8, 0.8, 0.40, 0.55));
    set.offer(tagged(3), desc(0.2, 0.8, 0.05, 0.55));
    set.offer(tagged(4), desc(0.8, 0.2, 0.40, 0.05));

    // Every bin holds two samples: gain 4/3 does not beat a contribution of 2.
    AdmissionDecision d = set.offer(tagged(5), desc(0.35, 0.35, 0.12, 0.18));
    EXPECT_EQ(d.verdict, Admission::RejectedUninformative);
    EXPECT_EQ(set.size(), 4u);
}

TEST(SampleSet, NovelSampleAtCapacityEvictsAndKeepsSizeBound) {
    SampleSet set(config(3, 2));
    set.offer(tagged(1), kLowA);
    set.offer(tagged(2), kLowB);
    set.offer(tagged(3), kLowC);
    ASSERT_EQ(set.size(), 3u);

    AdmissionDecision d = set.offer(tagged(4), kHighA);
    EXPECT_EQ(d.verdict, Admission::AcceptedNovel);
    EXPECT_EQ(d.evictIndex, 0);
    EXPECT_EQ(set.size(), 3u);
    EXPECT_DOUBLE_EQ(set.tracker().coverage().readiness, 1.0);
    EXPECT_TRUE(set.isConsistent());
}

TEST(SampleSet, NovelSampleIsRejectedWhenEveryEvictionWouldEmptyABin) {
    Config::Sampling cfg = config(2, 3);
    cfg.xRange = cfg.yRange = cfg.sizeRange = cfg.skewRange = {0.0, 0.9};
    SampleSet set(cfg);
    set.offer(tagged(1), desc(0.1, 0.1, 0.1, 0.1));   // bin 0 everywhere
    set.offer(tagged(2), desc(0.8, 0.8, 0.8, 0.8));   // bin 2 everywhere
    ASSERT_EQ(set.size(), 2u);

    CoverageReport before = set.tracker().coverage();
    AdmissionDecision d = set.offer(tagged(3), desc(0.45, 0.45, 0.45, 0.45));
    EXPECT_EQ(d.verdict, Admission::RejectedUninformative);
    EXPECT_EQ(set.size(), 2u);
    CoverageReport after = set.tracker().coverage();
    for (int i = 0; i < kDimensionCount; ++i) EXPECT_DOUBLE_EQ(after.fraction[i], before.fraction[i]);
}

TEST(SampleSet, CoverageNeverDropsAndCountsStayConsistent) {
    SampleSet set(config(8, 5));
    cv::RNG rng(42);
    CoverageReport previous = set.tracker().coverage();
    for (int i = 0; i < 400; ++i) {
        SampleDescriptor d = desc(rng.uniform(0.1, 0.9), rng.uniform(0.1, 0.9),
                                  rng.uniform(0.0, 0.45), rng.uniform(0.0, 0.7));
        set.offer(tagged(i), d);

        ASSERT_LE(set.size(), set.capacity());
        ASSERT_TRUE(set.isConsistent());
        CoverageReport now = set.tracker().coverage();
        for (int k = 0; k < kDimensionCount; ++k) {
            ASSERT_GE(now.fraction[k], previous.fraction[k]) << "offer " << i << " dimension " << k;
        }
        previous = now;
    }
    EXPECT_EQ(set.size(), set.capacity());
}

TEST(SampleSet, ClearEmptiesSamplesAndHistograms) {
    SampleSet set(config(10, 10));
    set.offer(tagged(1), kLowA);
    set.offer(tagged(2), kHighA);
    set.clear();
    EXPECT_EQ(set.size(), 0u);
    EXPECT_EQ(set.tracker().total(Dimension::Size), 0);
    EXPECT_TRUE(set.isConsistent());
}

TEST(SampleSet, GoodEnoughByReadinessOrCount) {
    Config::Sampling cfg = config(10, 2);
    cfg.sufficientSamples = 3;
    SampleSet set(cfg);
    EXPECT_FALSE(set.goodEnough());
    set.offer(tagged(1), kLowA);
    EXPECT_FALSE(set.goodEnough());
    set.offer(tagged(2), kHighA);
    EXPECT_TRUE(set.goodEnough());      // both bins of every dimension filled

    Config::Sampling countOnly = config(10, 10);
    countOnly.sufficientSamples = 2;
    SampleSet byCount(countOnly);
    byCount.offer(tagged(1), kLowA);
    EXPECT_FALSE(byCount.goodEnough());
    byCount.offer(tagged(2), kHighA);
    EXPECT_TRUE(byCount.goodEnough());
}

TEST(SampleSet, RejectsZeroCapacity) {
    EXPECT_THROW(SampleSet set(config(0, 10)), ValidationException);
}

TEST(SampleSet, MeanMotion) {
    std::vector<cv::Point2f> a = {{0, 0}, {10, 0}};
    std::vector<cv::Point2f> b = {{3, 4}, {13, 4}};
    EXPECT_DOUBLE_EQ(meanMotion(a, a), 0.0);
    EXPECT_NEAR(meanMotion(a, b), 5.0, 1e-9);
    EXPECT_DOUBLE_EQ(meanMotion(a, {}), -1.0);
}
