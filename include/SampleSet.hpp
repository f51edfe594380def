/**
 * @file SampleSet.hpp
 * @brief Bounded set of accepted samples coupled to the coverage histograms
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <vector>
#include "Config.hpp"
#include "Coverage.hpp"
#include "Target.hpp"

/**
 * @brief Outcome of the admission policy for one descriptor
 */
enum class Admission {
    AcceptedNovel,          // populated a previously empty bin
    AcceptedRoom,           // distinct enough and set not full
    AcceptedReplacing,      // set full, displaced a less informative sample
    RejectedRedundant,      // too close to an existing sample
    RejectedUninformative   // set full and no sample worth displacing
};

const char* toString(Admission a);

inline bool isAccepted(Admission a) {
    return a == Admission::AcceptedNovel || a == Admission::AcceptedRoom ||
           a == Admission::AcceptedReplacing;
}

struct AdmissionDecision {
    Admission verdict = Admission::RejectedRedundant;
    int evictIndex = -1;        // index into samples() of the sample to displace
    double gain = 0.0;          // marginal gain of the candidate
    double nearest = -1.0;      // normalized distance to the nearest sample, -1 if none
};

/**
 * @brief Accepted observations and their histograms, mutated only together
 */
class SampleSet {
public:
    explicit SampleSet(const Config::Sampling& cfg);

    /**
     * @brief Runs the admission policy without side effects
     */
    AdmissionDecision evaluate(const SampleDescriptor& d) const;

    /**
     * @brief Runs the admission policy and applies its decision
     *
     * Eviction, histogram updates and insertion happen in one call.
     */
    AdmissionDecision offer(const Detection& detection, const SampleDescriptor& d);

    void clear();

    const std::vector<Sample>& samples() const { return samples_; }
    const CoverageTracker& tracker() const { return tracker_; }
    size_t size() const { return samples_.size(); }
    size_t capacity() const { return capacity_; }

    /**
     * @brief Normalized Euclidean distance between two descriptors
     */
    double distance(const SampleDescriptor& a, const SampleDescriptor& b) const;

    /**
     * @brief Index of the sample in the most populated bin combination, oldest first on ties
     *
     * Only samples whose removal leaves no bin empty once incoming is recorded
     * are eligible. Returns -1 if there is none.
     */
    int evictionCandidate(const SampleDescriptor& incoming) const;

    /**
     * @brief Histogram totals equal the sample count in every dimension
     */
    bool isConsistent() const;

    /**
     * @brief True when readiness reaches the threshold or enough samples were accepted
     */
    bool goodEnough() const;

private:
    bool removalKeepsCoverage(const SampleDescriptor& leaving, const SampleDescriptor& incoming) const;
    void evict(int index);

    size_t capacity_;
    double noveltyThreshold_;
    double readinessThreshold_;
    size_t sufficientSamples_;
    CoverageTracker tracker_;
    std::vector<Sample> samples_;
    uint64_t nextOrder_ = 0;
};

/**
 * @brief Mean per-point displacement between two detections of the same grid
 * @return -1 if the detections are not comparable
 */
double meanMotion(const std::vector<cv::Point2f>& a, const std::vector<cv::Point2f>& b);
