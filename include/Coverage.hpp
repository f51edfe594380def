/**
 * @file Coverage.hpp
 * @brief Per-dimension histograms over accepted sample descriptors
 * @date 2025
 */

#pragma once

#include <array>
#include <string>
#include <vector>
#include "Config.hpp"
#include "Target.hpp"

/**
 * @brief Descriptor dimensions tracked by the coverage histograms
 */
enum class Dimension { X = 0, Y = 1, Size = 2, Skew = 3 };

constexpr int kDimensionCount = 4;

const char* toString(Dimension d);

double descriptorValue(const SampleDescriptor& d, Dimension dim);

/**
 * @brief Coverage fractions for presentation
 */
struct CoverageReport {
    std::array<double, kDimensionCount> fraction{};
    double readiness = 0.0;     // weakest dimension
};

/**
 * @brief Fixed-bin histograms, one per descriptor dimension
 *
 * Every record() must be paired with the insertion of one sample and every
 * unrecord() with its removal; SampleSet owns that pairing.
 */
class CoverageTracker {
public:
    explicit CoverageTracker(const Config::Sampling& cfg);

    int bins() const { return bins_; }

    /**
     * @brief Quantizes value into one of the equal-width bins of the dimension's range
     *
     * Values outside the range land in the first or last bin.
     */
    int binIndex(Dimension dim, double value) const;

    /**
     * @brief Maps value to [0,1] over the dimension's range, clamped
     */
    double normalize(Dimension dim, double value) const;

    void record(const SampleDescriptor& d);

    /**
     * @brief Removes one contribution; counters never drop below zero
     */
    void unrecord(const SampleDescriptor& d);

    void reset();

    CoverageReport coverage() const;

    int count(Dimension dim, int bin) const;
    int total(Dimension dim) const;

    /// Number of currently empty bins that recording d would populate
    int emptyBinsFilled(const SampleDescriptor& d) const;

    /// Sum over dimensions of 1 / (count(bin) + 1), for a descriptor not yet recorded
    double marginalGain(const SampleDescriptor& d) const;

    /// Sum over dimensions of 1 / count(bin), for a descriptor already recorded
    double marginalContribution(const SampleDescriptor& d) const;

    /// Sum over dimensions of the population of the descriptor's bins
    int crowding(const SampleDescriptor& d) const;

private:
    const Config::Range& rangeOf(Dimension dim) const;

    int bins_;
    std::array<Config::Range, kDimensionCount> ranges_;
    std::array<std::vector<int>, kDimensionCount> counts_;
};
