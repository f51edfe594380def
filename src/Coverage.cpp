/**
 * @file Coverage.cpp
 * @brief Implementation of the coverage histograms
 */

#include "Coverage.hpp"
#include "Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

const char* toString(Dimension d) {
    switch (d) {
        case Dimension::X:    return "X";
        case Dimension::Y:    return "Y";
        case Dimension::Size: return "Size";
        case Dimension::Skew: return "Skew";
    }
    return "?";
}

double descriptorValue(const SampleDescriptor& d, Dimension dim) {
    switch (dim) {
        case Dimension::X:    return d.x;
        case Dimension::Y:    return d.y;
        case Dimension::Size: return d.size;
        case Dimension::Skew: return d.skew;
    }
    return 0.0;
}

CoverageTracker::CoverageTracker(const Config::Sampling& cfg)
    : bins_(cfg.bins),
      ranges_{cfg.xRange, cfg.yRange, cfg.sizeRange, cfg.skewRange} {
    require(bins_ > 0, "histogram bin count must be > 0");
    for (const auto& r : ranges_) {
        require(r.hi > r.lo, "histogram range must have hi > lo");
    }
    reset();
}

const Config::Range& CoverageTracker::rangeOf(Dimension dim) const {
    return ranges_[static_cast<int>(dim)];
}

double CoverageTracker::normalize(Dimension dim, double value) const {
    const auto& r = rangeOf(dim);
    double t = (value - r.lo) / (r.hi - r.lo);
    if (!std::isfinite(t)) return 0.0;
    return std::min(1.0, std::max(0.0, t));
}

int CoverageTracker::binIndex(Dimension dim, double value) const {
    int b = static_cast<int>(std::floor(normalize(dim, value) * bins_));
    return std::min(bins_ - 1, std::max(0, b));
}

void CoverageTracker::record(const SampleDescriptor& d) {
    for (int i = 0; i < kDimensionCount; ++i) {
        Dimension dim = static_cast<Dimension>(i);
        ++counts_[i][binIndex(dim, descriptorValue(d, dim))];
    }
}

void CoverageTracker::unrecord(const SampleDescriptor& d) {
    for (int i = 0; i < kDimensionCount; ++i) {
        Dimension dim = static_cast<Dimension>(i);
        int& c = counts_[i][binIndex(dim, descriptorValue(d, dim))];
        if (c > 0) {
            --c;
        } else {
            std::cerr << "Coverage: unrecord on empty " << toString(dim) << " bin ignored\n";
        }
    }
}

void CoverageTracker::reset() {
    for (auto& h : counts_) h.assign(bins_, 0);
}

CoverageReport CoverageTracker::coverage() const {
    CoverageReport report;
    double weakest = 1.0;
    for (int i = 0; i < kDimensionCount; ++i) {
        int filled = static_cast<int>(std::count_if(counts_[i].begin(), counts_[i].end(),
                                                    [](int c) { return c > 0; }));
        report.fraction[i] = static_cast<double>(filled) / bins_;
        weakest = std::min(weakest, report.fraction[i]);
    }
    report.readiness = weakest;
    return report;
}

int CoverageTracker::count(Dimension dim, int bin) const {
    if (bin < 0 || bin >= bins_) return 0;
    return counts_[static_cast<int>(dim)][bin];
}

int CoverageTracker::total(Dimension dim) const {
    const auto& h = counts_[static_cast<int>(dim)];
    int sum = 0;
    for (int c : h) sum += c;
    return sum;
}

int CoverageTracker::emptyBinsFilled(const SampleDescriptor& d) const {
    int filled = 0;
    for (int i = 0; i < kDimensionCount; ++i) {
        Dimension dim = static_cast<Dimension>(i);
        if (counts_[i][binIndex(dim, descriptorValue(d, dim))] == 0) ++filled;
    }
    return filled;
}

double CoverageTracker::marginalGain(const SampleDescriptor& d) const {
    double gain = 0.0;
    for (int i = 0; i < kDimensionCount; ++i) {
        Dimension dim = static_cast<Dimension>(i);
        gain += 1.0 / (counts_[i][binIndex(dim, descriptorValue(d, dim))] + 1);
    }
    return gain;
}

double CoverageTracker::marginalContribution(const SampleDescriptor& d) const {
    double contribution = 0.0;
    for (int i = 0; i < kDimensionCount; ++i) {
        Dimension dim = static_cast<Dimension>(i);
        int c = counts_[i][binIndex(dim, descriptorValue(d, dim))];
        contribution += 1.0 / std::max(1, c);
    }
    return contribution;
}

int CoverageTracker::crowding(const SampleDescriptor& d) const {
    int sum = 0;
    for (int i = 0; i < kDimensionCount; ++i) {
        Dimension dim = static_cast<Dimension>(i);
        sum += counts_[i][binIndex(dim, descriptorValue(d, dim))];
    }
    return sum;
}
