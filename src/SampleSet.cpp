/**
 * @file SampleSet.cpp
 * @brief Implementation of the sample admission policy
 */

#include "SampleSet.hpp"
#include "Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

const char* toString(Admission a) {
    switch (a) {
        case Admission::AcceptedNovel:         return "accepted (novel)";
        case Admission::AcceptedRoom:          return "accepted";
        case Admission::AcceptedReplacing:     return "accepted (replacing)";
        case Admission::RejectedRedundant:     return "rejected (redundant)";
        case Admission::RejectedUninformative: return "rejected (uninformative)";
    }
    return "unknown";
}

SampleSet::SampleSet(const Config::Sampling& cfg)
    : capacity_(static_cast<size_t>(cfg.capacity)),
      noveltyThreshold_(cfg.noveltyThreshold),
      readinessThreshold_(cfg.readinessThreshold),
      sufficientSamples_(static_cast<size_t>(std::max(0, cfg.sufficientSamples))),
      tracker_(cfg) {
    require(cfg.capacity > 0, "sample capacity must be > 0");
    samples_.reserve(capacity_);
}

double SampleSet::distance(const SampleDescriptor& a, const SampleDescriptor& b) const {
    double sum = 0.0;
    for (int i = 0; i < kDimensionCount; ++i) {
        Dimension dim = static_cast<Dimension>(i);
        double d = tracker_.normalize(dim, descriptorValue(a, dim)) -
                   tracker_.normalize(dim, descriptorValue(b, dim));
        sum += d * d;
    }
    return std::sqrt(sum);
}

bool SampleSet::removalKeepsCoverage(const SampleDescriptor& leaving, const SampleDescriptor& incoming) const {
    for (int i = 0; i < kDimensionCount; ++i) {
        Dimension dim = static_cast<Dimension>(i);
        int bin = tracker_.binIndex(dim, descriptorValue(leaving, dim));
        if (tracker_.count(dim, bin) <= 1 && bin != tracker_.binIndex(dim, descriptorValue(incoming, dim)))
            return false;
    }
    return true;
}

int SampleSet::evictionCandidate(const SampleDescriptor& incoming) const {
    int best = -1;
    int bestCrowding = -1;
    uint64_t bestOrder = std::numeric_limits<uint64_t>::max();
    for (size_t i = 0; i < samples_.size(); ++i) {
        if (!removalKeepsCoverage(samples_[i].descriptor, incoming)) continue;
        int c = tracker_.crowding(samples_[i].descriptor);
        if (c > bestCrowding || (c == bestCrowding && samples_[i].order < bestOrder)) {
            best = static_cast<int>(i);
            bestCrowding = c;
            bestOrder = samples_[i].order;
        }
    }
    return best;
}

AdmissionDecision SampleSet::evaluate(const SampleDescriptor& d) const {
    AdmissionDecision out;
    out.gain = tracker_.marginalGain(d);

    double nearest = std::numeric_limits<double>::infinity();
    for (const auto& s : samples_) nearest = std::min(nearest, distance(d, s.descriptor));
    out.nearest = samples_.empty() ? -1.0 : nearest;

    const bool full = samples_.size() >= capacity_;

    // 1. New information in any histogram
    if (tracker_.emptyBinsFilled(d) > 0) {
        if (!full) {
            out.verdict = Admission::AcceptedNovel;
            return out;
        }
        out.evictIndex = evictionCandidate(d);
        out.verdict = out.evictIndex >= 0 ? Admission::AcceptedNovel : Admission::RejectedUninformative;
        return out;
    }

    // 2. Too close to something we already hold
    if (!samples_.empty() && nearest < noveltyThreshold_) {
        out.verdict = Admission::RejectedRedundant;
        return out;
    }

    // 3. Room left
    if (!full) {
        out.verdict = Admission::AcceptedRoom;
        return out;
    }

    // 4. Displace the least informative sample if strictly better
    int candidate = evictionCandidate(d);
    if (candidate >= 0 &&
        out.gain > tracker_.marginalContribution(samples_[candidate].descriptor)) {
        out.verdict = Admission::AcceptedReplacing;
        out.evictIndex = candidate;
        return out;
    }
    out.verdict = Admission::RejectedUninformative;
    return out;
}

void SampleSet::evict(int index) {
    tracker_.unrecord(samples_[index].descriptor);
    samples_.erase(samples_.begin() + index);
}

AdmissionDecision SampleSet::offer(const Detection& detection, const SampleDescriptor& d) {
    AdmissionDecision decision = evaluate(d);
    if (!isAccepted(decision.verdict)) return decision;

    if (decision.evictIndex >= 0) evict(decision.evictIndex);

    Sample s;
    s.detection = detection;
    s.descriptor = d;
    s.order = nextOrder_++;
    tracker_.record(d);
    samples_.push_back(std::move(s));
    return decision;
}

void SampleSet::clear() {
    samples_.clear();
    tracker_.reset();
    nextOrder_ = 0;
}

bool SampleSet::isConsistent() const {
    for (int i = 0; i < kDimensionCount; ++i) {
        if (tracker_.total(static_cast<Dimension>(i)) != static_cast<int>(samples_.size()))
            return false;
    }
    return samples_.size() <= capacity_;
}

bool SampleSet::goodEnough() const {
    if (samples_.empty()) return false;
    if (sufficientSamples_ > 0 && samples_.size() >= sufficientSamples_) return true;
    return tracker_.coverage().readiness >= readinessThreshold_;
}

double meanMotion(const std::vector<cv::Point2f>& a, const std::vector<cv::Point2f>& b) {
    if (a.empty() || a.size() != b.size()) return -1.0;
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) sum += cv::norm(a[i] - b[i]);
    return sum / static_cast<double>(a.size());
}
