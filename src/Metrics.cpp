#include "Metrics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

// ============== Compensated Sum ==============

void CompensatedSum::add(double value) {
    double y = value - compensation;
    double t = sum + y;
    compensation = (t - sum) - y;
    sum = t;
}

// ============== Metrics Aggregator Implementation ==============

MetricsAggregator::MetricsAggregator(std::size_t elevatorCount)
    : energy_(elevatorCount) {}

void MetricsAggregator::recordEnergy(std::size_t elevatorIndex, double delta) {
    if (elevatorIndex >= energy_.size()) {
        throw std::out_of_range("Invalid elevator index: " + std::to_string(elevatorIndex));
    }
    if (!std::isfinite(delta) || delta < 0.0) {
        throw std::invalid_argument("Energy delta must be non-negative");
    }
    energy_[elevatorIndex].add(delta);
    ++energySamples_;
}

void MetricsAggregator::recordWait(int ticks) {
    if (ticks < 0) {
        throw std::invalid_argument("Wait time must be non-negative: " + std::to_string(ticks));
    }
    waitSamples_.push_back(ticks);
    waitSum_ += ticks;
    maxWait_ = std::max(maxWait_, ticks);
}

void MetricsAggregator::commitTick() {
    ++ticks_;
}

void MetricsAggregator::merge(const MetricsAggregator& other) {
    if (other.energy_.size() > energy_.size()) {
        energy_.resize(other.energy_.size());
    }
    for (std::size_t i = 0; i < other.energy_.size(); ++i) {
        energy_[i].add(other.energy_[i].sum);
    }
    energySamples_ += other.energySamples_;
    waitSamples_.insert(waitSamples_.end(), other.waitSamples_.begin(), other.waitSamples_.end());
    waitSum_ += other.waitSum_;
    maxWait_ = std::max(maxWait_, other.maxWait_);
    ticks_ += other.ticks_;
}

Metrics MetricsAggregator::snapshot() const {
    Metrics m;
    m.perElevatorEnergy.reserve(energy_.size());
    CompensatedSum total;
    for (const auto& e : energy_) {
        m.perElevatorEnergy.push_back(e.sum);
        total.add(e.sum);
    }
    m.totalEnergy = total.sum;
    m.energySampleCount = energySamples_;
    m.ticks = ticks_;
    m.meanEnergyPerTick = ticks_ > 0 ? m.totalEnergy / static_cast<double>(ticks_) : 0.0;

    m.sampleCount = waitSamples_.size();
    m.maxWaitTime = maxWait_;
    if (!waitSamples_.empty()) {
        m.meanWaitTime = static_cast<double>(waitSum_) / static_cast<double>(waitSamples_.size());

        // Nearest-rank percentile
        std::vector<int> sorted(waitSamples_);
        std::sort(sorted.begin(), sorted.end());
        auto rank = static_cast<std::size_t>(std::ceil(0.9 * static_cast<double>(sorted.size())));
        m.p90WaitTime = sorted[std::max<std::size_t>(rank, 1) - 1];
    }
    return m;
}

const std::vector<int>& MetricsAggregator::getWaitSamples() const { return waitSamples_; }
std::size_t MetricsAggregator::getElevatorCount() const { return energy_.size(); }
long MetricsAggregator::getTicks() const { return ticks_; }

// ============== Shared Metrics Sink Implementation ==============

void SharedMetricsSink::absorb(std::uint64_t seed, const MetricsAggregator& run) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(seed);
    if (it == runs_.end()) {
        runs_.emplace(seed, run);
    } else {
        it->second.merge(run);
    }
}

Metrics SharedMetricsSink::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MetricsAggregator pooled;
    for (const auto& [seed, run] : runs_) {
        pooled.merge(run);
    }
    return pooled.snapshot();
}

std::size_t SharedMetricsSink::runCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}
