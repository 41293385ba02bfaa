#ifndef METRICS_HPP
#define METRICS_HPP

#include "Types.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

// ============== Compensated Sum ==============
// Kahan summation. Shared by the cars and the aggregator so both report
// bit-identical energy totals.

struct CompensatedSum {
    double sum = 0.0;
    double compensation = 0.0;
    void add(double value);
};

// ============== Metrics Aggregator ==============
// Append-only accumulator for one run. Energy totals use compensated
// summation so long horizons do not drift.

class MetricsAggregator {
private:
    std::vector<CompensatedSum> energy_;
    std::size_t energySamples_ = 0;
    std::vector<int> waitSamples_;
    long long waitSum_ = 0;
    int maxWait_ = 0;
    long ticks_ = 0;

public:
    explicit MetricsAggregator(std::size_t elevatorCount = 0);

    // Recording (tick orchestrator only)
    void recordEnergy(std::size_t elevatorIndex, double delta);
    void recordWait(int ticks);
    void commitTick();

    // Folds another run's samples into this one. Order of merges does not
    // change counts, sums or percentiles.
    void merge(const MetricsAggregator& other);

    // Queries
    Metrics snapshot() const;
    const std::vector<int>& getWaitSamples() const;
    std::size_t getElevatorCount() const;
    long getTicks() const;
};

// ============== Shared Metrics Sink ==============
// Collects results from independent runs executing on different
// threads. Contributions are keyed by seed and reduced in seed order,
// so the pooled figures do not depend on completion order.

class SharedMetricsSink {
private:
    std::map<std::uint64_t, MetricsAggregator> runs_;
    mutable std::mutex mutex_;

public:
    SharedMetricsSink() = default;

    SharedMetricsSink(const SharedMetricsSink&) = delete;
    SharedMetricsSink& operator=(const SharedMetricsSink&) = delete;

    void absorb(std::uint64_t seed, const MetricsAggregator& run);
    Metrics snapshot() const;
    std::size_t runCount() const;
};

#endif // METRICS_HPP
