#include <gtest/gtest.h>
#include "Simulation.hpp"
#include <atomic>
#include <chrono>
#include <numeric>
#include <sstream>
#include <thread>
#include <vector>

namespace {

struct RunTrace {
    std::vector<TickReport> reports;
    Metrics metrics;
};

// Steps the building while checking the per-tick invariants: population is
// conserved, car energy never decreases and matches the reported deltas,
// and every wait sample is non-negative.
RunTrace runChecked(Building& building, int ticks) {
    RunTrace trace;
    std::size_t population = building.population();
    double energySum = 0.0;
    std::vector<double> lastEnergy(static_cast<std::size_t>(building.getNumElevators()), 0.0);

    for (int t = 0; t < ticks; ++t) {
        TickReport r = building.tick();

        EXPECT_EQ(r.population + static_cast<std::size_t>(r.departures),
                  population + static_cast<std::size_t>(r.arrivals)) << "tick " << r.tick;
        EXPECT_EQ(r.population, building.population());
        population = r.population;

        EXPECT_GE(r.energyDelta, 0.0);
        energySum += r.energyDelta;
        double carTotal = 0.0;
        for (int e = 0; e < building.getNumElevators(); ++e) {
            double energy = building.getElevator(e).getCumulativeEnergy();
            EXPECT_GE(energy, lastEnergy[static_cast<std::size_t>(e)]);
            lastEnergy[static_cast<std::size_t>(e)] = energy;
            carTotal += energy;
        }
        EXPECT_NEAR(carTotal, energySum, 1e-6);

        for (int w : r.waitSamples) {
            EXPECT_GE(w, 0);
        }
        trace.reports.push_back(std::move(r));
    }

    trace.metrics = building.snapshot();
    EXPECT_NEAR(trace.metrics.totalEnergy, energySum, 1e-6);
    return trace;
}

ScenarioOptions busyOptions(std::uint64_t seed, DispatchMode mode) {
    ScenarioOptions options;
    options.numFloors = 12;
    options.numElevators = 3;
    options.numDoors = 2;
    options.arrivalProbability = 0.6;
    options.requestProbability = 0.1;
    options.leaveProbability = 0.08;
    options.dispatchMode = mode;
    options.seed = seed;
    return options;
}

} // namespace

// ============== Invariant Tests ==============

TEST(StressTest, InvariantsAcrossSeedsAndModes) {
    for (DispatchMode mode : {DispatchMode::DoorWeighted, DispatchMode::Nearest, DispatchMode::RoundRobin}) {
        for (std::uint64_t seed = 1; seed <= 10; ++seed) {
            Building building(buildConfig(busyOptions(seed, mode)));
            RunTrace trace = runChecked(building, 400);

            std::size_t samples = 0;
            for (const auto& r : trace.reports) {
                samples += r.waitSamples.size();
            }
            EXPECT_EQ(trace.metrics.sampleCount, samples);
            EXPECT_EQ(trace.metrics.ticks, 400);
        }
    }
}

TEST(StressTest, PoissonCrowdWithSmallCars) {
    BuildingConfig config = buildConfig(busyOptions(77, DispatchMode::Nearest));
    for (auto& door : config.doors) {
        door.arrivalModel = ArrivalModel::Poisson;
        door.arrivalProbability = 1.5;
    }
    for (auto& elev : config.elevators) {
        elev.capacity = 2;
    }

    Building building(config);
    RunTrace trace = runChecked(building, 1500);
    EXPECT_GT(trace.metrics.sampleCount, 0u);
    EXPECT_GE(trace.metrics.maxWaitTime, static_cast<int>(trace.metrics.p90WaitTime));
}

// ============== Determinism Tests ==============

TEST(StressTest, SameSeedSameTrajectory) {
    for (DispatchMode mode : {DispatchMode::DoorWeighted, DispatchMode::Nearest, DispatchMode::RoundRobin}) {
        BuildingConfig config = buildConfig(busyOptions(2024, mode));
        Building a(config);
        Building b(config);

        RunTrace first = runChecked(a, 500);
        RunTrace second = runChecked(b, 500);

        ASSERT_EQ(first.reports.size(), second.reports.size());
        for (std::size_t i = 0; i < first.reports.size(); ++i) {
            EXPECT_EQ(first.reports[i], second.reports[i]) << "diverged at tick " << i;
        }
        EXPECT_EQ(first.metrics.totalEnergy, second.metrics.totalEnergy);
        EXPECT_EQ(first.metrics.meanWaitTime, second.metrics.meanWaitTime);
    }
}

TEST(StressTest, DifferentSeedsDiverge) {
    Building a(buildConfig(busyOptions(1, DispatchMode::DoorWeighted)));
    Building b(buildConfig(busyOptions(2, DispatchMode::DoorWeighted)));

    RunTrace first = runChecked(a, 300);
    RunTrace second = runChecked(b, 300);
    EXPECT_NE(first.reports, second.reports);
}

TEST(StressTest, LoggingDoesNotChangeTrajectory) {
    BuildingConfig config = buildConfig(busyOptions(5, DispatchMode::DoorWeighted));
    Building quiet(config);
    config.verbose = true;
    std::ostringstream sink;
    Building noisy(config, sink);

    RunTrace first = runChecked(quiet, 200);
    RunTrace second = runChecked(noisy, 200);
    EXPECT_EQ(first.reports, second.reports);
    EXPECT_FALSE(sink.str().empty());
}

// ============== Long Horizon Tests ==============

TEST(StressTest, DrainsAfterDoorsClose) {
    BuildingConfig config = buildConfig(busyOptions(31, DispatchMode::Nearest));
    for (auto& door : config.doors) {
        door.schedule = {ArrivalPhase{300, 0.0}};
    }

    Building building(config);
    RunSummary summary = building.runUntilDrained(50000);

    EXPECT_TRUE(summary.drained);
    EXPECT_LT(summary.ticksRun, 50000);
    EXPECT_GT(summary.totalArrivals, 0);
    EXPECT_EQ(summary.totalArrivals, summary.totalDepartures);
    EXPECT_EQ(summary.finalPopulation, 0u);
    EXPECT_TRUE(building.isDrained());
}

TEST(StressTest, LongHorizonEnergyStaysExact) {
    ScenarioOptions options = busyOptions(9, DispatchMode::RoundRobin);
    options.energyUp = 0.1;
    options.energyDown = 0.05;
    options.energyPerPassenger = 0.01;
    Building building(buildConfig(options));
    RunTrace trace = runChecked(building, 20000);

    // Cars and the aggregator accumulate identically, so they agree to the bit
    for (int e = 0; e < building.getNumElevators(); ++e) {
        EXPECT_EQ(building.getElevator(e).getCumulativeEnergy(),
                  trace.metrics.perElevatorEnergy[static_cast<std::size_t>(e)]) << "car " << e;
    }

    double perCar = std::accumulate(trace.metrics.perElevatorEnergy.begin(),
                                    trace.metrics.perElevatorEnergy.end(), 0.0);
    EXPECT_NEAR(perCar, trace.metrics.totalEnergy, 1e-6);
    EXPECT_NEAR(trace.metrics.meanEnergyPerTick, trace.metrics.totalEnergy / 20000.0, 1e-9);
}

// ============== Concurrent Run Tests ==============

TEST(StressTest, IndependentBuildingsOnThreads) {
    BuildingConfig config = buildConfig(busyOptions(11, DispatchMode::DoorWeighted));
    const int numThreads = 4;
    std::vector<Metrics> results(numThreads);
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&config, &results, t]() {
            Building building(config);
            results[static_cast<std::size_t>(t)] = building.run(600).metrics;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int t = 1; t < numThreads; ++t) {
        EXPECT_EQ(results[static_cast<std::size_t>(t)].totalEnergy, results[0].totalEnergy);
        EXPECT_EQ(results[static_cast<std::size_t>(t)].sampleCount, results[0].sampleCount);
    }
}

TEST(StressTest, BatchMatchesSerialRuns) {
    BuildingConfig config = buildConfig(busyOptions(0, DispatchMode::Nearest));
    std::vector<std::uint64_t> seeds{3, 1, 4, 15, 9, 2, 6, 5};

    BatchRunner runner(config, 4);
    BatchResult batch = runner.run(seeds, 300, false);

    ASSERT_EQ(batch.runs.size(), seeds.size());
    EXPECT_FALSE(batch.cancelled);
    for (std::size_t i = 1; i < batch.runs.size(); ++i) {
        EXPECT_LT(batch.runs[i - 1].first, batch.runs[i].first);
    }

    for (const auto& [seed, summary] : batch.runs) {
        BuildingConfig serial = config;
        serial.seed = seed;
        Building building(serial);
        RunSummary expected = building.run(300);

        EXPECT_EQ(summary.metrics.totalEnergy, expected.metrics.totalEnergy) << "seed " << seed;
        EXPECT_EQ(summary.metrics.sampleCount, expected.metrics.sampleCount) << "seed " << seed;
        EXPECT_EQ(summary.totalArrivals, expected.totalArrivals) << "seed " << seed;
    }
}

TEST(StressTest, PooledMetricsIndependentOfThreadCount) {
    BuildingConfig config = buildConfig(busyOptions(0, DispatchMode::DoorWeighted));
    std::vector<std::uint64_t> seeds(12);
    std::iota(seeds.begin(), seeds.end(), 100);

    BatchRunner single(config, 1);
    BatchRunner many(config, 6);
    Metrics a = single.run(seeds, 250, false).pooled;
    Metrics b = many.run(seeds, 250, false).pooled;

    EXPECT_EQ(a.sampleCount, b.sampleCount);
    EXPECT_EQ(a.totalEnergy, b.totalEnergy);
    EXPECT_EQ(a.meanWaitTime, b.meanWaitTime);
    EXPECT_EQ(a.p90WaitTime, b.p90WaitTime);
    EXPECT_EQ(a.ticks, 12 * 250);
}

TEST(StressTest, RunnerReusableAfterCancel) {
    BatchRunner runner(buildConfig(busyOptions(0, DispatchMode::Nearest)), 2);
    runner.cancel();
    EXPECT_TRUE(runner.isCancelled());

    // A new batch starts uncancelled
    BatchResult result = runner.run({1, 2, 3}, 100, false);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.runs.size(), 3u);
    EXPECT_FALSE(runner.isCancelled());
}

TEST(StressTest, CancelMidBatch) {
    BatchRunner runner(buildConfig(busyOptions(0, DispatchMode::DoorWeighted)), 2);
    std::vector<std::uint64_t> seeds(64);
    std::iota(seeds.begin(), seeds.end(), 1);

    std::thread canceller([&runner]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        runner.cancel();
    });
    BatchResult result = runner.run(seeds, 5000, false);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_LE(result.runs.size(), seeds.size());
    for (const auto& [seed, summary] : result.runs) {
        EXPECT_LE(summary.ticksRun, 5000);
    }

    BatchResult again = runner.run({7, 8}, 50, false);
    EXPECT_FALSE(again.cancelled);
    EXPECT_EQ(again.runs.size(), 2u);
}

TEST(StressTest, BatchPropagatesConfigurationErrors) {
    BuildingConfig config = buildConfig(busyOptions(0, DispatchMode::Nearest));
    config.floorCount = 0;

    BatchRunner runner(config, 3);
    EXPECT_THROW(runner.run({1, 2, 3, 4}, 10, false), InvalidConfiguration);
}

// ============== Main ==============

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
