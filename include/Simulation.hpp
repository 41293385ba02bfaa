#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include "Metrics.hpp"
#include "Probability.hpp"
#include "Scheduler.hpp"
#include "WorkQueue.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// ============== Logger ==============

class Logger {
private:
    mutable std::mutex mutex_;
    std::ostream& out_;
    bool enabled_;
    const int* tickRef_ = nullptr;  // Reference to current tick

public:
    explicit Logger(std::ostream& out = std::cout, bool enabled = true);

    void setTickReference(const int* tick);

    void log(const std::string& message);
    void logArrival(const Person& person, const Door& door);
    void logRequest(const Person& person, const Elevator& elev);
    void logBoarding(int personId, const Elevator& elev, int wait);
    void logAlighting(int personId, const Elevator& elev);
    void logDeparture(int personId);
    void logElevatorState(const Elevator& elev);

    void enable();
    void disable();
    bool isEnabled() const;

private:
    std::string getTimestamp() const;
};

// ============== Building ==============
// Owns every Floor, Elevator and Door of one run and advances them one
// tick at a time. Each tick runs arrival, dispatch, elevator step, floor
// transition and exit phases in that order, then commits metrics.

class Building {
public:
    using StopPredicate = std::function<bool(const TickReport&)>;

private:
    BuildingConfig config_;
    ProbabilityModel model_;
    std::vector<Floor> floors_;
    std::vector<Elevator> elevators_;
    std::vector<Door> doors_;
    std::vector<double> arrivalDestinations_;
    std::unique_ptr<IDispatchPolicy> dispatch_;
    MetricsAggregator metrics_;
    Logger logger_;

    int currentTick_ = 0;
    int nextPersonId_ = 0;
    long totalArrivals_ = 0;
    long totalDepartures_ = 0;

public:
    // Throws InvalidConfiguration (or its InvalidDistribution subclass)
    explicit Building(const BuildingConfig& config, std::ostream& logOut = std::cout);

    // Non-copyable
    Building(const Building&) = delete;
    Building& operator=(const Building&) = delete;

    // Simulation
    TickReport tick();
    RunSummary run(int nTicks);
    RunSummary run(int maxTicks, const StopPredicate& shouldStop);
    // Drain mode: stops once no one is inside and no car has work left
    RunSummary runUntilDrained(int maxTicks, const StopPredicate& shouldStop = nullptr);

    // External request to a specific car. InvalidFloor leaves it unchanged.
    void request(int elevatorIndex, int fromFloor, int targetFloor);

    // Status
    void printStatus(std::ostream& out) const;
    int getCurrentTick() const;
    std::size_t population() const;
    std::size_t pendingRequests() const;
    bool isDrained() const;

    // Accessors
    int getNumFloors() const;
    int getNumElevators() const;
    int getNumDoors() const;
    const BuildingConfig& getConfig() const;
    const Floor& getFloor(int index) const;
    const Elevator& getElevator(int index) const;
    const Door& getDoor(int index) const;
    const MetricsAggregator& getMetricsAggregator() const;
    Metrics snapshot() const;
    const IDispatchPolicy& getDispatchPolicy() const;

private:
    void validateConfig() const;
    void arrivalPhase(TickReport& report);
    void dispatchPhase(TickReport& report);
    void elevatorPhase(TickReport& report);
    void transitionPhase(TickReport& report);
    void exitPhase(TickReport& report);
    void issueRequest(Person& person, TickReport& report);
    RunSummary summarize(int ticksRun, bool stopped) const;
};

// ============== Scenario Options ==============
// Flat knobs for a uniform building, as filled in by the CLI.

struct ScenarioOptions {
    int numFloors = 10;
    int numElevators = 3;
    int numDoors = 1;
    double arrivalProbability = 0.3;
    double requestProbability = 0.05;  // Idle resident calls a car to another floor
    double leaveProbability = 0.05;    // Head for the ground floor / exit the building
    double energyUp = 5.0;
    double energyDown = 2.5;
    double energyPerPassenger = 0.5;
    DispatchMode dispatchMode = DispatchMode::DoorWeighted;
    WeightingKind weighting = WeightingKind::InverseDistance;
    std::uint64_t seed = 42;
    int ticks = 200;
    bool drain = false;
    int runs = 1;
    int threads = 0;                   // 0 = hardware concurrency
    bool verbose = false;
};

// Shafts spaced along y = 0, doors along y = 5, uniform destinations.
BuildingConfig buildConfig(const ScenarioOptions& options);

// ============== Batch Runner ==============
// Runs one isolated Building per seed across worker threads.

struct BatchResult {
    std::vector<std::pair<std::uint64_t, RunSummary>> runs;  // Ordered by seed
    Metrics pooled;
    bool cancelled = false;
};

class BatchRunner {
private:
    BuildingConfig base_;
    int threads_;
    std::atomic<bool> cancelled_{false};

public:
    BatchRunner(const BuildingConfig& base, int threads);

    // Non-copyable
    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;

    // Blocks until every seed has run or the batch is cancelled. An
    // exception thrown by any run is rethrown here after all workers join.
    // Each call starts uncancelled, so the runner can be reused.
    BatchResult run(const std::vector<std::uint64_t>& seeds, int ticks, bool drain);

    // Stops every run of the batch in progress after its current tick
    void cancel();
    bool isCancelled() const;
};

#endif // SIMULATION_HPP
