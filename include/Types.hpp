#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ============== Enums =============

enum class Direction {
    Up,
    Down,
    Idle
};

enum class TransitionKind {
    Stay,           // Remain on the current floor this tick
    RequestFloor,   // Call an elevator to another floor
    Leave           // Exit the building (ground floor only)
};

enum class DispatchMode {
    DoorWeighted,   // Categorical draw over the entry door's elevator weights
    Nearest,        // Closest car by current floor
    RoundRobin
};

enum class WeightingKind {
    InverseDistance,
    ExponentialDecay
};

enum class ArrivalModel {
    Bernoulli,      // At most one arrival per tick
    Poisson         // Arrival count per tick ~ Poisson(probability)
};

// ============== Geometry ==============

struct Position {
    double x = 0.0;
    double y = 0.0;
};

// Maps a door-to-shaft distance onto a non-negative weight.
// Must be monotonically decreasing in distance.
using DistanceWeighting = std::function<double(double)>;

// ============== Configuration ==============

struct ElevatorConfig {
    std::string name;
    Position position;                  // Shaft location on the ground plan
    int startFloor = 0;
    std::optional<int> restingFloor;    // Where an idle, empty car parks
    double energyUp = 1.0;              // Per floor moved upward
    double energyDown = 1.0;            // Per floor moved downward
    double energyPerPassenger = 0.0;    // Added per floor for each rider
    int capacity = 0;                   // 0 = unlimited
};

struct ArrivalPhase {
    int startTick = 0;
    double probability = 0.0;
};

struct DoorConfig {
    std::string name;
    Position position;
    double arrivalProbability = 0.0;
    ArrivalModel arrivalModel = ArrivalModel::Bernoulli;
    std::vector<ArrivalPhase> schedule;  // Overrides arrivalProbability from each startTick on
    WeightingKind weighting = WeightingKind::InverseDistance;
    double weightingScale = 1.0;
    DistanceWeighting customWeighting;   // Takes precedence over `weighting` when set
};

// Per-tick behaviour of an idle resident. `requestFloor` is indexed by
// floor and may be left empty (all zero). Entries must sum to 1.
struct FloorDistribution {
    double stay = 1.0;
    std::vector<double> requestFloor;
    double leave = 0.0;
};

struct BuildingConfig {
    int floorCount = 2;
    std::vector<ElevatorConfig> elevators;
    std::vector<DoorConfig> doors;
    std::vector<FloorDistribution> floorDistributions;  // Empty = everyone stays
    std::vector<double> arrivalDestinations;            // Indexed by floor; empty = uniform over upper floors
    DispatchMode dispatchMode = DispatchMode::DoorWeighted;
    std::uint64_t seed = 0;
    bool verbose = false;
};

// ============== Results ==============

struct Metrics {
    double totalEnergy = 0.0;
    std::vector<double> perElevatorEnergy;
    double meanWaitTime = 0.0;
    std::size_t sampleCount = 0;
    int maxWaitTime = 0;
    double p90WaitTime = 0.0;
    std::size_t energySampleCount = 0;
    long ticks = 0;
    double meanEnergyPerTick = 0.0;
};

struct TickReport {
    int tick = 0;
    int arrivals = 0;
    int departures = 0;
    int requests = 0;
    int boardings = 0;
    int alightings = 0;
    double energyDelta = 0.0;
    std::vector<int> waitSamples;
    std::vector<int> elevatorFloors;
    std::size_t population = 0;

    bool operator==(const TickReport& other) const {
        return tick == other.tick && arrivals == other.arrivals &&
               departures == other.departures && requests == other.requests &&
               boardings == other.boardings && alightings == other.alightings &&
               energyDelta == other.energyDelta && waitSamples == other.waitSamples &&
               elevatorFloors == other.elevatorFloors && population == other.population;
    }
    bool operator!=(const TickReport& other) const { return !(*this == other); }
};

struct RunSummary {
    int ticksRun = 0;
    bool drained = false;
    bool stopped = false;           // Ended early by an external stop condition
    long totalArrivals = 0;
    long totalDepartures = 0;
    std::size_t finalPopulation = 0;
    Metrics metrics;
};

// ============== Errors ==============

class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& what) : std::runtime_error(what) {}
};

class InvalidConfiguration : public SimulationError {
public:
    explicit InvalidConfiguration(const std::string& what) : SimulationError(what) {}
};

// A distribution is configuration, so construction-time failures are
// catchable as either kind.
class InvalidDistribution : public InvalidConfiguration {
public:
    explicit InvalidDistribution(const std::string& what) : InvalidConfiguration(what) {}
};

class EmptyElevatorSet : public InvalidConfiguration {
public:
    explicit EmptyElevatorSet(const std::string& what) : InvalidConfiguration(what) {}
};

class InvalidFloor : public SimulationError {
public:
    explicit InvalidFloor(const std::string& what) : SimulationError(what) {}
};

class PersonNotFound : public SimulationError {
public:
    explicit PersonNotFound(const std::string& what) : SimulationError(what) {}
};

class InvalidTransition : public SimulationError {
public:
    explicit InvalidTransition(const std::string& what) : SimulationError(what) {}
};

// ============== Utility Functions ==============

inline std::string directionToString(Direction dir) {
    switch (dir) {
        case Direction::Up: return "Up";
        case Direction::Down: return "Down";
        case Direction::Idle: return "Idle";
    }
    return "Unknown";
}

inline std::string transitionToString(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::Stay: return "Stay";
        case TransitionKind::RequestFloor: return "RequestFloor";
        case TransitionKind::Leave: return "Leave";
    }
    return "Unknown";
}

inline std::string dispatchModeToString(DispatchMode mode) {
    switch (mode) {
        case DispatchMode::DoorWeighted: return "weighted";
        case DispatchMode::Nearest: return "nearest";
        case DispatchMode::RoundRobin: return "round-robin";
    }
    return "unknown";
}

inline std::string weightingToString(WeightingKind kind) {
    switch (kind) {
        case WeightingKind::InverseDistance: return "inverse";
        case WeightingKind::ExponentialDecay: return "exponential";
    }
    return "unknown";
}

#endif // TYPES_HPP
