#ifndef DOMAIN_HPP
#define DOMAIN_HPP

#include "Types.hpp"
#include "Probability.hpp"
#include "Metrics.hpp"
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// ============== Person ==============
// Lives in exactly one Floor or Elevator; moved between them by value.

struct Person {
    int id = -1;
    int floor = 0;                          // Current floor, or boarding floor while riding
    int doorIndex = 0;                      // Door used to enter the building
    std::optional<int> destination;         // Set while waiting or riding
    std::optional<int> assignedElevator;    // Set once a request has been dispatched
    std::optional<int> waitStartTick;       // Set at request, cleared at boarding
    int settledTick = -1;                   // Tick of the last arrival or alighting

    bool isWaiting() const { return destination.has_value(); }
    bool isAwaitingDispatch() const { return destination.has_value() && !assignedElevator.has_value(); }
};

struct Transition {
    TransitionKind kind = TransitionKind::Stay;
    int targetFloor = -1;
};

// ============== Floor ==============

class Floor {
private:
    int index_;
    std::vector<double> weights_;   // [stay, request(0..N-1), leave]
    std::unordered_map<int, Person> residents_;

public:
    // Throws InvalidDistribution if the distribution does not sum to 1,
    // allows Leave off the ground floor, or requests the floor itself.
    Floor(int index, int floorCount, const FloorDistribution& distribution);

    int getIndex() const;
    bool isGround() const;

    // Residents
    void admit(Person person);
    Person remove(int personId);
    bool contains(int personId) const;
    Person& getPerson(int personId);
    const Person& getPerson(int personId) const;
    std::size_t size() const;
    bool empty() const;

    // Ascending ids, so iteration order does not depend on hashing
    std::vector<int> residentIds() const;
    std::vector<int> waitingFor(int elevatorIndex) const;
    std::size_t waitingCount() const;
    std::size_t unassignedCount() const;

    Transition sampleTransition(const Person& person, ProbabilityModel& model) const;
    const std::vector<double>& getTransitionWeights() const;
};

// ============== Elevator ==============

struct ElevatorStepReport {
    bool moved = false;
    double energy = 0.0;
    std::vector<int> boardedIds;
    std::vector<int> alightedIds;
    std::vector<int> waitSamples;
};

class Elevator {
private:
    struct Stop {
        int floor;
        int readyTick;  // First tick in which the car acts on this stop
    };

    int index_;
    std::string name_;
    Position position_;
    int floorCount_;
    int currentFloor_;
    std::optional<int> restingFloor_;
    Direction direction_ = Direction::Idle;
    double energyUp_;
    double energyDown_;
    double energyPerPassenger_;
    int capacity_;
    CompensatedSum cumulativeEnergy_;
    std::deque<Stop> targetQueue_;
    std::unordered_map<int, Person> riders_;

public:
    Elevator(int index, int floorCount, const ElevatorConfig& config);

    // Getters
    int getIndex() const;
    const std::string& getName() const;
    Position getPosition() const;
    int getCurrentFloor() const;
    Direction getDirection() const;
    double getCumulativeEnergy() const;
    int getCapacity() const;
    std::optional<int> getRestingFloor() const;
    std::vector<int> getTargetQueue() const;
    std::size_t getRiderCount() const;
    std::vector<int> riderIds() const;
    const Person& getRider(int personId) const;

    // Requests. Throws InvalidFloor and leaves the queue untouched if
    // either floor is out of range. Already-queued floors are skipped.
    void request(int fromFloor, int targetFloor, int readyTick = 0);
    // Dispatches a waiting person to this car and starts their wait clock
    // unless it is already running. The car acts on it from the following tick.
    void request(Person& person, int tick);

    bool hasTarget(int floor) const;
    bool hasPendingTargets() const;
    bool isIdle() const;
    bool canBoard() const;

    // Advances at most one floor toward the head of the queue, serving
    // the floor it starts on and the floor it reaches.
    ElevatorStepReport step(int tick, std::vector<Floor>& floors, MetricsAggregator& metrics);

private:
    bool enqueue(int floor, int readyTick);
    bool headReady(int tick) const;
    void serviceFloor(int tick, Floor& floor, ElevatorStepReport& report, MetricsAggregator& metrics);
    void moveOneFloor(Direction dir, ElevatorStepReport& report, MetricsAggregator& metrics);
};

// ============== Door ==============

class Door {
private:
    int index_;
    std::string name_;
    Position position_;
    double arrivalProbability_;
    ArrivalModel arrivalModel_;
    std::vector<ArrivalPhase> schedule_;
    DistanceWeighting weighting_;

public:
    Door(int index, const DoorConfig& config);

    int getIndex() const;
    const std::string& getName() const;
    Position getPosition() const;
    ArrivalModel getArrivalModel() const;
    double arrivalProbabilityAt(int tick) const;

    double distanceTo(const Elevator& elevator) const;

    // One weight per elevator, in the given order. Closer shafts weigh more.
    // Throws EmptyElevatorSet for an empty list.
    std::vector<double> elevatorWeights(const std::vector<Elevator>& elevators) const;
};

DistanceWeighting makeWeighting(WeightingKind kind, double scale);

#endif // DOMAIN_HPP
