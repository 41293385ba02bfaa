#include "Domain.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

// ============== Floor Implementation ==============

Floor::Floor(int index, int floorCount, const FloorDistribution& distribution)
    : index_(index) {
    if (!distribution.requestFloor.empty() &&
        static_cast<int>(distribution.requestFloor.size()) != floorCount) {
        throw InvalidConfiguration("Floor " + std::to_string(index) +
                                   ": request probabilities must cover exactly " +
                                   std::to_string(floorCount) + " floors");
    }

    weights_.reserve(static_cast<std::size_t>(floorCount) + 2);
    weights_.push_back(distribution.stay);
    for (int f = 0; f < floorCount; ++f) {
        weights_.push_back(distribution.requestFloor.empty() ? 0.0 : distribution.requestFloor[f]);
    }
    weights_.push_back(distribution.leave);

    validateProbabilities(weights_, "Floor " + std::to_string(index));

    if (!isGround() && distribution.leave > 0.0) {
        throw InvalidDistribution("Floor " + std::to_string(index) +
                                  ": Leave is only possible from the ground floor");
    }
    if (weights_[static_cast<std::size_t>(index) + 1] > 0.0) {
        throw InvalidDistribution("Floor " + std::to_string(index) + ": cannot request itself");
    }
}

int Floor::getIndex() const { return index_; }
bool Floor::isGround() const { return index_ == 0; }

void Floor::admit(Person person) {
    person.floor = index_;
    int id = person.id;
    residents_[id] = std::move(person);
}

Person Floor::remove(int personId) {
    auto it = residents_.find(personId);
    if (it == residents_.end()) {
        throw PersonNotFound("Person " + std::to_string(personId) +
                             " is not on floor " + std::to_string(index_));
    }
    Person person = std::move(it->second);
    residents_.erase(it);
    return person;
}

bool Floor::contains(int personId) const {
    return residents_.count(personId) > 0;
}

Person& Floor::getPerson(int personId) {
    auto it = residents_.find(personId);
    if (it == residents_.end()) {
        throw PersonNotFound("Person " + std::to_string(personId) +
                             " is not on floor " + std::to_string(index_));
    }
    return it->second;
}

const Person& Floor::getPerson(int personId) const {
    auto it = residents_.find(personId);
    if (it == residents_.end()) {
        throw PersonNotFound("Person " + std::to_string(personId) +
                             " is not on floor " + std::to_string(index_));
    }
    return it->second;
}

std::size_t Floor::size() const { return residents_.size(); }
bool Floor::empty() const { return residents_.empty(); }

std::vector<int> Floor::residentIds() const {
    std::vector<int> ids;
    ids.reserve(residents_.size());
    for (const auto& [id, person] : residents_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<int> Floor::waitingFor(int elevatorIndex) const {
    std::vector<int> ids;
    for (const auto& [id, person] : residents_) {
        if (person.isWaiting() && person.assignedElevator == elevatorIndex) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t Floor::waitingCount() const {
    return static_cast<std::size_t>(std::count_if(residents_.begin(), residents_.end(),
        [](const auto& entry) { return entry.second.isWaiting(); }));
}

std::size_t Floor::unassignedCount() const {
    return static_cast<std::size_t>(std::count_if(residents_.begin(), residents_.end(),
        [](const auto& entry) { return entry.second.isAwaitingDispatch(); }));
}

Transition Floor::sampleTransition(const Person& person, ProbabilityModel& model) const {
    if (!contains(person.id)) {
        throw PersonNotFound("Person " + std::to_string(person.id) +
                             " is not on floor " + std::to_string(index_));
    }

    std::size_t drawn = model.sampleCategorical(weights_);
    std::size_t leaveIndex = weights_.size() - 1;

    if (drawn == 0) {
        return Transition{TransitionKind::Stay, -1};
    }
    if (drawn == leaveIndex) {
        if (!isGround()) {
            throw InvalidTransition("Leave sampled on floor " + std::to_string(index_));
        }
        return Transition{TransitionKind::Leave, -1};
    }
    return Transition{TransitionKind::RequestFloor, static_cast<int>(drawn) - 1};
}

const std::vector<double>& Floor::getTransitionWeights() const { return weights_; }

// ============== Elevator Implementation ==============

Elevator::Elevator(int index, int floorCount, const ElevatorConfig& config)
    : index_(index),
      name_(config.name.empty() ? "E" + std::to_string(index) : config.name),
      position_(config.position),
      floorCount_(floorCount),
      currentFloor_(config.startFloor),
      restingFloor_(config.restingFloor),
      energyUp_(config.energyUp),
      energyDown_(config.energyDown),
      energyPerPassenger_(config.energyPerPassenger),
      capacity_(config.capacity) {
    if (config.startFloor < 0 || config.startFloor >= floorCount) {
        throw InvalidConfiguration("Elevator " + name_ + ": start floor " +
                                   std::to_string(config.startFloor) + " out of range");
    }
    if (restingFloor_ && (*restingFloor_ < 0 || *restingFloor_ >= floorCount)) {
        throw InvalidConfiguration("Elevator " + name_ + ": resting floor " +
                                   std::to_string(*restingFloor_) + " out of range");
    }
    for (double e : {energyUp_, energyDown_, energyPerPassenger_}) {
        if (!std::isfinite(e) || e < 0.0) {
            throw InvalidConfiguration("Elevator " + name_ + ": energy costs must be non-negative");
        }
    }
    if (capacity_ < 0) {
        throw InvalidConfiguration("Elevator " + name_ + ": capacity must be >= 0");
    }
}

int Elevator::getIndex() const { return index_; }
const std::string& Elevator::getName() const { return name_; }
Position Elevator::getPosition() const { return position_; }
int Elevator::getCurrentFloor() const { return currentFloor_; }
Direction Elevator::getDirection() const { return direction_; }
double Elevator::getCumulativeEnergy() const { return cumulativeEnergy_.sum; }
int Elevator::getCapacity() const { return capacity_; }
std::optional<int> Elevator::getRestingFloor() const { return restingFloor_; }

std::vector<int> Elevator::getTargetQueue() const {
    std::vector<int> floors;
    floors.reserve(targetQueue_.size());
    for (const Stop& stop : targetQueue_) {
        floors.push_back(stop.floor);
    }
    return floors;
}

std::size_t Elevator::getRiderCount() const { return riders_.size(); }

std::vector<int> Elevator::riderIds() const {
    std::vector<int> ids;
    ids.reserve(riders_.size());
    for (const auto& [id, person] : riders_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

const Person& Elevator::getRider(int personId) const {
    auto it = riders_.find(personId);
    if (it == riders_.end()) {
        throw PersonNotFound("Person " + std::to_string(personId) + " is not in " + name_);
    }
    return it->second;
}

void Elevator::request(int fromFloor, int targetFloor, int readyTick) {
    for (int f : {fromFloor, targetFloor}) {
        if (f < 0 || f >= floorCount_) {
            throw InvalidFloor("Invalid floor " + std::to_string(f) + " for " + name_ +
                               " (building has " + std::to_string(floorCount_) + " floors)");
        }
    }
    enqueue(fromFloor, readyTick);
    enqueue(targetFloor, readyTick);
}

void Elevator::request(Person& person, int tick) {
    if (!person.destination) {
        throw std::invalid_argument("Person " + std::to_string(person.id) + " has no destination");
    }
    request(person.floor, *person.destination, tick + 1);
    person.assignedElevator = index_;
    if (!person.waitStartTick) {
        person.waitStartTick = tick;
    }
}

bool Elevator::hasTarget(int floor) const {
    return std::any_of(targetQueue_.begin(), targetQueue_.end(),
        [floor](const Stop& s) { return s.floor == floor; });
}

bool Elevator::hasPendingTargets() const { return !targetQueue_.empty(); }

bool Elevator::isIdle() const { return targetQueue_.empty() && riders_.empty(); }

bool Elevator::canBoard() const {
    return capacity_ == 0 || static_cast<int>(riders_.size()) < capacity_;
}

bool Elevator::enqueue(int floor, int readyTick) {
    if (hasTarget(floor)) {
        return false;
    }
    targetQueue_.push_back(Stop{floor, readyTick});
    return true;
}

bool Elevator::headReady(int tick) const {
    return !targetQueue_.empty() && targetQueue_.front().readyTick <= tick;
}

ElevatorStepReport Elevator::step(int tick, std::vector<Floor>& floors, MetricsAggregator& metrics) {
    ElevatorStepReport report;
    direction_ = Direction::Idle;

    if (isIdle() && restingFloor_ && *restingFloor_ != currentFloor_) {
        enqueue(*restingFloor_, tick);
    }

    if (!headReady(tick)) {
        return report;
    }

    // Doors open where the car already stands
    if (targetQueue_.front().floor == currentFloor_) {
        targetQueue_.pop_front();
        serviceFloor(tick, floors[currentFloor_], report, metrics);
        if (!headReady(tick) || targetQueue_.front().floor == currentFloor_) {
            return report;
        }
    }

    int target = targetQueue_.front().floor;
    moveOneFloor(target > currentFloor_ ? Direction::Up : Direction::Down, report, metrics);

    if (currentFloor_ == target) {
        targetQueue_.pop_front();
        serviceFloor(tick, floors[currentFloor_], report, metrics);
    }
    return report;
}

void Elevator::moveOneFloor(Direction dir, ElevatorStepReport& report, MetricsAggregator& metrics) {
    double energy = (dir == Direction::Up ? energyUp_ : energyDown_) +
                    energyPerPassenger_ * static_cast<double>(riders_.size());
    currentFloor_ += (dir == Direction::Up) ? 1 : -1;
    direction_ = dir;
    cumulativeEnergy_.add(energy);
    metrics.recordEnergy(static_cast<std::size_t>(index_), energy);
    report.moved = true;
    report.energy += energy;
}

void Elevator::serviceFloor(int tick, Floor& floor, ElevatorStepReport& report,
                            MetricsAggregator& metrics) {
    // Alight first so their places free up for boarders
    for (int id : riderIds()) {
        auto it = riders_.find(id);
        if (it->second.destination != floor.getIndex()) continue;

        Person person = std::move(it->second);
        riders_.erase(it);
        person.destination.reset();
        person.assignedElevator.reset();
        person.settledTick = tick;
        floor.admit(std::move(person));
        report.alightedIds.push_back(id);
    }

    bool leftBehind = false;
    for (int id : floor.waitingFor(index_)) {
        if (!canBoard()) {
            leftBehind = true;
            break;
        }
        Person person = floor.remove(id);
        int wait = tick - person.waitStartTick.value_or(tick);
        metrics.recordWait(wait);
        report.waitSamples.push_back(wait);
        person.waitStartTick.reset();
        enqueue(*person.destination, tick);
        riders_.emplace(id, std::move(person));
        report.boardedIds.push_back(id);
    }

    // Come back for whoever did not fit
    if (leftBehind) {
        enqueue(floor.getIndex(), tick + 1);
    }
}

// ============== Door Implementation ==============

DistanceWeighting makeWeighting(WeightingKind kind, double scale) {
    if (!std::isfinite(scale) || scale < 0.0) {
        throw InvalidConfiguration("Weighting scale must be non-negative");
    }
    switch (kind) {
        case WeightingKind::InverseDistance:
            return [scale](double d) { return 1.0 / (1.0 + scale * d); };
        case WeightingKind::ExponentialDecay:
            return [scale](double d) { return std::exp(-scale * d); };
    }
    throw InvalidConfiguration("Unknown weighting kind");
}

Door::Door(int index, const DoorConfig& config)
    : index_(index),
      name_(config.name.empty() ? "door" + std::to_string(index) : config.name),
      position_(config.position),
      arrivalProbability_(config.arrivalProbability),
      arrivalModel_(config.arrivalModel),
      schedule_(config.schedule),
      weighting_(config.customWeighting ? config.customWeighting
                                        : makeWeighting(config.weighting, config.weightingScale)) {
    auto checkRate = [this](double p) {
        bool ok = std::isfinite(p) && p >= 0.0 &&
                  (arrivalModel_ == ArrivalModel::Poisson || p <= 1.0);
        if (!ok) {
            throw InvalidDistribution("Door " + name_ + ": invalid arrival probability " +
                                      std::to_string(p));
        }
    };
    checkRate(arrivalProbability_);
    for (const ArrivalPhase& phase : schedule_) {
        checkRate(phase.probability);
    }
    std::stable_sort(schedule_.begin(), schedule_.end(),
        [](const ArrivalPhase& a, const ArrivalPhase& b) { return a.startTick < b.startTick; });
}

int Door::getIndex() const { return index_; }
const std::string& Door::getName() const { return name_; }
Position Door::getPosition() const { return position_; }
ArrivalModel Door::getArrivalModel() const { return arrivalModel_; }

double Door::arrivalProbabilityAt(int tick) const {
    double p = arrivalProbability_;
    for (const ArrivalPhase& phase : schedule_) {
        if (phase.startTick > tick) break;
        p = phase.probability;
    }
    return p;
}

double Door::distanceTo(const Elevator& elevator) const {
    Position shaft = elevator.getPosition();
    return std::hypot(shaft.x - position_.x, shaft.y - position_.y);
}

std::vector<double> Door::elevatorWeights(const std::vector<Elevator>& elevators) const {
    if (elevators.empty()) {
        throw EmptyElevatorSet("Door " + name_ + ": no elevators to weight");
    }
    std::vector<double> weights;
    weights.reserve(elevators.size());
    for (const Elevator& elev : elevators) {
        double w = weighting_(distanceTo(elev));
        if (!std::isfinite(w) || w < 0.0) {
            throw InvalidDistribution("Door " + name_ + ": weighting produced an invalid weight");
        }
        weights.push_back(w);
    }
    return weights;
}
