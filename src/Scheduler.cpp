#include "Scheduler.hpp"
#include <cstdlib>
#include <limits>

// ============== Door Weighted Dispatch Implementation ==============

std::size_t DoorWeightedDispatch::selectElevator(const DispatchRequest& request,
                                                 const std::vector<Elevator>& elevators,
                                                 const Door& door,
                                                 ProbabilityModel& model) {
    (void)request;
    return model.sampleCategorical(door.elevatorWeights(elevators));
}

// ============== Nearest Dispatch Implementation ==============

int NearestDispatch::calculateCost(const Elevator& elev, int floor) const {
    return std::abs(elev.getCurrentFloor() - floor);
}

std::size_t NearestDispatch::selectElevator(const DispatchRequest& request,
                                            const std::vector<Elevator>& elevators,
                                            const Door& door,
                                            ProbabilityModel& model) {
    (void)door;
    (void)model;
    if (elevators.empty()) {
        throw EmptyElevatorSet("No elevators to dispatch to");
    }

    std::size_t best = 0;
    int bestCost = std::numeric_limits<int>::max();
    std::size_t bestQueue = std::numeric_limits<std::size_t>::max();

    for (std::size_t i = 0; i < elevators.size(); ++i) {
        int cost = calculateCost(elevators[i], request.fromFloor);
        std::size_t queued = elevators[i].getTargetQueue().size();
        if (cost < bestCost || (cost == bestCost && queued < bestQueue)) {
            best = i;
            bestCost = cost;
            bestQueue = queued;
        }
    }
    return best;
}

// ============== Round Robin Dispatch Implementation ==============

std::size_t RoundRobinDispatch::selectElevator(const DispatchRequest& request,
                                               const std::vector<Elevator>& elevators,
                                               const Door& door,
                                               ProbabilityModel& model) {
    (void)request;
    (void)door;
    (void)model;
    if (elevators.empty()) {
        throw EmptyElevatorSet("No elevators to dispatch to");
    }
    std::size_t chosen = next_ % elevators.size();
    next_ = chosen + 1;
    return chosen;
}

// ============== Factory Implementation ==============

std::unique_ptr<IDispatchPolicy> createDispatchPolicy(DispatchMode mode) {
    switch (mode) {
        case DispatchMode::DoorWeighted:
            return std::make_unique<DoorWeightedDispatch>();
        case DispatchMode::Nearest:
            return std::make_unique<NearestDispatch>();
        case DispatchMode::RoundRobin:
            return std::make_unique<RoundRobinDispatch>();
    }
    return std::make_unique<DoorWeightedDispatch>();
}
