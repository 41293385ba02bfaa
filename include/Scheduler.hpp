#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include "Probability.hpp"
#include <memory>
#include <string>
#include <vector>

// ============== Dispatch Request ==============

struct DispatchRequest {
    int personId = -1;
    int fromFloor = 0;
    int targetFloor = 0;
    int doorIndex = 0;
};

// ============== Dispatch Policy Interface ==============

class IDispatchPolicy {
public:
    virtual ~IDispatchPolicy() = default;

    // Index into `elevators` of the car that will serve the request.
    // Throws EmptyElevatorSet if there is nothing to choose from.
    virtual std::size_t selectElevator(const DispatchRequest& request,
                                       const std::vector<Elevator>& elevators,
                                       const Door& door,
                                       ProbabilityModel& model) = 0;

    // Get policy name for logging
    virtual std::string getName() const = 0;
};

// ============== Door Weighted Dispatch ==============
// Draws a car from the entry door's distance weights. Closer shafts are
// more likely, but any car with a positive weight can be picked.

class DoorWeightedDispatch : public IDispatchPolicy {
public:
    std::size_t selectElevator(const DispatchRequest& request,
                               const std::vector<Elevator>& elevators,
                               const Door& door,
                               ProbabilityModel& model) override;
    std::string getName() const override { return "DoorWeightedDispatch"; }
};

// ============== Nearest Dispatch ==============
// Car whose current floor is closest to the caller. Ties go to the
// shorter queue, then the lower index. Draws nothing from the model.

class NearestDispatch : public IDispatchPolicy {
public:
    std::size_t selectElevator(const DispatchRequest& request,
                               const std::vector<Elevator>& elevators,
                               const Door& door,
                               ProbabilityModel& model) override;
    std::string getName() const override { return "NearestDispatch"; }

private:
    int calculateCost(const Elevator& elev, int floor) const;
};

// ============== Round Robin Dispatch ==============

class RoundRobinDispatch : public IDispatchPolicy {
private:
    std::size_t next_ = 0;

public:
    std::size_t selectElevator(const DispatchRequest& request,
                               const std::vector<Elevator>& elevators,
                               const Door& door,
                               ProbabilityModel& model) override;
    std::string getName() const override { return "RoundRobinDispatch"; }
};

// ============== Factory ==============

std::unique_ptr<IDispatchPolicy> createDispatchPolicy(DispatchMode mode);

#endif // SCHEDULER_HPP
