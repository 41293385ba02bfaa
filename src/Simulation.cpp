#include "Simulation.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

// ============== Logger Implementation ==============

Logger::Logger(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

void Logger::setTickReference(const int* tick) {
    tickRef_ = tick;
}

void Logger::log(const std::string& message) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << getTimestamp() << " " << message << "\n";
}

void Logger::logArrival(const Person& person, const Door& door) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[ARRIVAL] person=" << person.id << " door=" << door.getName();
    if (person.destination) {
        oss << " dest=" << *person.destination;
    }
    log(oss.str());
}

void Logger::logRequest(const Person& person, const Elevator& elev) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[REQUEST] person=" << person.id << " elevator=" << elev.getName()
        << " from=" << person.floor << " to=" << person.destination.value_or(-1);
    log(oss.str());
}

void Logger::logBoarding(int personId, const Elevator& elev, int wait) {
    log("[BOARD] person=" + std::to_string(personId) +
        " elevator=" + elev.getName() +
        " floor=" + std::to_string(elev.getCurrentFloor()) +
        " wait=" + std::to_string(wait));
}

void Logger::logAlighting(int personId, const Elevator& elev) {
    log("[ALIGHT] person=" + std::to_string(personId) +
        " elevator=" + elev.getName() +
        " floor=" + std::to_string(elev.getCurrentFloor()));
}

void Logger::logDeparture(int personId) {
    log("[DEPART] person=" + std::to_string(personId));
}

void Logger::logElevatorState(const Elevator& elev) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[ELEVATOR " << elev.getName() << "] "
        << "floor=" << elev.getCurrentFloor() << " "
        << "dir=" << directionToString(elev.getDirection()) << " "
        << "riders=" << elev.getRiderCount() << " "
        << "energy=" << elev.getCumulativeEnergy();

    auto queue = elev.getTargetQueue();
    if (!queue.empty()) {
        oss << " queue={";
        bool first = true;
        for (int f : queue) {
            if (!first) oss << ",";
            oss << f;
            first = false;
        }
        oss << "}";
    }

    log(oss.str());
}

void Logger::enable() { enabled_ = true; }
void Logger::disable() { enabled_ = false; }
bool Logger::isEnabled() const { return enabled_; }

std::string Logger::getTimestamp() const {
    std::ostringstream oss;
    oss << "[";
    if (tickRef_) {
        oss << "T" << std::setw(4) << std::setfill('0') << *tickRef_;
    } else {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        oss << std::put_time(std::localtime(&time), "%H:%M:%S");
    }
    oss << "]";
    return oss.str();
}

// ============== Building Implementation ==============

Building::Building(const BuildingConfig& config, std::ostream& logOut)
    : config_(config),
      model_(config.seed),
      dispatch_(createDispatchPolicy(config.dispatchMode)),
      metrics_(config.elevators.size()),
      logger_(logOut, config.verbose) {

    validateConfig();

    const int n = config_.floorCount;
    floors_.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        FloorDistribution dist = config_.floorDistributions.empty()
            ? FloorDistribution{} : config_.floorDistributions[static_cast<std::size_t>(i)];
        floors_.emplace_back(i, n, dist);
    }

    elevators_.reserve(config_.elevators.size());
    for (std::size_t i = 0; i < config_.elevators.size(); ++i) {
        elevators_.emplace_back(static_cast<int>(i), n, config_.elevators[i]);
    }

    doors_.reserve(config_.doors.size());
    for (std::size_t i = 0; i < config_.doors.size(); ++i) {
        doors_.emplace_back(static_cast<int>(i), config_.doors[i]);
    }

    arrivalDestinations_ = config_.arrivalDestinations;
    if (arrivalDestinations_.empty()) {
        // Uniform over the upper floors; a single-floor building keeps everyone downstairs
        arrivalDestinations_.assign(static_cast<std::size_t>(n), n > 1 ? 1.0 / (n - 1) : 1.0);
        if (n > 1) arrivalDestinations_[0] = 0.0;
    }
    validateProbabilities(arrivalDestinations_, "Arrival destinations");

    // Every door must reach at least one car
    for (const Door& door : doors_) {
        auto weights = door.elevatorWeights(elevators_);
        double total = 0.0;
        for (double w : weights) total += w;
        if (!(total > 0.0)) {
            throw InvalidConfiguration("Door " + door.getName() +
                                       ": distance weights are zero for every elevator");
        }
    }

    logger_.setTickReference(&currentTick_);
    logger_.log("Building initialized with " + std::to_string(n) + " floors, " +
                std::to_string(elevators_.size()) + " elevators, " +
                std::to_string(doors_.size()) + " doors, seed " + std::to_string(config_.seed));
    logger_.log("Dispatch: " + dispatch_->getName());
}

void Building::validateConfig() const {
    if (config_.floorCount <= 0) {
        throw InvalidConfiguration("Floor count must be positive: " +
                                   std::to_string(config_.floorCount));
    }
    if (config_.elevators.empty()) {
        throw InvalidConfiguration("Building needs at least one elevator");
    }
    if (config_.doors.empty()) {
        throw InvalidConfiguration("Building needs at least one door");
    }
    const auto n = static_cast<std::size_t>(config_.floorCount);
    if (!config_.floorDistributions.empty() && config_.floorDistributions.size() != n) {
        throw InvalidConfiguration("Expected " + std::to_string(n) + " floor distributions, got " +
                                   std::to_string(config_.floorDistributions.size()));
    }
    if (!config_.arrivalDestinations.empty() && config_.arrivalDestinations.size() != n) {
        throw InvalidConfiguration("Arrival destinations must cover exactly " +
                                   std::to_string(n) + " floors");
    }
}

TickReport Building::tick() {
    TickReport report;
    report.tick = currentTick_;
    const std::size_t before = population();

    arrivalPhase(report);
    dispatchPhase(report);
    elevatorPhase(report);
    transitionPhase(report);
    exitPhase(report);

    metrics_.commitTick();

    report.population = population();
    report.elevatorFloors.reserve(elevators_.size());
    for (const Elevator& elev : elevators_) {
        report.elevatorFloors.push_back(elev.getCurrentFloor());
    }
    totalArrivals_ += report.arrivals;
    totalDepartures_ += report.departures;

    if (report.population + static_cast<std::size_t>(report.departures) !=
        before + static_cast<std::size_t>(report.arrivals)) {
        throw SimulationError("Population not conserved at tick " + std::to_string(currentTick_));
    }

    ++currentTick_;
    return report;
}

void Building::arrivalPhase(TickReport& report) {
    for (const Door& door : doors_) {
        double p = door.arrivalProbabilityAt(currentTick_);
        int count = (door.getArrivalModel() == ArrivalModel::Poisson)
            ? model_.samplePoisson(p)
            : (model_.sampleBernoulli(p) ? 1 : 0);

        for (int k = 0; k < count; ++k) {
            Person person;
            person.id = nextPersonId_++;
            person.floor = 0;
            person.doorIndex = door.getIndex();
            person.settledTick = currentTick_;

            auto dest = static_cast<int>(model_.sampleCategorical(arrivalDestinations_));
            if (dest != 0) {
                person.destination = dest;
            }

            logger_.logArrival(person, door);
            floors_[0].admit(std::move(person));
            ++report.arrivals;
        }
    }
}

void Building::dispatchPhase(TickReport& report) {
    Floor& ground = floors_[0];
    for (int id : ground.residentIds()) {
        Person& person = ground.getPerson(id);
        if (person.isAwaitingDispatch()) {
            issueRequest(person, report);
        }
    }
}

void Building::issueRequest(Person& person, TickReport& report) {
    DispatchRequest req;
    req.personId = person.id;
    req.fromFloor = person.floor;
    req.targetFloor = person.destination.value_or(person.floor);
    req.doorIndex = person.doorIndex;

    std::size_t chosen = dispatch_->selectElevator(
        req, elevators_, doors_[static_cast<std::size_t>(person.doorIndex)], model_);
    Elevator& elev = elevators_[chosen];
    elev.request(person, currentTick_);

    ++report.requests;
    logger_.logRequest(person, elev);
}

void Building::elevatorPhase(TickReport& report) {
    // Ascending index keeps ties reproducible
    for (Elevator& elev : elevators_) {
        ElevatorStepReport step = elev.step(currentTick_, floors_, metrics_);

        report.boardings += static_cast<int>(step.boardedIds.size());
        report.alightings += static_cast<int>(step.alightedIds.size());
        report.energyDelta += step.energy;
        report.waitSamples.insert(report.waitSamples.end(),
                                  step.waitSamples.begin(), step.waitSamples.end());

        if (logger_.isEnabled()) {
            for (std::size_t i = 0; i < step.boardedIds.size(); ++i) {
                logger_.logBoarding(step.boardedIds[i], elev, step.waitSamples[i]);
            }
            for (int id : step.alightedIds) {
                logger_.logAlighting(id, elev);
            }
            if (step.moved) {
                logger_.logElevatorState(elev);
            }
        }
    }
}

void Building::transitionPhase(TickReport& report) {
    for (std::size_t f = 1; f < floors_.size(); ++f) {
        Floor& floor = floors_[f];
        for (int id : floor.residentIds()) {
            Person& person = floor.getPerson(id);
            if (person.isWaiting() || person.settledTick == currentTick_) {
                continue;
            }

            Transition t = floor.sampleTransition(person, model_);
            switch (t.kind) {
                case TransitionKind::Stay:
                    break;
                case TransitionKind::RequestFloor:
                    person.destination = t.targetFloor;
                    issueRequest(person, report);
                    break;
                case TransitionKind::Leave:
                    throw InvalidTransition("Person " + std::to_string(id) +
                                            " sampled Leave on floor " + std::to_string(f));
            }
        }
    }
}

void Building::exitPhase(TickReport& report) {
    Floor& ground = floors_[0];
    for (int id : ground.residentIds()) {
        Person& person = ground.getPerson(id);
        if (person.isWaiting() || person.settledTick == currentTick_) {
            continue;
        }

        Transition t = ground.sampleTransition(person, model_);
        switch (t.kind) {
            case TransitionKind::Stay:
                break;
            case TransitionKind::RequestFloor:
                // Dispatched next tick, but the wait starts now
                person.destination = t.targetFloor;
                person.waitStartTick = currentTick_;
                break;
            case TransitionKind::Leave:
                ground.remove(id);
                ++report.departures;
                logger_.logDeparture(id);
                break;
        }
    }
}

RunSummary Building::run(int nTicks) {
    return run(nTicks, nullptr);
}

RunSummary Building::run(int maxTicks, const StopPredicate& shouldStop) {
    if (maxTicks < 0) {
        throw std::invalid_argument("Tick count must be non-negative");
    }
    for (int i = 0; i < maxTicks; ++i) {
        TickReport report = tick();
        if (shouldStop && shouldStop(report)) {
            return summarize(i + 1, true);
        }
    }
    return summarize(maxTicks, false);
}

RunSummary Building::runUntilDrained(int maxTicks, const StopPredicate& shouldStop) {
    if (maxTicks < 0) {
        throw std::invalid_argument("Tick count must be non-negative");
    }
    for (int i = 0; i < maxTicks; ++i) {
        TickReport report = tick();
        if (isDrained()) {
            return summarize(i + 1, false);
        }
        if (shouldStop && shouldStop(report)) {
            return summarize(i + 1, true);
        }
    }
    return summarize(maxTicks, false);
}

RunSummary Building::summarize(int ticksRun, bool stopped) const {
    RunSummary summary;
    summary.ticksRun = ticksRun;
    summary.drained = isDrained();
    summary.stopped = stopped;
    summary.totalArrivals = totalArrivals_;
    summary.totalDepartures = totalDepartures_;
    summary.finalPopulation = population();
    summary.metrics = metrics_.snapshot();
    return summary;
}

void Building::request(int elevatorIndex, int fromFloor, int targetFloor) {
    if (elevatorIndex < 0 || elevatorIndex >= getNumElevators()) {
        throw std::out_of_range("Invalid elevator index: " + std::to_string(elevatorIndex));
    }
    elevators_[static_cast<std::size_t>(elevatorIndex)].request(fromFloor, targetFloor, currentTick_);
}

void Building::printStatus(std::ostream& out) const {
    const std::ios::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();

    out << "\n========== Status at Tick " << currentTick_ << " ==========\n";

    for (int f = getNumFloors() - 1; f >= 0; --f) {
        const Floor& floor = floors_[static_cast<std::size_t>(f)];
        out << "Floor " << std::setw(3) << f << " | "
            << std::setw(4) << floor.size() << " here, "
            << std::setw(3) << floor.waitingCount() << " waiting |";
        for (const Elevator& elev : elevators_) {
            if (elev.getCurrentFloor() == f) {
                out << " [" << elev.getName() << ": " << elev.getRiderCount() << "]";
            }
        }
        out << "\n";
    }

    for (const Elevator& elev : elevators_) {
        out << "Elevator " << elev.getName() << ": "
            << "Floor " << elev.getCurrentFloor() << ", "
            << directionToString(elev.getDirection()) << ", "
            << "Energy " << std::fixed << std::setprecision(2) << elev.getCumulativeEnergy();

        auto queue = elev.getTargetQueue();
        if (!queue.empty()) {
            out << ", Queue: {";
            bool first = true;
            for (int q : queue) {
                if (!first) out << ", ";
                out << q;
                first = false;
            }
            out << "}";
        }
        out << "\n";
    }

    Metrics m = metrics_.snapshot();
    out << "Average wait time:\t" << std::fixed << std::setprecision(2) << m.meanWaitTime
        << " (" << m.sampleCount << " rides)\n"
        << "Average energy spent:\t" << m.meanEnergyPerTick << " per tick\n"
        << "==========================================\n\n";
    out.flags(flags);
    out.precision(precision);
}

int Building::getCurrentTick() const { return currentTick_; }

std::size_t Building::population() const {
    std::size_t count = 0;
    for (const Floor& floor : floors_) {
        count += floor.size();
    }
    for (const Elevator& elev : elevators_) {
        count += elev.getRiderCount();
    }
    return count;
}

std::size_t Building::pendingRequests() const {
    std::size_t count = 0;
    for (const Elevator& elev : elevators_) {
        count += elev.getTargetQueue().size();
    }
    for (const Floor& floor : floors_) {
        count += floor.unassignedCount();
    }
    return count;
}

bool Building::isDrained() const {
    return population() == 0 && pendingRequests() == 0;
}

int Building::getNumFloors() const { return static_cast<int>(floors_.size()); }
int Building::getNumElevators() const { return static_cast<int>(elevators_.size()); }
int Building::getNumDoors() const { return static_cast<int>(doors_.size()); }
const BuildingConfig& Building::getConfig() const { return config_; }

const Floor& Building::getFloor(int index) const {
    if (index < 0 || index >= getNumFloors()) {
        throw std::out_of_range("Invalid floor index: " + std::to_string(index));
    }
    return floors_[static_cast<std::size_t>(index)];
}

const Elevator& Building::getElevator(int index) const {
    if (index < 0 || index >= getNumElevators()) {
        throw std::out_of_range("Invalid elevator index: " + std::to_string(index));
    }
    return elevators_[static_cast<std::size_t>(index)];
}

const Door& Building::getDoor(int index) const {
    if (index < 0 || index >= getNumDoors()) {
        throw std::out_of_range("Invalid door index: " + std::to_string(index));
    }
    return doors_[static_cast<std::size_t>(index)];
}

const MetricsAggregator& Building::getMetricsAggregator() const { return metrics_; }
Metrics Building::snapshot() const { return metrics_.snapshot(); }
const IDispatchPolicy& Building::getDispatchPolicy() const { return *dispatch_; }

// ============== Scenario Options ==============

BuildingConfig buildConfig(const ScenarioOptions& options) {
    BuildingConfig config;
    config.floorCount = options.numFloors;
    config.dispatchMode = options.dispatchMode;
    config.seed = options.seed;
    config.verbose = options.verbose;

    for (int i = 0; i < options.numElevators; ++i) {
        ElevatorConfig elev;
        elev.name = "E" + std::to_string(i);
        elev.position = Position{2.0 * i, 0.0};
        elev.energyUp = options.energyUp;
        elev.energyDown = options.energyDown;
        elev.energyPerPassenger = options.energyPerPassenger;
        config.elevators.push_back(elev);
    }

    // Spread doors across the width of the elevator bank
    double width = 2.0 * std::max(0, options.numElevators - 1);
    for (int j = 0; j < options.numDoors; ++j) {
        DoorConfig door;
        door.name = (j == 0) ? "lobby" : "door" + std::to_string(j);
        double x = options.numDoors > 1 ? width * j / (options.numDoors - 1) : width / 2.0;
        door.position = Position{x, 5.0};
        door.arrivalProbability = options.arrivalProbability;
        door.weighting = options.weighting;
        config.doors.push_back(door);
    }

    const int n = options.numFloors;
    if (n <= 0) {
        return config;
    }
    const int upper = n - 1;

    for (int f = 0; f < n; ++f) {
        FloorDistribution dist;
        dist.requestFloor.assign(static_cast<std::size_t>(n), 0.0);
        if (f == 0) {
            for (int g = 1; g < n; ++g) {
                dist.requestFloor[static_cast<std::size_t>(g)] = options.requestProbability / upper;
            }
            dist.leave = options.leaveProbability;
            dist.stay = 1.0 - dist.leave - (upper > 0 ? options.requestProbability : 0.0);
        } else {
            dist.requestFloor[0] = options.leaveProbability;
            int others = upper - 1;
            for (int g = 1; g < n; ++g) {
                if (g != f) {
                    dist.requestFloor[static_cast<std::size_t>(g)] = options.requestProbability / others;
                }
            }
            dist.stay = 1.0 - options.leaveProbability - (others > 0 ? options.requestProbability : 0.0);
        }
        config.floorDistributions.push_back(dist);
    }
    return config;
}

// ============== Batch Runner Implementation ==============

BatchRunner::BatchRunner(const BuildingConfig& base, int threads)
    : base_(base), threads_(threads) {}

BatchResult BatchRunner::run(const std::vector<std::uint64_t>& seeds, int ticks, bool drain) {
    cancelled_.store(false);

    WorkQueue<std::uint64_t> queue;
    for (std::uint64_t seed : seeds) {
        queue.push(seed);
    }
    queue.close();

    int workers = threads_ > 0 ? threads_ : static_cast<int>(std::thread::hardware_concurrency());
    workers = std::max(1, std::min(workers, static_cast<int>(seeds.size())));

    SharedMetricsSink sink;
    BatchResult result;
    std::mutex resultMutex;
    std::exception_ptr firstError;

    auto worker = [&]() {
        while (!cancelled_.load()) {
            auto seed = queue.pop();
            if (!seed) break;

            try {
                BuildingConfig config = base_;
                config.seed = *seed;
                config.verbose = false;  // Concurrent runs would interleave lines

                Building building(config);
                auto stop = [this](const TickReport&) { return cancelled_.load(); };
                RunSummary summary = drain ? building.runUntilDrained(ticks, stop)
                                           : building.run(ticks, stop);

                sink.absorb(*seed, building.getMetricsAggregator());
                std::lock_guard<std::mutex> lock(resultMutex);
                result.runs.emplace_back(*seed, summary);
            } catch (...) {
                std::lock_guard<std::mutex> lock(resultMutex);
                if (!firstError) {
                    firstError = std::current_exception();
                }
                cancelled_.store(true);
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(workers));
    for (int i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }

    std::sort(result.runs.begin(), result.runs.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    result.pooled = sink.snapshot();
    result.cancelled = cancelled_.load();
    return result;
}

void BatchRunner::cancel() {
    cancelled_.store(true);
}

bool BatchRunner::isCancelled() const {
    return cancelled_.load();
}
