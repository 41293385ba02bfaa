#include "Simulation.hpp"
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>

void printUsage(const char* progName) {
    std::cout << "Usage: " << progName << " [options]\n"
              << "\nOptions:\n"
              << "  -f, --floors <n>          Number of floors (default: 10)\n"
              << "  -e, --elevators <n>       Number of elevators (default: 3)\n"
              << "  -d, --doors <n>           Number of entry doors (default: 1)\n"
              << "  -t, --ticks <n>           Ticks to simulate, or tick limit with --drain (default: 200)\n"
              << "  -s, --seed <n>            Random seed (default: 42)\n"
              << "  -a, --arrival <p>         Per-door arrival probability per tick (default: 0.3)\n"
              << "      --request <p>         Chance an idle resident calls a car (default: 0.05)\n"
              << "      --leave <p>           Chance a resident heads out (default: 0.05)\n"
              << "      --energy-up <x>       Energy per floor moving up (default: 5.0)\n"
              << "      --energy-down <x>     Energy per floor moving down (default: 2.5)\n"
              << "      --energy-passenger <x> Extra energy per rider per floor (default: 0.5)\n"
              << "  -m, --mode <type>         Dispatch: weighted|nearest|round-robin (default: weighted)\n"
              << "  -w, --weighting <type>    Door weighting: inverse|exponential (default: inverse)\n"
              << "      --drain               Stop once the building is empty\n"
              << "  -r, --runs <n>            Independent runs with seeds seed..seed+n-1 (default: 1)\n"
              << "  -j, --threads <n>         Worker threads for --runs (default: all cores)\n"
              << "  -v, --verbose             Log every event\n"
              << "  -h, --help                Show this help\n"
              << "\nExample:\n"
              << "  " << progName << " -f 12 -e 3 -m nearest -t 1000\n";
}

bool parseArgs(int argc, char* argv[], ScenarioOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return false;
        }
        else if ((arg == "-f" || arg == "--floors") && hasValue) {
            options.numFloors = std::stoi(argv[++i]);
        }
        else if ((arg == "-e" || arg == "--elevators") && hasValue) {
            options.numElevators = std::stoi(argv[++i]);
        }
        else if ((arg == "-d" || arg == "--doors") && hasValue) {
            options.numDoors = std::stoi(argv[++i]);
        }
        else if ((arg == "-t" || arg == "--ticks") && hasValue) {
            options.ticks = std::stoi(argv[++i]);
            if (options.ticks < 0) {
                std::cerr << "Error: ticks must be >= 0\n";
                return false;
            }
        }
        else if ((arg == "-s" || arg == "--seed") && hasValue) {
            options.seed = std::stoull(argv[++i]);
        }
        else if ((arg == "-a" || arg == "--arrival") && hasValue) {
            options.arrivalProbability = std::stod(argv[++i]);
        }
        else if (arg == "--request" && hasValue) {
            options.requestProbability = std::stod(argv[++i]);
        }
        else if (arg == "--leave" && hasValue) {
            options.leaveProbability = std::stod(argv[++i]);
        }
        else if (arg == "--energy-up" && hasValue) {
            options.energyUp = std::stod(argv[++i]);
        }
        else if (arg == "--energy-down" && hasValue) {
            options.energyDown = std::stod(argv[++i]);
        }
        else if (arg == "--energy-passenger" && hasValue) {
            options.energyPerPassenger = std::stod(argv[++i]);
        }
        else if ((arg == "-m" || arg == "--mode") && hasValue) {
            std::string mode = argv[++i];
            if (mode == "weighted") {
                options.dispatchMode = DispatchMode::DoorWeighted;
            } else if (mode == "nearest") {
                options.dispatchMode = DispatchMode::Nearest;
            } else if (mode == "round-robin") {
                options.dispatchMode = DispatchMode::RoundRobin;
            } else {
                std::cerr << "Error: mode must be 'weighted', 'nearest' or 'round-robin'\n";
                return false;
            }
        }
        else if ((arg == "-w" || arg == "--weighting") && hasValue) {
            std::string kind = argv[++i];
            if (kind == "inverse") {
                options.weighting = WeightingKind::InverseDistance;
            } else if (kind == "exponential") {
                options.weighting = WeightingKind::ExponentialDecay;
            } else {
                std::cerr << "Error: weighting must be 'inverse' or 'exponential'\n";
                return false;
            }
        }
        else if (arg == "--drain") {
            options.drain = true;
        }
        else if ((arg == "-r" || arg == "--runs") && hasValue) {
            options.runs = std::stoi(argv[++i]);
            if (options.runs < 1) {
                std::cerr << "Error: runs must be >= 1\n";
                return false;
            }
        }
        else if ((arg == "-j" || arg == "--threads") && hasValue) {
            options.threads = std::stoi(argv[++i]);
        }
        else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}

void printMetrics(const Metrics& m) {
    std::cout << std::fixed << std::setprecision(2)
              << "  Ticks:            " << m.ticks << "\n"
              << "  Rides:            " << m.sampleCount << "\n"
              << "  Mean wait:        " << m.meanWaitTime << " ticks\n"
              << "  P90 wait:         " << m.p90WaitTime << " ticks\n"
              << "  Max wait:         " << m.maxWaitTime << " ticks\n"
              << "  Total energy:     " << m.totalEnergy << "\n"
              << "  Energy per tick:  " << m.meanEnergyPerTick << "\n";
    for (std::size_t i = 0; i < m.perElevatorEnergy.size(); ++i) {
        std::cout << "    E" << i << ":             " << m.perElevatorEnergy[i] << "\n";
    }
}

int main(int argc, char* argv[]) {
    ScenarioOptions options;

    try {
        if (!parseArgs(argc, argv, options)) {
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad option value (" << e.what() << ")\n";
        return 1;
    }

    std::cout << "========================================\n"
              << "       Elevator Traffic Simulation      \n"
              << "========================================\n"
              << "Configuration:\n"
              << "  Floors:     " << options.numFloors << "\n"
              << "  Elevators:  " << options.numElevators << "\n"
              << "  Doors:      " << options.numDoors << "\n"
              << "  Dispatch:   " << dispatchModeToString(options.dispatchMode) << "\n"
              << "  Weighting:  " << weightingToString(options.weighting) << "\n"
              << "  Arrival p:  " << options.arrivalProbability << "\n"
              << "  Ticks:      " << options.ticks << (options.drain ? " (drain)" : "") << "\n"
              << "  Seed:       " << options.seed << "\n"
              << "  Runs:       " << options.runs << "\n"
              << "========================================\n";

    try {
        BuildingConfig config = buildConfig(options);

        if (options.runs == 1) {
            Building building(config);
            RunSummary summary = options.drain ? building.runUntilDrained(options.ticks)
                                               : building.run(options.ticks);
            building.printStatus(std::cout);

            std::cout << "Run summary:\n"
                      << "  Ticks run:        " << summary.ticksRun
                      << (summary.drained ? " (drained)" : "") << "\n"
                      << "  Arrivals:         " << summary.totalArrivals << "\n"
                      << "  Departures:       " << summary.totalDepartures << "\n"
                      << "  Still inside:     " << summary.finalPopulation << "\n";
            printMetrics(summary.metrics);
        } else {
            std::vector<std::uint64_t> seeds(static_cast<std::size_t>(options.runs));
            std::iota(seeds.begin(), seeds.end(), options.seed);

            BatchRunner runner(config, options.threads);
            BatchResult result = runner.run(seeds, options.ticks, options.drain);

            for (const auto& [seed, summary] : result.runs) {
                std::cout << "Seed " << seed << ": "
                          << summary.ticksRun << " ticks, "
                          << summary.metrics.sampleCount << " rides, "
                          << std::fixed << std::setprecision(2)
                          << "mean wait " << summary.metrics.meanWaitTime << ", "
                          << "energy " << summary.metrics.totalEnergy << "\n";
            }
            std::cout << "Pooled over " << result.runs.size() << " runs:\n";
            printMetrics(result.pooled);
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Simulation ended.\n";
    return 0;
}
