#include "Probability.hpp"
#include <cmath>

// ============== Probability Model Implementation ==============

ProbabilityModel::ProbabilityModel(std::uint64_t seed)
    : seed_(seed), engine_(seed) {}

void ProbabilityModel::reseed(std::uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
    unit_.reset();
}

std::uint64_t ProbabilityModel::getSeed() const { return seed_; }

double ProbabilityModel::sampleUniform() {
    return unit_(engine_);
}

std::size_t ProbabilityModel::sampleCategorical(const std::vector<double>& weights) {
    double total = 0.0;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            throw InvalidDistribution("Negative or non-finite weight in categorical draw");
        }
        total += w;
    }
    if (total <= 0.0) {
        throw InvalidDistribution("Categorical draw needs at least one positive weight");
    }

    double threshold = sampleUniform() * total;
    double cumulative = 0.0;
    std::size_t lastPositive = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) continue;
        cumulative += weights[i];
        lastPositive = i;
        if (threshold < cumulative) {
            return i;
        }
    }
    // Rounding can leave threshold a hair above the final cumulative sum
    return lastPositive;
}

bool ProbabilityModel::sampleBernoulli(double p) {
    if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
        throw InvalidDistribution("Bernoulli probability out of [0, 1]: " + std::to_string(p));
    }
    return sampleUniform() < p;
}

int ProbabilityModel::samplePoisson(double lambda) {
    if (!std::isfinite(lambda) || lambda < 0.0) {
        throw InvalidDistribution("Poisson mean must be non-negative: " + std::to_string(lambda));
    }
    if (lambda == 0.0) {
        sampleUniform();
        return 0;
    }
    std::poisson_distribution<int> dist(lambda);
    return dist(engine_);
}

// ============== Validation ==============

void validateProbabilities(const std::vector<double>& probabilities, const std::string& what) {
    double total = 0.0;
    for (double p : probabilities) {
        if (!std::isfinite(p) || p < 0.0) {
            throw InvalidDistribution(what + ": probabilities must be finite and non-negative");
        }
        total += p;
    }
    if (std::fabs(total - 1.0) > kProbabilityTolerance) {
        throw InvalidDistribution(what + ": probabilities sum to " + std::to_string(total) +
                                  ", expected 1");
    }
}
