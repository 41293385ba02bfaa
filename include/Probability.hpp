#ifndef PROBABILITY_HPP
#define PROBABILITY_HPP

#include "Types.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

// ============== Probability Model ==============
// Explicitly seeded sampling source. Every sample advances the engine,
// so two models with the same seed and the same call sequence agree.

class ProbabilityModel {
private:
    std::uint64_t seed_;
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};

public:
    explicit ProbabilityModel(std::uint64_t seed);

    void reseed(std::uint64_t seed);
    std::uint64_t getSeed() const;

    // Index drawn proportionally to `weights`.
    // Throws InvalidDistribution on negative weights or an all-zero set.
    std::size_t sampleCategorical(const std::vector<double>& weights);

    // Throws InvalidDistribution unless 0 <= p <= 1.
    bool sampleBernoulli(double p);

    // Throws InvalidDistribution on a negative mean.
    int samplePoisson(double lambda);

    double sampleUniform();
};

// ============== Validation ==============

constexpr double kProbabilityTolerance = 1e-9;

// Throws InvalidDistribution unless every entry is a finite, non-negative
// probability and the entries sum to 1 within kProbabilityTolerance.
void validateProbabilities(const std::vector<double>& probabilities, const std::string& what);

#endif // PROBABILITY_HPP
