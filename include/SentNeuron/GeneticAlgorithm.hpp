#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace sentneuron {

using Individual = std::vector<double>;
using Population = std::vector<Individual>;

/// Score of one individual; lower is better. Must be safe to call from
/// several threads at once.
using FitnessFunction = std::function<double(const Individual&)>;

/// Roulette-wheel weighting of the sorted population.
enum class SelectionPolicy {
    RawFitness,     ///< weight = score; favors worse individuals
    InverseFitness, ///< weight = 1 / (score + 1e-9)
    Rank            ///< weight = n - rank
};

SelectionPolicy parse_selection_policy(const std::string& name);
std::string to_string(SelectionPolicy policy);

struct GeneticAlgorithmConfig {
    std::size_t population_size = 100;
    double cross_rate = 0.95;
    double mutation_rate = 0.1;
    std::size_t elitism = 3;
    std::pair<double, double> domain{-10.0, 10.0};
    SelectionPolicy selection = SelectionPolicy::InverseFitness;
    unsigned workers = 0; ///< 0 = hardware concurrency
    std::uint32_t seed = 42;

    /// Throws std::invalid_argument on inconsistent settings.
    void validate() const;
};

struct EvolutionResult {
    Individual best;
    double best_score = 0.0;
    std::vector<double> history; ///< best score of every evaluated generation
};

class GeneticAlgorithm {
public:
    GeneticAlgorithm(GeneticAlgorithmConfig config, std::size_t individual_size, FitnessFunction fitness);

    const Population& population() const { return population_; }
    /// Replaces the current population; size and dimensionality must match.
    void set_population(Population population);

    /// Scores every individual on worker threads. A worker exception is
    /// rethrown here after all workers have joined.
    std::vector<double> evaluate(const Population& population);

    /// Stable ascending sort by score; the elite prefix is copied unchanged
    /// and the remaining slots are drawn by roulette wheel.
    Population select(const Population& population, const std::vector<double>& scores);

    /// pop[i] = (pop[i] + pop[i + 1]) / 2 with probability cross_rate, i in [elitism, n - 1).
    void cross(Population& population);

    /// Non-elite genes are resampled from the domain with probability mutation_rate.
    void mutate(Population& population);

    EvolutionResult evolve(int generations);

    const GeneticAlgorithmConfig& config() const { return config_; }

private:
    std::vector<double> selection_weights(const std::vector<double>& sorted_scores) const;
    std::size_t roulette(const std::vector<double>& weights);
    void check_population(const Population& population, const char* where) const;

    GeneticAlgorithmConfig config_;
    std::size_t individual_size_;
    FitnessFunction fitness_;
    std::mt19937 rng_;
    Population population_;
};

} // namespace sentneuron
