#include "SentNeuron/GeneticAlgorithm.hpp"

#include "SentTorch/Random.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <thread>

namespace sentneuron {

SelectionPolicy parse_selection_policy(const std::string& name) {
    if (name == "raw") return SelectionPolicy::RawFitness;
    if (name == "inverse") return SelectionPolicy::InverseFitness;
    if (name == "rank") return SelectionPolicy::Rank;
    throw std::invalid_argument("parse_selection_policy: unknown policy '" + name + "' (expected raw, inverse or rank)");
}

std::string to_string(SelectionPolicy policy) {
    switch (policy) {
        case SelectionPolicy::RawFitness: return "raw";
        case SelectionPolicy::InverseFitness: return "inverse";
        case SelectionPolicy::Rank: return "rank";
    }
    return "unknown";
}

void GeneticAlgorithmConfig::validate() const {
    if (population_size == 0) {
        throw std::invalid_argument("GeneticAlgorithmConfig: population_size must be positive");
    }
    if (elitism > population_size) {
        throw std::invalid_argument("GeneticAlgorithmConfig: elitism exceeds population_size");
    }
    if (cross_rate < 0.0 || cross_rate > 1.0 || mutation_rate < 0.0 || mutation_rate > 1.0) {
        throw std::invalid_argument("GeneticAlgorithmConfig: rates must be in [0, 1]");
    }
    if (!(domain.first < domain.second)) {
        throw std::invalid_argument("GeneticAlgorithmConfig: domain lower bound must be below upper bound");
    }
}

GeneticAlgorithm::GeneticAlgorithm(GeneticAlgorithmConfig config, std::size_t individual_size, FitnessFunction fitness)
    : config_(std::move(config)),
      individual_size_(individual_size),
      fitness_(std::move(fitness)),
      rng_(config_.seed)
{
    config_.validate();
    if (individual_size_ == 0) {
        throw std::invalid_argument("GeneticAlgorithm: individuals must have at least one gene");
    }
    if (!fitness_) {
        throw std::invalid_argument("GeneticAlgorithm: fitness function is empty");
    }

    std::uniform_real_distribution<double> gene(config_.domain.first, config_.domain.second);
    population_.assign(config_.population_size, Individual(individual_size_));
    for (auto& individual : population_) {
        for (auto& g : individual) g = gene(rng_);
    }
}

void GeneticAlgorithm::check_population(const Population& population, const char* where) const {
    if (population.size() != config_.population_size) {
        throw std::invalid_argument(std::string(where) + ": population size " + std::to_string(population.size()) +
                                    " != " + std::to_string(config_.population_size));
    }
    for (const auto& individual : population) {
        if (individual.size() != individual_size_) {
            throw std::invalid_argument(std::string(where) + ": individual has " + std::to_string(individual.size()) +
                                        " genes, expected " + std::to_string(individual_size_));
        }
    }
}

void GeneticAlgorithm::set_population(Population population) {
    check_population(population, "GeneticAlgorithm::set_population");
    population_ = std::move(population);
}

std::vector<double> GeneticAlgorithm::evaluate(const Population& population) {
    const std::size_t n = population.size();
    std::vector<double> scores(n, 0.0);
    if (n == 0) return scores;

    unsigned workers = config_.workers != 0 ? config_.workers : std::thread::hardware_concurrency();
    workers = std::max(1u, std::min<unsigned>(workers, static_cast<unsigned>(n)));

    // Each individual samples from its own seed so results do not depend on the worker count.
    const std::uint32_t seed_base = rng_();

    std::vector<std::exception_ptr> errors(workers);
    auto run = [&](unsigned w) {
        try {
            for (std::size_t i = w; i < n; i += workers) {
                st::manual_seed(seed_base + static_cast<std::uint32_t>(i));
                scores[i] = fitness_(population[i]);
            }
        } catch (...) {
            errors[w] = std::current_exception();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers - 1);
    for (unsigned w = 1; w < workers; ++w) {
        threads.emplace_back(run, w);
    }
    run(0);
    for (auto& t : threads) t.join();

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }
    return scores;
}

std::vector<double> GeneticAlgorithm::selection_weights(const std::vector<double>& sorted_scores) const {
    const std::size_t n = sorted_scores.size();
    std::vector<double> weights(n);
    for (std::size_t rank = 0; rank < n; ++rank) {
        switch (config_.selection) {
            case SelectionPolicy::RawFitness:
                weights[rank] = sorted_scores[rank];
                break;
            case SelectionPolicy::InverseFitness:
                weights[rank] = 1.0 / (sorted_scores[rank] + 1e-9);
                break;
            case SelectionPolicy::Rank:
                weights[rank] = static_cast<double>(n - rank);
                break;
        }
        if (weights[rank] < 0.0 || !std::isfinite(weights[rank])) {
            throw std::invalid_argument("GeneticAlgorithm::select: " + to_string(config_.selection) +
                                        " selection needs non-negative finite weights");
        }
    }
    return weights;
}

std::size_t GeneticAlgorithm::roulette(const std::vector<double>& weights) {
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (total <= 0.0) {
        std::uniform_int_distribution<std::size_t> any(0, weights.size() - 1);
        return any(rng_);
    }
    std::uniform_real_distribution<double> spin(0.0, total);
    const double pick = spin(rng_);
    double current = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        current += weights[i];
        if (current > pick) return i;
    }
    return weights.size() - 1;
}

Population GeneticAlgorithm::select(const Population& population, const std::vector<double>& scores) {
    check_population(population, "GeneticAlgorithm::select");
    if (scores.size() != population.size()) {
        throw std::invalid_argument("GeneticAlgorithm::select: one score per individual required");
    }

    std::vector<std::size_t> order(population.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&scores](std::size_t a, std::size_t b) { return scores[a] < scores[b]; });

    std::vector<double> sorted_scores(order.size());
    for (std::size_t i = 0; i < order.size(); ++i) sorted_scores[i] = scores[order[i]];
    const auto weights = selection_weights(sorted_scores);

    Population next;
    next.reserve(population.size());
    for (std::size_t i = 0; i < population.size(); ++i) {
        if (i < config_.elitism) {
            next.push_back(population[order[i]]);
        } else {
            next.push_back(population[order[roulette(weights)]]);
        }
    }
    return next;
}

void GeneticAlgorithm::cross(Population& population) {
    std::bernoulli_distribution crossover(config_.cross_rate);
    for (std::size_t i = config_.elitism; i + 1 < population.size(); ++i) {
        if (crossover(rng_)) {
            for (std::size_t g = 0; g < population[i].size(); ++g) {
                population[i][g] = (population[i][g] + population[i + 1][g]) / 2.0;
            }
        }
    }
}

void GeneticAlgorithm::mutate(Population& population) {
    std::bernoulli_distribution mutation(config_.mutation_rate);
    std::uniform_real_distribution<double> gene(config_.domain.first, config_.domain.second);
    for (std::size_t i = config_.elitism; i < population.size(); ++i) {
        for (auto& g : population[i]) {
            if (mutation(rng_)) g = gene(rng_);
        }
    }
}

EvolutionResult GeneticAlgorithm::evolve(int generations) {
    if (generations < 0) {
        throw std::invalid_argument("GeneticAlgorithm::evolve: generations must be non-negative");
    }

    EvolutionResult result;
    for (int generation = 0; generation < generations; ++generation) {
        const auto scores = evaluate(population_);
        const double best = *std::min_element(scores.begin(), scores.end());
        result.history.push_back(best);
        std::cout << "[GeneticAlgorithm] generation " << generation << " best score " << best << std::endl;

        Population next = select(population_, scores);
        cross(next);
        mutate(next);
        population_ = std::move(next);
    }

    const auto scores = evaluate(population_);
    const auto best_it = std::min_element(scores.begin(), scores.end());
    const auto best_ix = static_cast<std::size_t>(std::distance(scores.begin(), best_it));
    result.history.push_back(*best_it);
    result.best = population_[best_ix];
    result.best_score = *best_it;
    std::cout << "[GeneticAlgorithm] final best score " << result.best_score << std::endl;
    return result;
}

} // namespace sentneuron
