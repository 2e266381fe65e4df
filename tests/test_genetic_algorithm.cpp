#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "SentNeuron/GeneticAlgorithm.hpp"
#include "SentNeuron/NeuronSearch.hpp"
#include "SentTorch/Random.hpp"

using namespace sentneuron;

namespace {

double sphere(const Individual& ind) {
    double total = 0.0;
    for (double g : ind) total += g * g;
    return total;
}

GeneticAlgorithmConfig small_config(std::size_t population, std::size_t elitism) {
    GeneticAlgorithmConfig config;
    config.population_size = population;
    config.elitism = elitism;
    config.workers = 2;
    config.seed = 11;
    return config;
}

Population numbered_population(std::size_t n) {
    Population pop;
    for (std::size_t i = 0; i < n; ++i) pop.push_back({static_cast<double>(i)});
    return pop;
}

} // namespace

TEST(GeneticAlgorithmTest, SelectionPolicyNames) {
    EXPECT_EQ(parse_selection_policy("raw"), SelectionPolicy::RawFitness);
    EXPECT_EQ(parse_selection_policy("inverse"), SelectionPolicy::InverseFitness);
    EXPECT_EQ(parse_selection_policy("rank"), SelectionPolicy::Rank);
    EXPECT_EQ(to_string(SelectionPolicy::Rank), "rank");
    EXPECT_THROW(parse_selection_policy("tournament"), std::invalid_argument);
}

TEST(GeneticAlgorithmTest, ConfigValidation) {
    EXPECT_THROW((GeneticAlgorithm(small_config(5, 6), 1, sphere)), std::invalid_argument);
    EXPECT_THROW((GeneticAlgorithm(small_config(0, 0), 1, sphere)), std::invalid_argument);
    EXPECT_THROW((GeneticAlgorithm(small_config(5, 1), 0, sphere)), std::invalid_argument);

    auto config = small_config(5, 1);
    config.domain = {1.0, -1.0};
    EXPECT_THROW((GeneticAlgorithm(config, 1, sphere)), std::invalid_argument);
}

TEST(GeneticAlgorithmTest, InitialPopulationLiesInDomain) {
    auto config = small_config(30, 2);
    config.domain = {-2.0, 3.0};
    GeneticAlgorithm ga(config, 4, sphere);
    ASSERT_EQ(ga.population().size(), 30u);
    for (const auto& ind : ga.population()) {
        ASSERT_EQ(ind.size(), 4u);
        for (double g : ind) {
            EXPECT_GE(g, -2.0);
            EXPECT_LT(g, 3.0);
        }
    }
    EXPECT_THROW(ga.set_population(numbered_population(29)), std::invalid_argument);
}

TEST(GeneticAlgorithmTest, SelectKeepsElitesInScoreOrder) {
    GeneticAlgorithm ga(small_config(10, 3), 1, sphere);
    const Population pop = numbered_population(10);
    const std::vector<double> scores{5.0, 0.5, 9.0, 0.1, 7.0, 3.0, 0.3, 8.0, 6.0, 4.0};

    const Population next = ga.select(pop, scores);
    ASSERT_EQ(next.size(), 10u);
    EXPECT_EQ(next[0], Individual{3.0});
    EXPECT_EQ(next[1], Individual{6.0});
    EXPECT_EQ(next[2], Individual{1.0});
    for (const auto& ind : next) {
        EXPECT_NE(std::find(pop.begin(), pop.end(), ind), pop.end());
    }

    EXPECT_THROW(ga.select(pop, {1.0, 2.0}), std::invalid_argument);
}

TEST(GeneticAlgorithmTest, StableSortKeepsFirstOfEqualScores) {
    GeneticAlgorithm ga(small_config(4, 2), 1, sphere);
    const Population next = ga.select(numbered_population(4), {1.0, 1.0, 1.0, 1.0});
    EXPECT_EQ(next[0], Individual{0.0});
    EXPECT_EQ(next[1], Individual{1.0});
}

TEST(GeneticAlgorithmTest, RawAndInverseWeightingPullOppositeWays) {
    const Population pop = numbered_population(10);
    std::vector<double> scores(10, 1.0);
    scores[0] = 0.0;

    auto count_best = [&](SelectionPolicy policy) {
        auto config = small_config(10, 0);
        config.selection = policy;
        GeneticAlgorithm ga(config, 1, sphere);
        std::size_t hits = 0;
        for (int round = 0; round < 20; ++round) {
            for (const auto& ind : ga.select(pop, scores)) {
                if (ind == Individual{0.0}) ++hits;
            }
        }
        return hits;
    };

    EXPECT_EQ(count_best(SelectionPolicy::RawFitness), 0u);
    EXPECT_GE(count_best(SelectionPolicy::InverseFitness), 195u);

    auto config = small_config(10, 0);
    config.selection = SelectionPolicy::RawFitness;
    GeneticAlgorithm raw(config, 1, sphere);
    scores[3] = -1.0;
    EXPECT_THROW(raw.select(pop, scores), std::invalid_argument);
}

TEST(GeneticAlgorithmTest, CrossAndMutateLeaveElitesUntouched) {
    auto config = small_config(6, 2);
    config.cross_rate = 1.0;
    config.mutation_rate = 1.0;
    GeneticAlgorithm ga(config, 1, sphere);

    Population crossed = numbered_population(6);
    ga.cross(crossed);
    EXPECT_EQ(crossed[0], Individual{0.0});
    EXPECT_EQ(crossed[1], Individual{1.0});
    EXPECT_EQ(crossed[2], Individual{2.5});
    EXPECT_EQ(crossed[3], Individual{3.5});
    EXPECT_EQ(crossed[4], Individual{4.5});
    EXPECT_EQ(crossed[5], Individual{5.0});

    Population mutated = numbered_population(6);
    ga.mutate(mutated);
    EXPECT_EQ(mutated[0], Individual{0.0});
    EXPECT_EQ(mutated[1], Individual{1.0});
    std::size_t changed = 0;
    for (std::size_t i = 2; i < 6; ++i) {
        if (mutated[i] != Individual{static_cast<double>(i)}) ++changed;
        EXPECT_GE(mutated[i][0], config.domain.first);
        EXPECT_LT(mutated[i][0], config.domain.second);
    }
    EXPECT_EQ(changed, 4u);
}

TEST(GeneticAlgorithmTest, EvaluationDoesNotDependOnWorkerCount) {
    auto noisy = [](const Individual& ind) {
        std::uniform_real_distribution<double> jitter(0.0, 1.0);
        return sphere(ind) + jitter(st::generator());
    };

    auto single = small_config(16, 2);
    single.workers = 1;
    auto many = small_config(16, 2);
    many.workers = 4;

    GeneticAlgorithm a(single, 3, noisy);
    GeneticAlgorithm b(many, 3, noisy);
    EXPECT_EQ(a.population(), b.population());
    EXPECT_EQ(a.evaluate(a.population()), b.evaluate(b.population()));
}

TEST(GeneticAlgorithmTest, WorkerExceptionsPropagate) {
    auto failing = [](const Individual& ind) -> double {
        if (ind[0] > 0.0) throw std::runtime_error("bad individual");
        return 0.0;
    };
    auto config = small_config(8, 1);
    config.workers = 3;
    GeneticAlgorithm ga(config, 1, failing);
    Population pop = numbered_population(8);
    EXPECT_THROW(ga.evaluate(pop), std::runtime_error);
}

TEST(GeneticAlgorithmTest, EvolveNeverLosesTheBestScore) {
    auto config = small_config(20, 3);
    config.domain = {-5.0, 5.0};
    GeneticAlgorithm ga(config, 2, sphere);

    const EvolutionResult result = ga.evolve(8);
    ASSERT_EQ(result.history.size(), 9u);
    for (std::size_t i = 1; i < result.history.size(); ++i) {
        EXPECT_LE(result.history[i], result.history[i - 1]);
    }
    EXPECT_DOUBLE_EQ(result.best_score, result.history.back());
    EXPECT_DOUBLE_EQ(sphere(result.best), result.best_score);

    EXPECT_THROW(ga.evolve(-1), std::invalid_argument);
}

class NeuronSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        codec_ = make_codec("txt", build_vocabulary({"a", "b", " "}));
        st::manual_seed(8);
        model_ = std::make_unique<GenerativeModel>(codec_->vocab_size(), 3, 4, codec_->vocab_size());

        const std::vector<std::string> texts{"aab", "bba", "ab ab", "ba ba", "aaaa", "bbbb", "a b", "b a"};
        for (std::size_t i = 0; i < texts.size(); ++i) {
            features_.push_back(model_->transform(*codec_, codec_->symbols(texts[i])).features);
            labels_.push_back(static_cast<int>(i % 2));
        }
        classifier_.fit(features_, labels_, features_, labels_, {1.0});
    }

    std::unique_ptr<SequenceCodec> codec_;
    std::unique_ptr<GenerativeModel> model_;
    FeatureMatrix features_;
    std::vector<int> labels_;
    SentimentClassifier classifier_;
};

TEST_F(NeuronSearchTest, SampleValidationByCodecKind) {
    auto midi = make_codec("midi_note", build_vocabulary({"n_60", "w_2", "."}));
    EXPECT_TRUE(is_valid_sample(*midi, {"w_2", "n_60"}));
    EXPECT_FALSE(is_valid_sample(*midi, {"w_2", "."}));
    EXPECT_TRUE(is_valid_sample(*codec_, {" ", "a"}));
    EXPECT_FALSE(is_valid_sample(*codec_, {" ", " "}));
    EXPECT_FALSE(is_valid_sample(*codec_, {}));
}

TEST_F(NeuronSearchTest, DefaultSeedFollowsCodecKind) {
    EXPECT_EQ(default_seed_text(*codec_), ".");
    auto midi = make_codec("midi_note", build_vocabulary({"n_60", "t_128", "w_2"}));
    EXPECT_EQ(default_seed_text(*midi), "t_128");
    EXPECT_EQ(midi->symbols(default_seed_text(*midi)), (std::vector<std::string>{"t_128"}));
    EXPECT_TRUE(midi->contains("t_128"));
}

TEST_F(NeuronSearchTest, FitnessIsMeanSquaredDistanceToTarget) {
    NeuronFitnessConfig config;
    config.seed = {"a"};
    config.sample_length = 6;
    config.experiments = 4;
    config.max_attempts = 4;
    config.validator = [](const SequenceCodec&, const std::vector<std::string>&) { return true; };
    NeuronFitness fitness(*model_, *codec_, classifier_, {1, 3}, config);

    EXPECT_EQ(fitness.overrides_for({0.5, -2.0}), (OverrideMap{{1, 0.5f}, {3, -2.0f}}));
    EXPECT_THROW(fitness.overrides_for({1.0}), std::invalid_argument);

    st::manual_seed(4);
    const double score = fitness({0.5, -2.0});
    EXPECT_GE(score, 0.0);
    EXPECT_LE(score, 1.0);
}

TEST_F(NeuronSearchTest, ExhaustedSampleBudgetFailsTheEvaluation) {
    NeuronFitnessConfig config;
    config.seed = {"a"};
    config.sample_length = 4;
    config.experiments = 2;
    config.max_attempts = 5;
    std::atomic<int> calls{0};
    config.validator = [&calls](const SequenceCodec&, const std::vector<std::string>&) {
        ++calls;
        return false;
    };
    NeuronFitness fitness(*model_, *codec_, classifier_, {0}, config);
    EXPECT_THROW(fitness({1.0}), SampleBudgetExhausted);
    EXPECT_EQ(calls.load(), 5);

    GeneticAlgorithm ga(small_config(4, 1), 1, [&fitness](const Individual& ind) { return fitness(ind); });
    EXPECT_THROW(ga.evolve(1), SampleBudgetExhausted);
}

TEST_F(NeuronSearchTest, SeedDoesNotValidateDegenerateSamples) {
    // Force every sampled symbol to be a space.
    const int space = codec_->encode({" "}).front();
    for (const auto& named : model_->named_parameters()) {
        if (named.first == "h2y.bias") named.second->data(0, space) = 100.0f;
    }

    NeuronFitnessConfig config;
    config.seed = {"a"};
    config.sample_length = 8;
    config.experiments = 3;
    config.max_attempts = 3;
    NeuronFitness fitness(*model_, *codec_, classifier_, {0}, config);

    st::manual_seed(5);
    const auto sample = model_->generate(*codec_, config.seed, config.sample_length);
    EXPECT_EQ(codec_->decode(sample.symbols), "a        ");
    EXPECT_THROW(fitness({0.0}), SampleBudgetExhausted);
}

TEST_F(NeuronSearchTest, ConstructorRejectsInconsistentSetups) {
    NeuronFitnessConfig config;
    EXPECT_THROW((NeuronFitness(*model_, *codec_, classifier_, {4}, config)), std::out_of_range);
    EXPECT_THROW((NeuronFitness(*model_, *codec_, classifier_, {}, config)), std::invalid_argument);

    SentimentClassifier unfitted;
    EXPECT_THROW((NeuronFitness(*model_, *codec_, unfitted, {0}, config)), std::invalid_argument);

    auto few_attempts = config;
    few_attempts.max_attempts = few_attempts.experiments - 1;
    EXPECT_THROW((NeuronFitness(*model_, *codec_, classifier_, {0}, few_attempts)), std::invalid_argument);

    auto nothing_sampled = config;
    nothing_sampled.sample_length = 0;
    EXPECT_THROW((NeuronFitness(*model_, *codec_, classifier_, {0}, nothing_sampled)), std::invalid_argument);

    auto no_seed = config;
    no_seed.seed.clear();
    EXPECT_THROW((NeuronFitness(*model_, *codec_, classifier_, {0}, no_seed)), std::invalid_argument);

    // The default "." seed is not in this vocabulary.
    EXPECT_THROW((NeuronFitness(*model_, *codec_, classifier_, {0}, config)), std::invalid_argument);
}

TEST_F(NeuronSearchTest, OverrideNeuronsComeFromTheLastLayer) {
    const auto neurons = select_override_neurons(classifier_, *model_, 2);
    ASSERT_EQ(neurons.size(), 2u);
    const auto ranked = classifier_.top_k_salient_dimensions(4);
    EXPECT_EQ(neurons[0], ranked[0]);
    EXPECT_EQ(neurons[1], ranked[1]);

    st::manual_seed(8);
    GenerativeModel deep(codec_->vocab_size(), 3, 4, codec_->vocab_size(), 2);
    FeatureMatrix deep_features;
    for (const auto& text : {"aab", "bba", "ab ab", "ba ba"}) {
        deep_features.push_back(deep.transform(*codec_, codec_->symbols(text)).features);
    }
    SentimentClassifier deep_clf;
    deep_clf.fit(deep_features, {0, 1, 0, 1}, deep_features, {0, 1, 0, 1}, {1.0});
    for (auto n : select_override_neurons(deep_clf, deep, 8)) {
        EXPECT_LT(n, 4u);
    }
}
