#pragma once

#include "SentNeuron/Codec.hpp"
#include "SentNeuron/GenerativeModel.hpp"
#include "SentNeuron/GeneticAlgorithm.hpp"
#include "SentNeuron/Override.hpp"
#include "SentNeuron/SentimentClassifier.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sentneuron {

/// Raised when a fitness evaluation runs out of sampling attempts.
class SampleBudgetExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Accepts or rejects a generated symbol sequence.
using SampleValidator = std::function<bool(const SequenceCodec&, const std::vector<std::string>&)>;

/// Symbolic streams need at least one note symbol (a symbol starting
/// with 'n'); text must contain a non-whitespace character.
bool is_valid_sample(const SequenceCodec& codec, const std::vector<std::string>& symbols);

/// Seed text used when none is given: a rest token for symbolic streams,
/// "." for text.
std::string default_seed_text(const SequenceCodec& codec);

struct NeuronFitnessConfig {
    std::vector<std::string> seed{"."};
    std::size_t sample_length = 256;
    float temperature = 1.0f;
    int experiments = 30;
    int max_attempts = 300;
    double target = 1.0;
    SampleValidator validator = is_valid_sample;
};

/// Scores an individual by steering generation with it and asking the
/// classifier how far the samples land from the target class. Lower is better.
class NeuronFitness {
public:
    NeuronFitness(const GenerativeModel& model, const SequenceCodec& codec, const SentimentClassifier& classifier,
                  std::vector<std::size_t> neurons, NeuronFitnessConfig config);

    double operator()(const Individual& individual) const;

    OverrideMap overrides_for(const Individual& individual) const;

    const std::vector<std::size_t>& neurons() const { return neurons_; }

private:
    const GenerativeModel& model_;
    const SequenceCodec& codec_;
    const SentimentClassifier& classifier_;
    std::vector<std::size_t> neurons_;
    NeuronFitnessConfig config_;
};

/// Salient classifier dimensions that fall in the model's last layer,
/// returned as hidden-unit indices in salience order.
std::vector<std::size_t> select_override_neurons(const SentimentClassifier& classifier,
                                                 const GenerativeModel& model, std::size_t count);

} // namespace sentneuron
