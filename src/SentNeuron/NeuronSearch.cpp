#include "SentNeuron/NeuronSearch.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace sentneuron {

bool is_valid_sample(const SequenceCodec& codec, const std::vector<std::string>& symbols) {
    if (codec.is_symbolic()) {
        return std::any_of(symbols.begin(), symbols.end(),
                           [](const std::string& s) { return !s.empty() && s[0] == 'n'; });
    }
    return std::any_of(symbols.begin(), symbols.end(), [](const std::string& s) {
        return std::any_of(s.begin(), s.end(), [](char ch) { return !std::isspace(static_cast<unsigned char>(ch)); });
    });
}

std::string default_seed_text(const SequenceCodec& codec) {
    return codec.is_symbolic() ? "t_128" : ".";
}

NeuronFitness::NeuronFitness(const GenerativeModel& model, const SequenceCodec& codec,
                             const SentimentClassifier& classifier, std::vector<std::size_t> neurons,
                             NeuronFitnessConfig config)
    : model_(model), codec_(codec), classifier_(classifier), neurons_(std::move(neurons)), config_(std::move(config))
{
    if (!classifier_.fitted()) {
        throw std::invalid_argument("NeuronFitness: classifier is not fitted");
    }
    if (neurons_.empty()) {
        throw std::invalid_argument("NeuronFitness: no neurons to search");
    }
    for (auto n : neurons_) {
        if (n >= model_.hidden_size()) {
            throw std::out_of_range("NeuronFitness: neuron " + std::to_string(n) + " outside [0, " +
                                    std::to_string(model_.hidden_size()) + ")");
        }
    }
    if (config_.experiments <= 0 || config_.max_attempts < config_.experiments) {
        throw std::invalid_argument("NeuronFitness: need experiments > 0 and max_attempts >= experiments");
    }
    if (config_.sample_length == 0) {
        throw std::invalid_argument("NeuronFitness: sample_length must be positive");
    }
    if (config_.seed.empty()) {
        throw std::invalid_argument("NeuronFitness: seed sequence is empty");
    }
    for (const auto& symbol : config_.seed) {
        if (!codec_.contains(symbol)) {
            throw std::invalid_argument("NeuronFitness: seed symbol '" + symbol + "' is not in the vocabulary");
        }
    }
    if (!config_.validator) {
        config_.validator = is_valid_sample;
    }
}

OverrideMap NeuronFitness::overrides_for(const Individual& individual) const {
    if (individual.size() != neurons_.size()) {
        throw std::invalid_argument("NeuronFitness: individual has " + std::to_string(individual.size()) +
                                    " genes for " + std::to_string(neurons_.size()) + " neurons");
    }
    OverrideMap overrides;
    for (std::size_t i = 0; i < neurons_.size(); ++i) {
        overrides[static_cast<int>(neurons_[i])] = static_cast<float>(individual[i]);
    }
    return overrides;
}

double NeuronFitness::operator()(const Individual& individual) const {
    const OverrideMap overrides = overrides_for(individual);

    double total = 0.0;
    int valid = 0;
    int attempts = 0;
    while (valid < config_.experiments) {
        if (attempts >= config_.max_attempts) {
            throw SampleBudgetExhausted("NeuronFitness: only " + std::to_string(valid) + " of " +
                                        std::to_string(config_.experiments) + " valid samples after " +
                                        std::to_string(attempts) + " attempts");
        }
        ++attempts;

        const auto sample = model_.generate(codec_, config_.seed, config_.sample_length, config_.temperature, overrides);
        std::vector<std::string> symbols;
        symbols.reserve(sample.symbols.size());
        for (int id : sample.symbols) symbols.push_back(codec_.symbol(id));

        // Only the sampled suffix decides validity; the seed is always present.
        const std::vector<std::string> generated(symbols.end() - static_cast<std::ptrdiff_t>(config_.sample_length),
                                                 symbols.end());
        if (!config_.validator(codec_, generated)) continue;

        const auto features = model_.transform(codec_, symbols).features;
        const auto guess = classifier_.predict_one(features);
        if (!guess) {
            throw std::logic_error("NeuronFitness: classifier returned no prediction");
        }
        const double diff = static_cast<double>(*guess) - config_.target;
        total += diff * diff;
        ++valid;
    }
    return total / static_cast<double>(valid);
}

std::vector<std::size_t> select_override_neurons(const SentimentClassifier& classifier,
                                                 const GenerativeModel& model, std::size_t count) {
    const std::size_t hidden = model.hidden_size();
    const std::size_t last_layer_start = (model.n_layers() - 1) * hidden;
    const auto ranked = classifier.top_k_salient_dimensions(static_cast<std::size_t>(classifier.weights().cols()));

    std::vector<std::size_t> out;
    for (auto dim : ranked) {
        if (out.size() == count) break;
        if (dim >= last_layer_start && dim < last_layer_start + hidden) {
            out.push_back(dim - last_layer_start);
        }
    }
    return out;
}

} // namespace sentneuron
