#include "SentNeuron/Codec.hpp"
#include "SentNeuron/Config.hpp"
#include "SentNeuron/Dataset.hpp"
#include "SentNeuron/GenerativeModel.hpp"
#include "SentNeuron/GeneticAlgorithm.hpp"
#include "SentNeuron/NeuronSearch.hpp"
#include "SentNeuron/Override.hpp"
#include "SentNeuron/SentimentClassifier.hpp"
#include "SentTorch/Random.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace sentneuron;

namespace {

std::atomic<bool> g_cancel{false};

void handle_sigint(int) {
    g_cancel.store(true);
}

void print_usage() {
    std::cout << "Usage:\n"
              << "  sentneuron train -data_path P -data_type {txt,midi_note,midi_chord,midi_perform}\n"
              << "      [-embed_size 64] [-hidden_size 128] [-n_layers 1] [-dropout 0] [-epochs 100]\n"
              << "      [-seq_length 256] [-lr 5e-4] [-lr_decay 0.7] [-grad_clip 5] [-batch_size 128]\n"
              << "      [-save_path trained_models] [-resume PREFIX] [-config FILE]\n"
              << "  sentneuron generate -model_path PREFIX [-seq_init .] [-seq_length 256] [-temp 1.0]\n"
              << "      [-override FILE] [-n 1] [-output_dir output]\n"
              << "  sentneuron evolve -model_path PREFIX -sent_train FILE -sent_test FILE [-n_neurons 1]\n"
              << "      [-population 100] [-generations 10] [-elitism 3] [-target 1.0] [-seq_init .|t_128]\n"
              << "      [-seq_length 256] [-experiments 30] [-selection inverse|raw|rank]\n"
              << "      [-override_out override.json]\n";
}

// "-key value" pairs after the subcommand.
class Args {
public:
    Args(int argc, char** argv, int first) {
        for (int i = first; i < argc; ++i) {
            const std::string key = argv[i];
            if (key.size() < 2 || key[0] != '-') {
                throw std::invalid_argument("unexpected argument '" + key + "'");
            }
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + key);
            }
            values_[key.substr(1)] = argv[++i];
        }
    }

    bool has(const std::string& key) const { return values_.count(key) > 0; }

    std::string str(const std::string& key, const std::string& fallback = "") const {
        auto it = values_.find(key);
        return it == values_.end() ? fallback : it->second;
    }

    std::string required(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            throw std::invalid_argument("-" + key + " is required");
        }
        return it->second;
    }

    int integer(const std::string& key, int fallback) const {
        if (!has(key)) return fallback;
        try {
            return std::stoi(str(key));
        } catch (const std::exception&) {
            throw std::invalid_argument("-" + key + " expects an integer, got '" + str(key) + "'");
        }
    }

    double real(const std::string& key, double fallback) const {
        if (!has(key)) return fallback;
        try {
            return std::stod(str(key));
        } catch (const std::exception&) {
            throw std::invalid_argument("-" + key + " expects a number, got '" + str(key) + "'");
        }
    }

private:
    std::map<std::string, std::string> values_;
};

int run_train(const Args& args) {
    TrainConfig config;
    if (args.has("config") && !config.load(args.str("config"))) {
        throw std::runtime_error("Unable to load config file: " + args.str("config"));
    }

    config.data_path = args.str("data_path", config.data_path);
    config.data_type = args.str("data_type", config.data_type);
    config.save_path = args.str("save_path", config.save_path);
    config.embed_size = args.integer("embed_size", config.embed_size);
    config.hidden_size = args.integer("hidden_size", config.hidden_size);
    config.n_layers = args.integer("n_layers", config.n_layers);
    config.dropout = static_cast<float>(args.real("dropout", config.dropout));
    config.epochs = args.integer("epochs", config.epochs);
    config.seq_length = args.integer("seq_length", config.seq_length);
    config.lr = args.real("lr", config.lr);
    config.lr_decay = args.real("lr_decay", config.lr_decay);
    config.grad_clip = static_cast<float>(args.real("grad_clip", config.grad_clip));
    config.batch_size = args.integer("batch_size", config.batch_size);
    config.eval_interval = args.integer("eval_interval", config.eval_interval);
    config.seed = static_cast<unsigned>(args.integer("seed", static_cast<int>(config.seed)));
    config.validate();

    if (config.data_path.empty() || config.data_type.empty()) {
        throw std::invalid_argument("-data_path and -data_type are required");
    }

    st::manual_seed(config.seed);
    const Dataset dataset = Dataset::open(config.data_path, config.data_type);

    std::shared_ptr<GenerativeModel> model;
    std::unique_ptr<SequenceCodec> codec;
    std::optional<Checkpoint> checkpoint;

    if (args.has("resume")) {
        LoadedModel loaded = GenerativeModel::load(args.str("resume"));
        if (loaded.meta.dataset.data_type != config.data_type) {
            throw std::invalid_argument("resume: model was trained on '" + loaded.meta.dataset.data_type +
                                        "' data, not '" + config.data_type + "'");
        }
        model = std::move(loaded.model);
        codec = std::move(loaded.codec);
        checkpoint = std::move(loaded.checkpoint);
        if (!checkpoint) {
            std::cerr << "[Main] No training state next to " << args.str("resume") << ", starting from epoch 0\n";
        }
    } else {
        codec = make_codec(config.data_type, build_vocabulary(dataset.scan_vocabulary()));
        const std::size_t vocab = codec->vocab_size();
        std::cout << "[Main] Vocabulary size: " << vocab << std::endl;
        model = std::make_shared<GenerativeModel>(vocab, static_cast<std::size_t>(config.embed_size),
                                                  static_cast<std::size_t>(config.hidden_size), vocab,
                                                  static_cast<std::size_t>(config.n_layers), config.dropout);
    }

    FitOptions options = FitOptions::from_config(config);
    options.save_prefix = fs::path(config.save_path) / dataset.name();
    options.cancel = &g_cancel;

    std::signal(SIGINT, handle_sigint);
    const FitResult result = model->fit(dataset, *codec, options, checkpoint);
    std::signal(SIGINT, SIG_DFL);

    std::cout << "[Main] Training " << (result.interrupted ? "interrupted" : "finished") << " at epoch "
              << result.state.epoch << ", shard " << result.state.shard << ", batch " << result.state.batch
              << "; test loss " << result.test_loss << std::endl;
    return 0;
}

int run_generate(const Args& args) {
    const fs::path model_path = args.required("model_path");
    const std::string seq_init = args.str("seq_init", ".");
    const int seq_length = args.integer("seq_length", 256);
    const auto temperature = static_cast<float>(args.real("temp", 1.0));
    const int count = args.integer("n", 1);
    const fs::path output_dir = args.str("output_dir", "output");

    if (seq_length < 0 || count < 0) {
        throw std::invalid_argument("-seq_length and -n must be non-negative");
    }

    OverrideMap overrides;
    if (args.has("override")) {
        overrides = load_override(args.str("override"));
    }

    LoadedModel loaded = GenerativeModel::load(model_path);
    const auto seed = loaded.codec->symbols(seq_init);

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw std::runtime_error("Unable to create output directory " + output_dir.string() + ": " + ec.message());
    }

    const std::string dataset_name = model_path.filename().string();
    for (int i = 0; i < count; ++i) {
        const auto sample = loaded.model->generate(*loaded.codec, seed, static_cast<std::size_t>(seq_length),
                                                   temperature, overrides);
        const fs::path out = output_dir / (dataset_name + "_" + std::to_string(i));
        std::ofstream file(out, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Unable to write sample " + out.string());
        }
        file << sample.text;
        std::cout << "[Main] Wrote " << out.string() << std::endl;
    }
    return 0;
}

struct LabelledData {
    FeatureMatrix features;
    std::vector<int> labels;
};

// One "label<TAB>text" example per line; symbols outside the vocabulary are dropped.
LabelledData load_labelled(const fs::path& path, const GenerativeModel& model, const SequenceCodec& codec) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open labelled data " + path.string());
    }

    LabelledData data;
    std::string line;
    std::size_t line_no = 0;
    std::size_t dropped = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        const auto tab = line.find('\t');
        if (tab == std::string::npos) {
            throw std::runtime_error(path.string() + ":" + std::to_string(line_no) + ": expected label<TAB>text");
        }
        int label = 0;
        try {
            label = std::stoi(line.substr(0, tab));
        } catch (const std::exception&) {
            throw std::runtime_error(path.string() + ":" + std::to_string(line_no) + ": label is not an integer");
        }

        std::vector<std::string> symbols;
        for (auto& s : codec.symbols(line.substr(tab + 1))) {
            if (codec.contains(s)) symbols.push_back(std::move(s));
            else ++dropped;
        }
        if (symbols.empty()) continue;

        data.features.push_back(model.transform(codec, symbols).features);
        data.labels.push_back(label);
    }
    if (dropped > 0) {
        std::cerr << "[Main] Dropped " << dropped << " out-of-vocabulary symbols from " << path.string() << std::endl;
    }
    return data;
}

int run_evolve(const Args& args) {
    const fs::path model_path = args.required("model_path");
    LoadedModel loaded = GenerativeModel::load(model_path);
    const GenerativeModel& model = *loaded.model;
    const SequenceCodec& codec = *loaded.codec;

    const auto train = load_labelled(args.required("sent_train"), model, codec);
    const auto test = load_labelled(args.required("sent_test"), model, codec);

    SentimentClassifier classifier;
    const double accuracy = classifier.fit(train.features, train.labels, test.features, test.labels);
    std::cout << "[Main] Sentiment classifier accuracy: " << accuracy << "%" << std::endl;

    const int n_neurons = args.integer("n_neurons", 1);
    if (n_neurons <= 0) {
        throw std::invalid_argument("-n_neurons must be positive");
    }
    const auto neurons = select_override_neurons(classifier, model, static_cast<std::size_t>(n_neurons));
    if (neurons.empty()) {
        throw std::runtime_error("No salient neurons found in the last layer");
    }

    NeuronFitnessConfig fitness_config;
    fitness_config.seed = codec.symbols(args.str("seq_init", default_seed_text(codec)));
    fitness_config.sample_length = static_cast<std::size_t>(args.integer("seq_length", 256));
    fitness_config.experiments = args.integer("experiments", 30);
    fitness_config.max_attempts = 10 * fitness_config.experiments;
    fitness_config.target = args.real("target", 1.0);
    const NeuronFitness fitness(model, codec, classifier, neurons, fitness_config);

    GeneticAlgorithmConfig ga_config;
    ga_config.population_size = static_cast<std::size_t>(args.integer("population", 100));
    ga_config.elitism = static_cast<std::size_t>(args.integer("elitism", 3));
    ga_config.selection = parse_selection_policy(args.str("selection", "inverse"));
    ga_config.seed = static_cast<std::uint32_t>(args.integer("seed", 42));

    GeneticAlgorithm ga(ga_config, neurons.size(), [&fitness](const Individual& ind) { return fitness(ind); });
    const EvolutionResult result = ga.evolve(args.integer("generations", 10));

    const OverrideMap best = fitness.overrides_for(result.best);
    std::cout << "[Main] Best score " << result.best_score << " with overrides:";
    for (const auto& [dim, bias] : best) std::cout << " " << dim << "=" << bias;
    std::cout << std::endl;

    // Trajectories of the chosen units while generating with the best overrides.
    const auto sample = model.generate(codec, fitness_config.seed, fitness_config.sample_length, 1.0f, best);
    std::vector<std::string> symbols;
    for (int id : sample.symbols) symbols.push_back(codec.symbol(id));
    const std::size_t offset = (model.n_layers() - 1) * model.hidden_size();
    std::vector<std::size_t> tracked;
    for (auto n : neurons) tracked.push_back(offset + n);
    const auto trajectories = model.neuron_values(codec, symbols, tracked);
    for (std::size_t i = 0; i < trajectories.size(); ++i) {
        const auto& values = trajectories[i];
        const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
        std::cout << "[Main] neuron " << neurons[i] << ": " << values.size() << " steps, min " << *lo
                  << ", max " << *hi << ", final " << values.back() << std::endl;
    }

    const fs::path override_out = args.str("override_out", "override.json");
    save_override(override_out, best);
    std::cout << "[Main] Wrote " << override_out.string() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            print_usage();
            return 1;
        }
        const std::string command = argv[1];
        if (command == "-h" || command == "--help" || command == "help") {
            print_usage();
            return 0;
        }

        const Args args(argc, argv, 2);
        if (command == "train") return run_train(args);
        if (command == "generate") return run_generate(args);
        if (command == "evolve") return run_evolve(args);

        std::cerr << "[Main] Unknown command: " << command << '\n';
        print_usage();
    } catch (const std::exception& e) {
        std::cerr << "[Main] Unhandled exception: " << e.what() << '\n';
    } catch (...) {
        std::cerr << "[Main] Unhandled unknown exception" << '\n';
    }
    return 1;
}
