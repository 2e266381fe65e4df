#include "SentNeuron/GenerativeModel.hpp"

#include "SentNeuron/SafeTensors.hpp"
#include "SentTorch/Functions.hpp"
#include "SentTorch/Random.hpp"
#include "SentTorch/Softmax.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sentneuron {

namespace {

// Raised between windows when cancellation was requested.
class TrainingInterrupted : public std::exception {
public:
    const char* what() const noexcept override { return "training interrupted"; }
};

constexpr const char* kStepKey = "optim.step";
constexpr std::size_t kSamplePrimeLength = 20;
constexpr std::size_t kSampleLength = 200;

std::vector<std::size_t> targets_of(const std::vector<int>& row) {
    return std::vector<std::size_t>(row.begin(), row.end());
}

} // namespace

HiddenState HiddenState::detached() const {
    HiddenState out;
    out.h.reserve(h.size());
    out.c.reserve(c.size());
    for (const auto& v : h) out.h.push_back(v->detach());
    for (const auto& v : c) out.c.push_back(v->detach());
    return out;
}

std::vector<float> HiddenState::flattened_cell() const {
    std::vector<float> out;
    for (const auto& layer : c) {
        const std::size_t width = layer->data.dim(1);
        for (std::size_t d = 0; d < width; ++d) {
            out.push_back(layer->data(0, d));
        }
    }
    return out;
}

FitOptions FitOptions::from_config(const TrainConfig& config) {
    FitOptions options;
    options.epochs = config.epochs;
    options.seq_length = config.seq_length;
    options.lr = config.lr;
    options.lr_decay = config.lr_decay;
    options.grad_clip = config.grad_clip;
    options.batch_size = config.batch_size;
    options.eval_interval = config.eval_interval;
    return options;
}

double shard_learning_rate(double lr, int epochs, int epoch, int shard, int shard_count) {
    if (epochs <= 0 || shard_count <= 0) {
        throw std::invalid_argument("shard_learning_rate: epochs and shard_count must be positive");
    }
    const double completed = static_cast<double>(epoch) + static_cast<double>(shard) / shard_count;
    return lr * (static_cast<double>(epochs) - completed) / static_cast<double>(epochs);
}

std::vector<std::vector<int>> batchify(const std::vector<int>& sequence, std::size_t batch_size) {
    if (batch_size == 0) {
        throw std::invalid_argument("batchify: batch_size must be positive");
    }
    const std::size_t rows = sequence.size() / batch_size;
    std::vector<std::vector<int>> out(rows, std::vector<int>(batch_size));
    for (std::size_t t = 0; t < rows; ++t) {
        for (std::size_t j = 0; j < batch_size; ++j) {
            out[t][j] = sequence[j * rows + t];
        }
    }
    return out;
}

std::vector<float> temperature_softmax(const st::Tensor& logits, float temperature) {
    if (!(temperature > 0.0f) || !std::isfinite(temperature)) {
        throw std::invalid_argument("temperature_softmax: temperature must be positive");
    }
    const st::Tensor probs = st::softmax_rows(logits / temperature);
    return std::vector<float>(probs.values().begin(), probs.values().begin() + probs.dim(1));
}

fs::path model_blob_path(const fs::path& prefix) { return fs::path(prefix.string() + "_model.safetensors"); }
fs::path training_state_path(const fs::path& prefix) { return fs::path(prefix.string() + "_train.json"); }
fs::path metadata_path(const fs::path& prefix) { return fs::path(prefix.string() + "_meta.json"); }

GenerativeModel::GenerativeModel(std::size_t input_size, std::size_t embed_size, std::size_t hidden_size,
                                 std::size_t output_size, std::size_t n_layers, float dropout)
    : input_size_(input_size),
      embed_size_(embed_size),
      hidden_size_(hidden_size),
      output_size_(output_size),
      dropout_(dropout)
{
    if (input_size == 0 || embed_size == 0 || hidden_size == 0 || output_size == 0 || n_layers == 0) {
        throw std::invalid_argument("GenerativeModel: sizes and layer count must be positive");
    }
    if (dropout < 0.0f || dropout >= 1.0f) {
        throw std::invalid_argument("GenerativeModel: dropout must be in [0, 1)");
    }

    i2h_ = std::make_shared<st::Embedding>(input_size, embed_size);
    add_module("i2h", i2h_);

    std::size_t layer_input = embed_size;
    for (std::size_t i = 0; i < n_layers; ++i) {
        auto cell = std::make_shared<st::MLSTMCell>(layer_input, hidden_size);
        add_module("layer_" + std::to_string(i), cell);
        layers_.push_back(cell);
        layer_input = hidden_size;
    }

    h2y_ = std::make_shared<st::Linear>(hidden_size, output_size);
    add_module("h2y", h2y_);
}

HiddenState GenerativeModel::init_hidden(std::size_t batch_size) const {
    HiddenState state;
    for (const auto& layer : layers_) {
        auto s = layer->initial_state(batch_size);
        state.h.push_back(s.h);
        state.c.push_back(s.c);
    }
    return state;
}

std::pair<HiddenState, VariablePtr> GenerativeModel::forward(const std::vector<int>& symbols,
                                                            const HiddenState& hidden) const {
    if (hidden.h.size() != layers_.size() || hidden.c.size() != layers_.size()) {
        throw std::invalid_argument("GenerativeModel::forward: hidden state has " + std::to_string(hidden.h.size()) +
                                    " layers, model has " + std::to_string(layers_.size()));
    }

    std::vector<std::size_t> ids(symbols.size());
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        if (symbols[i] < 0) {
            throw std::out_of_range("GenerativeModel::forward: negative symbol id");
        }
        ids[i] = static_cast<std::size_t>(symbols[i]);
    }

    VariablePtr x = (*i2h_)(st::make_indices(ids));

    HiddenState next;
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        auto out = (*layers_[i])(x, {hidden.h[i], hidden.c[i]});
        x = (i == 0) ? out.h : x + out.h;
        if (dropout_ > 0.0f) {
            x = st::dropout(x, dropout_);
        }
        next.h.push_back(out.h);
        next.c.push_back(out.c);
    }

    return {next, (*h2y_)(x)};
}

FitResult GenerativeModel::fit(const Dataset& dataset, const SequenceCodec& codec, const FitOptions& options,
                               const std::optional<Checkpoint>& checkpoint) {
    if (options.epochs <= 0 || options.seq_length <= 0 || options.batch_size <= 0 || options.eval_interval <= 0) {
        throw std::invalid_argument("GenerativeModel::fit: epochs, seq_length, batch_size and eval_interval must be positive");
    }
    if (dataset.shard_count() == 0) {
        throw std::invalid_argument("GenerativeModel::fit: dataset has no training shards");
    }

    st::Adam optimizer(named_parameters(), options.lr, options.lr_decay, 0.999, 1e-8);

    TrainingState state;
    std::optional<HiddenState> carried;
    if (checkpoint) {
        state = checkpoint->state;
        carried = checkpoint->carried;
        if (carried && (carried->h.size() != layers_.size() ||
                        carried->h.front()->data.dim(0) != static_cast<std::size_t>(options.batch_size))) {
            throw std::invalid_argument("GenerativeModel::fit: checkpoint state does not match batch_size " +
                                        std::to_string(options.batch_size));
        }
        if (!checkpoint->optimizer.exp_avg.empty()) {
            optimizer.load_state(checkpoint->optimizer);
        }
        std::cout << "[Trainer] Resuming at epoch " << state.epoch << ", shard " << state.shard
                  << ", batch " << state.batch << std::endl;
    }

    FitResult result;
    try {
        run_epochs(dataset, codec, options, optimizer, state, std::move(carried));
    } catch (const TrainingInterrupted&) {
        std::cout << "[Trainer] Exiting from training early." << std::endl;
        result.interrupted = true;
    }

    training_state_ = state;
    optimizer_state_ = optimizer.get_state();
    save_if_requested(options, dataset, codec);

    result.state = state;
    result.test_loss = evaluate(dataset, codec, dataset.test_shard(), options.seq_length, options.batch_size);
    std::cout << "[Trainer] Final test loss: " << result.test_loss << std::endl;
    return result;
}

void GenerativeModel::run_epochs(const Dataset& dataset, const SequenceCodec& codec, const FitOptions& options,
                                 st::Adam& optimizer, TrainingState& state, std::optional<HiddenState> carried) {
    const auto params = named_parameters();
    const auto& shards = dataset.train_shards();
    const int shard_count = static_cast<int>(shards.size());
    const auto L = static_cast<std::size_t>(options.seq_length);
    const auto batch_size = static_cast<std::size_t>(options.batch_size);

    int batch_in = state.batch;
    int shard_in = state.shard;

    for (int epoch = state.epoch; epoch < options.epochs; ++epoch) {
        state.epoch = epoch;

        for (int shard = shard_in; shard < shard_count; ++shard) {
            state.shard = shard;
            state.batch = batch_in;

            const double lr = shard_learning_rate(options.lr, options.epochs, epoch, shard, shard_count);
            optimizer.set_learning_rate(lr);

            auto mode = st::train_mode();

            const auto symbols = codec.symbols(dataset.read(shards[shard]));
            const auto rows = batchify(codec.encode(symbols), batch_size);
            const int n_batches = static_cast<int>(rows.size() / L);

            HiddenState h_init = carried ? *carried : init_hidden(batch_size);
            carried.reset();

            for (int batch_ix = batch_in; batch_ix < n_batches - 1; ++batch_ix) {
                if (options.cancel && options.cancel->load()) {
                    state.batch = batch_ix;
                    carried_ = h_init;
                    throw TrainingInterrupted();
                }

                optimizer.zero_grad();

                HiddenState h = h_init;
                VariablePtr loss;
                const std::size_t base = static_cast<std::size_t>(batch_ix) * L;
                for (std::size_t t = 0; t < L; ++t) {
                    auto step = forward(rows[base + t], h);
                    h = std::move(step.first);
                    auto step_loss = st::softmax_cross_entropy(step.second, targets_of(rows[base + t + 1]));
                    loss = loss ? loss + step_loss : step_loss;
                }
                loss->backward();

                h_init = h.detached();

                st::clip_grad_value(params, options.grad_clip);
                optimizer.step();

                const double window_loss = loss->data(0, 0);
                state.loss = 0.99 * state.loss + 0.01 * window_loss / static_cast<double>(L);
                state.batch = batch_ix + 1;

                training_state_ = state;
                optimizer_state_ = optimizer.get_state();
                carried_ = h_init;

                if (batch_ix % options.eval_interval == 0) {
                    log_progress(dataset, codec, options, state, lr, n_batches - 1, shards[shard], symbols);
                }

                if (options.on_batch_end) {
                    options.on_batch_end(state);
                }
            }

            batch_in = 0;
        }

        shard_in = 0;

        state.epoch = epoch + 1;
        state.shard = 0;
        state.batch = 0;
        training_state_ = state;
        optimizer_state_ = optimizer.get_state();
        carried_.reset();
        save_if_requested(options, dataset, codec);
    }
}

void GenerativeModel::log_progress(const Dataset& dataset, const SequenceCodec& codec, const FitOptions& options,
                                   const TrainingState& state, double lr, int n_windows, const ShardInfo& shard,
                                   const std::vector<std::string>& shard_symbols) const {
    const double test_loss = evaluate(dataset, codec, dataset.test_shard(), options.seq_length, options.batch_size);

    const std::size_t prime = std::min(kSamplePrimeLength, shard_symbols.size());
    std::string sample;
    if (prime > 0) {
        std::vector<std::string> seed(shard_symbols.begin(), shard_symbols.begin() + prime);
        sample = generate(codec, seed, kSampleLength).text;
    }

    std::cout << "[Trainer] epoch: " << state.epoch << "\n"
              << "[Trainer] lr: " << lr << "\n"
              << "[Trainer] filename: " << shard.name << "\n"
              << "[Trainer] batch: " << state.batch - 1 << "/" << n_windows << "\n"
              << "[Trainer] train loss = " << state.loss << "\n"
              << "[Trainer] test loss = " << test_loss << "\n"
              << "----\n" << sample << "\n----" << std::endl;
}

void GenerativeModel::save_if_requested(const FitOptions& options, const Dataset& dataset,
                                        const SequenceCodec& codec) const {
    if (!options.save_prefix.empty()) {
        save(options.save_prefix, dataset.info(), codec);
    }
}

double GenerativeModel::evaluate(const Dataset& dataset, const SequenceCodec& codec, const ShardInfo& shard,
                                 int seq_length, int batch_size) const {
    if (seq_length <= 0 || batch_size <= 0) {
        throw std::invalid_argument("GenerativeModel::evaluate: seq_length and batch_size must be positive");
    }
    std::cout << "[GenerativeModel] Evaluating model with test data: " << shard.path.string() << std::endl;

    auto grad_guard = st::no_grad();
    auto mode_guard = st::test_mode();

    const auto L = static_cast<std::size_t>(seq_length);
    const auto rows = batchify(codec.encode(codec.symbols(dataset.read(shard))), static_cast<std::size_t>(batch_size));
    const int n_windows = static_cast<int>(rows.size() / L) - 1;
    if (n_windows <= 0) {
        std::cerr << "[GenerativeModel] Test shard too short for one window: " << shard.path.string() << std::endl;
        return std::numeric_limits<double>::quiet_NaN();
    }

    HiddenState h = init_hidden(static_cast<std::size_t>(batch_size));
    double loss_avg = 0.0;
    for (int batch_ix = 0; batch_ix < n_windows; ++batch_ix) {
        const std::size_t base = static_cast<std::size_t>(batch_ix) * L;
        double loss = 0.0;
        for (std::size_t t = 0; t < L; ++t) {
            auto step = forward(rows[base + t], h);
            h = std::move(step.first);
            loss += st::softmax_cross_entropy(step.second, targets_of(rows[base + t + 1]))->data(0, 0);
        }
        loss_avg += loss / static_cast<double>(L);
    }
    return loss_avg / static_cast<double>(n_windows);
}

GenerationResult GenerativeModel::generate(const SequenceCodec& codec, const std::vector<std::string>& seed,
                                           std::size_t length, float temperature, const OverrideMap& overrides,
                                           bool append_seed) const {
    if (!(temperature > 0.0f) || !std::isfinite(temperature)) {
        throw std::invalid_argument("GenerativeModel::generate: temperature must be positive");
    }
    if (seed.empty()) {
        throw std::invalid_argument("GenerativeModel::generate: seed sequence is empty");
    }
    for (const auto& [dim, bias] : overrides) {
        if (dim < 0 || static_cast<std::size_t>(dim) >= hidden_size_) {
            throw std::out_of_range("GenerativeModel::generate: override index " + std::to_string(dim) +
                                    " outside [0, " + std::to_string(hidden_size_) + ")");
        }
    }

    const std::vector<int> ids = codec.encode(seed);

    auto grad_guard = st::no_grad();
    auto mode_guard = st::test_mode();

    HiddenState hidden = init_hidden(1);
    for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
        hidden = forward({ids[i]}, hidden).first;
    }

    GenerationResult result;
    if (append_seed) {
        result.symbols = ids;
    }

    int x = ids.back();
    if (length == 0) {
        hidden = forward({x}, hidden).first;
    }

    for (std::size_t step = 0; step < length; ++step) {
        auto& last_h = hidden.h.back()->data;
        for (const auto& [dim, bias] : overrides) {
            last_h(0, dim) += bias;
        }

        auto out = forward({x}, hidden);
        hidden = std::move(out.first);

        const auto probs = temperature_softmax(out.second->data, temperature);
        std::discrete_distribution<int> dist(probs.begin(), probs.end());
        x = dist(st::generator());
        result.symbols.push_back(x);
    }

    result.text = codec.decode(result.symbols);
    result.cell = hidden.flattened_cell();
    return result;
}

TransformResult GenerativeModel::transform(const SequenceCodec& codec, const std::vector<std::string>& symbols,
                                           const std::vector<std::size_t>& tracked_dims) const {
    if (symbols.empty()) {
        throw std::invalid_argument("GenerativeModel::transform: sequence is empty");
    }
    const std::size_t feature_size = layers_.size() * hidden_size_;
    for (auto dim : tracked_dims) {
        if (dim >= feature_size) {
            throw std::out_of_range("GenerativeModel::transform: tracked dimension " + std::to_string(dim) +
                                    " outside [0, " + std::to_string(feature_size) + ")");
        }
    }

    const std::vector<int> ids = codec.encode(symbols);

    auto grad_guard = st::no_grad();
    auto mode_guard = st::test_mode();

    TransformResult result;
    result.tracked.assign(tracked_dims.size(), {});

    HiddenState hidden = init_hidden(1);
    for (int id : ids) {
        hidden = forward({id}, hidden).first;
        if (tracked_dims.empty()) continue;
        const auto cell = hidden.flattened_cell();
        for (std::size_t k = 0; k < tracked_dims.size(); ++k) {
            result.tracked[k].push_back(cell[tracked_dims[k]]);
        }
    }

    result.features = hidden.flattened_cell();
    return result;
}

std::vector<std::vector<float>> GenerativeModel::neuron_values(const SequenceCodec& codec,
                                                               const std::vector<std::string>& symbols,
                                                               const std::vector<std::size_t>& tracked_dims) const {
    return transform(codec, symbols, tracked_dims).tracked;
}

void GenerativeModel::save(const fs::path& prefix, const DatasetInfo& dataset, const SequenceCodec& codec) const {
    const auto parent = prefix.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("GenerativeModel::save: cannot create " + parent.string() + ": " + ec.message());
        }
    }

    SafeTensorWriter writer;
    for (const auto& [name, param] : named_parameters()) {
        writer.add(name, param->data);
    }
    for (const auto& [name, moment] : optimizer_state_.exp_avg) {
        writer.add("optim.exp_avg." + name, moment);
    }
    for (const auto& [name, moment] : optimizer_state_.exp_avg_sq) {
        writer.add("optim.exp_avg_sq." + name, moment);
    }
    writer.set_metadata(kStepKey, std::to_string(optimizer_state_.step));
    if (carried_) {
        for (std::size_t l = 0; l < carried_->h.size(); ++l) {
            writer.add("state.h." + std::to_string(l), carried_->h[l]->data);
            writer.add("state.c." + std::to_string(l), carried_->c[l]->data);
        }
    }

    if (!writer.save(model_blob_path(prefix))) {
        throw std::runtime_error("GenerativeModel::save: cannot write " + model_blob_path(prefix).string());
    }
    if (!training_state_.save(training_state_path(prefix))) {
        throw std::runtime_error("GenerativeModel::save: cannot write " + training_state_path(prefix).string());
    }

    ModelMetadata meta;
    meta.dataset = dataset;
    meta.dataset.data_type = codec.type();
    meta.vocab = codec.vocab();
    meta.input_size = static_cast<int>(input_size_);
    meta.embed_size = static_cast<int>(embed_size_);
    meta.hidden_size = static_cast<int>(hidden_size_);
    meta.output_size = static_cast<int>(output_size_);
    meta.n_layers = static_cast<int>(layers_.size());
    meta.dropout = dropout_;
    if (!meta.save(metadata_path(prefix))) {
        throw std::runtime_error("GenerativeModel::save: cannot write " + metadata_path(prefix).string());
    }

    std::cout << "[Artifacts] Saved model to " << prefix.string() << std::endl;
}

LoadedModel GenerativeModel::load(const fs::path& prefix) {
    std::cout << "[Artifacts] Loading model: " << prefix.string() << std::endl;

    LoadedModel loaded;
    if (!loaded.meta.load(metadata_path(prefix))) {
        throw std::runtime_error("GenerativeModel::load: unable to load metadata " + metadata_path(prefix).string());
    }
    const auto& meta = loaded.meta;

    loaded.codec = make_codec(meta.dataset.data_type, meta.vocab);
    if (loaded.codec->vocab_size() != static_cast<std::size_t>(meta.input_size)) {
        throw std::runtime_error("GenerativeModel::load: vocabulary has " + std::to_string(loaded.codec->vocab_size()) +
                                 " symbols but input_size is " + std::to_string(meta.input_size));
    }

    loaded.model = std::make_shared<GenerativeModel>(
        static_cast<std::size_t>(meta.input_size), static_cast<std::size_t>(meta.embed_size),
        static_cast<std::size_t>(meta.hidden_size), static_cast<std::size_t>(meta.output_size),
        static_cast<std::size_t>(meta.n_layers), meta.dropout);
    auto& model = *loaded.model;

    SafeTensorReader reader;
    if (!reader.load(model_blob_path(prefix))) {
        throw std::runtime_error("GenerativeModel::load: unable to load weights " + model_blob_path(prefix).string());
    }

    for (const auto& [name, param] : model.named_parameters()) {
        if (!reader.has(name)) {
            throw std::runtime_error("GenerativeModel::load: missing parameter " + name);
        }
        reader.read_into(name, param->data);
    }

    st::AdamState optimizer;
    for (const auto& [name, param] : model.named_parameters()) {
        const std::string m_key = "optim.exp_avg." + name;
        const std::string v_key = "optim.exp_avg_sq." + name;
        if (!reader.has(m_key) || !reader.has(v_key)) continue;
        st::Tensor m(param->data.getShape());
        st::Tensor v(param->data.getShape());
        reader.read_into(m_key, m);
        reader.read_into(v_key, v);
        optimizer.exp_avg.emplace(name, std::move(m));
        optimizer.exp_avg_sq.emplace(name, std::move(v));
    }
    const auto step_it = reader.metadata().find(kStepKey);
    if (step_it != reader.metadata().end()) {
        try {
            optimizer.step = std::stoll(step_it->second);
        } catch (const std::exception& e) {
            throw std::runtime_error("GenerativeModel::load: invalid optimizer step '" + step_it->second + "': " + e.what());
        }
    }

    std::optional<HiddenState> carried;
    if (reader.has("state.h.0")) {
        HiddenState state;
        for (std::size_t l = 0; l < model.n_layers(); ++l) {
            const auto shape = reader.get_shape("state.h." + std::to_string(l));
            if (shape.size() != st::TensorRank || !reader.has("state.c." + std::to_string(l))) {
                throw std::runtime_error("GenerativeModel::load: incomplete carried state for layer " + std::to_string(l));
            }
            st::Tensor h(shape[0], shape[1]);
            st::Tensor c(shape[0], shape[1]);
            reader.read_into("state.h." + std::to_string(l), h);
            reader.read_into("state.c." + std::to_string(l), c);
            state.h.push_back(st::Variable::create(std::move(h)));
            state.c.push_back(st::Variable::create(std::move(c)));
        }
        carried = std::move(state);
    }

    TrainingState training;
    if (training.load(training_state_path(prefix))) {
        model.training_state_ = training;
        model.carried_ = carried;
        const bool complete_moments = optimizer.exp_avg.size() == model.named_parameters().size();
        if (complete_moments) {
            model.optimizer_state_ = optimizer;
        }
        loaded.checkpoint = Checkpoint{training, complete_moments ? optimizer : st::AdamState{}, carried};
    }

    return loaded;
}

} // namespace sentneuron
