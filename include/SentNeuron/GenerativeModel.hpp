#pragma once

#include "SentNeuron/Codec.hpp"
#include "SentNeuron/Config.hpp"
#include "SentNeuron/Dataset.hpp"
#include "SentNeuron/Override.hpp"
#include "SentTorch/Adam.hpp"
#include "SentTorch/Embedding.hpp"
#include "SentTorch/Linear.hpp"
#include "SentTorch/MLSTMCell.hpp"
#include "SentTorch/Module.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sentneuron {

using VariablePtr = std::shared_ptr<st::Variable>;

/// Recurrent memories, one (batch, hidden) tensor per layer.
struct HiddenState {
    std::vector<VariablePtr> h;
    std::vector<VariablePtr> c;

    /// Same values without graph history.
    HiddenState detached() const;
    /// Cell state of batch row 0, layer-major.
    std::vector<float> flattened_cell() const;
};

/// Everything needed to continue a run where it stopped.
struct Checkpoint {
    TrainingState state;
    st::AdamState optimizer;
    std::optional<HiddenState> carried;
};

struct FitOptions {
    int epochs = 100;
    int seq_length = 256;
    double lr = 5e-4;
    double lr_decay = 0.7; ///< Adam beta1
    float grad_clip = 5.0f;
    int batch_size = 128;
    int eval_interval = 500;

    /// Artifacts are written to <save_prefix>_*; empty disables saving.
    std::filesystem::path save_prefix;
    /// Checked between windows; when set the run stops, saves and evaluates.
    const std::atomic<bool>* cancel = nullptr;
    /// Called after every optimizer step with the updated position.
    std::function<void(const TrainingState&)> on_batch_end;

    static FitOptions from_config(const TrainConfig& config);
};

struct FitResult {
    double test_loss = 0.0;
    TrainingState state;
    bool interrupted = false;
};

struct GenerationResult {
    std::string text;
    std::vector<int> symbols;
    std::vector<float> cell; ///< final cell state, layer-major
};

struct TransformResult {
    std::vector<float> features;
    std::vector<std::vector<float>> tracked; ///< one trajectory per tracked dimension
};

/// Learning rate for a shard: lr * (epochs - (epoch + shard / shard_count)) / epochs.
double shard_learning_rate(double lr, int epochs, int epoch, int shard, int shard_count);

/// Column-major split of a sequence into `batch_size` streams: element
/// [t][j] is seq[j * (n / batch_size) + t]. The remainder is dropped.
std::vector<std::vector<int>> batchify(const std::vector<int>& sequence, std::size_t batch_size);

/// softmax(logits / temperature) for a (1, vocab) row.
std::vector<float> temperature_softmax(const st::Tensor& logits, float temperature);

class GenerativeModel;

struct LoadedModel {
    std::shared_ptr<GenerativeModel> model;
    std::unique_ptr<SequenceCodec> codec;
    ModelMetadata meta;
    std::optional<Checkpoint> checkpoint;
};

/// Embedding, stacked mLSTM layers with residual connections after the
/// first, dropout after each layer and a projection to symbol logits.
class GenerativeModel : public st::Module {
public:
    GenerativeModel(std::size_t input_size, std::size_t embed_size, std::size_t hidden_size,
                    std::size_t output_size, std::size_t n_layers = 1, float dropout = 0.0f);

    HiddenState init_hidden(std::size_t batch_size = 1) const;

    /// One time step for a batch of symbols.
    std::pair<HiddenState, VariablePtr> forward(const std::vector<int>& symbols, const HiddenState& hidden) const;

    /// Truncated-BPTT training over the dataset; resumes from `checkpoint` when given.
    FitResult fit(const Dataset& dataset, const SequenceCodec& codec, const FitOptions& options,
                  const std::optional<Checkpoint>& checkpoint = std::nullopt);

    /// Mean per-step cross-entropy over the windows of one shard.
    double evaluate(const Dataset& dataset, const SequenceCodec& codec, const ShardInfo& shard,
                    int seq_length, int batch_size) const;

    GenerationResult generate(const SequenceCodec& codec, const std::vector<std::string>& seed,
                              std::size_t length, float temperature = 1.0f,
                              const OverrideMap& overrides = {}, bool append_seed = true) const;

    TransformResult transform(const SequenceCodec& codec, const std::vector<std::string>& symbols,
                              const std::vector<std::size_t>& tracked_dims = {}) const;

    std::vector<std::vector<float>> neuron_values(const SequenceCodec& codec,
                                                  const std::vector<std::string>& symbols,
                                                  const std::vector<std::size_t>& tracked_dims) const;

    /// Writes <prefix>_model.safetensors, <prefix>_train.json and <prefix>_meta.json.
    void save(const std::filesystem::path& prefix, const DatasetInfo& dataset, const SequenceCodec& codec) const;

    /// Rebuilds codec and model from <prefix>_meta.json and the parameter blob.
    static LoadedModel load(const std::filesystem::path& prefix);

    const TrainingState& training_state() const { return training_state_; }

    std::size_t input_size() const { return input_size_; }
    std::size_t embed_size() const { return embed_size_; }
    std::size_t hidden_size() const { return hidden_size_; }
    std::size_t output_size() const { return output_size_; }
    std::size_t n_layers() const { return layers_.size(); }
    float dropout() const { return dropout_; }

private:
    void run_epochs(const Dataset& dataset, const SequenceCodec& codec, const FitOptions& options,
                    st::Adam& optimizer, TrainingState& state, std::optional<HiddenState> carried);
    void log_progress(const Dataset& dataset, const SequenceCodec& codec, const FitOptions& options,
                      const TrainingState& state, double lr, int n_windows, const ShardInfo& shard,
                      const std::vector<std::string>& shard_symbols) const;
    void save_if_requested(const FitOptions& options, const Dataset& dataset, const SequenceCodec& codec) const;

    std::size_t input_size_;
    std::size_t embed_size_;
    std::size_t hidden_size_;
    std::size_t output_size_;
    float dropout_;

    std::shared_ptr<st::Embedding> i2h_;
    std::vector<std::shared_ptr<st::MLSTMCell>> layers_;
    std::shared_ptr<st::Linear> h2y_;

    TrainingState training_state_;
    st::AdamState optimizer_state_;
    std::optional<HiddenState> carried_;
};

/// Artifact paths for a prefix.
std::filesystem::path model_blob_path(const std::filesystem::path& prefix);
std::filesystem::path training_state_path(const std::filesystem::path& prefix);
std::filesystem::path metadata_path(const std::filesystem::path& prefix);

} // namespace sentneuron
