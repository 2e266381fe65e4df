#pragma once

#include "SentNeuron/Codec.hpp"
#include "SentNeuron/Dataset.hpp"

#include <filesystem>
#include <string>

namespace sentneuron {

/// Hyper-parameters for the train command. Defaults follow the reference
/// training script; a JSON file may override any subset of keys.
struct TrainConfig {
    std::string data_path;
    std::string data_type;
    std::string save_path = "trained_models";

    int embed_size = 64;
    int hidden_size = 128;
    int n_layers = 1;
    float dropout = 0.0f;

    int epochs = 100;
    int seq_length = 256;
    double lr = 5e-4;
    double lr_decay = 0.7;
    float grad_clip = 5.0f;
    int batch_size = 128;
    int eval_interval = 500;
    unsigned seed = 42;

    bool load(const std::string& path);
    /// Throws std::invalid_argument on a non-positive size or an out-of-range ratio.
    void validate() const;
};

/// Architecture and dataset record stored as <prefix>_meta.json.
struct ModelMetadata {
    DatasetInfo dataset;
    Vocabulary vocab;
    int input_size = 0;
    int embed_size = 0;
    int hidden_size = 0;
    int output_size = 0;
    int n_layers = 1;
    float dropout = 0.0f;

    bool load(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;
};

/// Position of a training run; `batch` is the next window to run.
struct TrainingState {
    int epoch = 0;
    int shard = 0;
    int batch = 0;
    double loss = 0.0;

    bool load(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;
};

} // namespace sentneuron
