#include "SentNeuron/Config.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sentneuron {

namespace {

bool read_json(const std::filesystem::path& path, const char* tag, json& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[" << tag << "] cannot open file: " << path.string() << std::endl;
        return false;
    }
    try {
        file >> out;
    } catch (const std::exception& e) {
        std::cerr << "[" << tag << "] JSON parse failed: " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool write_json(const std::filesystem::path& path, const char* tag, const json& j) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[" << tag << "] cannot open for writing: " << path.string() << std::endl;
        return false;
    }
    file << j.dump(2) << '\n';
    if (!file) {
        std::cerr << "[" << tag << "] write failed: " << path.string() << std::endl;
        return false;
    }
    return true;
}

std::vector<ShardInfo> read_shards(const json& j, const char* key) {
    std::vector<ShardInfo> out;
    if (!j.contains(key) || !j.at(key).is_array()) return out;
    for (const auto& item : j.at(key)) {
        if (item.is_array() && item.size() == 2 && item[0].is_string() && item[1].is_string()) {
            out.push_back({item[0].get<std::string>(), item[1].get<std::string>()});
        }
    }
    return out;
}

json write_shards(const std::vector<ShardInfo>& shards) {
    json out = json::array();
    for (const auto& s : shards) {
        out.push_back(json::array({s.path.string(), s.name}));
    }
    return out;
}

} // namespace

bool TrainConfig::load(const std::string& path) {
    json j;
    if (!read_json(path, "TrainConfig", j)) return false;
    if (!j.is_object()) {
        std::cerr << "[TrainConfig] top level must be an object: " << path << std::endl;
        return false;
    }

    try {
        data_path = j.value("data_path", data_path);
        data_type = j.value("data_type", data_type);
        save_path = j.value("save_path", save_path);
        embed_size = j.value("embed_size", embed_size);
        hidden_size = j.value("hidden_size", hidden_size);
        n_layers = j.value("n_layers", n_layers);
        dropout = j.value("dropout", dropout);
        epochs = j.value("epochs", epochs);
        seq_length = j.value("seq_length", seq_length);
        lr = j.value("lr", lr);
        lr_decay = j.value("lr_decay", lr_decay);
        grad_clip = j.value("grad_clip", grad_clip);
        batch_size = j.value("batch_size", batch_size);
        eval_interval = j.value("eval_interval", eval_interval);
        seed = j.value("seed", seed);
    } catch (const std::exception& e) {
        std::cerr << "[TrainConfig] invalid value in " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

void TrainConfig::validate() const {
    if (embed_size <= 0 || hidden_size <= 0 || n_layers <= 0) {
        throw std::invalid_argument("TrainConfig::validate: layer sizes must be positive");
    }
    if (epochs <= 0 || seq_length <= 0 || batch_size <= 0 || eval_interval <= 0) {
        throw std::invalid_argument("TrainConfig::validate: epochs, seq_length, batch_size and eval_interval must be positive");
    }
    if (dropout < 0.0f || dropout >= 1.0f) {
        throw std::invalid_argument("TrainConfig::validate: dropout must be in [0, 1)");
    }
    if (lr_decay < 0.0 || lr_decay >= 1.0) {
        throw std::invalid_argument("TrainConfig::validate: lr_decay must be in [0, 1)");
    }
    if (lr <= 0.0 || grad_clip <= 0.0f) {
        throw std::invalid_argument("TrainConfig::validate: lr and grad_clip must be positive");
    }
}

bool ModelMetadata::load(const std::filesystem::path& path) {
    json j;
    if (!read_json(path, "ModelMetadata", j)) return false;

    *this = ModelMetadata();
    try {
        dataset.data_type = j.value("data_type", std::string{});
        dataset.train = read_shards(j, "train_data");
        dataset.test = read_shards(j, "test_data");
        if (j.contains("vocab") && j.at("vocab").is_object()) {
            for (auto& [sym, id] : j.at("vocab").items()) {
                vocab[sym] = id.get<int>();
            }
        }
        input_size = j.value("input_size", input_size);
        embed_size = j.value("embed_size", embed_size);
        hidden_size = j.value("hidden_size", hidden_size);
        output_size = j.value("output_size", output_size);
        n_layers = j.value("n_layers", n_layers);
        dropout = j.value("dropout", dropout);
    } catch (const std::exception& e) {
        std::cerr << "[ModelMetadata] invalid field in " << path.string() << ": " << e.what() << std::endl;
        return false;
    }

    if (dataset.data_type.empty() || vocab.empty() || input_size <= 0 || embed_size <= 0 ||
        hidden_size <= 0 || output_size <= 0 || n_layers <= 0) {
        std::cerr << "[ModelMetadata] incomplete record: " << path.string() << std::endl;
        return false;
    }
    return true;
}

bool ModelMetadata::save(const std::filesystem::path& path) const {
    json j;
    j["train_data"] = write_shards(dataset.train);
    j["test_data"] = write_shards(dataset.test);
    j["vocab"] = vocab;
    j["data_type"] = dataset.data_type;
    j["input_size"] = input_size;
    j["embed_size"] = embed_size;
    j["hidden_size"] = hidden_size;
    j["output_size"] = output_size;
    j["n_layers"] = n_layers;
    j["dropout"] = dropout;
    return write_json(path, "ModelMetadata", j);
}

bool TrainingState::load(const std::filesystem::path& path) {
    json j;
    if (!read_json(path, "TrainingState", j)) return false;
    try {
        epoch = j.value("epoch", 0);
        shard = j.value("shard", 0);
        batch = j.value("batch", 0);
        loss = j.value("loss", 0.0);
    } catch (const std::exception& e) {
        std::cerr << "[TrainingState] invalid field in " << path.string() << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool TrainingState::save(const std::filesystem::path& path) const {
    json j;
    j["epoch"] = epoch;
    j["shard"] = shard;
    j["batch"] = batch;
    j["loss"] = loss;
    return write_json(path, "TrainingState", j);
}

} // namespace sentneuron
