#include "SentNeuron/Dataset.hpp"

#include "SentNeuron/Codec.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sentneuron {

Dataset Dataset::open(const fs::path& path, const std::string& data_type) {
    if (!is_supported_data_type(data_type)) {
        throw std::invalid_argument("Dataset::open: unsupported data type '" + data_type + "'");
    }

    std::error_code ec;
    Dataset ds;
    ds.info_.data_type = data_type;

    auto trimmed = path;
    if (!trimmed.has_filename()) trimmed = trimmed.parent_path();
    ds.name_ = trimmed.filename().string();

    if (fs::is_directory(path, ec)) {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(path, ec)) {
            if (entry.is_regular_file()) files.push_back(entry.path());
        }
        if (ec) {
            throw std::runtime_error("Dataset::open: cannot list " + path.string() + ": " + ec.message());
        }
        std::sort(files.begin(), files.end());
        if (files.empty()) {
            throw std::runtime_error("Dataset::open: no shard files in " + path.string());
        }

        for (const auto& f : files) {
            ds.info_.train.push_back({f, f.filename().string()});
        }
        if (ds.info_.train.size() >= 2) {
            ds.info_.test.push_back(ds.info_.train.back());
            ds.info_.train.pop_back();
        } else {
            ds.info_.test.push_back(ds.info_.train.front());
        }
    } else if (fs::is_regular_file(path, ec)) {
        ShardInfo shard{path, path.filename().string()};
        ds.info_.train.push_back(shard);
        ds.info_.test.push_back(shard);
    } else {
        throw std::runtime_error("Dataset::open: path does not exist: " + path.string());
    }

    std::cout << "[Dataset] " << ds.name_ << ": " << ds.info_.train.size() << " training shard(s), test shard "
              << ds.info_.test.front().name << std::endl;
    return ds;
}

const ShardInfo& Dataset::test_shard() const {
    if (info_.test.empty()) {
        throw std::runtime_error("Dataset::test_shard: dataset has no test shard");
    }
    return info_.test.front();
}

std::string Dataset::read(const ShardInfo& shard) const {
    std::ifstream file(shard.path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Dataset::read: cannot open shard " + shard.path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::set<std::string> Dataset::scan_vocabulary() const {
    std::set<std::string> vocab;
    auto scan = [&](const ShardInfo& shard) {
        for (auto& s : tokenize(info_.data_type, read(shard))) {
            vocab.insert(std::move(s));
        }
    };
    for (const auto& shard : info_.train) scan(shard);
    for (const auto& shard : info_.test) scan(shard);
    return vocab;
}

} // namespace sentneuron
