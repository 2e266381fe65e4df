#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace sentneuron {

struct ShardInfo {
    std::filesystem::path path;
    std::string name;
};

/// Shard listing persisted in the model metadata.
struct DatasetInfo {
    std::string data_type;
    std::vector<ShardInfo> train;
    std::vector<ShardInfo> test;
};

/// Lists the shards of a dataset path. Shard contents are read on demand.
class Dataset {
public:
    /// A directory contributes its regular files in name order; with two or
    /// more files the last one is held out as the test shard. A single file
    /// is both the only training shard and the test shard.
    static Dataset open(const std::filesystem::path& path, const std::string& data_type);

    const std::string& data_type() const { return info_.data_type; }
    const std::vector<ShardInfo>& train_shards() const { return info_.train; }
    const ShardInfo& test_shard() const;
    std::size_t shard_count() const { return info_.train.size(); }
    const DatasetInfo& info() const { return info_; }

    /// Name used for artifact prefixes: the last component of the dataset path.
    const std::string& name() const { return name_; }

    /// Reads one shard; throws std::runtime_error when it cannot be opened.
    std::string read(const ShardInfo& shard) const;

    /// Every symbol found in the training and test shards.
    std::set<std::string> scan_vocabulary() const;

private:
    DatasetInfo info_;
    std::string name_;
};

} // namespace sentneuron
