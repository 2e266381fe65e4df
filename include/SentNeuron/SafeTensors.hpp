#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "SentTorch/Core.hpp"

namespace sentneuron {

/**
 * Reader for safetensors files.
 *
 * The container is
 *   [8 byte little-endian header size][JSON header][tensor bytes...]
 *
 * The header maps each tensor name to its dtype, shape and data offsets
 * relative to the data section. An optional "__metadata__" entry holds
 * string key/value pairs. Only F32 tensors are accepted.
 */
class SafeTensorReader {
public:
    struct TensorInfo {
        std::string dtype;
        std::vector<std::size_t> shape;
        std::uint64_t offset_start = 0; ///< absolute file offset
        std::uint64_t offset_end = 0;   ///< absolute file offset
    };

    /**
     * Parse the header of the file at `path`. Returns false and logs
     * when the file cannot be opened or the header is malformed.
     */
    bool load(const std::filesystem::path& path);

    [[nodiscard]] bool has(const std::string& name) const;
    [[nodiscard]] std::vector<std::size_t> get_shape(const std::string& name) const;

    /// Reads a full tensor; throws std::runtime_error when absent or truncated.
    [[nodiscard]] std::vector<float> get(const std::string& name) const;

    /// Reads a rank-2 tensor into `target`, which must already have the stored shape.
    void read_into(const std::string& name, st::Tensor& target) const;

    [[nodiscard]] const std::map<std::string, std::string>& metadata() const { return metadata_; }
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t tensor_count() const { return tensors_.size(); }

private:
    std::filesystem::path file_path_;
    std::unordered_map<std::string, TensorInfo> tensors_;
    std::map<std::string, std::string> metadata_;
};

/// Collects rank-2 float tensors and writes them as one safetensors file.
class SafeTensorWriter {
public:
    void add(const std::string& name, const st::Tensor& tensor);
    void set_metadata(const std::string& key, const std::string& value) { metadata_[key] = value; }

    /// Returns false and logs on I/O failure.
    bool save(const std::filesystem::path& path) const;

private:
    std::map<std::string, st::Tensor> tensors_;
    std::map<std::string, std::string> metadata_;
};

} // namespace sentneuron
