#include "SentNeuron/SafeTensors.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sentneuron {

bool SafeTensorReader::load(const std::filesystem::path& path) {
    file_path_ = path;
    tensors_.clear();
    metadata_.clear();

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[SafeTensors] cannot open file: " << path.string() << std::endl;
        return false;
    }

    std::uint64_t header_len = 0;
    file.read(reinterpret_cast<char*>(&header_len), sizeof(header_len));
    if (!file) {
        std::cerr << "[SafeTensors] failed to read header length: " << path.string() << std::endl;
        return false;
    }

    std::string header_str(static_cast<std::size_t>(header_len), '\0');
    if (header_len > 0) {
        file.read(header_str.data(), static_cast<std::streamsize>(header_len));
        if (!file) {
            std::cerr << "[SafeTensors] failed to read header data: " << path.string() << std::endl;
            return false;
        }
    }

    json header;
    try {
        header = json::parse(header_str);
    } catch (const std::exception& e) {
        std::cerr << "[SafeTensors] header parse failed: " << e.what() << std::endl;
        return false;
    }
    if (!header.is_object()) {
        std::cerr << "[SafeTensors] header is not a JSON object\n";
        return false;
    }

    file.seekg(0, std::ios::end);
    const auto file_size = static_cast<std::uint64_t>(file.tellg());
    const std::uint64_t data_base_offset = sizeof(std::uint64_t) + header_len;

    for (auto& [name, meta] : header.items()) {
        if (name == "__metadata__") {
            if (meta.is_object()) {
                for (auto& [key, value] : meta.items()) {
                    if (value.is_string()) metadata_[key] = value.get<std::string>();
                }
            }
            continue;
        }
        if (!meta.is_object()) continue;

        TensorInfo info;
        info.dtype = meta.value("dtype", std::string{});
        if (info.dtype != "F32") {
            std::cerr << "[SafeTensors] unsupported dtype (" << info.dtype << ") - " << name << std::endl;
            return false;
        }

        std::size_t element_count = 1;
        if (meta.contains("shape") && meta["shape"].is_array()) {
            for (const auto& d : meta["shape"]) {
                info.shape.push_back(d.get<std::size_t>());
                element_count *= info.shape.back();
            }
        }

        if (!meta.contains("data_offsets") || !meta["data_offsets"].is_array() || meta["data_offsets"].size() != 2) {
            std::cerr << "[SafeTensors] missing data_offsets: " << name << std::endl;
            return false;
        }
        const auto relative_start = meta["data_offsets"][0].get<std::uint64_t>();
        const auto relative_end = meta["data_offsets"][1].get<std::uint64_t>();
        if (relative_end < relative_start || relative_end - relative_start != element_count * sizeof(float)) {
            std::cerr << "[SafeTensors] size mismatch: " << name << std::endl;
            return false;
        }

        info.offset_start = data_base_offset + relative_start;
        info.offset_end = data_base_offset + relative_end;
        if (info.offset_end > file_size) {
            std::cerr << "[SafeTensors] tensor extends past end of file: " << name << std::endl;
            return false;
        }
        tensors_[name] = std::move(info);
    }

    return true;
}

bool SafeTensorReader::has(const std::string& name) const {
    return tensors_.find(name) != tensors_.end();
}

std::vector<std::size_t> SafeTensorReader::get_shape(const std::string& name) const {
    auto it = tensors_.find(name);
    if (it == tensors_.end()) return {};
    return it->second.shape;
}

std::vector<float> SafeTensorReader::get(const std::string& name) const {
    auto it = tensors_.find(name);
    if (it == tensors_.end()) {
        throw std::runtime_error("SafeTensorReader::get: no tensor named " + name + " in " + file_path_.string());
    }
    const auto& info = it->second;

    std::ifstream file(file_path_, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("SafeTensorReader::get: cannot reopen " + file_path_.string());
    }

    std::vector<float> data((info.offset_end - info.offset_start) / sizeof(float));
    file.seekg(static_cast<std::streamoff>(info.offset_start), std::ios::beg);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size() * sizeof(float)));
    if (!file) {
        throw std::runtime_error("SafeTensorReader::get: truncated data for " + name);
    }
    return data;
}

void SafeTensorReader::read_into(const std::string& name, st::Tensor& target) const {
    const auto shape = get_shape(name);
    if (shape.size() != st::TensorRank || shape[0] != target.dim(0) || shape[1] != target.dim(1)) {
        throw std::runtime_error("SafeTensorReader::read_into: shape mismatch for " + name +
                                 ", expected " + target.shape_string());
    }
    const auto& info = tensors_.at(name);
    std::ifstream file(file_path_, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("SafeTensorReader::read_into: cannot reopen " + file_path_.string());
    }
    target.loadWeight(file, static_cast<std::streamoff>(info.offset_start),
                      static_cast<std::streamoff>(info.offset_end));
}

std::vector<std::string> SafeTensorReader::names() const {
    std::vector<std::string> out;
    out.reserve(tensors_.size());
    for (const auto& [name, info] : tensors_) out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
}

void SafeTensorWriter::add(const std::string& name, const st::Tensor& tensor) {
    if (name.empty() || name == "__metadata__") {
        throw std::invalid_argument("SafeTensorWriter::add: invalid tensor name '" + name + "'");
    }
    tensors_.insert_or_assign(name, tensor);
}

bool SafeTensorWriter::save(const std::filesystem::path& path) const {
    json header = json::object();
    if (!metadata_.empty()) {
        header["__metadata__"] = metadata_;
    }

    std::uint64_t offset = 0;
    for (const auto& [name, tensor] : tensors_) {
        const std::uint64_t bytes = tensor.size() * sizeof(float);
        header[name] = {
            {"dtype", "F32"},
            {"shape", {tensor.dim(0), tensor.dim(1)}},
            {"data_offsets", {offset, offset + bytes}}
        };
        offset += bytes;
    }

    const std::string header_str = header.dump();
    const std::uint64_t header_len = header_str.size();

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[SafeTensors] cannot open for writing: " << path.string() << std::endl;
        return false;
    }

    file.write(reinterpret_cast<const char*>(&header_len), sizeof(header_len));
    file.write(header_str.data(), static_cast<std::streamsize>(header_str.size()));
    for (const auto& [name, tensor] : tensors_) {
        tensor.writeWeight(file);
    }

    if (!file) {
        std::cerr << "[SafeTensors] write failed: " << path.string() << std::endl;
        return false;
    }
    return true;
}

} // namespace sentneuron
