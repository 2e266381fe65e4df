#include "SentNeuron/Override.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sentneuron {

namespace {

int parse_dimension(const std::string& key) {
    if (key.empty()) {
        throw std::runtime_error("parse_override: empty key");
    }
    if (!(std::isdigit(static_cast<unsigned char>(key[0])) || key[0] == '-')) {
        throw std::runtime_error("parse_override: key '" + key + "' is not an integer");
    }
    errno = 0;
    char* end = nullptr;
    const long value = std::strtol(key.c_str(), &end, 10);
    if (end != key.c_str() + key.size() || errno == ERANGE ||
        value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::runtime_error("parse_override: key '" + key + "' is not an integer");
    }
    return static_cast<int>(value);
}

} // namespace

OverrideMap parse_override(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("parse_override: invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("parse_override: document must be a JSON object");
    }

    OverrideMap out;
    for (auto& [key, value] : j.items()) {
        if (!value.is_number()) {
            throw std::runtime_error("parse_override: value for '" + key + "' is not a number");
        }
        out[parse_dimension(key)] = value.get<float>();
    }
    return out;
}

OverrideMap load_override(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("load_override: cannot open " + path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return parse_override(oss.str());
}

void save_override(const std::filesystem::path& path, const OverrideMap& overrides) {
    json j = json::object();
    for (const auto& [dim, bias] : overrides) {
        j[std::to_string(dim)] = bias;
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("save_override: cannot open " + path.string());
    }
    file << j.dump(2) << '\n';
    if (!file) {
        throw std::runtime_error("save_override: write failed for " + path.string());
    }
}

} // namespace sentneuron
