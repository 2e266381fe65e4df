#include "SentNeuron/Codec.hpp"

#include <sstream>
#include <stdexcept>

namespace sentneuron {

namespace {

const char* const kSymbolicTypes[] = {"midi_note", "midi_chord", "midi_perform"};

std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1; // stray continuation or invalid lead byte
}

std::vector<std::string> split_code_points(const std::string& text) {
    std::vector<std::string> out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t len = utf8_sequence_length(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) len = 1;
        for (std::size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                len = 1;
                break;
            }
        }
        out.push_back(text.substr(i, len));
        i += len;
    }
    return out;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        out.push_back(token);
    }
    return out;
}

} // namespace

bool is_supported_data_type(const std::string& data_type) {
    if (data_type == "txt") return true;
    for (const char* t : kSymbolicTypes) {
        if (data_type == t) return true;
    }
    return false;
}

std::vector<std::string> tokenize(const std::string& data_type, const std::string& text) {
    if (data_type == "txt") {
        return split_code_points(text);
    }
    if (!is_supported_data_type(data_type)) {
        throw std::invalid_argument("tokenize: unsupported data type '" + data_type + "'");
    }
    return split_whitespace(text);
}

Vocabulary build_vocabulary(const std::set<std::string>& symbols) {
    Vocabulary vocab;
    int next = 0;
    for (const auto& s : symbols) {
        vocab.emplace(s, next++);
    }
    return vocab;
}

SequenceCodec::SequenceCodec(Vocabulary vocab) : vocab_(std::move(vocab)) {
    id_to_symbol_.assign(vocab_.size(), std::string{});
    std::vector<bool> seen(vocab_.size(), false);
    for (const auto& [sym, id] : vocab_) {
        if (id < 0 || static_cast<std::size_t>(id) >= vocab_.size() || seen[id]) {
            throw std::invalid_argument("SequenceCodec: vocabulary ids must be a permutation of 0.." +
                                        std::to_string(vocab_.size() - 1));
        }
        seen[id] = true;
        id_to_symbol_[id] = sym;
    }
}

std::vector<int> SequenceCodec::encode(const std::vector<std::string>& symbols) const {
    std::vector<int> ids;
    ids.reserve(symbols.size());
    for (const auto& s : symbols) {
        auto it = vocab_.find(s);
        if (it == vocab_.end()) {
            throw std::invalid_argument("SequenceCodec::encode: symbol '" + s + "' is not in the vocabulary");
        }
        ids.push_back(it->second);
    }
    return ids;
}

const std::string& SequenceCodec::symbol(int id) const {
    if (id < 0 || static_cast<std::size_t>(id) >= id_to_symbol_.size()) {
        throw std::out_of_range("SequenceCodec::symbol: id " + std::to_string(id) + " outside vocabulary");
    }
    return id_to_symbol_[id];
}

std::string TextCodec::decode(const std::vector<int>& ids) const {
    std::string out;
    for (int id : ids) {
        out += symbol(id);
    }
    return out;
}

SymbolCodec::SymbolCodec(std::string data_type, Vocabulary vocab)
    : SequenceCodec(std::move(vocab)), data_type_(std::move(data_type)) {}

std::string SymbolCodec::decode(const std::vector<int>& ids) const {
    std::string out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ' ';
        out += symbol(ids[i]);
    }
    return out;
}

std::unique_ptr<SequenceCodec> make_codec(const std::string& data_type, Vocabulary vocab) {
    if (data_type == "txt") {
        return std::make_unique<TextCodec>(std::move(vocab));
    }
    if (!is_supported_data_type(data_type)) {
        throw std::invalid_argument("make_codec: unsupported data type '" + data_type + "'");
    }
    return std::make_unique<SymbolCodec>(data_type, std::move(vocab));
}

} // namespace sentneuron
