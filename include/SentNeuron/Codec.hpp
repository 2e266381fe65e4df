#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sentneuron {

using Vocabulary = std::map<std::string, int>;

/// Splits raw shard text into symbols for the given data type:
/// UTF-8 code points for "txt", whitespace tokens for the midi encodings.
std::vector<std::string> tokenize(const std::string& data_type, const std::string& text);

/// Assigns ids 0..n-1 to the symbols in sorted order.
Vocabulary build_vocabulary(const std::set<std::string>& symbols);

bool is_supported_data_type(const std::string& data_type);

/// Maps between symbol strings and integer ids for one data type.
class SequenceCodec {
public:
    explicit SequenceCodec(Vocabulary vocab);
    virtual ~SequenceCodec() = default;

    virtual std::string type() const = 0;
    /// True for token streams (midi encodings), false for plain text.
    virtual bool is_symbolic() const = 0;
    virtual std::string decode(const std::vector<int>& ids) const = 0;

    std::vector<std::string> symbols(const std::string& text) const { return tokenize(type(), text); }

    /// Throws std::invalid_argument on a symbol outside the vocabulary.
    std::vector<int> encode(const std::vector<std::string>& symbols) const;

    const std::string& symbol(int id) const;
    bool contains(const std::string& symbol) const { return vocab_.count(symbol) > 0; }

    const Vocabulary& vocab() const { return vocab_; }
    std::size_t vocab_size() const { return id_to_symbol_.size(); }

protected:
    Vocabulary vocab_;
    std::vector<std::string> id_to_symbol_;
};

class TextCodec : public SequenceCodec {
public:
    explicit TextCodec(Vocabulary vocab) : SequenceCodec(std::move(vocab)) {}

    std::string type() const override { return "txt"; }
    bool is_symbolic() const override { return false; }
    std::string decode(const std::vector<int>& ids) const override;
};

class SymbolCodec : public SequenceCodec {
public:
    SymbolCodec(std::string data_type, Vocabulary vocab);

    std::string type() const override { return data_type_; }
    bool is_symbolic() const override { return true; }
    std::string decode(const std::vector<int>& ids) const override;

private:
    std::string data_type_;
};

/// Throws std::invalid_argument for an unknown data type.
std::unique_ptr<SequenceCodec> make_codec(const std::string& data_type, Vocabulary vocab);

} // namespace sentneuron
