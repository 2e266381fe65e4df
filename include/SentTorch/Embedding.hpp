#pragma once

#include "Module.hpp"
#include "Random.hpp"

#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace st {

/// Row gather from a (vocab, dim) table. Indices arrive as a (batch, 1)
/// tensor of symbol ids stored as floats.
class EmbeddingFunction : public Function {
private:
    std::vector<std::size_t> flat_indices_;
    TensorShape weight_shape_{};

public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        const auto& indices = xs[0];
        const auto& weight = xs[1];

        if (indices.dim(1) != 1) {
            throw std::invalid_argument("EmbeddingFunction::forward: indices must have shape (batch, 1), got " +
                                        indices.shape_string());
        }

        weight_shape_ = weight.getShape();
        const std::size_t batch = indices.dim(0);
        const std::size_t vocab = weight_shape_[0];
        const std::size_t dim = weight_shape_[1];

        Tensor output(batch, dim);
        flat_indices_.resize(batch);

        for (std::size_t b = 0; b < batch; ++b) {
            const float raw = indices(b, 0);
            if (raw < 0.0f) {
                throw std::out_of_range("EmbeddingFunction::forward: index must be non-negative");
            }
            const auto idx = static_cast<std::size_t>(raw);
            if (idx >= vocab) {
                throw std::out_of_range("EmbeddingFunction::forward: index " + std::to_string(idx) +
                                        " outside vocabulary of " + std::to_string(vocab));
            }
            flat_indices_[b] = idx;
            for (std::size_t d = 0; d < dim; ++d) {
                output(b, d) = weight(idx, d);
            }
        }

        return { output };
    }

    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        Tensor grad_weight(weight_shape_);
        const std::size_t dim = weight_shape_[1];

        for (std::size_t b = 0; b < flat_indices_.size(); ++b) {
            const std::size_t idx = flat_indices_[b];
            for (std::size_t d = 0; d < dim; ++d) {
                grad_weight(idx, d) += gy(b, d);
            }
        }

        // Symbol ids are not differentiable.
        return { nullptr, Variable::create(std::move(grad_weight)) };
    }
};

inline std::shared_ptr<Variable> embedding_lookup(const std::shared_ptr<Variable>& indices,
                                                  const std::shared_ptr<Variable>& weight) {
    return apply_op(std::make_shared<EmbeddingFunction>(), {indices, weight});
}

/// Builds the (batch, 1) index tensor for a batch of symbol ids.
inline std::shared_ptr<Variable> make_indices(const std::vector<std::size_t>& ids) {
    Tensor t(ids.size(), std::size_t{1});
    for (std::size_t i = 0; i < ids.size(); ++i) {
        t(i, 0) = static_cast<float>(ids[i]);
    }
    return Variable::create(std::move(t));
}

class Embedding : public Module {
private:
    std::shared_ptr<Parameter> weight_;
    std::size_t vocab_size_{0};
    std::size_t embedding_dim_{0};

public:
    Embedding(std::size_t vocab_size, std::size_t embedding_dim)
        : vocab_size_(vocab_size), embedding_dim_(embedding_dim)
    {
        std::normal_distribution<float> dist(0.0f, 1.0f);
        Tensor w(vocab_size, embedding_dim);
        float* p = w.data();
        for (std::size_t i = 0; i < w.size(); ++i) p[i] = dist(generator());
        weight_ = Parameter::create(w, "weight");
        register_parameter("weight", weight_);
    }

    std::shared_ptr<Variable> forward(const std::shared_ptr<Variable>& indices) const {
        return embedding_lookup(indices, weight_);
    }

    std::shared_ptr<Variable> operator()(const std::shared_ptr<Variable>& indices) const {
        return forward(indices);
    }

    std::shared_ptr<Parameter> weight() const { return weight_; }
    std::size_t vocab_size() const { return vocab_size_; }
    std::size_t embedding_dim() const { return embedding_dim_; }
};

} // namespace st
