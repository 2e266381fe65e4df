#pragma once

#include "Core.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace st {

/// Row-wise softmax of a (rows, classes) tensor.
inline Tensor softmax_rows(const Tensor& x) {
    const std::size_t rows = x.dim(0);
    const std::size_t depth = x.dim(1);
    Tensor y(x.getShape());

    for (std::size_t r = 0; r < rows; ++r) {
        float max_val = -std::numeric_limits<float>::infinity();
        for (std::size_t d = 0; d < depth; ++d) {
            max_val = std::max(max_val, x(r, d));
        }

        float sum_exp = 0.0f;
        for (std::size_t d = 0; d < depth; ++d) {
            const float e = std::exp(x(r, d) - max_val);
            y(r, d) = e;
            sum_exp += e;
        }

        if (sum_exp == 0.0f || !std::isfinite(sum_exp)) {
            const float value = 1.0f / static_cast<float>(depth);
            for (std::size_t d = 0; d < depth; ++d) y(r, d) = value;
        } else {
            const float inv_sum = 1.0f / sum_exp;
            for (std::size_t d = 0; d < depth; ++d) y(r, d) *= inv_sum;
        }
    }
    return y;
}

class Softmax : public Function {
    Tensor y_;
public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        y_ = softmax_rows(xs[0]);
        return { y_ };
    }

    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        Tensor gx = y_ * gy;
        const Tensor row_sum = ns::sum(gx, 1);
        gx = gx - y_ * row_sum.broadcast_to(y_.getShape());
        return { Variable::create(std::move(gx)) };
    }
};

/// Mean cross-entropy over the batch between logits (batch, classes)
/// and integer targets. Output is a (1, 1) tensor.
class SoftmaxCrossEntropy : public Function {
    std::vector<std::size_t> targets_;
    Tensor probs_;
public:
    explicit SoftmaxCrossEntropy(std::vector<std::size_t> targets) : targets_(std::move(targets)) {}

    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        const Tensor& logits = xs[0];
        const std::size_t batch = logits.dim(0);
        const std::size_t classes = logits.dim(1);
        if (targets_.size() != batch) {
            throw std::invalid_argument("SoftmaxCrossEntropy::forward: expected " + std::to_string(batch) +
                                        " targets, got " + std::to_string(targets_.size()));
        }

        probs_ = softmax_rows(logits);
        double loss = 0.0;
        for (std::size_t r = 0; r < batch; ++r) {
            if (targets_[r] >= classes) {
                throw std::out_of_range("SoftmaxCrossEntropy::forward: target " + std::to_string(targets_[r]) +
                                        " outside " + std::to_string(classes) + " classes");
            }
            const float p = std::max(probs_(r, targets_[r]), 1e-15f);
            loss -= std::log(static_cast<double>(p));
        }

        Tensor out(1, 1);
        out(0, 0) = batch > 0 ? static_cast<float>(loss / static_cast<double>(batch)) : 0.0f;
        return { out };
    }

    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const float gy = gys[0]->data(0, 0);
        const std::size_t batch = probs_.dim(0);
        Tensor gx = probs_;
        for (std::size_t r = 0; r < batch; ++r) {
            gx(r, targets_[r]) -= 1.0f;
        }
        gx = gx * (gy / static_cast<float>(std::max<std::size_t>(batch, 1)));
        return { Variable::create(std::move(gx)) };
    }
};

inline std::shared_ptr<Variable> softmax(const std::shared_ptr<Variable>& x) {
    return apply_op(std::make_shared<Softmax>(), {x});
}

inline std::shared_ptr<Variable> softmax_cross_entropy(const std::shared_ptr<Variable>& logits,
                                                       std::vector<std::size_t> targets) {
    return apply_op(std::make_shared<SoftmaxCrossEntropy>(std::move(targets)), {logits});
}

} // namespace st
