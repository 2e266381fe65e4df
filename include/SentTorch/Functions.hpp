#pragma once

#include "Core.hpp"
#include "Random.hpp"

#include <random>
#include <stdexcept>
#include <string>

namespace st {

class Sigmoid : public Function {
    Tensor y_;
public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        y_ = ns::sigmoid(xs[0]);
        return { y_ };
    }
    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        return { Variable::create(gy.zip(y_, [](float g, float y) { return g * y * (1.0f - y); })) };
    }
};

class Tanh : public Function {
    Tensor y_;
public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        y_ = ns::tanh(xs[0]);
        return { y_ };
    }
    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        return { Variable::create(gy.zip(y_, [](float g, float y) { return g * (1.0f - y * y); })) };
    }
};

/// y = x @ W^T + b with W stored as (out, in) and b as (1, out).
class LinearFunction : public Function {
public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        Tensor y = ns::matmul_nt(xs[0], xs[1]);
        if (xs.size() > 2) {
            y = y + xs[2].broadcast_to(y.getShape());
        }
        return { y };
    }

    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        const auto& x = inputs[0]->data;
        const auto& W = inputs[1]->data;

        std::vector<std::shared_ptr<Variable>> gxs;
        gxs.push_back(Variable::create(gy.matmul(W)));
        gxs.push_back(Variable::create(ns::matmul_tn(gy, x)));
        if (inputs.size() > 2) {
            gxs.push_back(Variable::create(ns::sum(gy, 0)));
        }
        return gxs;
    }
};

/// Chunk `index` of `count` equal slices along the feature axis.
class Split : public Function {
    std::size_t index_;
    std::size_t count_;
    TensorShape in_shape_{};
public:
    Split(std::size_t index, std::size_t count) : index_(index), count_(count) {}

    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        in_shape_ = xs[0].getShape();
        if (count_ == 0 || in_shape_[1] % count_ != 0) {
            throw std::invalid_argument("Split::forward: feature dimension " + std::to_string(in_shape_[1]) +
                                        " is not divisible into " + std::to_string(count_) + " chunks");
        }
        return { ns::split(xs[0], index_, in_shape_[1] / count_) };
    }

    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        const std::size_t chunk = in_shape_[1] / count_;
        Tensor gx(in_shape_);
        for (std::size_t r = 0; r < in_shape_[0]; ++r) {
            for (std::size_t c = 0; c < chunk; ++c) {
                gx(r, index_ * chunk + c) = gy(r, c);
            }
        }
        return { Variable::create(std::move(gx)) };
    }
};

/// Inverted dropout; identity outside train mode.
class DropoutFunction : public Function {
    float ratio_;
    Tensor mask_;
    bool active_ = false;
public:
    explicit DropoutFunction(float ratio) : ratio_(ratio) {}

    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        active_ = Config::train && ratio_ > 0.0f;
        if (!active_) {
            return { xs[0] };
        }
        const float scale = 1.0f / (1.0f - ratio_);
        std::bernoulli_distribution keep(1.0 - ratio_);
        mask_ = Tensor(xs[0].getShape());
        float* m = mask_.data();
        for (std::size_t i = 0; i < mask_.size(); ++i) {
            m[i] = keep(generator()) ? scale : 0.0f;
        }
        return { xs[0] * mask_ };
    }

    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        if (!active_) {
            return { Variable::create(gys[0]->data) };
        }
        return { Variable::create(gys[0]->data * mask_) };
    }
};

inline std::shared_ptr<Variable> sigmoid(const std::shared_ptr<Variable>& x) {
    return apply_op(std::make_shared<Sigmoid>(), {x});
}

inline std::shared_ptr<Variable> tanh(const std::shared_ptr<Variable>& x) {
    return apply_op(std::make_shared<Tanh>(), {x});
}

inline std::shared_ptr<Variable> linear(const std::shared_ptr<Variable>& x,
                                        const std::shared_ptr<Variable>& W,
                                        const std::shared_ptr<Variable>& b = nullptr) {
    if (b) {
        return apply_op(std::make_shared<LinearFunction>(), {x, W, b});
    }
    return apply_op(std::make_shared<LinearFunction>(), {x, W});
}

inline std::shared_ptr<Variable> split(const std::shared_ptr<Variable>& x, std::size_t index, std::size_t count) {
    return apply_op(std::make_shared<Split>(index, count), {x});
}

inline std::shared_ptr<Variable> dropout(const std::shared_ptr<Variable>& x, float ratio) {
    if (ratio < 0.0f || ratio >= 1.0f) {
        throw std::invalid_argument("st::dropout: ratio must be in [0, 1)");
    }
    return apply_op(std::make_shared<DropoutFunction>(ratio), {x});
}

} // namespace st
