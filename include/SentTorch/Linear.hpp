#pragma once

#include "Functions.hpp"
#include "Module.hpp"
#include "Random.hpp"

#include <cmath>
#include <memory>
#include <random>

namespace st {

class Linear : public Module {
private:
    std::shared_ptr<Parameter> W;
    std::shared_ptr<Parameter> b;
    bool use_bias;

public:
    Linear(std::size_t in_features, std::size_t out_features, bool bias = true)
        : use_bias(bias)
    {
        // U(-1/sqrt(in), 1/sqrt(in)) for both weight and bias.
        const float bound = in_features > 0 ? 1.0f / std::sqrt(static_cast<float>(in_features)) : 0.0f;
        std::uniform_real_distribution<float> dist(-bound, bound);

        Tensor w_data(out_features, in_features);
        float* w = w_data.data();
        for (std::size_t i = 0; i < w_data.size(); ++i) w[i] = dist(generator());
        W = Parameter::create(w_data, "weight");
        register_parameter("weight", W);

        if (use_bias) {
            Tensor b_data(std::size_t{1}, out_features);
            float* bp = b_data.data();
            for (std::size_t i = 0; i < b_data.size(); ++i) bp[i] = dist(generator());
            b = Parameter::create(b_data, "bias");
            register_parameter("bias", b);
        }
    }

    std::shared_ptr<Variable> forward(const std::shared_ptr<Variable>& x) const {
        return linear(x, W, use_bias ? b : nullptr);
    }

    std::shared_ptr<Variable> operator()(const std::shared_ptr<Variable>& x) const {
        return forward(x);
    }

    std::shared_ptr<Parameter> weight() const { return W; }
    std::shared_ptr<Parameter> bias() const { return b; }
    std::size_t in_features() const { return W->data.dim(1); }
    std::size_t out_features() const { return W->data.dim(0); }
};

} // namespace st
