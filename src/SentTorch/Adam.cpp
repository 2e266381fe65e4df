#include "SentTorch/Adam.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace st {

Adam::Adam(std::vector<NamedParameter> params, double lr, double beta1, double beta2, double eps)
    : params_(std::move(params)), lr_(lr), beta1_(beta1), beta2_(beta2), eps_(eps)
{
    if (lr < 0.0) {
        throw std::invalid_argument("Adam::Adam: learning rate must be non-negative");
    }
    if (beta1 < 0.0 || beta1 >= 1.0 || beta2 < 0.0 || beta2 >= 1.0) {
        throw std::invalid_argument("Adam::Adam: betas must be in [0, 1)");
    }
    for (const auto& [name, param] : params_) {
        state_.exp_avg.emplace(name, ns::zeros_like(param->data));
        state_.exp_avg_sq.emplace(name, ns::zeros_like(param->data));
    }
}

void Adam::step() {
    ++state_.step;
    const double bias1 = 1.0 - std::pow(beta1_, static_cast<double>(state_.step));
    const double bias2 = 1.0 - std::pow(beta2_, static_cast<double>(state_.step));
    const double step_size = lr_ / bias1;
    const double bias2_sqrt = std::sqrt(bias2);

    const auto b1 = static_cast<float>(beta1_);
    const auto b2 = static_cast<float>(beta2_);

    for (const auto& [name, param] : params_) {
        if (!param->grad) continue;

        const float* g = param->grad->data.data();
        float* w = param->data.data();
        float* m = state_.exp_avg.at(name).data();
        float* v = state_.exp_avg_sq.at(name).data();

        for (std::size_t i = 0; i < param->data.size(); ++i) {
            m[i] = b1 * m[i] + (1.0f - b1) * g[i];
            v[i] = b2 * v[i] + (1.0f - b2) * g[i] * g[i];
            const double denom = std::sqrt(static_cast<double>(v[i])) / bias2_sqrt + eps_;
            w[i] -= static_cast<float>(step_size * static_cast<double>(m[i]) / denom);
        }
    }
}

void Adam::zero_grad() {
    for (auto& named : params_) {
        named.second->cleargrad();
    }
}

void Adam::load_state(AdamState state) {
    for (const auto& [name, param] : params_) {
        auto m = state.exp_avg.find(name);
        auto v = state.exp_avg_sq.find(name);
        if (m == state.exp_avg.end() || v == state.exp_avg_sq.end()) {
            throw std::runtime_error("Adam::load_state: missing moments for " + name);
        }
        if (!m->second.is_same_shape(param->data) || !v->second.is_same_shape(param->data)) {
            throw std::runtime_error("Adam::load_state: moment shape mismatch for " + name);
        }
    }
    state_ = std::move(state);
}

void clip_grad_value(const std::vector<NamedParameter>& params, float clip) {
    for (const auto& named : params) {
        auto& param = named.second;
        if (!param->grad) continue;
        param->grad->data = ns::clamp(param->grad->data, -clip, clip);
    }
}

} // namespace st
