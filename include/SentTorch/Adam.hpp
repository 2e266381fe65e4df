#pragma once

#include "Module.hpp"

#include <map>
#include <string>
#include <vector>

namespace st {

/// Moment buffers keyed by parameter name, plus the shared step count.
struct AdamState {
    std::map<std::string, Tensor> exp_avg;
    std::map<std::string, Tensor> exp_avg_sq;
    long long step = 0;
};

/// Adam with bias correction; matches torch.optim.Adam without weight decay.
class Adam {
public:
    Adam(std::vector<NamedParameter> params, double lr, double beta1 = 0.9, double beta2 = 0.999,
         double eps = 1e-8);

    void step();
    void zero_grad();

    void set_learning_rate(double lr) { lr_ = lr; }
    double learning_rate() const { return lr_; }

    const AdamState& get_state() const { return state_; }
    /// Restores moments saved by get_state(); shapes must match the parameters.
    void load_state(AdamState state);

private:
    std::vector<NamedParameter> params_;
    double lr_;
    double beta1_;
    double beta2_;
    double eps_;
    AdamState state_;
};

/// Clamps every gradient element into [-clip, clip].
void clip_grad_value(const std::vector<NamedParameter>& params, float clip);

} // namespace st
