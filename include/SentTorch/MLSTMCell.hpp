#pragma once

#include "Functions.hpp"
#include "Linear.hpp"
#include "Module.hpp"

#include <memory>

namespace st {

struct LSTMState {
    std::shared_ptr<Variable> h;
    std::shared_ptr<Variable> c;
};

/// Multiplicative LSTM cell.
///
///   m  = (x Wmx^T) * (h Wmh^T)
///   g  = x Wx^T + m Wh^T + b
///   i, f, o = sigmoid(g[0]), sigmoid(g[1]), sigmoid(g[2])
///   u  = tanh(g[3])
///   c' = f * c + i * u
///   h' = o * tanh(c')
class MLSTMCell : public Module {
private:
    std::size_t input_size_;
    std::size_t hidden_size_;
    std::shared_ptr<Linear> wx_;
    std::shared_ptr<Linear> wh_;
    std::shared_ptr<Linear> wmx_;
    std::shared_ptr<Linear> wmh_;

public:
    MLSTMCell(std::size_t input_size, std::size_t hidden_size)
        : input_size_(input_size),
          hidden_size_(hidden_size),
          wx_(std::make_shared<Linear>(input_size, 4 * hidden_size, false)),
          wh_(std::make_shared<Linear>(hidden_size, 4 * hidden_size, true)),
          wmx_(std::make_shared<Linear>(input_size, hidden_size, false)),
          wmh_(std::make_shared<Linear>(hidden_size, hidden_size, false))
    {
        add_module("wx", wx_);
        add_module("wh", wh_);
        add_module("wmx", wmx_);
        add_module("wmh", wmh_);
    }

    LSTMState forward(const std::shared_ptr<Variable>& x, const LSTMState& state) const {
        auto m = (*wmx_)(x) * (*wmh_)(state.h);
        auto gates = (*wx_)(x) + (*wh_)(m);

        auto i = sigmoid(split(gates, 0, 4));
        auto f = sigmoid(split(gates, 1, 4));
        auto o = sigmoid(split(gates, 2, 4));
        auto u = tanh(split(gates, 3, 4));

        auto c = f * state.c + i * u;
        auto h = o * tanh(c);
        return { h, c };
    }

    LSTMState operator()(const std::shared_ptr<Variable>& x, const LSTMState& state) const {
        return forward(x, state);
    }

    /// Zero state for a batch.
    LSTMState initial_state(std::size_t batch) const {
        return { Variable::create(Tensor(batch, hidden_size_)), Variable::create(Tensor(batch, hidden_size_)) };
    }

    std::size_t input_size() const { return input_size_; }
    std::size_t hidden_size() const { return hidden_size_; }
};

} // namespace st
