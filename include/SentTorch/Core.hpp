#ifndef SENTTORCH_CORE_HPP
#define SENTTORCH_CORE_HPP

#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "NumSent/Tensor.hpp"

namespace st {

using TensorValueType = float;
constexpr std::size_t TensorRank = 2;
using Tensor = ns::Tensor<TensorValueType, TensorRank>;
using TensorShape = typename Tensor::shape_type;

// Mode flags are per thread so fitness workers can run inference
// while another thread builds a graph.
struct Config {
    static inline thread_local bool enable_backprop = true;
    static inline thread_local bool train = true;
};

class UsingConfig {
public:
    UsingConfig(bool& flag, bool val) : flagRef(flag), old(flag) { flagRef = val; }
    ~UsingConfig() { flagRef = old; }
    UsingConfig(const UsingConfig&) = delete;
    UsingConfig& operator=(const UsingConfig&) = delete;
private:
    bool& flagRef;
    bool old;
};

inline UsingConfig no_grad() { return UsingConfig(Config::enable_backprop, false); }
inline UsingConfig test_mode() { return UsingConfig(Config::train, false); }
inline UsingConfig train_mode() { return UsingConfig(Config::train, true); }

class Function;

class Variable : public std::enable_shared_from_this<Variable> {
public:
    Tensor data;
    std::string name;
    std::shared_ptr<Variable> grad;
    std::shared_ptr<Function> creator;
    int generation = 0;

    Variable() = default;
    explicit Variable(const Tensor& arr, const std::string& n = "") : data(arr), name(n) {}
    explicit Variable(Tensor&& arr, const std::string& n = "") : data(std::move(arr)), name(n) {}
    virtual ~Variable() = default;

    static std::shared_ptr<Variable> create(const Tensor& arr, const std::string& n = "") {
        return std::make_shared<Variable>(arr, n);
    }
    static std::shared_ptr<Variable> create(Tensor&& arr, const std::string& n = "") {
        return std::make_shared<Variable>(std::move(arr), n);
    }

    const TensorShape& shape() const { return data.getShape(); }
    size_t size() const { return data.size(); }

    void set_creator(const std::shared_ptr<Function>& f);
    void cleargrad() { grad.reset(); }

    /// Runs reverse-mode differentiation from this variable. The seed
    /// gradient is ones when no gradient has been set.
    void backward(bool retain_grad = false);

    /// Copy of the data with no history; used to carry state across windows.
    std::shared_ptr<Variable> detach() const { return create(data, name); }
};

class Parameter : public Variable {
public:
    Parameter() = default;
    explicit Parameter(const Tensor& arr, const std::string& n = "") : Variable(arr, n) {}

    static std::shared_ptr<Parameter> create(const Tensor& arr, const std::string& n = "") {
        return std::make_shared<Parameter>(arr, n);
    }
};

class Function : public std::enable_shared_from_this<Function> {
public:
    std::vector<std::shared_ptr<Variable>> inputs;
    std::vector<std::weak_ptr<Variable>> outputs;
    int generation = 0;

    virtual ~Function() = default;

    std::vector<std::shared_ptr<Variable>> operator()(const std::vector<std::shared_ptr<Variable>>& in_vars) {
        std::vector<Tensor> xs;
        xs.reserve(in_vars.size());
        for (const auto& v : in_vars) {
            xs.push_back(v->data);
        }

        std::vector<Tensor> ys = forward(xs);

        std::vector<std::shared_ptr<Variable>> out_vars;
        out_vars.reserve(ys.size());
        for (auto& y : ys) {
            out_vars.push_back(Variable::create(std::move(y)));
        }

        if (Config::enable_backprop) {
            inputs = in_vars;
            generation = 0;
            for (const auto& v : inputs) generation = std::max(generation, v->generation);

            for (auto& out : out_vars) {
                out->set_creator(shared_from_this());
                outputs.push_back(out);
            }
        }

        return out_vars;
    }

    virtual std::vector<Tensor> forward(const std::vector<Tensor>& xs) = 0;
    virtual std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) = 0;
};

inline void Variable::set_creator(const std::shared_ptr<Function>& f) {
    creator = f;
    generation = f->generation + 1;
}

// --- elementwise functions ---

class Add : public Function {
    TensorShape x0_shape, x1_shape;
public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        x0_shape = xs[0].getShape();
        x1_shape = xs[1].getShape();
        if (x0_shape == x1_shape) {
            return { xs[0] + xs[1] };
        }
        TensorShape out_shape{};
        for (std::size_t axis = 0; axis < TensorRank; ++axis) {
            out_shape[axis] = std::max(x0_shape[axis], x1_shape[axis]);
        }
        return { xs[0].broadcast_to(out_shape) + xs[1].broadcast_to(out_shape) };
    }

    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        return { Variable::create(gy.sum_to(x0_shape)), Variable::create(gy.sum_to(x1_shape)) };
    }
};

class Sub : public Function {
public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        return { xs[0] - xs[1] };
    }
    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        return { Variable::create(gy), Variable::create(-gy) };
    }
};

class Mul : public Function {
public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        return { xs[0] * xs[1] };
    }

    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        const auto& gy = gys[0]->data;
        return { Variable::create(gy * inputs[1]->data), Variable::create(gy * inputs[0]->data) };
    }
};

class Neg : public Function {
public:
    std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
        return { -xs[0] };
    }
    std::vector<std::shared_ptr<Variable>> backward(const std::vector<std::shared_ptr<Variable>>& gys) override {
        return { Variable::create(-gys[0]->data) };
    }
};

inline std::shared_ptr<Variable> apply_op(const std::shared_ptr<Function>& f,
                                          const std::vector<std::shared_ptr<Variable>>& in_vars) {
    return (*f)(in_vars)[0];
}

inline std::shared_ptr<Variable> add(const std::shared_ptr<Variable>& a, const std::shared_ptr<Variable>& b) {
    return apply_op(std::make_shared<Add>(), {a, b});
}

inline std::shared_ptr<Variable> sub(const std::shared_ptr<Variable>& a, const std::shared_ptr<Variable>& b) {
    return apply_op(std::make_shared<Sub>(), {a, b});
}

inline std::shared_ptr<Variable> mul(const std::shared_ptr<Variable>& a, const std::shared_ptr<Variable>& b) {
    return apply_op(std::make_shared<Mul>(), {a, b});
}

inline std::shared_ptr<Variable> neg(const std::shared_ptr<Variable>& a) {
    return apply_op(std::make_shared<Neg>(), {a});
}

inline std::shared_ptr<Variable> operator+(const std::shared_ptr<Variable>& a, const std::shared_ptr<Variable>& b) {
    return add(a, b);
}

inline std::shared_ptr<Variable> operator-(const std::shared_ptr<Variable>& a, const std::shared_ptr<Variable>& b) {
    return sub(a, b);
}

inline std::shared_ptr<Variable> operator*(const std::shared_ptr<Variable>& a, const std::shared_ptr<Variable>& b) {
    return mul(a, b);
}

inline std::shared_ptr<Variable> operator-(const std::shared_ptr<Variable>& a) {
    return neg(a);
}

} // namespace st

#endif
