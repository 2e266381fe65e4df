#include "SentTorch/Core.hpp"

#include <queue>
#include <unordered_set>

namespace st {

namespace {

struct GenerationOrder {
    bool operator()(const std::shared_ptr<Function>& a, const std::shared_ptr<Function>& b) const {
        return a->generation < b->generation;
    }
};

} // namespace

void Variable::backward(bool retain_grad) {
    if (!grad) {
        grad = Variable::create(ns::ones_like(data));
    }

    std::priority_queue<std::shared_ptr<Function>,
                        std::vector<std::shared_ptr<Function>>,
                        GenerationOrder> funcs;
    std::unordered_set<Function*> seen;

    auto add_func = [&](const std::shared_ptr<Function>& f) {
        if (!f) return;
        if (seen.insert(f.get()).second) {
            funcs.push(f);
        }
    };

    add_func(creator);

    // Gradient functions never record graphs of their own.
    UsingConfig no_graph(Config::enable_backprop, false);

    while (!funcs.empty()) {
        auto f = funcs.top();
        funcs.pop();

        std::vector<std::shared_ptr<Variable>> gys;
        bool complete = true;
        for (auto& w : f->outputs) {
            auto outp = w.lock();
            if (!outp || !outp->grad) {
                complete = false;
                break;
            }
            gys.push_back(outp->grad);
        }
        if (!complete) continue;

        auto gxs = f->backward(gys);

        for (size_t i = 0; i < f->inputs.size(); ++i) {
            auto& x = f->inputs[i];
            auto gx = (i < gxs.size() ? gxs[i] : nullptr);
            if (!gx) continue;

            // Accumulate into a fresh variable so no two inputs share a gradient buffer.
            if (!x->grad) x->grad = gx;
            else x->grad = Variable::create(x->grad->data + gx->data);

            if (x->creator) add_func(x->creator);
        }

        if (!retain_grad) {
            for (auto& w : f->outputs) {
                if (auto outp = w.lock()) outp->grad.reset();
            }
        }
    }
}

} // namespace st
