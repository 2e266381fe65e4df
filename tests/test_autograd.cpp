#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <string>

#include "SentTorch/Adam.hpp"
#include "SentTorch/Embedding.hpp"
#include "SentTorch/Functions.hpp"
#include "SentTorch/Linear.hpp"
#include "SentTorch/MLSTMCell.hpp"
#include "SentTorch/Random.hpp"
#include "SentTorch/Softmax.hpp"
#include "test_helpers.hpp"

using st::Tensor;
using st::Variable;
using test_utils::expect_gradient_matches;
using test_utils::random_tensor;

TEST(AutogradTest, SharedInputAccumulatesGradient) {
    auto x = Variable::create(Tensor(st::TensorShape{1, 1}, 3.0f));
    auto y = x * x + x;
    y->backward();
    ASSERT_TRUE(x->grad);
    EXPECT_FLOAT_EQ(x->grad->data(0, 0), 7.0f);
}

TEST(AutogradTest, NoGradSkipsGraphConstruction) {
    auto x = Variable::create(Tensor(st::TensorShape{1, 2}, 1.0f));
    {
        auto guard = st::no_grad();
        auto y = st::tanh(x);
        EXPECT_FALSE(y->creator);
    }
    auto z = st::tanh(x);
    EXPECT_TRUE(z->creator);
    EXPECT_TRUE(st::Config::enable_backprop);
}

TEST(AutogradTest, BroadcastAddReducesGradient) {
    auto x = Variable::create(random_tensor(3, 2, 1u));
    auto b = Variable::create(random_tensor(1, 2, 2u));
    auto y = x + b;
    y->backward();
    ASSERT_TRUE(b->grad);
    EXPECT_EQ(b->grad->data.dim(0), 1u);
    EXPECT_FLOAT_EQ(b->grad->data(0, 0), 3.0f);
    EXPECT_FLOAT_EQ(x->grad->data(2, 1), 1.0f);
}

TEST(AutogradTest, ElementwiseGradientsMatchFiniteDifferences) {
    auto a = Variable::create(random_tensor(2, 3, 3u));
    auto b = Variable::create(random_tensor(2, 3, 4u));
    expect_gradient_matches(a, [&] { return st::sigmoid(a * b) - st::tanh(a); });
    expect_gradient_matches(b, [&] { return st::sigmoid(a * b) - st::tanh(a); });
}

TEST(AutogradTest, LinearGradientsMatchFiniteDifferences) {
    st::manual_seed(11);
    st::Linear layer(3, 4);
    auto x = Variable::create(random_tensor(2, 3, 5u));
    auto f = [&] { return st::tanh(layer(x)); };
    expect_gradient_matches(x, f);
    expect_gradient_matches(layer.weight(), f);
    expect_gradient_matches(layer.bias(), f);
}

TEST(AutogradTest, SplitRoutesGradientToItsSlice) {
    auto x = Variable::create(random_tensor(2, 8, 6u));
    auto part = st::split(x, 1, 4);
    EXPECT_EQ(part->data.dim(1), 2u);
    part->backward();
    ASSERT_TRUE(x->grad);
    EXPECT_FLOAT_EQ(x->grad->data(0, 1), 0.0f);
    EXPECT_FLOAT_EQ(x->grad->data(0, 2), 1.0f);
    EXPECT_FLOAT_EQ(x->grad->data(1, 3), 1.0f);
    EXPECT_FLOAT_EQ(x->grad->data(1, 4), 0.0f);

    EXPECT_THROW(st::split(Variable::create(Tensor(2, 6)), 0, 4), std::invalid_argument);
}

TEST(AutogradTest, SoftmaxCrossEntropyGradient) {
    auto logits = Variable::create(random_tensor(3, 5, 8u, 2.0f));
    const std::vector<std::size_t> targets{0, 4, 2};

    auto loss = st::softmax_cross_entropy(logits, targets);
    ASSERT_EQ(loss->data.size(), 1u);
    EXPECT_GT(loss->data(0, 0), 0.0f);

    expect_gradient_matches(logits, [&] { return st::softmax_cross_entropy(logits, targets); });
    expect_gradient_matches(logits, [&] { return st::softmax(logits); });

    EXPECT_THROW(st::softmax_cross_entropy(logits, {0, 1}), std::invalid_argument);
}

TEST(AutogradTest, SoftmaxRowsAreStable) {
    Tensor big(st::TensorShape{1, 3}, std::vector<float>{1000.0f, 1000.0f, -1000.0f});
    auto p = st::softmax_rows(big);
    EXPECT_NEAR(p(0, 0), 0.5f, 1e-6f);
    EXPECT_NEAR(p(0, 2), 0.0f, 1e-6f);
}

TEST(AutogradTest, EmbeddingGradientScattersIntoRows) {
    st::manual_seed(3);
    st::Embedding emb(5, 3);
    auto ids = st::make_indices({1, 4, 1});
    auto out = emb(ids);
    EXPECT_EQ(out->data.dim(0), 3u);
    EXPECT_FLOAT_EQ(out->data(2, 1), emb.weight()->data(1, 1));

    out->backward();
    const auto& g = emb.weight()->grad->data;
    EXPECT_FLOAT_EQ(g(1, 0), 2.0f);
    EXPECT_FLOAT_EQ(g(4, 2), 1.0f);
    EXPECT_FLOAT_EQ(g(0, 0), 0.0f);
}

TEST(AutogradTest, MLSTMCellGradientsMatchFiniteDifferences) {
    st::manual_seed(21);
    st::MLSTMCell cell(3, 2);
    auto x = Variable::create(random_tensor(2, 3, 9u));
    st::LSTMState state{ Variable::create(random_tensor(2, 2, 10u, 0.5f)),
                         Variable::create(random_tensor(2, 2, 11u, 0.5f)) };

    auto h_of = [&] { return cell(x, state).h; };
    auto c_of = [&] { return cell(x, state).c; };

    expect_gradient_matches(x, h_of);
    expect_gradient_matches(state.h, h_of);
    expect_gradient_matches(state.c, c_of);
    for (const auto& named : cell.named_parameters()) {
        SCOPED_TRACE(named.first);
        expect_gradient_matches(named.second, h_of);
    }
}

TEST(AutogradTest, DropoutIsIdentityOutsideTraining) {
    auto x = Variable::create(random_tensor(4, 4, 12u));
    {
        auto guard = st::test_mode();
        auto y = st::dropout(x, 0.5f);
        EXPECT_EQ(y->data.values(), x->data.values());
    }
    auto guard = st::train_mode();
    st::manual_seed(5);
    auto y = st::dropout(x, 0.5f);
    for (std::size_t i = 0; i < y->data.size(); ++i) {
        const float v = y->data.data()[i];
        const float expected = x->data.data()[i] * 2.0f;
        EXPECT_TRUE(v == 0.0f || std::abs(v - expected) < 1e-6f);
    }
    EXPECT_THROW(st::dropout(x, 1.0f), std::invalid_argument);
}

TEST(AdamTest, FirstStepMovesEachWeightByLearningRate) {
    auto p = st::Parameter::create(Tensor(st::TensorShape{1, 2}, std::vector<float>{1.0f, -1.0f}));
    st::Adam adam({{"p", p}}, 0.1);
    p->grad = Variable::create(Tensor(st::TensorShape{1, 2}, std::vector<float>{0.5f, -3.0f}));
    adam.step();
    EXPECT_NEAR(p->data(0, 0), 0.9f, 1e-5f);
    EXPECT_NEAR(p->data(0, 1), -0.9f, 1e-5f);
    EXPECT_EQ(adam.get_state().step, 1);

    adam.zero_grad();
    EXPECT_FALSE(p->grad);
}

TEST(AdamTest, StateRestoreContinuesIdentically) {
    auto make = [] {
        return st::Parameter::create(Tensor(st::TensorShape{2, 2}, std::vector<float>{0.5f, -0.5f, 1.0f, 2.0f}));
    };
    auto grad = Tensor(st::TensorShape{2, 2}, std::vector<float>{0.1f, -0.2f, 0.3f, 0.0f});

    auto a = make();
    st::Adam first({{"w", a}}, 0.01);
    for (int i = 0; i < 3; ++i) {
        a->grad = Variable::create(grad);
        first.step();
    }

    auto b = make();
    st::Adam warm({{"w", b}}, 0.01);
    b->grad = Variable::create(grad);
    warm.step();
    st::Adam resumed({{"w", b}}, 0.01);
    resumed.load_state(warm.get_state());
    for (int i = 0; i < 2; ++i) {
        b->grad = Variable::create(grad);
        resumed.step();
    }

    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_FLOAT_EQ(a->data.data()[i], b->data.data()[i]);
    }

    st::AdamState broken = warm.get_state();
    broken.exp_avg["w"] = Tensor(3, 3);
    EXPECT_THROW(resumed.load_state(broken), std::runtime_error);
}

TEST(AdamTest, ClipGradValueClampsElements) {
    auto p = st::Parameter::create(Tensor(1, 3));
    p->grad = Variable::create(Tensor(st::TensorShape{1, 3}, std::vector<float>{-10.0f, 0.5f, 7.0f}));
    st::clip_grad_value({{"p", p}}, 5.0f);
    EXPECT_FLOAT_EQ(p->grad->data(0, 0), -5.0f);
    EXPECT_FLOAT_EQ(p->grad->data(0, 1), 0.5f);
    EXPECT_FLOAT_EQ(p->grad->data(0, 2), 5.0f);
}
