#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <vector>

#include "NumSent/Tensor.hpp"

using Tensor2f = ns::Tensor<float, 2>;
using Shape2 = Tensor2f::shape_type;

TEST(TensorTest, ConstructionZeroFillsAndChecksValueCount) {
    Tensor2f t(2, 3);
    EXPECT_EQ(t.size(), 6u);
    EXPECT_EQ(t.dim(0), 2u);
    EXPECT_EQ(t.dim(1), 3u);
    EXPECT_FLOAT_EQ(t.sum(), 0.0f);

    EXPECT_THROW(Tensor2f(Shape2{2, 2}, std::vector<float>{1.0f, 2.0f, 3.0f}), std::invalid_argument);
}

TEST(TensorTest, ElementwiseArithmetic) {
    Tensor2f a(Shape2{2, 2}, std::vector<float>{1, 2, 3, 4});
    Tensor2f b(Shape2{2, 2}, std::vector<float>{4, 3, 2, 1});

    auto sum = a + b;
    auto prod = a * b;
    auto scaled = 2.0f * a - 1.0f;
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_FLOAT_EQ(sum.data()[i], 5.0f);
    }
    EXPECT_FLOAT_EQ(prod(0, 1), 6.0f);
    EXPECT_FLOAT_EQ(scaled(1, 1), 7.0f);

    Tensor2f c(3, 1);
    EXPECT_THROW(a + c, std::invalid_argument);
}

TEST(TensorTest, BroadcastAndSumToAreAdjoint) {
    Tensor2f row(Shape2{1, 3}, std::vector<float>{1, 2, 3});
    auto wide = row.broadcast_to(Shape2{4, 3});
    EXPECT_EQ(wide.dim(0), 4u);
    EXPECT_FLOAT_EQ(wide(3, 2), 3.0f);

    auto back = wide.sum_to(Shape2{1, 3});
    EXPECT_FLOAT_EQ(back(0, 0), 4.0f);
    EXPECT_FLOAT_EQ(back(0, 2), 12.0f);

    EXPECT_THROW(row.broadcast_to(Shape2{2, 4}), std::invalid_argument);
}

TEST(TensorTest, MatmulVariantsAgree) {
    Tensor2f a(Shape2{2, 3}, std::vector<float>{1, 2, 3, 4, 5, 6});
    Tensor2f b(Shape2{4, 3}, std::vector<float>{1, 0, 1, 0, 1, 0, 2, 2, 2, -1, 0, 1});

    auto direct = a.matmul(b.transpose());
    auto nt = ns::matmul_nt(a, b);
    ASSERT_EQ(nt.dim(0), 2u);
    ASSERT_EQ(nt.dim(1), 4u);
    for (std::size_t i = 0; i < direct.size(); ++i) {
        EXPECT_FLOAT_EQ(nt.data()[i], direct.data()[i]);
    }
    EXPECT_FLOAT_EQ(nt(1, 2), 30.0f);

    auto tn = ns::matmul_tn(a, a);
    auto expected = a.transpose().matmul(a);
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_FLOAT_EQ(tn.data()[i], expected.data()[i]);
    }

    EXPECT_THROW(a.matmul(a), std::invalid_argument);
}

TEST(TensorTest, AxisReductions) {
    Tensor2f t(Shape2{2, 3}, std::vector<float>{1, 5, 2, -1, 0, 7});
    auto col_sum = ns::sum(t, 0);
    auto row_max = ns::max(t, 1);
    EXPECT_EQ(col_sum.dim(0), 1u);
    EXPECT_FLOAT_EQ(col_sum(0, 2), 9.0f);
    EXPECT_FLOAT_EQ(row_max(0, 0), 5.0f);
    EXPECT_FLOAT_EQ(row_max(1, 0), 7.0f);
}

TEST(TensorTest, SplitAndConcatRoundTrip) {
    Tensor2f t(Shape2{2, 4}, std::vector<float>{0, 1, 2, 3, 4, 5, 6, 7});
    auto left = ns::split(t, 0, 2);
    auto right = ns::split(t, 1, 2);
    EXPECT_FLOAT_EQ(left(1, 1), 5.0f);
    EXPECT_FLOAT_EQ(right(0, 0), 2.0f);

    auto joined = ns::concat<float, 2>({left, right}, 1);
    EXPECT_EQ(joined.values(), t.values());

    EXPECT_THROW(ns::split(t, 2, 2), std::out_of_range);
}

TEST(TensorTest, ElementwiseFunctions) {
    Tensor2f t(Shape2{1, 3}, std::vector<float>{-1000.0f, 0.0f, 1000.0f});
    auto s = ns::sigmoid(t);
    EXPECT_NEAR(s(0, 0), 0.0f, 1e-6f);
    EXPECT_FLOAT_EQ(s(0, 1), 0.5f);
    EXPECT_NEAR(s(0, 2), 1.0f, 1e-6f);

    auto c = ns::clamp(t, -1.0f, 1.0f);
    EXPECT_FLOAT_EQ(c(0, 0), -1.0f);
    EXPECT_FLOAT_EQ(c(0, 2), 1.0f);
}

TEST(TensorTest, WeightBytesRoundTripThroughStream) {
    Tensor2f src(Shape2{2, 2}, std::vector<float>{1.5f, -2.0f, 3.25f, 0.0f});
    std::stringstream buffer;
    buffer << "hdr";
    src.writeWeight(buffer);

    Tensor2f dst(2, 2);
    dst.loadWeight(buffer, 3, 3 + 4 * static_cast<std::streamoff>(sizeof(float)));
    EXPECT_EQ(dst.values(), src.values());

    EXPECT_THROW(dst.loadWeight(buffer, 3, 5), std::invalid_argument);
}
