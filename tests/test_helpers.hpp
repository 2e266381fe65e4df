#pragma once

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <random>
#include <string>

#include "SentTorch/Core.hpp"

namespace test_utils {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("sentneuron_" + tag + "_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

inline st::Tensor random_tensor(std::size_t rows, std::size_t cols, std::uint32_t seed, float scale = 1.0f) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-scale, scale);
    st::Tensor t(rows, cols);
    for (std::size_t i = 0; i < t.size(); ++i) t.data()[i] = dist(rng);
    return t;
}

/// Compares the analytical gradient of sum(weights * f()) with respect to
/// `target` against central differences.
inline void expect_gradient_matches(const std::shared_ptr<st::Variable>& target,
                                    const std::function<std::shared_ptr<st::Variable>()>& f,
                                    float eps = 1e-2f, float atol = 2e-3f, float rtol = 2e-2f) {
    const auto probe = f();
    const auto weights = st::Variable::create(random_tensor(probe->data.dim(0), probe->data.dim(1), 7u));

    target->cleargrad();
    auto y = f() * weights;
    y->backward();
    ASSERT_TRUE(target->grad) << "no gradient reached the target";
    const st::Tensor analytic = target->grad->data;

    auto objective = [&]() {
        auto guard = st::no_grad();
        auto out = f();
        double total = 0.0;
        for (std::size_t i = 0; i < out->data.size(); ++i) {
            total += static_cast<double>(out->data.data()[i]) * weights->data.data()[i];
        }
        return total;
    };

    for (std::size_t i = 0; i < target->data.size(); ++i) {
        float& x = target->data.data()[i];
        const float saved = x;
        x = saved + eps;
        const double plus = objective();
        x = saved - eps;
        const double minus = objective();
        x = saved;

        const double numeric = (plus - minus) / (2.0 * eps);
        const double tol = atol + rtol * std::abs(numeric);
        EXPECT_NEAR(analytic.data()[i], numeric, tol) << "element " << i;
    }
}

} // namespace test_utils
