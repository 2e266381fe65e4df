#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <Eigen/Dense>

namespace sentneuron {

using FeatureMatrix = std::vector<std::vector<float>>;

/// L1-penalized logistic regression over cell-state features.
///
/// Minimizes ||w||_1 + C * sum(logloss) by randomized coordinate descent
/// with the logistic curvature bound 1/4 as quadratic majorizer. The
/// intercept is not penalized. Two classes give one weight row; more
/// classes are fitted one-vs-rest with one row per class.
class SentimentClassifier {
public:
    /// 2^-8, 2^-7, ..., 2^0
    static std::vector<double> default_candidates();

    /// Fits one model per candidate C (seed + i), keeps the C with the best
    /// held-out accuracy (first on ties), refits it with seed + candidates
    /// and returns the held-out accuracy in percent.
    double fit(const FeatureMatrix& train_X, const std::vector<int>& train_y,
               const FeatureMatrix& test_X, const std::vector<int>& test_y,
               const std::vector<double>& candidates = default_candidates(), unsigned seed = 42);

    /// std::nullopt until fit() has succeeded.
    std::optional<std::vector<int>> predict(const FeatureMatrix& X) const;
    std::optional<int> predict_one(const std::vector<float>& x) const;

    /// Dimensions ranked by the L1 norm of their weight column, descending,
    /// ties broken by lower index. Throws std::invalid_argument for k outside
    /// [1, d] or an unfitted classifier.
    std::vector<std::size_t> top_k_salient_dimensions(std::size_t k) const;

    bool fitted() const { return model_.has_value(); }
    double regularization() const;
    const Eigen::MatrixXd& weights() const;
    const std::vector<int>& classes() const;

private:
    struct Model {
        Eigen::MatrixXd W; ///< rows x features
        Eigen::VectorXd b;
        std::vector<int> classes;
        double C = 1.0;
    };

    static Model train(const Eigen::MatrixXd& X, const std::vector<int>& y, double C, unsigned seed);
    static std::vector<int> predict_with(const Model& model, const Eigen::MatrixXd& X);
    static double accuracy(const Model& model, const Eigen::MatrixXd& X, const std::vector<int>& y);

    std::optional<Model> model_;
};

} // namespace sentneuron
