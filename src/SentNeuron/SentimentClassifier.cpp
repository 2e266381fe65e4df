#include "SentNeuron/SentimentClassifier.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>
#include <set>
#include <stdexcept>
#include <string>

namespace sentneuron {

namespace {

constexpr int kMaxSweeps = 200;
constexpr double kTolerance = 1e-5;
constexpr double kCurvatureBound = 0.25;

Eigen::MatrixXd to_matrix(const FeatureMatrix& rows, const char* where) {
    if (rows.empty()) {
        return Eigen::MatrixXd(0, 0);
    }
    const auto d = static_cast<Eigen::Index>(rows.front().size());
    Eigen::MatrixXd X(static_cast<Eigen::Index>(rows.size()), d);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (static_cast<Eigen::Index>(rows[i].size()) != d) {
            throw std::invalid_argument(std::string(where) + ": feature rows have different lengths");
        }
        for (Eigen::Index j = 0; j < d; ++j) {
            X(static_cast<Eigen::Index>(i), j) = rows[i][static_cast<std::size_t>(j)];
        }
    }
    return X;
}

double soft_threshold(double v, double t) {
    if (v > t) return v - t;
    if (v < -t) return v + t;
    return 0.0;
}

double sigmoid(double z) {
    if (z >= 0.0) return 1.0 / (1.0 + std::exp(-z));
    const double e = std::exp(z);
    return e / (1.0 + e);
}

// Binary problem with labels in {-1, +1}.
void solve_binary(const Eigen::MatrixXd& X, const Eigen::VectorXd& y, double C, std::mt19937& rng,
                  Eigen::VectorXd& w, double& b) {
    const Eigen::Index n = X.rows();
    const Eigen::Index d = X.cols();

    w = Eigen::VectorXd::Zero(d);
    b = 0.0;
    Eigen::VectorXd z = Eigen::VectorXd::Zero(n);

    const Eigen::VectorXd col_sq = X.colwise().squaredNorm().transpose();
    std::vector<Eigen::Index> order(static_cast<std::size_t>(d));
    std::iota(order.begin(), order.end(), Eigen::Index{0});

    for (int sweep = 0; sweep < kMaxSweeps; ++sweep) {
        std::shuffle(order.begin(), order.end(), rng);
        double max_change = 0.0;

        for (Eigen::Index j : order) {
            const double H = C * kCurvatureBound * col_sq(j);
            if (H <= 0.0) continue;

            double g = 0.0;
            for (Eigen::Index i = 0; i < n; ++i) {
                g -= y(i) * X(i, j) * sigmoid(-y(i) * z(i));
            }
            g *= C;

            const double w_old = w(j);
            const double w_new = soft_threshold(w_old - g / H, 1.0 / H);
            const double delta = w_new - w_old;
            if (delta != 0.0) {
                w(j) = w_new;
                z += delta * X.col(j);
                max_change = std::max(max_change, std::abs(delta));
            }
        }

        // Unpenalized intercept.
        double gb = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            gb -= y(i) * sigmoid(-y(i) * z(i));
        }
        gb *= C;
        const double Hb = C * kCurvatureBound * static_cast<double>(n);
        if (Hb > 0.0) {
            const double delta = -gb / Hb;
            b += delta;
            z.array() += delta;
            max_change = std::max(max_change, std::abs(delta));
        }

        if (max_change < kTolerance) break;
    }
}

} // namespace

std::vector<double> SentimentClassifier::default_candidates() {
    std::vector<double> out;
    for (int e = -8; e <= 0; ++e) {
        out.push_back(std::ldexp(1.0, e));
    }
    return out;
}

SentimentClassifier::Model SentimentClassifier::train(const Eigen::MatrixXd& X, const std::vector<int>& y,
                                                      double C, unsigned seed) {
    if (!(C > 0.0)) {
        throw std::invalid_argument("SentimentClassifier::train: C must be positive");
    }

    Model model;
    model.C = C;
    const std::set<int> labels(y.begin(), y.end());
    model.classes.assign(labels.begin(), labels.end());
    if (model.classes.size() < 2) {
        throw std::invalid_argument("SentimentClassifier::train: training labels contain a single class");
    }

    std::mt19937 rng(seed);
    const Eigen::Index n = X.rows();
    const std::size_t rows = model.classes.size() == 2 ? 1 : model.classes.size();
    model.W = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(rows), X.cols());
    model.b = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(rows));

    for (std::size_t r = 0; r < rows; ++r) {
        // Binary: the larger label is the positive class.
        const int positive = rows == 1 ? model.classes[1] : model.classes[r];
        Eigen::VectorXd target(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            target(i) = y[static_cast<std::size_t>(i)] == positive ? 1.0 : -1.0;
        }
        Eigen::VectorXd w;
        double bias = 0.0;
        solve_binary(X, target, C, rng, w, bias);
        model.W.row(static_cast<Eigen::Index>(r)) = w.transpose();
        model.b(static_cast<Eigen::Index>(r)) = bias;
    }
    return model;
}

std::vector<int> SentimentClassifier::predict_with(const Model& model, const Eigen::MatrixXd& X) {
    std::vector<int> out(static_cast<std::size_t>(X.rows()));
    if (X.rows() == 0) return out;
    if (X.cols() != model.W.cols()) {
        throw std::invalid_argument("SentimentClassifier::predict: expected " + std::to_string(model.W.cols()) +
                                    " features, got " + std::to_string(X.cols()));
    }
    const Eigen::MatrixXd scores = (X * model.W.transpose()).rowwise() + model.b.transpose();
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        if (model.W.rows() == 1) {
            out[static_cast<std::size_t>(i)] = scores(i, 0) > 0.0 ? model.classes[1] : model.classes[0];
        } else {
            Eigen::Index best = 0;
            scores.row(i).maxCoeff(&best);
            out[static_cast<std::size_t>(i)] = model.classes[static_cast<std::size_t>(best)];
        }
    }
    return out;
}

double SentimentClassifier::accuracy(const Model& model, const Eigen::MatrixXd& X, const std::vector<int>& y) {
    const auto guesses = predict_with(model, X);
    std::size_t correct = 0;
    for (std::size_t i = 0; i < guesses.size(); ++i) {
        if (guesses[i] == y[i]) ++correct;
    }
    return guesses.empty() ? 0.0 : static_cast<double>(correct) / static_cast<double>(guesses.size());
}

double SentimentClassifier::fit(const FeatureMatrix& train_X, const std::vector<int>& train_y,
                                const FeatureMatrix& test_X, const std::vector<int>& test_y,
                                const std::vector<double>& candidates, unsigned seed) {
    if (candidates.empty()) {
        throw std::invalid_argument("SentimentClassifier::fit: candidate set is empty");
    }
    if (train_X.empty() || train_X.size() != train_y.size()) {
        throw std::invalid_argument("SentimentClassifier::fit: training features and labels must be non-empty and aligned");
    }
    if (test_X.size() != test_y.size()) {
        throw std::invalid_argument("SentimentClassifier::fit: test features and labels must be aligned");
    }

    const Eigen::MatrixXd Xtr = to_matrix(train_X, "SentimentClassifier::fit");
    const Eigen::MatrixXd Xte = to_matrix(test_X, "SentimentClassifier::fit");

    std::size_t best = 0;
    double best_score = -1.0;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const Model candidate = train(Xtr, train_y, candidates[i], seed + static_cast<unsigned>(i));
        const double score = accuracy(candidate, Xte, test_y);
        std::cout << "[Classifier] C=" << candidates[i] << " accuracy=" << score * 100.0 << "%" << std::endl;
        if (score > best_score) {
            best_score = score;
            best = i;
        }
    }

    model_ = train(Xtr, train_y, candidates[best], seed + static_cast<unsigned>(candidates.size()));
    const double score = accuracy(*model_, Xte, test_y) * 100.0;
    std::cout << "[Classifier] Selected C=" << candidates[best] << ", test accuracy " << score << "%" << std::endl;
    return score;
}

std::optional<std::vector<int>> SentimentClassifier::predict(const FeatureMatrix& X) const {
    if (!model_) {
        return std::nullopt;
    }
    return predict_with(*model_, to_matrix(X, "SentimentClassifier::predict"));
}

std::optional<int> SentimentClassifier::predict_one(const std::vector<float>& x) const {
    if (!model_) {
        return std::nullopt;
    }
    return predict_with(*model_, to_matrix({x}, "SentimentClassifier::predict_one")).front();
}

std::vector<std::size_t> SentimentClassifier::top_k_salient_dimensions(std::size_t k) const {
    if (!model_) {
        throw std::invalid_argument("SentimentClassifier::top_k_salient_dimensions: classifier is not fitted");
    }
    const auto d = static_cast<std::size_t>(model_->W.cols());
    if (k < 1 || k > d) {
        throw std::invalid_argument("SentimentClassifier::top_k_salient_dimensions: k=" + std::to_string(k) +
                                    " outside [1, " + std::to_string(d) + "]");
    }

    const Eigen::RowVectorXd norms = model_->W.cwiseAbs().colwise().sum();
    auto before = [&norms](std::size_t a, std::size_t b) {
        const double na = norms(static_cast<Eigen::Index>(a));
        const double nb = norms(static_cast<Eigen::Index>(b));
        return na != nb ? na > nb : a < b;
    };

    if (k == 1) {
        std::size_t best = 0;
        for (std::size_t j = 1; j < d; ++j) {
            if (before(j, best)) best = j;
        }
        return {best};
    }

    std::vector<std::size_t> order(d);
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (static_cast<double>(k) >= std::log(static_cast<double>(d))) {
        std::sort(order.begin(), order.end(), before);
    } else {
        std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(), before);
    }
    order.resize(k);
    return order;
}

double SentimentClassifier::regularization() const {
    if (!model_) throw std::logic_error("SentimentClassifier::regularization: classifier is not fitted");
    return model_->C;
}

const Eigen::MatrixXd& SentimentClassifier::weights() const {
    if (!model_) throw std::logic_error("SentimentClassifier::weights: classifier is not fitted");
    return model_->W;
}

const std::vector<int>& SentimentClassifier::classes() const {
    if (!model_) throw std::logic_error("SentimentClassifier::classes: classifier is not fitted");
    return model_->classes;
}

} // namespace sentneuron
