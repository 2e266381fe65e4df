#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <istream>
#include <limits>
#include <numeric>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace ns {

using Shape = std::vector<std::size_t>;

namespace detail {

template<std::size_t Rank>
std::size_t compute_size(const std::array<std::size_t, Rank>& shape) {
    if constexpr (Rank == 0) {
        return 1;
    } else {
        std::size_t total = 1;
        for (auto dim : shape) {
            total *= dim;
        }
        return total;
    }
}

template<std::size_t Rank>
std::array<std::size_t, Rank> compute_strides(const std::array<std::size_t, Rank>& shape) {
    std::array<std::size_t, Rank> strides{};
    if constexpr (Rank > 0) {
        strides[Rank - 1] = 1;
        for (std::size_t axis = Rank; axis-- > 0;) {
            if (axis + 1 < Rank) {
                strides[axis] = strides[axis + 1] * shape[axis + 1];
            }
        }
    }
    return strides;
}

template<std::size_t Rank>
bool has_zero_dim(const std::array<std::size_t, Rank>& shape) {
    if constexpr (Rank == 0) {
        return false;
    } else {
        for (auto dim : shape) {
            if (dim == 0) return true;
        }
        return false;
    }
}

template<std::size_t Rank, typename Func>
void for_each_index(const std::array<std::size_t, Rank>& shape, Func&& func) {
    if constexpr (Rank == 0) {
        func(std::array<std::size_t, 0>{});
        return;
    } else {
        if (has_zero_dim(shape)) return;
        std::array<std::size_t, Rank> idx{};
        while (true) {
            func(idx);
            std::size_t axis = Rank;
            while (axis > 0) {
                --axis;
                ++idx[axis];
                if (idx[axis] < shape[axis]) goto next;
                idx[axis] = 0;
            }
            break;
        next:;
        }
    }
}

template<std::size_t Rank>
std::array<std::size_t, Rank> shape_to_array(const Shape& shape) {
    if (shape.size() != Rank) {
        throw std::invalid_argument("shape_to_array: rank mismatch");
    }
    std::array<std::size_t, Rank> out{};
    for (std::size_t i = 0; i < Rank; ++i) {
        out[i] = shape[i];
    }
    return out;
}

template<std::size_t Rank>
std::array<std::size_t, Rank> shape_to_array(std::initializer_list<std::size_t> values) {
    if (values.size() != Rank) {
        throw std::invalid_argument("shape_to_array: rank mismatch");
    }
    std::array<std::size_t, Rank> out{};
    std::size_t i = 0;
    for (auto v : values) {
        out[i++] = v;
    }
    return out;
}

template<std::size_t Rank>
Shape array_to_shape(const std::array<std::size_t, Rank>& arr) {
    return Shape(arr.begin(), arr.end());
}

template<std::size_t Rank>
int normalize_axis(int axis) {
    int upper = static_cast<int>(Rank);
    if (axis < 0) axis += upper;
    if (axis < 0 || axis >= upper) {
        throw std::out_of_range("axis is out of range");
    }
    return axis;
}

template<typename T>
using RowMajorMatrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

} // namespace detail

template<typename T, std::size_t Rank>
class Tensor {
public:
    using value_type = T;
    using shape_type = std::array<std::size_t, Rank>;
    using stride_type = std::array<std::size_t, Rank>;

    Tensor() = default;

    template<typename... Dims,
             std::enable_if_t<sizeof...(Dims) == Rank &&
                              (std::is_integral_v<std::decay_t<Dims>> && ...), int> = 0>
    explicit Tensor(Dims... dims) {
        shape_type shape{ static_cast<std::size_t>(dims)... };
        init_from_shape(shape);
    }

    explicit Tensor(const shape_type& shape) {
        init_from_shape(shape);
    }

    Tensor(const shape_type& shape, const T& value) {
        init_from_shape(shape);
        std::fill(data_.begin(), data_.end(), value);
    }

    Tensor(const shape_type& shape, std::vector<T> values) {
        init_from_shape(shape);
        if (values.size() != data_.size()) {
            throw std::invalid_argument("Tensor: value count does not match shape " + shape_string());
        }
        data_ = std::move(values);
    }

    Tensor(const Tensor&) = default;
    Tensor(Tensor&&) noexcept = default;
    Tensor& operator=(const Tensor&) = default;
    Tensor& operator=(Tensor&&) noexcept = default;

    T* data() { return data_.empty() ? nullptr : data_.data(); }
    const T* data() const { return data_.empty() ? nullptr : data_.data(); }

    const std::vector<T>& values() const { return data_; }

    const shape_type& getShape() const { return shape_; }
    const stride_type& getStride() const { return stride_; }

    Shape shape() const { return detail::array_to_shape(shape_); }

    std::size_t size() const { return data_.size(); }
    std::size_t ndim() const { return Rank; }
    std::size_t dim(std::size_t axis) const { return shape_.at(axis); }

    std::string shape_string() const {
        std::ostringstream oss;
        oss << '(';
        for (std::size_t i = 0; i < Rank; ++i) {
            oss << shape_[i];
            if (i + 1 < Rank) oss << ", ";
        }
        oss << ')';
        return oss.str();
    }

    bool is_same_shape(const Tensor& other) const { return shape_ == other.shape_; }

    void fill(const T& value) {
        std::fill(data_.begin(), data_.end(), value);
    }

    template<typename... Ix>
    T& operator()(Ix... indices) {
        static_assert(sizeof...(Ix) == Rank, "Tensor: index count must match rank");
        shape_type idx{ static_cast<std::size_t>(indices)... };
        return data_[offset(idx)];
    }

    template<typename... Ix>
    const T& operator()(Ix... indices) const {
        static_assert(sizeof...(Ix) == Rank, "Tensor: index count must match rank");
        shape_type idx{ static_cast<std::size_t>(indices)... };
        return data_[offset(idx)];
    }

    T& operator[](const shape_type& idx) {
        return data_[offset(idx)];
    }

    const T& operator[](const shape_type& idx) const {
        return data_[offset(idx)];
    }

    Tensor transpose() const {
        static_assert(Rank >= 2, "transpose requires rank >= 2");
        return transpose(Rank - 2, Rank - 1);
    }

    Tensor transpose(std::size_t axis_a, std::size_t axis_b) const {
        if (axis_a >= Rank || axis_b >= Rank) {
            throw std::out_of_range("Tensor::transpose axis out of range");
        }
        if (axis_a == axis_b) return *this;

        shape_type new_shape = shape_;
        std::swap(new_shape[axis_a], new_shape[axis_b]);

        Tensor result(new_shape);
        detail::for_each_index<Rank>(shape_, [&](const auto& idx) {
            auto out_idx = idx;
            std::swap(out_idx[axis_a], out_idx[axis_b]);
            result[out_idx] = (*this)[idx];
        });
        return result;
    }

    Tensor broadcast_to(const shape_type& target) const {
        for (std::size_t axis = 0; axis < Rank; ++axis) {
            if (shape_[axis] == target[axis] || shape_[axis] == 1) continue;
            throw std::invalid_argument("Tensor::broadcast_to: incompatible dimensions");
        }
        if (shape_ == target) return *this;

        Tensor result(target);
        detail::for_each_index<Rank>(target, [&](const auto& idx) {
            shape_type src_idx = idx;
            for (std::size_t axis = 0; axis < Rank; ++axis) {
                if (shape_[axis] == 1) src_idx[axis] = 0;
            }
            result[idx] = (*this)[src_idx];
        });
        return result;
    }

    Tensor sum_to(const shape_type& target) const {
        for (std::size_t axis = 0; axis < Rank; ++axis) {
            if (target[axis] == shape_[axis] || target[axis] == 1) continue;
            throw std::invalid_argument("Tensor::sum_to: incompatible target shape");
        }
        if (shape_ == target) return *this;

        Tensor result(target);
        result.fill(T{});
        detail::for_each_index<Rank>(shape_, [&](const auto& idx) {
            auto out_idx = idx;
            for (std::size_t axis = 0; axis < Rank; ++axis) {
                if (target[axis] == 1) out_idx[axis] = 0;
            }
            result[out_idx] += (*this)[idx];
        });
        return result;
    }

    Tensor add(const Tensor& rhs) const {
        return zip(rhs, [](T a, T b) { return a + b; });
    }

    Tensor sub(const Tensor& rhs) const {
        return zip(rhs, [](T a, T b) { return a - b; });
    }

    Tensor mul(const Tensor& rhs) const {
        return zip(rhs, [](T a, T b) { return a * b; });
    }

    Tensor div(const Tensor& rhs) const {
        return zip(rhs, [](T a, T b) { return a / b; });
    }

    Tensor add(const T& scalar) const {
        return map([scalar](T v) { return v + scalar; });
    }

    Tensor sub(const T& scalar) const {
        return map([scalar](T v) { return v - scalar; });
    }

    Tensor mul(const T& scalar) const {
        return map([scalar](T v) { return v * scalar; });
    }

    Tensor div(const T& scalar) const {
        const T inv = static_cast<T>(1) / scalar;
        return map([inv](T v) { return v * inv; });
    }

    Tensor neg() const {
        return map([](T v) { return -v; });
    }

    Tensor pow(double exponent) const {
        return map([exponent](T v) {
            return static_cast<T>(std::pow(static_cast<double>(v), exponent));
        });
    }

    template<typename Func>
    Tensor map(Func&& func) const {
        Tensor out(shape_);
        const std::size_t total = size();
        const T* src = data();
        T* dst = out.data();
        for (std::size_t i = 0; i < total; ++i) {
            dst[i] = func(src[i]);
        }
        return out;
    }

    template<typename Func>
    Tensor zip(const Tensor& rhs, Func&& func) const {
        require_same_shape(rhs);
        Tensor out(shape_);
        const std::size_t total = size();
        const T* lhs_ptr = data();
        const T* rhs_ptr = rhs.data();
        T* dst = out.data();
        for (std::size_t i = 0; i < total; ++i) {
            dst[i] = func(lhs_ptr[i], rhs_ptr[i]);
        }
        return out;
    }

    Tensor& iadd(const Tensor& rhs) {
        require_same_shape(rhs);
        const std::size_t total = size();
        T* dst = data();
        const T* src = rhs.data();
        for (std::size_t i = 0; i < total; ++i) {
            dst[i] += src[i];
        }
        return *this;
    }

    Tensor& iadd(const T& scalar) {
        T* dst = data();
        const std::size_t total = size();
        for (std::size_t i = 0; i < total; ++i) {
            dst[i] += scalar;
        }
        return *this;
    }

    T sum() const {
        return std::accumulate(data_.begin(), data_.end(), T{});
    }

    // Reads size() * sizeof(T) raw bytes from [start_offset, end_offset) of `in`.
    void loadWeight(std::istream& in, std::streamoff start_offset, std::streamoff end_offset) {
        static_assert(std::is_trivially_copyable_v<T>,
                      "Tensor::loadWeight requires a trivially copyable value type");

        if (start_offset < 0 || end_offset < 0) {
            throw std::invalid_argument("Tensor::loadWeight: offsets must be non-negative");
        }
        if (end_offset < start_offset) {
            throw std::invalid_argument("Tensor::loadWeight: end_offset must be >= start_offset");
        }

        const std::size_t byte_count = size() * sizeof(T);
        const std::streamoff span = end_offset - start_offset;

        if (span != static_cast<std::streamoff>(byte_count)) {
            throw std::invalid_argument("Tensor::loadWeight: byte range and tensor size mismatch");
        }
        if (byte_count == 0) {
            return;
        }
        if (static_cast<std::uint64_t>(byte_count) >
            static_cast<std::uint64_t>(std::numeric_limits<std::streamsize>::max())) {
            throw std::overflow_error("Tensor::loadWeight: tensor byte size exceeds streamsize max");
        }

        in.clear();
        in.seekg(start_offset, std::ios::beg);
        if (!in) {
            throw std::runtime_error("Tensor::loadWeight: failed to seek to start_offset");
        }

        const auto expected = static_cast<std::streamsize>(byte_count);
        in.read(reinterpret_cast<char*>(data_.data()), expected);
        if (in.gcount() != expected || !in) {
            throw std::runtime_error("Tensor::loadWeight: failed to read expected number of bytes");
        }
    }

    void writeWeight(std::ostream& out) const {
        static_assert(std::is_trivially_copyable_v<T>,
                      "Tensor::writeWeight requires a trivially copyable value type");
        if (data_.empty()) {
            return;
        }
        out.write(reinterpret_cast<const char*>(data_.data()),
                  static_cast<std::streamsize>(data_.size() * sizeof(T)));
        if (!out) {
            throw std::runtime_error("Tensor::writeWeight: failed to write tensor bytes");
        }
    }

    Tensor matmul(const Tensor& rhs) const {
        static_assert(Rank >= 2, "Tensor::matmul requires rank >= 2");
        static_assert(std::is_floating_point_v<T>, "Tensor::matmul requires a floating point type");

        const auto& lhs_shape = shape_;
        const auto& rhs_shape = rhs.shape_;

        const std::size_t M = lhs_shape[Rank - 2];
        const std::size_t K = lhs_shape[Rank - 1];
        const std::size_t K_rhs = rhs_shape[Rank - 2];
        const std::size_t N = rhs_shape[Rank - 1];

        if (K != K_rhs) {
            throw std::invalid_argument("Tensor::matmul: inner dimensions must match " +
                                        shape_string() + " x " + rhs.shape_string());
        }

        for (std::size_t axis = 0; axis + 2 < Rank; ++axis) {
            if (lhs_shape[axis] != rhs_shape[axis]) {
                throw std::invalid_argument("Tensor::matmul: batch dimensions must align");
            }
        }

        shape_type out_shape = lhs_shape;
        out_shape[Rank - 1] = N;
        Tensor out(out_shape);

        if (M == 0 || N == 0 || K == 0 || detail::has_zero_dim(out_shape)) {
            return out;
        }

        using Matrix = detail::RowMajorMatrix<T>;
        auto run_matmul = [&](const T* A_ptr, const T* B_ptr, T* C_ptr) {
            Eigen::Map<const Matrix> A(A_ptr, static_cast<Eigen::Index>(M), static_cast<Eigen::Index>(K));
            Eigen::Map<const Matrix> B(B_ptr, static_cast<Eigen::Index>(K), static_cast<Eigen::Index>(N));
            Eigen::Map<Matrix> C(C_ptr, static_cast<Eigen::Index>(M), static_cast<Eigen::Index>(N));
            C.noalias() = A * B;
        };

        if constexpr (Rank == 2) {
            run_matmul(data(), rhs.data(), out.data());
        } else {
            std::array<std::size_t, Rank - 2> batch_shape{};
            for (std::size_t axis = 0; axis < Rank - 2; ++axis) {
                batch_shape[axis] = lhs_shape[axis];
            }

            const auto& lhs_stride = stride_;
            const auto& rhs_stride = rhs.getStride();
            const auto& out_stride = out.getStride();
            detail::for_each_index<Rank - 2>(batch_shape, [&](const auto& batch_idx) {
                std::size_t a_base = 0;
                std::size_t b_base = 0;
                std::size_t c_base = 0;
                for (std::size_t axis = 0; axis < Rank - 2; ++axis) {
                    a_base += batch_idx[axis] * lhs_stride[axis];
                    b_base += batch_idx[axis] * rhs_stride[axis];
                    c_base += batch_idx[axis] * out_stride[axis];
                }

                run_matmul(data() + a_base, rhs.data() + b_base, out.data() + c_base);
            });
        }
        return out;
    }

    Tensor operator+(const Tensor& rhs) const { return add(rhs); }
    Tensor operator-(const Tensor& rhs) const { return sub(rhs); }
    Tensor operator*(const Tensor& rhs) const { return mul(rhs); }
    Tensor operator/(const Tensor& rhs) const { return div(rhs); }

    Tensor operator+(const T& scalar) const { return add(scalar); }
    Tensor operator-(const T& scalar) const { return sub(scalar); }
    Tensor operator*(const T& scalar) const { return mul(scalar); }
    Tensor operator/(const T& scalar) const { return div(scalar); }

    Tensor operator-() const { return neg(); }

    template<typename U, std::enable_if_t<std::is_arithmetic_v<U>, int> = 0>
    friend Tensor operator*(U scalar, const Tensor& tensor) {
        return tensor.mul(static_cast<T>(scalar));
    }

    template<typename U, std::enable_if_t<std::is_arithmetic_v<U>, int> = 0>
    friend Tensor operator-(U scalar, const Tensor& tensor) {
        Tensor result = tensor.neg();
        result.iadd(static_cast<T>(scalar));
        return result;
    }

private:
    shape_type shape_{};
    stride_type stride_{};
    std::vector<T> data_{};

    void init_from_shape(const shape_type& shape) {
        shape_ = shape;
        stride_ = detail::compute_strides(shape_);
        const std::size_t total = detail::compute_size(shape_);
        data_.assign(total, T{});
    }

    std::size_t offset(const shape_type& idx) const {
        std::size_t off = 0;
        for (std::size_t axis = 0; axis < Rank; ++axis) {
            if (idx[axis] >= shape_[axis]) {
                throw std::out_of_range("Tensor: index out of range");
            }
            off += idx[axis] * stride_[axis];
        }
        return off;
    }

    void require_same_shape(const Tensor& rhs) const {
        if (!is_same_shape(rhs)) {
            throw std::invalid_argument("Tensor: shape mismatch " + shape_string() +
                                        " vs " + rhs.shape_string());
        }
    }
};

template<typename T, std::size_t Rank>
Tensor<T, Rank> sum_to(const Tensor<T, Rank>& tensor, const typename Tensor<T, Rank>::shape_type& target) {
    return tensor.sum_to(target);
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> ones_like(const Tensor<T, Rank>& tensor) {
    return Tensor<T, Rank>(tensor.getShape(), static_cast<T>(1));
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> zeros_like(const Tensor<T, Rank>& tensor) {
    return Tensor<T, Rank>(tensor.getShape());
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> exp(const Tensor<T, Rank>& tensor) {
    return tensor.map([](T v) { return static_cast<T>(std::exp(v)); });
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> tanh(const Tensor<T, Rank>& tensor) {
    return tensor.map([](T v) { return static_cast<T>(std::tanh(v)); });
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> sigmoid(const Tensor<T, Rank>& tensor) {
    // Split on sign so std::exp never overflows.
    return tensor.map([](T v) {
        if (v >= T{}) {
            return static_cast<T>(1) / (static_cast<T>(1) + std::exp(-v));
        }
        const T e = std::exp(v);
        return e / (static_cast<T>(1) + e);
    });
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> clamp(const Tensor<T, Rank>& tensor, T lo, T hi) {
    return tensor.map([lo, hi](T v) { return std::min(std::max(v, lo), hi); });
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> pow(const Tensor<T, Rank>& tensor, double exponent) {
    return tensor.pow(exponent);
}

/// a @ b^T for rank-2 tensors, without materializing the transpose.
template<typename T>
Tensor<T, 2> matmul_nt(const Tensor<T, 2>& a, const Tensor<T, 2>& b) {
    if (a.dim(1) != b.dim(1)) {
        throw std::invalid_argument("ns::matmul_nt: inner dimensions must match " +
                                    a.shape_string() + " x " + b.shape_string() + "^T");
    }
    using Matrix = detail::RowMajorMatrix<T>;
    Tensor<T, 2> out(a.dim(0), b.dim(0));
    if (out.size() == 0 || a.dim(1) == 0) return out;
    Eigen::Map<const Matrix> A(a.data(), a.dim(0), a.dim(1));
    Eigen::Map<const Matrix> B(b.data(), b.dim(0), b.dim(1));
    Eigen::Map<Matrix> C(out.data(), out.dim(0), out.dim(1));
    C.noalias() = A * B.transpose();
    return out;
}

/// a^T @ b for rank-2 tensors.
template<typename T>
Tensor<T, 2> matmul_tn(const Tensor<T, 2>& a, const Tensor<T, 2>& b) {
    if (a.dim(0) != b.dim(0)) {
        throw std::invalid_argument("ns::matmul_tn: inner dimensions must match " +
                                    a.shape_string() + "^T x " + b.shape_string());
    }
    using Matrix = detail::RowMajorMatrix<T>;
    Tensor<T, 2> out(a.dim(1), b.dim(1));
    if (out.size() == 0 || a.dim(0) == 0) return out;
    Eigen::Map<const Matrix> A(a.data(), a.dim(0), a.dim(1));
    Eigen::Map<const Matrix> B(b.data(), b.dim(0), b.dim(1));
    Eigen::Map<Matrix> C(out.data(), out.dim(0), out.dim(1));
    C.noalias() = A.transpose() * B;
    return out;
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> sum(const Tensor<T, Rank>& tensor, int axis) {
    const int ax = detail::normalize_axis<Rank>(axis);

    auto out_shape = tensor.getShape();
    out_shape[ax] = 1;

    Tensor<T, Rank> out(out_shape);
    detail::for_each_index<Rank>(tensor.getShape(), [&](const auto& idx) {
        auto out_idx = idx;
        out_idx[ax] = 0;
        out[out_idx] += tensor[idx];
    });

    return out;
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> max(const Tensor<T, Rank>& tensor, int axis) {
    const int ax = detail::normalize_axis<Rank>(axis);

    auto out_shape = tensor.getShape();
    out_shape[ax] = 1;

    Tensor<T, Rank> out(out_shape);

    const std::size_t axis_dim = tensor.getShape()[ax];
    detail::for_each_index<Rank>(out_shape, [&](const auto& base_idx) {
        auto scan_idx = base_idx;
        bool has_value = false;
        T best{};
        for (std::size_t i = 0; i < axis_dim; ++i) {
            scan_idx[ax] = i;
            const T& value = tensor[scan_idx];
            if (!has_value || value > best) {
                best = value;
                has_value = true;
            }
        }
        out[base_idx] = has_value ? best : T{};
    });

    return out;
}

/// Copies `chunk` entries of the last axis starting at `index * chunk`.
template<typename T, std::size_t Rank>
Tensor<T, Rank> split(const Tensor<T, Rank>& tensor, std::size_t index, std::size_t chunk) {
    constexpr std::size_t axis = Rank - 1;
    const auto& shape = tensor.getShape();
    const std::size_t start = index * chunk;
    if (start + chunk > shape[axis]) {
        throw std::out_of_range("ns::split: slice exceeds dimension");
    }

    auto out_shape = shape;
    out_shape[axis] = chunk;
    Tensor<T, Rank> out(out_shape);

    const std::size_t outer = tensor.size() / std::max<std::size_t>(shape[axis], 1);
    const T* src = tensor.data();
    T* dst = out.data();
    for (std::size_t row = 0; row < outer; ++row) {
        std::copy(src + row * shape[axis] + start,
                  src + row * shape[axis] + start + chunk,
                  dst + row * chunk);
    }
    return out;
}

template<typename T, std::size_t Rank>
Tensor<T, Rank> concat(const std::vector<Tensor<T, Rank>>& tensors, int axis) {
    if (tensors.empty()) {
        throw std::invalid_argument("ns::concat: tensors list must not be empty");
    }

    const int ax = detail::normalize_axis<Rank>(axis);
    auto out_shape = tensors.front().getShape();
    out_shape[ax] = 0;

    for (const auto& tensor : tensors) {
        const auto& shape = tensor.getShape();
        for (std::size_t i = 0; i < Rank; ++i) {
            if (i == static_cast<std::size_t>(ax)) continue;
            if (shape[i] != out_shape[i]) {
                throw std::invalid_argument("ns::concat: shapes must match except along the concatenation axis");
            }
        }
        out_shape[ax] += shape[ax];
    }

    Tensor<T, Rank> out(out_shape);
    std::size_t offset = 0;

    for (const auto& tensor : tensors) {
        detail::for_each_index<Rank>(tensor.getShape(), [&](const auto& idx) {
            auto out_idx = idx;
            out_idx[ax] = idx[ax] + offset;
            out[out_idx] = tensor[idx];
        });
        offset += tensor.getShape()[ax];
    }

    return out;
}

} // namespace ns
