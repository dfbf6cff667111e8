#pragma once

#include <cstddef>
#include <vector>

namespace datalens::linalg {

using Vector = std::vector<double>;

// Dense row-major matrix; one row per sample.
struct Matrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> data;

    Matrix() = default;
    Matrix(size_t r, size_t c);

    auto operator()(size_t r, size_t c) -> double&;
    auto operator()(size_t r, size_t c) const -> double;

    auto row(size_t r) -> double* { return data.data() + r * cols; }
    [[nodiscard]] auto row(size_t r) const -> const double* { return data.data() + r * cols; }
};

auto dot(const Vector& a, const Vector& b) -> double;
auto l2_norm(const Vector& v) -> double;

auto squared_distance(const double* a, const double* b, size_t n) -> double;
auto euclidean_distance(const double* a, const double* b, size_t n) -> double;

auto column_means(const Matrix& m) -> Vector;

// Indices ordered by value; equal values keep index order.
auto argsort_desc(const Vector& v) -> std::vector<size_t>;

} // namespace datalens::linalg
