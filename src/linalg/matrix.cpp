#include "linalg/matrix.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace datalens::linalg {

Matrix::Matrix(size_t r, size_t c) : rows(r), cols(c), data(r * c, 0.0) {}

auto Matrix::operator()(size_t r, size_t c) -> double& {
    return data[r * cols + c];
}

auto Matrix::operator()(size_t r, size_t c) const -> double {
    return data[r * cols + c];
}

auto dot(const Vector& a, const Vector& b) -> double {
    if (a.size() != b.size()) {
        throw std::runtime_error("dot dimension mismatch");
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

auto l2_norm(const Vector& v) -> double {
    return std::sqrt(dot(v, v));
}

auto squared_distance(const double* a, const double* b, size_t n) -> double {
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

auto euclidean_distance(const double* a, const double* b, size_t n) -> double {
    return std::sqrt(squared_distance(a, b, n));
}

auto column_means(const Matrix& m) -> Vector {
    Vector means(m.cols, 0.0);
    if (m.rows == 0) {
        return means;
    }
    for (size_t r = 0; r < m.rows; ++r) {
        const double* x = m.row(r);
        for (size_t c = 0; c < m.cols; ++c) {
            means[c] += x[c];
        }
    }
    for (double& v : means) {
        v /= static_cast<double>(m.rows);
    }
    return means;
}

auto argsort_desc(const Vector& v) -> std::vector<size_t> {
    std::vector<size_t> idx(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        idx[i] = i;
    }
    std::sort(idx.begin(), idx.end(), [&v](size_t a, size_t b) {
        if (v[a] == v[b]) {
            return a < b;
        }
        return v[a] > v[b];
    });
    return idx;
}

} // namespace datalens::linalg
