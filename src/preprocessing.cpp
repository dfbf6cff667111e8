#include "preprocessing.h"

#include <cmath>
#include <optional>
#include <stdexcept>

namespace datalens::ml {

auto ExtractNumericTable(const Dataset& dataset, const std::vector<std::string>& columns) -> NumericTable {
    std::vector<size_t> col_idx;
    col_idx.reserve(columns.size());
    for (const auto& name : columns) {
        auto idx = dataset.ColumnIndex(name);
        if (!idx) {
            throw std::invalid_argument("Unknown column: " + name);
        }
        col_idx.push_back(*idx);
    }

    NumericTable table;
    table.columns = columns;
    std::vector<double> flat;
    flat.reserve(dataset.RowCount() * columns.size());
    std::vector<double> cells(columns.size(), 0.0);

    for (size_t r = 0; r < dataset.RowCount(); ++r) {
        bool complete = true;
        for (size_t c = 0; c < col_idx.size(); ++c) {
            std::optional<double> v = dataset.rows[r][col_idx[c]].TryNumber();
            if (!v) {
                complete = false;
                break;
            }
            cells[c] = *v;
        }
        if (!complete) {
            table.excluded_rows++;
            continue;
        }
        flat.insert(flat.end(), cells.begin(), cells.end());
        table.source_rows.push_back(r);
    }

    table.values.rows = table.source_rows.size();
    table.values.cols = columns.size();
    table.values.data = std::move(flat);
    return table;
}

void StandardScaler::Fit(const linalg::Matrix& x) {
    if (x.rows == 0) {
        throw std::invalid_argument("StandardScaler requires at least one row");
    }
    mean_ = linalg::column_means(x);
    scale_.assign(x.cols, 0.0);
    for (size_t r = 0; r < x.rows; ++r) {
        const double* row = x.row(r);
        for (size_t c = 0; c < x.cols; ++c) {
            double d = row[c] - mean_[c];
            scale_[c] += d * d;
        }
    }
    for (double& s : scale_) {
        s = std::sqrt(s / static_cast<double>(x.rows));
        if (s == 0.0) s = 1.0;
    }
}

auto StandardScaler::Transform(const linalg::Matrix& x) const -> linalg::Matrix {
    if (x.cols != mean_.size()) {
        throw std::runtime_error("StandardScaler dimension mismatch");
    }
    linalg::Matrix out(x.rows, x.cols);
    for (size_t r = 0; r < x.rows; ++r) {
        for (size_t c = 0; c < x.cols; ++c) {
            out(r, c) = (x(r, c) - mean_[c]) / scale_[c];
        }
    }
    return out;
}

auto StandardScaler::FitTransform(const linalg::Matrix& x) -> linalg::Matrix {
    Fit(x);
    return Transform(x);
}

} // namespace datalens::ml
