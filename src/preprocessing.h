#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "linalg/matrix.h"
#include "types.h"

namespace datalens::ml {

// Numeric sub-table of a dataset. Rows with any missing or non-numeric cell
// in the selected columns are left out and counted.
struct NumericTable {
    std::vector<std::string> columns;
    linalg::Matrix values;
    std::vector<size_t> source_rows; // dataset row of each matrix row
    size_t excluded_rows = 0;
};

auto ExtractNumericTable(const Dataset& dataset, const std::vector<std::string>& columns) -> NumericTable;

// Zero mean, unit (population) variance per column. Constant columns keep
// scale 1 so they standardize to zero.
class StandardScaler {
public:
    void Fit(const linalg::Matrix& x);
    [[nodiscard]] auto Transform(const linalg::Matrix& x) const -> linalg::Matrix;
    auto FitTransform(const linalg::Matrix& x) -> linalg::Matrix;

    [[nodiscard]] auto mean() const -> const linalg::Vector& { return mean_; }
    [[nodiscard]] auto scale() const -> const linalg::Vector& { return scale_; }

private:
    linalg::Vector mean_;
    linalg::Vector scale_;
};

} // namespace datalens::ml
