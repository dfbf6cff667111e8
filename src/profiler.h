#pragma once

#include <cstddef>

#include "contract.h"
#include "types.h"

namespace datalens {

// Strict: every non-missing cell must be numeric (or numeric text), and at
// least one cell must be present.
auto IsNumericColumn(const Dataset& dataset, size_t column) -> bool;

// Numeric wins over Boolean, which needs every present cell to be a bool.
// Columns with no present cell report Text.
auto InferColumnType(const Dataset& dataset, size_t column) -> ColumnType;

// Throws EmptyDatasetError when the dataset has no rows or no columns.
auto ProfileDataset(const Dataset& dataset) -> DatasetProfile;

} // namespace datalens
