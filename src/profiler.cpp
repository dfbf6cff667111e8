#include "profiler.h"

#include "errors.h"

namespace datalens {

auto IsNumericColumn(const Dataset& dataset, size_t column) -> bool {
    size_t present = 0;
    for (const auto& row : dataset.rows) {
        const Value& v = row[column];
        if (v.IsMissing()) continue;
        if (!v.TryNumber()) return false;
        present++;
    }
    return present > 0;
}

auto InferColumnType(const Dataset& dataset, size_t column) -> ColumnType {
    if (IsNumericColumn(dataset, column)) return ColumnType::Numeric;

    size_t present = 0;
    for (const auto& row : dataset.rows) {
        const Value& v = row[column];
        if (v.IsMissing()) continue;
        if (v.kind() != ValueKind::Bool) return ColumnType::Text;
        present++;
    }
    return present > 0 ? ColumnType::Boolean : ColumnType::Text;
}

auto ProfileDataset(const Dataset& dataset) -> DatasetProfile {
    if (dataset.RowCount() == 0) {
        throw EmptyDatasetError("Dataset has no rows");
    }
    if (dataset.ColumnCount() == 0) {
        throw EmptyDatasetError("Dataset has no columns");
    }

    DatasetProfile profile;
    profile.row_count = dataset.RowCount();
    profile.column_count = dataset.ColumnCount();
    for (size_t c = 0; c < dataset.ColumnCount(); ++c) {
        if (IsNumericColumn(dataset, c)) {
            profile.numeric_columns.push_back(dataset.columns[c]);
        }
    }
    profile.numeric_column_count = profile.numeric_columns.size();
    profile.numeric_column_ratio =
        static_cast<double>(profile.numeric_column_count) / static_cast<double>(profile.column_count);
    return profile;
}

} // namespace datalens
