#include "strategies/eda_strategy.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "obs/logging.h"
#include "profiler.h"

namespace datalens {

auto Quantile(const std::vector<double>& sorted, double q) -> double {
    if (sorted.empty()) {
        throw std::invalid_argument("Quantile requires non-empty input");
    }
    double pos = q * static_cast<double>(sorted.size() - 1);
    auto lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

auto DescribeNumeric(std::vector<double> values) -> NumericColumnStats {
    if (values.empty()) {
        throw std::invalid_argument("DescribeNumeric requires non-empty input");
    }
    std::sort(values.begin(), values.end());

    NumericColumnStats s;
    s.count = values.size();
    double sum = 0.0;
    for (double v : values) sum += v;
    s.mean = sum / static_cast<double>(s.count);
    if (s.count > 1) {
        double ss = 0.0;
        for (double v : values) ss += (v - s.mean) * (v - s.mean);
        s.std = std::sqrt(ss / static_cast<double>(s.count - 1));
    }
    s.min = values.front();
    s.max = values.back();
    s.p25 = Quantile(values, 0.25);
    s.p50 = Quantile(values, 0.50);
    s.p75 = Quantile(values, 0.75);
    return s;
}

auto CountDuplicateRows(const Dataset& dataset) -> size_t {
    std::unordered_set<std::string> seen;
    seen.reserve(dataset.RowCount());
    size_t duplicates = 0;
    for (const auto& row : dataset.rows) {
        std::string key;
        for (const auto& cell : row) {
            key += cell.ToKey();
            key += '\x1f';
        }
        if (!seen.insert(std::move(key)).second) {
            duplicates++;
        }
    }
    return duplicates;
}

auto EdaStrategy::Analyze(const Dataset& dataset, const DatasetProfile& profile) const -> AnalysisSummary {
    return RunEda(dataset, profile);
}

auto EdaStrategy::RunEda(const Dataset& dataset, const DatasetProfile& profile) const -> EdaSummary {
    obs::ScopedTimer timer("eda_strategy", "eda_strategy");

    EdaSummary summary;
    summary.row_count = dataset.RowCount();
    summary.column_count = dataset.ColumnCount();
    summary.numeric_column_count = profile.numeric_column_count;

    for (size_t c = 0; c < dataset.ColumnCount(); ++c) {
        const std::string& name = dataset.columns[c];
        size_t missing = 0;
        std::vector<double> numbers;
        for (const auto& row : dataset.rows) {
            const Value& v = row[c];
            if (v.IsMissing()) {
                missing++;
                continue;
            }
            if (auto n = v.TryNumber()) {
                numbers.push_back(*n);
            }
        }
        summary.missing_value_counts[name] = missing;
        summary.total_missing += missing;

        ColumnType type = InferColumnType(dataset, c);
        summary.column_type_breakdown[name] = type;
        if (type == ColumnType::Numeric) {
            summary.numeric_stats[name] = DescribeNumeric(std::move(numbers));
        }
    }

    summary.duplicate_row_count = CountDuplicateRows(dataset);

    timer.Stop(obs::LogLevel::Info, {{"rows", summary.row_count},
                                     {"columns", summary.column_count},
                                     {"total_missing", summary.total_missing},
                                     {"duplicate_rows", summary.duplicate_row_count}});
    return summary;
}

} // namespace datalens
