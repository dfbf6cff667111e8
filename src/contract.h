#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "types.h"

namespace datalens {

enum class Route {
    Ml,
    Eda
};

inline auto RouteToString(Route route) -> const char* {
    return route == Route::Ml ? "ml" : "eda";
}

struct DatasetProfile {
    size_t row_count = 0;
    size_t column_count = 0;
    size_t numeric_column_count = 0;
    double numeric_column_ratio = 0.0; // in [0, 1]
    std::vector<std::string> numeric_columns; // dataset column order
};

struct RoutingDecision {
    Route route = Route::Eda;
    DatasetProfile profile;
};

struct MlSummary {
    size_t original_row_count = 0;
    size_t analyzed_row_count = 0;
    size_t excluded_row_count = 0; // rows with a missing numeric cell
    std::vector<std::string> feature_columns;
    double contamination = 0.0;

    size_t outlier_count = 0;
    double outlier_percent = 0.0; // relative to original_row_count, 0-100

    int cluster_count = 0;
    std::map<std::string, size_t> cluster_distribution; // "C0".. -> members
    double silhouette_score = 0.0;
};

enum class ColumnType {
    Numeric,
    Text,
    Boolean
};

inline auto ColumnTypeToString(ColumnType type) -> const char* {
    switch (type) {
        case ColumnType::Numeric:
            return "numeric";
        case ColumnType::Text:
            return "text";
        case ColumnType::Boolean:
            return "boolean";
    }
    return "text";
}

struct NumericColumnStats {
    size_t count = 0;
    double mean = 0.0;
    double std = 0.0; // sample standard deviation
    double min = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double max = 0.0;
};

struct EdaSummary {
    size_t row_count = 0;
    size_t column_count = 0;
    size_t numeric_column_count = 0;
    size_t total_missing = 0;
    size_t duplicate_row_count = 0;
    std::map<std::string, size_t> missing_value_counts;
    std::map<std::string, ColumnType> column_type_breakdown;
    std::map<std::string, NumericColumnStats> numeric_stats;
    std::string fallback_reason; // set when EDA ran because ML could not
};

using AnalysisSummary = std::variant<MlSummary, EdaSummary>;

inline auto SummaryRoute(const AnalysisSummary& summary) -> Route {
    return std::holds_alternative<MlSummary>(summary) ? Route::Ml : Route::Eda;
}

enum class InsightSource {
    Generated,
    Fallback
};

inline auto InsightSourceToString(InsightSource source) -> const char* {
    return source == InsightSource::Generated ? "generated" : "fallback";
}

struct InsightReport {
    Route route = Route::Eda;
    std::vector<std::string> insights;
    std::string recommendation;
    InsightSource source = InsightSource::Fallback;
    std::vector<std::string> notes;
};

struct AnalysisRun {
    std::string run_id;
    std::string dataset_name;
    std::shared_ptr<const Dataset> dataset;
    DatasetProfile profile;
    RoutingDecision decision;
    Route executed_route = Route::Eda;
    AnalysisSummary summary;
    InsightReport report;
    double duration_ms = 0.0;
};

} // namespace datalens
