#include "serialization.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>

#include "dataset.h"
#include "obs/logging.h"

namespace datalens {

namespace {

auto FirstPresent(const nlohmann::json& body, const char* primary, const char* alias) -> const nlohmann::json* {
    if (body.contains(primary)) return &body.at(primary);
    if (body.contains(alias)) return &body.at(alias);
    return nullptr;
}

} // namespace

auto ParseAnalysisRequest(const nlohmann::json& body) -> AnalysisRequest {
    if (!body.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }

    AnalysisRequest req;
    if (const auto* name = FirstPresent(body, "dataset_name", "nome_arquivo"); name && !name->is_null()) {
        req.dataset_name = name->get<std::string>();
    }
    if (const auto* hint = FirstPresent(body, "row_count_hint", "total_de_linhas"); hint && !hint->is_null()) {
        if (!hint->is_number_integer()) {
            throw std::invalid_argument("row_count_hint must be an integer");
        }
        if (hint->is_number_unsigned()) {
            req.row_count_hint = static_cast<long>(
                std::min<uint64_t>(hint->get<uint64_t>(), static_cast<uint64_t>(std::numeric_limits<long>::max())));
        } else {
            req.row_count_hint = hint->get<long>();
        }
    }
    if (const auto* who = FirstPresent(body, "requester_identity", "user_email"); who && !who->is_null()) {
        req.requester_identity = who->get<std::string>();
    }

    const auto* rows = FirstPresent(body, "rows", "dados_completos");
    if (!rows) {
        throw MissingFieldError("rows");
    }
    req.dataset = std::make_shared<const Dataset>(DatasetFromJsonRows(*rows));

    if (req.row_count_hint > 0 && static_cast<size_t>(req.row_count_hint) != req.dataset->RowCount()) {
        obs::LogEvent(obs::LogLevel::Warn, "row_count_hint_mismatch", "serialization",
                      {{"row_count_hint", req.row_count_hint}, {"row_count", req.dataset->RowCount()}});
    }
    return req;
}

auto ProfileToJson(const DatasetProfile& profile) -> nlohmann::json {
    nlohmann::json j;
    j["row_count"] = profile.row_count;
    j["column_count"] = profile.column_count;
    j["numeric_column_count"] = profile.numeric_column_count;
    j["numeric_column_ratio"] = profile.numeric_column_ratio;
    j["numeric_columns"] = profile.numeric_columns;
    return j;
}

auto MlSummaryToJson(const MlSummary& summary) -> nlohmann::json {
    nlohmann::json j;
    j["type"] = "ml";
    j["original_row_count"] = summary.original_row_count;
    j["analyzed_row_count"] = summary.analyzed_row_count;
    j["excluded_row_count"] = summary.excluded_row_count;
    j["feature_columns"] = summary.feature_columns;
    j["contamination"] = summary.contamination;
    j["outlier_count"] = summary.outlier_count;
    j["outlier_percent"] = summary.outlier_percent;
    j["cluster_count"] = summary.cluster_count;
    j["cluster_distribution"] = summary.cluster_distribution;
    j["silhouette_score"] = summary.silhouette_score;
    return j;
}

auto EdaSummaryToJson(const EdaSummary& summary) -> nlohmann::json {
    nlohmann::json j;
    j["type"] = "eda";
    j["row_count"] = summary.row_count;
    j["column_count"] = summary.column_count;
    j["numeric_column_count"] = summary.numeric_column_count;
    j["total_missing"] = summary.total_missing;
    j["duplicate_row_count"] = summary.duplicate_row_count;
    j["missing_value_counts"] = summary.missing_value_counts;

    nlohmann::json types = nlohmann::json::object();
    for (const auto& kv : summary.column_type_breakdown) {
        types[kv.first] = ColumnTypeToString(kv.second);
    }
    j["column_type_breakdown"] = types;

    nlohmann::json stats = nlohmann::json::object();
    for (const auto& kv : summary.numeric_stats) {
        const auto& s = kv.second;
        stats[kv.first] = {{"count", s.count}, {"mean", s.mean}, {"std", s.std},
                           {"min", s.min},     {"25%", s.p25},   {"50%", s.p50},
                           {"75%", s.p75},     {"max", s.max}};
    }
    j["numeric_stats"] = stats;
    if (!summary.fallback_reason.empty()) {
        j["fallback_reason"] = summary.fallback_reason;
    }
    return j;
}

auto SummaryToJson(const AnalysisSummary& summary) -> nlohmann::json {
    if (const auto* ml = std::get_if<MlSummary>(&summary)) {
        return MlSummaryToJson(*ml);
    }
    return EdaSummaryToJson(std::get<EdaSummary>(summary));
}

auto ReportToJson(const InsightReport& report) -> nlohmann::json {
    nlohmann::json j;
    j["route"] = RouteToString(report.route);
    j["insights"] = report.insights;
    j["recommendation"] = report.recommendation;
    j["source"] = InsightSourceToString(report.source);
    j["notes"] = report.notes;
    return j;
}

auto RunToResponseJson(const AnalysisRun& run) -> nlohmann::json {
    nlohmann::json j;
    j["run_id"] = run.run_id;
    j["dataset_name"] = run.dataset_name;
    j["route"] = RouteToString(run.executed_route);
    j["decided_route"] = RouteToString(run.decision.route);
    j["profile"] = ProfileToJson(run.profile);
    j["summary"] = SummaryToJson(run.summary);
    j["insights"] = run.report.insights;
    j["recommendation"] = run.report.recommendation;
    j["insight_source"] = InsightSourceToString(run.report.source);
    j["notes"] = run.report.notes;
    j["duration_ms"] = run.duration_ms;
    return j;
}

} // namespace datalens
