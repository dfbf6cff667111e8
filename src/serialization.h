#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "contract.h"
#include "types.h"

namespace datalens {

class MissingFieldError : public std::invalid_argument {
public:
    explicit MissingFieldError(const std::string& field)
        : std::invalid_argument("Missing required field: " + field) {}
};

// Accepts dataset_name/row_count_hint/rows/requester_identity and the
// legacy nome_arquivo/total_de_linhas/dados_completos/user_email aliases.
// A request without rows throws MissingFieldError.
auto ParseAnalysisRequest(const nlohmann::json& body) -> AnalysisRequest;

auto ProfileToJson(const DatasetProfile& profile) -> nlohmann::json;
auto MlSummaryToJson(const MlSummary& summary) -> nlohmann::json;
auto EdaSummaryToJson(const EdaSummary& summary) -> nlohmann::json;

// Variant-tagged: {"type": "ml" | "eda", ...}.
auto SummaryToJson(const AnalysisSummary& summary) -> nlohmann::json;

auto ReportToJson(const InsightReport& report) -> nlohmann::json;

// run_id, route, summary, insights, recommendation plus profile and
// report metadata.
auto RunToResponseJson(const AnalysisRun& run) -> nlohmann::json;

} // namespace datalens
