#include "insights/insight_agent.h"

#include <algorithm>
#include <cctype>
#include <future>
#include <sstream>
#include <utility>

#include <fmt/format.h>

#include "dataset.h"
#include "errors.h"
#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "serialization.h"

namespace datalens {

namespace {

auto Trim(const std::string& s) -> std::string {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

auto ToUpper(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Returns the bullet text, or an empty string when `line` is not a bullet.
auto StripBullet(const std::string& line) -> std::string {
    static const char* const kBullets[] = {"-", "*", "\xE2\x80\xA2"};
    std::string t = Trim(line);
    for (const char* bullet : kBullets) {
        std::string b(bullet);
        if (t.compare(0, b.size(), b) == 0) {
            std::string rest = t.substr(b.size());
            while (!rest.empty() && (rest[0] == '-' || rest[0] == '*' || std::isspace(static_cast<unsigned char>(rest[0])))) {
                rest.erase(0, 1);
            }
            return Trim(rest);
        }
    }
    return {};
}

auto LargestCluster(const MlSummary& ml) -> std::pair<std::string, size_t> {
    std::pair<std::string, size_t> best{"", 0};
    for (const auto& kv : ml.cluster_distribution) {
        if (best.first.empty() || kv.second > best.second) {
            best = kv;
        }
    }
    return best;
}

auto MlFallback(const MlSummary& ml) -> InsightReport {
    InsightReport report;
    report.route = Route::Ml;
    report.insights.push_back(fmt::format("Dataset has {:.2f}% outliers ({} of {} rows flagged as anomalous).",
                                          ml.outlier_percent, ml.outlier_count, ml.original_row_count));
    auto largest = LargestCluster(ml);
    report.insights.push_back(fmt::format("Identified {} groups; the largest group {} holds {} of {} analyzed rows.",
                                          ml.cluster_count, largest.first, largest.second, ml.analyzed_row_count));
    report.insights.push_back(fmt::format("Clustering used {} numeric features (silhouette score {:.2f}).",
                                          ml.feature_columns.size(), ml.silhouette_score));
    if (ml.excluded_row_count > 0) {
        report.insights.push_back(fmt::format("{} rows with missing numeric values were excluded from the ML analysis.",
                                              ml.excluded_row_count));
    }

    if (ml.outlier_percent > ml.contamination * 100.0 + 1e-9) {
        report.recommendation = "Review the flagged outlier rows before using this data for modeling.";
    } else {
        report.recommendation = fmt::format(
            "Profile the {} identified groups separately and investigate the flagged outliers.", ml.cluster_count);
    }
    return report;
}

auto EdaFallback(const EdaSummary& eda) -> InsightReport {
    InsightReport report;
    report.route = Route::Eda;
    report.insights.push_back(fmt::format("Dataset has {} rows and {} columns, {} of them numeric.",
                                          eda.row_count, eda.column_count, eda.numeric_column_count));

    size_t columns_with_missing = 0;
    for (const auto& kv : eda.missing_value_counts) {
        if (kv.second > 0) columns_with_missing++;
    }
    if (eda.total_missing > 0) {
        report.insights.push_back(fmt::format("Found {} missing values across {} columns.",
                                              eda.total_missing, columns_with_missing));
    } else {
        report.insights.push_back("No missing values were found.");
    }

    if (eda.duplicate_row_count > 0) {
        report.insights.push_back(fmt::format("Found {} duplicate rows.", eda.duplicate_row_count));
    } else {
        report.insights.push_back("No duplicate rows were found.");
    }

    if (eda.total_missing > 0 && eda.duplicate_row_count > 0) {
        report.recommendation = "Handle missing values and remove duplicate rows before further analysis.";
    } else if (eda.total_missing > 0) {
        report.recommendation = "Handle missing values before further analysis.";
    } else if (eda.duplicate_row_count > 0) {
        report.recommendation = "Remove duplicate rows before further analysis.";
    } else {
        report.recommendation = "The data is complete; proceed with deeper analysis of the numeric columns.";
    }
    return report;
}

} // namespace

auto BuildInsightPrompt(const AnalysisSummary& summary,
                        const DatasetProfile* profile,
                        const Dataset* dataset,
                        size_t preview_rows) -> std::string {
    std::ostringstream oss;
    oss << "Analysis: " << ToUpper(RouteToString(SummaryRoute(summary))) << "\n";
    if (profile) {
        oss << "Profile: " << ProfileToJson(*profile).dump() << "\n";
    }
    oss << "Results: " << SummaryToJson(summary).dump() << "\n";
    if (dataset && preview_rows > 0) {
        nlohmann::json preview = nlohmann::json::array();
        size_t n = std::min(preview_rows, dataset->RowCount());
        for (size_t r = 0; r < n; ++r) {
            nlohmann::json row = nlohmann::json::object();
            for (size_t c = 0; c < dataset->ColumnCount(); ++c) {
                row[dataset->columns[c]] = ValueToJson(dataset->rows[r][c]);
            }
            preview.push_back(row);
        }
        oss << "Preview: " << preview.dump() << "\n";
    }
    oss << "\nProduce:\n"
        << "INSIGHTS:\n"
        << "- insight 1\n"
        << "- insight 2\n"
        << "\n"
        << "RECOMMENDATION:\n"
        << "text\n";
    return oss.str();
}

auto ParseCompletion(const std::string& text, size_t max_insights) -> ParsedCompletion {
    static const std::string kRecommendation = "RECOMMENDATION:";
    static const std::string kInsights = "INSIGHTS:";

    std::string upper = ToUpper(text);
    size_t split = upper.find(kRecommendation);
    std::string head = split == std::string::npos ? text : text.substr(0, split);
    std::string tail = split == std::string::npos ? "" : text.substr(split + kRecommendation.size());

    size_t marker = ToUpper(head).find(kInsights);
    if (marker != std::string::npos) {
        head.erase(marker, kInsights.size());
    }

    ParsedCompletion parsed;
    std::istringstream lines(head);
    std::string line;
    while (std::getline(lines, line) && parsed.insights.size() < max_insights) {
        std::string item = StripBullet(line);
        if (!item.empty()) {
            parsed.insights.push_back(item);
        }
    }
    parsed.recommendation = Trim(tail);
    return parsed;
}

auto BuildPolicyNotes(const AnalysisSummary& summary) -> std::vector<std::string> {
    std::vector<std::string> notes;
    if (const auto* ml = std::get_if<MlSummary>(&summary)) {
        if (ml->excluded_row_count > 0) {
            notes.push_back(fmt::format("{} of {} rows had a missing numeric value and were excluded from the ML analysis.",
                                        ml->excluded_row_count, ml->original_row_count));
        }
    } else {
        const auto& eda = std::get<EdaSummary>(summary);
        if (!eda.fallback_reason.empty()) {
            notes.push_back("ML analysis was not possible, exploratory analysis was used instead: " + eda.fallback_reason);
        }
    }
    return notes;
}

auto BuildFallbackReport(const AnalysisSummary& summary, const DatasetProfile* /*profile*/) -> InsightReport {
    InsightReport report;
    if (const auto* ml = std::get_if<MlSummary>(&summary)) {
        report = MlFallback(*ml);
    } else {
        report = EdaFallback(std::get<EdaSummary>(summary));
    }
    report.source = InsightSource::Fallback;
    report.notes = BuildPolicyNotes(summary);
    return report;
}

InsightAgent::InsightAgent(std::shared_ptr<ITextGenerator> generator,
                           InsightConfig config,
                           std::shared_ptr<GenerationWorkers> workers)
    : generator_(std::move(generator)),
      config_(config),
      workers_(workers ? std::move(workers) : std::make_shared<GenerationWorkers>()) {}

auto InsightAgent::CallWithDeadline(const std::string& prompt) const -> std::string {
    if (!generator_) {
        throw GenerationFailure("No text generator");
    }
    // The worker owns its own references so it can outlive an abandoned wait.
    auto generator = generator_;
    auto timeout = config_.timeout;
    std::future<std::string> result =
        workers_->Submit([generator, prompt, timeout]() { return generator->Generate(prompt, timeout); });

    if (result.wait_for(timeout) != std::future_status::ready) {
        throw GenerationTimeoutError("Text generation exceeded " + std::to_string(timeout.count()) + " ms");
    }
    return result.get();
}

auto InsightAgent::Generate(const AnalysisSummary& summary,
                            const DatasetProfile* profile,
                            const Dataset* dataset) const -> InsightReport {
    obs::ScopedTimer timer("insight_generation", "insight_agent");
    InsightReport fallback = BuildFallbackReport(summary, profile);

    std::string reason;
    std::string code;
    try {
        std::string prompt = BuildInsightPrompt(summary, profile, dataset, config_.preview_rows);
        ParsedCompletion parsed = ParseCompletion(CallWithDeadline(prompt), config_.max_insights);

        InsightReport report;
        report.route = SummaryRoute(summary);
        report.notes = fallback.notes;
        bool complete = !parsed.insights.empty() && !parsed.recommendation.empty();
        report.insights = parsed.insights.empty() ? fallback.insights : parsed.insights;
        report.recommendation = parsed.recommendation.empty() ? fallback.recommendation : parsed.recommendation;
        report.source = complete ? InsightSource::Generated : InsightSource::Fallback;
        if (!complete) {
            obs::EmitCounter("insight_fallback_total", 1, "reports", "insight_agent", {{"reason", "incomplete"}});
        }
        timer.Stop(obs::LogLevel::Info, {{"source", InsightSourceToString(report.source)},
                                         {"insights", report.insights.size()}});
        return report;
    } catch (const GenerationTimeoutError& e) {
        reason = e.what();
        code = obs::kErrGenerationTimeout;
    } catch (const GenerationError& e) {
        reason = e.what();
        code = obs::kErrGenerationFailed;
    } catch (const std::exception& e) {
        reason = e.what();
        code = obs::kErrGenerationFailed;
    }

    obs::EmitCounter("insight_fallback_total", 1, "reports", "insight_agent",
                     {{"reason", code == obs::kErrGenerationTimeout ? "timeout" : "failure"}});
    timer.Stop(obs::LogLevel::Warn, {{"source", "fallback"}, {"error_code", code}, {"error", reason}});
    return fallback;
}

} // namespace datalens
