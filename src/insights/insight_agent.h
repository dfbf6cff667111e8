#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analysis_config.h"
#include "contract.h"
#include "insights/generation_workers.h"
#include "insights/text_generator.h"
#include "types.h"

namespace datalens {

struct ParsedCompletion {
    std::vector<std::string> insights;
    std::string recommendation;
};

auto BuildInsightPrompt(const AnalysisSummary& summary,
                        const DatasetProfile* profile,
                        const Dataset* dataset,
                        size_t preview_rows) -> std::string;

// Splits at the first case-insensitive "RECOMMENDATION:". Bullet lines
// ("-", "*", "•") before it become insights, capped at max_insights; the
// trimmed text after it is the recommendation. Either part may come back
// empty.
auto ParseCompletion(const std::string& text, size_t max_insights) -> ParsedCompletion;

// Deterministic report derived from the summary's numeric fields only.
auto BuildFallbackReport(const AnalysisSummary& summary, const DatasetProfile* profile) -> InsightReport;

// Notes for the report about data the analysis left out.
auto BuildPolicyNotes(const AnalysisSummary& summary) -> std::vector<std::string>;

class InsightAgent {
public:
    // Generator calls run on `workers`. Without one the agent keeps its own,
    // and its destructor waits for any call still running.
    InsightAgent(std::shared_ptr<ITextGenerator> generator,
                 InsightConfig config,
                 std::shared_ptr<GenerationWorkers> workers = nullptr);

    // Never throws because of the generator: failures, exceptions and
    // timeouts produce the fallback report.
    [[nodiscard]] auto Generate(const AnalysisSummary& summary,
                                const DatasetProfile* profile = nullptr,
                                const Dataset* dataset = nullptr) const -> InsightReport;

private:
    auto CallWithDeadline(const std::string& prompt) const -> std::string;

    std::shared_ptr<ITextGenerator> generator_;
    InsightConfig config_;
    std::shared_ptr<GenerationWorkers> workers_;
};

} // namespace datalens
