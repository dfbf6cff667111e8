#include "pipeline.h"

#include <stdexcept>
#include <string>
#include <utility>

#include "errors.h"
#include "ids.h"
#include "insights/insight_agent.h"
#include "obs/context.h"
#include "obs/error_codes.h"
#include "obs/logging.h"
#include "obs/metrics.h"
#include "profiler.h"
#include "routing_agent.h"
#include "strategies/analysis_strategy.h"

namespace datalens {

namespace {

void Checkpoint(const std::atomic<bool>* cancel, const char* stage) {
    if (cancel && cancel->load()) {
        obs::LogEvent(obs::LogLevel::Warn, "analysis_cancelled", "pipeline",
                      {{"stage", stage}, {"error_code", obs::kErrCancelled}});
        throw AnalysisCancelledError(std::string("Analysis cancelled before ") + stage);
    }
}

void RequireValidConfig(const AnalysisConfig& config) {
    auto errors = ValidateAnalysisConfig(config);
    if (errors.empty()) return;
    std::string msg = "Invalid analysis config:";
    for (const auto& e : errors) {
        msg += " " + e.field + ": " + e.message + ";";
    }
    throw std::invalid_argument(msg);
}

auto RunStrategy(Route route,
                 const AnalysisConfig& config,
                 const Dataset& dataset,
                 const DatasetProfile& profile) -> AnalysisSummary {
    auto strategy = MakeStrategy(route, config);
    return strategy->Analyze(dataset, profile);
}

} // namespace

auto Analyze(const AnalysisRequest& request,
             const AnalysisConfig& config,
             std::shared_ptr<ITextGenerator> generator,
             const std::atomic<bool>* cancel,
             std::shared_ptr<GenerationWorkers> workers) -> AnalysisRun {
    RequireValidConfig(config);
    if (!request.dataset) {
        throw std::invalid_argument("Request carries no dataset");
    }

    AnalysisRun run;
    run.run_id = GenerateUuid();
    run.dataset_name = request.dataset_name;
    run.dataset = request.dataset;

    obs::Context ctx = obs::HasContext() ? obs::GetContext() : obs::Context{};
    ctx.run_id = run.run_id;
    ctx.dataset_name = run.dataset_name;
    obs::ScopedContext scoped(ctx);

    obs::ScopedTimer timer("analysis_run", "pipeline");
    obs::LogEvent(obs::LogLevel::Info, "analysis_start", "pipeline",
                  {{"rows", run.dataset->RowCount()}, {"columns", run.dataset->ColumnCount()}});

    Checkpoint(cancel, "profiling");
    run.profile = ProfileDataset(*run.dataset);

    Checkpoint(cancel, "routing");
    RoutingAgent router(config.routing);
    run.decision = router.Decide(run.profile);
    run.executed_route = run.decision.route;

    Checkpoint(cancel, "analysis");
    try {
        run.summary = RunStrategy(run.decision.route, config, *run.dataset, run.profile);
    } catch (const InsufficientDataError& e) {
        if (run.decision.route != Route::Ml) throw;
        obs::LogEvent(obs::LogLevel::Warn, "analysis_fallback", "pipeline",
                      {{"from", "ml"}, {"to", "eda"}, {"error_code", obs::kErrInsufficientData},
                       {"reason", e.what()}});
        obs::EmitCounter("analysis_fallback_total", 1, "runs", "pipeline", {{"reason", "insufficient_data"}});
        Checkpoint(cancel, "analysis");
        EdaSummary eda = std::get<EdaSummary>(RunStrategy(Route::Eda, config, *run.dataset, run.profile));
        eda.fallback_reason = e.what();
        run.summary = std::move(eda);
        run.executed_route = Route::Eda;
    }

    Checkpoint(cancel, "insights");
    {
        InsightAgent agent(std::move(generator), config.insight, std::move(workers));
        run.report = agent.Generate(run.summary, &run.profile, run.dataset.get());
    }

    Checkpoint(cancel, "report");
    run.duration_ms = timer.ElapsedMs();

    const char* route = RouteToString(run.executed_route);
    obs::EmitCounter("analysis_runs_total", 1, "runs", "pipeline", {{"route", route}});
    obs::EmitHistogram("analysis_duration_ms", run.duration_ms, "ms", "pipeline", {{"route", route}});
    timer.Stop(obs::LogLevel::Info, {{"decided_route", RouteToString(run.decision.route)},
                                     {"route", route},
                                     {"insight_source", InsightSourceToString(run.report.source)}});
    return run;
}

} // namespace datalens
