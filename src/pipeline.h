#pragma once

#include <atomic>
#include <memory>

#include "analysis_config.h"
#include "contract.h"
#include "insights/generation_workers.h"
#include "insights/text_generator.h"
#include "types.h"

namespace datalens {

// Profile -> route -> strategy -> insights for one request, on the calling
// thread.
//
// Throws:
//   std::invalid_argument   config fails ValidateAnalysisConfig or the
//                           request carries no dataset
//   EmptyDatasetError       no rows or no columns
//   AnalysisCancelledError  `cancel` was raised at a stage boundary
//
// InsufficientDataError from the ML strategy is recovered by running EDA
// and recording the reason in the summary. Generator failures never escape.
// Generator calls that outlive their deadline stay on `workers`; without one
// the run waits for such a call before returning.
auto Analyze(const AnalysisRequest& request,
             const AnalysisConfig& config,
             std::shared_ptr<ITextGenerator> generator,
             const std::atomic<bool>* cancel = nullptr,
             std::shared_ptr<GenerationWorkers> workers = nullptr) -> AnalysisRun;

} // namespace datalens
