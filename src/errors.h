#pragma once

#include <stdexcept>
#include <string>

namespace datalens {

class AnalysisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Dataset has no rows or no columns. Rejects the run.
class EmptyDatasetError : public AnalysisError {
public:
    using AnalysisError::AnalysisError;
};

// A row is not an object or carries a non-scalar cell. Rejects the run.
class MalformedRowError : public AnalysisError {
public:
    MalformedRowError(size_t row_index, const std::string& reason)
        : AnalysisError("Malformed row " + std::to_string(row_index) + ": " + reason),
          row_index_(row_index) {}

    [[nodiscard]] auto row_index() const -> size_t { return row_index_; }

private:
    size_t row_index_;
};

// Too few numeric rows for the ML strategy. Recovered by falling back to EDA.
class InsufficientDataError : public AnalysisError {
public:
    using AnalysisError::AnalysisError;
};

class AnalysisCancelledError : public AnalysisError {
public:
    using AnalysisError::AnalysisError;
};

// Text generation errors never leave the insight agent.
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class GenerationTimeoutError : public GenerationError {
public:
    using GenerationError::GenerationError;
};

class GenerationFailure : public GenerationError {
public:
    using GenerationError::GenerationError;
};

} // namespace datalens
