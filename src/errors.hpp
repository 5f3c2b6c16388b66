#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Pipeline error taxonomy
//
// ConfigurationError and SchemaError are fatal and propagate to the caller.
// InsufficientDataError and TrainingFailure are per-fold: the walk-forward
// runner catches them at the fold boundary and records a skip.
// ---------------------------------------------------------------------------
struct ConfigurationError : std::invalid_argument {
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

struct SchemaError : std::runtime_error {
    explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

struct InsufficientDataError : std::runtime_error {
    explicit InsufficientDataError(const std::string& what) : std::runtime_error(what) {}
};

struct TrainingFailure : std::runtime_error {
    explicit TrainingFailure(const std::string& what) : std::runtime_error(what) {}
};
