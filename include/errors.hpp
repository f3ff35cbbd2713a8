#pragma once
#include <stdexcept>
#include <string>

struct PipelineError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// empty calibration set, empty frame, bad board geometry
struct InvalidInputError : PipelineError {
    using PipelineError::PipelineError;
};

struct NotCalibratedError : PipelineError {
    using PipelineError::PipelineError;
};

struct MissingFinalStageError : PipelineError {
    using PipelineError::PipelineError;
};
