#pragma once

#include <stdexcept>
#include <string>

namespace libdynfit {

// Base class for every precondition or reliability failure the DFI pipeline
// reports to its caller. Numeric programming errors keep the standard
// exception types (std::invalid_argument, std::out_of_range, ...).
class DynamicFitError : public std::runtime_error {
public:
    explicit DynamicFitError(const std::string& message) : std::runtime_error(message) {}
};

// Manual flag and input kind disagree, or a manual model lacks a sample size.
class InputMismatchError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

class ModelSyntaxError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

// A standardized loading or correlation with magnitude >= 1.
class InvalidParameterError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

// Fewer than two latent factors.
class UnsupportedModelError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

// Just identified (or under-identified) model.
class IdentificationError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

class InsufficientCandidatesError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

class UnsupportedEstimatorError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

// Population covariance implied by a standardized model is not positive definite.
class InvalidPopulationModelError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

class SimulationReliabilityError final : public DynamicFitError {
public:
    using DynamicFitError::DynamicFitError;
};

}  // namespace libdynfit
