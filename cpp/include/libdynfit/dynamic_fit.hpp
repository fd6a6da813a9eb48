#pragma once

#include "libdynfit/cutoff_deriver.hpp"
#include "libdynfit/fit_distribution.hpp"
#include "libdynfit/misspecification.hpp"
#include "libdynfit/model_input.hpp"
#include "libdynfit/optimizer.hpp"
#include "libdynfit/result_table.hpp"
#include "libdynfit/simulation.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace libdynfit {

struct CfaHbOptions {
    // true: the input is standardized syntax and sample_size must be given.
    bool manual{false};
    std::optional<std::size_t> sample_size;
    std::string estimator{"ML"};
    std::size_t replications{500};
    bool plot{false};
    // Drawn from std::random_device when absent; the value used is reported.
    std::optional<std::uint64_t> seed;
    int threads{0};
    double max_failure_fraction{0.10};
    OptimizationOptions optimization{};
    // Progress and warnings; nullptr keeps the run silent.
    std::ostream* log{nullptr};
};

struct CfaHbResult {
    ResultTable cutoffs;
    std::vector<CutoffRow> rows;
    std::optional<EmpiricalFit> fit;  // only for fitted-model input
    SimulationRun data;
    std::vector<FitDistribution> plots;  // only with plot = true
    ResolvedModel model;
    std::vector<MisspecifiedModel> levels;
    std::vector<std::string> warnings;
    std::uint64_t seed{0};
};

// Dynamic fit index cutoffs for a multi-factor CFA model. All input checks
// run before any simulation:
//   InputMismatchError, ModelSyntaxError, InvalidParameterError,
//   UnsupportedModelError, IdentificationError, InsufficientCandidatesError,
//   UnsupportedEstimatorError.
// SimulationReliabilityError is raised when too many refits fail.
[[nodiscard]] CfaHbResult cfa_hb(const ModelInput& input, const CfaHbOptions& options = {});

}  // namespace libdynfit
