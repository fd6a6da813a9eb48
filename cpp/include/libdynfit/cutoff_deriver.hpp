#pragma once

#include "libdynfit/misspecification.hpp"
#include "libdynfit/simulation.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace libdynfit {

// Sample quantile with linear interpolation between order statistics
// (Hyndman and Fan type 7).
[[nodiscard]] double quantile(std::vector<double> values, double probability);

[[nodiscard]] std::vector<double> quantiles(std::vector<double> values, const std::vector<double>& probabilities);

struct IndexCutoff {
    double cutoff{0.0};
    double power{0.0};

    // Power below .50 means the index cannot separate the two models.
    [[nodiscard]] bool none() const noexcept { return power < 0.5; }
};

struct CutoffRow {
    std::size_t level{0};
    IndexCutoff srmr;
    IndexCutoff rmsea;
    IndexCutoff cfi;
    std::optional<double> magnitude;  // cross-loading added at this level

    [[nodiscard]] const IndexCutoff& get(FitIndex index) const noexcept;
};

inline constexpr double kReferencePower = 0.95;

// 95th percentile (SRMR, RMSEA) or 5th percentile (CFI) of true-model fit.
[[nodiscard]] double true_reference(const std::vector<double>& true_values, FitIndex index);

// Walks the misspecified quantiles from power .95 down to 0 and returns the
// first one at least as bad as the true-model reference; the power 0 row
// when none is.
[[nodiscard]] IndexCutoff derive_index_cutoff(const std::vector<double>& true_values,
                                              const std::vector<double>& misspecified_values,
                                              FitIndex index);

// One row per level: level 0 reports the true-model references at power .95,
// level k >= 1 the discriminating cutoffs.
[[nodiscard]] std::vector<CutoffRow> derive_cutoffs(const SimulationRun& run,
                                                    const std::vector<MisspecifiedModel>& levels);

}  // namespace libdynfit
