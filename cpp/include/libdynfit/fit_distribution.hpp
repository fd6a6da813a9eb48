#pragma once

#include "libdynfit/cutoff_deriver.hpp"
#include "libdynfit/simulation.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace libdynfit {

struct HistogramBin {
    double lower{0.0};
    double upper{0.0};
    std::size_t true_count{0};
    std::size_t misspecified_count{0};
};

// Overlaid true / misspecified distributions of one index at one level,
// with the dynamic cutoff and the Hu & Bentler (1999) reference line.
struct FitDistribution {
    std::size_t level{0};
    FitIndex index{FitIndex::SRMR};
    std::vector<HistogramBin> bins;
    double dynamic_cutoff{0.0};
    double dynamic_power{0.0};
    double reference_cutoff{0.0};
};

// .08 (SRMR), .06 (RMSEA), .95 (CFI).
[[nodiscard]] double hu_bentler_cutoff(FitIndex index) noexcept;

[[nodiscard]] std::vector<HistogramBin> histogram(const std::vector<double>& true_values,
                                                  const std::vector<double>& misspecified_values,
                                                  std::size_t bin_count);

// Levels 1..k for every index, in level order then SRMR, RMSEA, CFI.
[[nodiscard]] std::vector<FitDistribution> build_fit_distributions(const SimulationRun& run,
                                                                   const std::vector<CutoffRow>& cutoffs,
                                                                   std::size_t bin_count = 30);

// One-line text summary per distribution for terminal output.
[[nodiscard]] std::string summarize_distribution(const FitDistribution& distribution);

}  // namespace libdynfit
