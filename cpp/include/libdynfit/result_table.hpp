#pragma once

#include "libdynfit/cfa_estimator.hpp"
#include "libdynfit/cutoff_deriver.hpp"
#include "libdynfit/simulation.hpp"

#include <string>
#include <vector>

namespace libdynfit {

// Text table with named rows and columns, rendered left-aligned.
struct ResultTable {
    std::vector<std::string> columns;
    std::vector<std::string> row_names;
    std::vector<std::vector<std::string>> cells;

    [[nodiscard]] std::string render() const;
};

// Three decimals with trailing zeros removed: 0.060 -> "0.06".
[[nodiscard]] std::string format_number(double value);

// Power as a percentage: 0.95 -> "95%".
[[nodiscard]] std::string format_power(double power);

// Columns SRMR, RMSEA, CFI, Magnitude; per level a cutoff row, a
// Specificity/Sensitivity power row and a blank separator (dropped after the
// last level). Cutoffs with power below 50% read NONE.
[[nodiscard]] ResultTable build_cutoff_table(const std::vector<CutoffRow>& rows);

// Chi-Square, df, p-value, SRMR, RMSEA and CFI of the user's fitted model.
struct EmpiricalFit {
    double chi_square{0.0};
    double df{0.0};
    double p_value{0.0};
    double srmr{0.0};
    double rmsea{0.0};
    double cfi{0.0};
};

[[nodiscard]] EmpiricalFit empirical_fit(const FitResult& fit);

[[nodiscard]] ResultTable build_empirical_fit_table(const EmpiricalFit& fit);

// Long format: level, replication, model (True/Misspecified), SRMR, RMSEA, CFI, converged.
[[nodiscard]] std::vector<std::string> replication_header();

[[nodiscard]] std::vector<std::vector<std::string>> replication_rows(const SimulationRun& run);

void write_replication_csv(const std::string& path, const SimulationRun& run);

}  // namespace libdynfit
