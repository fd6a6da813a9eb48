#include "libdynfit/cutoff_deriver.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace libdynfit {

namespace {
constexpr int kPowerSteps = 96;  // .95, .94, ..., .00

[[nodiscard]] double power_at(int step) noexcept {
    return static_cast<double>(95 - step) / 100.0;
}

// Quantile probability for a misspecified distribution at a given power step.
[[nodiscard]] double probability_at(int step, FitIndex index) noexcept {
    return higher_is_better(index) ? static_cast<double>(95 - step) / 100.0 : static_cast<double>(5 + step) / 100.0;
}

[[nodiscard]] double sorted_quantile(const std::vector<double>& sorted, double probability) {
    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw std::out_of_range("quantile probability must lie in [0, 1]");
    }
    const double h = (static_cast<double>(sorted.size()) - 1.0) * probability;
    const auto lo = static_cast<std::size_t>(std::floor(h));
    const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

[[nodiscard]] IndexCutoff reference_cutoff(const LevelSimulation& level, FitIndex index) {
    return IndexCutoff{true_reference(level.true_values(index), index), kReferencePower};
}
}  // namespace

double quantile(std::vector<double> values, double probability) {
    if (values.empty()) {
        throw std::invalid_argument("quantile of an empty sample");
    }
    std::sort(values.begin(), values.end());
    return sorted_quantile(values, probability);
}

std::vector<double> quantiles(std::vector<double> values, const std::vector<double>& probabilities) {
    if (values.empty()) {
        throw std::invalid_argument("quantile of an empty sample");
    }
    std::sort(values.begin(), values.end());
    std::vector<double> out;
    out.reserve(probabilities.size());
    for (double p : probabilities) {
        out.push_back(sorted_quantile(values, p));
    }
    return out;
}

const IndexCutoff& CutoffRow::get(FitIndex index) const noexcept {
    switch (index) {
        case FitIndex::SRMR:
            return srmr;
        case FitIndex::RMSEA:
            return rmsea;
        case FitIndex::CFI:
            break;
    }
    return cfi;
}

double true_reference(const std::vector<double>& true_values, FitIndex index) {
    return quantile(true_values, higher_is_better(index) ? 0.05 : 0.95);
}

IndexCutoff derive_index_cutoff(const std::vector<double>& true_values,
                                const std::vector<double>& misspecified_values,
                                FitIndex index) {
    const double reference = true_reference(true_values, index);

    std::vector<double> probabilities(kPowerSteps);
    for (int step = 0; step < kPowerSteps; ++step) {
        probabilities[static_cast<std::size_t>(step)] = probability_at(step, index);
    }
    const auto mis = quantiles(misspecified_values, probabilities);

    for (int step = 0; step < kPowerSteps; ++step) {
        const double value = mis[static_cast<std::size_t>(step)];
        const bool worse = higher_is_better(index) ? value <= reference : value >= reference;
        if (worse) {
            return IndexCutoff{value, power_at(step)};
        }
    }
    return IndexCutoff{mis.back(), power_at(kPowerSteps - 1)};
}

std::vector<CutoffRow> derive_cutoffs(const SimulationRun& run, const std::vector<MisspecifiedModel>& levels) {
    if (run.levels.size() != levels.size()) {
        throw std::invalid_argument("simulation run and model levels differ in count");
    }
    std::vector<CutoffRow> rows;
    rows.reserve(levels.size());
    for (std::size_t k = 0; k < levels.size(); ++k) {
        const auto& sim = run.levels[k];
        CutoffRow row;
        row.level = levels[k].level;
        if (levels[k].added) {
            row.magnitude = levels[k].added->magnitude;
        }
        if (row.level == 0) {
            row.srmr = reference_cutoff(sim, FitIndex::SRMR);
            row.rmsea = reference_cutoff(sim, FitIndex::RMSEA);
            row.cfi = reference_cutoff(sim, FitIndex::CFI);
        } else {
            row.srmr = derive_index_cutoff(sim.true_values(FitIndex::SRMR), sim.misspecified_values(FitIndex::SRMR),
                                           FitIndex::SRMR);
            row.rmsea = derive_index_cutoff(sim.true_values(FitIndex::RMSEA),
                                            sim.misspecified_values(FitIndex::RMSEA), FitIndex::RMSEA);
            row.cfi = derive_index_cutoff(sim.true_values(FitIndex::CFI), sim.misspecified_values(FitIndex::CFI),
                                          FitIndex::CFI);
        }
        rows.push_back(row);
    }
    return rows;
}

}  // namespace libdynfit
