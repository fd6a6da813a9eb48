#include "libdynfit/fit_distribution.hpp"

#include "libdynfit/result_table.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace libdynfit {

double hu_bentler_cutoff(FitIndex index) noexcept {
    switch (index) {
        case FitIndex::SRMR:
            return 0.08;
        case FitIndex::RMSEA:
            return 0.06;
        case FitIndex::CFI:
            break;
    }
    return 0.95;
}

std::vector<HistogramBin> histogram(const std::vector<double>& true_values,
                                    const std::vector<double>& misspecified_values,
                                    std::size_t bin_count) {
    if (bin_count == 0) {
        throw std::invalid_argument("histogram needs at least one bin");
    }
    if (true_values.empty() && misspecified_values.empty()) {
        return {};
    }
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (const auto* values : {&true_values, &misspecified_values}) {
        for (double v : *values) {
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }
    if (hi <= lo) {
        hi = lo + 1e-3;
    }
    const double width = (hi - lo) / static_cast<double>(bin_count);

    std::vector<HistogramBin> bins(bin_count);
    for (std::size_t b = 0; b < bin_count; ++b) {
        bins[b].lower = lo + width * static_cast<double>(b);
        bins[b].upper = b + 1 == bin_count ? hi : lo + width * static_cast<double>(b + 1);
    }
    auto bin_of = [&](double v) {
        const auto b = static_cast<std::size_t>((v - lo) / width);
        return std::min(b, bin_count - 1);
    };
    for (double v : true_values) {
        ++bins[bin_of(v)].true_count;
    }
    for (double v : misspecified_values) {
        ++bins[bin_of(v)].misspecified_count;
    }
    return bins;
}

std::vector<FitDistribution> build_fit_distributions(const SimulationRun& run,
                                                     const std::vector<CutoffRow>& cutoffs,
                                                     std::size_t bin_count) {
    if (run.levels.size() != cutoffs.size()) {
        throw std::invalid_argument("simulation run and cutoff rows differ in count");
    }
    std::vector<FitDistribution> out;
    for (std::size_t k = 0; k < run.levels.size(); ++k) {
        const auto& level = run.levels[k];
        if (level.level == 0) {
            continue;
        }
        for (FitIndex index : {FitIndex::SRMR, FitIndex::RMSEA, FitIndex::CFI}) {
            FitDistribution dist;
            dist.level = level.level;
            dist.index = index;
            dist.bins = histogram(level.true_values(index), level.misspecified_values(index), bin_count);
            dist.dynamic_cutoff = cutoffs[k].get(index).cutoff;
            dist.dynamic_power = cutoffs[k].get(index).power;
            dist.reference_cutoff = hu_bentler_cutoff(index);
            out.push_back(std::move(dist));
        }
    }
    return out;
}

std::string summarize_distribution(const FitDistribution& distribution) {
    std::ostringstream out;
    out << "Level-" << distribution.level << ' ' << to_string(distribution.index) << ": dynamic cutoff "
        << format_number(distribution.dynamic_cutoff) << " (" << format_power(distribution.dynamic_power)
        << "), Hu & Bentler cutoff " << format_number(distribution.reference_cutoff);
    if (!distribution.bins.empty()) {
        std::size_t overlap = 0;
        std::size_t total = 0;
        for (const auto& bin : distribution.bins) {
            overlap += std::min(bin.true_count, bin.misspecified_count);
            total += bin.true_count;
        }
        out << ", range [" << format_number(distribution.bins.front().lower) << ", "
            << format_number(distribution.bins.back().upper) << "], overlap "
            << format_power(total > 0 ? static_cast<double>(overlap) / static_cast<double>(total) : 0.0);
    }
    return out.str();
}

}  // namespace libdynfit
