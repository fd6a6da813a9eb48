#include "libdynfit/misspecification.hpp"

#include "libdynfit/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace libdynfit {

namespace {
constexpr double kMaxCommunality = 0.95;

[[nodiscard]] double tabled_magnitude(std::size_t target_indicators) noexcept {
    if (target_indicators <= 3) {
        return 0.50;
    }
    if (target_indicators >= 8) {
        return 0.25;
    }
    return 0.50 - 0.05 * static_cast<double>(target_indicators - 3);
}

[[nodiscard]] double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

[[nodiscard]] double item_loading(const FactorSpec& factor, const std::string& item) {
    for (const auto& indicator : factor.indicators) {
        if (indicator.item == item) {
            return indicator.loading;
        }
    }
    throw std::invalid_argument("item " + item + " does not load on factor " + factor.name);
}

[[nodiscard]] std::size_t loading_factor_count(const CfaModelSpec& spec, const std::string& item) {
    std::size_t count = 0;
    for (const auto& factor : spec.factors) {
        for (const auto& indicator : factor.indicators) {
            if (indicator.item == item) {
                ++count;
            }
        }
    }
    return count;
}
}  // namespace

std::optional<double> cross_loading_magnitude(const CfaModelSpec& spec,
                                              const std::string& item,
                                              const std::string& source,
                                              const std::string& target) {
    const std::size_t source_index = find_factor(spec, source);
    if (source_index == kNoFactor) {
        throw std::invalid_argument("unknown source factor: " + source);
    }
    const double loading = item_loading(spec.factors[source_index], item);
    const double phi = factor_correlation(spec, source, target);
    const double magnitude = tabled_magnitude(indicator_count(spec, target));

    // Largest c with loading^2 + c^2 + 2*loading*c*phi <= .95.
    const double discriminant = loading * loading * phi * phi - loading * loading + kMaxCommunality;
    if (discriminant < 0.0) {
        return std::nullopt;
    }
    const double cap = -loading * phi + std::sqrt(discriminant);
    if (cap >= magnitude) {
        return round3(magnitude);
    }
    // Truncated so the rounded value never pushes the communality past .95.
    const double capped = std::floor(cap * 1000.0) / 1000.0;
    if (capped <= 0.0) {
        return std::nullopt;
    }
    return capped;
}

std::vector<MisspecificationCandidate> enumerate_candidates(const CfaModelSpec& spec) {
    const std::size_t factors = spec.factors.size();
    std::vector<std::vector<IndicatorSpec>> free_items(factors);
    for (std::size_t f = 0; f < factors; ++f) {
        for (const auto& indicator : spec.factors[f].indicators) {
            if (loading_factor_count(spec, indicator.item) == 1 && !has_residual_correlation(spec, indicator.item)) {
                free_items[f].push_back(indicator);
            }
        }
        std::stable_sort(free_items[f].begin(), free_items[f].end(),
                         [](const IndicatorSpec& a, const IndicatorSpec& b) {
                             return std::abs(a.loading) < std::abs(b.loading);
                         });
    }

    std::vector<MisspecificationCandidate> candidates;
    if (factors < 2) {
        return candidates;
    }
    std::size_t longest = 0;
    for (const auto& items : free_items) {
        longest = std::max(longest, items.size());
    }
    for (std::size_t round = 0; round < longest; ++round) {
        for (std::size_t f = 0; f < factors; ++f) {
            if (round >= free_items[f].size()) {
                continue;
            }
            const auto& source = spec.factors[f].name;
            const auto& target = spec.factors[(f + 1) % factors].name;
            const auto& item = free_items[f][round].item;
            const auto magnitude = cross_loading_magnitude(spec, item, source, target);
            if (!magnitude) {
                continue;
            }
            candidates.push_back(MisspecificationCandidate{item, source, target, *magnitude});
        }
    }
    return candidates;
}

std::vector<MisspecifiedModel> build_misspecification_levels(const CfaModelSpec& spec) {
    const std::size_t factors = spec.factors.size();
    if (factors < 2) {
        throw InsufficientCandidatesError("misspecification levels need at least 2 factors");
    }
    const auto candidates = enumerate_candidates(spec);
    if (candidates.size() < factors - 1) {
        throw InsufficientCandidatesError("only " + std::to_string(candidates.size()) +
                                          " cross-loading candidates for " + std::to_string(factors - 1) +
                                          " misspecification levels");
    }

    std::vector<MisspecifiedModel> levels;
    levels.reserve(factors);
    levels.push_back(MisspecifiedModel{0, spec, std::nullopt});
    for (std::size_t level = 1; level < factors; ++level) {
        const auto& candidate = candidates[level - 1];
        CfaModelSpec next = levels.back().spec;
        next.factors[find_factor(next, candidate.target_factor)].indicators.push_back(
            IndicatorSpec{candidate.item, candidate.magnitude});
        levels.push_back(MisspecifiedModel{level, std::move(next), candidate});
    }
    return levels;
}

}  // namespace libdynfit
