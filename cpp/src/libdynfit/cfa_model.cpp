#include "libdynfit/cfa_model.hpp"

#include "libdynfit/model_ir.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace libdynfit {

namespace {
[[nodiscard]] bool same_pair(const CorrelationSpec& corr, const std::string& a, const std::string& b) {
    return (corr.left == a && corr.right == b) || (corr.left == b && corr.right == a);
}

[[nodiscard]] std::string loading_id(const std::string& factor, const std::string& item) {
    return "lambda_" + factor + "_" + item;
}
}  // namespace

std::vector<std::string> observed_items(const CfaModelSpec& spec) {
    std::vector<std::string> items;
    std::unordered_set<std::string> seen;
    for (const auto& factor : spec.factors) {
        for (const auto& indicator : factor.indicators) {
            if (seen.insert(indicator.item).second) {
                items.push_back(indicator.item);
            }
        }
    }
    return items;
}

std::size_t factor_count(const CfaModelSpec& spec) noexcept {
    return spec.factors.size();
}

std::size_t find_factor(const CfaModelSpec& spec, const std::string& name) noexcept {
    for (std::size_t i = 0; i < spec.factors.size(); ++i) {
        if (spec.factors[i].name == name) {
            return i;
        }
    }
    return kNoFactor;
}

std::size_t indicator_count(const CfaModelSpec& spec, const std::string& factor) {
    const std::size_t index = find_factor(spec, factor);
    if (index == kNoFactor) {
        throw std::invalid_argument("unknown factor: " + factor);
    }
    return spec.factors[index].indicators.size();
}

std::size_t loading_count(const CfaModelSpec& spec) noexcept {
    std::size_t count = 0;
    for (const auto& factor : spec.factors) {
        count += factor.indicators.size();
    }
    return count;
}

double factor_correlation(const CfaModelSpec& spec, const std::string& a, const std::string& b) {
    if (find_factor(spec, a) == kNoFactor || find_factor(spec, b) == kNoFactor) {
        throw std::invalid_argument("unknown factor in correlation lookup: " + a + ", " + b);
    }
    if (a == b) {
        return 1.0;
    }
    for (const auto& corr : spec.factor_correlations) {
        if (same_pair(corr, a, b)) {
            return corr.value;
        }
    }
    return 0.0;
}

bool has_residual_correlation(const CfaModelSpec& spec, const std::string& item) noexcept {
    return std::any_of(spec.residual_correlations.begin(), spec.residual_correlations.end(),
                       [&](const CorrelationSpec& corr) { return corr.left == item || corr.right == item; });
}

std::size_t free_parameter_count(const CfaModelSpec& spec) {
    const std::size_t p = observed_items(spec).size();
    const std::size_t f = spec.factors.size();
    return loading_count(spec) + p + (f > 1 ? f * (f - 1) / 2 : 0) + spec.residual_correlations.size();
}

long degrees_of_freedom(const CfaModelSpec& spec) {
    const long p = static_cast<long>(observed_items(spec).size());
    return p * (p + 1) / 2 - static_cast<long>(free_parameter_count(spec));
}

double max_abs_parameter(const CfaModelSpec& spec) noexcept {
    double max_abs = 0.0;
    for (const auto& factor : spec.factors) {
        for (const auto& indicator : factor.indicators) {
            max_abs = std::max(max_abs, std::abs(indicator.loading));
        }
    }
    for (const auto& corr : spec.factor_correlations) {
        max_abs = std::max(max_abs, std::abs(corr.value));
    }
    for (const auto& corr : spec.residual_correlations) {
        max_abs = std::max(max_abs, std::abs(corr.value));
    }
    return max_abs;
}

ModelIR build_model_ir(const CfaModelSpec& spec, const std::vector<std::string>& item_order) {
    const auto items = observed_items(spec);
    if (item_order.size() != items.size()) {
        throw std::invalid_argument("item order does not match the model's observed items");
    }
    for (const auto& item : items) {
        if (std::find(item_order.begin(), item_order.end(), item) == item_order.end()) {
            throw std::invalid_argument("item order is missing observed item: " + item);
        }
    }

    ModelIRBuilder builder;
    for (const auto& factor : spec.factors) {
        builder.add_variable(factor.name, VariableKind::Latent);
    }
    for (const auto& item : item_order) {
        builder.add_variable(item, VariableKind::Observed);
    }

    std::unordered_map<std::string, double> communality;
    for (const auto& factor : spec.factors) {
        for (const auto& indicator : factor.indicators) {
            const std::string id = loading_id(factor.name, indicator.item);
            builder.add_edge(EdgeKind::Loading, factor.name, indicator.item, id);
            builder.set_parameter_initial_value(id, indicator.loading);
        }
    }
    // Communality accounts for correlated factors when an item cross-loads.
    for (const auto& item : items) {
        double h2 = 0.0;
        for (const auto& f1 : spec.factors) {
            for (const auto& i1 : f1.indicators) {
                if (i1.item != item) {
                    continue;
                }
                for (const auto& f2 : spec.factors) {
                    for (const auto& i2 : f2.indicators) {
                        if (i2.item == item) {
                            h2 += i1.loading * i2.loading * factor_correlation(spec, f1.name, f2.name);
                        }
                    }
                }
            }
        }
        communality[item] = h2;
    }

    for (std::size_t i = 0; i < spec.factors.size(); ++i) {
        const auto& fi = spec.factors[i].name;
        builder.add_edge(EdgeKind::Covariance, fi, fi, "1.0");
        for (std::size_t j = i + 1; j < spec.factors.size(); ++j) {
            const auto& fj = spec.factors[j].name;
            const std::string id = "psi_" + fi + "_" + fj;
            builder.add_edge(EdgeKind::Covariance, fi, fj, id);
            builder.set_parameter_initial_value(id, factor_correlation(spec, fi, fj));
        }
    }

    std::unordered_map<std::string, double> residual_variance;
    for (const auto& item : item_order) {
        const std::string id = "theta_" + item;
        const double theta = 1.0 - communality[item];
        residual_variance[item] = theta > 0.05 ? theta : 0.05;
        builder.add_edge(EdgeKind::Covariance, item, item, id);
        builder.set_parameter_initial_value(id, residual_variance[item]);
    }
    for (const auto& corr : spec.residual_correlations) {
        const std::string id = "theta_" + corr.left + "_" + corr.right;
        builder.add_edge(EdgeKind::Covariance, corr.left, corr.right, id);
        builder.set_parameter_initial_value(
            id, corr.value * std::sqrt(residual_variance[corr.left] * residual_variance[corr.right]));
    }

    return builder.build();
}

ModelIR build_model_ir(const CfaModelSpec& spec) {
    return build_model_ir(spec, observed_items(spec));
}

}  // namespace libdynfit
