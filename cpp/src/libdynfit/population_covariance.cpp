#include "libdynfit/population_covariance.hpp"

#include "libdynfit/errors.hpp"

#include <Eigen/Cholesky>

#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace libdynfit {

Eigen::MatrixXd implied_covariance(const CfaModelSpec& spec, const std::vector<std::string>& item_order) {
    const auto p = static_cast<Eigen::Index>(item_order.size());
    const auto f = static_cast<Eigen::Index>(spec.factors.size());

    std::unordered_map<std::string, Eigen::Index> row;
    for (Eigen::Index i = 0; i < p; ++i) {
        if (!row.emplace(item_order[static_cast<std::size_t>(i)], i).second) {
            throw std::invalid_argument("duplicate item in item order: " + item_order[static_cast<std::size_t>(i)]);
        }
    }
    if (observed_items(spec).size() != item_order.size()) {
        throw std::invalid_argument("item order does not match the model's observed items");
    }

    Eigen::MatrixXd lambda = Eigen::MatrixXd::Zero(p, f);
    for (Eigen::Index k = 0; k < f; ++k) {
        for (const auto& indicator : spec.factors[static_cast<std::size_t>(k)].indicators) {
            auto it = row.find(indicator.item);
            if (it == row.end()) {
                throw std::invalid_argument("item missing from item order: " + indicator.item);
            }
            lambda(it->second, k) = indicator.loading;
        }
    }

    Eigen::MatrixXd phi = Eigen::MatrixXd::Identity(f, f);
    for (const auto& corr : spec.factor_correlations) {
        const auto a = static_cast<Eigen::Index>(find_factor(spec, corr.left));
        const auto b = static_cast<Eigen::Index>(find_factor(spec, corr.right));
        phi(a, b) = corr.value;
        phi(b, a) = corr.value;
    }

    Eigen::MatrixXd sigma = lambda * phi * lambda.transpose();
    Eigen::VectorXd theta(p);
    for (Eigen::Index i = 0; i < p; ++i) {
        theta(i) = 1.0 - sigma(i, i);
        if (!(theta(i) > 0.0)) {
            throw InvalidPopulationModelError("communality of " + item_order[static_cast<std::size_t>(i)] +
                                              " reaches or exceeds 1; residual variance would be " +
                                              std::to_string(theta(i)));
        }
        sigma(i, i) = 1.0;
    }
    for (const auto& corr : spec.residual_correlations) {
        const Eigen::Index a = row.at(corr.left);
        const Eigen::Index b = row.at(corr.right);
        const double cov = corr.value * std::sqrt(theta(a) * theta(b));
        sigma(a, b) += cov;
        sigma(b, a) += cov;
    }

    Eigen::LLT<Eigen::MatrixXd> llt(sigma);
    if (llt.info() != Eigen::Success) {
        throw InvalidPopulationModelError("population covariance matrix is not positive definite");
    }
    return sigma;
}

Eigen::MatrixXd implied_covariance(const CfaModelSpec& spec) {
    return implied_covariance(spec, observed_items(spec));
}

}  // namespace libdynfit
