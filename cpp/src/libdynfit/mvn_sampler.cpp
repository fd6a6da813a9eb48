#include "libdynfit/mvn_sampler.hpp"

#include <Eigen/Cholesky>

#include <stdexcept>

namespace libdynfit {

MultivariateNormalSampler::MultivariateNormalSampler(const Eigen::MatrixXd& covariance) {
    if (covariance.rows() == 0 || covariance.rows() != covariance.cols()) {
        throw std::invalid_argument("covariance must be a non-empty square matrix");
    }
    if (!covariance.isApprox(covariance.transpose())) {
        throw std::invalid_argument("covariance must be symmetric");
    }
    Eigen::LLT<Eigen::MatrixXd> llt(covariance);
    if (llt.info() != Eigen::Success) {
        throw std::invalid_argument("covariance must be positive definite");
    }
    lower_ = llt.matrixL();
}

Eigen::Index MultivariateNormalSampler::dimension() const noexcept {
    return lower_.rows();
}

Eigen::MatrixXd MultivariateNormalSampler::sample(Eigen::Index n, std::mt19937_64& rng) const {
    if (n <= 0) {
        throw std::invalid_argument("sample size must be positive");
    }
    std::normal_distribution<double> standard_normal(0.0, 1.0);
    Eigen::MatrixXd z(n, lower_.rows());
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < z.cols(); ++j) {
            z(i, j) = standard_normal(rng);
        }
    }
    return z * lower_.transpose();
}

Eigen::MatrixXd MultivariateNormalSampler::sample(Eigen::Index n, std::uint64_t seed) const {
    std::mt19937_64 rng(seed);
    return sample(n, rng);
}

Eigen::MatrixXd sample_multivariate_normal(const Eigen::MatrixXd& covariance, Eigen::Index n, std::uint64_t seed) {
    return MultivariateNormalSampler(covariance).sample(n, seed);
}

}  // namespace libdynfit
