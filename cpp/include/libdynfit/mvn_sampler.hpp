#pragma once

#include <Eigen/Core>

#include <cstdint>
#include <random>

namespace libdynfit {

// Zero-mean multivariate normal draws through the Cholesky factor of a
// covariance matrix. The factor is computed once and reused across samples.
class MultivariateNormalSampler {
public:
    // Throws std::invalid_argument if covariance is not symmetric positive definite.
    explicit MultivariateNormalSampler(const Eigen::MatrixXd& covariance);

    [[nodiscard]] Eigen::Index dimension() const noexcept;

    // n x p sample; rows are observations.
    [[nodiscard]] Eigen::MatrixXd sample(Eigen::Index n, std::mt19937_64& rng) const;

    [[nodiscard]] Eigen::MatrixXd sample(Eigen::Index n, std::uint64_t seed) const;

private:
    Eigen::MatrixXd lower_;
};

[[nodiscard]] Eigen::MatrixXd sample_multivariate_normal(const Eigen::MatrixXd& covariance,
                                                         Eigen::Index n,
                                                         std::uint64_t seed);

}  // namespace libdynfit
