#pragma once

#include <Eigen/Core>

#include <cstddef>

namespace libdynfit {

// Sample moments of an n x p data matrix. The covariance uses divisor n.
// fourth_order holds the asymptotic covariance of vech(S) (ADF Gamma) when
// it was requested, and is empty otherwise.
struct SampleMoments {
    Eigen::VectorXd means;
    Eigen::MatrixXd covariance;
    Eigen::MatrixXd fourth_order;
    std::size_t sample_size{0};
};

[[nodiscard]] SampleMoments compute_sample_moments(const Eigen::MatrixXd& data, bool with_fourth_order = false);

// Moments from a known covariance (no raw data, so no fourth-order matrix).
[[nodiscard]] SampleMoments moments_from_covariance(const Eigen::MatrixXd& covariance, std::size_t sample_size);

// Half-vectorization: lower triangle, column by column.
[[nodiscard]] Eigen::Index vech_size(Eigen::Index p) noexcept;

[[nodiscard]] Eigen::Index vech_index(Eigen::Index row, Eigen::Index col, Eigen::Index p) noexcept;

[[nodiscard]] Eigen::VectorXd vech(const Eigen::MatrixXd& matrix);

}  // namespace libdynfit
