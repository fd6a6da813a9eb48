#include "libdynfit/sample_moments.hpp"

#include <stdexcept>
#include <utility>

namespace libdynfit {

Eigen::Index vech_size(Eigen::Index p) noexcept {
    return p * (p + 1) / 2;
}

Eigen::Index vech_index(Eigen::Index row, Eigen::Index col, Eigen::Index p) noexcept {
    if (row < col) {
        std::swap(row, col);
    }
    return col * p - col * (col - 1) / 2 + (row - col);
}

Eigen::VectorXd vech(const Eigen::MatrixXd& matrix) {
    if (matrix.rows() != matrix.cols()) {
        throw std::invalid_argument("vech requires a square matrix");
    }
    const Eigen::Index p = matrix.rows();
    Eigen::VectorXd out(vech_size(p));
    Eigen::Index k = 0;
    for (Eigen::Index c = 0; c < p; ++c) {
        for (Eigen::Index r = c; r < p; ++r) {
            out(k++) = matrix(r, c);
        }
    }
    return out;
}

SampleMoments compute_sample_moments(const Eigen::MatrixXd& data, bool with_fourth_order) {
    if (data.rows() < 2 || data.cols() < 1) {
        throw std::invalid_argument("sample moments need at least two observations of one variable");
    }
    const auto n = static_cast<double>(data.rows());

    SampleMoments moments;
    moments.sample_size = static_cast<std::size_t>(data.rows());
    moments.means = data.colwise().mean().transpose();
    const Eigen::MatrixXd centered = data.rowwise() - moments.means.transpose();
    moments.covariance = (centered.transpose() * centered) / n;

    if (with_fourth_order) {
        const Eigen::Index p = data.cols();
        const Eigen::Index q = vech_size(p);
        Eigen::MatrixXd products(data.rows(), q);
        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            Eigen::Index k = 0;
            for (Eigen::Index c = 0; c < p; ++c) {
                for (Eigen::Index r = c; r < p; ++r) {
                    products(i, k++) = centered(i, r) * centered(i, c);
                }
            }
        }
        const Eigen::VectorXd s = vech(moments.covariance);
        moments.fourth_order = (products.transpose() * products) / n - s * s.transpose();
    }
    return moments;
}

SampleMoments moments_from_covariance(const Eigen::MatrixXd& covariance, std::size_t sample_size) {
    if (covariance.rows() == 0 || covariance.rows() != covariance.cols()) {
        throw std::invalid_argument("covariance must be a non-empty square matrix");
    }
    if (sample_size < 2) {
        throw std::invalid_argument("sample size must be at least 2");
    }
    SampleMoments moments;
    moments.means = Eigen::VectorXd::Zero(covariance.rows());
    moments.covariance = covariance;
    moments.sample_size = sample_size;
    return moments;
}

}  // namespace libdynfit
