#include "libdynfit/discrepancy.hpp"

#include "libdynfit/errors.hpp"

#include <Eigen/Cholesky>
#include <Eigen/LU>
#include <Eigen/QR>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace libdynfit {

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();

[[nodiscard]] std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return text;
}

class MlDiscrepancy final : public DiscrepancyFunction {
public:
    explicit MlDiscrepancy(const Eigen::MatrixXd& sample) : sample_(sample) {
        Eigen::LLT<Eigen::MatrixXd> llt(sample_);
        if (llt.info() != Eigen::Success) {
            throw std::domain_error("ML requires a positive definite sample covariance");
        }
        log_det_sample_ = 2.0 * llt.matrixLLT().diagonal().array().log().sum();
    }

    [[nodiscard]] EstimationMethod method() const noexcept override { return EstimationMethod::ML; }

    [[nodiscard]] double value(const Eigen::MatrixXd& sigma) const override {
        Eigen::LLT<Eigen::MatrixXd> llt(sigma);
        if (llt.info() != Eigen::Success) {
            return kInf;
        }
        const double log_det = 2.0 * llt.matrixLLT().diagonal().array().log().sum();
        const double trace = llt.solve(sample_).trace();
        return log_det + trace - log_det_sample_ - static_cast<double>(sample_.rows());
    }

    [[nodiscard]] double value_and_derivative(const Eigen::MatrixXd& sigma, Eigen::MatrixXd& derivative) const override {
        Eigen::LLT<Eigen::MatrixXd> llt(sigma);
        if (llt.info() != Eigen::Success) {
            derivative = Eigen::MatrixXd::Zero(sigma.rows(), sigma.cols());
            return kInf;
        }
        const double log_det = 2.0 * llt.matrixLLT().diagonal().array().log().sum();
        const Eigen::MatrixXd sigma_inv = llt.solve(Eigen::MatrixXd::Identity(sigma.rows(), sigma.cols()));
        const Eigen::MatrixXd inv_s = sigma_inv * sample_;
        derivative = sigma_inv - inv_s * sigma_inv;
        return log_det + inv_s.trace() - log_det_sample_ - static_cast<double>(sample_.rows());
    }

    [[nodiscard]] Eigen::VectorXd independence_variances() const override {
        return sample_.diagonal();
    }

private:
    Eigen::MatrixXd sample_;
    double log_det_sample_{0.0};
};

// F = 1/2 tr((V (S - Sigma))^2) with V = S^-1.
class GlsDiscrepancy final : public DiscrepancyFunction {
public:
    explicit GlsDiscrepancy(const Eigen::MatrixXd& sample) : sample_(sample) {
        Eigen::LLT<Eigen::MatrixXd> llt(sample_);
        if (llt.info() != Eigen::Success) {
            throw std::domain_error("GLS requires a positive definite sample covariance");
        }
        weight_ = llt.solve(Eigen::MatrixXd::Identity(sample_.rows(), sample_.cols()));
    }

    [[nodiscard]] EstimationMethod method() const noexcept override { return EstimationMethod::GLS; }

    [[nodiscard]] double value(const Eigen::MatrixXd& sigma) const override {
        const Eigen::MatrixXd ve = weight_ * (sample_ - sigma);
        return 0.5 * (ve * ve).trace();
    }

    [[nodiscard]] double value_and_derivative(const Eigen::MatrixXd& sigma, Eigen::MatrixXd& derivative) const override {
        const Eigen::MatrixXd residual = sample_ - sigma;
        const Eigen::MatrixXd ve = weight_ * residual;
        derivative = -(ve * weight_);
        return 0.5 * (ve * ve).trace();
    }

    [[nodiscard]] Eigen::VectorXd independence_variances() const override {
        // Normal equations of min_psi 1/2 tr((I - V diag(psi))^2).
        const Eigen::MatrixXd hadamard = weight_.cwiseProduct(weight_);
        return hadamard.partialPivLu().solve(Eigen::VectorXd(weight_.diagonal()));
    }

private:
    Eigen::MatrixXd sample_;
    Eigen::MatrixXd weight_;
};

class UlsDiscrepancy final : public DiscrepancyFunction {
public:
    explicit UlsDiscrepancy(const Eigen::MatrixXd& sample) : sample_(sample) {}

    [[nodiscard]] EstimationMethod method() const noexcept override { return EstimationMethod::ULS; }

    [[nodiscard]] double value(const Eigen::MatrixXd& sigma) const override {
        return 0.5 * (sample_ - sigma).squaredNorm();
    }

    [[nodiscard]] double value_and_derivative(const Eigen::MatrixXd& sigma, Eigen::MatrixXd& derivative) const override {
        derivative = sigma - sample_;
        return 0.5 * derivative.squaredNorm();
    }

    [[nodiscard]] Eigen::VectorXd independence_variances() const override {
        return sample_.diagonal();
    }

private:
    Eigen::MatrixXd sample_;
};

// F = e' W e with e = vech(S - Sigma); W = Gamma^-1 (WLS) or diag(Gamma)^-1 (DWLS).
class WeightedLeastSquaresDiscrepancy final : public DiscrepancyFunction {
public:
    WeightedLeastSquaresDiscrepancy(const SampleMoments& moments, bool diagonal)
        : sample_(moments.covariance), diagonal_(diagonal) {
        const Eigen::Index q = vech_size(sample_.rows());
        if (moments.fourth_order.rows() != q || moments.fourth_order.cols() != q) {
            throw std::invalid_argument("weighted least squares needs the fourth-order sample moments");
        }
        if (diagonal_) {
            const Eigen::VectorXd gamma_diag = moments.fourth_order.diagonal();
            if ((gamma_diag.array() <= 0.0).any()) {
                throw std::domain_error("DWLS weight matrix has non-positive diagonal entries");
            }
            weight_ = gamma_diag.cwiseInverse().asDiagonal();
        } else {
            weight_ = moments.fourth_order.completeOrthogonalDecomposition().pseudoInverse();
        }
    }

    [[nodiscard]] EstimationMethod method() const noexcept override {
        return diagonal_ ? EstimationMethod::DWLS : EstimationMethod::WLS;
    }

    [[nodiscard]] double value(const Eigen::MatrixXd& sigma) const override {
        const Eigen::VectorXd e = vech(sample_ - sigma);
        return e.dot(weight_ * e);
    }

    [[nodiscard]] double value_and_derivative(const Eigen::MatrixXd& sigma, Eigen::MatrixXd& derivative) const override {
        const Eigen::Index p = sample_.rows();
        const Eigen::VectorXd e = vech(sample_ - sigma);
        const Eigen::VectorXd we = weight_ * e;
        derivative.resize(p, p);
        for (Eigen::Index c = 0; c < p; ++c) {
            for (Eigen::Index r = c; r < p; ++r) {
                const double g = we(vech_index(r, c, p));
                if (r == c) {
                    derivative(r, r) = -2.0 * g;
                } else {
                    derivative(r, c) = -g;
                    derivative(c, r) = -g;
                }
            }
        }
        return e.dot(we);
    }

    [[nodiscard]] Eigen::VectorXd independence_variances() const override {
        const Eigen::Index p = sample_.rows();
        const Eigen::Index q = vech_size(p);
        Eigen::MatrixXd selector = Eigen::MatrixXd::Zero(q, p);
        for (Eigen::Index i = 0; i < p; ++i) {
            selector(vech_index(i, i, p), i) = 1.0;
        }
        const Eigen::MatrixXd normal = selector.transpose() * weight_ * selector;
        const Eigen::VectorXd rhs = selector.transpose() * weight_ * vech(sample_);
        return normal.ldlt().solve(rhs);
    }

private:
    Eigen::MatrixXd sample_;
    Eigen::MatrixXd weight_;
    bool diagonal_{false};
};
}  // namespace

EstimationMethod parse_estimation_method(const std::string& name) {
    const std::string key = upper(name);
    if (key == "ML") {
        return EstimationMethod::ML;
    }
    if (key == "GLS") {
        return EstimationMethod::GLS;
    }
    // The robust variants differ only in their test statistic; the point
    // estimates come from the plain discrepancy.
    if (key == "ULS" || key == "ULSM" || key == "ULSMV" || key == "ULSMVS") {
        return EstimationMethod::ULS;
    }
    if (key == "DWLS" || key == "WLSM" || key == "WLSMV" || key == "WLSMVS") {
        return EstimationMethod::DWLS;
    }
    if (key == "WLS") {
        return EstimationMethod::WLS;
    }
    if (key == "MLR") {
        throw UnsupportedEstimatorError("MLR is not supported; dynamic fit cutoffs assume multivariate normal data");
    }
    throw UnsupportedEstimatorError("unknown estimator: " + name);
}

std::string to_string(EstimationMethod method) {
    switch (method) {
        case EstimationMethod::ML:
            return "ML";
        case EstimationMethod::GLS:
            return "GLS";
        case EstimationMethod::ULS:
            return "ULS";
        case EstimationMethod::DWLS:
            return "DWLS";
        case EstimationMethod::WLS:
            return "WLS";
    }
    return "unknown";
}

bool requires_fourth_order(EstimationMethod method) noexcept {
    return method == EstimationMethod::DWLS || method == EstimationMethod::WLS;
}

double DiscrepancyFunction::baseline_value() const {
    const Eigen::VectorXd psi = independence_variances();
    return value(psi.asDiagonal().toDenseMatrix());
}

std::unique_ptr<DiscrepancyFunction> make_discrepancy(EstimationMethod method, const SampleMoments& moments) {
    switch (method) {
        case EstimationMethod::ML:
            return std::make_unique<MlDiscrepancy>(moments.covariance);
        case EstimationMethod::GLS:
            return std::make_unique<GlsDiscrepancy>(moments.covariance);
        case EstimationMethod::ULS:
            return std::make_unique<UlsDiscrepancy>(moments.covariance);
        case EstimationMethod::DWLS:
            return std::make_unique<WeightedLeastSquaresDiscrepancy>(moments, true);
        case EstimationMethod::WLS:
            return std::make_unique<WeightedLeastSquaresDiscrepancy>(moments, false);
    }
    throw std::invalid_argument("unhandled estimation method");
}

}  // namespace libdynfit
