#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <Eigen/Core>

#include <stdexcept>

#include "libdynfit/mvn_sampler.hpp"
#include "libdynfit/sample_moments.hpp"

namespace {
Eigen::MatrixXd three_by_three() {
    Eigen::MatrixXd cov(3, 3);
    cov << 1.0, 0.5, 0.2,
           0.5, 2.0, -0.3,
           0.2, -0.3, 1.5;
    return cov;
}
}  // namespace

TEST_CASE("MultivariateNormalSampler reproduces the covariance", "[mvn_sampler]") {
    const Eigen::MatrixXd cov = three_by_three();
    const libdynfit::MultivariateNormalSampler sampler(cov);
    REQUIRE(sampler.dimension() == 3);

    const Eigen::MatrixXd data = sampler.sample(40000, std::uint64_t{2024});
    REQUIRE(data.rows() == 40000);
    REQUIRE(data.cols() == 3);

    const auto moments = libdynfit::compute_sample_moments(data);
    for (Eigen::Index i = 0; i < 3; ++i) {
        REQUIRE(moments.means(i) == Catch::Approx(0.0).margin(0.03));
        for (Eigen::Index j = 0; j < 3; ++j) {
            REQUIRE(moments.covariance(i, j) == Catch::Approx(cov(i, j)).margin(0.05));
        }
    }
}

TEST_CASE("MultivariateNormalSampler is deterministic per seed", "[mvn_sampler]") {
    const Eigen::MatrixXd cov = three_by_three();
    const Eigen::MatrixXd a = libdynfit::sample_multivariate_normal(cov, 50, 7);
    const Eigen::MatrixXd b = libdynfit::sample_multivariate_normal(cov, 50, 7);
    const Eigen::MatrixXd c = libdynfit::sample_multivariate_normal(cov, 50, 8);
    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);

    // Consecutive draws from one generator continue the stream.
    const libdynfit::MultivariateNormalSampler sampler(cov);
    std::mt19937_64 rng(7);
    const Eigen::MatrixXd first = sampler.sample(50, rng);
    const Eigen::MatrixXd second = sampler.sample(50, rng);
    REQUIRE(first == a);
    REQUIRE_FALSE(second == a);
}

TEST_CASE("MultivariateNormalSampler rejects invalid covariance matrices", "[mvn_sampler]") {
    Eigen::MatrixXd not_square(2, 3);
    not_square.setZero();
    REQUIRE_THROWS_AS(libdynfit::MultivariateNormalSampler(not_square), std::invalid_argument);

    Eigen::MatrixXd asymmetric(2, 2);
    asymmetric << 1.0, 0.5, 0.1, 1.0;
    REQUIRE_THROWS_AS(libdynfit::MultivariateNormalSampler(asymmetric), std::invalid_argument);

    Eigen::MatrixXd indefinite(2, 2);
    indefinite << 1.0, 2.0, 2.0, 1.0;
    REQUIRE_THROWS_AS(libdynfit::MultivariateNormalSampler(indefinite), std::invalid_argument);

    const libdynfit::MultivariateNormalSampler sampler(Eigen::MatrixXd::Identity(2, 2));
    REQUIRE_THROWS_AS(sampler.sample(0, std::uint64_t{1}), std::invalid_argument);
}

TEST_CASE("compute_sample_moments uses divisor n and builds Gamma", "[mvn_sampler]") {
    Eigen::MatrixXd data(4, 2);
    data << 1.0, 2.0,
            2.0, 4.0,
            3.0, 1.0,
            6.0, 5.0;
    const auto moments = libdynfit::compute_sample_moments(data, true);
    REQUIRE(moments.sample_size == 4);
    REQUIRE(moments.means(0) == Catch::Approx(3.0));
    REQUIRE(moments.covariance(0, 0) == Catch::Approx(3.5));
    REQUIRE(moments.covariance(0, 1) == Catch::Approx(1.75));
    REQUIRE(moments.fourth_order.rows() == 3);
    REQUIRE(moments.fourth_order.isApprox(moments.fourth_order.transpose()));

    REQUIRE(libdynfit::vech_size(4) == 10);
    REQUIRE(libdynfit::vech_index(0, 0, 3) == 0);
    REQUIRE(libdynfit::vech_index(2, 0, 3) == 2);
    REQUIRE(libdynfit::vech_index(1, 1, 3) == 3);
    REQUIRE(libdynfit::vech_index(1, 2, 3) == 4);
    REQUIRE(libdynfit::vech(moments.covariance)(1) == Catch::Approx(1.75));

    REQUIRE_THROWS_AS(libdynfit::compute_sample_moments(Eigen::MatrixXd::Zero(1, 2)), std::invalid_argument);
}
