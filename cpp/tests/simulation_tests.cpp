#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <stdexcept>

#include "libdynfit/errors.hpp"
#include "libdynfit/misspecification.hpp"
#include "libdynfit/model_syntax.hpp"
#include "libdynfit/simulation.hpp"

namespace {
libdynfit::CfaModelSpec two_factor_model() {
    return libdynfit::parse_model_syntax("F1 =~ .7*x1 + .7*x2 + .7*x3\n"
                                         "F2 =~ .7*x4 + .7*x5 + .7*x6\n"
                                         "F1 ~~ .3*F2",
                                         true);
}

libdynfit::LevelSimulation level_with_failures(std::size_t replications, std::size_t true_failures,
                                               std::size_t misspecified_failures) {
    libdynfit::LevelSimulation level;
    level.level = 1;
    for (std::size_t r = 0; r < replications; ++r) {
        libdynfit::ReplicationRecord record;
        record.level = 1;
        record.replication = r;
        record.true_fit = libdynfit::FitIndices{0.02 + 0.001 * static_cast<double>(r), 0.01, 0.99};
        record.true_converged = r >= true_failures;
        record.misspecified_fit = libdynfit::FitIndices{0.05, 0.04, 0.93};
        record.misspecified_converged = r >= misspecified_failures;
        level.replications.push_back(record);
    }
    return level;
}
}  // namespace

TEST_CASE("replication_seed gives independent deterministic streams", "[simulation]") {
    const auto a = libdynfit::replication_seed(42, 1, 3);
    REQUIRE(a == libdynfit::replication_seed(42, 1, 3));
    REQUIRE(a != libdynfit::replication_seed(42, 1, 4));
    REQUIRE(a != libdynfit::replication_seed(42, 2, 3));
    REQUIRE(a != libdynfit::replication_seed(43, 1, 3));
    REQUIRE(libdynfit::resolve_thread_count(3) >= 1);
}

TEST_CASE("run_simulation is reproducible across thread counts", "[simulation]") {
    const auto spec = two_factor_model();
    const auto levels = libdynfit::build_misspecification_levels(spec);

    libdynfit::SimulationOptions options;
    options.replications = 6;
    options.seed = 20240501;
    options.threads = 1;
    std::ostringstream log;
    options.log = &log;
    const auto serial = libdynfit::run_simulation(spec, levels, 300, options);

    options.threads = 2;
    options.log = nullptr;
    const auto parallel = libdynfit::run_simulation(spec, levels, 300, options);

    REQUIRE(log.str().find("Simulating 6 replications for 2 levels") != std::string::npos);
    REQUIRE(serial.seed == 20240501);
    REQUIRE(serial.sample_size == 300);
    REQUIRE(serial.levels.size() == 2);
    for (std::size_t k = 0; k < serial.levels.size(); ++k) {
        REQUIRE(serial.levels[k].level == k);
        REQUIRE(serial.levels[k].replications.size() == 6);
        for (std::size_t r = 0; r < 6; ++r) {
            const auto& a = serial.levels[k].replications[r];
            const auto& b = parallel.levels[k].replications[r];
            REQUIRE(a.replication == r);
            REQUIRE(a.true_converged == b.true_converged);
            REQUIRE(a.misspecified_converged == b.misspecified_converged);
            REQUIRE(a.true_fit.srmr == Catch::Approx(b.true_fit.srmr).epsilon(1e-12));
            REQUIRE(a.misspecified_fit.cfi == Catch::Approx(b.misspecified_fit.cfi).epsilon(1e-12));
        }
    }

    // Level 0 misspecified data comes from the true model but a separate draw.
    const auto& level0 = serial.levels[0].replications[0];
    REQUIRE(level0.true_fit.srmr != level0.misspecified_fit.srmr);

    // The omitted cross-loading degrades fit on average.
    double true_mean = 0.0;
    double mis_mean = 0.0;
    for (const auto& record : serial.levels[1].replications) {
        true_mean += record.true_fit.srmr;
        mis_mean += record.misspecified_fit.srmr;
    }
    REQUIRE(mis_mean > true_mean);
}

TEST_CASE("run_simulation validates its arguments", "[simulation]") {
    const auto spec = two_factor_model();
    const auto levels = libdynfit::build_misspecification_levels(spec);
    libdynfit::SimulationOptions options;
    options.replications = 0;
    REQUIRE_THROWS_AS(libdynfit::run_simulation(spec, levels, 300, options), std::invalid_argument);
    options.replications = 2;
    REQUIRE_THROWS_AS(libdynfit::run_simulation(spec, levels, 1, options), std::invalid_argument);
    REQUIRE_THROWS_AS(libdynfit::run_simulation(spec, {}, 300, options), std::invalid_argument);
}

TEST_CASE("LevelSimulation excludes non-converged replications", "[simulation]") {
    const auto level = level_with_failures(10, 2, 1);
    REQUIRE(level.true_failures() == 2);
    REQUIRE(level.misspecified_failures() == 1);
    const auto values = level.true_values(libdynfit::FitIndex::SRMR);
    REQUIRE(values.size() == 8);
    REQUIRE(values.front() == Catch::Approx(0.022));
    REQUIRE(level.misspecified_values(libdynfit::FitIndex::CFI).size() == 9);
}

TEST_CASE("check_simulation_reliability enforces the failure limit", "[simulation]") {
    libdynfit::SimulationRun run;
    run.levels.push_back(level_with_failures(10, 1, 0));
    REQUIRE_NOTHROW(libdynfit::check_simulation_reliability(run, 0.10));

    run.levels.push_back(level_with_failures(10, 0, 2));
    REQUIRE_THROWS_AS(libdynfit::check_simulation_reliability(run, 0.10), libdynfit::SimulationReliabilityError);
    REQUIRE_NOTHROW(libdynfit::check_simulation_reliability(run, 0.25));

    run.levels.push_back(libdynfit::LevelSimulation{});
    REQUIRE_THROWS_AS(libdynfit::check_simulation_reliability(run, 1.0), libdynfit::SimulationReliabilityError);
}

TEST_CASE("FitIndex direction and names", "[simulation]") {
    STATIC_REQUIRE(libdynfit::higher_is_better(libdynfit::FitIndex::CFI));
    STATIC_REQUIRE_FALSE(libdynfit::higher_is_better(libdynfit::FitIndex::SRMR));
    REQUIRE(libdynfit::to_string(libdynfit::FitIndex::RMSEA) == "RMSEA");
    const libdynfit::FitIndices fit{0.03, 0.02, 0.98};
    REQUIRE(fit.get(libdynfit::FitIndex::CFI) == 0.98);
}
