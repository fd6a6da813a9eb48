#pragma once

#include "libdynfit/cfa_estimator.hpp"
#include "libdynfit/cfa_model.hpp"
#include "libdynfit/misspecification.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace libdynfit {

enum class FitIndex {
    SRMR,
    RMSEA,
    CFI
};

[[nodiscard]] std::string to_string(FitIndex index);

// CFI improves upward; SRMR and RMSEA improve downward.
[[nodiscard]] constexpr bool higher_is_better(FitIndex index) noexcept {
    return index == FitIndex::CFI;
}

struct FitIndices {
    double srmr{0.0};
    double rmsea{0.0};
    double cfi{0.0};

    [[nodiscard]] double get(FitIndex index) const noexcept;
};

struct ReplicationRecord {
    std::size_t level{0};
    std::size_t replication{0};
    FitIndices true_fit;
    bool true_converged{false};
    FitIndices misspecified_fit;
    bool misspecified_converged{false};
};

struct LevelSimulation {
    std::size_t level{0};
    std::vector<ReplicationRecord> replications;

    [[nodiscard]] std::size_t true_failures() const noexcept;

    [[nodiscard]] std::size_t misspecified_failures() const noexcept;

    // Converged replications only, in replication order.
    [[nodiscard]] std::vector<double> true_values(FitIndex index) const;

    [[nodiscard]] std::vector<double> misspecified_values(FitIndex index) const;
};

struct SimulationRun {
    std::vector<LevelSimulation> levels;
    std::uint64_t seed{0};
    std::size_t sample_size{0};
};

struct SimulationOptions {
    std::size_t replications{500};
    std::uint64_t seed{0};
    int threads{0};  // 0 = OpenMP runtime default
    double max_failure_fraction{0.10};
    EstimatorOptions estimator{};
    std::ostream* log{nullptr};
};

// Generator for one (level, replication) cell. Streams are independent of the
// order in which cells are scheduled.
[[nodiscard]] std::uint64_t replication_seed(std::uint64_t seed, std::size_t level, std::size_t replication);

[[nodiscard]] int resolve_thread_count(int requested) noexcept;

// For each level and replication: draw sample_size rows from the true model
// and from the level's model (level 0: the true model again) and fit the true
// model structure to both. Throws SimulationReliabilityError when too many
// fits fail to converge.
[[nodiscard]] SimulationRun run_simulation(const CfaModelSpec& true_model,
                                           const std::vector<MisspecifiedModel>& levels,
                                           std::size_t sample_size,
                                           const SimulationOptions& options);

void check_simulation_reliability(const SimulationRun& run, double max_failure_fraction);

}  // namespace libdynfit
