#include "libdynfit/simulation.hpp"

#include "libdynfit/errors.hpp"
#include "libdynfit/mvn_sampler.hpp"
#include "libdynfit/population_covariance.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <random>
#include <sstream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace libdynfit {

namespace {
[[nodiscard]] bool usable(const FitResult& fit) {
    return fit.converged && std::isfinite(fit.srmr) && std::isfinite(fit.rmsea) && std::isfinite(fit.cfi);
}

[[nodiscard]] FitIndices indices_of(const FitResult& fit) {
    return FitIndices{fit.srmr, fit.rmsea, fit.cfi};
}
}  // namespace

std::string to_string(FitIndex index) {
    switch (index) {
        case FitIndex::SRMR:
            return "SRMR";
        case FitIndex::RMSEA:
            return "RMSEA";
        case FitIndex::CFI:
            return "CFI";
    }
    return "unknown";
}

double FitIndices::get(FitIndex index) const noexcept {
    switch (index) {
        case FitIndex::SRMR:
            return srmr;
        case FitIndex::RMSEA:
            return rmsea;
        case FitIndex::CFI:
            return cfi;
    }
    return 0.0;
}

std::size_t LevelSimulation::true_failures() const noexcept {
    return static_cast<std::size_t>(std::count_if(replications.begin(), replications.end(),
                                                  [](const ReplicationRecord& r) { return !r.true_converged; }));
}

std::size_t LevelSimulation::misspecified_failures() const noexcept {
    return static_cast<std::size_t>(std::count_if(replications.begin(), replications.end(),
                                                  [](const ReplicationRecord& r) { return !r.misspecified_converged; }));
}

std::vector<double> LevelSimulation::true_values(FitIndex index) const {
    std::vector<double> values;
    values.reserve(replications.size());
    for (const auto& record : replications) {
        if (record.true_converged) {
            values.push_back(record.true_fit.get(index));
        }
    }
    return values;
}

std::vector<double> LevelSimulation::misspecified_values(FitIndex index) const {
    std::vector<double> values;
    values.reserve(replications.size());
    for (const auto& record : replications) {
        if (record.misspecified_converged) {
            values.push_back(record.misspecified_fit.get(index));
        }
    }
    return values;
}

std::uint64_t replication_seed(std::uint64_t seed, std::size_t level, std::size_t replication) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffffU), static_cast<std::uint32_t>(seed >> 32U),
                      static_cast<std::uint32_t>(level), static_cast<std::uint32_t>(replication)};
    std::uint32_t words[2];
    seq.generate(words, words + 2);
    return (static_cast<std::uint64_t>(words[0]) << 32U) | words[1];
}

int resolve_thread_count(int requested) noexcept {
#ifdef _OPENMP
    if (requested <= 0) {
        return std::max(1, omp_get_max_threads());
    }
    return std::max(1, requested);
#else
    (void)requested;
    return 1;
#endif
}

SimulationRun run_simulation(const CfaModelSpec& true_model,
                             const std::vector<MisspecifiedModel>& levels,
                             std::size_t sample_size,
                             const SimulationOptions& options) {
    if (levels.empty()) {
        throw std::invalid_argument("simulation needs at least one model level");
    }
    if (options.replications == 0) {
        throw std::invalid_argument("simulation needs at least one replication");
    }
    if (sample_size < 2) {
        throw std::invalid_argument("simulation sample size must be at least 2");
    }

    // Cross-loadings can move an item to an earlier factor; rows keep the
    // true model's item order throughout.
    const auto item_order = observed_items(true_model);
    const ModelIR analysis_model = build_model_ir(true_model, item_order);
    const MultivariateNormalSampler true_sampler(implied_covariance(true_model, item_order));

    std::vector<MultivariateNormalSampler> level_samplers;
    level_samplers.reserve(levels.size());
    for (const auto& level : levels) {
        level_samplers.emplace_back(implied_covariance(level.spec, item_order));
    }

    SimulationRun run;
    run.seed = options.seed;
    run.sample_size = sample_size;
    run.levels.resize(levels.size());
    for (std::size_t k = 0; k < levels.size(); ++k) {
        run.levels[k].level = levels[k].level;
        run.levels[k].replications.resize(options.replications);
    }

    const int threads = resolve_thread_count(options.threads);
    if (options.log != nullptr) {
        *options.log << "Simulating " << options.replications << " replications for " << levels.size()
                     << " levels (n = " << sample_size << ", " << to_string(options.estimator.method) << ", "
                     << threads << " thread" << (threads == 1 ? "" : "s") << ")" << std::endl;
    }

    const CfaEstimator estimator(options.estimator);
    const auto n = static_cast<Eigen::Index>(sample_size);
    const auto total = static_cast<long long>(levels.size() * options.replications);
    std::exception_ptr failure;

#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic) num_threads(threads)
#endif
    for (long long task = 0; task < total; ++task) {
        const auto k = static_cast<std::size_t>(task) / options.replications;
        const auto r = static_cast<std::size_t>(task) % options.replications;
        try {
            std::mt19937_64 rng(replication_seed(options.seed, levels[k].level, r));
            const Eigen::MatrixXd true_data = true_sampler.sample(n, rng);
            const Eigen::MatrixXd mis_data = level_samplers[k].sample(n, rng);
            const FitResult true_fit = estimator.fit(analysis_model, true_data);
            const FitResult mis_fit = estimator.fit(analysis_model, mis_data);

            ReplicationRecord& record = run.levels[k].replications[r];
            record.level = levels[k].level;
            record.replication = r;
            record.true_fit = indices_of(true_fit);
            record.true_converged = usable(true_fit);
            record.misspecified_fit = indices_of(mis_fit);
            record.misspecified_converged = usable(mis_fit);
        } catch (const std::exception&) {
#ifdef _OPENMP
#pragma omp critical(libdynfit_simulation_failure)
#endif
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    if (options.log != nullptr) {
        for (const auto& level : run.levels) {
            const std::size_t failed = level.true_failures() + level.misspecified_failures();
            if (failed > 0) {
                *options.log << "Level-" << level.level << ": " << failed << " of " << 2 * options.replications
                             << " fits did not converge and were excluded" << std::endl;
            }
        }
    }

    check_simulation_reliability(run, options.max_failure_fraction);
    return run;
}

void check_simulation_reliability(const SimulationRun& run, double max_failure_fraction) {
    for (const auto& level : run.levels) {
        const auto reps = static_cast<double>(level.replications.size());
        if (reps == 0.0) {
            throw SimulationReliabilityError("Level-" + std::to_string(level.level) + " has no replications");
        }
        const double true_fraction = static_cast<double>(level.true_failures()) / reps;
        const double mis_fraction = static_cast<double>(level.misspecified_failures()) / reps;
        if (true_fraction > max_failure_fraction || mis_fraction > max_failure_fraction) {
            std::ostringstream msg;
            msg << "Level-" << level.level << ": " << level.true_failures() << " true-model and "
                << level.misspecified_failures() << " misspecified-model fits out of " << level.replications.size()
                << " replications failed to converge (limit " << max_failure_fraction * 100.0 << "%)";
            throw SimulationReliabilityError(msg.str());
        }
    }
}

}  // namespace libdynfit
