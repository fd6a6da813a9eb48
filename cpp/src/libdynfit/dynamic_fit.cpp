#include "libdynfit/dynamic_fit.hpp"

#include "libdynfit/discrepancy.hpp"
#include "libdynfit/model_validator.hpp"

#include <cctype>
#include <random>
#include <stdexcept>
#include <variant>

namespace libdynfit {

namespace {
[[nodiscard]] std::uint64_t fresh_seed() {
    std::random_device device;
    return (static_cast<std::uint64_t>(device()) << 32U) | device();
}

[[nodiscard]] bool least_squares_family(const std::string& estimator) {
    if (estimator.empty()) {
        return false;
    }
    const auto first = static_cast<char>(std::toupper(static_cast<unsigned char>(estimator.front())));
    return first == 'U' || first == 'W';
}

void warn(CfaHbResult& result, std::ostream* log, std::string message) {
    if (log != nullptr) {
        *log << "Warning: " << message << std::endl;
    }
    result.warnings.push_back(std::move(message));
}
}  // namespace

CfaHbResult cfa_hb(const ModelInput& input, const CfaHbOptions& options) {
    if (options.replications == 0) {
        throw std::invalid_argument("replications must be positive");
    }
    if (!(options.max_failure_fraction >= 0.0 && options.max_failure_fraction <= 1.0)) {
        throw std::invalid_argument("max_failure_fraction must lie in [0, 1]");
    }

    CfaHbResult result;
    result.model = resolve_model_input(input, options.manual, options.sample_size);
    validate_model(result.model.spec);

    const EstimationMethod method = parse_estimation_method(options.estimator);
    if (least_squares_family(options.estimator)) {
        warn(result, options.log,
             "cutoffs are interpretable when normality is reasonable to assume; the ULS and WLS estimator "
             "families are usually chosen for non-normal or categorical data, which these cutoffs do not model");
    }

    result.levels = build_misspecification_levels(result.model.spec);
    result.seed = options.seed ? *options.seed : fresh_seed();

    SimulationOptions sim;
    sim.replications = options.replications;
    sim.seed = result.seed;
    sim.threads = options.threads;
    sim.max_failure_fraction = options.max_failure_fraction;
    sim.estimator.method = method;
    sim.estimator.optimization = options.optimization;
    sim.log = options.log;
    result.data = run_simulation(result.model.spec, result.levels, result.model.sample_size, sim);

    result.rows = derive_cutoffs(result.data, result.levels);
    result.cutoffs = build_cutoff_table(result.rows);

    if (const auto* fitted = std::get_if<FittedModel>(&input)) {
        result.fit = empirical_fit(fitted->fit);
    }
    if (options.plot) {
        result.plots = build_fit_distributions(result.data, result.rows);
    }
    return result;
}

}  // namespace libdynfit
