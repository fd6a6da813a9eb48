#include "libdynfit/model_input.hpp"

#include "libdynfit/errors.hpp"
#include "libdynfit/model_syntax.hpp"
#include "libdynfit/post_estimation.hpp"

namespace libdynfit {

FittedModel fit_cfa(const std::string& syntax, const DataTable& data, const EstimatorOptions& options) {
    FittedModel fitted;
    fitted.syntax = syntax;
    fitted.structure = parse_model_syntax(syntax, false);

    const auto items = observed_items(fitted.structure);
    const SampleMoments moments =
        compute_sample_moments(select_columns(data, items), requires_fourth_order(options.method));

    fitted.model = build_model_ir(fitted.structure, items);
    apply_moment_start_values(fitted.model, moments);

    const CfaEstimator estimator(options);
    fitted.fit = estimator.fit(fitted.model, moments);
    return fitted;
}

ResolvedModel extract_model(const FittedModel& fitted) {
    if (!fitted.fit.converged || fitted.fit.parameter_estimates.empty()) {
        throw InputMismatchError("the supplied model has not been fitted to convergence");
    }
    const auto solution =
        compute_standardized_estimates(fitted.model, fitted.fit.parameter_names, fitted.fit.parameter_estimates);

    ResolvedModel resolved;
    resolved.sample_size = fitted.fit.sample_size;
    for (const auto& factor : fitted.structure.factors) {
        resolved.spec.factors.push_back(FactorSpec{factor.name, {}});
    }

    for (std::size_t i = 0; i < fitted.model.edges.size(); ++i) {
        const auto& edge = fitted.model.edges[i];
        const double value = solution.edges[i].std_all;
        if (edge.kind == EdgeKind::Loading) {
            resolved.spec.factors[find_factor(resolved.spec, edge.source)].indicators.push_back(
                IndicatorSpec{edge.target, value});
        } else if (edge.source != edge.target) {
            const bool is_latent = find_factor(resolved.spec, edge.source) != kNoFactor;
            auto& target = is_latent ? resolved.spec.factor_correlations : resolved.spec.residual_correlations;
            target.push_back(CorrelationSpec{edge.source, edge.target, value});
        }
    }
    return resolved;
}

std::string to_standardized_syntax(const FittedModel& fitted) {
    return format_model_syntax(extract_model(fitted).spec);
}

ResolvedModel resolve_model_input(const ModelInput& input, bool manual, std::optional<std::size_t> sample_size) {
    if (const auto* fitted = std::get_if<FittedModel>(&input)) {
        if (manual) {
            throw InputMismatchError("manual = true requires standardized model syntax, not a fitted model");
        }
        return extract_model(*fitted);
    }

    const auto& text = std::get<ManualModel>(input);
    if (!manual) {
        throw InputMismatchError("model syntax was supplied without manual = true; pass a fitted model instead");
    }
    if (!sample_size || *sample_size < 2) {
        throw InputMismatchError("manual model input requires a sample size of at least 2");
    }
    ResolvedModel resolved;
    resolved.spec = parse_model_syntax(text.syntax, true);
    resolved.sample_size = *sample_size;
    return resolved;
}

}  // namespace libdynfit
