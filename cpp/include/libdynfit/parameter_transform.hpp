#pragma once

#include "libdynfit/model_types.hpp"

#include <memory>

namespace libdynfit {

// Maps an optimizer coordinate (unconstrained) onto a model parameter value.
class ParameterTransform {
public:
    virtual ~ParameterTransform() = default;

    [[nodiscard]] virtual double to_constrained(double unconstrained) const = 0;

    [[nodiscard]] virtual double to_unconstrained(double constrained) const = 0;

    [[nodiscard]] virtual bool is_valid_constrained(double constrained) const noexcept = 0;

    [[nodiscard]] virtual double constrained_derivative(double unconstrained) const noexcept = 0;
};

class IdentityTransform final : public ParameterTransform {
public:
    [[nodiscard]] double to_constrained(double unconstrained) const override;

    [[nodiscard]] double to_unconstrained(double constrained) const override;

    [[nodiscard]] bool is_valid_constrained(double constrained) const noexcept override;

    [[nodiscard]] double constrained_derivative(double unconstrained) const noexcept override;
};

// Keeps variances strictly positive: value = exp(x).
class LogTransform final : public ParameterTransform {
public:
    [[nodiscard]] double to_constrained(double unconstrained) const override;

    [[nodiscard]] double to_unconstrained(double constrained) const override;

    [[nodiscard]] bool is_valid_constrained(double constrained) const noexcept override;

    [[nodiscard]] double constrained_derivative(double unconstrained) const noexcept override;
};

std::shared_ptr<const ParameterTransform> make_identity_transform();

std::shared_ptr<const ParameterTransform> make_log_transform();

// Positive parameters get the log transform, everything else the identity.
std::shared_ptr<const ParameterTransform> make_transform(ParameterConstraint constraint);

}  // namespace libdynfit
