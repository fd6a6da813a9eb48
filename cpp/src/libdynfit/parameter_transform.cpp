#include "libdynfit/parameter_transform.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

namespace libdynfit {

double IdentityTransform::to_constrained(double unconstrained) const {
    return unconstrained;
}

double IdentityTransform::to_unconstrained(double constrained) const {
    return constrained;
}

bool IdentityTransform::is_valid_constrained(double constrained) const noexcept {
    return std::isfinite(constrained);
}

double IdentityTransform::constrained_derivative(double /*unconstrained*/) const noexcept {
    return 1.0;
}

double LogTransform::to_constrained(double unconstrained) const {
    return std::exp(unconstrained);
}

double LogTransform::to_unconstrained(double constrained) const {
    if (constrained <= 0.0) {
        throw std::domain_error("log transform input must be positive");
    }
    return std::log(constrained);
}

bool LogTransform::is_valid_constrained(double constrained) const noexcept {
    return constrained > 0.0 && std::isfinite(constrained);
}

double LogTransform::constrained_derivative(double unconstrained) const noexcept {
    return std::exp(unconstrained);
}

std::shared_ptr<const ParameterTransform> make_identity_transform() {
    static const std::shared_ptr<const ParameterTransform> kIdentity = std::make_shared<IdentityTransform>();
    return kIdentity;
}

std::shared_ptr<const ParameterTransform> make_log_transform() {
    static const std::shared_ptr<const ParameterTransform> kLog = std::make_shared<LogTransform>();
    return kLog;
}

std::shared_ptr<const ParameterTransform> make_transform(ParameterConstraint constraint) {
    switch (constraint) {
        case ParameterConstraint::Positive:
            return make_log_transform();
        case ParameterConstraint::Free:
        case ParameterConstraint::Fixed:
            break;
    }
    return make_identity_transform();
}

}  // namespace libdynfit
