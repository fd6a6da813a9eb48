#include "libdynfit/parameter_catalog.hpp"

#include <stdexcept>

namespace libdynfit {

std::size_t ParameterCatalog::register_parameter(const std::string& name,
                                                 double initial_value,
                                                 std::shared_ptr<const ParameterTransform> transform) {
    if (name.empty()) {
        throw std::invalid_argument("parameter name must be non-empty");
    }
    if (!transform) {
        transform = make_identity_transform();
    }

    auto it = index_.find(name);
    if (it != index_.end()) {
        return it->second;
    }
    if (!transform->is_valid_constrained(initial_value)) {
        throw std::out_of_range("initial value violates transform constraints: " + name);
    }

    const double unconstrained = transform->to_unconstrained(initial_value);
    entries_.push_back(Entry{std::move(transform), unconstrained});
    names_.push_back(name);
    const std::size_t idx = entries_.size() - 1;
    index_.emplace(name, idx);
    return idx;
}

std::size_t ParameterCatalog::size() const noexcept {
    return entries_.size();
}

bool ParameterCatalog::contains(const std::string& name) const noexcept {
    return index_.contains(name);
}

std::size_t ParameterCatalog::find_index(const std::string& name) const noexcept {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return npos;
    }
    return it->second;
}

const std::vector<std::string>& ParameterCatalog::names() const noexcept {
    return names_;
}

std::vector<double> ParameterCatalog::initial_unconstrained() const {
    std::vector<double> values(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        values[i] = entries_[i].initial_unconstrained;
    }
    return values;
}

std::vector<double> ParameterCatalog::constrain(const std::vector<double>& unconstrained) const {
    if (unconstrained.size() != entries_.size()) {
        throw std::invalid_argument("unconstrained vector size mismatch");
    }
    std::vector<double> constrained(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        constrained[i] = entries_[i].transform->to_constrained(unconstrained[i]);
    }
    return constrained;
}

std::vector<double> ParameterCatalog::constrained_derivatives(const std::vector<double>& unconstrained) const {
    if (unconstrained.size() != entries_.size()) {
        throw std::invalid_argument("unconstrained vector size mismatch");
    }
    std::vector<double> derivatives(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        derivatives[i] = entries_[i].transform->constrained_derivative(unconstrained[i]);
    }
    return derivatives;
}

}  // namespace libdynfit
