#include "libdynfit/model_syntax.hpp"

#include "libdynfit/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <optional>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace libdynfit {

namespace {

struct Term {
    std::optional<double> value;
    std::string name;
};

struct CovarianceStatement {
    std::string lhs;
    Term term;
    std::string text;
};

[[nodiscard]] std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

[[nodiscard]] bool is_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) || name.front() == '.') {
        return false;
    }
    for (char ch : name) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_' && ch != '.') {
            return false;
        }
    }
    return true;
}

[[nodiscard]] std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// Statements split on newlines and ';' after comments are stripped.
[[nodiscard]] std::vector<std::string> split_statements(const std::string& text) {
    std::vector<std::string> statements;
    std::string current;
    bool in_comment = false;
    for (char ch : text) {
        if (ch == '\n' || ch == '\r') {
            in_comment = false;
            statements.push_back(trim(current));
            current.clear();
        } else if (in_comment) {
            continue;
        } else if (ch == '#') {
            in_comment = true;
        } else if (ch == ';') {
            statements.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    statements.push_back(trim(current));

    std::vector<std::string> non_empty;
    for (auto& statement : statements) {
        if (!statement.empty()) {
            non_empty.push_back(std::move(statement));
        }
    }
    return non_empty;
}

// '+' separates terms except inside an exponent such as 1e+2.
[[nodiscard]] std::vector<std::string> split_terms(const std::string& rhs) {
    std::vector<std::string> terms;
    std::string current;
    for (std::size_t i = 0; i < rhs.size(); ++i) {
        const char ch = rhs[i];
        const bool exponent_sign = ch == '+' && i >= 2 && (rhs[i - 1] == 'e' || rhs[i - 1] == 'E') &&
                                   (std::isdigit(static_cast<unsigned char>(rhs[i - 2])) || rhs[i - 2] == '.');
        if (ch == '+' && !exponent_sign) {
            terms.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    terms.push_back(trim(current));
    return terms;
}

[[nodiscard]] Term parse_term(const std::string& term_text, const std::string& statement, bool require_values) {
    if (term_text.empty()) {
        throw ModelSyntaxError("empty term in statement: " + statement);
    }
    Term term;
    const auto star = term_text.find('*');
    if (star == std::string::npos) {
        term.name = term_text;
    } else {
        const std::string modifier = trim(term_text.substr(0, star));
        term.name = trim(term_text.substr(star + 1));
        term.value = parse_number(modifier);
        if (!term.value && (require_values || modifier.empty() || term.name.find('*') != std::string::npos)) {
            throw ModelSyntaxError("invalid coefficient '" + modifier + "' in statement: " + statement);
        }
    }
    if (!is_identifier(term.name)) {
        throw ModelSyntaxError("invalid variable name '" + term.name + "' in statement: " + statement);
    }
    if (require_values && !term.value) {
        throw ModelSyntaxError("missing standardized coefficient for '" + term.name + "' in statement: " + statement);
    }
    return term;
}

[[nodiscard]] FactorSpec& factor_for(CfaModelSpec& spec, const std::string& name) {
    const std::size_t index = find_factor(spec, name);
    if (index != kNoFactor) {
        return spec.factors[index];
    }
    spec.factors.push_back(FactorSpec{name, {}});
    return spec.factors.back();
}

}  // namespace

CfaModelSpec parse_model_syntax(const std::string& text, bool require_values) {
    CfaModelSpec spec;
    std::vector<CovarianceStatement> covariances;

    for (const auto& statement : split_statements(text)) {
        const auto loading_op = statement.find("=~");
        const auto covariance_op = statement.find("~~");
        if (loading_op != std::string::npos) {
            const std::string lhs = trim(statement.substr(0, loading_op));
            if (!is_identifier(lhs)) {
                throw ModelSyntaxError("invalid factor name '" + lhs + "' in statement: " + statement);
            }
            auto& factor = factor_for(spec, lhs);
            for (const auto& term_text : split_terms(statement.substr(loading_op + 2))) {
                Term term = parse_term(term_text, statement, require_values);
                for (const auto& existing : factor.indicators) {
                    if (existing.item == term.name) {
                        throw ModelSyntaxError("duplicate indicator '" + term.name + "' for factor " + lhs);
                    }
                }
                factor.indicators.push_back(IndicatorSpec{term.name, term.value.value_or(0.0)});
            }
        } else if (covariance_op != std::string::npos) {
            const std::string lhs = trim(statement.substr(0, covariance_op));
            if (!is_identifier(lhs)) {
                throw ModelSyntaxError("invalid variable name '" + lhs + "' in statement: " + statement);
            }
            for (const auto& term_text : split_terms(statement.substr(covariance_op + 2))) {
                covariances.push_back(CovarianceStatement{lhs, parse_term(term_text, statement, require_values), statement});
            }
        } else {
            throw ModelSyntaxError("unsupported statement (expected '=~' or '~~'): " + statement);
        }
    }

    if (spec.factors.empty()) {
        throw ModelSyntaxError("model syntax declares no latent factors");
    }

    const auto items = observed_items(spec);
    const std::unordered_set<std::string> item_set(items.begin(), items.end());
    for (const auto& factor : spec.factors) {
        if (item_set.contains(factor.name)) {
            throw UnsupportedModelError("higher-order factor structures are not supported: " + factor.name);
        }
    }

    for (const auto& cov : covariances) {
        const std::string& rhs = cov.term.name;
        if (cov.lhs == rhs) {
            continue;  // variances are fixed (factors) or derived (items)
        }
        const bool lhs_factor = find_factor(spec, cov.lhs) != kNoFactor;
        const bool rhs_factor = find_factor(spec, rhs) != kNoFactor;
        const bool lhs_item = item_set.contains(cov.lhs);
        const bool rhs_item = item_set.contains(rhs);
        if ((!lhs_factor && !lhs_item) || (!rhs_factor && !rhs_item)) {
            throw ModelSyntaxError("covariance references an undeclared variable: " + cov.text);
        }
        if (lhs_factor != rhs_factor) {
            throw ModelSyntaxError("covariance between a factor and an item is not supported: " + cov.text);
        }
        auto& target = lhs_factor ? spec.factor_correlations : spec.residual_correlations;
        for (const auto& existing : target) {
            if ((existing.left == cov.lhs && existing.right == rhs) || (existing.left == rhs && existing.right == cov.lhs)) {
                throw ModelSyntaxError("duplicate covariance statement: " + cov.text);
            }
        }
        target.push_back(CorrelationSpec{cov.lhs, rhs, cov.term.value.value_or(0.0)});
    }

    return spec;
}

std::string format_model_syntax(const CfaModelSpec& spec) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    for (const auto& factor : spec.factors) {
        out << factor.name << " =~ ";
        for (std::size_t i = 0; i < factor.indicators.size(); ++i) {
            if (i > 0) {
                out << " + ";
            }
            out << factor.indicators[i].loading << '*' << factor.indicators[i].item;
        }
        out << '\n';
    }
    for (const auto& corr : spec.factor_correlations) {
        out << corr.left << " ~~ " << corr.value << '*' << corr.right << '\n';
    }
    for (const auto& corr : spec.residual_correlations) {
        out << corr.left << " ~~ " << corr.value << '*' << corr.right << '\n';
    }
    return out.str();
}

}  // namespace libdynfit
