#include "membership_function.h"
#include "fuzzy_config.h"
#include <cmath>
#include <sstream>
#include <algorithm>
#include <utility>

// SampledDomain implementation
SampledDomain::SampledDomain(double lo, double hi, double step)
    : lo_(lo), hi_(hi), step_(step) {
    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        throw InvalidDomainError("Domain bounds must be finite");
    }
    if (lo >= hi) {
        throw InvalidDomainError("Domain lower bound must be below upper bound");
    }
    if (!std::isfinite(step) || step <= 0.0) {
        throw InvalidDomainError("Domain step must be positive");
    }
    if (step > hi - lo) {
        throw InvalidDomainError("Domain step exceeds domain width");
    }

    // Small slack so that e.g. [0, 1] at 0.01 keeps its last sample
    double intervals = std::floor((hi - lo) / step + 1e-9);
    if (intervals + 1.0 > static_cast<double>(EngineDefaults::max_domain_samples)) {
        throw InvalidDomainError("Domain step too fine for range");
    }

    size_t count = static_cast<size_t>(intervals) + 1;
    samples_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        samples_.push_back(std::min(lo + static_cast<double>(i) * step, hi));
    }
}

double SampledDomain::clamp(double x) const {
    return std::max(lo_, std::min(hi_, x));
}

// MembershipFunction implementation
MembershipFunction::MembershipFunction(Type type, std::vector<double> parameters)
    : type_(type), parameters_(std::move(parameters)) {
    for (double p : parameters_) {
        if (!std::isfinite(p)) {
            throw InvalidShapeError("Membership function control points must be finite");
        }
    }
    if (!std::is_sorted(parameters_.begin(), parameters_.end())) {
        throw InvalidShapeError("Membership function control points out of order: " + describe());
    }
}

MembershipFunction MembershipFunction::triangular(double a, double b, double c) {
    return MembershipFunction(TRIANGULAR, {a, b, c});
}

MembershipFunction MembershipFunction::trapezoidal(double a, double b, double c, double d) {
    return MembershipFunction(TRAPEZOIDAL, {a, b, c, d});
}

double MembershipFunction::evaluate(double x) const {
    double a = support_min(), b = core_min(), c = core_max(), d = support_max();

    if (std::isnan(x) || x < a || x > d) return 0.0;
    if (x >= b && x <= c) return 1.0;
    if (x < b) return (x - a) / (b - a);
    return (d - x) / (d - c);
}

std::vector<double> MembershipFunction::evaluate_over(const SampledDomain& domain) const {
    std::vector<double> degrees;
    degrees.reserve(domain.size());

    for (double x : domain.samples()) {
        degrees.push_back(evaluate(x));
    }

    return degrees;
}

std::string MembershipFunction::describe() const {
    std::ostringstream out;
    out << (type_ == TRIANGULAR ? "trimf[" : "trapmf[");
    for (size_t i = 0; i < parameters_.size(); ++i) {
        if (i > 0) out << ", ";
        out << parameters_[i];
    }
    out << "]";
    return out.str();
}

// Utility functions implementation
namespace FuzzyUtils {
    FuzzySet create_triangular_set(const std::string& name, double a, double b, double c) {
        return FuzzySet{name, MembershipFunction::triangular(a, b, c)};
    }

    FuzzySet create_trapezoidal_set(const std::string& name, double a, double b, double c, double d) {
        return FuzzySet{name, MembershipFunction::trapezoidal(a, b, c, d)};
    }
}
