#ifndef MEMBERSHIP_FUNCTION_H
#define MEMBERSHIP_FUNCTION_H

#include "fuzzy_errors.h"
#include <vector>
#include <string>
#include <cstddef>

// Discretization grid over [lo, hi]; sample i is lo + i*step, never above hi
class SampledDomain {
private:
    double lo_;
    double hi_;
    double step_;
    std::vector<double> samples_;

public:
    SampledDomain(double lo, double hi, double step);

    double lo() const { return lo_; }
    double hi() const { return hi_; }
    double step() const { return step_; }
    size_t size() const { return samples_.size(); }
    bool contains(double x) const { return x >= lo_ && x <= hi_; }
    double clamp(double x) const;

    const std::vector<double>& samples() const { return samples_; }
};

// Piecewise-linear membership function (triangular or trapezoidal)
class MembershipFunction {
public:
    enum Type { TRIANGULAR, TRAPEZOIDAL };

    // Throw InvalidShapeError unless a <= b <= c (<= d) and all points are finite
    static MembershipFunction triangular(double a, double b, double c);
    static MembershipFunction trapezoidal(double a, double b, double c, double d);

    // Degree of membership of x; 0 outside the support and for NaN
    double evaluate(double x) const;
    std::vector<double> evaluate_over(const SampledDomain& domain) const;

    Type type() const { return type_; }
    const std::vector<double>& parameters() const { return parameters_; }

    // Support [a, d] and core (plateau) [b, c]
    double support_min() const { return parameters_.front(); }
    double support_max() const { return parameters_.back(); }
    double core_min() const { return parameters_[1]; }
    double core_max() const { return parameters_[parameters_.size() - 2]; }

    std::string describe() const;

private:
    MembershipFunction(Type type, std::vector<double> parameters);

    Type type_;
    std::vector<double> parameters_;  // [a, b, c] or [a, b, c, d]
};

// Named term of a linguistic variable
struct FuzzySet {
    std::string name;
    MembershipFunction function;

    double membership(double x) const { return function.evaluate(x); }
};

namespace FuzzyUtils {
    FuzzySet create_triangular_set(const std::string& name, double a, double b, double c);
    FuzzySet create_trapezoidal_set(const std::string& name, double a, double b, double c, double d);
}

#endif // MEMBERSHIP_FUNCTION_H
