#ifndef LINGUISTIC_VARIABLE_H
#define LINGUISTIC_VARIABLE_H

#include "membership_function.h"
#include <vector>
#include <string>
#include <map>

enum class VariableRole {
    ANTECEDENT,  // Receives a crisp input
    CONSEQUENT   // Produces a defuzzified output
};

// Linguistic variable definition.
// Terms keep their declaration order; names are unique and every term's
// support lies inside the domain.
class LinguisticVariable {
private:
    std::string name_;
    SampledDomain domain_;
    VariableRole role_;
    std::vector<FuzzySet> sets_;

public:
    LinguisticVariable(const std::string& name, const SampledDomain& domain,
                       VariableRole role, const std::vector<FuzzySet>& sets);

    const std::string& name() const { return name_; }
    const SampledDomain& domain() const { return domain_; }
    VariableRole role() const { return role_; }
    const std::vector<FuzzySet>& sets() const { return sets_; }

    bool has_term(const std::string& term) const;
    const FuzzySet& term(const std::string& term) const;

    // Degree of every term at crisp
    std::map<std::string, double> fuzzify(double crisp) const;
    double membership(const std::string& term, double crisp) const;

    // Term with the highest degree at crisp; ties go to the earlier term
    const std::string& dominant_term(double crisp) const;

    // Every term sampled over the domain, for plotting
    std::map<std::string, std::vector<double>> term_curves() const;
};

#endif // LINGUISTIC_VARIABLE_H
