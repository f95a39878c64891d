#include "linguistic_variable.h"
#include <algorithm>
#include <set>
#include <sstream>

LinguisticVariable::LinguisticVariable(const std::string& name, const SampledDomain& domain,
                                       VariableRole role, const std::vector<FuzzySet>& sets)
    : name_(name), domain_(domain), role_(role), sets_(sets) {
    if (name_.empty()) {
        throw InvalidTermError("Linguistic variable name must not be empty");
    }
    if (sets_.empty()) {
        throw InvalidTermError("Linguistic variable \"" + name_ + "\" has no terms");
    }

    std::set<std::string> seen;
    for (const auto& set : sets_) {
        if (set.name.empty()) {
            throw InvalidTermError("Empty term name in variable \"" + name_ + "\"");
        }
        if (!seen.insert(set.name).second) {
            throw InvalidTermError("Duplicate term \"" + set.name + "\" in variable \"" + name_ + "\"");
        }

        if (set.function.support_min() < domain_.lo() || set.function.support_max() > domain_.hi()) {
            std::ostringstream msg;
            msg << "Term \"" << set.name << "\" " << set.function.describe()
                << " extends outside domain [" << domain_.lo() << ", " << domain_.hi()
                << "] of variable \"" << name_ << "\"";
            throw DomainMismatchError(msg.str());
        }
    }
}

bool LinguisticVariable::has_term(const std::string& term) const {
    return std::any_of(sets_.begin(), sets_.end(),
                       [&term](const FuzzySet& s) { return s.name == term; });
}

const FuzzySet& LinguisticVariable::term(const std::string& term) const {
    auto it = std::find_if(sets_.begin(), sets_.end(),
                           [&term](const FuzzySet& s) { return s.name == term; });
    if (it == sets_.end()) {
        throw UnknownTermError("Term \"" + term + "\" not found in variable \"" + name_ + "\"");
    }
    return *it;
}

std::map<std::string, double> LinguisticVariable::fuzzify(double crisp) const {
    std::map<std::string, double> degrees;

    for (const auto& set : sets_) {
        degrees[set.name] = set.membership(crisp);
    }

    return degrees;
}

double LinguisticVariable::membership(const std::string& term_name, double crisp) const {
    return term(term_name).membership(crisp);
}

const std::string& LinguisticVariable::dominant_term(double crisp) const {
    const FuzzySet* best = &sets_.front();
    double best_degree = best->membership(crisp);

    for (const auto& set : sets_) {
        double degree = set.membership(crisp);
        if (degree > best_degree) {
            best = &set;
            best_degree = degree;
        }
    }

    return best->name;
}

std::map<std::string, std::vector<double>> LinguisticVariable::term_curves() const {
    std::map<std::string, std::vector<double>> curves;

    for (const auto& set : sets_) {
        curves[set.name] = set.function.evaluate_over(domain_);
    }

    return curves;
}
