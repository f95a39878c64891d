#ifndef FUZZY_RULE_H
#define FUZZY_RULE_H

#include "linguistic_variable.h"
#include <vector>
#include <string>
#include <memory>
#include <map>
#include <utility>

// Crisp input value per antecedent variable name, for one inference call
using EvaluationContext = std::map<std::string, double>;

// Antecedent expression tree: term leaves combined by AND (min), OR (max) and NOT (1 - x).
// Nodes are immutable and shared between copies.
class AntecedentExpr {
public:
    enum class Kind { TERM, AND, OR, NOT };

    // Leaf "variable IS term"; variable must be an antecedent and own the term
    static AntecedentExpr term(const std::shared_ptr<const LinguisticVariable>& variable,
                               const std::string& term_name);

    friend AntecedentExpr operator&&(const AntecedentExpr& lhs, const AntecedentExpr& rhs);
    friend AntecedentExpr operator||(const AntecedentExpr& lhs, const AntecedentExpr& rhs);
    friend AntecedentExpr operator!(const AntecedentExpr& operand);

    Kind kind() const { return node_->kind; }

    // Throws MissingInputError if a referenced variable has no value in ctx
    double evaluate(const EvaluationContext& ctx) const;

    // Antecedent variables referenced anywhere in the tree
    void collect_variables(std::vector<std::shared_ptr<const LinguisticVariable>>& out) const;

    std::string to_string() const;

private:
    struct Node {
        Kind kind;
        std::shared_ptr<const LinguisticVariable> variable;  // TERM only
        std::string term_name;                               // TERM only
        std::vector<std::shared_ptr<const Node>> children;
    };

    explicit AntecedentExpr(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    static AntecedentExpr combine(Kind kind, const AntecedentExpr& lhs, const AntecedentExpr& rhs);
    static double evaluate_node(const Node& node, const EvaluationContext& ctx);
    static void collect_node(const Node& node,
                             std::vector<std::shared_ptr<const LinguisticVariable>>& out);
    static std::string node_to_string(const Node& node, bool nested);

    std::shared_ptr<const Node> node_;
};

// Fuzzy rule definition: IF antecedent THEN consequent IS term, scaled by weight
class FuzzyRule {
private:
    AntecedentExpr antecedent_;
    std::shared_ptr<const LinguisticVariable> consequent_;
    std::string consequent_term_;
    double weight_;

public:
    FuzzyRule(const AntecedentExpr& antecedent,
              const std::shared_ptr<const LinguisticVariable>& consequent,
              const std::string& consequent_term,
              double weight = 1.0);

    const AntecedentExpr& antecedent() const { return antecedent_; }
    const std::shared_ptr<const LinguisticVariable>& consequent() const { return consequent_; }
    const std::string& consequent_term() const { return consequent_term_; }
    double weight() const { return weight_; }

    // Firing strength: antecedent degree times weight, in [0, 1]
    double strength(const EvaluationContext& ctx) const;

    std::string to_string() const;
};

// Ordered, immutable collection of rules with the variables they reference
class RuleBase {
private:
    std::vector<FuzzyRule> rules_;
    std::vector<std::shared_ptr<const LinguisticVariable>> antecedents_;
    std::vector<std::shared_ptr<const LinguisticVariable>> consequents_;

    static void register_variable(std::vector<std::shared_ptr<const LinguisticVariable>>& registry,
                                  std::map<std::string, const LinguisticVariable*>& owners,
                                  const std::shared_ptr<const LinguisticVariable>& variable);

public:
    explicit RuleBase(const std::vector<FuzzyRule>& rules);

    const std::vector<FuzzyRule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }

    // Distinct variables in order of first appearance
    const std::vector<std::shared_ptr<const LinguisticVariable>>& antecedents() const { return antecedents_; }
    const std::vector<std::shared_ptr<const LinguisticVariable>>& consequents() const { return consequents_; }
};

#endif // FUZZY_RULE_H
