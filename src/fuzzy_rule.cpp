#include "fuzzy_rule.h"
#include <algorithm>
#include <cmath>
#include <sstream>

// AntecedentExpr implementation
AntecedentExpr AntecedentExpr::term(const std::shared_ptr<const LinguisticVariable>& variable,
                                    const std::string& term_name) {
    if (!variable) {
        throw InvalidRuleError("Antecedent term \"" + term_name + "\" has no variable");
    }
    if (variable->role() != VariableRole::ANTECEDENT) {
        throw InvalidRuleError("Variable \"" + variable->name() + "\" is not an antecedent");
    }
    if (!variable->has_term(term_name)) {
        throw UnknownTermError("Term \"" + term_name + "\" not found in variable \"" +
                               variable->name() + "\"");
    }

    auto node = std::make_shared<Node>();
    node->kind = Kind::TERM;
    node->variable = variable;
    node->term_name = term_name;
    return AntecedentExpr(node);
}

AntecedentExpr AntecedentExpr::combine(Kind kind, const AntecedentExpr& lhs, const AntecedentExpr& rhs) {
    auto node = std::make_shared<Node>();
    node->kind = kind;
    node->children = {lhs.node_, rhs.node_};
    return AntecedentExpr(node);
}

AntecedentExpr operator&&(const AntecedentExpr& lhs, const AntecedentExpr& rhs) {
    return AntecedentExpr::combine(AntecedentExpr::Kind::AND, lhs, rhs);
}

AntecedentExpr operator||(const AntecedentExpr& lhs, const AntecedentExpr& rhs) {
    return AntecedentExpr::combine(AntecedentExpr::Kind::OR, lhs, rhs);
}

AntecedentExpr operator!(const AntecedentExpr& operand) {
    auto node = std::make_shared<AntecedentExpr::Node>();
    node->kind = AntecedentExpr::Kind::NOT;
    node->children = {operand.node_};
    return AntecedentExpr(node);
}

double AntecedentExpr::evaluate(const EvaluationContext& ctx) const {
    return evaluate_node(*node_, ctx);
}

double AntecedentExpr::evaluate_node(const Node& node, const EvaluationContext& ctx) {
    switch (node.kind) {
        case Kind::TERM: {
            auto input_it = ctx.find(node.variable->name());
            if (input_it == ctx.end()) {
                throw MissingInputError(node.variable->name());
            }
            return node.variable->membership(node.term_name, input_it->second);
        }

        case Kind::AND:
            return std::min(evaluate_node(*node.children[0], ctx),
                            evaluate_node(*node.children[1], ctx));

        case Kind::OR:
            return std::max(evaluate_node(*node.children[0], ctx),
                            evaluate_node(*node.children[1], ctx));

        case Kind::NOT:
            return 1.0 - evaluate_node(*node.children[0], ctx);
    }
    return 0.0;
}

void AntecedentExpr::collect_variables(std::vector<std::shared_ptr<const LinguisticVariable>>& out) const {
    collect_node(*node_, out);
}

void AntecedentExpr::collect_node(const Node& node,
                                  std::vector<std::shared_ptr<const LinguisticVariable>>& out) {
    if (node.kind == Kind::TERM) {
        if (std::find(out.begin(), out.end(), node.variable) == out.end()) {
            out.push_back(node.variable);
        }
        return;
    }

    for (const auto& child : node.children) {
        collect_node(*child, out);
    }
}

std::string AntecedentExpr::to_string() const {
    return node_to_string(*node_, false);
}

std::string AntecedentExpr::node_to_string(const Node& node, bool nested) {
    switch (node.kind) {
        case Kind::TERM:
            return node.variable->name() + " IS " + node.term_name;

        case Kind::NOT:
            return "NOT (" + node_to_string(*node.children[0], false) + ")";

        case Kind::AND:
        case Kind::OR: {
            std::string op = (node.kind == Kind::AND) ? " AND " : " OR ";
            std::string text = node_to_string(*node.children[0], true) + op +
                               node_to_string(*node.children[1], true);
            return nested ? "(" + text + ")" : text;
        }
    }
    return "";
}

// FuzzyRule implementation
FuzzyRule::FuzzyRule(const AntecedentExpr& antecedent,
                     const std::shared_ptr<const LinguisticVariable>& consequent,
                     const std::string& consequent_term,
                     double weight)
    : antecedent_(antecedent), consequent_(consequent),
      consequent_term_(consequent_term), weight_(weight) {
    if (!consequent_) {
        throw InvalidRuleError("Rule has no consequent variable");
    }
    if (consequent_->role() != VariableRole::CONSEQUENT) {
        throw InvalidRuleError("Variable \"" + consequent_->name() + "\" is not a consequent");
    }
    if (!consequent_->has_term(consequent_term_)) {
        throw UnknownTermError("Term \"" + consequent_term_ + "\" not found in variable \"" +
                               consequent_->name() + "\"");
    }
    if (!std::isfinite(weight_) || weight_ < 0.0 || weight_ > 1.0) {
        throw InvalidRuleError("Rule weight must lie in [0, 1]");
    }
}

double FuzzyRule::strength(const EvaluationContext& ctx) const {
    return antecedent_.evaluate(ctx) * weight_;
}

std::string FuzzyRule::to_string() const {
    std::ostringstream out;
    out << "IF " << antecedent_.to_string()
        << " THEN " << consequent_->name() << " IS " << consequent_term_;
    if (weight_ != 1.0) {
        out << " (weight=" << weight_ << ")";
    }
    return out.str();
}

// RuleBase implementation
RuleBase::RuleBase(const std::vector<FuzzyRule>& rules) : rules_(rules) {
    if (rules_.empty()) {
        throw InvalidRuleError("Rule base must contain at least one rule");
    }

    std::map<std::string, const LinguisticVariable*> owners;
    for (const auto& rule : rules_) {
        std::vector<std::shared_ptr<const LinguisticVariable>> inputs;
        rule.antecedent().collect_variables(inputs);

        for (const auto& variable : inputs) {
            register_variable(antecedents_, owners, variable);
        }
        register_variable(consequents_, owners, rule.consequent());
    }
}

void RuleBase::register_variable(std::vector<std::shared_ptr<const LinguisticVariable>>& registry,
                                 std::map<std::string, const LinguisticVariable*>& owners,
                                 const std::shared_ptr<const LinguisticVariable>& variable) {
    auto owner_it = owners.find(variable->name());
    if (owner_it != owners.end()) {
        // Same name must always mean the same variable
        if (owner_it->second != variable.get()) {
            throw InvalidRuleError("Two different variables are named \"" + variable->name() + "\"");
        }
        return;
    }

    owners[variable->name()] = variable.get();
    registry.push_back(variable);
}
