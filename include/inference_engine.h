#ifndef INFERENCE_ENGINE_H
#define INFERENCE_ENGINE_H

#include "fuzzy_rule.h"
#include <vector>
#include <string>
#include <map>
#include <iostream>
#include <cstdint>

enum class DefuzzificationMethod {
    CENTROID,        // sum(y * mu(y)) / sum(mu(y))
    BISECTOR,        // first sample where the cumulative area reaches half
    MEAN_OF_MAXIMUM  // mean of the samples where mu(y) is maximal
};

// Aggregated output fuzzy set of one consequent variable
struct AggregatedOutput {
    std::vector<double> samples;     // Consequent domain sample points
    std::vector<double> membership;  // Pointwise max of the clipped consequent terms
    double crisp;                    // Defuzzified value
};

struct PerformanceMetrics {
    double computation_time_ms;
    uint32_t rules_fired;
    double max_rule_activation;
    double min_rule_activation;
};

// Full diagnostic result of one inference call
struct InferenceTrace {
    std::map<std::string, double> outputs;
    std::map<std::string, std::map<std::string, double>> input_memberships;  // variable -> term -> degree
    std::vector<double> rule_strengths;                                    // Same order as the rule base
    std::map<std::string, AggregatedOutput> aggregated;
    PerformanceMetrics metrics;
};

// Mamdani inference over one immutable rule base.
// No state is kept between calls; one engine may be shared read-only by many threads.
class InferenceEngine {
private:
    RuleBase rule_base_;
    DefuzzificationMethod method_;

    // Consequent term curves sampled once over their domains: variable -> term -> curve
    std::map<std::string, std::map<std::string, std::vector<double>>> consequent_curves_;

    void validate_inputs(const EvaluationContext& inputs) const;
    std::vector<double> fire_rules(const EvaluationContext& inputs) const;
    std::map<std::string, AggregatedOutput> aggregate(const std::vector<double>& strengths) const;
    double defuzzify(const std::vector<double>& samples, const std::vector<double>& membership) const;

public:
    explicit InferenceEngine(const RuleBase& rule_base,
                             DefuzzificationMethod method = DefuzzificationMethod::CENTROID);

    // Crisp output per consequent variable; all outputs or an exception
    std::map<std::string, double> infer(const EvaluationContext& inputs) const;

    // Same as infer, plus memberships, rule strengths and aggregated curves
    InferenceTrace infer_with_trace(const EvaluationContext& inputs) const;

    const RuleBase& rule_base() const { return rule_base_; }
    DefuzzificationMethod method() const { return method_; }

    // Diagnostic methods
    void print_fuzzy_sets(std::ostream& out = std::cout) const;
    void print_rules(std::ostream& out = std::cout) const;
    void print_inference_trace(const EvaluationContext& inputs, std::ostream& out = std::cout) const;
};

// Evaluation entry point for a rule base that has no engine of its own
std::map<std::string, double> infer(const RuleBase& rule_base, const EvaluationContext& inputs);

namespace FuzzyUtils {
    double centroid(const std::vector<double>& samples, const std::vector<double>& membership);
    double bisector(const std::vector<double>& samples, const std::vector<double>& membership);
    double mean_of_maximum(const std::vector<double>& samples, const std::vector<double>& membership);

    // Round a crisp output for display (EngineDefaults::output_decimals places)
    double round_output(double value);
}

#endif // INFERENCE_ENGINE_H
