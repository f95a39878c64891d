#include "inference_engine.h"
#include "fuzzy_config.h"
#include <iomanip>
#include <cmath>
#include <algorithm>
#include <chrono>

InferenceEngine::InferenceEngine(const RuleBase& rule_base, DefuzzificationMethod method)
    : rule_base_(rule_base), method_(method) {
    for (const auto& variable : rule_base_.consequents()) {
        consequent_curves_[variable->name()] = variable->term_curves();
    }
}

std::map<std::string, double> InferenceEngine::infer(const EvaluationContext& inputs) const {
    validate_inputs(inputs);

    auto strengths = fire_rules(inputs);
    auto aggregated = aggregate(strengths);

    std::map<std::string, double> outputs;
    for (const auto& [name, output] : aggregated) {
        outputs[name] = output.crisp;
    }
    return outputs;
}

InferenceTrace InferenceEngine::infer_with_trace(const EvaluationContext& inputs) const {
    auto start_time = std::chrono::high_resolution_clock::now();

    validate_inputs(inputs);

    InferenceTrace trace;
    for (const auto& variable : rule_base_.antecedents()) {
        trace.input_memberships[variable->name()] = variable->fuzzify(inputs.at(variable->name()));
    }

    trace.rule_strengths = fire_rules(inputs);

    trace.metrics.rules_fired = 0;
    trace.metrics.max_rule_activation = 0.0;
    trace.metrics.min_rule_activation = 1.0;
    for (double strength : trace.rule_strengths) {
        if (strength > 0.0) {
            trace.metrics.rules_fired++;
            trace.metrics.max_rule_activation = std::max(trace.metrics.max_rule_activation, strength);
            trace.metrics.min_rule_activation = std::min(trace.metrics.min_rule_activation, strength);
        }
    }

    trace.aggregated = aggregate(trace.rule_strengths);
    for (const auto& [name, output] : trace.aggregated) {
        trace.outputs[name] = output.crisp;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    trace.metrics.computation_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    return trace;
}

void InferenceEngine::validate_inputs(const EvaluationContext& inputs) const {
    for (const auto& variable : rule_base_.antecedents()) {
        auto input_it = inputs.find(variable->name());
        if (input_it == inputs.end()) {
            throw MissingInputError(variable->name());
        }
        if (!std::isfinite(input_it->second)) {
            throw InvalidInputError("Input for variable \"" + variable->name() + "\" is not finite");
        }
    }
}

std::vector<double> InferenceEngine::fire_rules(const EvaluationContext& inputs) const {
    std::vector<double> strengths;
    strengths.reserve(rule_base_.size());

    for (const auto& rule : rule_base_.rules()) {
        strengths.push_back(rule.strength(inputs));
    }

    return strengths;
}

std::map<std::string, AggregatedOutput> InferenceEngine::aggregate(const std::vector<double>& strengths) const {
    std::map<std::string, AggregatedOutput> outputs;

    for (const auto& variable : rule_base_.consequents()) {
        AggregatedOutput& output = outputs[variable->name()];
        output.samples = variable->domain().samples();
        output.membership.assign(output.samples.size(), 0.0);
        output.crisp = 0.0;
    }

    // Mamdani min-implication, max-aggregation
    const auto& rules = rule_base_.rules();
    for (size_t r = 0; r < rules.size(); ++r) {
        double activation = strengths[r];
        if (activation <= 0.0) continue;

        const std::string& variable_name = rules[r].consequent()->name();
        const auto& curve = consequent_curves_.at(variable_name).at(rules[r].consequent_term());
        auto& membership = outputs[variable_name].membership;

        for (size_t i = 0; i < membership.size(); ++i) {
            membership[i] = std::max(membership[i], std::min(activation, curve[i]));
        }
    }

    for (auto& [name, output] : outputs) {
        bool empty = std::none_of(output.membership.begin(), output.membership.end(),
                                  [](double mu) { return mu > 0.0; });
        if (empty) {
            throw NoRuleFiredError(name);
        }
        output.crisp = defuzzify(output.samples, output.membership);
    }

    return outputs;
}

double InferenceEngine::defuzzify(const std::vector<double>& samples,
                                  const std::vector<double>& membership) const {
    switch (method_) {
        case DefuzzificationMethod::CENTROID:
            return FuzzyUtils::centroid(samples, membership);
        case DefuzzificationMethod::BISECTOR:
            return FuzzyUtils::bisector(samples, membership);
        case DefuzzificationMethod::MEAN_OF_MAXIMUM:
            return FuzzyUtils::mean_of_maximum(samples, membership);
    }
    return FuzzyUtils::centroid(samples, membership);
}

void InferenceEngine::print_fuzzy_sets(std::ostream& out) const {
    auto print_variables = [&out](const std::vector<std::shared_ptr<const LinguisticVariable>>& variables) {
        for (const auto& var : variables) {
            const auto& domain = var->domain();
            out << var->name() << " (" << domain.lo() << " to " << domain.hi()
                << ", step " << domain.step() << "):" << std::endl;
            for (const auto& set : var->sets()) {
                out << "  " << set.name << " " << set.function.describe() << std::endl;
            }
            out << std::endl;
        }
    };

    out << "\n=== INPUT VARIABLES ===" << std::endl;
    print_variables(rule_base_.antecedents());

    out << "\n=== OUTPUT VARIABLES ===" << std::endl;
    print_variables(rule_base_.consequents());
}

void InferenceEngine::print_rules(std::ostream& out) const {
    out << "\n=== FUZZY RULES (" << rule_base_.size() << " total) ===" << std::endl;

    const auto& rules = rule_base_.rules();
    for (size_t i = 0; i < rules.size(); ++i) {
        out << "Rule " << i << ": " << rules[i].to_string() << std::endl;
    }
}

void InferenceEngine::print_inference_trace(const EvaluationContext& inputs, std::ostream& out) const {
    auto trace = infer_with_trace(inputs);

    std::ios_base::fmtflags saved_flags = out.flags();
    std::streamsize saved_precision = out.precision();

    out << "\n=== INFERENCE TRACE ===" << std::endl;
    out << std::fixed << std::setprecision(3);

    out << "INPUTS:" << std::endl;
    for (const auto& [name, degrees] : trace.input_memberships) {
        out << "  " << name << " = " << inputs.at(name) << std::endl;
        for (const auto& [term, degree] : degrees) {
            out << "    " << term << ": " << degree << std::endl;
        }
    }

    out << "\nRULES:" << std::endl;
    const auto& rules = rule_base_.rules();
    for (size_t i = 0; i < rules.size(); ++i) {
        out << "  [" << trace.rule_strengths[i] << "] " << rules[i].to_string() << std::endl;
    }

    out << "\nOUTPUTS:" << std::endl;
    for (const auto& [name, value] : trace.outputs) {
        out << "  " << name << " = " << value << std::endl;
    }

    out << "\nPERFORMANCE:" << std::endl;
    out << "  Rules Fired: " << trace.metrics.rules_fired << std::endl;
    out << "  Computation Time: " << trace.metrics.computation_time_ms << " ms" << std::endl;

    out.flags(saved_flags);
    out.precision(saved_precision);
}

std::map<std::string, double> infer(const RuleBase& rule_base, const EvaluationContext& inputs) {
    return InferenceEngine(rule_base).infer(inputs);
}

// Defuzzification implementations
namespace FuzzyUtils {
    namespace {
        void check_fuzzy_set(const std::vector<double>& samples, const std::vector<double>& membership) {
            if (samples.size() != membership.size()) {
                throw InvalidInputError("Sample and membership sizes differ");
            }
            if (std::none_of(membership.begin(), membership.end(), [](double mu) { return mu > 0.0; })) {
                throw InvalidInputError("Cannot defuzzify an empty fuzzy set");
            }
        }
    }

    double centroid(const std::vector<double>& samples, const std::vector<double>& membership) {
        check_fuzzy_set(samples, membership);

        double numerator = 0.0;
        double denominator = 0.0;
        for (size_t i = 0; i < samples.size(); ++i) {
            numerator += samples[i] * membership[i];
            denominator += membership[i];
        }

        // Rounding must not push the result past the outermost samples
        return std::max(samples.front(), std::min(samples.back(), numerator / denominator));
    }

    double bisector(const std::vector<double>& samples, const std::vector<double>& membership) {
        check_fuzzy_set(samples, membership);

        double total = 0.0;
        for (double mu : membership) total += mu;

        double running = 0.0;
        for (size_t i = 0; i < samples.size(); ++i) {
            running += membership[i];
            if (running >= total / 2.0) {
                return samples[i];
            }
        }
        return samples.back();
    }

    double mean_of_maximum(const std::vector<double>& samples, const std::vector<double>& membership) {
        check_fuzzy_set(samples, membership);

        double peak = *std::max_element(membership.begin(), membership.end());
        double sum = 0.0;
        size_t count = 0;
        for (size_t i = 0; i < samples.size(); ++i) {
            if (peak - membership[i] <= EngineDefaults::zero_tolerance) {
                sum += samples[i];
                count++;
            }
        }
        return sum / static_cast<double>(count);
    }

    double round_output(double value) {
        double scale = std::pow(10.0, EngineDefaults::output_decimals);
        return std::round(value * scale) / scale;
    }
}
