#ifndef MICROWAVE_OVEN_H
#define MICROWAVE_OVEN_H

#include "inference_engine.h"
#include <memory>
#include <vector>
#include <iostream>
#include <string>

enum class TemperaturePreset { FROZEN, REFRIGERATED, ROOM, WARM, HOT };
enum class WeightPreset { SNACK, SINGLE_SERVING, SMALL_MEAL, FAMILY_MEAL, LARGE_PORTION };

// Cooking time advisor: food temperature (°C) and weight (g) -> minutes
class MicrowaveOven {
private:
    std::shared_ptr<const LinguisticVariable> temperature_;
    std::shared_ptr<const LinguisticVariable> weight_;
    std::shared_ptr<const LinguisticVariable> cooking_time_;
    std::unique_ptr<InferenceEngine> engine_;

    void initialize_variables();
    void initialize_rule_base();

    // Rule groups by food temperature
    void add_frozen_rules(std::vector<FuzzyRule>& rules) const;
    void add_normal_rules(std::vector<FuzzyRule>& rules) const;
    void add_hot_rules(std::vector<FuzzyRule>& rules) const;

    EvaluationContext make_inputs(double temperature_c, double weight_g) const;

public:
    MicrowaveOven();

    // Throws InvalidInputError outside [-18, 70] °C or [0, 1500] g; result rounded to 2 decimals
    double calculate_cooking_time(double temperature_c, double weight_g) const;
    InferenceTrace cooking_time_trace(double temperature_c, double weight_g) const;

    const InferenceEngine& engine() const { return *engine_; }
    const LinguisticVariable& temperature() const { return *temperature_; }
    const LinguisticVariable& weight() const { return *weight_; }
    const LinguisticVariable& cooking_time() const { return *cooking_time_; }

    void print_fuzzy_sets(std::ostream& out = std::cout) const { engine_->print_fuzzy_sets(out); }
    void print_rules(std::ostream& out = std::cout) const { engine_->print_rules(out); }

    // "Very Short" .. "Very Long" by fixed minute thresholds
    static std::string time_label(double minutes);

    static double preset_temperature(TemperaturePreset preset);
    static double preset_weight(WeightPreset preset);
};

namespace MicrowaveUtils {
    // Reads one number from in, skipping unreadable lines with a note on err.
    // Returns false only when in runs out.
    bool read_number(std::istream& in, std::ostream& err, double& value);
}

#endif // MICROWAVE_OVEN_H
