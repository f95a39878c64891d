#include "microwave_oven.h"
#include "fuzzy_config.h"
#include <sstream>
#include <limits>

using namespace MicrowaveParams;

MicrowaveOven::MicrowaveOven() {
    initialize_variables();
    initialize_rule_base();
}

void MicrowaveOven::initialize_variables() {
    // 1. Food temperature
    temperature_ = std::make_shared<LinguisticVariable>(
        "temperature", SampledDomain(temperature_min, temperature_max, temperature_step),
        VariableRole::ANTECEDENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_trapezoidal_set("frozen", -18, -18, -10, 0),
            FuzzyUtils::create_triangular_set("normal", -5, 22, 30),
            FuzzyUtils::create_trapezoidal_set("hot", 24, 50, 70, 70)
        });

    // 2. Food weight
    weight_ = std::make_shared<LinguisticVariable>(
        "weight", SampledDomain(weight_min, weight_max, weight_step),
        VariableRole::ANTECEDENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_trapezoidal_set("light", 0, 0, 200, 400),
            FuzzyUtils::create_triangular_set("medium", 300, 500, 700),
            FuzzyUtils::create_trapezoidal_set("heavy", 600, 1000, 1500, 1500)
        });

    // Output: cooking time in minutes
    cooking_time_ = std::make_shared<LinguisticVariable>(
        "cooking_time", SampledDomain(time_min, time_max, time_step),
        VariableRole::CONSEQUENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_triangular_set("very_short", 0, 5, 10),
            FuzzyUtils::create_triangular_set("short", 4, 10, 16),
            FuzzyUtils::create_triangular_set("normal", 12, 20, 30),
            FuzzyUtils::create_triangular_set("long", 25, 40, 55),
            FuzzyUtils::create_trapezoidal_set("very_long", 40, 60, 60, 60)
        });
}

void MicrowaveOven::initialize_rule_base() {
    std::vector<FuzzyRule> rules;

    add_frozen_rules(rules);
    add_normal_rules(rules);
    add_hot_rules(rules);

    engine_ = std::make_unique<InferenceEngine>(RuleBase(rules));
}

void MicrowaveOven::add_frozen_rules(std::vector<FuzzyRule>& rules) const {
    // Frozen food needs the longest time whatever it weighs
    rules.emplace_back(AntecedentExpr::term(temperature_, "frozen"), cooking_time_, "very_long");
}

void MicrowaveOven::add_normal_rules(std::vector<FuzzyRule>& rules) const {
    auto normal = AntecedentExpr::term(temperature_, "normal");

    rules.emplace_back(normal && AntecedentExpr::term(weight_, "light"), cooking_time_, "short");
    rules.emplace_back(normal && AntecedentExpr::term(weight_, "medium"), cooking_time_, "normal");
    rules.emplace_back(normal && AntecedentExpr::term(weight_, "heavy"), cooking_time_, "long");
}

void MicrowaveOven::add_hot_rules(std::vector<FuzzyRule>& rules) const {
    auto hot = AntecedentExpr::term(temperature_, "hot");

    rules.emplace_back(hot && AntecedentExpr::term(weight_, "light"), cooking_time_, "very_short");
    rules.emplace_back(hot && AntecedentExpr::term(weight_, "medium"), cooking_time_, "short");
    rules.emplace_back(hot && AntecedentExpr::term(weight_, "heavy"), cooking_time_, "normal");
}

EvaluationContext MicrowaveOven::make_inputs(double temperature_c, double weight_g) const {
    if (!temperature_->domain().contains(temperature_c)) {
        std::ostringstream msg;
        msg << "Temperature must be between " << temperature_min << "°C and " << temperature_max << "°C";
        throw InvalidInputError(msg.str());
    }
    if (!weight_->domain().contains(weight_g)) {
        std::ostringstream msg;
        msg << "Weight must be between " << weight_min << "g and " << weight_max << "g";
        throw InvalidInputError(msg.str());
    }

    return {{temperature_->name(), temperature_c}, {weight_->name(), weight_g}};
}

double MicrowaveOven::calculate_cooking_time(double temperature_c, double weight_g) const {
    auto outputs = engine_->infer(make_inputs(temperature_c, weight_g));
    return FuzzyUtils::round_output(outputs.at(cooking_time_->name()));
}

InferenceTrace MicrowaveOven::cooking_time_trace(double temperature_c, double weight_g) const {
    return engine_->infer_with_trace(make_inputs(temperature_c, weight_g));
}

std::string MicrowaveOven::time_label(double minutes) {
    if (minutes <= very_short_limit) return "Very Short";
    if (minutes <= short_limit) return "Short";
    if (minutes <= normal_limit) return "Normal";
    if (minutes <= long_limit) return "Long";
    return "Very Long";
}

double MicrowaveOven::preset_temperature(TemperaturePreset preset) {
    switch (preset) {
        case TemperaturePreset::FROZEN: return frozen_temperature;
        case TemperaturePreset::REFRIGERATED: return refrigerated_temperature;
        case TemperaturePreset::ROOM: return room_temperature;
        case TemperaturePreset::WARM: return warm_temperature;
        case TemperaturePreset::HOT: return hot_temperature;
    }
    return room_temperature;
}

double MicrowaveOven::preset_weight(WeightPreset preset) {
    switch (preset) {
        case WeightPreset::SNACK: return snack_weight;
        case WeightPreset::SINGLE_SERVING: return single_serving_weight;
        case WeightPreset::SMALL_MEAL: return small_meal_weight;
        case WeightPreset::FAMILY_MEAL: return family_meal_weight;
        case WeightPreset::LARGE_PORTION: return large_portion_weight;
    }
    return small_meal_weight;
}

namespace MicrowaveUtils {
    bool read_number(std::istream& in, std::ostream& err, double& value) {
        while (!(in >> value)) {
            if (in.eof()) return false;
            in.clear();
            in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            err << "Please enter a valid number: ";
        }
        return true;
    }
}
