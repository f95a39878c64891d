#include "preset_cooker.h"
#include "fuzzy_config.h"
#include <vector>

using namespace PresetParams;

PresetCookingAdvisor::PresetCookingAdvisor() {
    initialize_variables();
    initialize_rule_base();
}

void PresetCookingAdvisor::initialize_variables() {
    food_type_ = std::make_shared<LinguisticVariable>(
        "food_type", SampledDomain(scale_min, scale_max, scale_step),
        VariableRole::ANTECEDENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_triangular_set("raw", 0, 0, 3),
            FuzzyUtils::create_triangular_set("half_cooked", 2, 5, 8),
            FuzzyUtils::create_triangular_set("fully_cooked", 7, 10, 10)
        });

    quantity_ = std::make_shared<LinguisticVariable>(
        "quantity", SampledDomain(scale_min, scale_max, scale_step),
        VariableRole::ANTECEDENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_triangular_set("little", 0, 0, 3),
            FuzzyUtils::create_triangular_set("medium", 2, 5, 8),
            FuzzyUtils::create_triangular_set("large", 7, 10, 10)
        });

    cooking_time_ = std::make_shared<LinguisticVariable>(
        "cooking_time", SampledDomain(time_min, time_max, time_step),
        VariableRole::CONSEQUENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_triangular_set("VS", 0, 0, 15),
            FuzzyUtils::create_triangular_set("S", 10, 20, 30),
            FuzzyUtils::create_triangular_set("MT", 25, 35, 45),
            FuzzyUtils::create_triangular_set("Lo", 40, 50, 60),
            FuzzyUtils::create_triangular_set("VL", 55, 60, 60)
        });
}

void PresetCookingAdvisor::initialize_rule_base() {
    auto food = [this](const char* term) { return AntecedentExpr::term(food_type_, term); };
    auto amount = [this](const char* term) { return AntecedentExpr::term(quantity_, term); };

    std::vector<FuzzyRule> rules = {
        FuzzyRule(food("raw") && amount("large"), cooking_time_, "VL"),
        FuzzyRule(food("half_cooked") && amount("medium"), cooking_time_, "MT"),
        FuzzyRule(food("fully_cooked") && amount("little"), cooking_time_, "VS"),

        // Remaining combinations
        FuzzyRule(food("raw") && amount("medium"), cooking_time_, "Lo"),
        FuzzyRule(food("raw") && amount("little"), cooking_time_, "MT"),
        FuzzyRule(food("half_cooked") && amount("large"), cooking_time_, "Lo"),
        FuzzyRule(food("half_cooked") && amount("little"), cooking_time_, "S"),
        FuzzyRule(food("fully_cooked") && amount("large"), cooking_time_, "MT"),
        FuzzyRule(food("fully_cooked") && amount("medium"), cooking_time_, "S")
    };

    engine_ = std::make_unique<InferenceEngine>(RuleBase(rules));
}

CookingRecommendation PresetCookingAdvisor::recommend(FoodState state, FoodQuantity quantity) const {
    return recommend_raw(preset_value(state), preset_value(quantity));
}

CookingRecommendation PresetCookingAdvisor::recommend_raw(double food_type, double quantity) const {
    if (!food_type_->domain().contains(food_type) || !quantity_->domain().contains(quantity)) {
        throw InvalidInputError("Food type and quantity must lie on the 0-10 scale");
    }

    auto outputs = engine_->infer({{food_type_->name(), food_type}, {quantity_->name(), quantity}});

    double minutes = outputs.at(cooking_time_->name());

    CookingRecommendation result;
    result.minutes = FuzzyUtils::round_output(minutes);
    result.label = linguistic_label(minutes);
    return result;
}

double PresetCookingAdvisor::preset_value(FoodState state) {
    switch (state) {
        case FoodState::RAW: return low_preset;
        case FoodState::HALF_COOKED: return mid_preset;
        case FoodState::FULLY_COOKED: return high_preset;
    }
    return low_preset;
}

double PresetCookingAdvisor::preset_value(FoodQuantity quantity) {
    switch (quantity) {
        case FoodQuantity::LITTLE: return low_preset;
        case FoodQuantity::MEDIUM: return mid_preset;
        case FoodQuantity::LARGE: return high_preset;
    }
    return low_preset;
}

std::string PresetCookingAdvisor::linguistic_label(double minutes) {
    if (minutes <= very_short_limit) return "VS (Very Short)";
    if (minutes <= short_limit) return "S (Short)";
    if (minutes <= medium_limit) return "MT (Medium)";
    if (minutes <= long_limit) return "Lo (Long)";
    return "VL (Very Long)";
}
