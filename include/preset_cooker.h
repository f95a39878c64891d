#ifndef PRESET_COOKER_H
#define PRESET_COOKER_H

#include "inference_engine.h"
#include <memory>
#include <string>

enum class FoodState { RAW, HALF_COOKED, FULLY_COOKED };
enum class FoodQuantity { LITTLE, MEDIUM, LARGE };

struct CookingRecommendation {
    double minutes;      // Rounded to 2 decimals
    std::string label;   // e.g. "MT (Medium)"
};

// Cooking time from food state and quantity, both on a conceptual 0-10 scale
class PresetCookingAdvisor {
private:
    std::shared_ptr<const LinguisticVariable> food_type_;
    std::shared_ptr<const LinguisticVariable> quantity_;
    std::shared_ptr<const LinguisticVariable> cooking_time_;
    std::unique_ptr<InferenceEngine> engine_;

    void initialize_variables();
    void initialize_rule_base();

public:
    PresetCookingAdvisor();

    CookingRecommendation recommend(FoodState state, FoodQuantity quantity) const;
    // Arbitrary scale positions; throws InvalidInputError outside [0, 10]
    CookingRecommendation recommend_raw(double food_type, double quantity) const;

    const InferenceEngine& engine() const { return *engine_; }

    static double preset_value(FoodState state);
    static double preset_value(FoodQuantity quantity);
    // Label of the unrounded centroid
    static std::string linguistic_label(double minutes);
};

#endif // PRESET_COOKER_H
