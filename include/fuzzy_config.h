#ifndef FUZZY_CONFIG_H
#define FUZZY_CONFIG_H

#include <cstddef>

// Engine-wide limits
namespace EngineDefaults {
    constexpr std::size_t max_domain_samples = 1000000;  // Upper bound on samples per domain
    constexpr double zero_tolerance = 1e-12;             // Degrees this close to the peak count as maximal
    constexpr int output_decimals = 2;                   // Rounding applied by appliance front-ends
}

// Microwave oven: food temperature + weight -> cooking time
namespace MicrowaveParams {
    constexpr double temperature_min = -18.0;   // °C
    constexpr double temperature_max = 70.0;    // °C
    constexpr double temperature_step = 1.0;

    constexpr double weight_min = 0.0;          // g
    constexpr double weight_max = 1500.0;       // g
    constexpr double weight_step = 1.0;

    constexpr double time_min = 0.0;            // min
    constexpr double time_max = 60.0;           // min
    constexpr double time_step = 1.0;

    // Upper bounds (inclusive) of the result labels, minutes
    constexpr double very_short_limit = 10.0;
    constexpr double short_limit = 20.0;
    constexpr double normal_limit = 40.0;
    constexpr double long_limit = 50.0;

    // Food temperature presets, °C
    constexpr double frozen_temperature = -18.0;
    constexpr double refrigerated_temperature = 4.0;
    constexpr double room_temperature = 22.0;
    constexpr double warm_temperature = 45.0;
    constexpr double hot_temperature = 70.0;

    // Portion presets, g
    constexpr double snack_weight = 100.0;
    constexpr double single_serving_weight = 250.0;
    constexpr double small_meal_weight = 500.0;
    constexpr double family_meal_weight = 1000.0;
    constexpr double large_portion_weight = 1500.0;
}

// Preset cooker: food state + quantity on conceptual 0-10 scales
namespace PresetParams {
    constexpr double scale_min = 0.0;
    constexpr double scale_max = 10.0;
    constexpr double scale_step = 1.0;

    constexpr double time_min = 0.0;            // min
    constexpr double time_max = 60.0;           // min
    constexpr double time_step = 1.0;

    // Preset positions on the 0-10 scales
    constexpr double low_preset = 0.0;
    constexpr double mid_preset = 5.0;
    constexpr double high_preset = 10.0;

    // Upper bounds (inclusive) of the linguistic labels, minutes
    constexpr double very_short_limit = 15.0;
    constexpr double short_limit = 30.0;
    constexpr double medium_limit = 45.0;
    constexpr double long_limit = 55.0;
}

// Air conditioning: temperature error + error rate -> cooling command
namespace CoolingParams {
    constexpr double error_min = -10.0;         // °F
    constexpr double error_max = 10.0;          // °F
    constexpr double error_step = 0.1;

    constexpr double error_dot_min = -15.0;     // °F per reading
    constexpr double error_dot_max = 15.0;      // °F per reading
    constexpr double error_dot_step = 0.1;

    constexpr double cooling_min = 0.0;
    constexpr double cooling_max = 1.0;
    constexpr double cooling_step = 0.01;

    // Status interpretation of the cooling command
    constexpr double off_below = 0.3;
    constexpr double on_above = 0.7;

    constexpr double default_target = 72.0;     // °F
}

#endif // FUZZY_CONFIG_H
