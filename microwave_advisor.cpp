#include "microwave_oven.h"
#include "preset_cooker.h"
#include <iostream>
#include <iomanip>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -t temperature  Food temperature in °C (-18 to 70)" << std::endl;
    std::cout << "                  or frozen|refrigerated|room|warm|hot" << std::endl;
    std::cout << "  -w weight       Food weight in grams (0 to 1500)" << std::endl;
    std::cout << "                  or snack|single|small|family|large" << std::endl;
    std::cout << "  -s state        Preset food state (raw|half|full), use with -q" << std::endl;
    std::cout << "  -q quantity     Preset quantity (little|medium|large), use with -s" << std::endl;
    std::cout << "  -p              Print membership functions" << std::endl;
    std::cout << "  -r              Print rule base" << std::endl;
    std::cout << "  -v              Print inference trace" << std::endl;
    std::cout << "  -h              Show this help" << std::endl;
    std::cout << "Without -t/-w or -s/-q the advisor prompts interactively." << std::endl;
}

bool parse_food_state(const std::string& text, FoodState& state) {
    if (text == "raw") state = FoodState::RAW;
    else if (text == "half") state = FoodState::HALF_COOKED;
    else if (text == "full") state = FoodState::FULLY_COOKED;
    else return false;
    return true;
}

// Preset name or a number in °C
double parse_temperature(const std::string& text) {
    if (text == "frozen") return MicrowaveOven::preset_temperature(TemperaturePreset::FROZEN);
    if (text == "refrigerated") return MicrowaveOven::preset_temperature(TemperaturePreset::REFRIGERATED);
    if (text == "room") return MicrowaveOven::preset_temperature(TemperaturePreset::ROOM);
    if (text == "warm") return MicrowaveOven::preset_temperature(TemperaturePreset::WARM);
    if (text == "hot") return MicrowaveOven::preset_temperature(TemperaturePreset::HOT);
    return std::stod(text);
}

// Preset name or a number in grams
double parse_weight(const std::string& text) {
    if (text == "snack") return MicrowaveOven::preset_weight(WeightPreset::SNACK);
    if (text == "single") return MicrowaveOven::preset_weight(WeightPreset::SINGLE_SERVING);
    if (text == "small") return MicrowaveOven::preset_weight(WeightPreset::SMALL_MEAL);
    if (text == "family") return MicrowaveOven::preset_weight(WeightPreset::FAMILY_MEAL);
    if (text == "large") return MicrowaveOven::preset_weight(WeightPreset::LARGE_PORTION);
    return std::stod(text);
}

bool parse_quantity(const std::string& text, FoodQuantity& quantity) {
    if (text == "little") quantity = FoodQuantity::LITTLE;
    else if (text == "medium") quantity = FoodQuantity::MEDIUM;
    else if (text == "large") quantity = FoodQuantity::LARGE;
    else return false;
    return true;
}

void report(const MicrowaveOven& oven, double temperature, double weight, bool trace) {
    double minutes = oven.calculate_cooking_time(temperature, weight);
    std::cout << "Recommended Cooking Time: " << std::fixed << std::setprecision(2)
              << minutes << " minutes (" << MicrowaveOven::time_label(minutes) << ")"
              << std::defaultfloat << std::endl;

    if (trace) {
        oven.engine().print_inference_trace({{"temperature", temperature}, {"weight", weight}});
    }
}

// Prompt loop: one reading per round until the user declines
void run_interactive(const MicrowaveOven& oven, bool trace) {
    std::cout << "Fuzzy Logic Microwave Oven" << std::endl;
    std::cout << "========================================" << std::endl;

    while (true) {
        double temperature = 0.0;
        double weight = 0.0;

        std::cout << "\nFood Temperature [-18 to 70°C]: ";
        if (!MicrowaveUtils::read_number(std::cin, std::cerr, temperature)) break;
        std::cout << "Food Weight [0 to 1500g]: ";
        if (!MicrowaveUtils::read_number(std::cin, std::cerr, weight)) break;

        try {
            report(oven, temperature, weight, trace);
        } catch (const FuzzyError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }

        std::string answer;
        std::cout << "\nCalculate another cooking time? (y/n): ";
        if (!(std::cin >> answer) || (answer != "y" && answer != "Y")) break;
    }

    std::cout << "Goodbye!" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    double temperature = 0.0;
    double weight = 0.0;
    bool have_temperature = false;
    bool have_weight = false;
    std::string state_arg;
    std::string quantity_arg;
    bool show_sets = false;
    bool show_rules = false;
    bool show_trace = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "-t" && i + 1 < argc) {
                temperature = parse_temperature(argv[++i]);
                have_temperature = true;
            } else if (arg == "-w" && i + 1 < argc) {
                weight = parse_weight(argv[++i]);
                have_weight = true;
            } else if (arg == "-s" && i + 1 < argc) {
                state_arg = argv[++i];
            } else if (arg == "-q" && i + 1 < argc) {
                quantity_arg = argv[++i];
            } else if (arg == "-p") {
                show_sets = true;
            } else if (arg == "-r") {
                show_rules = true;
            } else if (arg == "-v") {
                show_trace = true;
            } else if (arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    }

    try {
        MicrowaveOven oven;

        if (show_sets) oven.print_fuzzy_sets();
        if (show_rules) oven.print_rules();

        if (!state_arg.empty() || !quantity_arg.empty()) {
            FoodState state = FoodState::RAW;
            FoodQuantity quantity = FoodQuantity::LITTLE;
            if (!parse_food_state(state_arg, state) || !parse_quantity(quantity_arg, quantity)) {
                std::cerr << "Presets need both -s raw|half|full and -q little|medium|large" << std::endl;
                return 1;
            }

            PresetCookingAdvisor advisor;
            auto recommendation = advisor.recommend(state, quantity);
            std::cout << "Recommended Cooking Time: " << recommendation.label << std::endl;
            std::cout << "Numerical Value: " << std::fixed << std::setprecision(2)
                      << recommendation.minutes << " minutes" << std::endl;
            return 0;
        }

        if (have_temperature != have_weight) {
            std::cerr << "Both -t and -w are required for a one-shot calculation" << std::endl;
            return 1;
        }

        if (have_temperature) {
            report(oven, temperature, weight, show_trace);
        } else if (!show_sets && !show_rules) {
            run_interactive(oven, show_trace);
        }
    } catch (const FuzzyError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cout << "No reading" << std::endl;
        return 1;
    }

    return 0;
}
