#include "cooling_controller.h"
#include "fuzzy_config.h"
#include <iostream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] < readings" << std::endl;
    std::cout << "Reads one room temperature (°F) per line from stdin." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -s target  Target temperature in °F (default: " << CoolingParams::default_target << ")" << std::endl;
    std::cout << "  -v         Print inference trace for every reading" << std::endl;
    std::cout << "  -h         Show this help" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    double target = CoolingParams::default_target;
    bool show_trace = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "-s" && i + 1 < argc) {
                target = std::stod(argv[++i]);
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
        CoolingController controller;
        std::optional<double> previous_error;

        std::cout << "Cooling monitor, target " << target << "°F" << std::endl;
        std::cout << std::fixed << std::setprecision(2);

        std::string line;
        while (std::getline(std::cin, line)) {
            std::istringstream fields(line);
            double room = 0.0;
            if (!(fields >> room)) {
                if (!line.empty()) {
                    std::cerr << "Skipping unreadable line: " << line << std::endl;
                }
                continue;
            }

            double error = CoolingUtils::temperature_error(target, room);
            double error_dot = CoolingUtils::error_rate(previous_error, error);
            previous_error = error;

            try {
                double clamped_error = controller.clamp_error(error);
                double clamped_error_dot = controller.clamp_error_dot(error_dot);
                double cooling = controller.compute_cooling(clamped_error, clamped_error_dot);
                CoolingStatus status = CoolingUtils::cooling_status(cooling);

                std::cout << "room=" << room << " error=" << error << " rate=" << error_dot
                          << " cooling=" << cooling << " status=" << CoolingUtils::status_name(status)
                          << std::endl;

                if (show_trace) {
                    controller.engine().print_inference_trace(
                        {{"error", clamped_error}, {"error_dot", clamped_error_dot}});
                }
            } catch (const FuzzyError& e) {
                std::cerr << "Error: " << e.what() << std::endl;
                std::cout << "room=" << room << " no reading" << std::endl;
            }
        }
    } catch (const FuzzyError& e) {
        std::cerr << "Failed to initialize cooling controller: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
