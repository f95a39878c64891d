#ifndef COOLING_CONTROLLER_H
#define COOLING_CONTROLLER_H

#include "inference_engine.h"
#include <memory>
#include <optional>
#include <string>

enum class CoolingStatus { OFF, MODERATE, ON };

// Air conditioning controller: temperature error and its rate of change -> cooling command in [0, 1]
class CoolingController {
private:
    std::shared_ptr<const LinguisticVariable> error_;
    std::shared_ptr<const LinguisticVariable> error_dot_;
    std::shared_ptr<const LinguisticVariable> cooling_;
    std::unique_ptr<InferenceEngine> engine_;

    void initialize_variables();
    void initialize_rule_base();

    EvaluationContext make_inputs(double error, double error_dot) const;

public:
    CoolingController();

    // Throws InvalidInputError for values outside the error / error_dot domains
    double compute_cooling(double error, double error_dot) const;
    InferenceTrace cooling_trace(double error, double error_dot) const;

    // Clamp raw readings into the input domains before computing
    double clamp_error(double error) const { return error_->domain().clamp(error); }
    double clamp_error_dot(double error_dot) const { return error_dot_->domain().clamp(error_dot); }

    const InferenceEngine& engine() const { return *engine_; }
    const LinguisticVariable& error() const { return *error_; }
    const LinguisticVariable& error_dot() const { return *error_dot_; }
    const LinguisticVariable& cooling() const { return *cooling_; }
};

namespace CoolingUtils {
    // Positive when the room is colder than the target
    double temperature_error(double target, double room);

    // Previous error minus current error; 0 for the first reading
    double error_rate(const std::optional<double>& previous_error, double current_error);

    CoolingStatus cooling_status(double cooling_output);
    std::string status_name(CoolingStatus status);
}

#endif // COOLING_CONTROLLER_H
