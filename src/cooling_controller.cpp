#include "cooling_controller.h"
#include "fuzzy_config.h"
#include <vector>
#include <sstream>

using namespace CoolingParams;

CoolingController::CoolingController() {
    initialize_variables();
    initialize_rule_base();
}

void CoolingController::initialize_variables() {
    error_ = std::make_shared<LinguisticVariable>(
        "error", SampledDomain(error_min, error_max, error_step),
        VariableRole::ANTECEDENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_trapezoidal_set("negative", -10, -10, -4, 0),
            FuzzyUtils::create_triangular_set("zero", -2, 0, 2),
            FuzzyUtils::create_trapezoidal_set("positive", 0, 4, 10, 10)
        });

    error_dot_ = std::make_shared<LinguisticVariable>(
        "error_dot", SampledDomain(error_dot_min, error_dot_max, error_dot_step),
        VariableRole::ANTECEDENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_trapezoidal_set("negative", -15, -15, -10, 0),
            FuzzyUtils::create_triangular_set("zero", -5, 0, 5),
            FuzzyUtils::create_trapezoidal_set("positive", 0, 10, 15, 15)
        });

    cooling_ = std::make_shared<LinguisticVariable>(
        "cooling", SampledDomain(cooling_min, cooling_max, cooling_step),
        VariableRole::CONSEQUENT,
        std::vector<FuzzySet>{
            FuzzyUtils::create_trapezoidal_set("off", 0, 0, 0.3, 0.5),
            FuzzyUtils::create_trapezoidal_set("on", 0.5, 0.7, 1, 1)
        });
}

void CoolingController::initialize_rule_base() {
    std::vector<FuzzyRule> rules = {
        FuzzyRule(AntecedentExpr::term(error_, "negative"), cooling_, "on"),      // Too hot
        FuzzyRule(AntecedentExpr::term(error_, "zero"), cooling_, "off"),         // On target
        FuzzyRule(AntecedentExpr::term(error_, "positive"), cooling_, "off"),     // Too cold
        FuzzyRule(AntecedentExpr::term(error_dot_, "positive"), cooling_, "on"),  // Getting hotter
        FuzzyRule(AntecedentExpr::term(error_dot_, "negative"), cooling_, "off")  // Getting colder
    };

    engine_ = std::make_unique<InferenceEngine>(RuleBase(rules));
}

EvaluationContext CoolingController::make_inputs(double error, double error_dot) const {
    if (!error_->domain().contains(error)) {
        std::ostringstream msg;
        msg << "Temperature error " << error << " outside [" << error_min << ", " << error_max << "]";
        throw InvalidInputError(msg.str());
    }
    if (!error_dot_->domain().contains(error_dot)) {
        std::ostringstream msg;
        msg << "Error rate " << error_dot << " outside [" << error_dot_min << ", " << error_dot_max << "]";
        throw InvalidInputError(msg.str());
    }

    return {{error_->name(), error}, {error_dot_->name(), error_dot}};
}

double CoolingController::compute_cooling(double error, double error_dot) const {
    return engine_->infer(make_inputs(error, error_dot)).at(cooling_->name());
}

InferenceTrace CoolingController::cooling_trace(double error, double error_dot) const {
    return engine_->infer_with_trace(make_inputs(error, error_dot));
}

namespace CoolingUtils {
    double temperature_error(double target, double room) {
        return target - room;
    }

    double error_rate(const std::optional<double>& previous_error, double current_error) {
        if (!previous_error) {
            return 0.0;
        }
        return *previous_error - current_error;
    }

    CoolingStatus cooling_status(double cooling_output) {
        if (cooling_output > on_above) return CoolingStatus::ON;
        if (cooling_output < off_below) return CoolingStatus::OFF;
        return CoolingStatus::MODERATE;
    }

    std::string status_name(CoolingStatus status) {
        switch (status) {
            case CoolingStatus::OFF: return "OFF";
            case CoolingStatus::MODERATE: return "MODERATE";
            case CoolingStatus::ON: return "ON";
        }
        return "UNKNOWN";
    }
}
