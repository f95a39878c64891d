#ifndef FUZZY_ERRORS_H
#define FUZZY_ERRORS_H

#include <stdexcept>
#include <string>

// Base of every error raised by the fuzzy engine
class FuzzyError : public std::runtime_error {
public:
    explicit FuzzyError(const std::string& message) : std::runtime_error(message) {}
};

// Construction-time failures (configuration is unusable)
class InvalidShapeError : public FuzzyError {
public:
    explicit InvalidShapeError(const std::string& message) : FuzzyError(message) {}
};

class InvalidDomainError : public FuzzyError {
public:
    explicit InvalidDomainError(const std::string& message) : FuzzyError(message) {}
};

class InvalidTermError : public FuzzyError {
public:
    explicit InvalidTermError(const std::string& message) : FuzzyError(message) {}
};

class DomainMismatchError : public FuzzyError {
public:
    explicit DomainMismatchError(const std::string& message) : FuzzyError(message) {}
};

class UnknownTermError : public FuzzyError {
public:
    explicit UnknownTermError(const std::string& message) : FuzzyError(message) {}
};

class InvalidRuleError : public FuzzyError {
public:
    explicit InvalidRuleError(const std::string& message) : FuzzyError(message) {}
};

// Per-call failures (configuration stays valid)
class InvalidInputError : public FuzzyError {
public:
    explicit InvalidInputError(const std::string& message) : FuzzyError(message) {}
};

class MissingInputError : public FuzzyError {
public:
    explicit MissingInputError(const std::string& variable)
        : FuzzyError("Missing input value for variable \"" + variable + "\""),
          variable_(variable) {}

    const std::string& variable() const { return variable_; }

private:
    std::string variable_;
};

class NoRuleFiredError : public FuzzyError {
public:
    explicit NoRuleFiredError(const std::string& variable)
        : FuzzyError("No rule fired for output variable \"" + variable + "\""),
          variable_(variable) {}

    const std::string& variable() const { return variable_; }

private:
    std::string variable_;
};

#endif // FUZZY_ERRORS_H
