#include <gtest/gtest.h>
#include "inference_engine.h"
#include <cmath>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

// Input x on [0, 10] with disjoint "low" and "high" terms, so x = 5 fires nothing
class InferenceEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        x = std::make_shared<LinguisticVariable>(
            "x", SampledDomain(0, 10, 1), VariableRole::ANTECEDENT,
            std::vector<FuzzySet>{FuzzyUtils::create_triangular_set("low", 0, 0, 3),
                                  FuzzyUtils::create_triangular_set("high", 7, 10, 10)});
        out = std::make_shared<LinguisticVariable>(
            "out", SampledDomain(0, 10, 1), VariableRole::CONSEQUENT,
            std::vector<FuzzySet>{FuzzyUtils::create_triangular_set("a", 0, 2, 4),
                                  FuzzyUtils::create_triangular_set("b", 6, 8, 10)});
    }

    RuleBase make_rule_base() const {
        return RuleBase({FuzzyRule(AntecedentExpr::term(x, "low"), out, "a"),
                         FuzzyRule(AntecedentExpr::term(x, "high"), out, "b")});
    }

    std::shared_ptr<const LinguisticVariable> x;
    std::shared_ptr<const LinguisticVariable> out;
};

TEST_F(InferenceEngineTest, SingleRuleCentroid) {
    InferenceEngine engine(make_rule_base());

    EXPECT_NEAR(engine.infer({{"x", 0}}).at("out"), 2.0, 1e-9) << "Symmetric term centroid";
    EXPECT_NEAR(engine.infer({{"x", 10}}).at("out"), 8.0, 1e-9);
}

TEST_F(InferenceEngineTest, ClippingKeepsSymmetricCentroid) {
    InferenceEngine engine(make_rule_base());

    // low(1.5) = 0.5 clips "a" to a symmetric plateau
    auto trace = engine.infer_with_trace({{"x", 1.5}});
    EXPECT_DOUBLE_EQ(trace.rule_strengths[0], 0.5);
    EXPECT_DOUBLE_EQ(trace.rule_strengths[1], 0.0);
    EXPECT_NEAR(trace.outputs.at("out"), 2.0, 1e-9);

    for (double mu : trace.aggregated.at("out").membership) {
        EXPECT_LE(mu, 0.5) << "Aggregated curve must not exceed the firing strength";
    }
}

TEST_F(InferenceEngineTest, NoRuleFired) {
    InferenceEngine engine(make_rule_base());

    try {
        engine.infer({{"x", 5}});
        FAIL() << "Expected NoRuleFiredError";
    } catch (const NoRuleFiredError& e) {
        EXPECT_EQ(e.variable(), "out");
    }
}

TEST_F(InferenceEngineTest, EveryOutputOrNone) {
    auto second = std::make_shared<LinguisticVariable>(
        "second", SampledDomain(0, 10, 1), VariableRole::CONSEQUENT,
        std::vector<FuzzySet>{FuzzyUtils::create_triangular_set("c", 0, 5, 10)});

    RuleBase rule_base({FuzzyRule(AntecedentExpr::term(x, "low"), out, "a"),
                        FuzzyRule(AntecedentExpr::term(x, "high"), second, "c")});
    InferenceEngine engine(rule_base);

    EXPECT_THROW(engine.infer({{"x", 0}}), NoRuleFiredError) << "One silent output fails the call";
    EXPECT_THROW(engine.infer({{"x", 10}}), NoRuleFiredError);
    EXPECT_THROW(engine.infer_with_trace({{"x", 0}}), NoRuleFiredError);
}

TEST_F(InferenceEngineTest, InputValidation) {
    InferenceEngine engine(make_rule_base());

    EXPECT_THROW(engine.infer({}), MissingInputError);
    EXPECT_THROW(engine.infer({{"y", 1}}), MissingInputError);
    EXPECT_THROW(engine.infer({{"x", std::numeric_limits<double>::quiet_NaN()}}), InvalidInputError);
    EXPECT_THROW(engine.infer({{"x", std::numeric_limits<double>::infinity()}}), InvalidInputError);

    EXPECT_NEAR(engine.infer({{"x", 0}, {"extra", 99}}).at("out"), 2.0, 1e-9) << "Extra inputs ignored";
}

TEST_F(InferenceEngineTest, Deterministic) {
    InferenceEngine engine(make_rule_base());

    for (double value : {0.0, 1.0, 2.5, 7.5, 9.0, 10.0}) {
        EXPECT_EQ(engine.infer({{"x", value}}).at("out"), engine.infer({{"x", value}}).at("out"))
            << "x=" << value;
    }
}

TEST_F(InferenceEngineTest, TraceMatchesInfer) {
    InferenceEngine engine(make_rule_base());
    auto trace = engine.infer_with_trace({{"x", 9}});

    EXPECT_EQ(trace.outputs.at("out"), engine.infer({{"x", 9}}).at("out"));
    ASSERT_EQ(trace.rule_strengths.size(), 2u);
    ASSERT_EQ(trace.input_memberships.count("x"), 1u);
    EXPECT_DOUBLE_EQ(trace.input_memberships.at("x").at("low"), 0.0);
    EXPECT_NEAR(trace.input_memberships.at("x").at("high"), 2.0 / 3.0, 1e-12);

    const auto& aggregated = trace.aggregated.at("out");
    EXPECT_EQ(aggregated.samples.size(), out->domain().size());
    EXPECT_EQ(aggregated.membership.size(), aggregated.samples.size());
    EXPECT_EQ(aggregated.crisp, trace.outputs.at("out"));

    EXPECT_EQ(trace.metrics.rules_fired, 1u);
    EXPECT_NEAR(trace.metrics.max_rule_activation, 2.0 / 3.0, 1e-12);
    EXPECT_GE(trace.metrics.computation_time_ms, 0.0);
}

TEST_F(InferenceEngineTest, FreeFunctionMatchesEngine) {
    auto rule_base = make_rule_base();
    InferenceEngine engine(rule_base);

    EXPECT_EQ(infer(rule_base, {{"x", 1}}).at("out"), engine.infer({{"x", 1}}).at("out"));
    EXPECT_THROW(infer(rule_base, {{"x", 5}}), NoRuleFiredError);
}

TEST_F(InferenceEngineTest, OtherDefuzzificationMethods) {
    InferenceEngine mom(make_rule_base(), DefuzzificationMethod::MEAN_OF_MAXIMUM);
    EXPECT_EQ(mom.method(), DefuzzificationMethod::MEAN_OF_MAXIMUM);
    EXPECT_DOUBLE_EQ(mom.infer({{"x", 0}}).at("out"), 2.0);

    InferenceEngine bisector(make_rule_base(), DefuzzificationMethod::BISECTOR);
    EXPECT_DOUBLE_EQ(bisector.infer({{"x", 10}}).at("out"), 8.0);
}

TEST_F(InferenceEngineTest, OutputListings) {
    InferenceEngine engine(make_rule_base());

    std::ostringstream rules;
    engine.print_rules(rules);
    EXPECT_NE(rules.str().find("=== FUZZY RULES (2 total) ==="), std::string::npos);
    EXPECT_NE(rules.str().find("Rule 0: IF x IS low THEN out IS a"), std::string::npos);

    std::ostringstream sets;
    engine.print_fuzzy_sets(sets);
    EXPECT_NE(sets.str().find("trimf[0, 2, 4]"), std::string::npos);

    std::ostringstream trace;
    engine.print_inference_trace({{"x", 1}}, trace);
    EXPECT_NE(trace.str().find("=== INFERENCE TRACE ==="), std::string::npos);
    EXPECT_NE(trace.str().find("Rules Fired: 1"), std::string::npos);
}

TEST_F(InferenceEngineTest, TraceKeepsCallerStreamFormat) {
    InferenceEngine engine(make_rule_base());

    std::ostringstream out;
    out << std::scientific << std::setprecision(4);
    engine.print_inference_trace({{"x", 1}}, out);

    EXPECT_TRUE(out.flags() & std::ios_base::scientific) << "Float format must be restored";
    EXPECT_EQ(out.precision(), 4);

    std::ostringstream value;
    value.flags(out.flags());
    value.precision(out.precision());
    value << 2.5;
    EXPECT_EQ(value.str(), "2.5000e+00");
}

TEST_F(InferenceEngineTest, SharedEngineAcrossThreads) {
    const InferenceEngine engine(make_rule_base());
    const std::vector<double> readings = {0.0, 0.5, 1.0, 1.5, 2.0, 2.5, 8.0, 8.5, 9.0, 9.5, 10.0};

    std::vector<double> expected;
    for (double reading : readings) {
        expected.push_back(engine.infer({{"x", reading}}).at("out"));
    }

    const size_t thread_count = 4;
    const int rounds = 200;
    std::vector<std::vector<double>> results(thread_count);
    std::vector<std::thread> workers;

    for (size_t t = 0; t < thread_count; ++t) {
        workers.emplace_back([&engine, &readings, &results, t, rounds]() {
            for (int round = 0; round < rounds; ++round) {
                for (double reading : readings) {
                    results[t].push_back(engine.infer({{"x", reading}}).at("out"));
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (size_t t = 0; t < thread_count; ++t) {
        ASSERT_EQ(results[t].size(), readings.size() * rounds) << "thread " << t;
        for (size_t i = 0; i < results[t].size(); ++i) {
            EXPECT_EQ(results[t][i], expected[i % readings.size()]) << "thread " << t << " call " << i;
        }
    }
}

// A narrowing triangle should pull the centroid toward its peak
TEST(InferenceConvergenceTest, CentroidApproachesPeak) {
    const double peak = 5.0;
    double previous_error = std::numeric_limits<double>::infinity();

    for (double width : {1.0, 0.1, 0.01}) {
        auto input = std::make_shared<LinguisticVariable>(
            "x", SampledDomain(0, 1, 0.5), VariableRole::ANTECEDENT,
            std::vector<FuzzySet>{FuzzyUtils::create_trapezoidal_set("any", 0, 0, 1, 1)});
        auto output = std::make_shared<LinguisticVariable>(
            "y", SampledDomain(0, 10, 0.001), VariableRole::CONSEQUENT,
            std::vector<FuzzySet>{
                FuzzyUtils::create_triangular_set("spike", peak - width, peak, peak + 2 * width)});

        RuleBase rule_base({FuzzyRule(AntecedentExpr::term(input, "any"), output, "spike")});
        double error = std::fabs(infer(rule_base, {{"x", 0.5}}).at("y") - peak);

        EXPECT_LT(error, previous_error) << "width=" << width;
        previous_error = error;
    }

    EXPECT_LT(previous_error, 0.01);
}

TEST(DefuzzificationTest, SimpleSets) {
    std::vector<double> samples = {0, 1, 2, 3, 4};
    std::vector<double> membership = {0, 1, 1, 0, 0};

    EXPECT_DOUBLE_EQ(FuzzyUtils::centroid(samples, membership), 1.5);
    EXPECT_DOUBLE_EQ(FuzzyUtils::mean_of_maximum(samples, membership), 1.5);
    EXPECT_DOUBLE_EQ(FuzzyUtils::bisector(samples, membership), 1.0);
}

TEST(DefuzzificationTest, RejectsEmptyOrMismatchedSets) {
    std::vector<double> samples = {0, 1, 2};

    EXPECT_THROW(FuzzyUtils::centroid(samples, {0, 0, 0}), InvalidInputError);
    EXPECT_THROW(FuzzyUtils::bisector(samples, {0, 0, 0}), InvalidInputError);
    EXPECT_THROW(FuzzyUtils::mean_of_maximum(samples, {1, 0}), InvalidInputError);
}

TEST(DefuzzificationTest, RoundOutput) {
    EXPECT_DOUBLE_EQ(FuzzyUtils::round_output(53.666666), 53.67);
    EXPECT_DOUBLE_EQ(FuzzyUtils::round_output(20.664), 20.66);
    EXPECT_DOUBLE_EQ(FuzzyUtils::round_output(40.0), 40.0);
}
