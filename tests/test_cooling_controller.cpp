#include <gtest/gtest.h>
#include "cooling_controller.h"
#include <optional>

class CoolingControllerTest : public ::testing::Test {
protected:
    CoolingController controller;
};

TEST_F(CoolingControllerTest, RoomTooHotTurnsCoolingOn) {
    double cooling = controller.compute_cooling(-10, 0);
    EXPECT_NEAR(cooling, 0.798, 0.001);
    EXPECT_EQ(CoolingUtils::cooling_status(cooling), CoolingStatus::ON);
}

TEST_F(CoolingControllerTest, OnTargetTurnsCoolingOff) {
    double cooling = controller.compute_cooling(0, 0);
    EXPECT_NEAR(cooling, 0.202, 0.001);
    EXPECT_EQ(CoolingUtils::cooling_status(cooling), CoolingStatus::OFF);
}

TEST_F(CoolingControllerTest, SlightlyWarmIsModerate) {
    // negative(-1) = 0.25 fires "on", zero(-1) = 0.5 fires "off"
    double cooling = controller.compute_cooling(-1, 0);
    EXPECT_EQ(CoolingUtils::cooling_status(cooling), CoolingStatus::MODERATE) << "cooling=" << cooling;
}

TEST_F(CoolingControllerTest, RisingTemperatureAddsCooling) {
    double steady = controller.compute_cooling(0, 0);
    double rising = controller.compute_cooling(0, 8);
    EXPECT_GT(rising, steady);
}

TEST_F(CoolingControllerTest, OutputStaysInUnitInterval) {
    for (double error = -10; error <= 10; error += 2.5) {
        for (double error_dot = -15; error_dot <= 15; error_dot += 5) {
            double cooling = controller.compute_cooling(error, error_dot);
            EXPECT_GE(cooling, 0.0) << error << " " << error_dot;
            EXPECT_LE(cooling, 1.0) << error << " " << error_dot;
        }
    }
}

TEST_F(CoolingControllerTest, RangeChecksAndClamping) {
    EXPECT_THROW(controller.compute_cooling(12, 0), InvalidInputError);
    EXPECT_THROW(controller.compute_cooling(0, -20), InvalidInputError);

    EXPECT_DOUBLE_EQ(controller.clamp_error(12), 10.0);
    EXPECT_DOUBLE_EQ(controller.clamp_error(-3), -3.0);
    EXPECT_DOUBLE_EQ(controller.clamp_error_dot(-20), -15.0);
}

TEST_F(CoolingControllerTest, TraceListsBothInputs) {
    auto trace = controller.cooling_trace(-10, 0);
    EXPECT_EQ(trace.input_memberships.size(), 2u);
    EXPECT_EQ(trace.rule_strengths.size(), 5u);
    EXPECT_EQ(trace.metrics.rules_fired, 1u);
    EXPECT_EQ(trace.outputs.at("cooling"), controller.compute_cooling(-10, 0));
}

TEST(CoolingUtilsTest, ErrorAndRate) {
    EXPECT_DOUBLE_EQ(CoolingUtils::temperature_error(72, 75), -3.0);
    EXPECT_DOUBLE_EQ(CoolingUtils::error_rate(std::nullopt, -3.0), 0.0) << "First reading has no rate";
    EXPECT_DOUBLE_EQ(CoolingUtils::error_rate(2.0, 3.5), -1.5);
}

TEST(CoolingUtilsTest, StatusThresholds) {
    EXPECT_EQ(CoolingUtils::cooling_status(0.29), CoolingStatus::OFF);
    EXPECT_EQ(CoolingUtils::cooling_status(0.3), CoolingStatus::MODERATE);
    EXPECT_EQ(CoolingUtils::cooling_status(0.5), CoolingStatus::MODERATE);
    EXPECT_EQ(CoolingUtils::cooling_status(0.7), CoolingStatus::MODERATE);
    EXPECT_EQ(CoolingUtils::cooling_status(0.71), CoolingStatus::ON);
    EXPECT_EQ(CoolingUtils::status_name(CoolingStatus::ON), "ON");
    EXPECT_EQ(CoolingUtils::status_name(CoolingStatus::OFF), "OFF");
}
