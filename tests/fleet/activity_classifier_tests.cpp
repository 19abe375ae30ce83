/**
 * @file activity_classifier_tests.cpp
 * @brief Unit tests for activity message classification
 */

#include <gtest/gtest.h>
#include "scaleguard/fleet/activity_classifier.h"

using namespace scaleguard;
using namespace scaleguard::fleet;

class ActivityClassifierTest : public ::testing::Test {
protected:
    ActivityClassifier classifier_;
};

// ============================================================================
// Status Message Tests
// ============================================================================

TEST_F(ActivityClassifierTest, InstanceLimit) {
    auto result = classifier_.classify_status(
        "You have requested more instances (12) than your current instance limit of 10 allows "
        "for the specified instance type. Please visit http://aws.amazon.com/contact-us/ec2-request "
        "to request an adjustment to this limit. Launching EC2 instance failed.");

    const auto* limit = std::get_if<InstanceLimitFailure>(&result);
    ASSERT_NE(limit, nullptr);
    EXPECT_EQ(limit->requested, 12);
    EXPECT_EQ(limit->limit, 10);
    EXPECT_STREQ(status_classification_name(result), "InstanceLimit");
}

TEST_F(ActivityClassifierTest, TruncatedInstanceLimitStillMatches) {
    auto result = classifier_.classify_status(
        "You have requested more instances (12) than your current instance limit of 10...");

    const auto* limit = std::get_if<InstanceLimitFailure>(&result);
    ASSERT_NE(limit, nullptr);
    EXPECT_EQ(limit->requested, 12);
}

TEST_F(ActivityClassifierTest, InstanceLimitMustLeadTheMessage) {
    auto result = classifier_.classify_status(
        "Note: You have requested more instances (12) than your current instance limit of 10");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(result));
}

TEST_F(ActivityClassifierTest, OversizedInstanceCountIsUnclassified) {
    // Beyond Int32
    auto wide = classifier_.classify_status(
        "You have requested more instances (3000000000) than your current instance limit of 10...");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(wide));

    // Beyond any native integer
    auto huge = classifier_.classify_status(
        "You have requested more instances (99999999999999999999) than your current instance limit of 10...");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(huge));

    auto huge_limit = classifier_.classify_status(
        "You have requested more instances (12) than your current instance limit of 4294967296...");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(huge_limit));
}

TEST_F(ActivityClassifierTest, LargestInstanceCountStillParses) {
    auto result = classifier_.classify_status(
        "You have requested more instances (2147483647) than your current instance limit of 10...");

    const auto* limit = std::get_if<InstanceLimitFailure>(&result);
    ASSERT_NE(limit, nullptr);
    EXPECT_EQ(limit->requested, 2147483647);
}

TEST_F(ActivityClassifierTest, VolumeLimit) {
    auto result = classifier_.classify_status(
        "Instance became unhealthy while waiting for instance to be in InService state. "
        "Termination Reason: Client.VolumeLimitExceeded: Volume limit exceeded");
    EXPECT_TRUE(std::holds_alternative<VolumeLimitFailure>(result));
}

TEST_F(ActivityClassifierTest, CapacityLimit) {
    auto result = classifier_.classify_status(
        "Insufficient capacity. Launching EC2 instance failed.");
    EXPECT_TRUE(std::holds_alternative<CapacityLimitFailure>(result));
}

TEST_F(ActivityClassifierTest, ZoneCapacityCapturesZone) {
    auto result = classifier_.classify_status(
        "We currently do not have sufficient p3.8xlarge capacity in the Availability Zone you "
        "requested (us-west-2b). Our system will be working on provisioning additional capacity. "
        "Launching EC2 instance failed.");

    const auto* zone = std::get_if<ZoneCapacityFailure>(&result);
    ASSERT_NE(zone, nullptr);
    EXPECT_EQ(zone->zone, "us-west-2b");
}

TEST_F(ActivityClassifierTest, SpotRequestCancelled) {
    auto result = classifier_.classify_status(
        "Spot instance request: sir-abc123 has been cancelled.");

    const auto* cancelled = std::get_if<SpotRequestCancelled>(&result);
    ASSERT_NE(cancelled, nullptr);
    EXPECT_EQ(cancelled->request_id, "sir-abc123");
}

TEST_F(ActivityClassifierTest, SpotLimit) {
    auto result = classifier_.classify_status(
        "Max spot instance count exceeded. Placing Spot instance request failed.");
    EXPECT_TRUE(std::holds_alternative<SpotLimitFailure>(result));
}

TEST_F(ActivityClassifierTest, SpotRequestWaiting) {
    auto result = classifier_.classify_status(
        "Placed Spot instance request: sir-xyz789. Waiting for instance(s)");

    const auto* waiting = std::get_if<SpotRequestWaiting>(&result);
    ASSERT_NE(waiting, nullptr);
    EXPECT_EQ(waiting->request_id, "sir-xyz789");
}

TEST_F(ActivityClassifierTest, UnrecognisedMessage) {
    auto result = classifier_.classify_status("Launching a new EC2 instance: i-0123");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(result));
    EXPECT_STREQ(status_classification_name(result), "Unclassified");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(classifier_.classify_status("")));
}

// ============================================================================
// Cause Message Tests
// ============================================================================

TEST_F(ActivityClassifierTest, LaunchCapacityChange) {
    auto result = classifier_.classify_cause(
        "At 2024-01-31T11:58:03Z a user request update of AutoScalingGroup constraints to min: 1, "
        "max: 20, desired: 5 changing the desired capacity from 3 to 5.  "
        "At 2024-01-31T11:58:10Z an instance was started in response to a difference between "
        "desired and actual capacity, increasing the capacity from 3 to 5.");

    const auto* change = std::get_if<LaunchCapacityChange>(&result);
    ASSERT_NE(change, nullptr);
    EXPECT_EQ(change->original_capacity, 3);
    EXPECT_EQ(change->target_capacity, 5);
}

TEST_F(ActivityClassifierTest, OversizedCapacityChangeIsUnclassified) {
    auto result = classifier_.classify_cause(
        "At 2024-01-31T11:58:10Z an instance was started in response to a difference between "
        "desired and actual capacity, increasing the capacity from 3 to 123456789012345678901.");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(result));
}

TEST_F(ActivityClassifierTest, ZoneRebalance) {
    auto result = classifier_.classify_cause(
        "An instance was launched to aid in balancing the group's zones.");
    EXPECT_TRUE(std::holds_alternative<ZoneRebalanceLaunch>(result));
}

TEST_F(ActivityClassifierTest, UnrecognisedCause) {
    auto result = classifier_.classify_cause("A user request explicitly set group desired capacity");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(result));
}

// ============================================================================
// Termination Error Tests
// ============================================================================

TEST_F(ActivityClassifierTest, MinSizeViolation) {
    EXPECT_TRUE(ActivityClassifier::is_min_size_violation(
        "ValidationError: Currently, desiredSize equals minSize (1). Terminating instance without "
        "replacement will violate group's min size constraint. Either set shouldDecrementDesiredCapacity "
        "flag to false or lower group's min size."));
    EXPECT_FALSE(ActivityClassifier::is_min_size_violation("Instance i-0123 is not part of the group"));
}
