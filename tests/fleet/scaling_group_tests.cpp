/**
 * @file scaling_group_tests.cpp
 * @brief Unit tests for the scaling group entity
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "scaleguard/fleet/scaling_group.h"
#include "support/mock_cloud.h"

using namespace scaleguard;
using namespace scaleguard::fleet;
using namespace scaleguard::test_support;
using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;

// ============================================================================
// Test Fixtures
// ============================================================================

class ScalingGroupTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<StrictMock<MockScalingGroupClient>>();
    }

    ScalingGroup make_group(Int32 desired, Int32 min_size, Int32 max_size,
                            const std::vector<std::string>& instance_ids = {},
                            const cloud::LaunchSpec& spec = make_launch_spec()) {
        auto description = make_description("workers", desired, min_size, max_size, instance_ids);
        description.tags = {{"kube/team", "infra"}, {"KubernetesCluster", "prod"}};
        return ScalingGroup(client_, "us-west-2", nodes_, description, spec);
    }

    std::shared_ptr<FakeClusterNode> add_node(const std::string& instance_id, bool unschedulable = false) {
        auto node = std::make_shared<FakeClusterNode>("node-" + instance_id, instance_id, unschedulable);
        nodes_.push_back(node);
        return node;
    }

    std::shared_ptr<StrictMock<MockScalingGroupClient>> client_;
    std::vector<cloud::ClusterNodePtr> nodes_;
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST_F(ScalingGroupTest, AttributesFromSnapshot) {
    auto group = make_group(3, 1, 10, {}, make_launch_spec("c5.xlarge"));

    EXPECT_EQ(group.name(), "workers");
    EXPECT_EQ(group.region(), "us-west-2");
    EXPECT_EQ(group.id(), (GroupId{"us-west-2", "workers"}));
    EXPECT_EQ(group.desired_capacity(), 3);
    EXPECT_EQ(group.min_size(), 1);
    EXPECT_EQ(group.max_size(), 10);
    EXPECT_EQ(group.instance_type(), "c5.xlarge");
    EXPECT_EQ(group.image_id(), "ami-0123456789");
    EXPECT_FALSE(group.is_spot());
    EXPECT_FALSE(group.bid_price().has_value());
    EXPECT_EQ(group.global_priority(), 0);
    EXPECT_TRUE(group.no_schedule_taints().empty());
}

TEST_F(ScalingGroupTest, SpotGroupCarriesBidPrice) {
    auto group = make_group(1, 0, 5, {}, make_launch_spec("m5.large", 0.12));

    EXPECT_TRUE(group.is_spot());
    ASSERT_TRUE(group.bid_price().has_value());
    EXPECT_DOUBLE_EQ(*group.bid_price(), 0.12);
}

TEST_F(ScalingGroupTest, SelectorsFromLaunchSpecAndTags) {
    auto group = make_group(1, 0, 5, {}, make_launch_spec("c5.xlarge"));
    const auto& selectors = group.selectors();

    EXPECT_EQ(selectors.at("aws/type"), "c5.xlarge");
    EXPECT_EQ(selectors.at("aws/class"), "c");
    EXPECT_EQ(selectors.at("aws/ami-id"), "ami-0123456789");
    EXPECT_EQ(selectors.at("aws/region"), "us-west-2");
    EXPECT_EQ(selectors.at("beta.kubernetes.io/instance-type"), "c5.xlarge");
    EXPECT_EQ(selectors.at("failure-domain.beta.kubernetes.io/region"), "us-west-2");
    EXPECT_EQ(selectors.at("team"), "infra");
    // Tags without the selector prefix are not labels
    EXPECT_EQ(selectors.count("KubernetesCluster"), 0u);
    EXPECT_EQ(selectors.size(), 7u);
}

TEST_F(ScalingGroupTest, MembershipJoinsClusterNodes) {
    auto a = add_node("i-a");
    auto b = add_node("i-b", true);
    add_node("i-other");

    auto group = make_group(3, 0, 5, {"i-a", "i-b", "i-pending"});

    EXPECT_EQ(group.instance_ids().size(), 3u);
    ASSERT_EQ(group.nodes().size(), 2u);
    EXPECT_EQ(group.actual_capacity(), 2);
    ASSERT_EQ(group.unschedulable_nodes().size(), 1u);
    EXPECT_EQ(group.unschedulable_nodes()[0], b);
    EXPECT_TRUE(group.contains(*a));
    EXPECT_FALSE(group.contains(FakeClusterNode("x", "i-other")));
}

TEST_F(ScalingGroupTest, ToStringIsStable) {
    auto first = make_group(1, 0, 5);
    auto second = make_group(4, 0, 9);

    EXPECT_EQ(first.to_string(), second.to_string());
    EXPECT_EQ(first.to_string().rfind("ScalingGroup(workers, ", 0), 0u);
    EXPECT_EQ(selectors_to_hash(first.selectors()).size(), 16u);

    auto other = make_group(1, 0, 5, {}, make_launch_spec("r5.large"));
    EXPECT_NE(first.to_string(), other.to_string());
}

// ============================================================================
// scale Tests
// ============================================================================

TEST_F(ScalingGroupTest, ScaleToCurrentDesiredIsNoOp) {
    for (const auto& id : {"i-1", "i-2", "i-3", "i-4", "i-5"}) {
        add_node(id);
    }
    auto group = make_group(5, 1, 10, {"i-1", "i-2", "i-3", "i-4", "i-5"});

    bool increased = true;
    EXPECT_EQ(group.scale(5, increased), ScalingResult::Success);
    EXPECT_FALSE(increased);
    EXPECT_EQ(group.desired_capacity(), 5);
}

TEST_F(ScalingGroupTest, ScaleUpUncordonsThenRaisesCapacity) {
    add_node("i-1");
    add_node("i-2");
    auto cordoned = add_node("i-3", true);
    auto group = make_group(3, 1, 10, {"i-1", "i-2", "i-3"});

    EXPECT_CALL(*client_, set_desired_capacity("workers", 5, false)).WillOnce(Return(ScalingResult::Success));

    bool increased = false;
    EXPECT_EQ(group.scale(5, increased), ScalingResult::Success);
    EXPECT_TRUE(increased);
    EXPECT_EQ(group.desired_capacity(), 5);
    EXPECT_EQ(cordoned->uncordon_calls, 1);
    EXPECT_FALSE(cordoned->is_unschedulable());
}

TEST_F(ScalingGroupTest, UncordonStopsAtTarget) {
    add_node("i-1");
    auto first = add_node("i-2", true);
    auto second = add_node("i-3", true);
    auto group = make_group(3, 1, 10, {"i-1", "i-2", "i-3"});

    bool increased = true;
    EXPECT_EQ(group.scale(2, increased), ScalingResult::Success);
    EXPECT_FALSE(increased);
    EXPECT_EQ(first->uncordon_calls + second->uncordon_calls, 1);
}

TEST_F(ScalingGroupTest, FailedUncordonIsNotCounted) {
    add_node("i-1");
    auto stuck = std::make_shared<NiceMock<MockClusterNode>>();
    ON_CALL(*stuck, name()).WillByDefault(Return("node-stuck"));
    ON_CALL(*stuck, instance_id()).WillByDefault(Return("i-stuck"));
    ON_CALL(*stuck, is_unschedulable()).WillByDefault(Return(true));
    EXPECT_CALL(*stuck, uncordon()).WillOnce(Return(false));
    nodes_.push_back(stuck);
    auto cordoned = add_node("i-2", true);

    auto group = make_group(3, 1, 10, {"i-1", "i-stuck", "i-2"});

    bool increased = true;
    EXPECT_EQ(group.scale(2, increased), ScalingResult::Success);
    EXPECT_EQ(cordoned->uncordon_calls, 1);
}

TEST_F(ScalingGroupTest, ScaleClampsToMaxSize) {
    auto group = make_group(3, 1, 6);

    EXPECT_CALL(*client_, set_desired_capacity("workers", 6, false)).WillOnce(Return(ScalingResult::Success));

    bool increased = false;
    EXPECT_EQ(group.scale(50, increased), ScalingResult::Success);
    EXPECT_TRUE(increased);
    EXPECT_EQ(group.desired_capacity(), 6);
}

TEST_F(ScalingGroupTest, ScaleAtMaxDoesNothing) {
    auto group = make_group(6, 1, 6);

    bool increased = true;
    EXPECT_EQ(group.scale(6, increased), ScalingResult::Success);
    EXPECT_FALSE(increased);
}

TEST_F(ScalingGroupTest, ScaleNeverLowersCapacity) {
    auto group = make_group(5, 1, 10);

    bool increased = true;
    EXPECT_EQ(group.scale(2, increased), ScalingResult::Success);
    EXPECT_FALSE(increased);
    EXPECT_EQ(group.desired_capacity(), 5);
}

TEST_F(ScalingGroupTest, ScaleFailureKeepsLocalCapacity) {
    auto group = make_group(3, 1, 10);

    EXPECT_CALL(*client_, set_desired_capacity("workers", 4, false)).WillOnce(Return(ScalingResult::Throttled));

    bool increased = true;
    EXPECT_EQ(group.scale(4, increased), ScalingResult::Throttled);
    EXPECT_FALSE(increased);
    EXPECT_EQ(group.desired_capacity(), 3);
}

TEST_F(ScalingGroupTest, SetDesiredCapacityBypassesValidation) {
    auto group = make_group(3, 2, 10);

    EXPECT_CALL(*client_, set_desired_capacity("workers", 1, false)).WillOnce(Return(ScalingResult::Success));

    EXPECT_EQ(group.set_desired_capacity(1), ScalingResult::Success);
    EXPECT_EQ(group.desired_capacity(), 1);
}

// ============================================================================
// scale_nodes_in Tests
// ============================================================================

TEST_F(ScalingGroupTest, ScaleNodesInDecrementsAboveMin) {
    auto a = add_node("i-a");
    auto b = add_node("i-b");
    auto group = make_group(2, 1, 5, {"i-a", "i-b"});

    {
        InSequence seq;
        EXPECT_CALL(*client_, terminate_instance("i-a", true)).WillOnce(Return(ScalingResult::Success));
        EXPECT_CALL(*client_, terminate_instance("i-b", false)).WillOnce(Return(ScalingResult::Success));
    }

    EXPECT_EQ(group.scale_nodes_in({a, b}), ScalingResult::Success);
    EXPECT_EQ(group.desired_capacity(), 1);
    EXPECT_TRUE(group.nodes().empty());
    EXPECT_TRUE(group.instance_ids().empty());
}

TEST_F(ScalingGroupTest, MinSizeViolationIsSkipped) {
    auto a = add_node("i-a");
    auto b = add_node("i-b");
    auto group = make_group(3, 1, 5, {"i-a", "i-b"});

    EXPECT_CALL(*client_, terminate_instance("i-a", true)).WillOnce(Return(ScalingResult::MinSizeViolation));
    EXPECT_CALL(*client_, terminate_instance("i-b", true)).WillOnce(Return(ScalingResult::Success));

    EXPECT_EQ(group.scale_nodes_in({a, b}), ScalingResult::Success);
    EXPECT_TRUE(group.contains(*a));
    EXPECT_FALSE(group.contains(*b));
    EXPECT_EQ(group.desired_capacity(), 2);
}

TEST_F(ScalingGroupTest, OtherTerminationFailureAborts) {
    auto a = add_node("i-a");
    auto b = add_node("i-b");
    auto group = make_group(3, 1, 5, {"i-a", "i-b"});

    EXPECT_CALL(*client_, terminate_instance("i-a", true)).WillOnce(Return(ScalingResult::ProviderAPIError));
    EXPECT_CALL(*client_, terminate_instance("i-b", _)).Times(0);

    EXPECT_EQ(group.scale_nodes_in({a, b}), ScalingResult::ProviderAPIError);
    EXPECT_EQ(group.actual_capacity(), 2);
}

// ============================================================================
// Predicate Tests
// ============================================================================

TEST_F(ScalingGroupTest, SelectorMatching) {
    auto group = make_group(1, 0, 5, {}, make_launch_spec("m5.large"));

    EXPECT_TRUE(group.is_match_for_selectors({}));
    EXPECT_TRUE(group.is_match_for_selectors({{"aws/type", "m5.large"}, {"team", "infra"}}));
    EXPECT_FALSE(group.is_match_for_selectors({{"aws/type", "c5.large"}}));
    EXPECT_FALSE(group.is_match_for_selectors({{"gpu", "true"}}));
}

TEST_F(ScalingGroupTest, TaintToleration) {
    auto group = make_group(1, 0, 5);

    cloud::Workload workload;
    workload.selectors = {{"aws/class", "m"}};
    EXPECT_TRUE(group.is_taints_tolerated(workload));

    group.set_no_schedule_taints({{"dedicated", "batch"}});
    EXPECT_FALSE(group.is_taints_tolerated(workload));

    workload.no_schedule_existential_tolerations.insert("dedicated");
    EXPECT_TRUE(group.is_taints_tolerated(workload));

    cloud::Workload wildcard;
    wildcard.no_schedule_wildcard_toleration = true;
    EXPECT_TRUE(group.is_taints_tolerated(wildcard));

    // Selector mismatch wins over tolerations
    wildcard.selectors = {{"aws/class", "c"}};
    EXPECT_FALSE(group.is_taints_tolerated(wildcard));
}
