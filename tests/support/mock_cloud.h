#pragma once
/**
 * @file mock_cloud.h
 * @brief gmock doubles for the provider and cluster collaborators
 */

#include <gmock/gmock.h>
#include "scaleguard/cloud/provider.h"
#include "scaleguard/cloud/cluster.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scaleguard::test_support {

// ============================================================================
// Provider Mocks
// ============================================================================

class MockScalingGroupClient : public cloud::IScalingGroupClient {
public:
    MOCK_METHOD(ScalingResult, describe_groups,
                (UInt32 max_records, const std::string& next_token, cloud::Page<cloud::GroupDescription>& page),
                (override));
    MOCK_METHOD(ScalingResult, describe_launch_specs,
                (const std::vector<std::string>& names, const std::string& next_token,
                 cloud::Page<cloud::LaunchSpec>& page),
                (override));
    MOCK_METHOD(ScalingResult, set_desired_capacity,
                (const std::string& group_name, Int32 desired_capacity, bool honor_cooldown),
                (override));
    MOCK_METHOD(ScalingResult, terminate_instance,
                (const std::string& instance_id, bool decrement_desired_capacity),
                (override));
    MOCK_METHOD(ScalingResult, describe_activities,
                (const std::string& next_token, cloud::Page<cloud::ScalingActivity>& page),
                (override));
};

class MockComputeClient : public cloud::IComputeClient {
public:
    MOCK_METHOD(ScalingResult, describe_spot_requests,
                (const std::vector<std::string>& request_ids, std::vector<cloud::SpotRequest>& requests),
                (override));
    MOCK_METHOD(ScalingResult, cancel_spot_requests,
                (const std::vector<std::string>& request_ids),
                (override));
    MOCK_METHOD(ScalingResult, describe_spot_price_history,
                (const cloud::SpotPriceQuery& query, const std::string& next_token,
                 cloud::Page<cloud::SpotPriceObservation>& page),
                (override));
};

/**
 * @brief Session handing out one nice mock pair per region
 */
class MockCloudSession : public cloud::ICloudSession {
public:
    std::shared_ptr<cloud::IScalingGroupClient> scaling_client(const std::string& region) override {
        return scaling(region);
    }

    std::shared_ptr<cloud::IComputeClient> compute_client(const std::string& region) override {
        return compute(region);
    }

    std::shared_ptr<::testing::NiceMock<MockScalingGroupClient>> scaling(const std::string& region) {
        auto& client = scaling_clients_[region];
        if (!client) {
            client = std::make_shared<::testing::NiceMock<MockScalingGroupClient>>();
        }
        return client;
    }

    std::shared_ptr<::testing::NiceMock<MockComputeClient>> compute(const std::string& region) {
        auto& client = compute_clients_[region];
        if (!client) {
            client = std::make_shared<::testing::NiceMock<MockComputeClient>>();
        }
        return client;
    }

private:
    std::map<std::string, std::shared_ptr<::testing::NiceMock<MockScalingGroupClient>>> scaling_clients_;
    std::map<std::string, std::shared_ptr<::testing::NiceMock<MockComputeClient>>> compute_clients_;
};

// ============================================================================
// Cluster Doubles
// ============================================================================

class MockClusterNode : public cloud::IClusterNode {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::string, instance_id, (), (const, override));
    MOCK_METHOD(bool, is_unschedulable, (), (const, override));
    MOCK_METHOD(bool, uncordon, (), (override));
};

/**
 * @brief Node with plain state; uncordon() clears the cordon
 */
class FakeClusterNode : public cloud::IClusterNode {
public:
    FakeClusterNode(std::string name, std::string instance_id, bool unschedulable = false)
        : name_(std::move(name)), instance_id_(std::move(instance_id)), unschedulable_(unschedulable) {}

    std::string name() const override { return name_; }
    std::string instance_id() const override { return instance_id_; }
    bool is_unschedulable() const override { return unschedulable_; }

    bool uncordon() override {
        ++uncordon_calls;
        unschedulable_ = false;
        return true;
    }

    int uncordon_calls{0};

private:
    std::string name_;
    std::string instance_id_;
    bool unschedulable_;
};

// ============================================================================
// Builders
// ============================================================================

/**
 * @brief Fixed test epoch; offsets in seconds from it
 */
inline TimePoint at(Int64 seconds) {
    return TimePoint(Seconds(1700000000 + seconds));
}

inline cloud::GroupDescription make_description(const std::string& name,
                                                Int32 desired,
                                                Int32 min_size,
                                                Int32 max_size,
                                                const std::vector<std::string>& instance_ids = {},
                                                const std::string& launch_spec_name = "lc-default") {
    cloud::GroupDescription description;
    description.name = name;
    description.desired_capacity = desired;
    description.min_size = min_size;
    description.max_size = max_size;
    description.launch_spec_name = launch_spec_name;
    for (const auto& id : instance_ids) {
        description.instances.push_back({id, "us-west-2a", "InService"});
    }
    return description;
}

inline cloud::LaunchSpec make_launch_spec(const std::string& instance_type = "m5.large",
                                          std::optional<Real> spot_price = std::nullopt,
                                          const std::string& name = "lc-default") {
    cloud::LaunchSpec spec;
    spec.name = name;
    spec.instance_type = instance_type;
    spec.image_id = "ami-0123456789";
    spec.spot_price = spot_price;
    return spec;
}

inline cloud::ScalingActivity make_activity(const std::string& id,
                                            const std::string& group_name,
                                            TimePoint start_time,
                                            cloud::ActivityStatus status,
                                            const std::string& status_message = "",
                                            const std::string& cause = "",
                                            Int32 progress = 100) {
    cloud::ScalingActivity activity;
    activity.activity_id = id;
    activity.group_name = group_name;
    activity.start_time = start_time;
    activity.progress = progress;
    activity.status = status;
    activity.status_message = status_message;
    activity.cause = cause;
    return activity;
}

} // namespace scaleguard::test_support
