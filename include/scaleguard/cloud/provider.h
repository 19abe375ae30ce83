#pragma once
/**
 * @file provider.h
 * @brief Cloud provider interfaces consumed by the fleet components
 *
 * The HTTP, authentication and retry plumbing of a concrete provider lives
 * behind these interfaces. Every call reports a ScalingResult and fills an
 * output record or page.
 *
 * Key features:
 * - Scaling-group client: groups, launch specifications, activities,
 *   desired-capacity and termination mutations
 * - Compute client: spot requests and spot price history
 * - Per-region session handing out clients
 * - Token-based pagination helpers
 */

#include "scaleguard/core/types.h"
#include "scaleguard/core/result.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scaleguard::cloud {

// ============================================================================
// Scaling Group Records
// ============================================================================

/**
 * @brief Key/value tag attached to a scaling group
 */
struct ResourceTag {
    std::string key;
    std::string value;
};

/**
 * @brief Instance currently registered in a scaling group
 */
struct GroupInstance {
    std::string instance_id;
    std::string availability_zone;
    std::string lifecycle_state;
};

/**
 * @brief Provider snapshot of a scaling group
 */
struct GroupDescription {
    std::string name;
    Int32 desired_capacity{0};
    Int32 min_size{0};
    Int32 max_size{0};
    std::string launch_spec_name;               ///< Launch specification used by the group
    std::vector<ResourceTag> tags;
    std::vector<GroupInstance> instances;
};

/**
 * @brief Launch specification (instance template) of a group
 */
struct LaunchSpec {
    std::string name;
    std::string instance_type;                  ///< e.g. "m5.large"
    std::string image_id;
    std::optional<Real> spot_price;             ///< Bid price, present for spot groups
};

// ============================================================================
// Scaling Activities
// ============================================================================

/**
 * @brief Status code of a scaling activity
 */
enum class ActivityStatus : UInt8 {
    PendingSpotBidPlacement,
    WaitingForSpotInstanceRequestId,
    WaitingForSpotInstanceId,
    WaitingForInstanceId,
    PreInService,
    InProgress,
    WaitingForELBConnectionDraining,
    MidLifecycleAction,
    WaitingForInstanceWarmup,
    Successful,
    Failed,
    Cancelled,
    Unknown
};

/**
 * @brief Convert ActivityStatus to its provider status code
 */
const char* activity_status_to_string(ActivityStatus status);

/**
 * @brief Parse a provider status code, Unknown when unrecognised
 */
ActivityStatus parse_activity_status(const std::string& code);

/**
 * @brief Historical provisioning event of a group
 */
struct ScalingActivity {
    std::string activity_id;
    std::string group_name;                     ///< Owning group
    TimePoint start_time;
    Int32 progress{0};                          ///< Completion percentage (0-100)
    ActivityStatus status{ActivityStatus::Unknown};
    std::string status_message;
    std::string cause;                          ///< Free-text cause
    std::string description;
};

// ============================================================================
// Spot Records
// ============================================================================

/**
 * @brief Spot instance request state
 */
struct SpotRequest {
    std::string request_id;
    std::string state;                          ///< open, active, closed, cancelled, failed
};

/**
 * @brief One spot price observation
 */
struct SpotPriceObservation {
    TimePoint timestamp;
    std::string availability_zone;
    std::string instance_type;
    Real price{0.0};
};

/**
 * @brief Spot price history filter
 */
struct SpotPriceQuery {
    TimePoint start_time;
    std::vector<std::string> instance_types;
    std::vector<std::string> product_descriptions;
};

// ============================================================================
// Pagination
// ============================================================================

/**
 * @brief One page of a paginated listing
 */
template<typename Item>
struct Page {
    std::vector<Item> items;
    std::string next_token;                     ///< Empty on the last page
};

/**
 * @brief Visit every item of a paginated listing in order
 *
 * @param fetch_page Callable (const std::string& token, Page<Item>&) -> ScalingResult
 * @param visit Callable (const Item&) -> bool, return false to stop early
 * @return First failing page result, Success otherwise
 */
template<typename Item, typename FetchPage, typename Visit>
ScalingResult for_each_item(FetchPage&& fetch_page, Visit&& visit) {
    std::string token;
    do {
        Page<Item> page;
        ScalingResult result = fetch_page(token, page);
        if (result != ScalingResult::Success) {
            return result;
        }
        for (const auto& item : page.items) {
            if (!visit(item)) {
                return ScalingResult::Success;
            }
        }
        token = page.next_token;
    } while (!token.empty());

    return ScalingResult::Success;
}

/**
 * @brief Collect every item of a paginated listing
 */
template<typename Item, typename FetchPage>
ScalingResult fetch_all(FetchPage&& fetch_page, std::vector<Item>& items) {
    return for_each_item<Item>(std::forward<FetchPage>(fetch_page), [&items](const Item& item) {
        items.push_back(item);
        return true;
    });
}

// ============================================================================
// Client Interfaces
// ============================================================================

/**
 * @brief Regional scaling-group API
 */
class IScalingGroupClient {
public:
    virtual ~IScalingGroupClient() = default;

    /**
     * @brief List scaling groups
     * @param max_records Page size (provider limit 100)
     * @param next_token Continuation token, empty for the first page
     * @param page Output page
     */
    virtual ScalingResult describe_groups(UInt32 max_records,
                                          const std::string& next_token,
                                          Page<GroupDescription>& page) = 0;

    /**
     * @brief List launch specifications by name
     * @param names Specification names (at most 50 per call)
     */
    virtual ScalingResult describe_launch_specs(const std::vector<std::string>& names,
                                                const std::string& next_token,
                                                Page<LaunchSpec>& page) = 0;

    /**
     * @brief Set a group's desired capacity
     * @param honor_cooldown False applies the change immediately
     */
    virtual ScalingResult set_desired_capacity(const std::string& group_name,
                                               Int32 desired_capacity,
                                               bool honor_cooldown) = 0;

    /**
     * @brief Terminate one instance of a group
     * @return MinSizeViolation when the provider refuses to go below min size
     *         without replacement
     */
    virtual ScalingResult terminate_instance(const std::string& instance_id,
                                             bool decrement_desired_capacity) = 0;

    /**
     * @brief List scaling activities, newest first
     */
    virtual ScalingResult describe_activities(const std::string& next_token,
                                              Page<ScalingActivity>& page) = 0;
};

/**
 * @brief Regional compute API (spot market)
 */
class IComputeClient {
public:
    virtual ~IComputeClient() = default;

    /**
     * @brief Describe spot requests; unknown ids are omitted from the output
     */
    virtual ScalingResult describe_spot_requests(const std::vector<std::string>& request_ids,
                                                 std::vector<SpotRequest>& requests) = 0;

    /**
     * @brief Cancel spot requests
     */
    virtual ScalingResult cancel_spot_requests(const std::vector<std::string>& request_ids) = 0;

    /**
     * @brief List spot price history matching the query
     */
    virtual ScalingResult describe_spot_price_history(const SpotPriceQuery& query,
                                                      const std::string& next_token,
                                                      Page<SpotPriceObservation>& page) = 0;
};

/**
 * @brief Provider session handing out regional clients
 *
 * Clients are requested from the control-loop thread only.
 */
class ICloudSession {
public:
    virtual ~ICloudSession() = default;

    virtual std::shared_ptr<IScalingGroupClient> scaling_client(const std::string& region) = 0;

    virtual std::shared_ptr<IComputeClient> compute_client(const std::string& region) = 0;
};

} // namespace scaleguard::cloud
