#pragma once
/**
 * @file activity_classifier.h
 * @brief Pattern table over provider activity messages
 *
 * Maps the free-text status and cause messages of scaling activities to a
 * closed set of tagged outcomes. Provider wording is not a versioned
 * contract, so every pattern lives here and nowhere else.
 */

#include "scaleguard/core/types.h"
#include <regex>
#include <string>
#include <variant>

namespace scaleguard::fleet {

// ============================================================================
// Status Message Outcomes
// ============================================================================

/**
 * @brief Launch failed because the account instance limit was reached
 */
struct InstanceLimitFailure {
    Int32 requested{0};     ///< Instances requested when the launch failed
    Int32 limit{0};         ///< Account limit for the instance type
};

/**
 * @brief Instance went unhealthy because the volume limit was exceeded
 */
struct VolumeLimitFailure {};

/**
 * @brief Provider reported insufficient capacity for the instance type
 */
struct CapacityLimitFailure {};

/**
 * @brief Provider lacks capacity in the requested availability zone
 */
struct ZoneCapacityFailure {
    std::string zone;
};

/**
 * @brief A spot request placed by the group was cancelled
 */
struct SpotRequestCancelled {
    std::string request_id;
};

/**
 * @brief Account spot instance count exceeded
 */
struct SpotLimitFailure {};

/**
 * @brief A spot request is placed and waiting for an instance
 */
struct SpotRequestWaiting {
    std::string request_id;
};

/**
 * @brief Classified status message, std::monostate when unrecognised
 */
using StatusClassification = std::variant<
    std::monostate,
    InstanceLimitFailure,
    VolumeLimitFailure,
    CapacityLimitFailure,
    ZoneCapacityFailure,
    SpotRequestCancelled,
    SpotLimitFailure,
    SpotRequestWaiting
>;

// ============================================================================
// Cause Message Outcomes
// ============================================================================

/**
 * @brief Launch triggered by a desired-capacity increase
 */
struct LaunchCapacityChange {
    Int32 original_capacity{0};
    Int32 target_capacity{0};
};

/**
 * @brief Launch issued by the provider to rebalance availability zones
 */
struct ZoneRebalanceLaunch {};

/**
 * @brief Classified cause message, std::monostate when unrecognised
 */
using CauseClassification = std::variant<
    std::monostate,
    LaunchCapacityChange,
    ZoneRebalanceLaunch
>;

/**
 * @brief Short name of a status outcome for logging
 */
const char* status_classification_name(const StatusClassification& classification);

// ============================================================================
// Activity Classifier
// ============================================================================

/**
 * @brief Ordered pattern rules over activity messages
 *
 * Status rules are tried in this order and the first match wins:
 * instance limit, volume limit, capacity limit, zone capacity, spot request
 * cancelled, spot limit, spot request waiting.
 */
class ActivityClassifier {
public:
    ActivityClassifier();

    /**
     * @brief Classify an activity status message
     */
    StatusClassification classify_status(const std::string& message) const;

    /**
     * @brief Classify an activity cause message
     */
    CauseClassification classify_cause(const std::string& message) const;

    /**
     * @brief True if a termination error message reports a min size violation
     *
     * Used by provider clients to map the rejection to
     * ScalingResult::MinSizeViolation.
     */
    static bool is_min_size_violation(const std::string& message);

private:
    std::regex instance_limit_;
    std::regex volume_limit_;
    std::regex capacity_limit_;
    std::regex zone_capacity_;
    std::regex spot_request_cancelled_;
    std::regex spot_limit_;
    std::regex spot_request_waiting_;

    std::regex launch_capacity_change_;
    std::regex zone_rebalance_;
};

} // namespace scaleguard::fleet
