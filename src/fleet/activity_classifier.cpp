/**
 * @file activity_classifier.cpp
 * @brief Implementation of the activity message pattern table
 */

#include "scaleguard/fleet/activity_classifier.h"
#include <charconv>
#include <limits>
#include <optional>

namespace scaleguard::fleet {

namespace {

// Anchored at the start of the message
bool match_prefix(const std::string& message, const std::regex& pattern, std::smatch& match) {
    return std::regex_search(message, match, pattern, std::regex_constants::match_continuous);
}

bool match_anywhere(const std::string& message, const std::regex& pattern, std::smatch& match) {
    return std::regex_search(message, match, pattern);
}

// Empty when the digits do not fit an Int32
std::optional<Int32> to_int(const std::ssub_match& group) {
    const std::string digits = group.str();
    Int64 value = 0;
    const auto [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (error != std::errc{} || end != digits.data() + digits.size()) {
        return std::nullopt;
    }
    if (value < std::numeric_limits<Int32>::min() || value > std::numeric_limits<Int32>::max()) {
        return std::nullopt;
    }
    return static_cast<Int32>(value);
}

constexpr const char* MIN_SIZE_VIOLATION_TEXT =
    "Terminating instance without replacement will violate group's min size constraint.";

} // anonymous namespace

// ============================================================================
// Outcome Names
// ============================================================================

const char* status_classification_name(const StatusClassification& classification) {
    switch (classification.index()) {
        case 0: return "Unclassified";
        case 1: return "InstanceLimit";
        case 2: return "VolumeLimit";
        case 3: return "CapacityLimit";
        case 4: return "ZoneCapacity";
        case 5: return "SpotRequestCancelled";
        case 6: return "SpotLimit";
        case 7: return "SpotRequestWaiting";
        default: return "Unknown";
    }
}

// ============================================================================
// ActivityClassifier Implementation
// ============================================================================

ActivityClassifier::ActivityClassifier()
    : instance_limit_(
          R"(You have requested more instances \((\d+)\) than your current instance limit of (\d+))")
    , volume_limit_(
          R"(Instance became unhealthy while waiting for instance to be in InService state\. )"
          R"(Termination Reason: Client\.VolumeLimitExceeded: Volume limit exceeded)")
    , capacity_limit_(R"(Insufficient capacity\. Launching EC2 instance failed\.)")
    , zone_capacity_(
          R"(We currently do not have sufficient .+ capacity in the Availability Zone you requested \(?([^)\s]+?)\)?\.)")
    , spot_request_cancelled_(R"(Spot instance request: (\S+) has been cancelled\.)")
    , spot_limit_(R"(Max spot instance count exceeded\. Placing Spot instance request failed\.)")
    , spot_request_waiting_(R"(Placed Spot instance request: (\S+)\. Waiting for instance\(s\))")
    , launch_capacity_change_(
          R"(At \d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z an instance was started in response to a )"
          R"(difference between desired and actual capacity, increasing the capacity from (\d+) to (\d+)\.)")
    , zone_rebalance_(R"(An instance was launched to aid in balancing the group's zones\.)")
{}

StatusClassification ActivityClassifier::classify_status(const std::string& message) const {
    std::smatch match;

    if (match_prefix(message, instance_limit_, match)) {
        const auto requested = to_int(match[1]);
        const auto limit = to_int(match[2]);
        if (!requested || !limit) {
            return std::monostate{};
        }
        return InstanceLimitFailure{*requested, *limit};
    }
    if (match_prefix(message, volume_limit_, match)) {
        return VolumeLimitFailure{};
    }
    if (match_prefix(message, capacity_limit_, match)) {
        return CapacityLimitFailure{};
    }
    if (match_anywhere(message, zone_capacity_, match)) {
        return ZoneCapacityFailure{match[1].str()};
    }
    if (match_anywhere(message, spot_request_cancelled_, match)) {
        return SpotRequestCancelled{match[1].str()};
    }
    if (match_prefix(message, spot_limit_, match)) {
        return SpotLimitFailure{};
    }
    if (match_anywhere(message, spot_request_waiting_, match)) {
        return SpotRequestWaiting{match[1].str()};
    }

    return std::monostate{};
}

CauseClassification ActivityClassifier::classify_cause(const std::string& message) const {
    std::smatch match;

    if (match_anywhere(message, launch_capacity_change_, match)) {
        const auto original = to_int(match[1]);
        const auto target = to_int(match[2]);
        if (!original || !target) {
            return std::monostate{};
        }
        return LaunchCapacityChange{*original, *target};
    }
    if (match_anywhere(message, zone_rebalance_, match)) {
        return ZoneRebalanceLaunch{};
    }

    return std::monostate{};
}

bool ActivityClassifier::is_min_size_violation(const std::string& message) {
    return message.find(MIN_SIZE_VIOLATION_TEXT) != std::string::npos;
}

} // namespace scaleguard::fleet
