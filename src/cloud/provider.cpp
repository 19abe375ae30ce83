/**
 * @file provider.cpp
 * @brief Activity status code conversions
 */

#include "scaleguard/cloud/provider.h"
#include <unordered_map>

namespace scaleguard::cloud {

const char* activity_status_to_string(ActivityStatus status) {
    switch (status) {
        case ActivityStatus::PendingSpotBidPlacement: return "PendingSpotBidPlacement";
        case ActivityStatus::WaitingForSpotInstanceRequestId: return "WaitingForSpotInstanceRequestId";
        case ActivityStatus::WaitingForSpotInstanceId: return "WaitingForSpotInstanceId";
        case ActivityStatus::WaitingForInstanceId: return "WaitingForInstanceId";
        case ActivityStatus::PreInService: return "PreInService";
        case ActivityStatus::InProgress: return "InProgress";
        case ActivityStatus::WaitingForELBConnectionDraining: return "WaitingForELBConnectionDraining";
        case ActivityStatus::MidLifecycleAction: return "MidLifecycleAction";
        case ActivityStatus::WaitingForInstanceWarmup: return "WaitingForInstanceWarmup";
        case ActivityStatus::Successful: return "Successful";
        case ActivityStatus::Failed: return "Failed";
        case ActivityStatus::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

ActivityStatus parse_activity_status(const std::string& code) {
    static const std::unordered_map<std::string, ActivityStatus> codes = {
        {"PendingSpotBidPlacement", ActivityStatus::PendingSpotBidPlacement},
        {"WaitingForSpotInstanceRequestId", ActivityStatus::WaitingForSpotInstanceRequestId},
        {"WaitingForSpotInstanceId", ActivityStatus::WaitingForSpotInstanceId},
        {"WaitingForInstanceId", ActivityStatus::WaitingForInstanceId},
        {"PreInService", ActivityStatus::PreInService},
        {"InProgress", ActivityStatus::InProgress},
        {"WaitingForELBConnectionDraining", ActivityStatus::WaitingForELBConnectionDraining},
        {"MidLifecycleAction", ActivityStatus::MidLifecycleAction},
        {"WaitingForInstanceWarmup", ActivityStatus::WaitingForInstanceWarmup},
        {"Successful", ActivityStatus::Successful},
        {"Failed", ActivityStatus::Failed},
        {"Cancelled", ActivityStatus::Cancelled},
    };

    auto it = codes.find(code);
    return it == codes.end() ? ActivityStatus::Unknown : it->second;
}

} // namespace scaleguard::cloud
