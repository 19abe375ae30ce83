#pragma once
/**
 * @file result.h
 * @brief Result codes shared by the fleet components and provider clients
 */

#include "scaleguard/core/types.h"

namespace scaleguard {

/**
 * @brief Result codes for provider calls and fleet operations
 */
enum class ScalingResult : UInt8 {
    Success = 0,

    // Configuration errors
    InvalidConfiguration,
    InvalidArgument,

    // Provider errors
    ProviderConnectionFailed,
    ProviderAuthenticationFailed,
    ProviderAPIError,
    Throttled,
    Timeout,

    // Lookup errors
    GroupNotFound,
    LaunchSpecNotFound,
    SpotRequestNotFound,

    // Mutation errors
    MinSizeViolation,       ///< Termination without replacement would drop below min size
    CapacityUpdateFailed,
    TerminationFailed,
    SpotCancellationFailed
};

/**
 * @brief Convert ScalingResult to string
 */
inline const char* scaling_result_to_string(ScalingResult result) {
    switch (result) {
        case ScalingResult::Success: return "Success";
        case ScalingResult::InvalidConfiguration: return "InvalidConfiguration";
        case ScalingResult::InvalidArgument: return "InvalidArgument";
        case ScalingResult::ProviderConnectionFailed: return "ProviderConnectionFailed";
        case ScalingResult::ProviderAuthenticationFailed: return "ProviderAuthenticationFailed";
        case ScalingResult::ProviderAPIError: return "ProviderAPIError";
        case ScalingResult::Throttled: return "Throttled";
        case ScalingResult::Timeout: return "Timeout";
        case ScalingResult::GroupNotFound: return "GroupNotFound";
        case ScalingResult::LaunchSpecNotFound: return "LaunchSpecNotFound";
        case ScalingResult::SpotRequestNotFound: return "SpotRequestNotFound";
        case ScalingResult::MinSizeViolation: return "MinSizeViolation";
        case ScalingResult::CapacityUpdateFailed: return "CapacityUpdateFailed";
        case ScalingResult::TerminationFailed: return "TerminationFailed";
        case ScalingResult::SpotCancellationFailed: return "SpotCancellationFailed";
        default: return "Unknown";
    }
}

} // namespace scaleguard
