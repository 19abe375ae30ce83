#pragma once
/**
 * @file scaleguard.h
 * @brief Main include file for ScaleGuard
 *
 * ScaleGuard - Scaling group discovery and failure backoff for cluster autoscalers
 *
 * Include this single header to access all public ScaleGuard APIs.
 */

#include "scaleguard/core/types.h"
#include "scaleguard/core/result.h"
#include "scaleguard/core/threading/thread_pool.h"

#include "scaleguard/cloud/provider.h"
#include "scaleguard/cloud/cluster.h"

#include "scaleguard/fleet/activity_classifier.h"
#include "scaleguard/fleet/scaling_group.h"
#include "scaleguard/fleet/spot_outbid_tracker.h"
#include "scaleguard/fleet/timeout_reconciler.h"
#include "scaleguard/fleet/group_catalog.h"

#include "scaleguard/interface/config.h"

/**
 * @namespace scaleguard
 * @brief Root namespace for all ScaleGuard components
 */
namespace scaleguard {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 4;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.4.0";
}

} // namespace scaleguard
