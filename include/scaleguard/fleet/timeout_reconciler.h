#pragma once
/**
 * @file timeout_reconciler.h
 * @brief Per-group health state machine driven by provisioning history
 *
 * The reconciler scans each region's recent scaling activities, classifies
 * failures, corrects desired capacity where a failed scale-up left it too
 * high and suppresses ("times out") groups stuck in a failure loop so the
 * scheduler favours other groups.
 *
 * Key features:
 * - Two independent suppression channels per group (activity, spot outbid)
 * - Incremental activity consumption bounded by a per-region watermark
 * - Capacity reversion and capping after failed launches
 * - Cancellation of spot requests stuck waiting for an instance
 * - Dry-run mode that logs corrective actions instead of performing them
 *
 * State lives in the instance and lasts as long as the control loop that
 * owns it. The class is not internally synchronized.
 */

#include "scaleguard/core/types.h"
#include "scaleguard/core/result.h"
#include "scaleguard/cloud/provider.h"
#include "scaleguard/fleet/activity_classifier.h"
#include "scaleguard/fleet/scaling_group.h"
#include "scaleguard/fleet/spot_outbid_tracker.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace scaleguard::fleet {

/**
 * @brief Tuning of the reconciler
 */
struct ReconcilerConfig {
    Seconds timeout{60 * 60};                   ///< Suppression length after a failure
    Seconds spot_request_timeout{5 * 60};       ///< Max wait for a spot instance
    Seconds activity_window{60 * 60};           ///< Older activities are not scanned
    std::string zone_restricted_marker{"only-az"}; ///< Name marker of single-AZ groups
    SpotOutbidConfig spot;
};

class TimeoutReconciler {
public:
    TimeoutReconciler(std::shared_ptr<cloud::ICloudSession> session,
                      ReconcilerConfig config = {},
                      ClockFn clock = system_now);

    /**
     * @brief Refresh every group's timeout state from provider data
     *
     * Runs the spot outbid evaluation, then fetches each region's recent
     * activities and reconciles every group of that region. Corrective
     * mutations are skipped and logged when dry_run is set.
     *
     * @return First provider failure, which aborts the remaining work
     */
    ScalingResult refresh_timeouts(std::vector<ScalingGroup>& groups, bool dry_run = false);

    /**
     * @brief Reconcile one group against its activities (newest first)
     *
     * The first matching failure rule ends the pass. The ordinary timeout is
     * cleared only when the whole list is consumed without a failure rule
     * matching or a spot request timing out.
     *
     * @param disqualified Set when a failure rule matched or a spot request
     *        timed out; the ordinary timeout is then left in place
     */
    ScalingResult reconcile(ScalingGroup& group,
                            const std::vector<cloud::ScalingActivity>& activities,
                            bool dry_run,
                            bool& disqualified);

    /**
     * @brief True if either suppression channel expires in the future
     */
    bool is_timed_out(const ScalingGroup& group) const;

    // ========================================================================
    // State Inspection
    // ========================================================================

    std::optional<TimePoint> timeout_until(const GroupId& id) const;
    std::optional<TimePoint> spot_timeout_until(const GroupId& id) const;

    /**
     * @brief Watermark of a region, empty if none recorded yet
     */
    std::string last_activity_id(const std::string& region) const;

    const SpotOutbidTracker& spot_tracker() const noexcept { return spot_tracker_; }

    /**
     * @brief Forget every timeout, watermark and price observation
     */
    void reset();

private:
    ScalingResult fetch_region_activities(
        const std::string& region,
        std::unordered_map<std::string, std::vector<cloud::ScalingActivity>>& by_group);

    ScalingResult revert_capacity(ScalingGroup& group,
                                  const cloud::ScalingActivity& activity,
                                  bool dry_run,
                                  bool& reverted);

    ScalingResult cancel_spot_request(const std::string& region,
                                      const std::string& request_id,
                                      bool& cancelled);

    void time_out_group(const ScalingGroup& group, const cloud::ScalingActivity& activity);

    std::shared_ptr<cloud::ICloudSession> session_;
    ReconcilerConfig config_;
    ClockFn clock_;

    ActivityClassifier classifier_;
    SpotOutbidTracker spot_tracker_;

    std::unordered_map<GroupId, std::optional<TimePoint>, GroupIdHash> timeouts_;
    std::unordered_map<std::string, std::string> last_activities_;
};

} // namespace scaleguard::fleet
