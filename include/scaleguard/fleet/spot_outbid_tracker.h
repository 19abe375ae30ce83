#pragma once
/**
 * @file spot_outbid_tracker.h
 * @brief Spot price history window and outbid suppression
 *
 * Keeps a rolling window of spot price observations per region and times
 * out spot groups whose bid would recently have been beaten by the market
 * for too long on average across availability zones.
 */

#include "scaleguard/core/types.h"
#include "scaleguard/core/result.h"
#include "scaleguard/cloud/provider.h"
#include "scaleguard/fleet/scaling_group.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace scaleguard::fleet {

/**
 * @brief Tuning of the outbid evaluation
 */
struct SpotOutbidConfig {
    Seconds history_period{5 * 60 * 60};    ///< Lookback window of retained prices
    Seconds max_outbid{20 * 60};            ///< Average outbid time that triggers a timeout
    Seconds timeout{60 * 60};               ///< Suppression length once triggered
    std::vector<std::string> product_descriptions{"Linux/UNIX"};
};

class SpotOutbidTracker {
public:
    SpotOutbidTracker(std::shared_ptr<cloud::ICloudSession> session,
                      SpotOutbidConfig config = {},
                      ClockFn clock = system_now);

    /**
     * @brief Refresh price history and recompute the spot channel of every spot group
     *
     * Non-spot groups are ignored. A fetch failure stops the pass and is
     * returned; regions already processed keep their new state.
     */
    ScalingResult refresh(const std::vector<ScalingGroup>& groups);

    /**
     * @brief Expiry of the group's spot timeout, nullopt when not timed out
     */
    std::optional<TimePoint> spot_timeout_until(const GroupId& id) const;

    /**
     * @brief Retained observations of a region
     */
    const std::vector<cloud::SpotPriceObservation>& price_history(const std::string& region) const;

    /**
     * @brief Average seconds per zone during which the price exceeded the bid
     *
     * Each observation above the bid counts until the zone's next
     * observation. Zones with no outbid time are left out of the average;
     * returns 0 when no zone was outbid.
     */
    static Real average_outbid_seconds(const std::vector<cloud::SpotPriceObservation>& history,
                                       const std::string& instance_type,
                                       Real bid_price);

    void reset();

private:
    ScalingResult refresh_region_history(const std::string& region,
                                         const std::vector<std::string>& instance_types,
                                         TimePoint since);

    std::shared_ptr<cloud::ICloudSession> session_;
    SpotOutbidConfig config_;
    ClockFn clock_;

    std::unordered_map<std::string, std::vector<cloud::SpotPriceObservation>> history_;
    std::unordered_map<GroupId, std::optional<TimePoint>, GroupIdHash> spot_timeouts_;
};

} // namespace scaleguard::fleet
