/**
 * @file spot_outbid_tracker.cpp
 * @brief Implementation of spot outbid tracking
 */

#include "scaleguard/fleet/spot_outbid_tracker.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>

namespace scaleguard::fleet {

namespace {

bool same_observation(const cloud::SpotPriceObservation& a, const cloud::SpotPriceObservation& b) {
    return a.timestamp == b.timestamp &&
           a.availability_zone == b.availability_zone &&
           a.instance_type == b.instance_type &&
           a.price == b.price;
}

} // anonymous namespace

SpotOutbidTracker::SpotOutbidTracker(std::shared_ptr<cloud::ICloudSession> session,
                                     SpotOutbidConfig config,
                                     ClockFn clock)
    : session_(std::move(session))
    , config_(std::move(config))
    , clock_(std::move(clock))
{}

ScalingResult SpotOutbidTracker::refresh(const std::vector<ScalingGroup>& groups) {
    // region -> instance type -> spot groups
    std::map<std::string, std::map<std::string, std::vector<const ScalingGroup*>>> by_region;
    for (const auto& group : groups) {
        if (!group.is_spot()) {
            continue;
        }
        by_region[group.region()][group.instance_type()].push_back(&group);
    }

    const TimePoint now = clock_();
    const TimePoint since = now - config_.history_period;

    for (const auto& [region, by_type] : by_region) {
        std::vector<std::string> instance_types;
        instance_types.reserve(by_type.size());
        for (const auto& entry : by_type) {
            instance_types.push_back(entry.first);
        }

        ScalingResult result = refresh_region_history(region, instance_types, since);
        if (result != ScalingResult::Success) {
            spdlog::error("Failed to fetch spot price history for {}: {}",
                          region, scaling_result_to_string(result));
            return result;
        }

        const auto& history = history_[region];
        for (const auto& [instance_type, members] : by_type) {
            for (const ScalingGroup* group : members) {
                Real average = average_outbid_seconds(history, instance_type, *group->bid_price());
                if (average > static_cast<Real>(config_.max_outbid.count())) {
                    TimePoint until = now + config_.timeout;
                    spot_timeouts_[group->id()] = until;
                    spdlog::info("{} ({}) is spot timed out until {} (would have been outbid for {:.0f}s on average)",
                                 group->name(), group->region(), format_time(until), average);
                } else {
                    spot_timeouts_[group->id()] = std::nullopt;
                }
            }
        }
    }

    return ScalingResult::Success;
}

ScalingResult SpotOutbidTracker::refresh_region_history(const std::string& region,
                                                        const std::vector<std::string>& instance_types,
                                                        TimePoint since) {
    auto& history = history_[region];

    // Expire old history
    history.erase(std::remove_if(history.begin(), history.end(),
                                 [since](const cloud::SpotPriceObservation& item) {
                                     return item.timestamp <= since;
                                 }),
                  history.end());

    TimePoint newest = since;
    for (const auto& item : history) {
        newest = std::max(newest, item.timestamp);
    }

    cloud::SpotPriceQuery query;
    query.start_time = newest;
    query.instance_types = instance_types;
    query.product_descriptions = config_.product_descriptions;

    auto client = session_->compute_client(region);
    std::vector<cloud::SpotPriceObservation> fetched;
    ScalingResult result = cloud::fetch_all<cloud::SpotPriceObservation>(
        [&client, &query](const std::string& token, cloud::Page<cloud::SpotPriceObservation>& page) {
            return client->describe_spot_price_history(query, token, page);
        },
        fetched);
    if (result != ScalingResult::Success) {
        return result;
    }

    // The start of the incremental window overlaps the newest retained sample
    for (const auto& item : fetched) {
        bool known = std::any_of(history.begin(), history.end(),
                                 [&item](const cloud::SpotPriceObservation& held) {
                                     return same_observation(held, item);
                                 });
        if (!known) {
            history.push_back(item);
        }
    }

    spdlog::debug("{}: {} spot price observations retained ({} fetched)",
                  region, history.size(), fetched.size());
    return ScalingResult::Success;
}

Real SpotOutbidTracker::average_outbid_seconds(const std::vector<cloud::SpotPriceObservation>& history,
                                               const std::string& instance_type,
                                               Real bid_price) {
    std::map<std::string, std::vector<const cloud::SpotPriceObservation*>> by_zone;
    for (const auto& item : history) {
        if (item.instance_type == instance_type) {
            by_zone[item.availability_zone].push_back(&item);
        }
    }

    Real total_seconds = 0.0;
    SizeT outbid_zones = 0;
    for (auto& entry : by_zone) {
        auto& samples = entry.second;
        std::stable_sort(samples.begin(), samples.end(),
                         [](const cloud::SpotPriceObservation* a, const cloud::SpotPriceObservation* b) {
                             return a->timestamp < b->timestamp;
                         });

        Real zone_seconds = 0.0;
        for (SizeT i = 0; i + 1 < samples.size(); ++i) {
            if (samples[i]->price > bid_price) {
                zone_seconds += std::chrono::duration<Real>(samples[i + 1]->timestamp -
                                                            samples[i]->timestamp).count();
            }
        }

        if (zone_seconds > 0.0) {
            total_seconds += zone_seconds;
            ++outbid_zones;
        }
    }

    return outbid_zones > 0 ? total_seconds / static_cast<Real>(outbid_zones) : 0.0;
}

std::optional<TimePoint> SpotOutbidTracker::spot_timeout_until(const GroupId& id) const {
    auto it = spot_timeouts_.find(id);
    if (it == spot_timeouts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::vector<cloud::SpotPriceObservation>& SpotOutbidTracker::price_history(const std::string& region) const {
    static const std::vector<cloud::SpotPriceObservation> empty;
    auto it = history_.find(region);
    return it == history_.end() ? empty : it->second;
}

void SpotOutbidTracker::reset() {
    history_.clear();
    spot_timeouts_.clear();
}

} // namespace scaleguard::fleet
