/**
 * @file timeout_reconciler.cpp
 * @brief Implementation of the group timeout state machine
 */

#include "scaleguard/fleet/timeout_reconciler.h"
#include <spdlog/spdlog.h>
#include <map>

namespace scaleguard::fleet {

namespace {

bool is_failed(cloud::ActivityStatus status) {
    return status == cloud::ActivityStatus::Failed || status == cloud::ActivityStatus::Cancelled;
}

} // anonymous namespace

// ============================================================================
// TimeoutReconciler Implementation
// ============================================================================

TimeoutReconciler::TimeoutReconciler(std::shared_ptr<cloud::ICloudSession> session,
                                     ReconcilerConfig config,
                                     ClockFn clock)
    : session_(std::move(session))
    , config_(std::move(config))
    , clock_(std::move(clock))
    , spot_tracker_(session_, config_.spot, clock_)
{}

ScalingResult TimeoutReconciler::refresh_timeouts(std::vector<ScalingGroup>& groups, bool dry_run) {
    ScalingResult result = spot_tracker_.refresh(groups);
    if (result != ScalingResult::Success) {
        return result;
    }

    std::map<std::string, std::vector<ScalingGroup*>> by_region;
    for (auto& group : groups) {
        by_region[group.region()].push_back(&group);
    }

    for (auto& [region, regional_groups] : by_region) {
        std::unordered_map<std::string, std::vector<cloud::ScalingActivity>> by_group;
        result = fetch_region_activities(region, by_group);
        if (result != ScalingResult::Success) {
            spdlog::error("Failed to fetch scaling activities for {}: {}",
                          region, scaling_result_to_string(result));
            return result;
        }

        static const std::vector<cloud::ScalingActivity> no_activities;
        for (ScalingGroup* group : regional_groups) {
            auto it = by_group.find(group->name());
            const auto& activities = it == by_group.end() ? no_activities : it->second;

            bool disqualified = false;
            result = reconcile(*group, activities, dry_run, disqualified);
            if (result != ScalingResult::Success) {
                spdlog::error("{}: reconciliation failed: {}",
                              group->to_string(), scaling_result_to_string(result));
                return result;
            }
        }
    }

    return ScalingResult::Success;
}

ScalingResult TimeoutReconciler::fetch_region_activities(
    const std::string& region,
    std::unordered_map<std::string, std::vector<cloud::ScalingActivity>>& by_group)
{
    auto client = session_->scaling_client(region);
    const TimePoint cutoff = clock_() - config_.activity_window;
    const std::string previous = last_activity_id(region);

    std::optional<std::string> newest_completed;
    ScalingResult result = cloud::for_each_item<cloud::ScalingActivity>(
        [&client](const std::string& token, cloud::Page<cloud::ScalingActivity>& page) {
            return client->describe_activities(token, page);
        },
        [&](const cloud::ScalingActivity& activity) {
            // Only completed activities may become the watermark, otherwise
            // an activity still in flight would be skipped next pass
            if (!newest_completed && activity.progress == 100) {
                newest_completed = activity.activity_id;
            }
            if (!previous.empty() && activity.activity_id == previous) {
                return false;
            }
            if (activity.start_time < cutoff) {
                return false;
            }
            by_group[activity.group_name].push_back(activity);
            return true;
        });
    if (result != ScalingResult::Success) {
        return result;
    }

    if (newest_completed) {
        last_activities_[region] = *newest_completed;
    }
    return ScalingResult::Success;
}

ScalingResult TimeoutReconciler::reconcile(ScalingGroup& group,
                                           const std::vector<cloud::ScalingActivity>& activities,
                                           bool dry_run,
                                           bool& disqualified)
{
    disqualified = false;
    const TimePoint now = clock_();
    ScalingResult result = ScalingResult::Success;

    for (const auto& activity : activities) {
        if (is_failed(activity.status)) {
            spdlog::warn("{} scaling failure: {} {} \"{}\"", group.to_string(), activity.activity_id,
                         cloud::activity_status_to_string(activity.status), activity.status_message);

            const StatusClassification failure = classifier_.classify_status(activity.status_message);

            if (const auto* limit = std::get_if<InstanceLimitFailure>(&failure)) {
                const Int32 max_desired_capacity = limit->requested - 1;
                if (group.desired_capacity() > max_desired_capacity) {
                    time_out_group(group, activity);

                    // The scale-up went over the account limit; cap it
                    if (!dry_run) {
                        result = group.set_desired_capacity(max_desired_capacity);
                        if (result != ScalingResult::Success) {
                            return result;
                        }
                    } else {
                        spdlog::info("[Dry run] Would have set desired capacity of {} to {}",
                                     group.name(), max_desired_capacity);
                    }
                }
                disqualified = true;
                return ScalingResult::Success;
            }

            if (std::holds_alternative<VolumeLimitFailure>(failure)) {
                // TODO: lower desired capacity once the volume quota in use can be queried
                time_out_group(group, activity);
                disqualified = true;
                return ScalingResult::Success;
            }

            if (std::holds_alternative<CapacityLimitFailure>(failure)) {
                bool reverted = false;
                result = revert_capacity(group, activity, dry_run, reverted);
                if (result != ScalingResult::Success) {
                    return result;
                }
                if (reverted) {
                    time_out_group(group, activity);
                }
                disqualified = true;
                return ScalingResult::Success;
            }

            if (std::holds_alternative<ZoneCapacityFailure>(failure) &&
                group.name().find(config_.zone_restricted_marker) != std::string::npos) {
                bool reverted = false;
                result = revert_capacity(group, activity, dry_run, reverted);
                if (result != ScalingResult::Success) {
                    return result;
                }
                if (reverted) {
                    time_out_group(group, activity);
                }
                disqualified = true;
                return ScalingResult::Success;
            }

            if (std::holds_alternative<SpotRequestCancelled>(failure)) {
                // Cancelled by us; not a failure of the group
                continue;
            }

            if (std::holds_alternative<SpotLimitFailure>(failure)) {
                time_out_group(group, activity);

                if (!dry_run) {
                    result = group.set_desired_capacity(group.actual_capacity());
                    if (result != ScalingResult::Success) {
                        return result;
                    }
                } else {
                    spdlog::info("[Dry run] Would have set desired capacity of {} to {}",
                                 group.name(), group.actual_capacity());
                }
                disqualified = true;
                return ScalingResult::Success;
            }
        } else if (activity.status == cloud::ActivityStatus::WaitingForSpotInstanceId) {
            spdlog::warn("{} waiting for spot: {} \"{}\"", group.to_string(), activity.activity_id,
                         activity.status_message);

            // The provider launches into other zones to balance the group and
            // would simply retry a cancelled request
            if (std::holds_alternative<ZoneRebalanceLaunch>(classifier_.classify_cause(activity.cause))) {
                spdlog::info("{}: ignoring AZ balance launch event {}", group.name(), activity.activity_id);
                continue;
            }

            if (now - activity.start_time > config_.spot_request_timeout) {
                time_out_group(group, activity);
                disqualified = true;

                const StatusClassification waiting = classifier_.classify_status(activity.status_message);
                if (const auto* request = std::get_if<SpotRequestWaiting>(&waiting)) {
                    if (!dry_run) {
                        bool cancelled = false;
                        result = cancel_spot_request(group.region(), request->request_id, cancelled);
                        if (result != ScalingResult::Success) {
                            return result;
                        }
                        if (cancelled) {
                            result = group.set_desired_capacity(group.desired_capacity() - 1);
                            if (result != ScalingResult::Success) {
                                return result;
                            }
                        }
                    } else {
                        spdlog::info("[Dry run] Would have cancelled spot request {} and decremented "
                                     "desired capacity of {}", request->request_id, group.name());
                    }
                }
                // Keep going: several requests of the group may be stuck
            }
        }
    }

    if (!disqualified) {
        timeouts_[group.id()] = std::nullopt;
        spdlog::debug("{} has no timeout", group.name());
    }
    return ScalingResult::Success;
}

ScalingResult TimeoutReconciler::revert_capacity(ScalingGroup& group,
                                                 const cloud::ScalingActivity& activity,
                                                 bool dry_run,
                                                 bool& reverted)
{
    reverted = false;

    const CauseClassification cause = classifier_.classify_cause(activity.cause);
    const auto* change = std::get_if<LaunchCapacityChange>(&cause);
    if (!change) {
        return ScalingResult::Success;
    }

    const Int32 original_capacity = change->original_capacity;
    if (group.desired_capacity() <= original_capacity) {
        return ScalingResult::Success;
    }

    // The scale-up could not be fulfilled; go back to where it started
    if (!dry_run) {
        ScalingResult result = group.set_desired_capacity(original_capacity);
        if (result != ScalingResult::Success) {
            return result;
        }
    } else {
        spdlog::info("[Dry run] Would have set desired capacity of {} to {}",
                     group.name(), original_capacity);
    }

    reverted = true;
    return ScalingResult::Success;
}

ScalingResult TimeoutReconciler::cancel_spot_request(const std::string& region,
                                                     const std::string& request_id,
                                                     bool& cancelled)
{
    cancelled = false;
    auto client = session_->compute_client(region);

    std::vector<cloud::SpotRequest> requests;
    ScalingResult result = client->describe_spot_requests({request_id}, requests);
    if (result != ScalingResult::Success) {
        return result;
    }
    if (requests.empty()) {
        return ScalingResult::Success;
    }

    const std::string& state = requests.front().state;
    if (state != "open" && state != "active") {
        return ScalingResult::Success;
    }

    result = client->cancel_spot_requests({request_id});
    if (result != ScalingResult::Success) {
        return result;
    }

    spdlog::info("Spot instance request {} cancelled", request_id);
    cancelled = true;
    return ScalingResult::Success;
}

void TimeoutReconciler::time_out_group(const ScalingGroup& group, const cloud::ScalingActivity& activity) {
    const TimePoint until = activity.start_time + config_.timeout;
    timeouts_[group.id()] = until;
    spdlog::info("{} ({}) is timed out until {} ({})", group.name(), group.region(),
                 format_time(until), status_classification_name(classifier_.classify_status(activity.status_message)));
}

bool TimeoutReconciler::is_timed_out(const ScalingGroup& group) const {
    const TimePoint now = clock_();

    auto timeout = timeout_until(group.id());
    if (timeout && now < *timeout) {
        return true;
    }

    auto spot_timeout = spot_tracker_.spot_timeout_until(group.id());
    if (spot_timeout && now < *spot_timeout) {
        return true;
    }

    return false;
}

std::optional<TimePoint> TimeoutReconciler::timeout_until(const GroupId& id) const {
    auto it = timeouts_.find(id);
    if (it == timeouts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TimePoint> TimeoutReconciler::spot_timeout_until(const GroupId& id) const {
    return spot_tracker_.spot_timeout_until(id);
}

std::string TimeoutReconciler::last_activity_id(const std::string& region) const {
    auto it = last_activities_.find(region);
    return it == last_activities_.end() ? std::string() : it->second;
}

void TimeoutReconciler::reset() {
    timeouts_.clear();
    last_activities_.clear();
    spot_tracker_.reset();
}

} // namespace scaleguard::fleet
