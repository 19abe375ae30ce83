/**
 * @file scaling_group.cpp
 * @brief Implementation of the scaling group entity
 */

#include "scaleguard/fleet/scaling_group.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>

namespace scaleguard::fleet {

// ============================================================================
// Selector Helpers
// ============================================================================

cloud::Selectors extract_selectors(const std::string& region,
                                   const cloud::LaunchSpec& launch_spec,
                                   const std::vector<cloud::ResourceTag>& tags) {
    cloud::Selectors selectors;
    selectors[SELECTOR_INSTANCE_TYPE] = launch_spec.instance_type;
    selectors[SELECTOR_INSTANCE_CLASS] = launch_spec.instance_type.substr(0, 1);
    selectors[SELECTOR_IMAGE_ID] = launch_spec.image_id;
    selectors[SELECTOR_REGION] = region;

    const std::string prefix = SELECTOR_TAG_PREFIX;
    for (const auto& tag : tags) {
        if (tag.key.compare(0, prefix.size(), prefix) == 0) {
            selectors[tag.key.substr(prefix.size())] = tag.value;
        }
    }

    // Kubernetes label counterparts
    selectors[SELECTOR_KUBE_INSTANCE_TYPE] = selectors[SELECTOR_INSTANCE_TYPE];
    selectors[SELECTOR_KUBE_REGION] = selectors[SELECTOR_REGION];

    return selectors;
}

std::string selectors_to_hash(const cloud::Selectors& selectors) {
    // FNV-1a over "key=value;" pairs in key order
    UInt64 hash = 14695981039346656037ULL;
    auto mix = [&hash](const std::string& text) {
        for (unsigned char byte : text) {
            hash ^= byte;
            hash *= 1099511628211ULL;
        }
    };
    for (const auto& [key, value] : selectors) {
        mix(key);
        mix("=");
        mix(value);
        mix(";");
    }

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buffer);
}

// ============================================================================
// ScalingGroup Implementation
// ============================================================================

ScalingGroup::ScalingGroup(std::shared_ptr<cloud::IScalingGroupClient> client,
                           std::string region,
                           const std::vector<cloud::ClusterNodePtr>& cluster_nodes,
                           const cloud::GroupDescription& description,
                           const cloud::LaunchSpec& launch_spec)
    : client_(std::move(client))
    , id_{std::move(region), description.name}
    , desired_capacity_(description.desired_capacity)
    , min_size_(description.min_size)
    , max_size_(description.max_size)
    , instance_type_(launch_spec.instance_type)
    , image_id_(launch_spec.image_id)
    , bid_price_(launch_spec.spot_price)
{
    selectors_ = extract_selectors(id_.region, launch_spec, description.tags);

    for (const auto& instance : description.instances) {
        if (!instance.instance_id.empty()) {
            instance_ids_.insert(instance.instance_id);
        }
    }

    for (const auto& node : cluster_nodes) {
        if (node && instance_ids_.count(node->instance_id()) > 0) {
            nodes_.push_back(node);
        }
    }
}

std::vector<cloud::ClusterNodePtr> ScalingGroup::unschedulable_nodes() const {
    std::vector<cloud::ClusterNodePtr> result;
    for (const auto& node : nodes_) {
        if (node->is_unschedulable()) {
            result.push_back(node);
        }
    }
    return result;
}

ScalingResult ScalingGroup::set_desired_capacity(Int32 desired_capacity) {
    spdlog::info("{}: new desired capacity {}", to_string(), desired_capacity);

    ScalingResult result = client_->set_desired_capacity(id_.name, desired_capacity, false);
    if (result != ScalingResult::Success) {
        spdlog::error("{}: failed to set desired capacity to {}: {}",
                      to_string(), desired_capacity, scaling_result_to_string(result));
        return result;
    }

    desired_capacity_ = desired_capacity;
    return ScalingResult::Success;
}

ScalingResult ScalingGroup::scale(Int32 target, bool& increased) {
    increased = false;

    const Int32 desired = std::min(max_size_, target);
    const auto unschedulable = unschedulable_nodes();
    const Int32 num_unschedulable = static_cast<Int32>(unschedulable.size());
    Int32 num_schedulable = actual_capacity() - num_unschedulable;

    spdlog::info("{}: desired {}, currently at {}", name(), desired, desired_capacity_);
    spdlog::info("{}: {} schedulable, {} unschedulable nodes", name(), num_schedulable, num_unschedulable);

    // Bring schedulable nodes up first, even when capacity already matches
    if (num_schedulable < desired) {
        for (const auto& node : unschedulable) {
            if (node->uncordon()) {
                ++num_schedulable;
                if (num_schedulable == desired) {
                    break;
                }
            }
        }
    }

    if (desired_capacity_ != desired) {
        if (desired_capacity_ == max_size_) {
            spdlog::info("{}: desired capacity already at max {}, schedulable {}",
                         name(), desired_capacity_, num_schedulable);
            return ScalingResult::Success;
        }

        // Lowering desired capacity would race the provider's own choice of
        // which instances to terminate; shrinking goes through scale_nodes_in.
        if (desired_capacity_ < desired) {
            ScalingResult result = set_desired_capacity(desired);
            if (result == ScalingResult::Success) {
                increased = true;
            }
            return result;
        }
    }

    spdlog::info("{}: doing nothing, desired capacity {} correctly set, schedulable {}",
                 name(), desired_capacity_, num_schedulable);
    return ScalingResult::Success;
}

ScalingResult ScalingGroup::scale_nodes_in(const std::vector<cloud::ClusterNodePtr>& nodes) {
    for (const auto& node : nodes) {
        // Decrementing below min size is rejected by the provider
        const bool decrement = desired_capacity_ > min_size_;
        const std::string instance_id = node->instance_id();

        ScalingResult result = client_->terminate_instance(instance_id, decrement);
        if (result == ScalingResult::MinSizeViolation) {
            spdlog::error("{}: failed to terminate instance {} of node {}: {}",
                          to_string(), instance_id, node->name(), scaling_result_to_string(result));
            continue;
        }
        if (result != ScalingResult::Success) {
            return result;
        }

        nodes_.erase(std::remove_if(nodes_.begin(), nodes_.end(),
                                    [&instance_id](const cloud::ClusterNodePtr& member) {
                                        return member->instance_id() == instance_id;
                                    }),
                     nodes_.end());
        instance_ids_.erase(instance_id);
        if (decrement) {
            --desired_capacity_;
        }
        spdlog::info("{}: scaled node {} ({}) in", to_string(), node->name(), instance_id);
    }

    return ScalingResult::Success;
}

bool ScalingGroup::contains(const cloud::IClusterNode& node) const {
    return instance_ids_.count(node.instance_id()) > 0;
}

bool ScalingGroup::is_match_for_selectors(const cloud::Selectors& selectors) const {
    for (const auto& [label, value] : selectors) {
        auto it = selectors_.find(label);
        if (it == selectors_.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

bool ScalingGroup::is_taints_tolerated(const cloud::Workload& workload) const {
    if (!is_match_for_selectors(workload.selectors)) {
        return false;
    }
    for (const auto& taint : no_schedule_taints_) {
        if (!(workload.no_schedule_wildcard_toleration ||
              workload.no_schedule_existential_tolerations.count(taint.first) > 0)) {
            return false;
        }
    }
    return true;
}

std::string ScalingGroup::to_string() const {
    return "ScalingGroup(" + id_.name + ", " + selectors_to_hash(selectors_) + ")";
}

} // namespace scaleguard::fleet
