#pragma once
/**
 * @file scaling_group.h
 * @brief Provider-managed pool of homogeneous worker instances
 *
 * A ScalingGroup is rebuilt from a provider snapshot every control-loop
 * iteration. It exposes current-state queries and the two mutation commands
 * the scheduler uses: growing through scale() and shrinking by terminating
 * specific members through scale_nodes_in().
 */

#include "scaleguard/core/types.h"
#include "scaleguard/core/result.h"
#include "scaleguard/cloud/provider.h"
#include "scaleguard/cloud/cluster.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace scaleguard::fleet {

// ============================================================================
// Selector Keys
// ============================================================================

constexpr const char* SELECTOR_INSTANCE_TYPE = "aws/type";
constexpr const char* SELECTOR_INSTANCE_CLASS = "aws/class";
constexpr const char* SELECTOR_IMAGE_ID = "aws/ami-id";
constexpr const char* SELECTOR_REGION = "aws/region";
constexpr const char* SELECTOR_KUBE_INSTANCE_TYPE = "beta.kubernetes.io/instance-type";
constexpr const char* SELECTOR_KUBE_REGION = "failure-domain.beta.kubernetes.io/region";

/// Group tags with this prefix become selectors (prefix stripped)
constexpr const char* SELECTOR_TAG_PREFIX = "kube/";

/**
 * @brief Build the selector map of a group
 */
cloud::Selectors extract_selectors(const std::string& region,
                                   const cloud::LaunchSpec& launch_spec,
                                   const std::vector<cloud::ResourceTag>& tags);

/**
 * @brief Stable FNV-1a digest of a selector map, rendered as hex
 */
std::string selectors_to_hash(const cloud::Selectors& selectors);

// ============================================================================
// Scaling Group
// ============================================================================

class ScalingGroup {
public:
    /**
     * @brief Build a group from a provider snapshot
     * @param client Regional client used for mutations
     * @param region Region the group lives in
     * @param cluster_nodes Every node currently visible in the cluster
     * @param description Provider snapshot of the group
     * @param launch_spec Launch specification referenced by the group
     */
    ScalingGroup(std::shared_ptr<cloud::IScalingGroupClient> client,
                 std::string region,
                 const std::vector<cloud::ClusterNodePtr>& cluster_nodes,
                 const cloud::GroupDescription& description,
                 const cloud::LaunchSpec& launch_spec);

    // ========================================================================
    // Identity & Attributes
    // ========================================================================

    const GroupId& id() const noexcept { return id_; }
    const std::string& region() const noexcept { return id_.region; }
    const std::string& name() const noexcept { return id_.name; }

    Int32 desired_capacity() const noexcept { return desired_capacity_; }
    Int32 min_size() const noexcept { return min_size_; }
    Int32 max_size() const noexcept { return max_size_; }

    const std::string& instance_type() const noexcept { return instance_type_; }
    const std::string& image_id() const noexcept { return image_id_; }
    bool is_spot() const noexcept { return bid_price_.has_value(); }
    const std::optional<Real>& bid_price() const noexcept { return bid_price_; }

    const cloud::Selectors& selectors() const noexcept { return selectors_; }

    /**
     * @brief Taints carried by the group's nodes (key to value)
     */
    const std::unordered_map<std::string, std::string>& no_schedule_taints() const noexcept {
        return no_schedule_taints_;
    }

    void set_no_schedule_taints(std::unordered_map<std::string, std::string> taints) {
        no_schedule_taints_ = std::move(taints);
    }

    /**
     * @brief Provider-backed groups share one priority
     */
    Int32 global_priority() const noexcept { return 0; }

    // ========================================================================
    // Membership
    // ========================================================================

    const std::unordered_set<std::string>& instance_ids() const noexcept { return instance_ids_; }
    const std::vector<cloud::ClusterNodePtr>& nodes() const noexcept { return nodes_; }

    /**
     * @brief Member nodes that are currently cordoned
     */
    std::vector<cloud::ClusterNodePtr> unschedulable_nodes() const;

    /**
     * @brief Number of member nodes visible in the cluster
     */
    Int32 actual_capacity() const noexcept { return static_cast<Int32>(nodes_.size()); }

    // ========================================================================
    // Commands
    // ========================================================================

    /**
     * @brief Set the provider's desired capacity directly, bypassing cooldown
     *
     * Internal control only; scheduling decisions go through scale().
     * No min/max validation is done here.
     */
    ScalingResult set_desired_capacity(Int32 desired_capacity);

    /**
     * @brief Grow the group towards a target size
     *
     * Uncordons member nodes first when fewer than the target are schedulable,
     * then raises desired capacity if needed. Never lowers desired capacity.
     *
     * @param target Requested size (clamped to max_size)
     * @param increased Set to true if desired capacity was raised
     */
    ScalingResult scale(Int32 target, bool& increased);

    /**
     * @brief Terminate the instances backing the given nodes
     *
     * Min-size rejections are logged and skipped. Any other failure aborts
     * the remaining nodes and is returned.
     */
    ScalingResult scale_nodes_in(const std::vector<cloud::ClusterNodePtr>& nodes);

    // ========================================================================
    // Predicates
    // ========================================================================

    bool contains(const cloud::IClusterNode& node) const;

    /**
     * @brief True if every given label/value pair matches the group's selectors
     */
    bool is_match_for_selectors(const cloud::Selectors& selectors) const;

    /**
     * @brief True if the workload's selectors match and it tolerates every group taint
     */
    bool is_taints_tolerated(const cloud::Workload& workload) const;

    std::string to_string() const;

private:
    std::shared_ptr<cloud::IScalingGroupClient> client_;
    GroupId id_;

    Int32 desired_capacity_{0};
    Int32 min_size_{0};
    Int32 max_size_{0};

    std::string instance_type_;
    std::string image_id_;
    std::optional<Real> bid_price_;

    cloud::Selectors selectors_;
    std::unordered_map<std::string, std::string> no_schedule_taints_;

    std::unordered_set<std::string> instance_ids_;
    std::vector<cloud::ClusterNodePtr> nodes_;
};

} // namespace scaleguard::fleet
