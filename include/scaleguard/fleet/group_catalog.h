#pragma once
/**
 * @file group_catalog.h
 * @brief Discovery of the cluster's worker scaling groups
 *
 * Lists scaling groups in every configured region concurrently, joins them
 * with their launch specifications and keeps the groups tagged as workers of
 * the configured cluster.
 */

#include "scaleguard/core/types.h"
#include "scaleguard/core/result.h"
#include "scaleguard/core/threading/thread_pool.h"
#include "scaleguard/cloud/provider.h"
#include "scaleguard/cloud/cluster.h"
#include "scaleguard/fleet/scaling_group.h"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace scaleguard::fleet {

// ============================================================================
// Tag Conventions
// ============================================================================

constexpr const char* CLUSTER_TAG_KEY = "KubernetesCluster";
constexpr std::array<const char*, 2> ROLE_TAG_KEYS = {"KubernetesRole", "Role"};
constexpr std::array<const char*, 2> WORKER_ROLE_VALUES = {"worker", "kubernetes-minion"};

/**
 * @brief Discovery settings
 */
struct CatalogConfig {
    std::vector<std::string> regions;
    std::optional<std::string> cluster_name;    ///< Unset keeps every group
    UInt32 group_page_size{100};                ///< Provider maximum
    SizeT launch_spec_batch_size{50};           ///< Names per launch spec request
    SizeT max_workers{0};                       ///< 0 = one worker per region
};

/**
 * @brief Raw provider data of one region
 */
struct RegionSnapshot {
    std::vector<cloud::GroupDescription> groups;
    std::unordered_map<std::string, cloud::LaunchSpec> launch_specs; ///< Keyed by name
};

class GroupCatalog {
public:
    GroupCatalog(std::shared_ptr<cloud::ICloudSession> session, CatalogConfig config);
    ~GroupCatalog();

    // Non-copyable
    GroupCatalog(const GroupCatalog&) = delete;
    GroupCatalog& operator=(const GroupCatalog&) = delete;

    /**
     * @brief Build the groups of the cluster
     *
     * Regions are fetched concurrently and assembled in configured order,
     * groups sorted by name within a region. Any fetch failure is returned
     * and no groups are produced.
     *
     * @param cluster_nodes Every node currently visible in the cluster
     * @param groups Output, replaced on success
     */
    ScalingResult list_groups(const std::vector<cloud::ClusterNodePtr>& cluster_nodes,
                              std::vector<ScalingGroup>& groups);

    /**
     * @brief True if the group carries the cluster tag and a worker role tag
     *
     * Always true when no cluster name is configured.
     */
    bool is_cluster_worker(const cloud::GroupDescription& group) const;

    /**
     * @brief Fetch every group of a region and their launch specifications
     */
    static ScalingResult fetch_region(cloud::IScalingGroupClient& client,
                                      UInt32 page_size,
                                      SizeT batch_size,
                                      RegionSnapshot& snapshot);

    const CatalogConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<cloud::ICloudSession> session_;
    CatalogConfig config_;
    std::unique_ptr<core::ThreadPool> pool_;
};

} // namespace scaleguard::fleet
