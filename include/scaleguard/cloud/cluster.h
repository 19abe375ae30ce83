#pragma once
/**
 * @file cluster.h
 * @brief Cluster-side collaborators: nodes and workloads
 */

#include "scaleguard/core/types.h"
#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace scaleguard::cloud {

/**
 * @brief Label name to value mapping used to match workloads to groups
 */
using Selectors = std::map<std::string, std::string>;

/**
 * @brief Cluster-visible worker node
 */
class IClusterNode {
public:
    virtual ~IClusterNode() = default;

    /**
     * @brief Node name as known to the cluster
     */
    virtual std::string name() const = 0;

    /**
     * @brief Provider instance backing this node
     */
    virtual std::string instance_id() const = 0;

    /**
     * @brief True when the node is cordoned
     */
    virtual bool is_unschedulable() const = 0;

    /**
     * @brief Mark the node schedulable again
     * @return True on success
     */
    virtual bool uncordon() = 0;
};

using ClusterNodePtr = std::shared_ptr<IClusterNode>;

/**
 * @brief Scheduling requirements of a pending workload
 */
struct Workload {
    Selectors selectors;                                    ///< Required node labels
    bool no_schedule_wildcard_toleration{false};            ///< Tolerates every NoSchedule taint
    std::unordered_set<std::string> no_schedule_existential_tolerations; ///< Tolerated taint keys
};

} // namespace scaleguard::cloud
