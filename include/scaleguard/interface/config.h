#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 */

#include "scaleguard/core/types.h"
#include "scaleguard/core/result.h"
#include "scaleguard/fleet/group_catalog.h"
#include "scaleguard/fleet/timeout_reconciler.h"
#include <optional>
#include <string>
#include <vector>

namespace scaleguard::config {

/**
 * @brief Autoscaler configuration loaded from XML
 */
struct ScaleGuardConfig {
    // Cluster
    std::optional<std::string> cluster_name;
    std::vector<std::string> regions;
    bool dry_run{false};
    std::string log_level{"info"};

    // Catalog
    UInt32 group_page_size{100};
    SizeT launch_spec_batch_size{50};
    SizeT max_workers{0};  // 0 = one per region

    // Reconciler
    Int64 timeout_seconds{3600};
    Int64 spot_request_timeout_seconds{300};
    Int64 max_outbid_seconds{1200};
    Int64 spot_history_seconds{18000};
    Int64 activity_window_seconds{3600};

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static ScaleGuardConfig load(const std::string& path);

    /**
     * @brief Load configuration from an XML document in memory
     * @throws std::runtime_error if the document cannot be parsed
     */
    static ScaleGuardConfig load_from_string(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static ScaleGuardConfig defaults();

    /**
     * @brief Check value ranges, logging every violation
     * @return InvalidConfiguration if any value is out of range
     */
    ScalingResult validate() const;

    fleet::CatalogConfig to_catalog_config() const;
    fleet::ReconcilerConfig to_reconciler_config() const;

    /**
     * @brief Set the global spdlog level from log_level
     */
    void apply_log_level() const;
};

} // namespace scaleguard::config
