/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Reads the autoscaler configuration with pugixml. Every element is optional;
 * missing values keep their defaults.
 */

#include "scaleguard/interface/config.h"
#include <pugixml.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace scaleguard::config {

namespace {

constexpr UInt32 MAX_GROUP_PAGE_SIZE = 100;
constexpr SizeT MAX_LAUNCH_SPEC_BATCH_SIZE = 50;

bool is_known_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

Int64 child_seconds(const pugi::xml_node& parent, const char* name, Int64 fallback) {
    return parent.child(name).text().as_llong(fallback);
}

ScaleGuardConfig parse_document(const pugi::xml_document& doc) {
    ScaleGuardConfig config = ScaleGuardConfig::defaults();

    auto root = doc.child("scaleguard");
    if (!root) {
        throw std::runtime_error("Invalid scaleguard config XML: no <scaleguard> root element");
    }

    // Cluster settings
    if (auto cluster = root.child("cluster")) {
        std::string name = cluster.attribute("name").as_string();
        if (!name.empty()) {
            config.cluster_name = name;
        }
    }

    if (auto regions = root.child("regions")) {
        for (auto region : regions.children("region")) {
            config.regions.push_back(region.text().as_string());
        }
    }

    config.dry_run = root.child("dry_run").text().as_bool(config.dry_run);
    config.log_level = root.child("log_level").text().as_string(config.log_level.c_str());

    // Catalog settings
    if (auto catalog = root.child("catalog")) {
        config.group_page_size = catalog.child("group_page_size").text().as_uint(config.group_page_size);
        config.launch_spec_batch_size = static_cast<SizeT>(catalog.child("launch_spec_batch_size").text().as_uint(
            static_cast<unsigned int>(config.launch_spec_batch_size)));
        config.max_workers = static_cast<SizeT>(catalog.child("max_workers").text().as_uint(
            static_cast<unsigned int>(config.max_workers)));
    }

    // Reconciler settings
    if (auto reconciler = root.child("reconciler")) {
        config.timeout_seconds = child_seconds(reconciler, "timeout_seconds", config.timeout_seconds);
        config.spot_request_timeout_seconds = child_seconds(
            reconciler, "spot_request_timeout_seconds", config.spot_request_timeout_seconds);
        config.max_outbid_seconds = child_seconds(reconciler, "max_outbid_seconds", config.max_outbid_seconds);
        config.spot_history_seconds = child_seconds(reconciler, "spot_history_seconds", config.spot_history_seconds);
        config.activity_window_seconds = child_seconds(
            reconciler, "activity_window_seconds", config.activity_window_seconds);
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// ScaleGuardConfig Implementation
// ============================================================================

ScaleGuardConfig ScaleGuardConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load config " + path + ": " + std::string(result.description()));
    }

    return parse_document(doc);
}

ScaleGuardConfig ScaleGuardConfig::load_from_string(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }

    return parse_document(doc);
}

ScaleGuardConfig ScaleGuardConfig::defaults() {
    return ScaleGuardConfig{};
}

ScalingResult ScaleGuardConfig::validate() const {
    bool valid = true;

    if (regions.empty()) {
        spdlog::error("Configuration lists no regions");
        valid = false;
    }
    for (const auto& region : regions) {
        if (region.empty()) {
            spdlog::error("Configuration contains an empty region name");
            valid = false;
        }
    }

    if (group_page_size == 0 || group_page_size > MAX_GROUP_PAGE_SIZE) {
        spdlog::error("group_page_size must be between 1 and {} (got {})", MAX_GROUP_PAGE_SIZE, group_page_size);
        valid = false;
    }
    if (launch_spec_batch_size == 0 || launch_spec_batch_size > MAX_LAUNCH_SPEC_BATCH_SIZE) {
        spdlog::error("launch_spec_batch_size must be between 1 and {} (got {})",
                      MAX_LAUNCH_SPEC_BATCH_SIZE, launch_spec_batch_size);
        valid = false;
    }

    const std::pair<const char*, Int64> durations[] = {
        {"timeout_seconds", timeout_seconds},
        {"spot_request_timeout_seconds", spot_request_timeout_seconds},
        {"max_outbid_seconds", max_outbid_seconds},
        {"spot_history_seconds", spot_history_seconds},
        {"activity_window_seconds", activity_window_seconds},
    };
    for (const auto& [name, value] : durations) {
        if (value <= 0) {
            spdlog::error("{} must be positive (got {})", name, value);
            valid = false;
        }
    }

    if (!is_known_log_level(log_level)) {
        spdlog::error("Unknown log level '{}'", log_level);
        valid = false;
    }

    return valid ? ScalingResult::Success : ScalingResult::InvalidConfiguration;
}

fleet::CatalogConfig ScaleGuardConfig::to_catalog_config() const {
    fleet::CatalogConfig catalog;
    catalog.regions = regions;
    catalog.cluster_name = cluster_name;
    catalog.group_page_size = group_page_size;
    catalog.launch_spec_batch_size = launch_spec_batch_size;
    catalog.max_workers = max_workers;
    return catalog;
}

fleet::ReconcilerConfig ScaleGuardConfig::to_reconciler_config() const {
    fleet::ReconcilerConfig reconciler;
    reconciler.timeout = Seconds(timeout_seconds);
    reconciler.spot_request_timeout = Seconds(spot_request_timeout_seconds);
    reconciler.activity_window = Seconds(activity_window_seconds);
    reconciler.spot.timeout = Seconds(timeout_seconds);
    reconciler.spot.max_outbid = Seconds(max_outbid_seconds);
    reconciler.spot.history_period = Seconds(spot_history_seconds);
    return reconciler;
}

void ScaleGuardConfig::apply_log_level() const {
    if (!is_known_log_level(log_level)) {
        spdlog::warn("Unknown log level '{}', keeping {}", log_level,
                     spdlog::level::to_string_view(spdlog::get_level()));
        return;
    }
    spdlog::set_level(spdlog::level::from_str(log_level));
}

} // namespace scaleguard::config
