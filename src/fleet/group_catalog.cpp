/**
 * @file group_catalog.cpp
 * @brief Implementation of scaling group discovery
 */

#include "scaleguard/fleet/group_catalog.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace scaleguard::fleet {

namespace {

struct RegionTask {
    std::string region;
    std::shared_ptr<cloud::IScalingGroupClient> client;
};

} // anonymous namespace

GroupCatalog::GroupCatalog(std::shared_ptr<cloud::ICloudSession> session, CatalogConfig config)
    : session_(std::move(session))
    , config_(std::move(config))
{
    SizeT workers = std::max<SizeT>(1, config_.regions.size());
    if (config_.max_workers > 0) {
        workers = std::min(workers, config_.max_workers);
    }
    pool_ = std::make_unique<core::ThreadPool>(workers);
}

GroupCatalog::~GroupCatalog() = default;

ScalingResult GroupCatalog::fetch_region(cloud::IScalingGroupClient& client,
                                         UInt32 page_size,
                                         SizeT batch_size,
                                         RegionSnapshot& snapshot)
{
    ScalingResult result = cloud::fetch_all<cloud::GroupDescription>(
        [&client, page_size](const std::string& token, cloud::Page<cloud::GroupDescription>& page) {
            return client.describe_groups(page_size, token, page);
        },
        snapshot.groups);
    if (result != ScalingResult::Success) {
        return result;
    }

    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& group : snapshot.groups) {
        if (!group.launch_spec_name.empty() && seen.insert(group.launch_spec_name).second) {
            names.push_back(group.launch_spec_name);
        }
    }

    batch_size = std::max<SizeT>(1, batch_size);
    for (SizeT offset = 0; offset < names.size(); offset += batch_size) {
        std::vector<std::string> batch(names.begin() + offset,
                                       names.begin() + std::min(offset + batch_size, names.size()));

        std::vector<cloud::LaunchSpec> specs;
        result = cloud::fetch_all<cloud::LaunchSpec>(
            [&client, &batch](const std::string& token, cloud::Page<cloud::LaunchSpec>& page) {
                return client.describe_launch_specs(batch, token, page);
            },
            specs);
        if (result != ScalingResult::Success) {
            return result;
        }

        for (auto& spec : specs) {
            std::string name = spec.name;
            snapshot.launch_specs[name] = std::move(spec);
        }
    }

    return ScalingResult::Success;
}

bool GroupCatalog::is_cluster_worker(const cloud::GroupDescription& group) const {
    if (!config_.cluster_name) {
        return true;
    }

    std::optional<std::string> cluster_name;
    std::optional<std::string> role;
    for (const auto& tag : group.tags) {
        if (tag.key == CLUSTER_TAG_KEY) {
            cluster_name = tag.value;
        } else if (std::find(ROLE_TAG_KEYS.begin(), ROLE_TAG_KEYS.end(), tag.key) != ROLE_TAG_KEYS.end()) {
            role = tag.value;
        }
    }

    if (cluster_name != config_.cluster_name || !role) {
        return false;
    }
    return std::find(WORKER_ROLE_VALUES.begin(), WORKER_ROLE_VALUES.end(), *role) != WORKER_ROLE_VALUES.end();
}

ScalingResult GroupCatalog::list_groups(const std::vector<cloud::ClusterNodePtr>& cluster_nodes,
                                        std::vector<ScalingGroup>& groups)
{
    std::vector<RegionTask> tasks;
    tasks.reserve(config_.regions.size());
    for (const auto& region : config_.regions) {
        tasks.push_back({region, session_->scaling_client(region)});
    }

    const UInt32 page_size = config_.group_page_size;
    const SizeT batch_size = config_.launch_spec_batch_size;

    std::vector<RegionSnapshot> snapshots;
    ScalingResult result = core::fan_out(*pool_, tasks,
        [page_size, batch_size](const RegionTask& task, RegionSnapshot& snapshot) {
            ScalingResult fetched = fetch_region(*task.client, page_size, batch_size, snapshot);
            if (fetched != ScalingResult::Success) {
                spdlog::error("Failed to list scaling groups in {}: {}",
                              task.region, scaling_result_to_string(fetched));
            }
            return fetched;
        },
        snapshots);
    if (result != ScalingResult::Success) {
        return result;
    }

    std::vector<ScalingGroup> assembled;
    for (SizeT i = 0; i < tasks.size(); ++i) {
        auto& snapshot = snapshots[i];
        std::sort(snapshot.groups.begin(), snapshot.groups.end(),
                  [](const cloud::GroupDescription& a, const cloud::GroupDescription& b) {
                      return a.name < b.name;
                  });

        for (const auto& description : snapshot.groups) {
            if (!is_cluster_worker(description)) {
                continue;
            }

            auto spec = snapshot.launch_specs.find(description.launch_spec_name);
            if (spec == snapshot.launch_specs.end()) {
                spdlog::error("{}: launch specification '{}' of group {} not found",
                              tasks[i].region, description.launch_spec_name, description.name);
                return ScalingResult::LaunchSpecNotFound;
            }

            assembled.emplace_back(tasks[i].client, tasks[i].region, cluster_nodes, description, spec->second);
        }
    }

    spdlog::debug("Discovered {} scaling groups in {} regions", assembled.size(), tasks.size());
    groups = std::move(assembled);
    return ScalingResult::Success;
}

} // namespace scaleguard::fleet
