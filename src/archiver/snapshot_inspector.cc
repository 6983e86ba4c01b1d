#include "snapshot_inspector.h"

#include <algorithm>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/errors.h"

namespace Skyvault {

namespace {

std::vector<Snapshot> ParseLineage(const YAML::Node& yaml) {
    auto lineage = yaml["lineage"];
    if (!lineage || !lineage["id"]) {
        throw ConfigurationError("Manifest has no lineage.id");
    }
    const std::string lineage_id = lineage["id"].as<std::string>();

    std::vector<Snapshot> snapshots;
    if (!lineage["snapshots"]) {
        return snapshots;
    }
    for (const auto& entry : lineage["snapshots"]) {
        if (!entry["relative_path"] || !entry["absolute_path"] || !entry["creation_time"]) {
            throw ConfigurationError("Manifest snapshot entries need relative_path, absolute_path and creation_time");
        }
        if (entry["read_only"] && !entry["read_only"].as<bool>()) {
            VLOG(1) << "Skipping writable subvolume " << entry["relative_path"].as<std::string>();
            continue;
        }
        Snapshot snapshot;
        snapshot.lineage_id = lineage_id;
        snapshot.relative_path = entry["relative_path"].as<std::string>();
        snapshot.absolute_path = entry["absolute_path"].as<std::string>();
        snapshot.creation_time = entry["creation_time"].as<double>();
        snapshots.push_back(std::move(snapshot));
    }

    std::stable_sort(snapshots.begin(), snapshots.end(), [](const Snapshot& a, const Snapshot& b) {
        return a.creation_time < b.creation_time;
    });
    VLOG(1) << "Lineage " << lineage_id << " has " << snapshots.size() << " read-only snapshots";
    return snapshots;
}

} // namespace

ManifestSnapshotInspector::ManifestSnapshotInspector(std::string manifest_path)
    : manifest_path_(std::move(manifest_path)) {}

std::vector<Snapshot> ManifestSnapshotInspector::FindSnapshots() {
    try {
        return ParseLineage(YAML::LoadFile(manifest_path_));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to read lineage manifest " + manifest_path_ + ": " + e.what());
    }
}

std::vector<Snapshot> ManifestSnapshotInspector::ParseManifest(const std::string& yaml_content) {
    try {
        return ParseLineage(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Failed to parse lineage manifest: ") + e.what());
    }
}

} // namespace Skyvault
