#ifndef SKYVAULT_ARCHIVER_SNAPSHOT_INSPECTOR_H_
#define SKYVAULT_ARCHIVER_SNAPSHOT_INSPECTOR_H_

#include <string>
#include <vector>

#include "lineage/snapshot.h"

namespace Skyvault {

/**
 * Source of the local lineage: the read-only snapshots of one subvolume,
 * ordered by creation time.
 */
class SnapshotInspector {
public:
    virtual ~SnapshotInspector() = default;
    virtual std::vector<Snapshot> FindSnapshots() = 0;
};

/**
 * Reads the lineage from a YAML manifest written by the snapshotting job:
 *
 *   lineage:
 *     id: 6c1d5e0e-...
 *     snapshots:
 *       - relative_path: snapshots/home-2024-01-01
 *         absolute_path: /mnt/pool/snapshots/home-2024-01-01
 *         creation_time: 1704067200
 *         read_only: true          # optional, defaults to true
 *
 * Writable entries are skipped; the rest is sorted by creation_time.
 */
class ManifestSnapshotInspector : public SnapshotInspector {
public:
    explicit ManifestSnapshotInspector(std::string manifest_path);

    // @throws ConfigurationError if the manifest is unreadable or malformed
    std::vector<Snapshot> FindSnapshots() override;

    // Same parsing from an in-memory document.
    static std::vector<Snapshot> ParseManifest(const std::string& yaml_content);

private:
    std::string manifest_path_;
};

} // namespace Skyvault

#endif // SKYVAULT_ARCHIVER_SNAPSHOT_INSPECTOR_H_
