#ifndef SKYVAULT_LINEAGE_SNAPSHOT_H_
#define SKYVAULT_LINEAGE_SNAPSHOT_H_

#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace Skyvault {

/**
 * A read-only point-in-time snapshot of a subvolume.
 *
 * lineage_id identifies the subvolume this snapshot is a version of,
 * relative_path is the path from the filesystem root and absolute_path the
 * path on the host. creation_time only orders snapshots of one lineage.
 * Equality and hashing cover every field.
 */
struct Snapshot {
    std::string lineage_id;
    std::string relative_path;
    std::string absolute_path;
    double creation_time = 0.0;

    // The value counterpart of a missing entry: no identifying field set.
    bool IsNull() const {
        return lineage_id.empty() && relative_path.empty() && absolute_path.empty();
    }

    std::string ToString() const { return "<FS_TREE>/" + relative_path; }

    template <typename H>
    friend H AbslHashValue(H h, const Snapshot& s) {
        return H::combine(std::move(h), s.lineage_id, s.relative_path, s.absolute_path,
                          s.creation_time);
    }
};

inline bool operator==(const Snapshot& a, const Snapshot& b) {
    return a.lineage_id == b.lineage_id && a.relative_path == b.relative_path &&
           a.absolute_path == b.absolute_path && a.creation_time == b.creation_time;
}

inline bool operator!=(const Snapshot& a, const Snapshot& b) { return !(a == b); }

std::ostream& operator<<(std::ostream& os, const Snapshot& s);

// Upload of a whole snapshot: nothing of its lineage is archived yet.
struct FullUnit {
    Snapshot snapshot;
};

// Delta of snapshot relative to an already archived parent.
struct IncrementalUnit {
    Snapshot parent;
    Snapshot snapshot;
};

using ArchivalUnit = std::variant<FullUnit, IncrementalUnit>;

bool operator==(const FullUnit& a, const FullUnit& b);
bool operator==(const IncrementalUnit& a, const IncrementalUnit& b);

// The snapshot a unit ends up archiving.
const Snapshot& TargetSnapshot(const ArchivalUnit& unit);

bool IsFull(const ArchivalUnit& unit);

// "whole snapshot <FS_TREE>/x" or "changes between <FS_TREE>/x and <FS_TREE>/y"
std::string Describe(const ArchivalUnit& unit);

std::ostream& operator<<(std::ostream& os, const ArchivalUnit& unit);

} // namespace Skyvault

#endif // SKYVAULT_LINEAGE_SNAPSHOT_H_
