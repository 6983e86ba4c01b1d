#include "lineage_resolver.h"

#include <sstream>

#include "common/errors.h"
#include "naming.h"

namespace Skyvault {

namespace {

void CheckDuplicatesOrNull(const std::vector<Snapshot>& snapshots, const char* what) {
    absl::flat_hash_set<Snapshot> seen;
    seen.reserve(snapshots.size());
    for (size_t i = 0; i < snapshots.size(); ++i) {
        if (snapshots[i].IsNull()) {
            std::ostringstream oss;
            oss << what << " holds a null snapshot at position " << i;
            throw DuplicateOrNullInput(oss.str());
        }
        if (!seen.insert(snapshots[i]).second) {
            std::ostringstream oss;
            oss << what << " holds " << snapshots[i] << " more than once";
            throw DuplicateOrNullInput(oss.str());
        }
    }
}

} // namespace

ArchivalChain::ArchivalChain(std::vector<Snapshot> pending, std::optional<Snapshot> base)
    : pending_(std::move(pending)), previous_(std::move(base)) {}

std::optional<ArchivalUnit> ArchivalChain::Next() {
    if (Done()) {
        return std::nullopt;
    }
    const Snapshot& current = pending_[position_++];
    ArchivalUnit unit = previous_.has_value()
        ? ArchivalUnit(IncrementalUnit{*previous_, current})
        : ArchivalUnit(FullUnit{current});
    previous_ = current;
    return unit;
}

ArchivalChain Resolve(const std::vector<Snapshot>& local, const std::vector<Snapshot>& archived) {
    CheckDuplicatesOrNull(local, "Local lineage");
    CheckDuplicatesOrNull(archived, "Archived lineage");

    size_t matched = 0;
    while (matched < local.size() && matched < archived.size()) {
        if (local[matched] != archived[matched]) {
            std::ostringstream oss;
            oss << "Archived snapshot " << archived[matched] << " should equal local snapshot "
                << local[matched] << " at position " << matched;
            throw InconsistentLayout(oss.str());
        }
        ++matched;
    }

    if (matched == local.size()) {
        // Fully archived, or no local snapshot at all.
        return ArchivalChain();
    }

    std::vector<Snapshot> pending(local.begin() + static_cast<std::ptrdiff_t>(matched), local.end());
    if (matched == 0) {
        return ArchivalChain(std::move(pending), std::nullopt);
    }
    return ArchivalChain(std::move(pending), local[matched - 1]);
}

std::vector<Snapshot> OnlyArchived(const std::vector<Snapshot>& local,
                                   const absl::flat_hash_set<std::string>& identifiers) {
    std::vector<Snapshot> result;
    for (const auto& snapshot : local) {
        if (identifiers.contains(StorageName(snapshot))) {
            result.push_back(snapshot);
        }
    }
    return result;
}

} // namespace Skyvault
