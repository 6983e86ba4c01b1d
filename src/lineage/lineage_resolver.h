#ifndef SKYVAULT_LINEAGE_LINEAGE_RESOLVER_H_
#define SKYVAULT_LINEAGE_LINEAGE_RESOLVER_H_

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_set.h>

#include "snapshot.h"

namespace Skyvault {

/**
 * Lazily produced sequence of the units still to archive.
 *
 * Units are built one at a time from the unarchived suffix of a lineage; each
 * one references its immediate predecessor as parent. A consumer interested
 * only in the next unit calls Next() once and drops the chain.
 */
class ArchivalChain {
public:
    ArchivalChain() = default;

    /**
     * @param pending Unarchived snapshots, in creation order
     * @param base Last archived snapshot, parent of the first pending one.
     *             Without a base the first unit is a FullUnit.
     */
    ArchivalChain(std::vector<Snapshot> pending, std::optional<Snapshot> base);

    std::optional<ArchivalUnit> Next();

    bool Done() const { return position_ >= pending_.size(); }
    size_t Remaining() const { return pending_.size() - position_; }

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ArchivalUnit;
        using difference_type = std::ptrdiff_t;
        using pointer = const ArchivalUnit*;
        using reference = const ArchivalUnit&;

        Iterator() = default;
        explicit Iterator(ArchivalChain* chain) : chain_(chain) { Advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            Advance();
            return *this;
        }

        bool operator==(const Iterator& other) const {
            return !current_.has_value() && !other.current_.has_value();
        }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        void Advance() { current_ = chain_ ? chain_->Next() : std::nullopt; }

        ArchivalChain* chain_ = nullptr;
        std::optional<ArchivalUnit> current_;
    };

    // Single pass: begin() consumes the chain.
    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

private:
    std::vector<Snapshot> pending_;
    size_t position_ = 0;
    std::optional<Snapshot> previous_;
};

/**
 * Computes the units needed to bring the archive up to date with the local
 * lineage.
 *
 * archived is matched position by position against the start of local; the
 * archive must be a prefix of the lineage. Everything after the last matched
 * position is emitted as a chain of units.
 *
 * @throws DuplicateOrNullInput if either list holds a duplicate or null snapshot
 * @throws InconsistentLayout if a paired position holds different snapshots
 */
ArchivalChain Resolve(const std::vector<Snapshot>& local, const std::vector<Snapshot>& archived);

/**
 * Local snapshots, in lineage order, whose storage name is among identifiers.
 */
std::vector<Snapshot> OnlyArchived(const std::vector<Snapshot>& local,
                                   const absl::flat_hash_set<std::string>& identifiers);

} // namespace Skyvault

#endif // SKYVAULT_LINEAGE_LINEAGE_RESOLVER_H_
