#ifndef SKYVAULT_LINEAGE_NAMING_H_
#define SKYVAULT_LINEAGE_NAMING_H_

#include <string>
#include <vector>

#include "snapshot.h"

namespace Skyvault {

// Replaces every '/' of a storage name. Four characters: backslash x 2 f.
inline constexpr char kSeparatorEscape[] = "\\x2f";

/**
 * Flat storage key of a unit, used both as the local artifact file name and
 * as the remote object name.
 *
 * The key is "<lineage_id>/<relative_path>" of the target snapshot with every
 * '/' replaced by kSeparatorEscape. The parent of an incremental unit does not
 * take part: there is one object per target snapshot.
 *
 * @throws InvalidNameError if the base contains NUL or already contains
 *         kSeparatorEscape (the mapping would no longer be injective)
 */
std::string StorageName(const ArchivalUnit& unit);

// StorageName(FullUnit{snapshot})
std::string StorageName(const Snapshot& snapshot);

/**
 * Longest common prefix of names. Used as the remote list filter so that a
 * lineage lookup does not fetch the whole container catalog.
 */
std::string CommonPrefix(const std::vector<std::string>& names);

} // namespace Skyvault

#endif // SKYVAULT_LINEAGE_NAMING_H_
