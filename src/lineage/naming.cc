#include "naming.h"

#include <algorithm>

#include "common/errors.h"

namespace Skyvault {

std::string StorageName(const Snapshot& snapshot) {
    const std::string base = snapshot.lineage_id + "/" + snapshot.relative_path;

    if (base.find('\0') != std::string::npos) {
        throw InvalidNameError("Snapshot name contains a NUL character: " + snapshot.ToString());
    }
    if (base.find(kSeparatorEscape) != std::string::npos) {
        throw InvalidNameError("Snapshot name already contains the escape sequence " +
                               std::string(kSeparatorEscape) + ": " + base);
    }

    std::string name;
    name.reserve(base.size() + 8);
    for (char c : base) {
        if (c == '/') {
            name += kSeparatorEscape;
        } else {
            name += c;
        }
    }
    return name;
}

std::string StorageName(const ArchivalUnit& unit) {
    return StorageName(TargetSnapshot(unit));
}

std::string CommonPrefix(const std::vector<std::string>& names) {
    if (names.empty()) {
        return std::string();
    }
    size_t length = names.front().size();
    for (const auto& name : names) {
        auto mismatch = std::mismatch(names.front().begin(), names.front().begin() + std::min(length, name.size()),
                                      name.begin());
        length = static_cast<size_t>(mismatch.first - names.front().begin());
        if (length == 0) {
            break;
        }
    }
    return names.front().substr(0, length);
}

} // namespace Skyvault
