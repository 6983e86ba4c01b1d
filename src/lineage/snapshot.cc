#include "snapshot.h"

#include "common/overloaded.h"

namespace Skyvault {

std::ostream& operator<<(std::ostream& os, const Snapshot& s) {
    return os << s.ToString();
}

bool operator==(const FullUnit& a, const FullUnit& b) {
    return a.snapshot == b.snapshot;
}

bool operator==(const IncrementalUnit& a, const IncrementalUnit& b) {
    return a.parent == b.parent && a.snapshot == b.snapshot;
}

const Snapshot& TargetSnapshot(const ArchivalUnit& unit) {
    return std::visit(Overloaded{
        [](const FullUnit& full) -> const Snapshot& { return full.snapshot; },
        [](const IncrementalUnit& inc) -> const Snapshot& { return inc.snapshot; },
    }, unit);
}

bool IsFull(const ArchivalUnit& unit) {
    return std::holds_alternative<FullUnit>(unit);
}

std::string Describe(const ArchivalUnit& unit) {
    return std::visit(Overloaded{
        [](const FullUnit& full) {
            return "whole snapshot " + full.snapshot.ToString();
        },
        [](const IncrementalUnit& inc) {
            return "changes between " + inc.parent.ToString() + " and " + inc.snapshot.ToString();
        },
    }, unit);
}

std::ostream& operator<<(std::ostream& os, const ArchivalUnit& unit) {
    return os << Describe(unit);
}

} // namespace Skyvault
