#pragma once

namespace basmgr {

enum class EntryKind {
    Alias,
    Export,
    SudoersRule
};

enum class EditOutcome {
    Added,
    Updated,
    Unchanged
};

} // namespace basmgr
