#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace basmgr {

struct Entry {
    EntryKind kind = EntryKind::Alias;
    // Alias or variable name. For sudoers rules: the trimmed rule text.
    std::string key;
    std::string value;
    std::string rawLine;
};

// One physical line of a parsed file. Lines without an entry are opaque and
// are written back exactly as read.
struct FileLine {
    std::string raw;
    std::optional<Entry> entry;
};

struct EntryDocument {
    std::vector<FileLine> lines;
    bool trailingNewline = false;
};

struct RemoveResult {
    EntryDocument document;
    std::size_t removedCount = 0;
};

struct FileSnapshot {
    std::string id;
    std::string sourcePath;
    std::string contentPath;
    std::chrono::system_clock::time_point createdAt;
    int sequence = 0;
    bool existed = true;
    std::size_t size = 0;
};

} // namespace basmgr
