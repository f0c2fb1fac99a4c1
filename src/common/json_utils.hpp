#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace basmgr {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{value}};
}

inline std::string toKindString(EntryKind kind)
{
    switch (kind) {
    case EntryKind::Alias:
        return "alias";
    case EntryKind::Export:
        return "export";
    case EntryKind::SudoersRule:
        return "sudoers-rule";
    }
    return "alias";
}

inline std::optional<EntryKind> parseKindString(const std::string &value)
{
    if (value == "alias") {
        return EntryKind::Alias;
    }
    if (value == "export") {
        return EntryKind::Export;
    }
    if (value == "sudoers-rule" || value == "sudoers") {
        return EntryKind::SudoersRule;
    }
    return std::nullopt;
}

inline std::string toOutcomeString(EditOutcome outcome)
{
    switch (outcome) {
    case EditOutcome::Added:
        return "added";
    case EditOutcome::Updated:
        return "updated";
    case EditOutcome::Unchanged:
        return "unchanged";
    }
    return "unchanged";
}

inline void to_json(nlohmann::json &j, const EntryKind &kind)
{
    j = toKindString(kind);
}

inline void to_json(nlohmann::json &j, const Entry &entry)
{
    j = nlohmann::json{
        {"kind", entry.kind},
        {"key", entry.key},
        {"value", entry.value},
        {"line", entry.rawLine}
    };
}

// Snapshot manifests are stored beside the content file; contentPath is
// derived from the manifest location and is not serialized.
inline void to_json(nlohmann::json &j, const FileSnapshot &snapshot)
{
    j = nlohmann::json{
        {"id", snapshot.id},
        {"source", snapshot.sourcePath},
        {"createdAt", toIso8601Utc(snapshot.createdAt)},
        {"createdAtMs", toEpochMillis(snapshot.createdAt)},
        {"sequence", snapshot.sequence},
        {"existed", snapshot.existed},
        {"size", snapshot.size}
    };
}

inline void from_json(const nlohmann::json &j, FileSnapshot &snapshot)
{
    snapshot.id = j.value("id", "");
    snapshot.sourcePath = j.value("source", "");
    snapshot.createdAt = fromEpochMillis(j.value("createdAtMs", static_cast<int64_t>(0)));
    snapshot.sequence = j.value("sequence", 0);
    snapshot.existed = j.value("existed", true);
    snapshot.size = j.value("size", static_cast<std::size_t>(0));
}

} // namespace basmgr
