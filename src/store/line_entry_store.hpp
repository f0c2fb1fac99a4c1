#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace basmgr {

/**
 * Line-based view of an rc or sudoers file.
 *
 * A document is parsed for exactly one EntryKind: lines in that kind's
 * syntax become entries, every other line is kept as opaque text. All
 * operations are pure and return a new document, so a caller can compute
 * the result, compare it, and only then decide to write.
 *
 * Line formats written by formatEntryLine():
 * - alias:   alias NAME='VALUE'      (embedded ' written as '\'')
 * - export:  export NAME=VALUE       when VALUE is made of [A-Za-z0-9_./:,+@%=~-]
 *            export NAME="VALUE"     otherwise, with \ " ` escaped and $ kept
 * - sudoers: the rule text, trimmed
 */

EntryDocument parseEntries(EntryKind kind, const std::string &text);

// Recognizes a single line; std::nullopt for opaque lines.
std::optional<Entry> parseEntryLine(EntryKind kind, const std::string &line);

// Replaces the first entry with the same key in place and drops any later
// duplicates, or appends a new entry. An existing entry that already holds
// value keeps its original line untouched.
EntryDocument upsertEntry(const EntryDocument &document, EntryKind kind,
                          const std::string &key, const std::string &value);

RemoveResult removeEntries(const EntryDocument &document, EntryKind kind,
                           const std::string &key);

std::vector<Entry> listEntries(const EntryDocument &document, EntryKind kind);

std::optional<Entry> findEntry(const EntryDocument &document, EntryKind kind,
                               const std::string &key);

std::string serializeEntries(const EntryDocument &document);

std::string formatEntryLine(EntryKind kind, const std::string &key,
                            const std::string &value);

// Throws ValidationError when key or value cannot be stored as one line of
// the given kind.
void validateEntryInput(EntryKind kind, const std::string &key,
                        const std::string &value);

// Sudoers rules are matched on their trimmed text.
std::string normalizeKey(EntryKind kind, const std::string &key);

} // namespace basmgr
