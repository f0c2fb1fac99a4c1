#include "store/line_entry_store.hpp"

#include <cctype>
#include <string>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace basmgr {

namespace {

bool isBlank(char ch)
{
    return ch == ' ' || ch == '\t';
}

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string stripCarriageReturn(const std::string &line)
{
    if (!line.empty() && line.back() == '\r') {
        return line.substr(0, line.size() - 1);
    }
    return line;
}

bool isIdentifier(const std::string &key)
{
    if (key.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(key.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char ch : key) {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && c != '_') {
            return false;
        }
    }
    return true;
}

bool isAliasName(const std::string &key)
{
    if (key.empty()) {
        return false;
    }
    for (char ch : key) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c) || std::iscntrl(c)) {
            return false;
        }
        switch (ch) {
        case '=':
        case '/':
        case '$':
        case '`':
        case '\'':
        case '"':
        case '\\':
            return false;
        default:
            break;
        }
    }
    return true;
}

bool isValidKey(EntryKind kind, const std::string &key)
{
    switch (kind) {
    case EntryKind::Alias:
        return isAliasName(key);
    case EntryKind::Export:
        return isIdentifier(key);
    case EntryKind::SudoersRule:
        return !key.empty();
    }
    return false;
}

bool isSafeBareChar(char ch)
{
    if (std::isalnum(static_cast<unsigned char>(ch))) {
        return true;
    }
    switch (ch) {
    case '_':
    case '.':
    case '/':
    case ':':
    case ',':
    case '+':
    case '@':
    case '%':
    case '=':
    case '~':
    case '-':
        return true;
    default:
        return false;
    }
}

bool isShellOperator(char ch)
{
    switch (ch) {
    case ';':
    case '&':
    case '|':
    case '<':
    case '>':
    case '(':
    case ')':
        return true;
    default:
        return false;
    }
}

// Decodes the shell word at the start of text into out: bare characters,
// '...' runs, "..." runs with backslash escapes, and backslash-escaped
// characters. Returns the offset just past the word, or nullopt when the
// word has an unterminated quote or runs into an unquoted operator.
std::optional<size_t> scanShellWord(const std::string &text, std::string &out)
{
    size_t i = 0;
    while (i < text.size()) {
        const char ch = text[i];
        if (isBlank(ch)) {
            break;
        }
        if (isShellOperator(ch)) {
            return std::nullopt;
        }
        if (ch == '\'') {
            const size_t close = text.find('\'', i + 1);
            if (close == std::string::npos) {
                return std::nullopt;
            }
            out += text.substr(i + 1, close - i - 1);
            i = close + 1;
            continue;
        }
        if (ch == '"') {
            ++i;
            while (i < text.size() && text[i] != '"') {
                if (text[i] == '\\' && i + 1 < text.size()) {
                    const char next = text[i + 1];
                    if (next == '"' || next == '\\' || next == '`' || next == '$') {
                        out += next;
                        i += 2;
                        continue;
                    }
                }
                out += text[i];
                ++i;
            }
            if (i >= text.size()) {
                return std::nullopt;
            }
            ++i;
            continue;
        }
        if (ch == '\\' && i + 1 < text.size()) {
            out += text[i + 1];
            i += 2;
            continue;
        }
        out += ch;
        ++i;
    }
    return i;
}

// What may follow an assignment on its line: nothing, blanks, or a comment.
// Returns the trailing comment with its leading blanks, or nullopt when the
// line carries another command.
std::optional<std::string> commentTail(const std::string &text, size_t pos)
{
    size_t i = pos;
    while (i < text.size() && isBlank(text[i])) {
        ++i;
    }
    if (i == text.size()) {
        return std::string();
    }
    if (text[i] == '#' && i > pos) {
        return text.substr(pos);
    }
    return std::nullopt;
}

std::string singleQuote(const std::string &value)
{
    std::string out = "'";
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out += ch;
        }
    }
    out += "'";
    return out;
}

std::string exportValue(const std::string &value)
{
    bool bare = !value.empty();
    for (char ch : value) {
        if (!isSafeBareChar(ch)) {
            bare = false;
            break;
        }
    }
    if (bare) {
        return value;
    }

    std::string out = "\"";
    for (char ch : value) {
        if (ch == '\\' || ch == '"' || ch == '`') {
            out += '\\';
        }
        out += ch;
    }
    out += "\"";
    return out;
}

// Recognizes "<keyword> KEY=WORD" holding exactly one assignment. Lines with
// further words or commands stay opaque so edits never drop their text.
std::optional<Entry> parseAssignment(EntryKind kind, const std::string &keyword,
                                     const std::string &line, std::string *tail = nullptr)
{
    size_t pos = 0;
    while (pos < line.size() && isBlank(line[pos])) {
        ++pos;
    }
    if (line.compare(pos, keyword.size(), keyword) != 0) {
        return std::nullopt;
    }
    pos += keyword.size();
    if (pos >= line.size() || !isBlank(line[pos])) {
        return std::nullopt;
    }
    while (pos < line.size() && isBlank(line[pos])) {
        ++pos;
    }

    const size_t eq = line.find('=', pos);
    if (eq == std::string::npos) {
        return std::nullopt;
    }
    const std::string key = line.substr(pos, eq - pos);
    if (!isValidKey(kind, key)) {
        return std::nullopt;
    }

    const std::string rest = line.substr(eq + 1);
    std::string value;
    const auto wordEnd = scanShellWord(rest, value);
    if (!wordEnd) {
        return std::nullopt;
    }
    const auto trailing = commentTail(rest, *wordEnd);
    if (!trailing) {
        return std::nullopt;
    }
    if (tail) {
        *tail = *trailing;
    }

    Entry entry;
    entry.kind = kind;
    entry.key = key;
    entry.value = value;
    return entry;
}

// A user spec by uid ("#1000 ALL=...") and the "#include"/"#includedir"
// directives start with '#' but are not comments.
bool isSudoersComment(const std::string &rule)
{
    if (rule.empty() || rule.front() != '#') {
        return false;
    }
    if (rule.rfind("#include", 0) == 0) {
        return false;
    }
    return !(rule.size() > 1 && std::isdigit(static_cast<unsigned char>(rule[1])));
}

// Trailing comment of an alias/export line, kept when the line is rewritten.
std::string assignmentTail(EntryKind kind, const std::string &rawLine)
{
    if (kind == EntryKind::SudoersRule) {
        return {};
    }
    std::string tail;
    parseAssignment(kind, kind == EntryKind::Alias ? "alias" : "export",
                    stripCarriageReturn(rawLine), &tail);
    return tail;
}

std::optional<Entry> parseSudoersRule(const std::string &line)
{
    const std::string rule = trim(line);
    if (rule.empty()) {
        return std::nullopt;
    }
    if (isSudoersComment(rule)) {
        return std::nullopt;
    }

    Entry entry;
    entry.kind = EntryKind::SudoersRule;
    entry.key = rule;
    entry.value = rule;
    return entry;
}

bool matches(const FileLine &line, EntryKind kind, const std::string &key)
{
    return line.entry.has_value() && line.entry->kind == kind && line.entry->key == key;
}

} // namespace

std::string normalizeKey(EntryKind kind, const std::string &key)
{
    if (kind == EntryKind::SudoersRule) {
        return trim(key);
    }
    return key;
}

std::optional<Entry> parseEntryLine(EntryKind kind, const std::string &line)
{
    const std::string content = stripCarriageReturn(line);

    std::optional<Entry> entry;
    switch (kind) {
    case EntryKind::Alias:
        entry = parseAssignment(kind, "alias", content);
        break;
    case EntryKind::Export:
        entry = parseAssignment(kind, "export", content);
        break;
    case EntryKind::SudoersRule:
        entry = parseSudoersRule(content);
        break;
    }

    if (entry) {
        entry->rawLine = line;
    }
    return entry;
}

EntryDocument parseEntries(EntryKind kind, const std::string &text)
{
    EntryDocument document;
    if (text.empty()) {
        return document;
    }

    size_t start = 0;
    while (start < text.size()) {
        const size_t newline = text.find('\n', start);
        const size_t end = newline == std::string::npos ? text.size() : newline;

        FileLine line;
        line.raw = text.substr(start, end - start);
        line.entry = parseEntryLine(kind, line.raw);
        document.lines.push_back(std::move(line));

        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
    }
    document.trailingNewline = text.back() == '\n';
    return document;
}

std::string formatEntryLine(EntryKind kind, const std::string &key,
                            const std::string &value)
{
    switch (kind) {
    case EntryKind::Alias:
        return "alias " + key + "=" + singleQuote(value);
    case EntryKind::Export:
        return "export " + key + "=" + exportValue(value);
    case EntryKind::SudoersRule:
        return trim(value.empty() ? key : value);
    }
    return {};
}

EntryDocument upsertEntry(const EntryDocument &document, EntryKind kind,
                          const std::string &key, const std::string &value)
{
    const std::string normalized = normalizeKey(kind, key);
    const std::string normalizedValue =
        kind == EntryKind::SudoersRule ? normalized : value;

    FileLine replacement;
    replacement.raw = formatEntryLine(kind, normalized, normalizedValue);
    replacement.entry = Entry{kind, normalized, normalizedValue, replacement.raw};

    EntryDocument result;
    result.trailingNewline = document.trailingNewline;
    result.lines.reserve(document.lines.size() + 1);

    bool placed = false;
    for (const FileLine &line : document.lines) {
        if (!matches(line, kind, normalized)) {
            result.lines.push_back(line);
            continue;
        }
        if (placed) {
            continue;
        }
        placed = true;
        if (line.entry->value == normalizedValue) {
            result.lines.push_back(line);
            continue;
        }
        FileLine rewritten = replacement;
        rewritten.raw += assignmentTail(kind, line.raw);
        rewritten.entry->rawLine = rewritten.raw;
        result.lines.push_back(std::move(rewritten));
    }

    if (!placed) {
        result.lines.push_back(std::move(replacement));
        result.trailingNewline = true;
    }
    return result;
}

RemoveResult removeEntries(const EntryDocument &document, EntryKind kind,
                           const std::string &key)
{
    const std::string normalized = normalizeKey(kind, key);

    RemoveResult result;
    result.document.trailingNewline = document.trailingNewline;
    for (const FileLine &line : document.lines) {
        if (matches(line, kind, normalized)) {
            ++result.removedCount;
            continue;
        }
        result.document.lines.push_back(line);
    }
    return result;
}

std::vector<Entry> listEntries(const EntryDocument &document, EntryKind kind)
{
    std::vector<Entry> entries;
    for (const FileLine &line : document.lines) {
        if (line.entry && line.entry->kind == kind) {
            entries.push_back(*line.entry);
        }
    }
    return entries;
}

std::optional<Entry> findEntry(const EntryDocument &document, EntryKind kind,
                               const std::string &key)
{
    const std::string normalized = normalizeKey(kind, key);
    for (const FileLine &line : document.lines) {
        if (matches(line, kind, normalized)) {
            return line.entry;
        }
    }
    return std::nullopt;
}

std::string serializeEntries(const EntryDocument &document)
{
    if (document.lines.empty()) {
        return {};
    }

    std::string text;
    for (size_t i = 0; i < document.lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += document.lines[i].raw;
    }
    if (document.trailingNewline) {
        text += '\n';
    }
    return text;
}

void validateEntryInput(EntryKind kind, const std::string &key,
                        const std::string &value)
{
    const std::string kindName = toKindString(kind);
    const auto isSingleLine = [](const std::string &text) {
        return text.find_first_of(std::string("\n\r\0", 3)) == std::string::npos;
    };

    if (!isSingleLine(key) || !isSingleLine(value)) {
        throw ValidationError(kindName + " input must be a single line");
    }

    switch (kind) {
    case EntryKind::Alias:
        if (!isAliasName(key)) {
            throw ValidationError("invalid alias name '" + key + "'");
        }
        break;
    case EntryKind::Export:
        if (!isIdentifier(key)) {
            throw ValidationError("invalid variable name '" + key + "'");
        }
        break;
    case EntryKind::SudoersRule: {
        const std::string rule = trim(key);
        if (rule.empty()) {
            throw ValidationError("sudoers rule must not be empty");
        }
        if (isSudoersComment(rule)) {
            throw ValidationError("sudoers rule must not be a comment");
        }
        break;
    }
    }
}

} // namespace basmgr
